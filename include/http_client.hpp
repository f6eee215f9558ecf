#pragma once
#include <string>
#include <utility>
#include <vector>

struct HttpResponse {
  long status = 0;
  std::string body;
};

// Blocking JSON-over-HTTP client on libcurl. Each request carries the
// configured timeout; transport failures (including timeouts) throw HttpError.
class HttpClient {
public:
  explicit HttpClient(long timeout_ms=30000);

  void add_header(const std::string& name, const std::string& value);

  HttpResponse request(const std::string& method, const std::string& url,
                       const std::string& body = "") const;

  long timeout_ms() const { return timeout_ms_; }

private:
  long timeout_ms_;
  std::vector<std::pair<std::string, std::string>> headers_;
};
