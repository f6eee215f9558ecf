#include "http_client.hpp"
#include "errors.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace {
size_t collect(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(ptr, size * nmemb);
  return size * nmemb;
}

void ensure_curl() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct CurlDeleter { void operator()(CURL* c) const { curl_easy_cleanup(c); } };
struct SlistDeleter { void operator()(curl_slist* l) const { curl_slist_free_all(l); } };
} // namespace

HttpClient::HttpClient(long timeout_ms) : timeout_ms_(timeout_ms) {
  ensure_curl();
  add_header("Content-Type", "application/json");
}

void HttpClient::add_header(const std::string& name, const std::string& value) {
  headers_.emplace_back(name, value);
}

HttpResponse HttpClient::request(const std::string& method, const std::string& url,
                                 const std::string& body) const {
  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) throw HttpError("curl_easy_init failed", 0);

  curl_slist* raw = nullptr;
  for (auto& h : headers_) raw = curl_slist_append(raw, (h.first + ": " + h.second).c_str());
  std::unique_ptr<curl_slist, SlistDeleter> list(raw);

  HttpResponse resp;
  CURL* c = curl.get();
  curl_easy_setopt(c, CURLOPT_URL, url.c_str());
  curl_easy_setopt(c, CURLOPT_CUSTOMREQUEST, method.c_str());
  curl_easy_setopt(c, CURLOPT_HTTPHEADER, list.get());
  curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, collect);
  curl_easy_setopt(c, CURLOPT_WRITEDATA, &resp.body);
  curl_easy_setopt(c, CURLOPT_TIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
  if (!body.empty()) {
    curl_easy_setopt(c, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE, (long)body.size());
  }

  CURLcode rc = curl_easy_perform(c);
  if (rc != CURLE_OK) {
    throw HttpError(method + " " + url + ": " + curl_easy_strerror(rc), 0);
  }
  curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &resp.status);
  return resp;
}
