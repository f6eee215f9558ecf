#include "chat_model.hpp"
#include "errors.hpp"
#include "http_client.hpp"

using json = nlohmann::json;

GroqChatModel::GroqChatModel(std::string api_key, std::string model, std::string base_url, long timeout_ms)
  : api_key_(std::move(api_key)), model_(std::move(model)), base_url_(std::move(base_url)),
    timeout_ms_(timeout_ms) {
  while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

json GroqChatModel::request_body(const ChatRequest& req) const {
  json msgs = json::array();
  for (auto& m : req.messages) msgs.push_back({{"role", m.role}, {"content", m.content}});
  json body = {
    {"model", model_},
    {"messages", msgs},
    {"temperature", req.temperature},
    {"max_tokens", req.max_tokens},
  };
  if (!req.schema.is_null()) {
    body["response_format"] = {
      {"type", "json_schema"},
      {"json_schema", {{"name", req.schema_name}, {"schema", req.schema}}},
    };
  }
  return body;
}

std::string GroqChatModel::complete(const ChatRequest& req) {
  HttpClient http(timeout_ms_);
  http.add_header("Authorization", "Bearer " + api_key_);

  HttpResponse r;
  try {
    r = http.request("POST", base_url_ + "/chat/completions", request_body(req).dump());
  } catch (const HttpError& e) {
    throw ChatError(std::string("chat completion failed: ") + e.what());
  }
  if (r.status != 200) {
    throw ChatError("chat completion returned " + std::to_string(r.status) + ": " + r.body.substr(0, 300));
  }

  auto j = json::parse(r.body, nullptr, /*allow_exceptions=*/false);
  if (!j.is_object()) throw ChatError("chat completion: unparsable response");
  auto content = j.value("/choices/0/message/content"_json_pointer, json());
  if (!content.is_string()) throw ChatError("chat completion: no message content");
  return content.get<std::string>();
}
