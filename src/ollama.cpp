#include <stratus/ollama.hpp>
#include <stratus/error.hpp>
#include <nlohmann/json.hpp>

namespace stratus {

using nlohmann::json;

std::string encode_generate_request(const GenerateRequest& req) {
  json j;
  j["model"] = req.model;
  j["prompt"] = req.prompt;
  j["stream"] = req.stream;
  j["options"] = {
    {"temperature", req.options.temperature},
    {"num_predict", req.options.num_predict},
  };
  return j.dump();
}

std::optional<GenerateLine> decode_generate_line(const std::string& line) {
  const json j = json::parse(line, nullptr, /*allow_exceptions*/ false);
  if (j.is_discarded() || !j.is_object()) return std::nullopt;
  const auto resp = j.find("response");
  if (resp == j.end() || !resp->is_string()) return std::nullopt;

  GenerateLine out;
  out.response = resp->get<std::string>();
  const auto done = j.find("done");
  if (done != j.end()) {
    if (!done->is_boolean()) return std::nullopt;
    out.done = done->get<bool>();
  }
  return out;
}

OllamaClient::OllamaClient(std::shared_ptr<LlmTransport> transport, std::string model)
  : transport_(std::move(transport)), model_(std::move(model)) {}

bool OllamaClient::is_available(std::chrono::milliseconds timeout) const {
  return transport_->probe(kTagsPath, timeout);
}

std::string OllamaClient::generate(const std::string& prompt,
                                   const GenerateOptions& options,
                                   std::chrono::milliseconds timeout) const {
  const GenerateRequest req{model_, prompt, false, options};
  const std::string body = transport_->post(kGeneratePath, encode_generate_request(req), timeout);
  auto parsed = decode_generate_line(body);
  if (!parsed) throw Error(ErrorKind::MalformedResponse, "generate reply is not a response object");
  return std::move(parsed->response);
}

std::unique_ptr<LineStream> OllamaClient::open_stream(const std::string& prompt,
                                                      const GenerateOptions& options,
                                                      std::chrono::milliseconds timeout) const {
  const GenerateRequest req{model_, prompt, true, options};
  return transport_->post_stream(kGeneratePath, encode_generate_request(req), timeout);
}

} // namespace stratus
