#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <stratus/llm_transport.hpp>

namespace stratus {

inline constexpr const char* kGeneratePath = "/api/generate";
inline constexpr const char* kTagsPath     = "/api/tags";

inline constexpr std::chrono::milliseconds kProbeTimeout{2000};
inline constexpr std::chrono::milliseconds kGenerateTimeout{30000};

struct GenerateOptions {
  double temperature = 0.7;  // low values keep phraseology deterministic
  int num_predict = 256;     // max new tokens
};

struct GenerateRequest {
  std::string model;
  std::string prompt;
  bool stream = false;
  GenerateOptions options;
};

// One NDJSON line of a streaming reply, or the whole non-streaming reply.
struct GenerateLine {
  std::string response;
  bool done = false;
};

std::string encode_generate_request(const GenerateRequest& req);

// nullopt if the line is not a JSON object with a string "response".
// A missing "done" reads as false.
std::optional<GenerateLine> decode_generate_line(const std::string& line);

// Thin client for an Ollama-style generation endpoint. Copies share the transport.
class OllamaClient {
public:
  OllamaClient(std::shared_ptr<LlmTransport> transport, std::string model);

  bool is_available(std::chrono::milliseconds timeout = kProbeTimeout) const;

  // Single-shot generation. Throws Error(Transport), Error(EndpointUnavailable)
  // or Error(MalformedResponse).
  std::string generate(const std::string& prompt,
                       const GenerateOptions& options = {},
                       std::chrono::milliseconds timeout = kGenerateTimeout) const;

  // Starts a streaming generation; the returned stream yields raw NDJSON lines.
  std::unique_ptr<LineStream> open_stream(const std::string& prompt,
                                          const GenerateOptions& options = {},
                                          std::chrono::milliseconds timeout = kGenerateTimeout) const;

  const std::string& model() const { return model_; }

private:
  std::shared_ptr<LlmTransport> transport_;
  std::string model_;
};

} // namespace stratus
