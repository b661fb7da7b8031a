#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <stratus/channel.hpp>
#include <stratus/chunker.hpp>
#include <stratus/ollama.hpp>

namespace stratus {

struct StreamChunk {
  std::string text;
  bool is_final = false;
  std::uint64_t latency_ms = 0;  // since the request was sent
};

using ChunkCallback = std::function<void(const StreamChunk&)>;

struct StreamConfig {
  ChunkLimits limits{};
  std::size_t channel_capacity = 32;
  GenerateOptions options{0.7, 256};
  std::chrono::milliseconds request_timeout = kGenerateTimeout;
  std::chrono::milliseconds probe_timeout = kProbeTimeout;
};

// Receiving end of one generation. Owns the producer thread; destroying the
// stream closes the receiver and cancels the body read so the producer exits
// without waiting for the model, then joins it. Move-only, single consumer.
class ChunkStream {
public:
  ChunkStream(std::shared_ptr<BoundedChannel<StreamChunk>> channel,
              std::shared_ptr<LineStream> lines,
              std::thread producer);
  ChunkStream(ChunkStream&&) noexcept = default;
  ChunkStream& operator=(ChunkStream&& other) noexcept;
  ChunkStream(const ChunkStream&) = delete;
  ChunkStream& operator=(const ChunkStream&) = delete;
  ~ChunkStream();

  // Blocks for the next chunk; false once the stream has ended.
  bool next(StreamChunk& out);

  // Valid after next() returned false: the reply ended without a done marker.
  bool truncated() const;

private:
  void release_();

  std::shared_ptr<BoundedChannel<StreamChunk>> channel_;
  std::shared_ptr<LineStream> lines_;
  std::thread producer_;
};

// Streams model output as phrase-sized chunks.
class StreamingGenerator {
public:
  explicit StreamingGenerator(OllamaClient client, StreamConfig config = {});

  // Throws Error(EndpointUnavailable) or Error(Transport) if the request is
  // not accepted; afterwards problems only shorten the stream.
  ChunkStream generate_stream(const std::string& prompt) const;

  // Drains a stream, calling on_chunk for each chunk, and returns the
  // space-joined text. Throws Error(StreamTruncated) after delivering what
  // arrived if the reply was cut short.
  std::string generate_with_callback(const std::string& prompt, const ChunkCallback& on_chunk) const;

  // Non-streaming path; returns the trimmed reply.
  std::string generate(const std::string& prompt) const;

  bool is_available() const;

  const OllamaClient& client() const { return client_; }
  const StreamConfig& config() const { return config_; }

private:
  OllamaClient client_;
  StreamConfig config_;
};

} // namespace stratus
