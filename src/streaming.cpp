#include <stratus/streaming.hpp>
#include <stratus/error.hpp>
#include <stratus/log.hpp>
#include <exception>

namespace stratus {

namespace {

constexpr const char* kTag = "stream";

using clock = std::chrono::steady_clock;

std::uint64_t elapsed_ms(clock::time_point start) {
  return static_cast<std::uint64_t>(
    std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start).count());
}

// Producer loop: NDJSON lines -> chunker -> channel.
void pump_chunks(std::shared_ptr<LineStream> lines,
                 std::shared_ptr<BoundedChannel<StreamChunk>> channel,
                 ChunkLimits limits,
                 clock::time_point start) {
  PhraseChunker chunker(limits);
  std::size_t skipped = 0;

  auto deliver = [&](ChunkText c) {
    return channel->send(StreamChunk{std::move(c.text), c.is_final, elapsed_ms(start)});
  };

  try {
    std::string line;
    while (!chunker.finished() && lines->next_line(line)) {
      if (trim_copy(line).empty()) continue;
      auto parsed = decode_generate_line(line);
      if (!parsed) {
        ++skipped;
        continue;
      }
      if (auto c = chunker.feed(parsed->response, parsed->done)) {
        if (!deliver(std::move(*c))) {
          STRATUS_LOG_DEBUG(kTag, "consumer went away; stopping producer");
          return;
        }
      }
    }
  } catch (const std::exception& e) {
    STRATUS_LOG_WARN(kTag, "stream producer failed: %s", e.what());
  }

  if (skipped > 0) STRATUS_LOG_DEBUG(kTag, "skipped %zu undecodable lines", skipped);

  if (chunker.finished()) {
    channel->close(ChannelEnd::Complete);
    return;
  }
  if (channel->receiver_closed()) {
    STRATUS_LOG_DEBUG(kTag, "stream cancelled after %llu ms",
                      static_cast<unsigned long long>(elapsed_ms(start)));
    return;
  }

  STRATUS_LOG_WARN(kTag, "reply ended without done marker after %llu ms%s",
                   static_cast<unsigned long long>(elapsed_ms(start)),
                   lines->failed() ? " (transport error)" : "");
  if (auto rest = chunker.flush()) {
    if (!deliver(std::move(*rest))) return;
  }
  channel->close(ChannelEnd::Aborted);
}

} // namespace

// ---- ChunkStream ----

ChunkStream::ChunkStream(std::shared_ptr<BoundedChannel<StreamChunk>> channel,
                         std::shared_ptr<LineStream> lines,
                         std::thread producer)
  : channel_(std::move(channel)), lines_(std::move(lines)), producer_(std::move(producer)) {}

ChunkStream& ChunkStream::operator=(ChunkStream&& other) noexcept {
  if (this != &other) {
    release_();
    channel_ = std::move(other.channel_);
    lines_ = std::move(other.lines_);
    producer_ = std::move(other.producer_);
  }
  return *this;
}

ChunkStream::~ChunkStream() { release_(); }

void ChunkStream::release_() {
  if (channel_) channel_->close_receiver();
  if (lines_) lines_->cancel();
  if (producer_.joinable()) producer_.join();
  lines_.reset();
  channel_.reset();
}

bool ChunkStream::next(StreamChunk& out) {
  return channel_ && channel_->receive(out);
}

bool ChunkStream::truncated() const {
  return channel_ && channel_->end_state() == ChannelEnd::Aborted;
}

// ---- StreamingGenerator ----

StreamingGenerator::StreamingGenerator(OllamaClient client, StreamConfig config)
  : client_(std::move(client)), config_(config) {}

ChunkStream StreamingGenerator::generate_stream(const std::string& prompt) const {
  const auto start = clock::now();
  std::shared_ptr<LineStream> lines =
    client_.open_stream(prompt, config_.options, config_.request_timeout);
  STRATUS_LOG_DEBUG(kTag, "stream accepted after %llu ms",
                    static_cast<unsigned long long>(elapsed_ms(start)));

  auto channel = std::make_shared<BoundedChannel<StreamChunk>>(config_.channel_capacity);
  std::thread producer(pump_chunks, lines, channel, config_.limits, start);
  return ChunkStream(std::move(channel), std::move(lines), std::move(producer));
}

std::string StreamingGenerator::generate_with_callback(const std::string& prompt,
                                                       const ChunkCallback& on_chunk) const {
  ChunkStream stream = generate_stream(prompt);
  std::string full;
  StreamChunk chunk;
  while (stream.next(chunk)) {
    if (!chunk.text.empty()) {
      full += chunk.text;
      full += ' ';
    }
    if (on_chunk) on_chunk(chunk);
  }
  if (stream.truncated()) {
    throw Error(ErrorKind::StreamTruncated, "reply ended before completion");
  }
  return trim_copy(full);
}

std::string StreamingGenerator::generate(const std::string& prompt) const {
  return trim_copy(client_.generate(prompt, config_.options, config_.request_timeout));
}

bool StreamingGenerator::is_available() const {
  return client_.is_available(config_.probe_timeout);
}

} // namespace stratus
