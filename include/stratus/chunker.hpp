#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace stratus {

struct ChunkLimits {
  std::size_t min_chars = 20;   // emit at a phrase boundary once this long
  std::size_t max_chars = 100;  // emit unconditionally once this long
};

struct ChunkText {
  std::string text;  // trimmed
  bool is_final = false;
};

// '.', '!', '?', ',', ';', ':' or a line break.
bool is_phrase_boundary(char c);

std::string trim_copy(std::string_view s);

// Accumulates token fragments and decides when a speakable phrase is ready.
//
// After each fragment a chunk is emitted when the upstream is done, the
// buffer reached max_chars, or it reached min_chars and ends on a phrase
// boundary. On done the whole remaining buffer becomes the final chunk, even
// when it is empty, so a completed stream always ends with exactly one final
// chunk. Non-final chunks that trim to nothing are dropped.
class PhraseChunker {
public:
  explicit PhraseChunker(ChunkLimits limits = {});

  std::optional<ChunkText> feed(std::string_view fragment, bool done);

  // Hands out whatever is buffered as a non-final chunk (upstream vanished).
  std::optional<ChunkText> flush();

  std::size_t buffered() const { return buffer_.size(); }
  bool finished() const { return finished_; }
  const ChunkLimits& limits() const { return limits_; }

private:
  ChunkLimits limits_;
  std::string buffer_;
  bool finished_{false};
};

} // namespace stratus
