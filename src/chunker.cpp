#include <stratus/chunker.hpp>
#include <cctype>

namespace stratus {

bool is_phrase_boundary(char c) {
  switch (c) {
    case '.': case '!': case '?':
    case ',': case ';': case ':':
    case '\n': case '\r':
      return true;
    default:
      return false;
  }
}

std::string trim_copy(std::string_view s) {
  auto is_space = [](char c){ return std::isspace(static_cast<unsigned char>(c)) != 0; };
  std::size_t b = 0, e = s.size();
  while (b < e && is_space(s[b])) ++b;
  while (e > b && is_space(s[e - 1])) --e;
  return std::string(s.substr(b, e - b));
}

PhraseChunker::PhraseChunker(ChunkLimits limits) : limits_(limits) {
  if (limits_.max_chars == 0) limits_.max_chars = 1;
  if (limits_.min_chars > limits_.max_chars) limits_.min_chars = limits_.max_chars;
}

std::optional<ChunkText> PhraseChunker::feed(std::string_view fragment, bool done) {
  if (finished_) return std::nullopt;
  buffer_.append(fragment.data(), fragment.size());

  if (done) {
    finished_ = true;
    ChunkText out{trim_copy(buffer_), true};
    buffer_.clear();
    return out;
  }

  const std::size_t n = buffer_.size();
  const bool at_boundary = n > 0 && is_phrase_boundary(buffer_.back());
  if (n < limits_.max_chars && !(n >= limits_.min_chars && at_boundary)) return std::nullopt;

  std::string text = trim_copy(buffer_);
  buffer_.clear();
  if (text.empty()) return std::nullopt;
  return ChunkText{std::move(text), false};
}

std::optional<ChunkText> PhraseChunker::flush() {
  std::string text = trim_copy(buffer_);
  buffer_.clear();
  if (text.empty()) return std::nullopt;
  return ChunkText{std::move(text), false};
}

} // namespace stratus
