#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <cctype>
#include <string>
#include <vector>
#include <stratus/chunker.hpp>

using namespace stratus;

TEST_CASE("phrase boundaries") {
  for (char c : std::string(".!?,;:\n\r")) REQUIRE(is_phrase_boundary(c));
  REQUIRE_FALSE(is_phrase_boundary(' '));
  REQUIRE_FALSE(is_phrase_boundary('a'));
  REQUIRE_FALSE(is_phrase_boundary('-'));
}

TEST_CASE("PhraseChunker emission rules") {
  SECTION("waits for min_chars before splitting at a boundary") {
    PhraseChunker ch({10, 100});
    REQUIRE_FALSE(ch.feed("Roger,", false));
    auto c = ch.feed(" N123,", false);
    REQUIRE(c);
    REQUIRE(c->text == "Roger, N123,");
    REQUIRE_FALSE(c->is_final);
    REQUIRE(ch.buffered() == 0);
  }

  SECTION("forces a chunk at max_chars without a boundary") {
    PhraseChunker ch({5, 12});
    REQUIRE_FALSE(ch.feed("climb and ", false));
    auto c = ch.feed("maintain", false);
    REQUIRE(c);
    REQUIRE(c->text == "climb and maintain");
  }

  SECTION("done emits the rest as the final chunk") {
    PhraseChunker ch;
    REQUIRE_FALSE(ch.feed("Cleared to land", false));
    auto c = ch.feed(" runway two seven", true);
    REQUIRE(c);
    REQUIRE(c->is_final);
    REQUIRE(c->text == "Cleared to land runway two seven");
    REQUIRE(ch.finished());
  }

  SECTION("done with nothing buffered still yields an empty final chunk") {
    PhraseChunker ch({1, 100});
    REQUIRE(ch.feed("Wilco.", false));
    auto c = ch.feed("", true);
    REQUIRE(c);
    REQUIRE(c->is_final);
    REQUIRE(c->text.empty());
  }

  SECTION("whitespace-only chunks are dropped") {
    PhraseChunker ch({1, 100});
    REQUIRE_FALSE(ch.feed("  \n", false));
    REQUIRE(ch.buffered() == 0);
  }

  SECTION("nothing is emitted after the final chunk") {
    PhraseChunker ch;
    REQUIRE(ch.feed("Contact tower.", true));
    REQUIRE_FALSE(ch.feed("extra", false));
    REQUIRE_FALSE(ch.feed("extra", true));
  }

  SECTION("flush hands out the remainder as non-final") {
    PhraseChunker ch;
    REQUIRE_FALSE(ch.feed("  squawk one two", false));
    auto c = ch.flush();
    REQUIRE(c);
    REQUIRE_FALSE(c->is_final);
    REQUIRE(c->text == "squawk one two");
    REQUIRE_FALSE(ch.flush());
  }
}

TEST_CASE("PhraseChunker clamps inconsistent limits") {
  PhraseChunker ch({50, 10});
  REQUIRE(ch.limits().max_chars == 10);
  REQUIRE(ch.limits().min_chars == 10);

  PhraseChunker zero({0, 0});
  REQUIRE(zero.limits().max_chars == 1);
}

TEST_CASE("trim_copy") {
  REQUIRE(trim_copy("  a b \t\n") == "a b");
  REQUIRE(trim_copy("   ").empty());
  REQUIRE(trim_copy("").empty());
}

TEST_CASE("PhraseChunker keeps every character and respects the limits") {
  const std::vector<std::string> fragments = {
    "N12345", ",", " Seattle", " Approach", ",", " radar", " contact", " two", " miles",
    " south", " of", " Boeing", " Field", ".", " Climb", " and", " maintain", " four",
    " thousand", ";", " expect", " higher", " in", " ten", " minutes", ".", "\n", "Squawk",
    " four", " five", " two", " one", "!",
  };
  const ChunkLimits limits{12, 30};
  PhraseChunker ch(limits);

  std::string input, output;
  std::size_t longest_fragment = 0, finals = 0;
  std::vector<ChunkText> chunks;
  for (std::size_t i = 0; i < fragments.size(); ++i) {
    const bool done = i + 1 == fragments.size();
    input += fragments[i];
    longest_fragment = std::max(longest_fragment, fragments[i].size());
    if (auto c = ch.feed(fragments[i], done)) chunks.push_back(*c);
  }

  for (std::size_t i = 0; i < chunks.size(); ++i) {
    const auto& c = chunks[i];
    REQUIRE(c.text.size() <= limits.max_chars + longest_fragment);
    if (c.is_final) {
      ++finals;
      REQUIRE(i + 1 == chunks.size());
    } else {
      REQUIRE(c.text.size() >= limits.min_chars);
    }
    output += c.text;
  }
  REQUIRE(finals == 1);

  auto strip = [](std::string s) {
    s.erase(std::remove_if(s.begin(), s.end(), [](unsigned char x){ return std::isspace(x) != 0; }), s.end());
    return s;
  };
  REQUIRE(strip(output) == strip(input));
}
