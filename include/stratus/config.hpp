#pragma once
#include <chrono>
#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <stratus/conversation.hpp>
#include <stratus/log.hpp>
#include <stratus/streaming.hpp>
#include <stratus/warmup.hpp>

namespace stratus {

struct AppConfig {
  std::string endpoint = "http://localhost:11434";
  std::string model = "llama3.2:3b";

  bool warmup_enabled = true;
  std::chrono::seconds warmup_interval{30};

  std::size_t min_chunk_chars = 20;
  std::size_t max_chunk_chars = 100;
  double temperature = 0.7;
  int max_new_tokens = 256;

  std::string callsign = "N12345";
  std::string aircraft_type = "C172";
  std::size_t history_limit = 20;

  std::string data_dir;  // empty: platform default
  LogLevel log_level = LogLevel::Info;
};

// "key = value" lines. Blank lines and '#' comments are ignored, whitespace
// around keys and values is trimmed. Unknown keys and invalid values are
// skipped with a warning, leaving the default in place.
AppConfig config_from_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if the file cannot be opened.
std::optional<AppConfig> load_config_file(const std::string& path);

// STRATUS_ENDPOINT, STRATUS_MODEL, STRATUS_DATA_DIR, STRATUS_LOG_LEVEL.
void apply_env_overrides(AppConfig& cfg);

WarmupConfig warmup_config(const AppConfig& cfg);
StreamConfig stream_config(const AppConfig& cfg);
EngineConfig engine_config(const AppConfig& cfg);

} // namespace stratus
