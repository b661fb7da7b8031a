#include <stratus/config.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace stratus {

static constexpr const char* kTag = "config";

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return s;
}

static std::optional<long long> to_int_safe(const std::string& s) {
  try {
    size_t idx = 0;
    const long long v = std::stoll(s, &idx);
    if (idx != s.size()) return std::nullopt;
    return v;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static std::optional<double> to_double_safe(const std::string& s) {
  try {
    size_t idx = 0;
    const double v = std::stod(s, &idx);
    if (idx != s.size()) return std::nullopt;
    return v;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static std::optional<bool> to_bool_safe(const std::string& s) {
  const std::string v = lower(s);
  if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
  if (v == "false" || v == "no" || v == "off" || v == "0") return false;
  return std::nullopt;
}

static bool set_count(std::size_t& field, const std::string& value, long long lo) {
  const auto v = to_int_safe(value);
  if (!v || *v < lo) return false;
  field = static_cast<std::size_t>(*v);
  return true;
}

// Returns false if the key is unknown or the value is invalid.
static bool apply_entry(AppConfig& cfg, const std::string& key, const std::string& value) {
  if (key == "endpoint")      { if (value.empty()) return false; cfg.endpoint = value; return true; }
  if (key == "model")         { if (value.empty()) return false; cfg.model = value; return true; }
  if (key == "callsign")      { if (value.empty()) return false; cfg.callsign = value; return true; }
  if (key == "aircraft_type") { if (value.empty()) return false; cfg.aircraft_type = value; return true; }
  if (key == "data_dir")      { cfg.data_dir = value; return true; }

  if (key == "warmup_enabled") {
    const auto v = to_bool_safe(value);
    if (!v) return false;
    cfg.warmup_enabled = *v;
    return true;
  }
  if (key == "warmup_interval_s") {
    const auto v = to_int_safe(value);
    if (!v || *v <= 0) return false;
    cfg.warmup_interval = std::chrono::seconds(*v);
    return true;
  }
  if (key == "min_chunk_chars") return set_count(cfg.min_chunk_chars, value, 1);
  if (key == "max_chunk_chars") return set_count(cfg.max_chunk_chars, value, 1);
  if (key == "history_limit")   return set_count(cfg.history_limit, value, 2);
  if (key == "temperature") {
    const auto v = to_double_safe(value);
    if (!v || *v < 0.0 || *v > 2.0) return false;
    cfg.temperature = *v;
    return true;
  }
  if (key == "max_new_tokens") {
    const auto v = to_int_safe(value);
    if (!v || *v <= 0) return false;
    cfg.max_new_tokens = static_cast<int>(*v);
    return true;
  }
  if (key == "log_level") {
    const auto v = parse_log_level(value);
    if (!v) return false;
    cfg.log_level = *v;
    return true;
  }
  return false;
}

AppConfig config_from_stream(std::istream& in) {
  AppConfig cfg;
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const std::string raw = trim_copy(line);
    if (raw.empty() || raw[0] == '#') continue;

    const auto eq = raw.find('=');
    if (eq == std::string::npos) {
      STRATUS_LOG_WARN(kTag, "line %d: expected key = value", line_no);
      continue;
    }
    const std::string key = lower(trim_copy(std::string_view(raw).substr(0, eq)));
    const std::string value = trim_copy(std::string_view(raw).substr(eq + 1));
    if (!apply_entry(cfg, key, value)) {
      STRATUS_LOG_WARN(kTag, "line %d: ignoring '%s = %s'", line_no, key.c_str(), value.c_str());
    }
  }

  if (cfg.min_chunk_chars > cfg.max_chunk_chars) {
    const AppConfig defaults;
    STRATUS_LOG_WARN(kTag, "min_chunk_chars %zu > max_chunk_chars %zu; using %zu/%zu",
                     cfg.min_chunk_chars, cfg.max_chunk_chars,
                     defaults.min_chunk_chars, defaults.max_chunk_chars);
    cfg.min_chunk_chars = defaults.min_chunk_chars;
    cfg.max_chunk_chars = defaults.max_chunk_chars;
  }
  return cfg;
}

std::optional<AppConfig> load_config_file(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return config_from_stream(f);
}

void apply_env_overrides(AppConfig& cfg) {
  auto env = [](const char* name) -> std::optional<std::string> {
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') return std::nullopt;
    return std::string(v);
  };
  if (auto v = env("STRATUS_ENDPOINT")) cfg.endpoint = *v;
  if (auto v = env("STRATUS_MODEL"))    cfg.model = *v;
  if (auto v = env("STRATUS_DATA_DIR")) cfg.data_dir = *v;
  if (auto v = env("STRATUS_LOG_LEVEL")) {
    if (auto level = parse_log_level(*v)) cfg.log_level = *level;
    else STRATUS_LOG_WARN(kTag, "ignoring STRATUS_LOG_LEVEL=%s", v->c_str());
  }
}

WarmupConfig warmup_config(const AppConfig& cfg) {
  WarmupConfig w;
  w.model = cfg.model;
  w.interval = std::chrono::duration_cast<std::chrono::milliseconds>(cfg.warmup_interval);
  w.endpoint = cfg.endpoint;
  return w;
}

StreamConfig stream_config(const AppConfig& cfg) {
  StreamConfig s;
  s.limits.min_chars = cfg.min_chunk_chars;
  s.limits.max_chars = cfg.max_chunk_chars;
  s.options.temperature = cfg.temperature;
  s.options.num_predict = cfg.max_new_tokens;
  return s;
}

EngineConfig engine_config(const AppConfig& cfg) {
  EngineConfig e;
  e.callsign = cfg.callsign;
  e.aircraft_type = cfg.aircraft_type;
  e.history_limit = cfg.history_limit;
  return e;
}

} // namespace stratus
