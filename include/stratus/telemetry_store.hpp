#pragma once
#include <filesystem>
#include <optional>
#include <stratus/telemetry.hpp>

namespace stratus {

// Watches the telemetry data directory and decodes the latest snapshot on demand.
// Construction throws Error(WatchSetup) if the directory or the watch cannot
// be set up. Not thread-safe; poll from one thread.
class TelemetryStore {
public:
  static constexpr const char* kFileName = "stratus_telemetry.json";

  TelemetryStore();
  explicit TelemetryStore(std::filesystem::path data_dir);
  ~TelemetryStore();
  TelemetryStore(const TelemetryStore&) = delete;
  TelemetryStore& operator=(const TelemetryStore&) = delete;

  // Throws Error(FileAccess) or Error(FileParse).
  TelemetrySnapshot read() const;

  // Non-blocking. Drains pending change notifications; reads once if any of
  // them concerned the telemetry file, otherwise returns nullopt.
  std::optional<TelemetrySnapshot> poll();

  const std::filesystem::path& data_dir() const { return data_dir_; }
  const std::filesystem::path& file_path() const { return file_path_; }

  // Per-platform application data directory (".../StratusATC").
  static std::filesystem::path default_data_dir();

private:
  bool drain_notifications_();

  std::filesystem::path data_dir_;
  std::filesystem::path file_path_;
#if defined(__linux__)
  int notify_fd_{-1};
  int watch_fd_{-1};
#else
  std::optional<std::filesystem::file_time_type> last_write_;
#endif
};

} // namespace stratus
