#include <stratus/telemetry_store.hpp>
#include <stratus/error.hpp>
#include <stratus/log.hpp>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#if defined(__linux__)
#include <sys/inotify.h>
#include <unistd.h>
#endif

namespace stratus {

static constexpr const char* kTag = "telemetry";

static std::filesystem::path env_path(const char* name) {
  const char* v = std::getenv(name);
  if (v == nullptr || *v == '\0') return {};
  return std::filesystem::path(v);
}

std::filesystem::path TelemetryStore::default_data_dir() {
  std::filesystem::path base;
#if defined(_WIN32)
  base = env_path("LOCALAPPDATA");
  if (base.empty()) return std::filesystem::path("C:\\StratusATC");
#elif defined(__APPLE__)
  const auto home = env_path("HOME");
  if (!home.empty()) base = home / "Library" / "Application Support";
#else
  base = env_path("XDG_DATA_HOME");
  if (base.empty()) {
    const auto home = env_path("HOME");
    if (!home.empty()) base = home / ".local" / "share";
  }
#endif
  if (base.empty()) base = std::filesystem::path("/tmp");
  return base / "StratusATC";
}

TelemetryStore::TelemetryStore() : TelemetryStore(default_data_dir()) {}

TelemetryStore::TelemetryStore(std::filesystem::path data_dir)
  : data_dir_(std::move(data_dir)), file_path_(data_dir_ / kFileName) {
  std::error_code ec;
  std::filesystem::create_directories(data_dir_, ec);
  if (ec || !std::filesystem::is_directory(data_dir_)) {
    throw Error(ErrorKind::WatchSetup,
                "cannot create data directory " + data_dir_.string() +
                (ec ? ": " + ec.message() : std::string()));
  }

#if defined(__linux__)
  notify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if (notify_fd_ < 0) {
    throw Error(ErrorKind::WatchSetup, std::string("inotify_init1: ") + std::strerror(errno));
  }
  watch_fd_ = inotify_add_watch(notify_fd_, data_dir_.c_str(),
                                IN_CLOSE_WRITE | IN_MOVED_TO | IN_CREATE | IN_MODIFY);
  if (watch_fd_ < 0) {
    const int err = errno;
    ::close(notify_fd_);
    notify_fd_ = -1;
    throw Error(ErrorKind::WatchSetup,
                "inotify_add_watch " + data_dir_.string() + ": " + std::strerror(err));
  }
#else
  if (std::filesystem::exists(file_path_, ec)) last_write_ = std::filesystem::last_write_time(file_path_, ec);
#endif

  STRATUS_LOG_INFO(kTag, "watching %s", file_path_.string().c_str());
}

TelemetryStore::~TelemetryStore() {
#if defined(__linux__)
  if (notify_fd_ >= 0) {
    if (watch_fd_ >= 0) inotify_rm_watch(notify_fd_, watch_fd_);
    ::close(notify_fd_);
  }
#endif
}

TelemetrySnapshot TelemetryStore::read() const {
  std::ifstream f(file_path_, std::ios::binary);
  if (!f) throw Error(ErrorKind::FileAccess, "cannot open " + file_path_.string());
  std::ostringstream ss;
  ss << f.rdbuf();
  if (f.bad()) throw Error(ErrorKind::FileAccess, "cannot read " + file_path_.string());
  return parse_telemetry_json(ss.str());
}

std::optional<TelemetrySnapshot> TelemetryStore::poll() {
  if (!drain_notifications_()) return std::nullopt;
  return read();
}

#if defined(__linux__)

bool TelemetryStore::drain_notifications_() {
  alignas(inotify_event) char buf[4096];
  bool changed = false;
  for (;;) {
    const ssize_t n = ::read(notify_fd_, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR) continue;
      if (errno != EAGAIN && errno != EWOULDBLOCK) {
        STRATUS_LOG_WARN(kTag, "inotify read failed: %s", std::strerror(errno));
      }
      break;
    }
    if (n == 0) break;
    for (ssize_t off = 0; off < n; ) {
      const auto* ev = reinterpret_cast<const inotify_event*>(buf + off);
      if (ev->mask & IN_Q_OVERFLOW) changed = true;
      else if (ev->len > 0 && std::strcmp(ev->name, kFileName) == 0) changed = true;
      off += static_cast<ssize_t>(sizeof(inotify_event) + ev->len);
    }
  }
  return changed;
}

#else

bool TelemetryStore::drain_notifications_() {
  std::error_code ec;
  if (!std::filesystem::exists(file_path_, ec)) return false;
  const auto t = std::filesystem::last_write_time(file_path_, ec);
  if (ec) return false;
  if (last_write_ && *last_write_ == t) return false;
  last_write_ = t;
  return true;
}

#endif

} // namespace stratus
