#pragma once

#include <atomic>
#include <cstdio>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "absl/strings/str_format.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace kubetls {
namespace log {

// Severity levels (syslog-inspired)
enum class LogLevel {
  Trace = 0,
  Debug,
  Info,
  Notice,
  Warning,
  Error,
  Critical,
  Alert,
  Emergency
};

// Encapsulates a log message with metadata
struct LogMessage {
  std::string logger_id;
  LogLevel level;
  absl::Time timestamp;
  std::thread::id thread_id;
  std::string message;
};

// LogAdapter: instance-based, thread-safe, synchronous. Messages below the
// minimum level are discarded; the rest go to the registered callbacks, or
// to stderr when none are registered.
class LogAdapter {
 public:
  using Callback = std::function<void(const LogMessage&)>;

  explicit LogAdapter(const std::string& id)
      : logger_id_(id), min_level_(LogLevel::Info) {}

  LogAdapter(const LogAdapter&)            = delete;
  LogAdapter& operator=(const LogAdapter&) = delete;

  void SetMinLevel(LogLevel level) {
    min_level_.store(level, std::memory_order_relaxed);
  }
  LogLevel GetMinLevel() const {
    return min_level_.load(std::memory_order_relaxed);
  }

  // Callback registration
  void RegisterCallback(Callback cb) {
    absl::MutexLock lock(&cb_mu_);
    auto next = std::make_shared<std::vector<Callback>>(
        callbacks_ ? *callbacks_ : std::vector<Callback>{});
    next->push_back(std::move(cb));
    callbacks_ = std::move(next);
  }
  void ClearCallbacks() {
    absl::MutexLock lock(&cb_mu_);
    callbacks_.reset();
  }

  void Log(LogLevel level, const std::string& msg) {
    if (level < GetMinLevel())
      return;
    LogMessage lm{logger_id_, level, absl::Now(), std::this_thread::get_id(),
                  msg};
    Dispatch(lm);
  }

  static const char* ToString(LogLevel lvl) {
    static constexpr const char* kNames[] = {
        "TRACE", "DEBUG",    "INFO",  "NOTICE",   "WARNING",
        "ERROR", "CRITICAL", "ALERT", "EMERGENCY"};
    size_t i = static_cast<size_t>(lvl);
    return i < (sizeof(kNames) / sizeof(kNames[0])) ? kNames[i] : "UNKNOWN";
  }

 private:
  // Dispatch to callbacks or fallback
  void Dispatch(const LogMessage& lm) {
    std::shared_ptr<const std::vector<Callback>> cbs;
    {
      absl::MutexLock lock(&cb_mu_);
      cbs = callbacks_;
    }
    if (!cbs || cbs->empty()) {
      DefaultLog(lm);
      return;
    }
    for (const auto& cb : *cbs) {
      try {
        cb(lm);
      } catch (const std::exception& e) {
        std::string err =
            absl::StrFormat("[%s] callback exception: %s\n", logger_id_,
                            e.what());
        fwrite(err.data(), 1, err.size(), stderr);
      }
    }
  }

  // Default synchronous write; includes logger_id
  void DefaultLog(const LogMessage& lm) {
    std::string ts  = absl::FormatTime(absl::RFC3339_full, lm.timestamp,
                                       absl::LocalTimeZone());
    auto tid        = std::hash<std::thread::id>()(lm.thread_id);
    std::string out = absl::StrFormat(
        "[%s] [%s] [%s] [t%llu] %s\n", ts, lm.logger_id, ToString(lm.level),
        static_cast<unsigned long long>(tid), lm.message);
    fwrite(out.data(), 1, out.size(), stderr);
  }

  const std::string logger_id_;
  std::atomic<LogLevel> min_level_;
  absl::Mutex cb_mu_;
  std::shared_ptr<const std::vector<Callback>> callbacks_
      ABSL_GUARDED_BY(cb_mu_);
};

// ========== Singleton and Convenience Macros ==========

// Default process-wide singleton logger
inline LogAdapter& DefaultLogAdapter() {
  static LogAdapter instance("kubetls");
  return instance;
}

#define KUBETLS_LOG_TRACE(msg)                \
  ::kubetls::log::DefaultLogAdapter().Log(    \
      ::kubetls::log::LogLevel::Trace, msg)
#define KUBETLS_LOG_DEBUG(msg)                \
  ::kubetls::log::DefaultLogAdapter().Log(    \
      ::kubetls::log::LogLevel::Debug, msg)
#define KUBETLS_LOG_INFO(msg)                 \
  ::kubetls::log::DefaultLogAdapter().Log(    \
      ::kubetls::log::LogLevel::Info, msg)
#define KUBETLS_LOG_WARNING(msg)              \
  ::kubetls::log::DefaultLogAdapter().Log(    \
      ::kubetls::log::LogLevel::Warning, msg)
#define KUBETLS_LOG_ERROR(msg)                \
  ::kubetls::log::DefaultLogAdapter().Log(    \
      ::kubetls::log::LogLevel::Error, msg)

}  // namespace log
}  // namespace kubetls
