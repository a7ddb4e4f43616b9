// Repository: nestlapse
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission with no multi-thread interleave.
// Copyright (c) 2025 nestlapse

#ifndef NESTLAPSE_UTIL_LOGGER_HPP_
#define NESTLAPSE_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace nestlapse::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, guaranteeing no interleave between concurrent threads
// (capture control thread, media consumer, negotiator callbacks).
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when NESTLAPSE_DEBUG env is set (verbose investigation)
// Warn  → stderr (degraded but recoverable conditions)
// Error → stderr (stage failures, hard faults)
//
// Test-only: the Set*Sink hooks install a callback invoked for every line of
// that severity (in addition to the stream). Used by tests to assert on
// advisories such as a close timeout.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Call with nullptr to clear.
  static void SetErrorSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);
  static void SetInfoSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> error_sink_;
  static std::function<void(const std::string&)> warn_sink_;
  static std::function<void(const std::string&)> info_sink_;
};

}  // namespace nestlapse::util

#endif  // NESTLAPSE_UTIL_LOGGER_HPP_
