#pragma once
#include <iostream>
#include <memory>
#include <string_view>

namespace kartsim {

enum class LogLevel {
  Debug,
  Info,
  Warning,
  Error,
};

class LogSink {
public:
  virtual ~LogSink() = default;
  virtual void log(LogLevel level, std::string_view message) = 0;
};

using LogSinkPtr = std::shared_ptr<LogSink>;

// Null sink is allowed and drops the message.
inline void log(const LogSinkPtr& sink, LogLevel level, std::string_view message) {
  if (sink) sink->log(level, message);
}

class OstreamLogSink : public LogSink {
public:
  explicit OstreamLogSink(std::ostream& os, LogLevel min_level = LogLevel::Info)
    : os_(os), min_level_(min_level) {}

  void log(LogLevel level, std::string_view message) override {
    if (level < min_level_) return;
    os_ << prefix_(level) << message << '\n';
  }

private:
  static constexpr const char* prefix_(LogLevel level) {
    switch (level) {
      case LogLevel::Debug:   return "[debug] ";
      case LogLevel::Info:    return "[info ] ";
      case LogLevel::Warning: return "[warn ] ";
      case LogLevel::Error:   return "[error] ";
    }
    return "";
  }

  std::ostream& os_;
  LogLevel min_level_;
};

inline LogSinkPtr make_console_log_sink(LogLevel min_level = LogLevel::Info) {
  return std::make_shared<OstreamLogSink>(std::clog, min_level);
}

} // namespace kartsim
