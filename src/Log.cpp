#include "DroidFrame/Log.h"

#include <utility>

namespace DroidFrame {

void Logger::setCallback(LogCallback callback) {
  std::shared_ptr<const LogCallback> next;
  if (callback) {
    next = std::make_shared<const LogCallback>(std::move(callback));
  }
  std::lock_guard<std::mutex> lock(mutex_);
  callback_ = std::move(next);
}

bool Logger::hasCallback() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return callback_ != nullptr;
}

void Logger::log(LogLevel level, Utf8TextView message) const {
  std::shared_ptr<const LogCallback> callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callback = callback_;
  }
  if (callback) {
    (*callback)(level, message);
  }
}

void Logger::debug(Utf8TextView message) const {
  log(LogLevel::Debug, message);
}

void Logger::info(Utf8TextView message) const {
  log(LogLevel::Info, message);
}

void Logger::warning(Utf8TextView message) const {
  log(LogLevel::Warning, message);
}

void Logger::error(Utf8TextView message) const {
  log(LogLevel::Error, message);
}

std::string_view logLevelLabel(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:
      return "debug";
    case LogLevel::Info:
      return "info";
    case LogLevel::Warning:
      return "warning";
    case LogLevel::Error:
      return "error";
  }
  return "unknown";
}

} // namespace DroidFrame
