#pragma once

#include <memory>
#include <mutex>

#include "DroidFrame/Types.h"

namespace DroidFrame {

// Routes backend diagnostics to the callback installed with setLogCallback.
// Safe to use from the platform callback thread and the render thread.
class Logger {
public:
  void setCallback(LogCallback callback);
  bool hasCallback() const;

  void log(LogLevel level, Utf8TextView message) const;
  void debug(Utf8TextView message) const;
  void info(Utf8TextView message) const;
  void warning(Utf8TextView message) const;
  void error(Utf8TextView message) const;

private:
  mutable std::mutex mutex_;
  std::shared_ptr<const LogCallback> callback_;
};

std::string_view logLevelLabel(LogLevel level);

} // namespace DroidFrame
