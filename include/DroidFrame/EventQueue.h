#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

#include "DroidFrame/Input.h"
#include "DroidFrame/Log.h"

namespace DroidFrame {

// Ordered handoff of platform events from the callback thread to the render
// thread. Single writer, single reader.
class EventQueue {
public:
  EventQueue(size_t capacity, const Logger& logger);

  // False when the queue is closed, or when it is full and `event` is a
  // pointer move; the event is dropped. Every other event is kept past
  // capacity.
  bool push(PlatformEvent event);
  std::vector<PlatformEvent> drain();

  size_t size() const;
  bool empty() const;
  size_t capacity() const;
  // Pointer moves rejected since the last drain.
  size_t droppedCount() const;

  void close();
  bool isClosed() const;

  // Invoked after every accepted push, outside the queue lock.
  void setNotifier(std::function<void()> notifier);

private:
  const Logger& logger_;
  size_t capacity_ = 0u;

  mutable std::mutex mutex_;
  std::deque<PlatformEvent> events_;
  size_t dropped_ = 0u;
  bool closed_ = false;
  std::function<void()> notifier_;
};

} // namespace DroidFrame
