#include "DroidFrame/EventQueue.h"

#include <string>
#include <utility>

namespace DroidFrame {
namespace {

// A later move of the same pointer supersedes these.
bool isDroppable(const PlatformEvent& event) {
  const auto* motion = std::get_if<RawMotionEvent>(&event);
  return motion && (motion->action == MotionAction::Move || motion->action == MotionAction::HoverMove);
}

} // namespace

EventQueue::EventQueue(size_t capacity, const Logger& logger) : logger_(logger), capacity_(capacity) {}

bool EventQueue::push(PlatformEvent event) {
  std::function<void()> notifier;
  bool accepted = false;
  bool firstDrop = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return false;
    }
    if (capacity_ != 0u && events_.size() >= capacity_ && isDroppable(event)) {
      ++dropped_;
      firstDrop = dropped_ == 1u;
    } else {
      events_.push_back(std::move(event));
      notifier = notifier_;
      accepted = true;
    }
  }
  // Only report the first drop of a burst.
  if (firstDrop) {
    std::string message = "events: queue full at ";
    message += std::to_string(capacity_);
    message += ", dropping pointer moves";
    logger_.warning(message);
  }
  if (!accepted) {
    return false;
  }
  if (notifier) {
    notifier();
  }
  return true;
}

std::vector<PlatformEvent> EventQueue::drain() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PlatformEvent> drained;
  drained.reserve(events_.size());
  for (auto& event : events_) {
    drained.push_back(std::move(event));
  }
  events_.clear();
  dropped_ = 0u;
  return drained;
}

size_t EventQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

bool EventQueue::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.empty();
}

size_t EventQueue::capacity() const {
  return capacity_;
}

size_t EventQueue::droppedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

void EventQueue::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
  events_.clear();
}

bool EventQueue::isClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

void EventQueue::setNotifier(std::function<void()> notifier) {
  std::lock_guard<std::mutex> lock(mutex_);
  notifier_ = std::move(notifier);
}

} // namespace DroidFrame
