#include "DroidFrame/Persistence.h"

#include <exception>
#include <span>
#include <string>
#include <utility>

namespace DroidFrame {

BackendStatus MemoryStateStore::store(std::string_view instanceKey, const PersistedState& state) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(instanceKey);
  if (it == entries_.end()) {
    entries_.emplace(std::string(instanceKey), state);
  } else {
    it->second = state;
  }
  return {};
}

std::optional<PersistedState> MemoryStateStore::load(std::string_view instanceKey) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(instanceKey);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MemoryStateStore::erase(std::string_view instanceKey) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(instanceKey);
  if (it != entries_.end()) {
    entries_.erase(it);
  }
}

size_t MemoryStateStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

StatePersistenceBridge::StatePersistenceBridge(StateStore& store, std::string instanceKey, const Logger& logger)
    : store_(store), instanceKey_(std::move(instanceKey)), logger_(logger) {}

PersistedState StatePersistenceBridge::onSave(Toolkit& toolkit) {
  BackendResult<PersistedState> saved =
      std::unexpected(BackendError{BackendErrorCode::SerializationFailed});
  try {
    saved = toolkit.saveState();
  } catch (const std::exception& ex) {
    std::string message = "persistence: save threw: ";
    message += ex.what();
    logger_.error(message);
    saved = std::unexpected(BackendError{BackendErrorCode::SerializationFailed});
  } catch (...) {
    logger_.error("persistence: save threw a non-standard exception");
    saved = std::unexpected(BackendError{BackendErrorCode::SerializationFailed});
  }

  PersistedState state{};
  if (saved) {
    state = std::move(saved.value());
  } else {
    std::string message = "persistence: save failed (";
    message += errorLabel(saved.error().code);
    message += "), storing empty state";
    logger_.warning(message);
  }

  auto stored = store_.store(instanceKey_, state);
  if (!stored) {
    std::string message = "persistence: store failed (";
    message += errorLabel(stored.error().code);
    message += ")";
    logger_.error(message);
  }
  return state;
}

void StatePersistenceBridge::onRestore(Toolkit& toolkit, std::optional<PersistedState> state) {
  if (restoreDelivered_) {
    logger_.warning("persistence: restore already delivered for this instance");
    return;
  }
  restoreDelivered_ = true;
  if (!state) {
    logger_.debug("persistence: no prior state");
    return;
  }
  toolkit.restoreState(std::span<const uint8_t>(state->bytes.data(), state->bytes.size()));
  std::string message = "persistence: restored ";
  message += std::to_string(state->bytes.size());
  message += " bytes";
  logger_.info(message);
}

std::optional<PersistedState> StatePersistenceBridge::loadPrior() {
  return store_.load(instanceKey_);
}

bool StatePersistenceBridge::restoreDelivered() const {
  return restoreDelivered_;
}

const std::string& StatePersistenceBridge::instanceKey() const {
  return instanceKey_;
}

} // namespace DroidFrame
