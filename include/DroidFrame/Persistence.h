#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "DroidFrame/Log.h"
#include "DroidFrame/Toolkit.h"
#include "DroidFrame/Types.h"

namespace DroidFrame {

// The platform's save/restore storage (the activity's saved state bundle).
class StateStore {
public:
  virtual ~StateStore() = default;

  virtual BackendStatus store(std::string_view instanceKey, const PersistedState& state) = 0;
  virtual std::optional<PersistedState> load(std::string_view instanceKey) = 0;
  virtual void erase(std::string_view instanceKey) = 0;
};

// Keeps saved state in process memory, surviving activity recreation.
class MemoryStateStore final : public StateStore {
public:
  BackendStatus store(std::string_view instanceKey, const PersistedState& state) override;
  std::optional<PersistedState> load(std::string_view instanceKey) override;
  void erase(std::string_view instanceKey) override;

  size_t size() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, PersistedState, std::less<>> entries_;
};

class StatePersistenceBridge {
public:
  StatePersistenceBridge(StateStore& store, std::string instanceKey, const Logger& logger);

  // Asks the toolkit for its state and stores it. A failed save is stored
  // and returned as an empty buffer.
  PersistedState onSave(Toolkit& toolkit);

  // Hands prior state to the toolkit, at most once per instance. An absent
  // state is not an error.
  void onRestore(Toolkit& toolkit, std::optional<PersistedState> state);

  std::optional<PersistedState> loadPrior();
  bool restoreDelivered() const;
  const std::string& instanceKey() const;

private:
  StateStore& store_;
  std::string instanceKey_;
  const Logger& logger_;
  bool restoreDelivered_ = false;
};

} // namespace DroidFrame
