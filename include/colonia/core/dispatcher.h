#pragma once

#include <map>
#include <memory>
#include <vector>

#include "colonia/core/config.h"
#include "colonia/core/connection.h"
#include "colonia/core/messages.h"
#include "colonia/core/projection.h"
#include "colonia/core/registry.h"
#include "colonia/core/rules.h"

namespace colonia {

// Sends projected change lists to attached observers.
//
// The registry is already up to date when dispatch() runs: the authoritative
// copy is the state the changes were recorded against. Each observer gets one
// batch per operation with its own gap-free sequence number. Observers whose
// projection is empty are skipped, except the submitter, who always gets a
// reply.
class Dispatcher {
 public:
  Dispatcher(const EntityRegistry& registry, const Rules& rules, const GameConfig& cfg)
      : registry_(registry), rules_(rules), cfg_(cfg) {}

  // Attaches (or re-attaches) an observer and sends it a snapshot of
  // everything it may currently see.
  void attach(Id player, std::shared_ptr<Connection> conn);
  void detach(Id player);
  bool attached(Id player) const { return endpoints_.count(player) != 0; }
  std::vector<Id> observers() const;

  // Projects and sends `cs`. Returns the submitter's batch; its seq is 0 when
  // the submitter is not attached.
  UpdateBatch dispatch(const ChangeSet& cs, Id submitter);

  // Sends a rejection to the submitter only.
  UpdateBatch reject(Id submitter, const ActionError& error);

  const ObserverState* observer_state(Id player) const;

 private:
  struct Endpoint {
    std::shared_ptr<Connection> conn;
    ObserverState state;
  };

  void send(Endpoint& ep, const UpdateBatch& batch);

  const EntityRegistry& registry_;
  const Rules& rules_;
  const GameConfig& cfg_;
  std::map<Id, Endpoint> endpoints_;
};

} // namespace colonia
