#include "colonia/core/dispatcher.h"

#include "colonia/core/wire.h"
#include "colonia/util/log.h"
#include "colonia/util/strings.h"

namespace colonia {

void Dispatcher::attach(Id player, std::shared_ptr<Connection> conn) {
  Endpoint ep;
  ep.conn = std::move(conn);
  ep.state.player = player;

  const VisibilityOracle oracle(registry_, rules_, cfg_);
  UpdateBatch batch;
  batch.observer = player;
  batch.changes = project_snapshot(oracle, registry_, ep.state);
  batch.seq = ep.state.next_seq++;

  log::debug(concat("dispatcher: snapshot for player ", player, ": ", batch.changes.size(), " entities"));
  auto& slot = endpoints_[player] = std::move(ep);
  send(slot, batch);
}

void Dispatcher::detach(Id player) {
  auto it = endpoints_.find(player);
  if (it == endpoints_.end()) return;
  if (it->second.conn) it->second.conn->close();
  endpoints_.erase(it);
}

std::vector<Id> Dispatcher::observers() const {
  std::vector<Id> out;
  out.reserve(endpoints_.size());
  for (const auto& [pid, _] : endpoints_) out.push_back(pid);
  return out;
}

const ObserverState* Dispatcher::observer_state(Id player) const {
  auto it = endpoints_.find(player);
  return it == endpoints_.end() ? nullptr : &it->second.state;
}

void Dispatcher::send(Endpoint& ep, const UpdateBatch& batch) {
  if (!ep.conn || ep.conn->closed()) {
    log::warn(concat("dispatcher: dropping batch ", batch.seq, " for player ", batch.observer,
                     ": connection closed"));
    return;
  }
  ep.conn->send(encode_update(batch));
}

UpdateBatch Dispatcher::dispatch(const ChangeSet& cs, Id submitter) {
  const VisibilityOracle oracle(registry_, rules_, cfg_);
  UpdateBatch reply;
  reply.observer = submitter;

  for (auto& [pid, ep] : endpoints_) {
    UpdateBatch batch;
    batch.observer = pid;
    batch.changes = project(cs, oracle, registry_, ep.state);
    log::debug(concat("dispatcher: player ", pid, " receives ", batch.changes.size(), " of ", cs.size(),
                      " changes"));
    if (batch.changes.empty() && pid != submitter) continue;

    batch.seq = ep.state.next_seq++;
    send(ep, batch);
    if (pid == submitter) reply = batch;
  }
  return reply;
}

UpdateBatch Dispatcher::reject(Id submitter, const ActionError& error) {
  UpdateBatch batch;
  batch.observer = submitter;
  batch.rejection = error;
  auto it = endpoints_.find(submitter);
  if (it == endpoints_.end()) return batch;
  batch.seq = it->second.state.next_seq++;
  send(it->second, batch);
  return batch;
}

} // namespace colonia
