#include "tokensale/ledger/unit_of_work.hpp"

#include <algorithm>
#include <utility>

namespace tokensale {

UnitOfWork::UnitOfWork(SequenceGenerator& sequence, const ITimeProvider& clock)
    : sequence_(sequence), clock_(clock) {}

// -----------------------------------------------------------------------------
// Destructor: roll back anything not committed
// -----------------------------------------------------------------------------
UnitOfWork::~UnitOfWork() {
  if (!committed_) {
    rollbackAll();
  }
}

void UnitOfWork::enlist(ITransactionParticipant& participant) {
  if (std::find(participants_.begin(), participants_.end(), &participant) !=
      participants_.end()) {
    return;
  }
  participant.begin();
  participants_.push_back(&participant);
}

// -----------------------------------------------------------------------------
// emit(): stamp sequence id + timestamp, then queue
// -----------------------------------------------------------------------------
void UnitOfWork::emit(Event event) {
  const std::uint64_t id = sequence_.next_id();
  const std::uint64_t ts = clock_.now_s();
  std::visit(
      [id, ts](auto& e) {
        e.sequence_id = id;
        e.timestamp = ts;
      },
      event);
  pending_.push_back(std::move(event));
}

std::vector<Event> UnitOfWork::commit() {
  if (committed_) {
    return {};
  }
  for (auto* participant : participants_) {
    participant->commit();
  }
  committed_ = true;
  return std::exchange(pending_, {});
}

void UnitOfWork::rollbackAll() noexcept {
  for (auto it = participants_.rbegin(); it != participants_.rend(); ++it) {
    (*it)->rollback();
  }
  participants_.clear();
  pending_.clear();
}

}  // namespace tokensale
