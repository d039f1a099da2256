#include "lunar_deferred.h"
#include "util.h"

namespace lunar {

std::shared_ptr<Deferred> Deferred::New() {
  return std::make_shared<Deferred>();
}

std::shared_ptr<Deferred> Deferred::Resolved(MultiReturn values) {
  std::shared_ptr<Deferred> deferred = New();
  deferred->Resolve(std::move(values));
  return deferred;
}

std::shared_ptr<Deferred> Deferred::Rejected(Value reason) {
  std::shared_ptr<Deferred> deferred = New();
  deferred->Reject(std::move(reason));
  return deferred;
}

bool Deferred::Resolve(MultiReturn values) {
  if (!pending()) return false;
  values_ = std::move(values);
  Settle(State::kFulfilled);
  return true;
}

bool Deferred::Reject(Value reason) {
  if (!pending()) return false;
  reason_ = std::move(reason);
  Settle(State::kRejected);
  return true;
}

void Deferred::Settle(State state) {
  CHECK(pending());
  CHECK_NE(state, State::kPending);
  state_ = state;

  // A callback may drop the last external reference to this deferred.
  std::shared_ptr<Deferred> self = weak_from_this().lock();
  std::vector<SettleCallback> callbacks;
  callbacks.swap(callbacks_);
  for (const SettleCallback& callback : callbacks)
    callback(*this);
}

void Deferred::OnSettled(SettleCallback callback) {
  if (!pending()) {
    callback(*this);
    return;
  }
  callbacks_.push_back(std::move(callback));
}

void Deferred::Adopt(const std::shared_ptr<Deferred>& target,
                     MultiReturn results) {
  if (results.size() == 1 && results[0].IsDeferred()) {
    std::shared_ptr<Deferred> inner = results[0].AsDeferred();
    if (inner == target) {
      target->Reject(Value("a deferred cannot adopt itself"));
      return;
    }
    inner->OnSettled([target](const Deferred& settled) {
      if (settled.rejected()) {
        target->Reject(settled.reason());
      } else {
        Adopt(target, settled.values());
      }
    });
    return;
  }
  target->Resolve(std::move(results));
}

std::shared_ptr<Deferred> Deferred::Then(Handler on_fulfilled,
                                         Handler on_rejected) {
  std::shared_ptr<Deferred> derived = New();
  OnSettled([derived,
             on_fulfilled = std::move(on_fulfilled),
             on_rejected = std::move(on_rejected)](const Deferred& settled) {
    if (settled.fulfilled()) {
      if (on_fulfilled) {
        Adopt(derived, on_fulfilled(settled.values()));
      } else {
        derived->Resolve(settled.values());
      }
      return;
    }
    if (on_rejected) {
      Adopt(derived, on_rejected(MultiReturn{settled.reason()}));
    } else {
      derived->Reject(settled.reason());
    }
  });
  return derived;
}

std::shared_ptr<Deferred> Deferred::Catch(Handler on_rejected) {
  return Then(nullptr, std::move(on_rejected));
}

std::shared_ptr<Deferred> Deferred::Finally(Handler on_settled) {
  std::shared_ptr<Deferred> derived = New();
  OnSettled([derived, on_settled = std::move(on_settled)](
                const Deferred& settled) {
    State outcome = settled.state();
    MultiReturn values = settled.values();
    Value reason = settled.reason();
    auto forward = [derived, outcome, values, reason]() {
      if (outcome == State::kRejected) {
        derived->Reject(reason);
      } else {
        derived->Resolve(values);
      }
    };

    MultiReturn results;
    if (on_settled) results = on_settled(MultiReturn());
    if (results.size() == 1 && results[0].IsDeferred()) {
      results[0].AsDeferred()->OnSettled(
          [derived, forward](const Deferred& cleanup) {
            if (cleanup.rejected()) {
              derived->Reject(cleanup.reason());
            } else {
              forward();
            }
          });
      return;
    }
    forward();
  });
  return derived;
}

}  // namespace lunar
