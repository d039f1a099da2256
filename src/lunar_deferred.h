#ifndef SRC_LUNAR_DEFERRED_H_
#define SRC_LUNAR_DEFERRED_H_

#include "lunar_value.h"

#include <functional>
#include <memory>
#include <vector>

namespace lunar {

// A host result that settles later, once, either with a list of values or
// with a rejection reason. Settle callbacks run synchronously from
// Resolve()/Reject(), or immediately when registered on a settled deferred.
class Deferred : public std::enable_shared_from_this<Deferred> {
 public:
  enum class State { kPending, kFulfilled, kRejected };

  using SettleCallback = std::function<void(const Deferred& settled)>;
  // Reaction of Then()/Catch()/Finally(). Returning exactly one Deferred
  // makes the derived deferred adopt its outcome.
  using Handler = std::function<MultiReturn(const MultiReturn& values)>;

  Deferred() = default;
  Deferred(const Deferred&) = delete;
  Deferred& operator=(const Deferred&) = delete;

  static std::shared_ptr<Deferred> New();
  static std::shared_ptr<Deferred> Resolved(MultiReturn values);
  static std::shared_ptr<Deferred> Rejected(Value reason);

  // Both return false when the deferred had already settled.
  bool Resolve(MultiReturn values);
  bool Reject(Value reason);

  State state() const { return state_; }
  bool pending() const { return state_ == State::kPending; }
  bool fulfilled() const { return state_ == State::kFulfilled; }
  bool rejected() const { return state_ == State::kRejected; }
  const MultiReturn& values() const { return values_; }
  const Value& reason() const { return reason_; }

  void OnSettled(SettleCallback callback);

  // Handlers receive the fulfilled values, or the reason as the only element
  // of the list on rejection. A missing handler passes the outcome through.
  std::shared_ptr<Deferred> Then(Handler on_fulfilled,
                                 Handler on_rejected = nullptr);
  std::shared_ptr<Deferred> Catch(Handler on_rejected);
  // The handler runs with no arguments on either outcome; the original
  // outcome is kept unless the handler's own deferred rejects.
  std::shared_ptr<Deferred> Finally(Handler on_settled);

 private:
  void Settle(State state);
  static void Adopt(const std::shared_ptr<Deferred>& target,
                    MultiReturn results);

  State state_ = State::kPending;
  MultiReturn values_;
  Value reason_;
  std::vector<SettleCallback> callbacks_;
};

}  // namespace lunar

#endif  // SRC_LUNAR_DEFERRED_H_
