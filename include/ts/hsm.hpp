/**
 * @file hsm.hpp
 * @brief Small hierarchical state machine driven by integer events.
 *
 * - Fixed-size state table, no heap.
 * - Function pointers with a typed context, not std::function.
 * - Unhandled events bubble to the parent state.
 * - Transitions exit up to the lowest common ancestor and enter down to
 *   the target. An entry action may itself request a transition; it runs
 *   once the current one completes (e.g. Starting -> Stopped when the
 *   engine cannot be opened).
 * - An optional hook observes every completed transition.
 *
 * Not thread-safe: the owner serializes Dispatch().
 */

#ifndef TS_HSM_HPP_
#define TS_HSM_HPP_

#include "ts/platform.hpp"

#include <cstdint>

namespace ts {

// ============================================================================
// Event / StateConfig
// ============================================================================

struct Event {
  uint32_t id;
  const void* data;  ///< Optional payload, nullptr if unused.
};

enum class TransitionResult : uint8_t {
  kHandled,    ///< Consumed.
  kUnhandled,  ///< Offer to the parent state.
  kTransition  ///< RequestTransition() was called.
};

template <typename Context>
struct StateConfig {
  using HandlerFn = TransitionResult (*)(Context& ctx, const Event& event);
  using ActionFn = void (*)(Context& ctx);

  const char* name;        ///< Static lifetime.
  int32_t parent_index;    ///< -1 for a top-level state.
  HandlerFn handler;       ///< nullptr forwards every event to the parent.
  ActionFn on_entry;
  ActionFn on_exit;
};

// ============================================================================
// StateMachine
// ============================================================================

template <typename Context, uint32_t MaxStates = 8>
class StateMachine final {
 public:
  static constexpr int32_t kNoState = -1;
  static constexpr uint32_t kMaxDepth = MaxStates;
  /// Bound on entry-requested follow-up transitions per dispatch.
  static constexpr uint32_t kMaxChainedTransitions = 8;

  using TransitionHook = void (*)(Context& ctx, int32_t from, int32_t to);

  explicit StateMachine(Context& ctx) noexcept : ctx_(ctx) {}

  StateMachine(const StateMachine&) = delete;
  StateMachine& operator=(const StateMachine&) = delete;

  /// @return Index of the new state, or kNoState when the table is full.
  int32_t AddState(const StateConfig<Context>& config) noexcept {
    TS_ASSERT(!started_);
    if (count_ >= MaxStates) {
      return kNoState;
    }
    TS_ASSERT(config.parent_index < static_cast<int32_t>(count_));
    states_[count_] = config;
    return static_cast<int32_t>(count_++);
  }

  void SetInitialState(int32_t index) noexcept {
    TS_ASSERT(IsValid(index));
    initial_ = index;
  }

  void SetTransitionHook(TransitionHook hook) noexcept { hook_ = hook; }

  /// @brief Enter the initial state and its ancestors, outermost first.
  void Start() noexcept {
    TS_ASSERT(!started_ && IsValid(initial_));
    started_ = true;
    EnterFrom(kNoState, initial_);
    current_ = initial_;
    RunPending();
  }

  /**
   * @brief Offer @p event to the current state, then its ancestors.
   * @return false when no state in the chain handled it.
   */
  bool Dispatch(const Event& event) noexcept {
    TS_ASSERT(started_);
    for (int32_t s = current_; s >= 0; s = states_[s].parent_index) {
      if (states_[s].handler == nullptr) continue;
      TransitionResult r = states_[s].handler(ctx_, event);
      if (r == TransitionResult::kHandled) return true;
      if (r == TransitionResult::kTransition) {
        RunPending();
        return true;
      }
    }
    return false;
  }

  /// @brief Call from a handler or an entry action; return its result.
  TransitionResult RequestTransition(int32_t target) noexcept {
    TS_ASSERT(IsValid(target));
    pending_ = target;
    return TransitionResult::kTransition;
  }

  int32_t CurrentState() const noexcept { return current_; }

  const char* CurrentStateName() const noexcept {
    return IsValid(current_) ? states_[current_].name : "";
  }

  const char* StateName(int32_t index) const noexcept {
    return IsValid(index) ? states_[index].name : "";
  }

  /// @brief True when current is @p index or one of its descendants.
  bool IsInState(int32_t index) const noexcept {
    for (int32_t s = current_; s >= 0; s = states_[s].parent_index) {
      if (s == index) return true;
    }
    return false;
  }

  bool IsStarted() const noexcept { return started_; }
  uint32_t StateCount() const noexcept { return count_; }

 private:
  bool IsValid(int32_t index) const noexcept {
    return index >= 0 && static_cast<uint32_t>(index) < count_;
  }

  /// Drains pending_ (including follow-ups requested by entry actions).
  void RunPending() noexcept {
    uint32_t chained = 0;
    while (pending_ != kNoState) {
      TS_ASSERT(chained < kMaxChainedTransitions);
      if (++chained > kMaxChainedTransitions) {
        pending_ = kNoState;
        return;
      }
      const int32_t target = pending_;
      pending_ = kNoState;
      const int32_t source = current_;
      Transition(source, target);
      if (hook_ != nullptr) {
        hook_(ctx_, source, target);
      }
    }
  }

  void Transition(int32_t source, int32_t target) noexcept {
    if (source == target) {
      if (states_[source].on_exit != nullptr) states_[source].on_exit(ctx_);
      current_ = target;
      if (states_[target].on_entry != nullptr) states_[target].on_entry(ctx_);
      return;
    }
    const int32_t lca = CommonAncestor(source, target);
    for (int32_t s = source; s >= 0 && s != lca; s = states_[s].parent_index) {
      if (states_[s].on_exit != nullptr) states_[s].on_exit(ctx_);
    }
    // current_ moves before entry so actions observe the new state.
    current_ = target;
    EnterFrom(lca, target);
  }

  /// Runs entry actions from just below @p ancestor down to @p target.
  void EnterFrom(int32_t ancestor, int32_t target) noexcept {
    int32_t path[kMaxDepth];
    uint32_t len = 0;
    for (int32_t s = target; s >= 0 && s != ancestor;
         s = states_[s].parent_index) {
      TS_ASSERT(len < kMaxDepth);
      path[len++] = s;
    }
    while (len > 0) {
      const int32_t s = path[--len];
      if (states_[s].on_entry != nullptr) states_[s].on_entry(ctx_);
    }
  }

  int32_t CommonAncestor(int32_t a, int32_t b) const noexcept {
    uint32_t da = Depth(a);
    uint32_t db = Depth(b);
    while (da > db) { a = states_[a].parent_index; --da; }
    while (db > da) { b = states_[b].parent_index; --db; }
    while (a != b) {
      a = states_[a].parent_index;
      b = states_[b].parent_index;
    }
    return a;
  }

  uint32_t Depth(int32_t s) const noexcept {
    uint32_t d = 0;
    for (; s >= 0; s = states_[s].parent_index) ++d;
    return d;
  }

  Context& ctx_;
  StateConfig<Context> states_[MaxStates] = {};
  uint32_t count_ = 0;
  int32_t current_ = kNoState;
  int32_t initial_ = kNoState;
  int32_t pending_ = kNoState;
  bool started_ = false;
  TransitionHook hook_ = nullptr;
};

}  // namespace ts

#endif  // TS_HSM_HPP_
