/**
 * @file supervisor.hpp
 * @brief Stream session supervisor: owns the media engine, reacts to its
 *        lifecycle events, reconnects pulled sources and samples bandwidth.
 *
 * State hierarchy:
 *
 *   Idle
 *   Active
 *     Starting      engine launched, waiting for playing
 *     Streaming     sampling tick running
 *     Reconnecting  one-shot delay pending, then rebuild
 *   Stopped
 *
 * Engine threads and timer threads never touch session state. They post
 * (kind, generation) items to a bounded channel; one loop thread pops them
 * and dispatches into the state machine under the supervisor mutex. Public
 * calls take the same mutex, so the session is a single actor.
 *
 * The generation advances whenever an engine is launched or abandoned and
 * when a session ends. Items carrying an older generation are dropped.
 */

#ifndef TS_SUPERVISOR_HPP_
#define TS_SUPERVISOR_HPP_

#include "ts/bandwidth.hpp"
#include "ts/hsm.hpp"
#include "ts/interface_inspector.hpp"
#include "ts/log.hpp"
#include "ts/media_engine.hpp"
#include "ts/platform.hpp"
#include "ts/status.hpp"
#include "ts/stream_config.hpp"
#include "ts/timer.hpp"
#include "ts/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace ts {

static constexpr uint32_t kDefaultMaxReconnectAttempts = 5U;
static constexpr uint32_t kDefaultReconnectDelayMs = 3000U;
static constexpr uint32_t kDefaultSampleIntervalMs = 1000U;
static constexpr uint32_t kDefaultNotificationIntervalTicks = 5U;

struct SupervisorOptions {
  uint32_t max_reconnect_attempts = kDefaultMaxReconnectAttempts;
  uint32_t reconnect_delay_ms = kDefaultReconnectDelayMs;
  uint32_t sample_interval_ms = kDefaultSampleIntervalMs;
  /// Every Nth tick also publishes kNotificationRefresh. 0 disables it.
  uint32_t notification_interval_ticks = kDefaultNotificationIntervalTicks;
};

/// @brief Returns the address to advertise in the published URL.
using AddressProviderFn = optional<std::string> (*)(void* ctx);

#if TS_HAS_NETWORK
/// @brief Default provider: Tailscale address if any, else first LAN one.
inline optional<std::string> LocalAdvertisedAddress(void* /*ctx*/) {
  return SelectAdvertisedAddress(ListInterfaces());
}
#endif

// ============================================================================
// HSM Events
// ============================================================================

enum class SupervisorEvent : uint32_t {
  kEvtStart = 1,
  kEvtStop = 2,
  kEvtEnginePlaying = 3,
  kEvtEngineError = 4,
  kEvtTick = 5,
  kEvtReconnectDue = 6,
};

namespace detail {

enum class ChannelKind : uint8_t { kEngine = 0, kTick, kReconnectDue };

struct ChannelItem {
  ChannelKind kind;
  EngineEventType engine_event;
  uint8_t percent;
  uint64_t generation;
};

/**
 * Bounded multi-producer, single-consumer queue. Producers never block.
 *
 * Besides the ring, one reserved slot holds an item that must not be lost
 * to a full ring (the reconnect deadline). A newer reserved item replaces an
 * undelivered older one. Pop() hands out the reserved item first.
 */
template <uint32_t Capacity>
class EventChannel final {
 public:
  bool TryPush(const ChannelItem& item) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_ || count_ == Capacity) return false;
      items_[(head_ + count_) % Capacity] = item;
      ++count_;
    }
    cv_.notify_one();
    return true;
  }

  /// Stores @p item in the reserved slot. false only once closed.
  bool PushReserved(const ChannelItem& item) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) return false;
      reserved_ = item;
      has_reserved_ = true;
    }
    cv_.notify_one();
    return true;
  }

  /// Blocks until an item is available. false once closed and drained.
  bool Pop(ChannelItem& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock,
             [this] { return has_reserved_ || count_ > 0U || closed_; });
    if (has_reserved_) {
      out = reserved_;
      has_reserved_ = false;
      return true;
    }
    if (count_ == 0U) return false;
    out = items_[head_];
    head_ = (head_ + 1U) % Capacity;
    --count_;
    return true;
  }

  void Close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  ChannelItem items_[Capacity] = {};
  ChannelItem reserved_ = {};
  uint32_t head_ = 0U;
  uint32_t count_ = 0U;
  bool has_reserved_ = false;
  bool closed_ = false;
};

inline uint64_t MonotonicMs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now().time_since_epoch())
          .count());
}

}  // namespace detail

// ============================================================================
// SupervisorContext
// ============================================================================

class StreamSupervisor;

/// Sink context handed to one engine instance.
struct EngineBinding {
  StreamSupervisor* owner;
  uint64_t generation;
};

struct SupervisorContext {
  StreamSupervisor* owner = nullptr;
  StateMachine<SupervisorContext, 8>* sm = nullptr;
  int32_t idx_idle = -1;
  int32_t idx_active = -1;
  int32_t idx_starting = -1;
  int32_t idx_streaming = -1;
  int32_t idx_reconnecting = -1;
  int32_t idx_stopped = -1;

  SupervisorOptions opts;
  StreamConfig config;
  optional<std::string> published_url;

  std::unique_ptr<EngineBinding> binding;  // outlives engine
  std::unique_ptr<MediaEngine> engine;

  uint32_t reconnect_attempts = 0U;
  bool has_played = false;
  uint64_t started_ms = 0U;
  bool launch_failed = false;
  optional<SessionFault> last_error;
  BandwidthEstimator bandwidth;
  uint32_t ticks = 0U;

  optional<TimerTaskId> tick_task;
  optional<TimerTaskId> reconnect_task;
};

// ============================================================================
// StreamSupervisor
// ============================================================================

/**
 * @brief Runs at most one streaming session at a time.
 *
 * Status subscribers are called with the supervisor mutex held and must not
 * call back into the supervisor from the callback.
 */
class StreamSupervisor final {
 public:
  static constexpr uint32_t kChannelCapacity = 64U;

  StreamSupervisor(MediaEngineFactory& factory,
                   const SupervisorOptions& opts = SupervisorOptions(),
                   AddressProviderFn address_fn = DefaultAddressProvider(),
                   void* address_ctx = nullptr)
      : factory_(factory),
        address_fn_(address_fn),
        address_ctx_(address_ctx),
        sm_(ctx_) {
    ctx_.owner = this;
    ctx_.sm = &sm_;
    ctx_.opts = opts;

    ctx_.idx_idle = sm_.AddState({"Idle", -1, &StreamSupervisor::OnInactive,
                                  nullptr, nullptr});
    ctx_.idx_active = sm_.AddState({"Active", -1, &StreamSupervisor::OnActive,
                                    nullptr, &StreamSupervisor::ExitActive});
    ctx_.idx_starting =
        sm_.AddState({"Starting", ctx_.idx_active,
                      &StreamSupervisor::OnStarting,
                      &StreamSupervisor::EnterStarting, nullptr});
    ctx_.idx_streaming =
        sm_.AddState({"Streaming", ctx_.idx_active,
                      &StreamSupervisor::OnStreaming,
                      &StreamSupervisor::EnterStreaming,
                      &StreamSupervisor::ExitStreaming});
    ctx_.idx_reconnecting =
        sm_.AddState({"Reconnecting", ctx_.idx_active,
                      &StreamSupervisor::OnReconnecting,
                      &StreamSupervisor::EnterReconnecting,
                      &StreamSupervisor::ExitReconnecting});
    ctx_.idx_stopped = sm_.AddState({"Stopped", -1,
                                     &StreamSupervisor::OnInactive, nullptr,
                                     nullptr});
    sm_.SetInitialState(ctx_.idx_idle);
    sm_.SetTransitionHook(&StreamSupervisor::OnTransition);
    sm_.Start();

    auto started = timer_.Start();
    if (!started.has_value()) {
      TS_LOG_ERROR("Supervisor", "timer scheduler did not start");
    }
    loop_ = std::thread(&StreamSupervisor::EventLoop, this);
  }

  ~StreamSupervisor() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (IsSessionActive(StateLocked())) {
        Dispatch(SupervisorEvent::kEvtStop);
      }
    }
    timer_.Stop();
    channel_.Close();
    if (loop_.joinable()) {
      loop_.join();
    }
  }

  StreamSupervisor(const StreamSupervisor&) = delete;
  StreamSupervisor& operator=(const StreamSupervisor&) = delete;

  // --------------------------------------------------------------------------
  // Session control
  // --------------------------------------------------------------------------

  /**
   * @brief Start a session from Idle or Stopped.
   *
   * @return kAlreadyRunning while a session is active (left untouched),
   *         kInvalidConfig for an unusable config, kEngineStartFailure when
   *         no engine could be created, opened or played (state Stopped).
   */
  expected<void, SessionError> Start(const StreamConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (IsSessionActive(StateLocked())) {
      TS_LOG_WARN("Supervisor", "start rejected: session already %s",
                  sm_.CurrentStateName());
      return expected<void, SessionError>::error(SessionError::kAlreadyRunning);
    }
    auto valid = ValidateStreamConfig(config);
    if (!valid.has_value()) {
      TS_LOG_ERROR("Supervisor", "start rejected: invalid stream config");
      return valid;
    }

    ctx_.config = config;
    ctx_.reconnect_attempts = 0U;
    ctx_.has_played = false;
    ctx_.started_ms = 0U;
    ctx_.launch_failed = false;
    ctx_.last_error.reset();
    ctx_.ticks = 0U;
    ctx_.bandwidth.Reset(detail::MonotonicMs());
    ctx_.published_url = ResolvePublishedUrl();

    TS_LOG_INFO("Supervisor", "starting %s session from %s",
                IngestModeName(config.mode),
                BuildDisplayIngestUrl(config).c_str());
    Dispatch(SupervisorEvent::kEvtStart);
    if (ctx_.launch_failed) {
      return expected<void, SessionError>::error(
          SessionError::kEngineStartFailure);
    }
    return expected<void, SessionError>::success();
  }

  /**
   * @brief End the active session, tear down the engine and publish the
   *        final status. No status is published for it after this returns.
   * @return kNotRunning (logged no-op) when no session is active.
   */
  expected<void, SessionError> Stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!IsSessionActive(StateLocked())) {
      TS_LOG_INFO("Supervisor", "stop ignored: no active session (%s)",
                  sm_.CurrentStateName());
      return expected<void, SessionError>::error(SessionError::kNotRunning);
    }
    Dispatch(SupervisorEvent::kEvtStop);
    return expected<void, SessionError>::success();
  }

  // --------------------------------------------------------------------------
  // Status
  // --------------------------------------------------------------------------

  StatusSnapshot Status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return BuildSnapshotLocked();
  }

  SessionState State() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return StateLocked();
  }

  optional<SubscriberId> Subscribe(StatusCallback fn, void* ctx = nullptr) {
    return publisher_.Subscribe(fn, ctx);
  }

  bool Unsubscribe(SubscriberId id) { return publisher_.Unsubscribe(id); }

  /**
   * @brief Record a fault raised outside the session (camera discovery) and
   *        publish it. The session state is left unchanged; the fault stays
   *        in last_error until the next Start().
   */
  void ReportFault(ErrorKind kind, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    TS_LOG_WARN("Supervisor", "fault %s: %s", ErrorKindName(kind),
                message.c_str());
    ctx_.last_error = SessionFault{kind, message};
    PublishLocked(StatusReason::kTransition);
  }

  const SupervisorOptions& Options() const noexcept { return ctx_.opts; }

 private:
  using Machine = StateMachine<SupervisorContext, 8>;

  static AddressProviderFn DefaultAddressProvider() noexcept {
#if TS_HAS_NETWORK
    return &LocalAdvertisedAddress;
#else
    return nullptr;
#endif
  }

  // --------------------------------------------------------------------------
  // State handlers
  // --------------------------------------------------------------------------

  static bool Is(const Event& event, SupervisorEvent id) noexcept {
    return event.id == static_cast<uint32_t>(id);
  }

  // Idle and Stopped.
  static TransitionResult OnInactive(SupervisorContext& ctx,
                                     const Event& event) {
    if (Is(event, SupervisorEvent::kEvtStart)) {
      return ctx.sm->RequestTransition(ctx.idx_starting);
    }
    return TransitionResult::kUnhandled;
  }

  static TransitionResult OnActive(SupervisorContext& ctx, const Event& event) {
    if (Is(event, SupervisorEvent::kEvtStop)) {
      return ctx.sm->RequestTransition(ctx.idx_stopped);
    }
    // Late ticks, retries and engine events with no meaning here.
    return TransitionResult::kHandled;
  }

  static void ExitActive(SupervisorContext& ctx) {
    ctx.owner->TearDownEngine();
    ctx.owner->generation_.fetch_add(1U, std::memory_order_acq_rel);
  }

  static void EnterStarting(SupervisorContext& ctx) {
    if (!ctx.owner->LaunchEngine()) {
      ctx.launch_failed = true;
      ctx.last_error = SessionFault{ErrorKind::kEngineStartFailure,
                                    "media engine could not be started"};
      ctx.sm->RequestTransition(ctx.idx_stopped);
    }
  }

  static TransitionResult OnStarting(SupervisorContext& ctx,
                                     const Event& event) {
    if (Is(event, SupervisorEvent::kEvtEnginePlaying)) {
      return ctx.sm->RequestTransition(ctx.idx_streaming);
    }
    if (Is(event, SupervisorEvent::kEvtEngineError)) {
      return HandleStreamFailure(ctx, "stream error while starting");
    }
    return TransitionResult::kUnhandled;
  }

  static void EnterStreaming(SupervisorContext& ctx) {
    ctx.reconnect_attempts = 0U;
    if (!ctx.has_played) {
      ctx.has_played = true;
      ctx.started_ms = detail::MonotonicMs();
    }
    ctx.ticks = 0U;
    ctx.owner->ArmTick();
    TS_LOG_INFO("Supervisor", "streaming at %s",
                ctx.published_url.value_or("<no address>").c_str());
  }

  static void ExitStreaming(SupervisorContext& ctx) {
    ctx.owner->CancelTask(ctx.tick_task);
  }

  static TransitionResult OnStreaming(SupervisorContext& ctx,
                                      const Event& event) {
    if (Is(event, SupervisorEvent::kEvtTick)) {
      ctx.owner->Sample();
      return TransitionResult::kHandled;
    }
    if (Is(event, SupervisorEvent::kEvtEngineError)) {
      return HandleStreamFailure(ctx, "stream error while streaming");
    }
    if (Is(event, SupervisorEvent::kEvtEnginePlaying)) {
      return TransitionResult::kHandled;
    }
    return TransitionResult::kUnhandled;
  }

  static void EnterReconnecting(SupervisorContext& ctx) {
    // The failed engine's remaining events are stale from here on.
    ctx.owner->generation_.fetch_add(1U, std::memory_order_acq_rel);
    TS_LOG_WARN("Supervisor", "reconnecting in %u ms (attempt %u/%u)",
                ctx.opts.reconnect_delay_ms, ctx.reconnect_attempts,
                ctx.opts.max_reconnect_attempts);
    ctx.owner->ArmReconnect();
  }

  static void ExitReconnecting(SupervisorContext& ctx) {
    ctx.owner->CancelTask(ctx.reconnect_task);
  }

  static TransitionResult OnReconnecting(SupervisorContext& ctx,
                                         const Event& event) {
    if (Is(event, SupervisorEvent::kEvtReconnectDue)) {
      ctx.reconnect_task.reset();
      ctx.owner->TearDownEngine();
      if (!ctx.owner->LaunchEngine()) {
        return HandleStreamFailure(ctx, "engine rebuild failed");
      }
      return TransitionResult::kHandled;
    }
    if (Is(event, SupervisorEvent::kEvtEnginePlaying)) {
      TS_LOG_INFO("Supervisor", "source recovered after %u attempt(s)",
                  ctx.reconnect_attempts);
      return ctx.sm->RequestTransition(ctx.idx_streaming);
    }
    if (Is(event, SupervisorEvent::kEvtEngineError)) {
      return HandleStreamFailure(ctx, "stream error after reconnect");
    }
    return TransitionResult::kUnhandled;
  }

  /// Pulled sources are retried up to the ceiling. Pushed sources only
  /// record the error.
  static TransitionResult HandleStreamFailure(SupervisorContext& ctx,
                                              const char* message) {
    ctx.last_error = SessionFault{ErrorKind::kStreamError, message};
    if (ctx.config.mode == IngestMode::kUdpPush) {
      TS_LOG_WARN("Supervisor", "%s (udp push, not retried)", message);
      ctx.owner->PublishLocked(StatusReason::kTransition);
      return TransitionResult::kHandled;
    }

    ++ctx.reconnect_attempts;
    if (ctx.reconnect_attempts > ctx.opts.max_reconnect_attempts) {
      TS_LOG_ERROR("Supervisor", "%s; giving up after %u reconnect attempts",
                   message, ctx.opts.max_reconnect_attempts);
      ctx.last_error =
          SessionFault{ErrorKind::kReconnectExhausted,
                       "source unreachable after " +
                           std::to_string(ctx.opts.max_reconnect_attempts) +
                           " reconnect attempts"};
      return ctx.sm->RequestTransition(ctx.idx_stopped);
    }
    TS_LOG_WARN("Supervisor", "%s", message);
    return ctx.sm->RequestTransition(ctx.idx_reconnecting);
  }

  static void OnTransition(SupervisorContext& ctx, int32_t from, int32_t to) {
    TS_LOG_INFO("Supervisor", "%s -> %s", ctx.sm->StateName(from),
                ctx.sm->StateName(to));
    ctx.owner->PublishLocked(StatusReason::kTransition);
  }

  // --------------------------------------------------------------------------
  // Engine management (mutex_ held)
  // --------------------------------------------------------------------------

  bool LaunchEngine() {
    std::unique_ptr<EngineBinding> binding(new EngineBinding{
        this, generation_.fetch_add(1U, std::memory_order_acq_rel) + 1U});
    std::unique_ptr<MediaEngine> engine = factory_.Create();
    if (!engine) {
      TS_LOG_ERROR("Supervisor", "media engine factory returned no instance");
      return false;
    }

    EngineEventSink sink;
    sink.fn = &StreamSupervisor::OnEngineEvent;
    sink.ctx = binding.get();

    auto opened = engine->Open(BuildLaunchSpec(ctx_.config), sink);
    if (!opened.has_value()) {
      TS_LOG_ERROR("Supervisor", "engine open failed (%u)",
                   static_cast<unsigned>(opened.get_error()));
      return false;
    }
    auto played = engine->Play();
    if (!played.has_value()) {
      TS_LOG_ERROR("Supervisor", "engine play failed (%u)",
                   static_cast<unsigned>(played.get_error()));
      engine->Stop();
      return false;
    }
    ctx_.binding = std::move(binding);
    ctx_.engine = std::move(engine);
    return true;
  }

  void TearDownEngine() {
    if (ctx_.engine) {
      ctx_.engine->Stop();
      ctx_.engine.reset();
    }
    ctx_.binding.reset();
  }

  static void OnEngineEvent(const EngineEvent& event, void* ctx) {
    auto* binding = static_cast<EngineBinding*>(ctx);
    binding->owner->Post(detail::ChannelKind::kEngine, binding->generation,
                         event.type, event.buffering_percent);
  }

  // --------------------------------------------------------------------------
  // Timers (mutex_ held)
  // --------------------------------------------------------------------------

  void ArmTick() {
    auto id = timer_.Add(ctx_.opts.sample_interval_ms,
                         &StreamSupervisor::OnTickTimer, this);
    if (id.has_value()) {
      ctx_.tick_task = id.value();
    } else {
      TS_LOG_ERROR("Supervisor", "cannot schedule sampling tick (%u)",
                   static_cast<unsigned>(id.get_error()));
    }
  }

  void ArmReconnect() {
    auto id = timer_.AddOneShot(ctx_.opts.reconnect_delay_ms,
                                &StreamSupervisor::OnReconnectTimer, this);
    if (id.has_value()) {
      ctx_.reconnect_task = id.value();
    } else {
      TS_LOG_ERROR("Supervisor", "cannot schedule reconnect (%u)",
                   static_cast<unsigned>(id.get_error()));
    }
  }

  void CancelTask(optional<TimerTaskId>& task) {
    if (!task.has_value()) return;
    auto removed = timer_.Remove(task.value());
    if (!removed.has_value()) {
      TS_LOG_DEBUG("Supervisor", "timer task %u already gone",
                   task.value().value());
    }
    task.reset();
  }

  static void OnTickTimer(void* ctx) {
    auto* self = static_cast<StreamSupervisor*>(ctx);
    self->Post(detail::ChannelKind::kTick,
               self->generation_.load(std::memory_order_acquire),
               EngineEventType::kOpening, 0U);
  }

  // Reconnecting is left only through this item, so it bypasses the ring.
  static void OnReconnectTimer(void* ctx) {
    auto* self = static_cast<StreamSupervisor*>(ctx);
    detail::ChannelItem item{detail::ChannelKind::kReconnectDue,
                             EngineEventType::kOpening, 0U,
                             self->generation_.load(std::memory_order_acquire)};
    if (!self->channel_.PushReserved(item)) {
      TS_LOG_DEBUG("Supervisor", "reconnect due after channel close");
    }
  }

  // --------------------------------------------------------------------------
  // Event loop
  // --------------------------------------------------------------------------

  void Post(detail::ChannelKind kind, uint64_t generation,
            EngineEventType type, uint8_t percent) {
    detail::ChannelItem item{kind, type, percent, generation};
    if (!channel_.TryPush(item)) {
      TS_LOG_WARN("Supervisor", "event channel full, dropped kind %u",
                  static_cast<unsigned>(kind));
    }
  }

  void EventLoop() {
    detail::ChannelItem item{};
    while (channel_.Pop(item)) {
      std::lock_guard<std::mutex> lock(mutex_);
      if (item.generation != generation_.load(std::memory_order_acquire)) {
        continue;
      }
      switch (item.kind) {
        case detail::ChannelKind::kTick:
          Dispatch(SupervisorEvent::kEvtTick);
          break;
        case detail::ChannelKind::kReconnectDue:
          Dispatch(SupervisorEvent::kEvtReconnectDue);
          break;
        case detail::ChannelKind::kEngine:
          HandleEngineEvent(item);
          break;
      }
    }
  }

  void HandleEngineEvent(const detail::ChannelItem& item) {
    switch (item.engine_event) {
      case EngineEventType::kOpening:
        TS_LOG_DEBUG("Supervisor", "engine opening");
        break;
      case EngineEventType::kBuffering:
        TS_LOG_DEBUG("Supervisor", "engine buffering %u%%",
                     static_cast<unsigned>(item.percent));
        break;
      case EngineEventType::kPlaying:
        Dispatch(SupervisorEvent::kEvtEnginePlaying);
        break;
      case EngineEventType::kError:
        Dispatch(SupervisorEvent::kEvtEngineError);
        break;
      case EngineEventType::kStopped:
        TS_LOG_DEBUG("Supervisor", "engine stopped");
        break;
    }
  }

  void Dispatch(SupervisorEvent id) {
    (void)sm_.Dispatch(Event{static_cast<uint32_t>(id), nullptr});
  }

  // --------------------------------------------------------------------------
  // Status (mutex_ held)
  // --------------------------------------------------------------------------

  SessionState StateLocked() const noexcept {
    const int32_t s = sm_.CurrentState();
    if (s == ctx_.idx_starting) return SessionState::kStarting;
    if (s == ctx_.idx_streaming) return SessionState::kStreaming;
    if (s == ctx_.idx_reconnecting) return SessionState::kReconnecting;
    if (s == ctx_.idx_stopped) return SessionState::kStopped;
    return SessionState::kIdle;
  }

  StatusSnapshot BuildSnapshotLocked() const {
    StatusSnapshot snap;
    snap.state = StateLocked();
    snap.reconnect_attempt = ctx_.reconnect_attempts;
    snap.last_error = ctx_.last_error;
    if (IsSessionActive(snap.state)) {
      snap.published_url = ctx_.published_url;
      snap.bandwidth_bytes_per_sec = ctx_.bandwidth.Current();
      if (ctx_.has_played) {
        snap.uptime_seconds =
            (detail::MonotonicMs() - ctx_.started_ms) / kMsPerSecond;
      }
    }
    return snap;
  }

  void PublishLocked(StatusReason reason) {
    publisher_.Publish(BuildSnapshotLocked(), reason);
  }

  void Sample() {
    if (ctx_.engine) {
      auto stats = ctx_.engine->ReadStats();
      if (stats.has_value()) {
        ctx_.bandwidth.Update(detail::MonotonicMs(), stats.value());
      }
    }
    ++ctx_.ticks;
    PublishLocked(StatusReason::kTick);
    const uint32_t every = ctx_.opts.notification_interval_ticks;
    if (every > 0U && ctx_.ticks % every == 0U) {
      PublishLocked(StatusReason::kNotificationRefresh);
    }
  }

  optional<std::string> ResolvePublishedUrl() {
    if (address_fn_ == nullptr) return {};
    optional<std::string> address = address_fn_(address_ctx_);
    if (!address.has_value()) {
      TS_LOG_WARN("Supervisor", "no routable local address to advertise");
      return {};
    }
    return optional<std::string>(
        BuildPublishedUrl(address.value(), ctx_.config));
  }

  MediaEngineFactory& factory_;
  AddressProviderFn address_fn_;
  void* address_ctx_;

  SupervisorContext ctx_;
  Machine sm_;
  mutable std::mutex mutex_;
  StatusPublisher publisher_;

  std::atomic<uint64_t> generation_{0U};
  detail::EventChannel<kChannelCapacity> channel_;
  TimerScheduler<4> timer_;
  std::thread loop_;
};

}  // namespace ts

#endif  // TS_SUPERVISOR_HPP_
