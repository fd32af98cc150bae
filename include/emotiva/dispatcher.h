#pragma once

#include "emotiva/diagnostics.h"
#include "emotiva/socket_manager.h"
#include "emotiva/types.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace emotiva {

/**
 * Cooperative cancellation flag handed to long-running callbacks.
 *
 * Copies share state; cancelling one cancels all of them.
 */
class CancelToken {
 public:
  CancelToken();

  bool IsCancelled() const;
  /// Sleep up to `duration`; returns true early if cancelled.
  bool WaitFor(std::chrono::milliseconds duration) const;
  void Cancel();

 private:
  struct State;
  std::shared_ptr<State> state_;
};

using PropertyCallback = std::function<void(const std::string& value)>;
using AsyncPropertyCallback =
    std::function<void(const std::string& value, const CancelToken& token)>;
/// Called with false when the device goes quiet and with true when it is heard again.
using LivenessCallback = std::function<void(bool responsive)>;

/// Handle returned by On(); pass it to Off() to remove the listener.
using ListenerId = uint64_t;

struct DispatcherOptions {
  int workers = 4;
  /// Deadline for async callbacks; the token is cancelled when it passes.
  std::chrono::milliseconds callback_timeout{5000};
  /// How long Stop() waits for running callbacks before abandoning them.
  std::chrono::milliseconds stop_grace{1000};
  /// Keepalive interval advertised by the device; zero disables liveness tracking.
  std::chrono::milliseconds keepalive_interval{0};

  static DispatcherOptions FromConfig(const Config& config);
};

/**
 * Routes notify-port property changes to registered callbacks.
 *
 * One receive thread decodes datagrams; callbacks run on a fixed worker
 * pool, one unit per callback, so a slow or throwing callback never stalls
 * the receive loop.
 *
 * With a keepalive interval set, the device counts as unresponsive once no
 * notification has arrived for 1.5 intervals.
 */
class Dispatcher {
 public:
  Dispatcher(std::shared_ptr<Transport> transport,
             DispatcherOptions options,
             Diagnostics& diagnostics);
  ~Dispatcher();

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  ListenerId On(const std::string& property, PropertyCallback callback);
  ListenerId On(const std::string& property, AsyncPropertyCallback callback);
  /// Remove a listener. Units already queued for it still run.
  bool Off(ListenerId id);

  /// Runs on a worker, like property callbacks.
  void SetLivenessCallback(LivenessCallback callback);

  /// @throws ConcurrencyError if already started.
  void Start();
  /**
   * Stop receiving, drop queued units and cancel running callbacks.
   *
   * Waits up to `stop_grace` for running callbacks. Workers still busy after
   * that are detached and finish on their own; no new unit starts once this
   * returns. Safe to call from inside a callback.
   */
  void Stop();
  bool IsRunning() const { return running_.load(); }

  /// When the device last reported the keepalive property.
  std::optional<std::chrono::steady_clock::time_point> LastKeepAlive() const;
  /// False while the device has missed its keepalive window.
  bool IsDeviceResponsive() const;

 private:
  struct Listener {
    ListenerId id = 0;
    AsyncPropertyCallback callback;
    bool async = false;
  };

  struct Unit {
    uint64_t id = 0;
    std::string property;
    std::string value;
    Listener listener;
    CancelToken token;
  };

  struct ActiveUnit {
    CancelToken token;
    std::optional<std::chrono::steady_clock::time_point> deadline;
    bool expired = false;
    std::thread::id worker;
  };

  // Worker-side state; shared with the worker threads so that a detached
  // worker never touches the Dispatcher itself.
  struct Pool;

  static void WorkerLoop(const std::shared_ptr<Pool>& pool,
                         std::chrono::milliseconds callback_timeout);
  static void RunUnit(Pool& pool, Unit& unit);

  ListenerId AddListener(const std::string& property, Listener listener);
  void ReceiveLoop();
  void HandleDatagram(const Datagram& datagram);
  void Submit(const std::string& property, const std::string& value);
  void Enqueue(const std::string& property,
               const std::string& value,
               std::vector<Listener> listeners);
  void ExpireOverdueUnits();
  void MarkActivity(bool keepalive);
  void CheckLiveness();
  void NotifyLiveness(const LivenessCallback& callback, bool responsive);
  std::chrono::milliseconds ReceiveSlice() const;

  std::shared_ptr<Transport> transport_;
  DispatcherOptions options_;
  Diagnostics& diagnostics_;

  std::atomic<bool> running_{false};
  bool started_ = false;
  std::thread receive_thread_;
  std::vector<std::thread> workers_;
  std::shared_ptr<Pool> pool_;

  mutable std::mutex listener_mutex_;
  std::map<std::string, std::vector<Listener>> listeners_;
  ListenerId next_listener_id_ = 1;

  std::optional<uint64_t> last_sequence_;

  mutable std::mutex liveness_mutex_;
  std::optional<std::chrono::steady_clock::time_point> last_keepalive_;
  std::chrono::steady_clock::time_point last_activity_;
  bool responsive_ = true;
  LivenessCallback liveness_callback_;
};

}  // namespace emotiva
