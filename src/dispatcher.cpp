#include "emotiva/dispatcher.h"

#include "emotiva/errors.h"
#include "emotiva/xml_codec.h"

#include <algorithm>
#include <set>
#include <system_error>
#include <utility>

namespace emotiva {
namespace {

// Receive slice; also bounds how late an overdue async callback is noticed.
constexpr std::chrono::milliseconds kReceiveSlice{200};
constexpr std::chrono::milliseconds kMinReceiveSlice{10};
constexpr char kKeepAliveProperty[] = "keepalive";
constexpr char kLivenessUnit[] = "liveness";

}  // namespace

struct CancelToken::State {
  mutable std::mutex mutex;
  mutable std::condition_variable cv;
  bool cancelled = false;
};

CancelToken::CancelToken() : state_(std::make_shared<State>()) {}

bool CancelToken::IsCancelled() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->cancelled;
}

bool CancelToken::WaitFor(std::chrono::milliseconds duration) const {
  std::unique_lock<std::mutex> lock(state_->mutex);
  return state_->cv.wait_for(lock, duration, [this]() { return state_->cancelled; });
}

void CancelToken::Cancel() {
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->cancelled = true;
  }
  state_->cv.notify_all();
}

struct Dispatcher::Pool {
  std::mutex mutex;
  std::condition_variable queue_cv;
  std::condition_variable idle_cv;
  std::deque<Unit> queue;
  std::map<uint64_t, ActiveUnit> active;
  uint64_t next_unit_id = 1;
  bool stopping = false;

  // Cleared by Stop(); workers report through it only while it is set.
  std::mutex report_mutex;
  Diagnostics* diagnostics = nullptr;
};

DispatcherOptions DispatcherOptions::FromConfig(const Config& config) {
  DispatcherOptions options;
  options.workers = config.dispatcher_workers;
  options.callback_timeout = config.callback_timeout;
  options.stop_grace = config.stop_grace;
  return options;
}

Dispatcher::Dispatcher(std::shared_ptr<Transport> transport,
                       DispatcherOptions options,
                       Diagnostics& diagnostics)
    : transport_(std::move(transport)),
      options_(options),
      diagnostics_(diagnostics),
      pool_(std::make_shared<Pool>()) {
  pool_->diagnostics = &diagnostics_;
}

Dispatcher::~Dispatcher() { Stop(); }

ListenerId Dispatcher::On(const std::string& property, PropertyCallback callback) {
  if (!callback) {
    return 0;
  }
  Listener listener;
  listener.callback = [callback](const std::string& value, const CancelToken&) {
    callback(value);
  };
  listener.async = false;
  return AddListener(property, std::move(listener));
}

ListenerId Dispatcher::On(const std::string& property, AsyncPropertyCallback callback) {
  if (!callback) {
    return 0;
  }
  Listener listener;
  listener.callback = std::move(callback);
  listener.async = true;
  return AddListener(property, std::move(listener));
}

ListenerId Dispatcher::AddListener(const std::string& property, Listener listener) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listener.id = next_listener_id_++;
  const ListenerId id = listener.id;
  listeners_[property].push_back(std::move(listener));
  return id;
}

bool Dispatcher::Off(ListenerId id) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
    auto& entries = it->second;
    auto found = std::find_if(entries.begin(), entries.end(),
                              [id](const Listener& listener) { return listener.id == id; });
    if (found == entries.end()) {
      continue;
    }
    entries.erase(found);
    if (entries.empty()) {
      listeners_.erase(it);
    }
    return true;
  }
  return false;
}

void Dispatcher::SetLivenessCallback(LivenessCallback callback) {
  std::lock_guard<std::mutex> lock(liveness_mutex_);
  liveness_callback_ = std::move(callback);
}

void Dispatcher::Start() {
  if (started_) {
    throw ConcurrencyError("dispatcher already started");
  }
  started_ = true;
  running_ = true;
  {
    std::lock_guard<std::mutex> lock(liveness_mutex_);
    last_activity_ = std::chrono::steady_clock::now();
    responsive_ = true;
  }
  const int worker_count = std::max(1, options_.workers);
  try {
    for (int i = 0; i < worker_count; ++i) {
      std::shared_ptr<Pool> pool = pool_;
      const std::chrono::milliseconds callback_timeout = options_.callback_timeout;
      workers_.emplace_back([pool, callback_timeout]() { WorkerLoop(pool, callback_timeout); });
    }
    receive_thread_ = std::thread([this]() { ReceiveLoop(); });
  } catch (const std::system_error& ex) {
    diagnostics_.LogError(std::string("dispatcher thread start failed: ") + ex.what());
    Stop();
    throw ConcurrencyError(std::string("dispatcher thread start failed: ") + ex.what());
  }
  diagnostics_.LogDebug("dispatcher started with " + std::to_string(worker_count) +
                        " workers");
}

void Dispatcher::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  if (receive_thread_.joinable()) {
    receive_thread_.join();
  }

  const std::thread::id self = std::this_thread::get_id();
  const bool called_from_worker =
      std::any_of(workers_.begin(), workers_.end(),
                  [self](const std::thread& worker) { return worker.get_id() == self; });
  std::set<std::thread::id> busy;
  {
    std::unique_lock<std::mutex> lock(pool_->mutex);
    if (!pool_->queue.empty()) {
      diagnostics_.LogDebug("dropping " + std::to_string(pool_->queue.size()) +
                            " queued callbacks");
    }
    pool_->queue.clear();
    for (auto& entry : pool_->active) {
      entry.second.token.Cancel();
    }
    pool_->stopping = true;
    pool_->queue_cv.notify_all();
    // A callback that stops its own dispatcher stays active until it returns.
    const size_t own_units = called_from_worker ? 1 : 0;
    pool_->idle_cv.wait_for(lock, options_.stop_grace,
                            [this, own_units]() { return pool_->active.size() <= own_units; });
    for (const auto& entry : pool_->active) {
      if (entry.second.worker != self) {
        busy.insert(entry.second.worker);
      }
    }
  }
  if (!busy.empty()) {
    diagnostics_.LogWarning(std::to_string(busy.size()) + " callbacks still running after " +
                            std::to_string(options_.stop_grace.count()) +
                            "ms; leaving them to finish on detached workers");
  }
  {
    std::lock_guard<std::mutex> lock(pool_->report_mutex);
    pool_->diagnostics = nullptr;
  }
  for (auto& worker : workers_) {
    if (!worker.joinable()) {
      continue;
    }
    if (worker.get_id() == self || busy.count(worker.get_id()) != 0) {
      worker.detach();
    } else {
      worker.join();
    }
  }
  workers_.clear();
  diagnostics_.LogDebug("dispatcher stopped");
}

std::optional<std::chrono::steady_clock::time_point> Dispatcher::LastKeepAlive() const {
  std::lock_guard<std::mutex> lock(liveness_mutex_);
  return last_keepalive_;
}

bool Dispatcher::IsDeviceResponsive() const {
  std::lock_guard<std::mutex> lock(liveness_mutex_);
  return responsive_;
}

std::chrono::milliseconds Dispatcher::ReceiveSlice() const {
  if (options_.keepalive_interval.count() <= 0) {
    return kReceiveSlice;
  }
  return std::max(kMinReceiveSlice, std::min(kReceiveSlice, options_.keepalive_interval / 4));
}

void Dispatcher::ReceiveLoop() {
  const std::chrono::milliseconds slice = ReceiveSlice();
  while (running_) {
    ExpireOverdueUnits();
    CheckLiveness();
    try {
      HandleDatagram(transport_->Recv(PortRole::kNotify, slice));
    } catch (const ReceiveTimeoutError&) {
      continue;
    } catch (const NetworkError& ex) {
      if (!running_) {
        break;
      }
      diagnostics_.LogWarning(std::string("notify receive failed: ") + ex.what());
      std::this_thread::sleep_for(slice);
    }
  }
}

void Dispatcher::HandleDatagram(const Datagram& datagram) {
  XmlElement root;
  try {
    root = Decode(datagram.payload);
  } catch (const MalformedMessageError& ex) {
    diagnostics_.RecordParseError();
    diagnostics_.LogWarning("malformed notification from " + datagram.source_address + ": " +
                            ex.what());
    return;
  }
  if (root.tag != kNotifyTag) {
    diagnostics_.LogDebug("ignoring " + root.tag + " on notify port");
    return;
  }
  diagnostics_.RecordNotification();
  const Notification notification = ExtractNotification(root);
  if (notification.sequence) {
    if (last_sequence_ && *notification.sequence <= *last_sequence_) {
      diagnostics_.RecordStaleSequence();
      diagnostics_.LogDebug("notification sequence " +
                            std::to_string(*notification.sequence) + " after " +
                            std::to_string(*last_sequence_));
    } else {
      last_sequence_ = notification.sequence;
    }
  }
  MarkActivity(notification.properties.count(kKeepAliveProperty) != 0);
  for (const auto& entry : notification.properties) {
    Submit(entry.first, entry.second);
  }
}

void Dispatcher::MarkActivity(bool keepalive) {
  LivenessCallback callback;
  {
    std::lock_guard<std::mutex> lock(liveness_mutex_);
    const auto now = std::chrono::steady_clock::now();
    last_activity_ = now;
    if (keepalive) {
      last_keepalive_ = now;
    }
    if (responsive_) {
      return;
    }
    responsive_ = true;
    callback = liveness_callback_;
  }
  diagnostics_.LogInfo("device is sending notifications again");
  NotifyLiveness(callback, true);
}

void Dispatcher::CheckLiveness() {
  if (options_.keepalive_interval.count() <= 0) {
    return;
  }
  LivenessCallback callback;
  std::chrono::milliseconds silent{0};
  {
    std::lock_guard<std::mutex> lock(liveness_mutex_);
    silent = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - last_activity_);
    if (!responsive_ || silent * 2 <= options_.keepalive_interval * 3) {
      return;
    }
    responsive_ = false;
    callback = liveness_callback_;
  }
  diagnostics_.RecordMissedKeepAlive();
  diagnostics_.LogWarning("no notifications for " + std::to_string(silent.count()) +
                          "ms; keepalive interval is " +
                          std::to_string(options_.keepalive_interval.count()) + "ms");
  NotifyLiveness(callback, false);
}

// Liveness callbacks run on the worker pool like any other callback, so they
// may stop the dispatcher or disconnect the client.
void Dispatcher::NotifyLiveness(const LivenessCallback& callback, bool responsive) {
  if (!callback) {
    return;
  }
  Listener listener;
  listener.callback = [callback, responsive](const std::string&, const CancelToken&) {
    callback(responsive);
  };
  std::vector<Listener> listeners;
  listeners.push_back(std::move(listener));
  Enqueue(kLivenessUnit, responsive ? "responsive" : "silent", std::move(listeners));
}

void Dispatcher::Submit(const std::string& property, const std::string& value) {
  std::vector<Listener> listeners;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    auto it = listeners_.find(property);
    if (it == listeners_.end()) {
      return;
    }
    listeners = it->second;
  }
  Enqueue(property, value, std::move(listeners));
}

void Dispatcher::Enqueue(const std::string& property,
                         const std::string& value,
                         std::vector<Listener> listeners) {
  {
    std::lock_guard<std::mutex> lock(pool_->mutex);
    if (pool_->stopping) {
      return;
    }
    for (auto& listener : listeners) {
      Unit unit;
      unit.id = pool_->next_unit_id++;
      unit.property = property;
      unit.value = value;
      unit.listener = std::move(listener);
      pool_->queue.push_back(std::move(unit));
    }
  }
  pool_->queue_cv.notify_all();
}

void Dispatcher::WorkerLoop(const std::shared_ptr<Pool>& pool,
                            std::chrono::milliseconds callback_timeout) {
  while (true) {
    Unit unit;
    {
      std::unique_lock<std::mutex> lock(pool->mutex);
      pool->queue_cv.wait(lock, [&pool]() { return pool->stopping || !pool->queue.empty(); });
      if (pool->stopping) {
        return;
      }
      unit = std::move(pool->queue.front());
      pool->queue.pop_front();
      ActiveUnit active;
      active.token = unit.token;
      active.worker = std::this_thread::get_id();
      if (unit.listener.async) {
        active.deadline = std::chrono::steady_clock::now() + callback_timeout;
      }
      pool->active.emplace(unit.id, std::move(active));
    }
    RunUnit(*pool, unit);
    {
      std::lock_guard<std::mutex> lock(pool->mutex);
      pool->active.erase(unit.id);
    }
    pool->idle_cv.notify_all();
  }
}

void Dispatcher::RunUnit(Pool& pool, Unit& unit) {
  std::string failure;
  try {
    unit.listener.callback(unit.value, unit.token);
    return;
  } catch (const std::exception& ex) {
    failure = "callback for '" + unit.property + "' threw: " + ex.what();
  } catch (...) {
    failure = "callback for '" + unit.property + "' threw a non-standard exception";
  }
  std::lock_guard<std::mutex> lock(pool.report_mutex);
  if (pool.diagnostics) {
    pool.diagnostics->RecordCallbackException();
    pool.diagnostics->LogError(failure);
  }
}

void Dispatcher::ExpireOverdueUnits() {
  const auto now = std::chrono::steady_clock::now();
  std::lock_guard<std::mutex> lock(pool_->mutex);
  for (auto& entry : pool_->active) {
    ActiveUnit& active = entry.second;
    if (active.expired || !active.deadline || now < *active.deadline) {
      continue;
    }
    active.expired = true;
    active.token.Cancel();
    diagnostics_.RecordCallbackTimeout();
    diagnostics_.LogWarning("callback unit " + std::to_string(entry.first) + " exceeded " +
                            std::to_string(options_.callback_timeout.count()) + "ms");
  }
}

}  // namespace emotiva
