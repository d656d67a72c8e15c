#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "outflow/broadcast-config.hpp"
#include "outflow/live-connection.hpp"
#include "outflow/sse-event.hpp"

namespace outflow {

struct DeliveryReport {
  bool operator==(const DeliveryReport&) const noexcept = default;

  std::size_t delivered{};
  std::size_t failed{};
  std::size_t skippedClosed{};
  std::size_t pruned{};
};

struct BroadcastStats {
  // Serialize this stats snapshot to JSON (single object).
  [[nodiscard]] std::string json_str() const;

  bool operator==(const BroadcastStats&) const noexcept = default;

  uint64_t ticks{};
  uint64_t eventsDelivered{};
  uint64_t deliveryFailures{};
  uint64_t subscribersPruned{};
  uint64_t subscribersRejected{};
};

// Fans out events to a dynamic set of live connections.
//
// The subscriber registry is copy-on-write: registration swaps in a new immutable vector, and a delivery
// pass iterates the snapshot it took at its start, so subscribers may come and go during a pass.
// Delivery passes are serialized, every subscriber sees events in generation order.
// A failing subscriber never prevents delivery to the others. Closed subscribers are pruned after the pass.
//
// start() runs a producer on a dedicated thread, generating one event per period.
// The producer may call stop() or destroy the hub. LiveConnection::send() runs under the delivery lock:
// it must not call deliver() on the same hub, nor destroy it.
class BroadcastHub {
 public:
  using Producer = std::function<SseEvent()>;

  // Throws std::invalid_argument if the configuration is invalid.
  explicit BroadcastHub(BroadcastConfig config = {});

  BroadcastHub(const BroadcastHub&) = delete;
  BroadcastHub(BroadcastHub&&) = delete;
  BroadcastHub& operator=(const BroadcastHub&) = delete;
  BroadcastHub& operator=(BroadcastHub&&) = delete;

  // Stops the producer thread if running.
  // When run by the producer itself, the thread is detached and exits at its next check.
  ~BroadcastHub();

  // Register a subscriber. Returns false if a subscriber limit is reached.
  // Registering an already registered connection is a no-op returning true.
  bool onOpen(std::shared_ptr<LiveConnection> connection);

  // Unregister a subscriber. Idempotent.
  void onClose(const std::shared_ptr<LiveConnection>& connection);

  // Send 'event' to all open subscribers of the current snapshot.
  DeliveryReport deliver(const SseEvent& event);

  // Launch the producer thread: each period, call 'producer' and deliver its event.
  // Producer exceptions are logged and do not stop the loop.
  // Throws std::logic_error if already started.
  void start(Producer producer);

  // Request the producer thread to stop and wait for it. Idempotent.
  // No delivery is issued by the producer after this returns.
  // Called from the producer thread, only requests the stop. The thread is joined by the next stop()
  // issued from another thread, or by the destructor.
  void stop() noexcept;

  [[nodiscard]] bool running() const noexcept { return _running.load(std::memory_order_acquire); }

  [[nodiscard]] std::size_t subscriberCount() const;

  [[nodiscard]] BroadcastStats stats() const noexcept;

  [[nodiscard]] const BroadcastConfig& config() const noexcept { return _config; }

 private:
  using Subscribers = std::vector<std::shared_ptr<LiveConnection>>;

  [[nodiscard]] std::shared_ptr<const Subscribers> snapshot() const;

  [[nodiscard]] bool onProducerThread() const noexcept;

  std::size_t prune(const std::vector<const LiveConnection*>& closed);

  BroadcastConfig _config;

  mutable std::mutex _registryMutex;
  std::shared_ptr<const Subscribers> _subscribers;

  std::mutex _deliverMutex;

  std::mutex _lifecycleMutex;
  std::mutex _waitMutex;
  std::condition_variable_any _waitCv;
  std::stop_source _stopSource;
  std::jthread _thread;
  std::atomic<std::thread::id> _producerThreadId;
  std::atomic<bool> _running{false};

  std::atomic<uint64_t> _ticks{0};
  std::atomic<uint64_t> _eventsDelivered{0};
  std::atomic<uint64_t> _deliveryFailures{0};
  std::atomic<uint64_t> _subscribersPruned{0};
  std::atomic<uint64_t> _subscribersRejected{0};
};

}  // namespace outflow
