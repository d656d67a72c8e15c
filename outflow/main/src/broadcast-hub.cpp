#include "outflow/broadcast-hub.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iterator>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "outflow/broadcast-config.hpp"
#include "outflow/live-connection.hpp"
#include "outflow/log.hpp"
#include "outflow/sse-event.hpp"
#include "outflow/timedef.hpp"

namespace outflow {

std::string BroadcastStats::json_str() const {
  std::string out;
  out.reserve(160UL);
  fmt::format_to(std::back_inserter(out),
                 R"({{"ticks":{},"eventsDelivered":{},"deliveryFailures":{},"subscribersPruned":{},)"
                 R"("subscribersRejected":{}}})",
                 ticks, eventsDelivered, deliveryFailures, subscribersPruned, subscribersRejected);
  return out;
}

BroadcastHub::BroadcastHub(BroadcastConfig config)
    : _config(std::move(config)), _subscribers(std::make_shared<const Subscribers>()) {
  _config.validate();
}

BroadcastHub::~BroadcastHub() {
  if (onProducerThread()) {
    // Destroyed by its own producer: the loop exits without touching the hub once stop is requested.
    _stopSource.request_stop();
    _thread.detach();
    return;
  }
  stop();
}

bool BroadcastHub::onProducerThread() const noexcept {
  return _producerThreadId.load(std::memory_order_acquire) == std::this_thread::get_id();
}

std::shared_ptr<const BroadcastHub::Subscribers> BroadcastHub::snapshot() const {
  std::lock_guard<std::mutex> lock(_registryMutex);
  return _subscribers;
}

bool BroadcastHub::onOpen(std::shared_ptr<LiveConnection> connection) {
  if (!connection) {
    throw std::invalid_argument("BroadcastHub: null connection");
  }
  std::lock_guard<std::mutex> lock(_registryMutex);
  const Subscribers& current = *_subscribers;
  if (std::ranges::find(current, connection) != current.end()) {
    return true;
  }
  if (_config.maxSubscribers != 0 && current.size() >= _config.maxSubscribers) {
    _subscribersRejected.fetch_add(1, std::memory_order_relaxed);
    log::warn("Subscriber {} rejected, limit of {} subscribers reached", connection->clientIdentity(),
              _config.maxSubscribers);
    return false;
  }
  if (_config.maxSubscribersPerClient != 0) {
    const auto clientCount = std::ranges::count_if(current, [&connection](const auto& sub) {
      return sub->clientIdentity() == connection->clientIdentity();
    });
    if (static_cast<std::size_t>(clientCount) >= _config.maxSubscribersPerClient) {
      _subscribersRejected.fetch_add(1, std::memory_order_relaxed);
      log::warn("Subscriber {} rejected, limit of {} subscribers per client reached", connection->clientIdentity(),
                _config.maxSubscribersPerClient);
      return false;
    }
  }
  auto next = std::make_shared<Subscribers>(current);
  next->push_back(std::move(connection));
  log::debug("Subscriber {} registered, {} live", next->back()->clientIdentity(), next->size());
  _subscribers = std::move(next);
  return true;
}

void BroadcastHub::onClose(const std::shared_ptr<LiveConnection>& connection) {
  std::lock_guard<std::mutex> lock(_registryMutex);
  const Subscribers& current = *_subscribers;
  const auto it = std::ranges::find(current, connection);
  if (it == current.end()) {
    return;
  }
  auto next = std::make_shared<Subscribers>();
  next->reserve(current.size() - 1U);
  std::ranges::copy_if(current, std::back_inserter(*next), [&connection](const auto& sub) { return sub != connection; });
  _subscribers = std::move(next);
}

std::size_t BroadcastHub::prune(const std::vector<const LiveConnection*>& closed) {
  std::lock_guard<std::mutex> lock(_registryMutex);
  const Subscribers& current = *_subscribers;
  auto next = std::make_shared<Subscribers>();
  next->reserve(current.size());
  std::ranges::copy_if(current, std::back_inserter(*next),
                       [&closed](const auto& sub) { return std::ranges::find(closed, sub.get()) == closed.end(); });
  const std::size_t nbPruned = current.size() - next->size();
  if (nbPruned != 0) {
    _subscribers = std::move(next);
  }
  return nbPruned;
}

DeliveryReport BroadcastHub::deliver(const SseEvent& event) {
  std::lock_guard<std::mutex> deliverLock(_deliverMutex);

  const auto subscribers = snapshot();

  DeliveryReport report;
  std::vector<const LiveConnection*> closed;
  for (const auto& sub : *subscribers) {
    if (!sub->isOpen()) {
      ++report.skippedClosed;
      closed.push_back(sub.get());
      continue;
    }
    const auto sendStart = SteadyClock::now();
    bool sent;
    try {
      sent = sub->send(event);
    } catch (const std::exception& ex) {
      log::debug("Send to subscriber {} threw: {}", sub->clientIdentity(), ex.what());
      sent = false;
    } catch (...) {
      log::debug("Send to subscriber {} threw an unknown exception", sub->clientIdentity());
      sent = false;
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - sendStart);
    if (elapsed > _config.slowSendThreshold) {
      log::warn("Slow subscriber {}: send took {} ms", sub->clientIdentity(), elapsed.count());
    }
    if (sent) {
      ++report.delivered;
    } else {
      ++report.failed;
      log::debug("Delivery of '{}' event to subscriber {} failed", event.eventType(), sub->clientIdentity());
    }
    if (!sub->isOpen()) {
      closed.push_back(sub.get());
    }
  }

  if (!closed.empty()) {
    report.pruned = prune(closed);
  }

  _eventsDelivered.fetch_add(report.delivered, std::memory_order_relaxed);
  _deliveryFailures.fetch_add(report.failed, std::memory_order_relaxed);
  _subscribersPruned.fetch_add(report.pruned, std::memory_order_relaxed);
  return report;
}

void BroadcastHub::start(Producer producer) {
  if (onProducerThread()) {
    throw std::logic_error("BroadcastHub cannot be started from its own producer");
  }
  std::lock_guard<std::mutex> lock(_lifecycleMutex);
  if (_thread.joinable()) {
    throw std::logic_error("BroadcastHub already started");
  }
  _stopSource = std::stop_source();
  _running.store(true, std::memory_order_release);
  log::info("Broadcast hub started, period {} ms", _config.period.count());
  _thread = std::jthread([this, token = _stopSource.get_token(), producer = std::move(producer)] {
    _producerThreadId.store(std::this_thread::get_id(), std::memory_order_release);
    while (true) {
      {
        std::unique_lock<std::mutex> waitLock(_waitMutex);
        // Woken up early by a stop request.
        if (_waitCv.wait_for(waitLock, token, _config.period, [&token] { return token.stop_requested(); })) {
          break;
        }
      }
      _ticks.fetch_add(1, std::memory_order_relaxed);
      try {
        const SseEvent event = producer();
        // The producer may have stopped or destroyed the hub.
        if (token.stop_requested()) {
          break;
        }
        deliver(event);
      } catch (const std::exception& ex) {
        log::error("Broadcast producer failed: {}", ex.what());
      } catch (...) {
        log::error("Broadcast producer failed with an unknown exception");
      }
    }
  });
}

void BroadcastHub::stop() noexcept {
  if (onProducerThread()) {
    // Cannot join itself: the loop exits at its next check, a later stop() from another thread joins it.
    _stopSource.request_stop();
    _running.store(false, std::memory_order_release);
    return;
  }
  std::lock_guard<std::mutex> lock(_lifecycleMutex);
  if (!_thread.joinable()) {
    return;
  }
  _stopSource.request_stop();
  _thread.join();
  _thread = std::jthread();
  _producerThreadId.store(std::thread::id{}, std::memory_order_release);
  _running.store(false, std::memory_order_release);
  log::info("Broadcast hub stopped after {} ticks", _ticks.load(std::memory_order_relaxed));
}

std::size_t BroadcastHub::subscriberCount() const { return snapshot()->size(); }

BroadcastStats BroadcastHub::stats() const noexcept {
  return {_ticks.load(std::memory_order_relaxed), _eventsDelivered.load(std::memory_order_relaxed),
          _deliveryFailures.load(std::memory_order_relaxed), _subscribersPruned.load(std::memory_order_relaxed),
          _subscribersRejected.load(std::memory_order_relaxed)};
}

}  // namespace outflow
