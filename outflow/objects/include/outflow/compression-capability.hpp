#pragma once

#include <cstdint>
#include <variant>

namespace outflow {

// Runtime availability of the optional brotli backend.
// Computed once per process by Probe() and treated as immutable afterwards.
class CompressionCapability {
 public:
  struct Available {
    bool operator==(const Available&) const noexcept = default;

    uint32_t encoderVersion;  // as reported by BrotliEncoderVersion(), 0xMMMmmmppp
  };

  struct Unavailable {
    bool operator==(const Unavailable&) const noexcept = default;
  };

  using State = std::variant<Unavailable, Available>;

  // Check whether an encoder instance can actually be created. Never throws, never re-run by Process().
  [[nodiscard]] static CompressionCapability Probe() noexcept;

  // Process-wide capability, probed on first call (the server calls it at startup, before any concurrent use).
  [[nodiscard]] static const CompressionCapability& Process() noexcept;

  [[nodiscard]] static CompressionCapability MakeAvailable(uint32_t encoderVersion) noexcept {
    return CompressionCapability(Available{encoderVersion});
  }

  [[nodiscard]] static CompressionCapability MakeUnavailable() noexcept { return CompressionCapability(Unavailable{}); }

  [[nodiscard]] bool isAvailable() const noexcept { return std::holds_alternative<Available>(_state); }

  // 0 when unavailable.
  [[nodiscard]] uint32_t encoderVersion() const noexcept {
    const auto* available = std::get_if<Available>(&_state);
    return available == nullptr ? 0U : available->encoderVersion;
  }

  [[nodiscard]] const State& state() const noexcept { return _state; }

  bool operator==(const CompressionCapability&) const noexcept = default;

 private:
  explicit CompressionCapability(State state) noexcept : _state(state) {}

  State _state;
};

}  // namespace outflow
