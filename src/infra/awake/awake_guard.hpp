#pragma once

#include <cstdint>
#include <string_view>
#include "../error_handler/error.hpp"

namespace pcopy::infra {

enum class AwakeScope {
    Disabled,
    DisplayOnly,
    System,
};

[[nodiscard]] auto to_string(AwakeScope scope) -> std::string_view;

// Power-management binding: the only OS surface the copy run talks to.
class PowerManager {
public:
    virtual ~PowerManager() = default;

    // Returns an opaque token identifying the inhibition.
    [[nodiscard]] virtual auto acquire(AwakeScope scope, std::string_view reason)
        -> Result<std::uint64_t> = 0;
    virtual void release(std::uint64_t token) noexcept = 0;
};

// Holds a sleep inhibition while alive. Released exactly once: on release(),
// on destruction or when moved-over; moved-from leases hold nothing.
class AwakeLease {
public:
    AwakeLease() = default;
    AwakeLease(PowerManager& manager, std::uint64_t token) noexcept;
    ~AwakeLease();

    AwakeLease(AwakeLease&& other) noexcept;
    AwakeLease& operator=(AwakeLease&& other) noexcept;
    AwakeLease(const AwakeLease&) = delete;
    AwakeLease& operator=(const AwakeLease&) = delete;

    void release() noexcept;
    [[nodiscard]] auto held() const noexcept -> bool { return manager_ != nullptr; }

private:
    PowerManager* manager_ = nullptr;
    std::uint64_t token_ = 0;
};

/// Best-effort: a refused capability logs a warning and yields an empty lease.
[[nodiscard]] auto acquire_awake(AwakeScope scope, PowerManager& manager,
                                 std::string_view reason = "Copying files") -> AwakeLease;

/// Platform binding: systemd-inhibit on Linux, caffeinate on macOS,
/// SetThreadExecutionState on Windows.
[[nodiscard]] auto system_power_manager() -> PowerManager&;

} // namespace pcopy::infra
