#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace constants
{
// Connection Manager worker: how long one dequeue waits before deadlines are re-checked
inline constexpr std::chrono::milliseconds CM_POLL_INTERVAL{100};

// Device Manager owning loop
inline constexpr std::chrono::milliseconds DEFAULT_SWEEP_INTERVAL{1000};
inline constexpr std::chrono::milliseconds DEFAULT_PERIODIC_INTERVAL{1000};
inline constexpr std::chrono::milliseconds DEFAULT_OP_TIMEOUT{5000};
inline constexpr std::size_t               DEFAULT_QUEUE_CAPACITY = 1024;

// Scan sightings from radio adapters stay valid this long unless refreshed
inline constexpr std::chrono::seconds BLE_SCAN_EXPIRY{60};

// Monitor ids: "<uuid hex>/<random hex>"
inline constexpr std::size_t MONITOR_SUFFIX_BYTES = 8;

// TileBus over BLE. Advertisement carries manufacturer data for this company id
// laid out as <u32 device uuid><u16 flags>, all little endian.
inline constexpr std::uint16_t ARCH_MANUFACTURER_ID = 0x03C0;
inline constexpr std::uint16_t ADV_FLAG_PENDING_DATA   = 1u << 0;
inline constexpr std::uint16_t ADV_FLAG_LOW_VOLTAGE    = 1u << 1;
inline constexpr std::uint16_t ADV_FLAG_USER_CONNECTED = 1u << 2;

inline constexpr std::string_view TILEBUS_SVC_UUID = "0ff60f63-132c-e611-ba53-f73f00200000";
inline constexpr std::string_view TILEBUS_STREAMING_UUID =
    "0ff60f63-132c-e611-ba53-f73f00200006";  // Notify
inline constexpr std::string_view TILEBUS_TRACING_UUID =
    "0ff60f63-132c-e611-ba53-f73f00200007";  // Notify

inline constexpr int BLUEZ_MAX_CONNECTIONS = 3;

}  // namespace constants
