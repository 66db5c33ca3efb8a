// include/transport/bluez_adapter_impl.hpp
#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

struct sd_bus;
struct sd_bus_slot;

#include "transport/bluez_adapter.hpp"
#include "util/work_queue.hpp"

namespace transport
{

// One in-flight Device1.Connect / Disconnect.
struct BluezAdapter::BusCall
{
    BluezAdapter *self{nullptr};
    std::string   path;
    ConnId        id{0};
    OpToken       token{0};
    bool          connect{false};
#if TILELINK_HAVE_SDBUS
    sd_bus_slot *slot{nullptr};
#endif
};

struct BluezAdapter::Impl
{
#if TILELINK_HAVE_SDBUS
    sd_bus *bus = nullptr;

    // serialize all sd-bus access
    std::mutex bus_mu;

    sd_bus_slot     *added_slot   = nullptr;
    sd_bus_slot     *removed_slot = nullptr;
    sd_bus_slot     *props_slot   = nullptr;
    std::atomic_bool discovery_on{false};
    bool             uuid_filter_ok{false};

    // Guarded by bus_mu: replies run under bus_mu.
    std::list<std::unique_ptr<BusCall>> calls;
#endif
    std::thread loop;
    std::string adapter_path;  // "/org/bluez/hci0"

    // Work handed to the bus thread (probe, discovery restarts).
    util::WorkQueue<std::function<void()>> tasks;

    // ---- Sighting cache (merged across partial PropertiesChanged) ----
    struct Sighting
    {
        std::string               addr;  // "AA:BB:CC:DD:EE:FF"
        std::int16_t              rssi{0};
        std::optional<TileAdvert> advert;
    };
    std::mutex                                seen_mu;
    std::unordered_map<std::string, Sighting> seen;  // by device path

    // characteristic path -> (connection, interface) while notifications are on
    std::unordered_map<std::string, std::pair<ConnId, Interface>> notifying;  // seen_mu
};

}  // namespace transport
