// tests/test_virtual_adapter.cpp
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <gtest/gtest.h>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "transport/virtual_adapter.hpp"

using namespace transport;
using namespace std::chrono_literals;

namespace
{
VirtualDevice make_tile(DeviceUuid uuid)
{
    VirtualDevice dev;
    dev.uuid            = uuid;
    dev.signal_strength = -45;
    dev.rpcs[{8, 0x0004}] = [](const Payload &) {
        return std::pair<std::uint8_t, Payload>(0, Payload{1, 0, 0});
    };
    dev.rpcs[{11, 0x8000}] = [](const Payload &in) {
        Payload out(in.rbegin(), in.rend());
        return std::pair<std::uint8_t, Payload>(0x40, out);
    };
    dev.debug_commands["dump_ram"] = [](const DebugArgs &args) -> std::optional<std::string> {
        auto it = args.find("offset");
        return std::string("ram@") + (it == args.end() ? "0" : it->second);
    };
    dev.debug_commands["broken"] = [](const DebugArgs &) -> std::optional<std::string> {
        return std::nullopt;
    };
    return dev;
}

// Waits for something to show up on an adapter thread.
template <typename Pred>
bool eventually(Pred p, std::chrono::milliseconds limit = 2000ms)
{
    const auto until = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < until)
    {
        if (p())
            return true;
        std::this_thread::sleep_for(5ms);
    }
    return p();
}

struct Fixture
{
    VirtualAdapter va{"virtual", 2};

    Fixture()
    {
        va.set_id(0);
        va.set_config(CFG_DEFAULT_TIMEOUT_MS, static_cast<std::int64_t>(300));
        va.add_device(make_tile(0x10));
        va.add_device(make_tile(0x20));
        va.start();
    }
};
}  // namespace

TEST(VirtualAdapter, StopIsIdempotentWithoutConnections)
{
    VirtualAdapter va;
    EXPECT_TRUE(va.start());
    va.stop();
    va.stop();
    EXPECT_EQ(va.connection_count(), 0u);
}

TEST(VirtualAdapter, ProbeAnnouncesEveryDevice)
{
    Fixture f;

    std::mutex                          mu;
    std::vector<std::pair<DeviceUuid, std::string>> seen;
    f.va.add_scan_callback([&](AdapterId, const DeviceInfo &info, std::chrono::seconds expiry) {
        EXPECT_EQ(expiry.count(), 0);
        std::lock_guard<std::mutex> lk(mu);
        seen.emplace_back(info.uuid, info.connection_string);
    });

    auto r = f.va.probe_sync();
    ASSERT_TRUE(r.success);

    std::lock_guard<std::mutex> lk(mu);
    ASSERT_GE(seen.size(), 2u);
    bool saw_10 = false, saw_20 = false;
    for (const auto &s : seen)
    {
        saw_10 |= s.first == 0x10 && s.second == device_slug(0x10);
        saw_20 |= s.first == 0x20 && s.second == device_slug(0x20);
    }
    EXPECT_TRUE(saw_10);
    EXPECT_TRUE(saw_20);
}

TEST(VirtualAdapter, ProbeWhenStoppedFails)
{
    VirtualAdapter va;
    auto           r = va.probe_sync();
    EXPECT_FALSE(r.success);
    EXPECT_EQ(*r.reason, "Adapter is not running");
}

TEST(VirtualAdapter, ConnectRpcDisconnect)
{
    Fixture f;

    auto r = f.va.connect_sync(1, device_slug(0x10));
    ASSERT_TRUE(r.success) << r.reason.value_or("");
    EXPECT_EQ(f.va.connection_count(), 1u);

    ASSERT_TRUE(f.va.open_interface_sync(1, Interface::Rpc).success);
    EXPECT_EQ(f.va.open_interfaces(1).count(Interface::Rpc), 1u);

    auto rpc = f.va.send_rpc_sync(1, 8, 0x0004, {}, 500ms);
    ASSERT_TRUE(rpc.success);
    EXPECT_EQ(*rpc.status, 0);
    EXPECT_EQ(*rpc.payload, (Payload{1, 0, 0}));

    rpc = f.va.send_rpc_sync(1, 11, 0x8000, Payload{1, 2, 3}, 500ms);
    ASSERT_TRUE(rpc.success);
    EXPECT_EQ(*rpc.status, 0x40);
    EXPECT_EQ(*rpc.payload, (Payload{3, 2, 1}));

    rpc = f.va.send_rpc_sync(1, 9, 0x1234, {}, 500ms);
    EXPECT_FALSE(rpc.success);
    EXPECT_EQ(*rpc.reason, "RPC 0x1234 not found at address 9");

    ASSERT_TRUE(f.va.disconnect_sync(1).success);
    EXPECT_EQ(f.va.connection_count(), 0u);
    EXPECT_TRUE(f.va.open_interfaces(1).empty());
}

TEST(VirtualAdapter, UnknownConnectionString)
{
    Fixture f;
    auto    r = f.va.connect_sync(1, "d--0000-0000-0000-0999");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.kind, ErrorKind::NotFound);
}

TEST(VirtualAdapter, CapacityIsEnforced)
{
    VirtualAdapter va("small", 1);
    va.add_device(make_tile(0x10));
    va.add_device(make_tile(0x20));
    va.start();

    ASSERT_TRUE(va.connect_sync(1, device_slug(0x10)).success);
    EXPECT_FALSE(va.can_connect());
    auto r = va.connect_sync(2, device_slug(0x20));
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.kind, ErrorKind::CapacityExhausted);
}

TEST(VirtualAdapter, InterfacesMustBeOpen)
{
    Fixture f;
    ASSERT_TRUE(f.va.connect_sync(1, device_slug(0x10)).success);

    auto rpc = f.va.send_rpc_sync(1, 8, 0x0004, {}, 500ms);
    EXPECT_FALSE(rpc.success);
    EXPECT_EQ(*rpc.reason, "RPC interface is not open");

    auto r = f.va.send_script_sync(1, Payload(10, 0));
    EXPECT_EQ(*r.reason, "Script interface is not open");

    auto dbg = f.va.debug_sync(1, "dump_ram", {});
    EXPECT_EQ(*dbg.reason, "Debug interface is not open");

    EXPECT_FALSE(f.va.push_report(0x10, Payload{1}));
}

TEST(VirtualAdapter, ScriptReportsProgressPerChunk)
{
    Fixture f;
    ASSERT_TRUE(f.va.connect_sync(1, device_slug(0x10)).success);
    ASSERT_TRUE(f.va.open_interface_sync(1, Interface::Script).success);

    Payload script(45);
    for (std::size_t i = 0; i < script.size(); ++i)
        script[i] = static_cast<std::uint8_t>(i);

    std::vector<std::pair<std::size_t, std::size_t>> progress;
    auto r = f.va.send_script_sync(1, script, [&](std::size_t done, std::size_t total) {
        progress.emplace_back(done, total);
    });
    ASSERT_TRUE(r.success);

    std::vector<std::pair<std::size_t, std::size_t>> want = {{20, 45}, {40, 45}, {45, 45}};
    EXPECT_EQ(progress, want);
    ASSERT_TRUE(f.va.last_script(0x10).has_value());
    EXPECT_EQ(*f.va.last_script(0x10), script);
    EXPECT_FALSE(f.va.last_script(0x20).has_value());
}

TEST(VirtualAdapter, DebugCommands)
{
    Fixture f;
    ASSERT_TRUE(f.va.connect_sync(1, device_slug(0x10)).success);
    ASSERT_TRUE(f.va.open_interface_sync(1, Interface::Debug).success);

    auto d = f.va.debug_sync(1, "dump_ram", {{"offset", "64"}});
    ASSERT_TRUE(d.success);
    EXPECT_EQ(*d.value, "ram@64");

    d = f.va.debug_sync(1, "broken", {});
    EXPECT_FALSE(d.success);
    EXPECT_EQ(*d.reason, "Debug command broken failed");

    d = f.va.debug_sync(1, "reflash", {});
    EXPECT_EQ(*d.reason, "Unknown debug command reflash");
}

TEST(VirtualAdapter, UnresponsiveDeviceTimesOut)
{
    Fixture f;
    ASSERT_TRUE(f.va.connect_sync(1, device_slug(0x10)).success);
    ASSERT_TRUE(f.va.open_interface_sync(1, Interface::Rpc).success);
    f.va.set_responsive(0x10, false);

    const auto t0  = std::chrono::steady_clock::now();
    auto       rpc = f.va.send_rpc_sync(1, 8, 0x0004, {}, 200ms);
    const auto dt  = std::chrono::steady_clock::now() - t0;
    EXPECT_FALSE(rpc.success);
    EXPECT_EQ(rpc.kind, ErrorKind::Timeout);
    EXPECT_EQ(*rpc.reason, "RPC timed out without response");
    EXPECT_LT(dt, 1500ms);

    // the link survives an operation timeout
    f.va.set_responsive(0x10, true);
    rpc = f.va.send_rpc_sync(1, 8, 0x0004, {}, 500ms);
    EXPECT_TRUE(rpc.success);

    f.va.set_responsive(0x20, false);
    auto r = f.va.connect_sync(2, device_slug(0x20));
    EXPECT_FALSE(r.success);
    EXPECT_EQ(*r.reason, "Connection attempt timed out");
    EXPECT_EQ(f.va.connection_count(), 1u);
}

TEST(VirtualAdapter, ReportsAndTracesNeedOpenChannels)
{
    Fixture f;

    std::mutex           mu;
    std::vector<Report>  reports;
    std::vector<Payload> traces;
    f.va.add_report_callback([&](ConnId id, const Report &r) {
        EXPECT_EQ(id, 1);
        std::lock_guard<std::mutex> lk(mu);
        reports.push_back(r);
    });
    f.va.add_trace_callback([&](ConnId, const Payload &p) {
        std::lock_guard<std::mutex> lk(mu);
        traces.push_back(p);
    });

    ASSERT_TRUE(f.va.connect_sync(1, device_slug(0x10)).success);
    ASSERT_TRUE(f.va.open_interface_sync(1, Interface::Streaming).success);
    ASSERT_TRUE(f.va.open_interface_sync(1, Interface::Tracing).success);

    EXPECT_TRUE(f.va.push_report(0x10, Payload{0xAA, 0xBB}));
    EXPECT_TRUE(f.va.push_trace(0x10, Payload{'h', 'i'}));

    ASSERT_TRUE(eventually([&] {
        std::lock_guard<std::mutex> lk(mu);
        return reports.size() == 1 && traces.size() == 1;
    }));
    std::lock_guard<std::mutex> lk(mu);
    EXPECT_EQ(reports[0].origin, 0x10u);
    EXPECT_EQ(reports[0].raw, (Payload{0xAA, 0xBB}));
    EXPECT_EQ(traces[0], (Payload{'h', 'i'}));
}

TEST(VirtualAdapter, DroppedLinkNotifiesAndFreesSlot)
{
    Fixture f;

    std::atomic<ConnId> dropped{-1};
    f.va.add_disconnect_callback([&](AdapterId, ConnId id) { dropped = id; });

    ASSERT_TRUE(f.va.connect_sync(4, device_slug(0x20)).success);
    ASSERT_TRUE(f.va.drop_connection(0x20));
    ASSERT_TRUE(eventually([&] { return dropped.load() == 4; }));
    EXPECT_TRUE(eventually([&] { return f.va.connection_count() == 0; }));

    // nothing left to disconnect
    auto r = f.va.disconnect_sync(4);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.kind, ErrorKind::NotFound);
}

TEST(VirtualAdapter, RemovedDeviceIsLost)
{
    Fixture f;

    std::atomic<DeviceUuid> lost{0};
    std::atomic<ConnId>     dropped{-1};
    f.va.add_device_lost_callback([&](AdapterId, DeviceUuid uuid) { lost = uuid; });
    f.va.add_disconnect_callback([&](AdapterId, ConnId id) { dropped = id; });

    ASSERT_TRUE(f.va.connect_sync(1, device_slug(0x10)).success);
    ASSERT_TRUE(f.va.remove_device(0x10));
    EXPECT_TRUE(eventually([&] { return lost.load() == 0x10u; }));
    EXPECT_TRUE(eventually([&] { return dropped.load() == 1; }));
    EXPECT_FALSE(f.va.remove_device(0x10));
}

TEST(VirtualAdapter, StopFailsPendingWork)
{
    VirtualAdapter va("virtual", 1);
    va.set_config(CFG_DEFAULT_TIMEOUT_MS, static_cast<std::int64_t>(5000));
    va.add_device(make_tile(0x10));
    va.start();
    va.set_responsive(0x10, false);

    std::mutex              mu;
    std::condition_variable cv;
    std::optional<Result>   got;
    va.connect_async(1, device_slug(0x10), [&](ConnId, AdapterId, const Result &r) {
        std::lock_guard<std::mutex> lk(mu);
        got = r;
        cv.notify_all();
    });
    std::this_thread::sleep_for(50ms);
    va.stop();

    std::unique_lock<std::mutex> lk(mu);
    ASSERT_TRUE(cv.wait_for(lk, 2s, [&] { return got.has_value(); }));
    EXPECT_FALSE(got->success);
    EXPECT_EQ(*got->reason, "Adapter stopped");
    EXPECT_EQ(got->kind, ErrorKind::UnexpectedDisconnect);
}

TEST(VirtualAdapter, DoubleStopWithOpenAndPendingConnections)
{
    VirtualAdapter va("virtual", 2);
    va.set_config(CFG_DEFAULT_TIMEOUT_MS, static_cast<std::int64_t>(5000));
    va.add_device(make_tile(0x10));
    va.add_device(make_tile(0x20));
    ASSERT_TRUE(va.start());

    ASSERT_TRUE(va.connect_sync(1, device_slug(0x10)).success);
    va.set_responsive(0x20, false);

    std::atomic<int> fired{0};
    va.connect_async(2, device_slug(0x20), [&](ConnId, AdapterId, const Result &r) {
        EXPECT_FALSE(r.success);
        ++fired;
    });
    ASSERT_TRUE(eventually([&] { return va.connection_count() == 2; }));

    va.stop();
    EXPECT_EQ(va.connection_count(), 0u);
    ASSERT_TRUE(eventually([&] { return fired.load() == 1; }));

    va.stop();
    EXPECT_EQ(va.connection_count(), 0u);
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(fired.load(), 1);
}
