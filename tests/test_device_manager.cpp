// tests/test_device_manager.cpp
#include <atomic>
#include <chrono>
#include <cstdint>
#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include "app/device_manager.hpp"
#include "transport/virtual_adapter.hpp"

using namespace app;
using namespace transport;
using namespace std::chrono_literals;

namespace
{
// Scan results on demand; no connections.
class ScanOnlyAdapter : public DeviceAdapter
{
  public:
    explicit ScanOnlyAdapter(bool start_ok = true) : start_ok_(start_ok) {}

    std::string name() const override { return "scan-only"; }
    bool        start() override { return start_ok_; }
    void        stop() override { stopped = true; }
    bool        can_connect() const override { return false; }

    void announce(DeviceUuid uuid, int rssi, std::chrono::seconds expiry)
    {
        DeviceInfo info;
        info.uuid              = uuid;
        info.connection_string = "scan:" + uuid_hex(uuid);
        info.signal_strength   = rssi;
        notify_scan(info, expiry);
    }

    std::atomic<bool> stopped{false};

  private:
    bool start_ok_;
};

VirtualDevice tile(DeviceUuid uuid, int rssi)
{
    VirtualDevice dev;
    dev.uuid            = uuid;
    dev.signal_strength = rssi;
    dev.rpcs[{8, 0x0004}] = [](const Payload &) {
        return std::pair<std::uint8_t, Payload>(0, Payload{1, 0, 0});
    };
    dev.debug_commands["dump_ram"] = [](const DebugArgs &) -> std::optional<std::string> {
        return std::string("00");
    };
    return dev;
}

config::ManagerSettings fast_settings()
{
    config::ManagerSettings s;
    s.sweep_interval    = 50ms;
    s.periodic_interval = 600000ms;
    s.default_timeout   = 300ms;
    return s;
}

template <typename Pred>
bool eventually(Pred p, std::chrono::milliseconds limit = 3000ms)
{
    const auto until = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < until)
    {
        if (p())
            return true;
        std::this_thread::sleep_for(10ms);
    }
    return p();
}

bool sees(DeviceManager &dm, DeviceUuid uuid)
{
    for (const auto &v : dm.scanned_devices())
        if (v.uuid == uuid)
            return true;
    return false;
}

// Two virtual adapters that both see tiles 0x10 and 0x20; "near" hears them louder
// but has a single slot.
struct TwoRadios
{
    std::shared_ptr<VirtualAdapter> far  = std::make_shared<VirtualAdapter>("far", 2);
    std::shared_ptr<VirtualAdapter> near = std::make_shared<VirtualAdapter>("near", 1);
    DeviceManager                   dm{fast_settings()};

    TwoRadios()
    {
        far->add_device(tile(0x10, -70));
        far->add_device(tile(0x20, -70));
        near->add_device(tile(0x10, -40));
        near->add_device(tile(0x20, -40));
        dm.add_adapter(far);
        dm.add_adapter(near);
        dm.start();
        dm.probe_sync();
    }
};
}  // namespace

TEST(DeviceManager, AggregatesRoutesStrongestFirst)
{
    TwoRadios r;
    auto      view = r.dm.scanned_devices();
    ASSERT_EQ(view.size(), 2u);

    const auto &d = view[0];
    EXPECT_EQ(d.uuid, 0x10u);
    EXPECT_EQ(d.connection_string, "device/10");
    ASSERT_EQ(d.adapters.size(), 2u);
    EXPECT_EQ(d.best_adapter, 1);
    EXPECT_EQ(d.signal_strength, -40);
    EXPECT_EQ(d.adapters[0].adapter, 1);
    EXPECT_EQ(d.adapters[1].adapter, 0);
    EXPECT_EQ(d.adapters[0].connection_string, device_slug(0x10));
    EXPECT_EQ(d.adapters[1].qualified_connection_string, "adapter/0/" + device_slug(0x10));
}

TEST(DeviceManager, RoutesToStrongestAdapterWithRoom)
{
    TwoRadios r;

    auto a = r.dm.connect_sync(0x10);
    ASSERT_TRUE(a.success) << a.reason.value_or("");
    EXPECT_EQ(r.near->connection_count(), 1u);
    EXPECT_EQ(r.far->connection_count(), 0u);

    // near is full now
    auto b = r.dm.connect_sync(0x20);
    ASSERT_TRUE(b.success) << b.reason.value_or("");
    EXPECT_EQ(r.near->connection_count(), 1u);
    EXPECT_EQ(r.far->connection_count(), 1u);
    EXPECT_EQ(r.dm.connection_count(), 2u);
}

TEST(DeviceManager, UnknownUuid)
{
    TwoRadios r;
    auto      res = r.dm.connect_sync(0x99);
    EXPECT_FALSE(res.success);
    EXPECT_EQ(*res.reason, "UUID not found");
    EXPECT_EQ(res.kind, ErrorKind::NotFound);
}

TEST(DeviceManager, NoRoomAnywhere)
{
    auto only = std::make_shared<VirtualAdapter>("only", 1);
    only->add_device(tile(0x10, -50));
    only->add_device(tile(0x20, -50));
    DeviceManager dm(fast_settings());
    dm.add_adapter(only);
    ASSERT_TRUE(dm.start());
    ASSERT_TRUE(dm.probe_sync().success);

    ASSERT_TRUE(dm.connect_sync(0x10).success);
    auto res = dm.connect_sync(0x20);
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.kind, ErrorKind::CapacityExhausted);
}

TEST(DeviceManager, ConnectionIdsAreNeverReused)
{
    TwoRadios r;

    auto first = r.dm.connect_sync(0x10);
    ASSERT_TRUE(first.success);
    EXPECT_EQ(*first.connection_id, 0);

    // far is the only route with room; its tile does not answer
    r.far->set_responsive(0x20, false);
    auto failed = r.dm.connect_sync(0x20);
    EXPECT_FALSE(failed.success);
    EXPECT_EQ(*failed.reason, "Connection attempt timed out");

    r.far->set_responsive(0x20, true);
    auto third = r.dm.connect_sync(0x20);
    ASSERT_TRUE(third.success);
    EXPECT_EQ(*third.connection_id, 2);

    ASSERT_TRUE(r.dm.disconnect_sync(0).success);
    auto fourth = r.dm.connect_sync(0x10);
    ASSERT_TRUE(fourth.success);
    EXPECT_EQ(*fourth.connection_id, 3);

    // attempts that never reach an adapter still use up an id
    EXPECT_EQ(r.dm.connect_sync(0x99).kind, ErrorKind::NotFound);
    EXPECT_EQ(r.dm.connect_string_sync("somewhere").kind, ErrorKind::NotFound);
    ASSERT_TRUE(r.dm.disconnect_sync(3).success);
    auto sixth = r.dm.connect_sync(0x10);
    ASSERT_TRUE(sixth.success);
    EXPECT_EQ(*sixth.connection_id, 6);
}

TEST(DeviceManager, ForwardsOperations)
{
    TwoRadios r;
    auto      c = r.dm.connect_sync(0x10);
    ASSERT_TRUE(c.success);
    const ConnId id = *c.connection_id;

    ASSERT_TRUE(r.dm.open_interface_sync(id, Interface::Rpc).success);
    // rpc id 0x0004: feature 0x00, command 0x04
    auto rpc = r.dm.send_rpc_sync(id, 8, 0x00, 0x04, {}, 500ms);
    ASSERT_TRUE(rpc.success) << rpc.reason.value_or("");
    EXPECT_EQ(*rpc.payload, (Payload{1, 0, 0}));
    EXPECT_EQ(r.dm.connection_state(id), LinkState::Idle);

    ASSERT_TRUE(r.dm.open_interface_sync(id, Interface::Script).success);
    std::vector<std::size_t> progress;
    auto s = r.dm.send_script_sync(id, Payload(30, 0xAB),
                                   [&](std::size_t done, std::size_t) { progress.push_back(done); });
    ASSERT_TRUE(s.success);
    EXPECT_EQ(progress, (std::vector<std::size_t>{20, 30}));

    ASSERT_TRUE(r.dm.open_interface_sync(id, Interface::Debug).success);
    auto d = r.dm.debug_sync(id, "dump_ram", {});
    ASSERT_TRUE(d.success);
    EXPECT_EQ(*d.value, "00");

    ASSERT_TRUE(r.dm.close_interface_sync(id, Interface::Rpc).success);
    ASSERT_TRUE(r.dm.disconnect_sync(id).success);
    EXPECT_FALSE(r.dm.connection_state(id).has_value());
}

TEST(DeviceManager, OperationsNeedAnIdleConnection)
{
    TwoRadios r;

    auto missing = r.dm.open_interface_sync(42, Interface::Rpc);
    EXPECT_FALSE(missing.success);
    EXPECT_EQ(missing.kind, ErrorKind::NotFound);
    EXPECT_EQ(*missing.reason, "Could not find connection id 42");

    // hold a connect attempt open
    r.near->set_config(CFG_DEFAULT_TIMEOUT_MS, static_cast<std::int64_t>(1000));
    r.near->set_responsive(0x10, false);
    std::atomic<bool> done{false};
    r.dm.connect(0x10, [&](const ConnectResult &) { done = true; });
    ASSERT_TRUE(eventually([&] { return r.dm.connection_state(0) == LinkState::Connecting; }));

    auto busy = r.dm.disconnect_sync(0);
    EXPECT_FALSE(busy.success);
    EXPECT_EQ(busy.kind, ErrorKind::InvalidState);
    auto rpc = r.dm.send_rpc_sync(0, 8, 0, 4, {}, 100ms);
    EXPECT_EQ(rpc.kind, ErrorKind::InvalidState);

    ASSERT_TRUE(eventually([&] { return done.load(); }));
    EXPECT_FALSE(r.dm.connection_state(0).has_value());
}

TEST(DeviceManager, ConnectionStrings)
{
    TwoRadios r;

    auto by_device = r.dm.connect_string_sync("device/10");
    ASSERT_TRUE(by_device.success) << by_device.reason.value_or("");
    EXPECT_EQ(r.near->connection_count(), 1u);

    // forces the weaker adapter
    auto forced = r.dm.connect_string_sync("adapter/0/" + device_slug(0x20));
    ASSERT_TRUE(forced.success) << forced.reason.value_or("");
    EXPECT_EQ(r.far->connection_count(), 1u);

    auto full = r.dm.connect_string_sync("adapter/1/" + device_slug(0x20));
    EXPECT_FALSE(full.success);
    EXPECT_EQ(full.kind, ErrorKind::CapacityExhausted);

    EXPECT_EQ(r.dm.connect_string_sync("adapter/7/x").kind, ErrorKind::NotFound);
    EXPECT_EQ(r.dm.connect_string_sync("device/zz").kind, ErrorKind::NotFound);
    EXPECT_EQ(r.dm.connect_string_sync("somewhere").kind, ErrorKind::NotFound);
}

TEST(DeviceManager, UnexpectedDisconnectReachesMonitors)
{
    std::mutex                   mu;
    std::vector<DisconnectEvent> drops;

    TwoRadios r;
    auto      mon = r.dm.register_monitor(0x10, std::vector<std::string>{"disconnection"},
                                          [&](DeviceUuid, EventKind, const DeviceEvent &ev) {
                                         std::lock_guard<std::mutex> lk(mu);
                                         drops.push_back(std::get<DisconnectEvent>(ev));
                                     });
    ASSERT_TRUE(mon.has_value());

    auto c = r.dm.connect_sync(0x10);
    ASSERT_TRUE(c.success);
    ASSERT_TRUE(r.near->drop_connection(0x10));

    ASSERT_TRUE(eventually([&] {
        std::lock_guard<std::mutex> lk(mu);
        return drops.size() == 1;
    }));
    {
        std::lock_guard<std::mutex> lk(mu);
        EXPECT_EQ(drops[0].connection_id, *c.connection_id);
        EXPECT_EQ(drops[0].reason, "Unexpected disconnection");
    }
    EXPECT_FALSE(r.dm.connection_state(*c.connection_id).has_value());
    EXPECT_TRUE(r.dm.remove_monitor(*mon));
}

TEST(DeviceManager, ReportsAndScansReachMonitors)
{
    std::mutex               mu;
    std::vector<std::string> seen;

    TwoRadios r;
    auto      mon = r.dm.register_monitor(
        std::nullopt, std::set<EventKind>{EventKind::Report, EventKind::Trace},
        [&](DeviceUuid uuid, EventKind kind, const DeviceEvent &) {
            std::lock_guard<std::mutex> lk(mu);
            seen.push_back(std::string(event_name(kind)) + ":" + uuid_hex(uuid));
        });
    ASSERT_TRUE(mon.has_value());

    auto c = r.dm.connect_sync(0x10);
    ASSERT_TRUE(c.success);
    ASSERT_TRUE(r.dm.open_interface_sync(*c.connection_id, Interface::Streaming).success);
    ASSERT_TRUE(r.near->push_report(0x10, Payload{1, 2, 3}));
    ASSERT_TRUE(eventually([&] {
        std::lock_guard<std::mutex> lk(mu);
        return seen.size() == 1;
    }));

    // add scans while listening
    ASSERT_TRUE(r.dm.adjust_monitor(*mon, {EventKind::DeviceSeen}, {EventKind::Report}));
    ASSERT_TRUE(r.dm.probe_sync().success);
    std::lock_guard<std::mutex> lk(mu);
    EXPECT_EQ(seen[0], "report:10");
    ASSERT_GT(seen.size(), 1u);
    EXPECT_EQ(seen.back().rfind("device_seen:", 0), 0u);
}

TEST(DeviceManager, MalformedMonitorNamesRejected)
{
    DeviceManager dm(fast_settings());
    auto          cb = [](DeviceUuid, EventKind, const DeviceEvent &) {};
    EXPECT_FALSE(dm.register_monitor(0x10, std::vector<std::string>{"report", "reportz"}, cb)
                     .has_value());
    EXPECT_TRUE(dm.register_monitor(0x10, std::vector<std::string>{"report", "progress"}, cb)
                    .has_value());
    EXPECT_FALSE(dm.adjust_monitor("nope", {EventKind::Report}, {}));
    EXPECT_FALSE(dm.remove_monitor("nope"));
}

TEST(DeviceManager, ScanRecordsExpire)
{
    auto          radio = std::make_shared<ScanOnlyAdapter>();
    DeviceManager dm(fast_settings());
    dm.add_adapter(radio);
    ASSERT_TRUE(dm.start());

    radio->announce(0x10, -50, 1s);
    radio->announce(0x20, -50, 0s);  // never expires
    ASSERT_TRUE(eventually([&] { return sees(dm, 0x10) && sees(dm, 0x20); }));

    ASSERT_TRUE(eventually([&] { return !sees(dm, 0x10); }));
    EXPECT_TRUE(sees(dm, 0x20));
}

TEST(DeviceManager, ExpiredRecordsHiddenBeforeSweep)
{
    auto settings           = fast_settings();
    settings.sweep_interval = 600000ms;

    auto          radio = std::make_shared<ScanOnlyAdapter>();
    DeviceManager dm(settings);
    dm.add_adapter(radio);
    ASSERT_TRUE(dm.start());

    radio->announce(0x10, -50, 1s);
    ASSERT_TRUE(eventually([&] { return sees(dm, 0x10); }));

    std::this_thread::sleep_for(1100ms);
    EXPECT_FALSE(sees(dm, 0x10));
    auto res = dm.connect_sync(0x10);
    EXPECT_FALSE(res.success);
    EXPECT_EQ(*res.reason, "UUID not found");
}

TEST(DeviceManager, DeviceLostDropsOnlyThatRoute)
{
    TwoRadios r;
    r.dm.device_lost(1, 0x10);

    ASSERT_TRUE(eventually([&] {
        for (const auto &v : r.dm.scanned_devices())
            if (v.uuid == 0x10)
                return v.adapters.size() == 1;
        return false;
    }));
    r.dm.device_lost(0, 0x10);
    ASSERT_TRUE(eventually([&] { return !sees(r.dm, 0x10); }));
    EXPECT_TRUE(sees(r.dm, 0x20));
}

TEST(DeviceManager, ProbeNeedsACapableAdapter)
{
    auto          radio = std::make_shared<ScanOnlyAdapter>();
    DeviceManager dm(fast_settings());
    dm.add_adapter(radio);
    ASSERT_TRUE(dm.start());

    auto r = dm.probe_sync();
    EXPECT_FALSE(r.success);
    EXPECT_EQ(*r.reason, "No adapter supports probing");
}

TEST(DeviceManager, StartRollsBackOnFailure)
{
    auto good = std::make_shared<ScanOnlyAdapter>(true);
    auto bad  = std::make_shared<ScanOnlyAdapter>(false);

    DeviceManager dm(fast_settings());
    dm.add_adapter(good);
    dm.add_adapter(bad);
    EXPECT_FALSE(dm.start());
    EXPECT_FALSE(dm.running());
    EXPECT_TRUE(good->stopped.load());
}

TEST(DeviceManager, AdaptersOnlyBeforeStart)
{
    DeviceManager dm(fast_settings());
    EXPECT_EQ(dm.add_adapter(std::make_shared<ScanOnlyAdapter>()), 0);
    EXPECT_FALSE(dm.add_adapter(nullptr).has_value());
    ASSERT_TRUE(dm.start());
    EXPECT_FALSE(dm.add_adapter(std::make_shared<ScanOnlyAdapter>()).has_value());

    dm.stop();
    dm.stop();
    EXPECT_FALSE(dm.running());
}

TEST(DeviceManager, BlockingCallsNeedARunningManager)
{
    DeviceManager dm(fast_settings());
    auto          res = dm.connect_sync(0x10);
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.kind, ErrorKind::InvalidState);
    EXPECT_EQ(dm.disconnect_sync(0).kind, ErrorKind::InvalidState);
}

TEST(DeviceManager, AsyncCallsAfterStopStillComplete)
{
    TwoRadios r;
    r.dm.stop();

    std::vector<std::string> reasons;
    auto on_result = [&](const Result &res) {
        EXPECT_EQ(res.kind, ErrorKind::InvalidState);
        reasons.push_back(res.reason.value_or(""));
    };
    r.dm.connect(0x10, [&](const ConnectResult &res) {
        EXPECT_FALSE(res.connection_id.has_value());
        reasons.push_back(res.reason.value_or(""));
    });
    r.dm.connect_string("device/10",
                        [&](const ConnectResult &res) { reasons.push_back(res.reason.value_or("")); });
    r.dm.disconnect(5, on_result);
    r.dm.open_interface(0, Interface::Rpc, on_result);
    r.dm.close_interface(0, Interface::Rpc, on_result);
    r.dm.send_rpc(0, 8, 0, 4, {}, 100ms,
                  [&](const RpcResult &res) { reasons.push_back(res.reason.value_or("")); });
    r.dm.send_script(0, Payload{1}, nullptr, on_result);
    r.dm.debug(0, "dump_ram", {}, nullptr,
               [&](const DebugResult &res) { reasons.push_back(res.reason.value_or("")); });
    r.dm.probe(on_result);

    // refusals are delivered on the calling thread
    ASSERT_EQ(reasons.size(), 9u);
    for (const auto &reason : reasons)
        EXPECT_EQ(reason, "Device manager is not running");
}

TEST(DeviceManager, DefaultTimeoutIsPushedToAdapters)
{
    auto          va = std::make_shared<VirtualAdapter>();
    DeviceManager dm(fast_settings());
    dm.add_adapter(va);
    auto v = va->get_config(CFG_DEFAULT_TIMEOUT_MS);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(std::get<std::int64_t>(*v), 300);
}
