// tests/test_monitors.cpp
#include <gtest/gtest.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "app/monitors.hpp"

using namespace app;

namespace
{
DeviceEvent report_from(transport::ConnId id)
{
    ReportEvent ev;
    ev.connection_id = id;
    ev.report.raw    = transport::Payload{1, 2, 3};
    return ev;
}

DeviceEvent dropped(transport::ConnId id)
{
    return DisconnectEvent{id, "Unexpected disconnection"};
}
}  // namespace

TEST(Monitors, EventNames)
{
    for (auto k : {EventKind::DeviceSeen, EventKind::Report, EventKind::Trace,
                   EventKind::Disconnection, EventKind::Progress})
    {
        auto back = parse_event_name(event_name(k));
        ASSERT_TRUE(back.has_value());
        EXPECT_EQ(*back, k);
    }
    EXPECT_FALSE(parse_event_name("reports").has_value());
    EXPECT_FALSE(parse_event_name("").has_value());
    EXPECT_EQ(kind_of(report_from(1)), EventKind::Report);
    EXPECT_EQ(kind_of(dropped(1)), EventKind::Disconnection);
}

TEST(Monitors, IdCombinesUuidAndRandomSuffix)
{
    MonitorTable t;
    auto         cb = [](transport::DeviceUuid, EventKind, const DeviceEvent &) {};

    auto a = t.add(0xabc, {EventKind::Report}, cb);
    auto b = t.add(0xabc, {EventKind::Report}, cb);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_NE(*a, *b);
    EXPECT_EQ(a->rfind("abc/", 0), 0u);
    EXPECT_EQ(a->size(), std::string("abc/").size() + 16);

    auto any = t.add(std::nullopt, {EventKind::Report}, cb);
    ASSERT_TRUE(any.has_value());
    EXPECT_EQ(any->rfind("*/", 0), 0u);
    EXPECT_EQ(t.size(), 3u);

    EXPECT_FALSE(t.add(0xabc, {EventKind::Report}, nullptr).has_value());
}

TEST(Monitors, DispatchFiltersByDeviceAndKind)
{
    MonitorTable             t;
    std::vector<std::string> got;

    t.add(0x10, {EventKind::Report},
          [&](transport::DeviceUuid, EventKind, const DeviceEvent &) { got.push_back("r10"); });
    t.add(0x20, {EventKind::Report, EventKind::Disconnection},
          [&](transport::DeviceUuid, EventKind k, const DeviceEvent &) {
              got.push_back(std::string(event_name(k)) + "20");
          });
    t.add(std::nullopt, {EventKind::Disconnection},
          [&](transport::DeviceUuid uuid, EventKind, const DeviceEvent &) {
              got.push_back("any" + transport::uuid_hex(uuid));
          });

    t.dispatch(0x10, report_from(1));
    t.dispatch(0x20, dropped(2));
    t.dispatch(0x30, report_from(3));

    // monitors run in id order; "*/..." sorts before hex ids
    std::vector<std::string> want = {"r10", "any20", "disconnection20"};
    EXPECT_EQ(got, want);
}

TEST(Monitors, AdjustAndRemove)
{
    MonitorTable t;
    int          reports = 0, drops = 0;
    auto         id      = t.add(0x10, {EventKind::Report},
                                 [&](transport::DeviceUuid, EventKind k, const DeviceEvent &) {
                          if (k == EventKind::Report)
                              ++reports;
                          else
                              ++drops;
                      });
    ASSERT_TRUE(id.has_value());

    EXPECT_TRUE(t.adjust(*id, {EventKind::Disconnection}, {EventKind::Report}));
    t.dispatch(0x10, report_from(1));
    t.dispatch(0x10, dropped(1));
    EXPECT_EQ(reports, 0);
    EXPECT_EQ(drops, 1);

    EXPECT_TRUE(t.remove(*id));
    EXPECT_FALSE(t.contains(*id));
    t.dispatch(0x10, dropped(1));
    EXPECT_EQ(drops, 1);

    EXPECT_FALSE(t.remove(*id));
    EXPECT_FALSE(t.adjust("10/0000000000000000", {}, {}));
}

TEST(Monitors, ChangesDuringDispatchApplyAfterwards)
{
    MonitorTable               t;
    int                        first = 0, late = 0;
    std::optional<std::string> self;

    self = t.add(0x10, {EventKind::Report},
                 [&](transport::DeviceUuid, EventKind, const DeviceEvent &) {
                     ++first;
                     // stop listening and hand over to a new monitor
                     EXPECT_TRUE(t.remove(*self));
                     EXPECT_TRUE(t.contains(*self));
                     auto added = t.add(0x10, {EventKind::Report},
                                        [&](transport::DeviceUuid, EventKind, const DeviceEvent &) {
                                            ++late;
                                        });
                     ASSERT_TRUE(added.has_value());
                     EXPECT_TRUE(t.contains(*added));
                 });

    t.dispatch(0x10, report_from(1));
    EXPECT_EQ(first, 1);
    EXPECT_EQ(late, 0);
    EXPECT_FALSE(t.contains(*self));
    EXPECT_EQ(t.size(), 1u);

    t.dispatch(0x10, report_from(1));
    EXPECT_EQ(first, 1);
    EXPECT_EQ(late, 1);
}

TEST(Monitors, AdjustDuringDispatchIsDeferred)
{
    MonitorTable               t;
    int                        calls = 0;
    std::optional<std::string> id;
    id = t.add(0x10, {EventKind::Trace},
               [&](transport::DeviceUuid, EventKind, const DeviceEvent &) {
                   ++calls;
                   t.adjust(*id, {}, {EventKind::Trace});
               });

    t.dispatch(0x10, TraceEvent{1, transport::Payload{0}});
    t.dispatch(0x10, TraceEvent{1, transport::Payload{0}});
    EXPECT_EQ(calls, 1);
}

TEST(Monitors, ThrowingMonitorLeavesTableUsable)
{
    MonitorTable t;
    int          hits = 0;

    auto bad = t.add(0x10, {EventKind::Report},
                     [](transport::DeviceUuid, EventKind, const DeviceEvent &) {
                         throw std::runtime_error("monitor failed");
                     });
    ASSERT_TRUE(bad.has_value());
    EXPECT_THROW(t.dispatch(0x10, report_from(1)), std::runtime_error);

    // removal and registration apply right away again
    EXPECT_TRUE(t.remove(*bad));
    EXPECT_FALSE(t.contains(*bad));
    auto good = t.add(0x10, {EventKind::Report},
                      [&](transport::DeviceUuid, EventKind, const DeviceEvent &) { ++hits; });
    ASSERT_TRUE(good.has_value());
    EXPECT_EQ(t.size(), 1u);

    EXPECT_NO_THROW(t.dispatch(0x10, report_from(1)));
    EXPECT_EQ(hits, 1);
}
