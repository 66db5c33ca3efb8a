#include <future>
#include <memory>
#include <utility>

#include "transport/device_adapter.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace transport
{

namespace
{
std::string unsupported(const char *what)
{
    return std::string(what) + " is not supported by this adapter";
}

// Copy under the lock, call outside it: handlers may subscribe or post freely.
template <typename H>
std::vector<H> snapshot(std::mutex &mu, const std::vector<H> &v)
{
    std::lock_guard<std::mutex> lk(mu);
    return v;
}
}  // namespace

DeviceAdapter::DeviceAdapter()
{
    config_.set(CFG_PROBE_SUPPORTED, false);
    config_.set(CFG_DEFAULT_TIMEOUT_MS,
                static_cast<std::int64_t>(constants::DEFAULT_OP_TIMEOUT.count()));
    config_.set(CFG_MAX_CONNECTIONS, static_cast<std::int64_t>(1));
}

// ============================================================================
// Default async forms: explicit failures
// ============================================================================
void DeviceAdapter::connect_async(ConnId id, const std::string &, OpCallback cb)
{
    cb(id, this->id(), Result::fail(unsupported("connect"), ErrorKind::NotSupported));
}

void DeviceAdapter::disconnect_async(ConnId id, OpCallback cb)
{
    cb(id, this->id(), Result::fail(unsupported("disconnect"), ErrorKind::NotSupported));
}

void DeviceAdapter::open_interface_async(ConnId id, Interface iface, OpCallback cb)
{
    const std::string what = std::string("interface ") + interface_name(iface);
    cb(id, this->id(), Result::fail(unsupported(what.c_str()), ErrorKind::NotSupported));
}

void DeviceAdapter::close_interface_async(ConnId id, Interface iface, OpCallback cb)
{
    const std::string what = std::string("interface ") + interface_name(iface);
    cb(id, this->id(), Result::fail(unsupported(what.c_str()), ErrorKind::NotSupported));
}

void DeviceAdapter::send_rpc_async(ConnId id, std::uint8_t, std::uint16_t, Payload,
                                   std::chrono::milliseconds, RpcCallback cb)
{
    cb(id, this->id(), RpcResult::fail(unsupported("send_rpc"), ErrorKind::NotSupported));
}

void DeviceAdapter::send_script_async(ConnId id, Payload, ProgressCallback, OpCallback cb)
{
    cb(id, this->id(), Result::fail(unsupported("send_script"), ErrorKind::NotSupported));
}

void DeviceAdapter::probe_async(ProbeCallback cb)
{
    cb(this->id(), Result::fail(unsupported("probe"), ErrorKind::NotSupported));
}

void DeviceAdapter::debug_async(ConnId id, const std::string &, DebugArgs, ProgressCallback,
                                DebugCallback cb)
{
    cb(id, this->id(), DebugResult::fail(unsupported("debug"), ErrorKind::NotSupported));
}

// ============================================================================
// Blocking forms
// ============================================================================
Result DeviceAdapter::connect_sync(ConnId id, const std::string &connection_string)
{
    auto p   = std::make_shared<std::promise<Result>>();
    auto fut = p->get_future();
    connect_async(id, connection_string,
                  [p](ConnId, AdapterId, const Result &r) { p->set_value(r); });
    return fut.get();
}

Result DeviceAdapter::disconnect_sync(ConnId id)
{
    auto p   = std::make_shared<std::promise<Result>>();
    auto fut = p->get_future();
    disconnect_async(id, [p](ConnId, AdapterId, const Result &r) { p->set_value(r); });
    return fut.get();
}

Result DeviceAdapter::open_interface_sync(ConnId id, Interface iface)
{
    auto p   = std::make_shared<std::promise<Result>>();
    auto fut = p->get_future();
    open_interface_async(id, iface, [p](ConnId, AdapterId, const Result &r) { p->set_value(r); });
    return fut.get();
}

Result DeviceAdapter::close_interface_sync(ConnId id, Interface iface)
{
    auto p   = std::make_shared<std::promise<Result>>();
    auto fut = p->get_future();
    close_interface_async(id, iface,
                          [p](ConnId, AdapterId, const Result &r) { p->set_value(r); });
    return fut.get();
}

RpcResult DeviceAdapter::send_rpc_sync(ConnId id, std::uint8_t address, std::uint16_t rpc_id,
                                       Payload payload, std::chrono::milliseconds timeout)
{
    auto p   = std::make_shared<std::promise<RpcResult>>();
    auto fut = p->get_future();
    send_rpc_async(id, address, rpc_id, std::move(payload), timeout,
                   [p](ConnId, AdapterId, const RpcResult &r) { p->set_value(r); });
    return fut.get();
}

Result DeviceAdapter::send_script_sync(ConnId id, Payload data, ProgressCallback progress)
{
    auto p   = std::make_shared<std::promise<Result>>();
    auto fut = p->get_future();
    send_script_async(id, std::move(data), std::move(progress),
                      [p](ConnId, AdapterId, const Result &r) { p->set_value(r); });
    return fut.get();
}

Result DeviceAdapter::probe_sync()
{
    auto p   = std::make_shared<std::promise<Result>>();
    auto fut = p->get_future();
    probe_async([p](AdapterId, const Result &r) { p->set_value(r); });
    return fut.get();
}

DebugResult DeviceAdapter::debug_sync(ConnId id, const std::string &command, DebugArgs args,
                                      ProgressCallback progress)
{
    auto p   = std::make_shared<std::promise<DebugResult>>();
    auto fut = p->get_future();
    debug_async(id, command, std::move(args), std::move(progress),
                [p](ConnId, AdapterId, const DebugResult &r) { p->set_value(r); });
    return fut.get();
}

// ============================================================================
// Configuration
// ============================================================================
void DeviceAdapter::set_config(const std::string &key, config::Value v)
{
    LOG_DEBUG("[%s] %s = %s", name().c_str(), key.c_str(), config::to_string(v).c_str());
    config_.set(key, std::move(v));
}

std::optional<config::Value> DeviceAdapter::get_config(const std::string &key) const
{
    return config_.get(key);
}

config::Value DeviceAdapter::get_config(const std::string &key, config::Value default_value) const
{
    return config_.get(key, std::move(default_value));
}

std::chrono::milliseconds DeviceAdapter::default_timeout() const
{
    return std::chrono::milliseconds(
        config_.get_int(CFG_DEFAULT_TIMEOUT_MS, constants::DEFAULT_OP_TIMEOUT.count()));
}

// ============================================================================
// Event channels
// ============================================================================
void DeviceAdapter::add_scan_callback(ScanHandler h)
{
    std::lock_guard<std::mutex> lk(handlers_mu_);
    on_scan_.push_back(std::move(h));
}

void DeviceAdapter::add_disconnect_callback(DisconnectHandler h)
{
    std::lock_guard<std::mutex> lk(handlers_mu_);
    on_disconnect_.push_back(std::move(h));
}

void DeviceAdapter::add_report_callback(ReportHandler h)
{
    std::lock_guard<std::mutex> lk(handlers_mu_);
    on_report_.push_back(std::move(h));
}

void DeviceAdapter::add_trace_callback(TraceHandler h)
{
    std::lock_guard<std::mutex> lk(handlers_mu_);
    on_trace_.push_back(std::move(h));
}

void DeviceAdapter::add_device_lost_callback(LostHandler h)
{
    std::lock_guard<std::mutex> lk(handlers_mu_);
    on_lost_.push_back(std::move(h));
}

void DeviceAdapter::notify_scan(const DeviceInfo &info, std::chrono::seconds expiry)
{
    for (auto &h : snapshot(handlers_mu_, on_scan_))
        h(id(), info, expiry);
}

void DeviceAdapter::notify_disconnect(ConnId conn)
{
    for (auto &h : snapshot(handlers_mu_, on_disconnect_))
        h(id(), conn);
}

void DeviceAdapter::notify_report(ConnId conn, const Report &r)
{
    for (auto &h : snapshot(handlers_mu_, on_report_))
        h(conn, r);
}

void DeviceAdapter::notify_trace(ConnId conn, const Payload &bytes)
{
    for (auto &h : snapshot(handlers_mu_, on_trace_))
        h(conn, bytes);
}

void DeviceAdapter::notify_device_lost(DeviceUuid uuid)
{
    for (auto &h : snapshot(handlers_mu_, on_lost_))
        h(id(), uuid);
}

}  // namespace transport
