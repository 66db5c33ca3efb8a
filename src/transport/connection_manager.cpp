#include <algorithm>
#include <iterator>
#include <utility>

#include "transport/connection_manager.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace transport
{

namespace
{
std::optional<ConnId> key_conn_id(const ConnKey &key)
{
    if (const ConnId *id = std::get_if<ConnId>(&key))
        return *id;
    return std::nullopt;
}
}  // namespace

const char *conn_state_name(ConnState s)
{
    switch (s)
    {
        case ConnState::Disconnected:
            return "Disconnected";
        case ConnState::Connecting:
            return "Connecting";
        case ConnState::Idle:
            return "Idle";
        case ConnState::InProgress:
            return "InProgress";
        case ConnState::Disconnecting:
            return "Disconnecting";
    }
    return "?";
}

std::string key_to_string(const ConnKey &key)
{
    if (const ConnId *id = std::get_if<ConnId>(&key))
        return "conn " + std::to_string(*id);
    return "'" + std::get<std::string>(key) + "'";
}

ConnectionManager::ConnectionManager(std::string tag, std::function<AdapterId()> adapter_id)
    : tag_(std::move(tag)), adapter_id_(std::move(adapter_id))
{
}

ConnectionManager::~ConnectionManager()
{
    stop();
}

bool ConnectionManager::start()
{
    if (running_.exchange(true))
        return true;

    actions_.reopen();
    worker_ = std::thread([this] { run(); });
    LOG_DEBUG("[CM][%s] worker started", tag_.c_str());
    return true;
}

void ConnectionManager::stop()
{
    if (!running_.exchange(false))
        return;

    actions_.close();
    if (worker_.joinable())
    {
        if (worker_.get_id() == std::this_thread::get_id())
        {
            LOG_WARN("[CM][%s] stop() called from the worker; detaching", tag_.c_str());
            worker_.detach();
        }
        else
        {
            worker_.join();
        }
    }

    // Anything still open gets its last callback now.
    std::vector<Completion> done;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto &rec : records_)
        {
            if (std::holds_alternative<std::monostate>(rec.callback))
                continue;
            Completion c;
            c.cb      = std::move(rec.callback);
            c.id      = rec.connection_id;
            c.reason  = "Adapter stopped";
            c.kind    = ErrorKind::UnexpectedDisconnect;
            done.push_back(std::move(c));
        }
        records_.clear();
        by_conn_id_.clear();
        by_internal_id_.clear();
    }
    for (auto &c : done)
        deliver(std::move(c));

    LOG_DEBUG("[CM][%s] stopped", tag_.c_str());
}

bool ConnectionManager::enqueue(Action a)
{
    if (!running_.load())
        return false;
    return actions_.push(std::move(a));
}

// ============================================================================
// Worker
// ============================================================================
void ConnectionManager::run()
{
    while (true)
    {
        check_timeouts();
        auto a = actions_.pop_for(next_wait());
        if (a)
            (*a)();
        else if (actions_.closed())
            break;
    }
}

// Poll interval, cut short by the nearest deadline.
std::chrono::milliseconds ConnectionManager::next_wait() const
{
    using namespace std::chrono;
    auto                        wait = constants::CM_POLL_INTERVAL;
    const auto                  now  = util::Clock::now();
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto &rec : records_)
    {
        const auto at = rec.deadline.at();
        if (!at)
            continue;
        // expired() is strict, so wake just past the deadline
        const auto left = duration_cast<milliseconds>(*at - now) + milliseconds(1);
        if (left < wait)
            wait = std::max(left, milliseconds(0));
    }
    return wait;
}

void ConnectionManager::check_timeouts()
{
    const auto              now = util::Clock::now();
    std::vector<Completion> done;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto it = records_.begin(); it != records_.end();)
        {
            auto cur = it++;
            if (!cur->deadline.expired(now))
                continue;

            Completion c;
            c.id   = cur->connection_id;
            c.kind = ErrorKind::Timeout;
            c.cb   = std::move(cur->callback);
            cur->callback = std::monostate{};
            cur->deadline = util::Deadline::never();

            switch (cur->state)
            {
                case ConnState::Connecting:
                    c.reason = "Connection attempt timed out";
                    erase(cur);
                    break;
                case ConnState::Disconnecting:
                    c.reason   = "Disconnection attempt timed out";
                    cur->state = ConnState::Idle;
                    break;
                case ConnState::InProgress:
                    c.reason = cur->microstate == "rpc" ? std::string("RPC timed out without response")
                                                        : cur->microstate + " request timed out";
                    cur->state = ConnState::Idle;
                    cur->microstate.clear();
                    break;
                default:
                    continue;
            }
            LOG_INFO("[CM][%s] conn %lld: %s", tag_.c_str(), (long long)c.id, c.reason->c_str());
            done.push_back(std::move(c));
        }
    }
    for (auto &c : done)
        deliver(std::move(c));
}

void ConnectionManager::deliver(Completion c) const
{
    const AdapterId aid = adapter_id_ ? adapter_id_() : NO_ADAPTER;

    if (auto *cb = std::get_if<OpCallback>(&c.cb))
    {
        if (*cb)
            (*cb)(c.id, aid, Result{c.success, std::move(c.reason), c.kind});
    }
    else if (auto *cb = std::get_if<RpcCallback>(&c.cb))
    {
        if (*cb)
            (*cb)(c.id, aid,
                  RpcResult{c.success, std::move(c.reason), c.status, std::move(c.payload), c.kind});
    }
    else if (auto *cb = std::get_if<DebugCallback>(&c.cb))
    {
        if (*cb)
            (*cb)(c.id, aid, DebugResult{c.success, std::move(c.reason), std::move(c.value), c.kind});
    }
}

// ============================================================================
// Table helpers (mu_ held)
// ============================================================================
ConnectionManager::Records::iterator ConnectionManager::find(const ConnKey &key)
{
    if (const ConnId *id = std::get_if<ConnId>(&key))
    {
        auto it = by_conn_id_.find(*id);
        return it == by_conn_id_.end() ? records_.end() : it->second;
    }
    auto it = by_internal_id_.find(std::get<std::string>(key));
    return it == by_internal_id_.end() ? records_.end() : it->second;
}

ConnectionManager::Records::const_iterator ConnectionManager::find(const ConnKey &key) const
{
    if (const ConnId *id = std::get_if<ConnId>(&key))
    {
        auto it = by_conn_id_.find(*id);
        return it == by_conn_id_.end() ? records_.cend() : Records::const_iterator(it->second);
    }
    auto it = by_internal_id_.find(std::get<std::string>(key));
    return it == by_internal_id_.end() ? records_.cend() : Records::const_iterator(it->second);
}

void ConnectionManager::erase(Records::iterator it)
{
    by_conn_id_.erase(it->connection_id);
    by_internal_id_.erase(it->internal_id);
    records_.erase(it);
}

bool ConnectionManager::token_matches(const ConnectionRecord &rec, OpToken token,
                                      const char *what) const
{
    if (token == ANY_TOKEN || token == rec.token)
        return true;
    LOG_WARN("[CM][%s] discarding stale %s for conn %lld (token %llu, current %llu)", tag_.c_str(),
             what, (long long)rec.connection_id, (unsigned long long)token,
             (unsigned long long)rec.token);
    return false;
}

// ============================================================================
// Connect
// ============================================================================
void ConnectionManager::begin_connection(ConnId id, std::string internal_id, OpCallback cb,
                                         std::chrono::milliseconds timeout, Context ctx,
                                         StartedHook started)
{
    auto action = [this, id, internal_id, cb, timeout, ctx, started]() mutable {
        OpToken token = 0;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (by_conn_id_.count(id) != 0 || by_internal_id_.count(internal_id) != 0)
            {
                token = 0;
            }
            else
            {
                ConnectionRecord rec;
                rec.connection_id = id;
                rec.internal_id   = internal_id;
                rec.state         = ConnState::Connecting;
                rec.callback      = cb;
                rec.deadline      = util::Deadline::after(timeout);
                rec.context       = std::move(ctx);
                rec.token         = ++next_token_;
                token             = rec.token;

                records_.push_back(std::move(rec));
                auto it = std::prev(records_.end());
                by_conn_id_[id]                = it;
                by_internal_id_[internal_id]   = it;
            }
        }

        if (token == 0)
        {
            LOG_ERROR("[CM][%s] conn %lld / '%s' is already in use", tag_.c_str(), (long long)id,
                      internal_id.c_str());
            Completion c;
            c.cb     = std::move(cb);
            c.id     = id;
            c.reason = "Connection id or internal id already in use";
            c.kind   = ErrorKind::InvalidState;
            deliver(std::move(c));
            return;
        }

        LOG_DEBUG("[CM][%s] conn %lld connecting to '%s'", tag_.c_str(), (long long)id,
                  internal_id.c_str());
        if (started)
            started(token);
    };

    if (!enqueue(std::move(action)))
    {
        LOG_ERROR("[CM][%s] begin_connection while stopped", tag_.c_str());
        Completion c;
        c.cb     = std::move(cb);
        c.id     = id;
        c.reason = "Connection manager is not running";
        c.kind   = ErrorKind::InvalidState;
        deliver(std::move(c));
    }
}

void ConnectionManager::finish_connection(ConnKey key, bool success,
                                          std::optional<std::string> reason, OpToken token)
{
    auto action = [this, key, success, reason, token]() {
        Completion c;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto                        it = find(key);
            if (it == records_.end())
            {
                LOG_WARN("[CM][%s] finish_connection for unknown %s", tag_.c_str(),
                         key_to_string(key).c_str());
                return;
            }
            if (it->state != ConnState::Connecting)
            {
                LOG_WARN("[CM][%s] finish_connection for %s in state %s", tag_.c_str(),
                         key_to_string(key).c_str(), conn_state_name(it->state));
                return;
            }
            if (!token_matches(*it, token, "connect completion"))
                return;

            c.cb      = std::move(it->callback);
            c.id      = it->connection_id;
            c.success = success;
            c.reason  = reason;
            c.kind    = success ? ErrorKind::None : ErrorKind::AdapterRejected;

            if (success)
            {
                it->state    = ConnState::Idle;
                it->callback = std::monostate{};
                it->deadline = util::Deadline::never();
            }
            else
            {
                erase(it);
            }
        }
        LOG_DEBUG("[CM][%s] conn %lld connect %s", tag_.c_str(), (long long)c.id,
                  success ? "ok" : "failed");
        deliver(std::move(c));
    };

    if (!enqueue(std::move(action)))
        LOG_WARN("[CM][%s] finish_connection dropped: not running", tag_.c_str());
}

// ============================================================================
// Disconnect
// ============================================================================
void ConnectionManager::begin_disconnection(ConnKey key, OpCallback cb,
                                            std::chrono::milliseconds timeout,
                                            StartedHook started)
{
    auto action = [this, key, cb, timeout, started]() mutable {
        Completion c;
        c.cb          = cb;
        c.id          = key_conn_id(key).value_or(-1);
        OpToken token = 0;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto                        it = find(key);
            if (it == records_.end())
            {
                c.reason = "Could not find connection";
                c.kind   = ErrorKind::NotFound;
            }
            else if (it->state != ConnState::Idle)
            {
                c.id     = it->connection_id;
                c.reason = std::string("Connection is not idle (state ") +
                           conn_state_name(it->state) + ")";
                c.kind   = ErrorKind::InvalidState;
            }
            else
            {
                it->state    = ConnState::Disconnecting;
                it->callback = cb;
                it->deadline = util::Deadline::after(timeout);
                it->token    = ++next_token_;
                token        = it->token;
                c.id         = it->connection_id;
            }
        }

        if (token == 0)
        {
            LOG_ERROR("[CM][%s] cannot disconnect %s: %s", tag_.c_str(), key_to_string(key).c_str(),
                      c.reason->c_str());
            deliver(std::move(c));
            return;
        }
        LOG_DEBUG("[CM][%s] conn %lld disconnecting", tag_.c_str(), (long long)c.id);
        if (started)
            started(token);
    };

    if (!enqueue(std::move(action)))
    {
        Completion c;
        c.cb     = std::move(cb);
        c.id     = key_conn_id(key).value_or(-1);
        c.reason = "Connection manager is not running";
        c.kind   = ErrorKind::InvalidState;
        deliver(std::move(c));
    }
}

void ConnectionManager::finish_disconnection(ConnKey key, bool success,
                                             std::optional<std::string> reason, OpToken token)
{
    auto action = [this, key, success, reason, token]() {
        Completion c;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto                        it = find(key);
            if (it == records_.end())
            {
                LOG_WARN("[CM][%s] finish_disconnection for unknown %s", tag_.c_str(),
                         key_to_string(key).c_str());
                return;
            }
            if (it->state != ConnState::Disconnecting)
            {
                LOG_WARN("[CM][%s] finish_disconnection for %s in state %s", tag_.c_str(),
                         key_to_string(key).c_str(), conn_state_name(it->state));
                return;
            }
            if (!token_matches(*it, token, "disconnect completion"))
                return;

            c.cb      = std::move(it->callback);
            c.id      = it->connection_id;
            c.success = success;
            c.reason  = reason;
            c.kind    = success ? ErrorKind::None : ErrorKind::AdapterRejected;

            if (success)
            {
                erase(it);
            }
            else
            {
                it->state    = ConnState::Idle;
                it->callback = std::monostate{};
                it->deadline = util::Deadline::never();
            }
        }
        deliver(std::move(c));
    };

    if (!enqueue(std::move(action)))
        LOG_WARN("[CM][%s] finish_disconnection dropped: not running", tag_.c_str());
}

// ============================================================================
// Operations
// ============================================================================
void ConnectionManager::begin_operation(ConnKey key, std::string microstate, PendingCallback cb,
                                        std::chrono::milliseconds timeout, StartedHook started)
{
    auto action = [this, key, microstate, cb, timeout, started]() mutable {
        Completion c;
        c.cb          = cb;
        c.id          = key_conn_id(key).value_or(-1);
        OpToken token = 0;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto                        it = find(key);
            if (it == records_.end())
            {
                c.reason = "Could not find connection";
                c.kind   = ErrorKind::NotFound;
            }
            else if (it->state != ConnState::Idle)
            {
                c.id     = it->connection_id;
                c.reason = std::string("Connection is not idle (state ") +
                           conn_state_name(it->state) + ")";
                c.kind   = ErrorKind::InvalidState;
            }
            else
            {
                it->state      = ConnState::InProgress;
                it->microstate = microstate;
                it->callback   = cb;
                it->deadline   = util::Deadline::after(timeout);
                it->token      = ++next_token_;
                token          = it->token;
                c.id           = it->connection_id;
            }
        }

        if (token == 0)
        {
            LOG_ERROR("[CM][%s] cannot start %s on %s: %s", tag_.c_str(), microstate.c_str(),
                      key_to_string(key).c_str(), c.reason->c_str());
            deliver(std::move(c));
            return;
        }
        LOG_DEBUG("[CM][%s] conn %lld %s started", tag_.c_str(), (long long)c.id,
                  microstate.c_str());
        if (started)
            started(token);
    };

    if (!enqueue(std::move(action)))
    {
        Completion c;
        c.cb     = std::move(cb);
        c.id     = key_conn_id(key).value_or(-1);
        c.reason = "Connection manager is not running";
        c.kind   = ErrorKind::InvalidState;
        deliver(std::move(c));
    }
}

void ConnectionManager::finish_operation(ConnKey key, Result r, OpToken token)
{
    Completion c;
    c.success = r.success;
    c.reason  = std::move(r.reason);
    c.kind    = r.kind;
    finish_operation_impl(key, std::move(c), token);
}

void ConnectionManager::finish_operation(ConnKey key, RpcResult r, OpToken token)
{
    Completion c;
    c.success = r.success;
    c.reason  = std::move(r.reason);
    c.kind    = r.kind;
    c.status  = r.status;
    c.payload = std::move(r.payload);
    finish_operation_impl(key, std::move(c), token);
}

void ConnectionManager::finish_operation(ConnKey key, DebugResult r, OpToken token)
{
    Completion c;
    c.success = r.success;
    c.reason  = std::move(r.reason);
    c.kind    = r.kind;
    c.value   = std::move(r.value);
    finish_operation_impl(key, std::move(c), token);
}

void ConnectionManager::finish_operation_impl(const ConnKey &key, Completion c, OpToken token)
{
    auto action = [this, key, c = std::move(c), token]() mutable {
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto                        it = find(key);
            if (it == records_.end())
            {
                LOG_WARN("[CM][%s] finish_operation for unknown %s", tag_.c_str(),
                         key_to_string(key).c_str());
                return;
            }
            if (it->state != ConnState::InProgress)
            {
                LOG_WARN("[CM][%s] finish_operation for %s in state %s", tag_.c_str(),
                         key_to_string(key).c_str(), conn_state_name(it->state));
                return;
            }
            if (!token_matches(*it, token, "operation completion"))
                return;

            c.cb = std::move(it->callback);
            c.id = it->connection_id;

            it->state    = ConnState::Idle;
            it->callback = std::monostate{};
            it->deadline = util::Deadline::never();
            it->microstate.clear();
        }
        deliver(std::move(c));
    };

    if (!enqueue(std::move(action)))
        LOG_WARN("[CM][%s] finish_operation dropped: not running", tag_.c_str());
}

// ============================================================================
// Unexpected disconnect
// ============================================================================
void ConnectionManager::force_disconnect(ConnKey key, std::string reason)
{
    auto action = [this, key, reason]() {
        Completion c;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto                        it = find(key);
            if (it == records_.end())
            {
                LOG_WARN("[CM][%s] force_disconnect for unknown %s", tag_.c_str(),
                         key_to_string(key).c_str());
                return;
            }

            LOG_INFO("[CM][%s] conn %lld dropped in state %s: %s", tag_.c_str(),
                     (long long)it->connection_id, conn_state_name(it->state), reason.c_str());

            c.id = it->connection_id;
            if (it->state != ConnState::Idle)
            {
                c.cb     = std::move(it->callback);
                c.reason = reason;
                c.kind   = ErrorKind::UnexpectedDisconnect;
            }
            erase(it);
        }
        deliver(std::move(c));
    };

    if (!enqueue(std::move(action)))
        LOG_WARN("[CM][%s] force_disconnect dropped: not running", tag_.c_str());
}

void ConnectionManager::set_context(ConnKey key, std::string name, std::string value)
{
    auto action = [this, key, name, value]() {
        std::lock_guard<std::mutex> lk(mu_);
        auto                        it = find(key);
        if (it == records_.end())
        {
            LOG_WARN("[CM][%s] set_context for unknown %s", tag_.c_str(), key_to_string(key).c_str());
            return;
        }
        it->context[name] = value;
    };

    if (!enqueue(std::move(action)))
        LOG_WARN("[CM][%s] set_context dropped: not running", tag_.c_str());
}

// ============================================================================
// Reads
// ============================================================================
std::vector<ConnectionInfo> ConnectionManager::connections() const
{
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<ConnectionInfo> out;
    out.reserve(records_.size());
    for (const auto &rec : records_)
        out.push_back(ConnectionInfo{rec.connection_id, rec.internal_id, rec.state, rec.microstate,
                                     rec.context});
    return out;
}

std::optional<Context> ConnectionManager::get_context(const ConnKey &key) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = find(key);
    if (it == records_.cend())
        return std::nullopt;
    return it->context;
}

std::optional<ConnId> ConnectionManager::get_connection_id(const ConnKey &key) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = find(key);
    if (it == records_.cend())
        return std::nullopt;
    return it->connection_id;
}

std::optional<std::string> ConnectionManager::get_internal_id(const ConnKey &key) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = find(key);
    if (it == records_.cend())
        return std::nullopt;
    return it->internal_id;
}

ConnState ConnectionManager::state(const ConnKey &key) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = find(key);
    return it == records_.cend() ? ConnState::Disconnected : it->state;
}

std::size_t ConnectionManager::count() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return records_.size();
}

}  // namespace transport
