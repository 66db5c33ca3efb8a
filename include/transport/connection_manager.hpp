#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <variant>
#include <vector>

#include "transport/types.hpp"
#include "util/timeout.hpp"
#include "util/work_queue.hpp"

namespace transport
{

enum class ConnState
{
    Disconnected,
    Connecting,
    Idle,
    InProgress,
    Disconnecting
};

const char *conn_state_name(ConnState s);

// Either the caller visible connection id or the adapter's internal handle.
using ConnKey = std::variant<ConnId, std::string>;
using OpToken = std::uint64_t;
using Context = std::map<std::string, std::string>;

// Invoked on the worker once a begin_* request is accepted. Adapters start their I/O here
// and pass the token back to the matching finish_* call.
using StartedHook = std::function<void(OpToken)>;

inline constexpr OpToken ANY_TOKEN = 0;

struct ConnectionInfo
{
    ConnId      connection_id{0};
    std::string internal_id;
    ConnState   state{ConnState::Disconnected};
    std::string microstate;
    Context     context;
};

// ============================================================================
// ConnectionManager
// - Owns one adapter's connection table.
// - Every mutating call enqueues an action and returns; a single worker applies them in
//   order and completes expired operations with synthetic failures.
// - Each pending callback is invoked exactly once, on the worker, without the table lock.
// ============================================================================
class ConnectionManager
{
  public:
    using PendingCallback = std::variant<std::monostate, OpCallback, RpcCallback, DebugCallback>;

    // `tag` prefixes log lines; `adapter_id` is read when completions are delivered.
    ConnectionManager(std::string tag, std::function<AdapterId()> adapter_id);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager &)            = delete;
    ConnectionManager &operator=(const ConnectionManager &) = delete;

    bool start();
    // Joins the worker, then fails whatever is still open. Idempotent.
    void stop();
    bool running() const noexcept { return running_.load(); }

    void begin_connection(ConnId id, std::string internal_id, OpCallback cb,
                          std::chrono::milliseconds timeout, Context ctx = {},
                          StartedHook started = {});
    void finish_connection(ConnKey key, bool success, std::optional<std::string> reason = {},
                           OpToken token = ANY_TOKEN);

    void begin_disconnection(ConnKey key, OpCallback cb, std::chrono::milliseconds timeout,
                             StartedHook started = {});
    void finish_disconnection(ConnKey key, bool success, std::optional<std::string> reason = {},
                              OpToken token = ANY_TOKEN);

    void begin_operation(ConnKey key, std::string microstate, PendingCallback cb,
                         std::chrono::milliseconds timeout, StartedHook started = {});
    void finish_operation(ConnKey key, Result r, OpToken token = ANY_TOKEN);
    void finish_operation(ConnKey key, RpcResult r, OpToken token = ANY_TOKEN);
    void finish_operation(ConnKey key, DebugResult r, OpToken token = ANY_TOKEN);

    // Connection lost outside of our control: fails whatever is pending and drops the record.
    void force_disconnect(ConnKey key, std::string reason = "Unexpected disconnection");

    void set_context(ConnKey key, std::string name, std::string value);

    // ---- reads (any thread) ----
    std::vector<ConnectionInfo> connections() const;
    std::optional<Context>      get_context(const ConnKey &key) const;
    std::optional<ConnId>       get_connection_id(const ConnKey &key) const;
    std::optional<std::string>  get_internal_id(const ConnKey &key) const;
    ConnState                   state(const ConnKey &key) const;
    std::size_t                 count() const;

  private:
    struct ConnectionRecord
    {
        ConnId          connection_id{0};
        std::string     internal_id;
        ConnState       state{ConnState::Disconnected};
        std::string     microstate;
        PendingCallback callback;
        util::Deadline  deadline;
        Context         context;
        OpToken         token{0};
    };
    using Records = std::list<ConnectionRecord>;

    // A completion ready to fire once the table lock is released.
    struct Completion
    {
        PendingCallback cb;
        ConnId          id{0};
        bool            success{false};
        std::optional<std::string> reason;
        ErrorKind       kind{ErrorKind::None};
        std::optional<std::uint8_t> status;
        std::optional<Payload>      payload;
        std::optional<std::string>  value;
    };

    using Action = std::function<void()>;

    void run();
    bool enqueue(Action a);
    void check_timeouts();
    std::chrono::milliseconds next_wait() const;

    // callers hold mu_
    Records::iterator find(const ConnKey &key);
    Records::const_iterator find(const ConnKey &key) const;
    void              erase(Records::iterator it);
    bool              token_matches(const ConnectionRecord &rec, OpToken token, const char *what) const;

    void deliver(Completion c) const;
    void finish_operation_impl(const ConnKey &key, Completion c, OpToken token);

    std::string                tag_;
    std::function<AdapterId()> adapter_id_;

    util::WorkQueue<Action> actions_;
    std::thread             worker_;
    std::atomic<bool>       running_{false};
    std::atomic<bool>       stopped_{false};

    mutable std::mutex                           mu_;
    Records                                      records_;
    std::unordered_map<ConnId, Records::iterator>      by_conn_id_;
    std::unordered_map<std::string, Records::iterator> by_internal_id_;
    OpToken                                      next_token_{0};  // worker only
};

std::string key_to_string(const ConnKey &key);

}  // namespace transport
