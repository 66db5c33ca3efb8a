#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <thread>
#include <type_traits>

#include "util/work_queue.hpp"

namespace util
{

// Single-threaded owning loop: posted tasks and scheduled (periodic) tasks all run on
// one thread, in post order. Any thread may post.
class EventLoop
{
  public:
    using Task     = std::function<void()>;
    using TimerId  = std::uint64_t;
    using Duration = std::chrono::milliseconds;

    explicit EventLoop(std::size_t capacity = 1024);
    ~EventLoop();

    EventLoop(const EventLoop &)            = delete;
    EventLoop &operator=(const EventLoop &) = delete;

    bool start();
    // Stops the thread after draining what is already queued. Idempotent.
    void stop();
    bool running() const noexcept { return running_.load(std::memory_order_acquire); }

    // Posts from the loop thread never block; from other threads they block while the
    // queue is full.
    bool post(Task t);

    TimerId schedule_every(Duration every, Task t);
    void    cancel(TimerId id);
    void    cancel_all();

    bool in_loop_thread() const;

    // Run fn on the loop and wait for its result. Runs inline on the loop thread, and
    // from other threads only while no loop thread is alive (before start, after the
    // thread has drained and exited).
    template <typename F>
    auto call(F &&fn) -> std::invoke_result_t<F>
    {
        using R = std::invoke_result_t<F>;
        if (in_loop_thread() || !thread_alive())
            return fn();

        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        auto fut  = task->get_future();
        if (!post([task] { (*task)(); }))
        {
            // closed while the thread drains: wait for it to let go of the state
            wait_thread_exit();
            (*task)();
        }
        return fut.get();
    }

  private:
    struct Timer
    {
        Duration                              every;
        std::chrono::steady_clock::time_point next;
        Task                                  fn;
    };

    void run();
    void run_due_timers();
    bool thread_alive() const;
    void wait_thread_exit();
    std::chrono::milliseconds next_wait();

    WorkQueue<Task>          tasks_;
    std::thread              thr_;
    std::atomic<bool>        running_{false};
    std::atomic<std::thread::id> loop_id_{};

    mutable std::mutex       alive_mu_;
    std::condition_variable  alive_cv_;
    bool                     alive_{false};

    std::mutex               timers_mu_;
    std::map<TimerId, Timer> timers_;
    TimerId                  next_timer_{1};
};

}  // namespace util
