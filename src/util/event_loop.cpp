#include <algorithm>
#include <exception>
#include <chrono>
#include <thread>
#include <vector>

#include "util/event_loop.hpp"
#include "util/log.hpp"

namespace util
{

namespace
{
constexpr std::chrono::milliseconds MAX_IDLE_WAIT{100};

void run_task(const EventLoop::Task &t)
{
    try
    {
        t();
    }
    catch (const std::exception &e)
    {
        LOG_ERROR("[LOOP] task threw: %s", e.what());
    }
}
}  // namespace

EventLoop::EventLoop(std::size_t capacity) : tasks_(capacity) {}

EventLoop::~EventLoop()
{
    stop();
    // a thread detached by stop() from inside a task still uses this object
    if (!in_loop_thread())
        wait_thread_exit();
}

bool EventLoop::start()
{
    if (running_.exchange(true, std::memory_order_acq_rel))
        return true;

    if (!in_loop_thread())
        wait_thread_exit();
    tasks_.reopen();
    {
        std::lock_guard<std::mutex> lk(alive_mu_);
        alive_ = true;
    }
    thr_ = std::thread([this] {
        loop_id_.store(std::this_thread::get_id());
        run();
        loop_id_.store(std::thread::id{});
        std::lock_guard<std::mutex> lk(alive_mu_);
        alive_ = false;
        alive_cv_.notify_all();
    });
    return true;
}

void EventLoop::stop()
{
    if (!running_.exchange(false, std::memory_order_acq_rel))
        return;

    tasks_.close();
    if (thr_.joinable())
    {
        if (thr_.get_id() == std::this_thread::get_id())
        {
            // stop() from a task: the thread finishes on its own
            thr_.detach();
            LOG_WARN("[LOOP] stop() called from the loop thread; detaching");
        }
        else
        {
            thr_.join();
        }
    }
}

bool EventLoop::post(Task t)
{
    if (!t)
        return false;
    if (in_loop_thread())
        return tasks_.force_push(std::move(t));
    return tasks_.push(std::move(t));
}

EventLoop::TimerId EventLoop::schedule_every(Duration every, Task t)
{
    std::lock_guard<std::mutex> lk(timers_mu_);
    const TimerId               id = next_timer_++;
    timers_.emplace(id, Timer{every, std::chrono::steady_clock::now() + every, std::move(t)});
    return id;
}

void EventLoop::cancel(TimerId id)
{
    std::lock_guard<std::mutex> lk(timers_mu_);
    timers_.erase(id);
}

void EventLoop::cancel_all()
{
    std::lock_guard<std::mutex> lk(timers_mu_);
    timers_.clear();
}

bool EventLoop::in_loop_thread() const
{
    return loop_id_.load() == std::this_thread::get_id();
}

bool EventLoop::thread_alive() const
{
    std::lock_guard<std::mutex> lk(alive_mu_);
    return alive_;
}

void EventLoop::wait_thread_exit()
{
    std::unique_lock<std::mutex> lk(alive_mu_);
    alive_cv_.wait(lk, [this] { return !alive_; });
}

std::chrono::milliseconds EventLoop::next_wait()
{
    using namespace std::chrono;
    std::lock_guard<std::mutex> lk(timers_mu_);
    auto                        wait = MAX_IDLE_WAIT;
    const auto                  now  = steady_clock::now();
    for (const auto &kv : timers_)
    {
        const auto left = duration_cast<milliseconds>(kv.second.next - now);
        if (left < wait)
            wait = std::max(left, milliseconds(0));
    }
    return wait;
}

void EventLoop::run_due_timers()
{
    const auto now = std::chrono::steady_clock::now();

    std::vector<std::pair<TimerId, Task>> due;
    {
        std::lock_guard<std::mutex> lk(timers_mu_);
        for (auto &kv : timers_)
        {
            if (kv.second.next <= now)
            {
                kv.second.next = now + kv.second.every;
                due.emplace_back(kv.first, kv.second.fn);
            }
        }
    }

    for (auto &d : due)
    {
        {
            // cancelled by an earlier timer in this batch
            std::lock_guard<std::mutex> lk(timers_mu_);
            if (timers_.count(d.first) == 0)
                continue;
        }
        run_task(d.second);
    }
}

void EventLoop::run()
{
    LOG_DEBUG("[LOOP] started");
    while (true)
    {
        auto task = tasks_.pop_for(next_wait());
        if (task)
            run_task(*task);
        else if (tasks_.closed())
            break;

        run_due_timers();
    }

    // drain whatever was posted before close()
    while (auto task = tasks_.try_pop())
        run_task(*task);
    LOG_DEBUG("[LOOP] stopped");
}

}  // namespace util
