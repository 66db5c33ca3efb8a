#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace util
{

// FIFO hand-off between threads. capacity == 0 means unbounded.
// push() blocks while the queue is full; force_push() ignores the bound and is meant
// for the consuming thread re-posting to itself, which must never block.
template <typename T>
class WorkQueue
{
  public:
    explicit WorkQueue(std::size_t capacity = 0) : capacity_(capacity) {}

    WorkQueue(const WorkQueue &)            = delete;
    WorkQueue &operator=(const WorkQueue &) = delete;

    bool push(T v)
    {
        std::unique_lock<std::mutex> lk(mu_);
        not_full_.wait(lk, [&] { return closed_ || capacity_ == 0 || q_.size() < capacity_; });
        if (closed_)
            return false;
        q_.push_back(std::move(v));
        lk.unlock();
        not_empty_.notify_one();
        return true;
    }

    bool force_push(T v)
    {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_)
                return false;
            q_.push_back(std::move(v));
        }
        not_empty_.notify_one();
        return true;
    }

    // Waits at most `wait` for an item.
    std::optional<T> pop_for(std::chrono::milliseconds wait)
    {
        std::unique_lock<std::mutex> lk(mu_);
        if (!not_empty_.wait_for(lk, wait, [&] { return closed_ || !q_.empty(); }))
            return std::nullopt;
        if (q_.empty())
            return std::nullopt;
        T v = std::move(q_.front());
        q_.pop_front();
        lk.unlock();
        not_full_.notify_one();
        return v;
    }

    std::optional<T> try_pop()
    {
        std::unique_lock<std::mutex> lk(mu_);
        if (q_.empty())
            return std::nullopt;
        T v = std::move(q_.front());
        q_.pop_front();
        lk.unlock();
        not_full_.notify_one();
        return v;
    }

    // Wake every waiter; later pushes fail, remaining items can still be drained.
    void close()
    {
        {
            std::lock_guard<std::mutex> lk(mu_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    void reopen()
    {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = false;
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        return q_.size();
    }

    bool closed() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

  private:
    mutable std::mutex      mu_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T>           q_;
    std::size_t             capacity_{0};
    bool                    closed_{false};
};

}  // namespace util
