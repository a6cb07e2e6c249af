#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

#include "proto/frame.hpp"

namespace session
{

// Hands notification frames from the link thread to the one blocked exchange.
// Frames pushed after close() are dropped.
class NotifyChannel
{
  public:
    void push(const frame::Bytes &raw)
    {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_)
                return;
            q_.push_back(raw);
        }
        cv_.notify_one();
    }

    // timeout_ms < 0 waits until a frame arrives or the channel closes.
    // False on timeout or once closed and drained.
    bool pop(frame::Bytes &out, long timeout_ms)
    {
        std::unique_lock<std::mutex> lk(mu_);
        auto ready = [&] { return closed_ || !q_.empty(); };
        if (timeout_ms < 0)
        {
            cv_.wait(lk, ready);
        }
        else if (!cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms), ready))
        {
            return false;
        }
        if (q_.empty())
            return false;
        out = std::move(q_.front());
        q_.pop_front();
        return true;
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lk(mu_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    // Drops stale frames left over from an earlier exchange.
    void clear()
    {
        std::lock_guard<std::mutex> lk(mu_);
        q_.clear();
    }

  private:
    std::mutex               mu_;
    std::condition_variable  cv_;
    std::deque<frame::Bytes> q_;
    bool                     closed_{false};
};

}  // namespace session
