#pragma once
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace session
{

// Ticket lock: waiters are served strictly in arrival order.
// Meets BasicLockable, so std::lock_guard releases it on every exit path.
class ExchangeLock
{
  public:
    void lock()
    {
        std::unique_lock<std::mutex> lk(mu_);
        const std::uint64_t          ticket = next_++;
        cv_.wait(lk, [&] { return serving_ == ticket; });
    }

    void unlock()
    {
        {
            std::lock_guard<std::mutex> lk(mu_);
            ++serving_;
        }
        cv_.notify_all();
    }

  private:
    std::mutex              mu_;
    std::condition_variable cv_;
    std::uint64_t           next_{0};
    std::uint64_t           serving_{0};
};

}  // namespace session
