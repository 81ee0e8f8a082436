#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace tf::engine
{

// Fixed-capacity pool of protocol clients. Clients are created lazily by the
// factory up to `capacity`; acquire() blocks while all of them are leased.
// A Lease hands the client back when it goes out of scope, on every path.
template <typename Client> class ClientPool
{
  public:
    using Factory = std::function<std::unique_ptr<Client>()>;

    class Lease
    {
      public:
        Lease() = default;
        Lease(ClientPool *pool, std::unique_ptr<Client> client)
            : pool_(pool), client_(std::move(client))
        {
        }
        Lease(Lease &&other) noexcept
            : pool_(std::exchange(other.pool_, nullptr)),
              client_(std::move(other.client_))
        {
        }
        Lease &operator=(Lease &&other) noexcept
        {
            if (this != &other)
            {
                release();
                pool_ = std::exchange(other.pool_, nullptr);
                client_ = std::move(other.client_);
            }
            return *this;
        }
        Lease(Lease const &) = delete;
        Lease &operator=(Lease const &) = delete;
        ~Lease() { release(); }

        explicit operator bool() const noexcept { return client_ != nullptr; }
        Client *operator->() const noexcept { return client_.get(); }
        Client &operator*() const noexcept { return *client_; }

        // Drops the client instead of returning it, e.g. after the
        // connection broke. The pool will create a fresh one on demand.
        void discard() noexcept
        {
            if (pool_ && client_)
            {
                client_.reset();
                pool_->give_back(nullptr);
                pool_ = nullptr;
            }
        }

      private:
        void release() noexcept
        {
            if (pool_)
            {
                pool_->give_back(std::move(client_));
                pool_ = nullptr;
            }
        }

        ClientPool *pool_ = nullptr;
        std::unique_ptr<Client> client_;
    };

    ClientPool(std::size_t capacity, Factory factory)
        : capacity_(capacity == 0 ? 1 : capacity), factory_(std::move(factory))
    {
    }
    ClientPool(ClientPool const &) = delete;
    ClientPool &operator=(ClientPool const &) = delete;

    Lease acquire()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !idle_.empty() || leased_ < capacity_; });
        return take_locked(lock);
    }

    // Empty lease on timeout or when the factory fails.
    Lease try_acquire(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this]
                          { return !idle_.empty() || leased_ < capacity_; }))
        {
            return {};
        }
        return take_locked(lock);
    }

    std::size_t capacity() const noexcept { return capacity_; }

    std::size_t leased() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return leased_;
    }

    std::size_t idle() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return idle_.size();
    }

  private:
    Lease take_locked(std::unique_lock<std::mutex> &lock)
    {
        ++leased_;
        if (!idle_.empty())
        {
            auto client = std::move(idle_.back());
            idle_.pop_back();
            return Lease(this, std::move(client));
        }
        // Create outside the lock; the slot is already reserved.
        lock.unlock();
        std::unique_ptr<Client> client = factory_ ? factory_() : nullptr;
        if (!client)
        {
            give_back(nullptr);
            return {};
        }
        return Lease(this, std::move(client));
    }

    void give_back(std::unique_ptr<Client> client) noexcept
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (leased_ > 0)
            {
                --leased_;
            }
            if (client)
            {
                idle_.push_back(std::move(client));
            }
        }
        cv_.notify_one();
    }

    std::size_t const capacity_;
    Factory factory_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::unique_ptr<Client>> idle_;
    std::size_t leased_ = 0;
};

} // namespace tf::engine
