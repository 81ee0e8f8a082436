#pragma once

#include <any>
#include <cstddef>
#include <functional>
#include <shared_mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tf::engine
{

class EventBus
{
  public:
    template <typename T> using Handler = std::function<void(T const &)>;
    using SubscriptionId = std::size_t;

    template <typename T> SubscriptionId subscribe(Handler<T> handler)
    {
        std::unique_lock lock(handlers_mutex_);
        auto id = next_id_++;
        auto &handlers = handlers_[std::type_index(typeid(T))];
        handlers.push_back(
            {id, [handler = std::move(handler)](std::any const &event)
             {
                 handler(
                     std::any_cast<std::reference_wrapper<T const>>(event)
                         .get());
             }});
        return id;
    }

    void unsubscribe(SubscriptionId id)
    {
        std::unique_lock lock(handlers_mutex_);
        for (auto &[type, handlers] : handlers_)
        {
            std::erase_if(handlers,
                          [id](Entry const &entry) { return entry.id == id; });
        }
    }

    template <typename T> bool has_subscribers() const
    {
        std::shared_lock lock(handlers_mutex_);
        auto it = handlers_.find(std::type_index(typeid(T)));
        return it != handlers_.end() && !it->second.empty();
    }

    // Returns how many handlers saw the event. Handlers run on the
    // publishing thread, outside the registry lock, so they may subscribe or
    // publish themselves.
    template <typename T> std::size_t publish(T const &event) const
    {
        std::vector<Entry> handlers_copy;
        {
            std::shared_lock lock(handlers_mutex_);
            auto it = handlers_.find(std::type_index(typeid(T)));
            if (it != handlers_.end())
            {
                handlers_copy = it->second;
            }
        }
        if (handlers_copy.empty())
        {
            return 0;
        }
        // Boxed by reference so large events (dispatch payloads) are not
        // copied per handler.
        std::any const boxed = std::cref(event);
        for (auto const &entry : handlers_copy)
        {
            entry.handler(boxed);
        }
        return handlers_copy.size();
    }

  private:
    struct Entry
    {
        SubscriptionId id;
        std::function<void(std::any const &)> handler;
    };

    std::unordered_map<std::type_index, std::vector<Entry>> handlers_;
    SubscriptionId next_id_ = 1;
    mutable std::shared_mutex handlers_mutex_;
};

} // namespace tf::engine
