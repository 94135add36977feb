#pragma once

#include "engine/AsyncTaskService.hpp"

#include <any>
#include <cstdint>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>

namespace kc::engine
{

class EventBus
{
  public:
    template <typename T> using Handler = std::function<void(T const &)>;
    using SubscriptionId = std::uint64_t;

    EventBus() = default;
    EventBus(EventBus const &) = delete;
    EventBus &operator=(EventBus const &) = delete;

    ~EventBus()
    {
        // Mailboxes drain and join before the handler table goes away.
        std::unordered_map<SubscriptionId, std::shared_ptr<AsyncTaskService>>
            mailboxes;
        {
            std::unique_lock lock(handlers_mutex_);
            mailboxes.swap(mailboxes_);
        }
        for (auto &entry : mailboxes)
        {
            entry.second->stop();
        }
    }

    // Handler runs on the publisher's thread.
    template <typename T> SubscriptionId subscribe(Handler<T> handler)
    {
        std::unique_lock lock(handlers_mutex_);
        auto id = next_id_++;
        handlers_[std::type_index(typeid(T))].push_back(
            {id, [handler](std::any const &event)
             { handler(std::any_cast<T const &>(event)); }});
        return id;
    }

    // Handler runs on a worker owned by this subscription, so a slow
    // consumer cannot stall the publisher or other subscribers. Events are
    // delivered in publish order.
    template <typename T>
    SubscriptionId subscribe_queued(Handler<T> handler, std::string name)
    {
        auto mailbox = std::make_shared<AsyncTaskService>(std::move(name));
        mailbox->start();
        std::weak_ptr<AsyncTaskService> weak = mailbox;
        std::unique_lock lock(handlers_mutex_);
        auto id = next_id_++;
        mailboxes_.emplace(id, mailbox);
        handlers_[std::type_index(typeid(T))].push_back(
            {id, [handler, weak](std::any const &event)
             {
                 if (auto box = weak.lock())
                 {
                     box->submit([handler, copy = std::any_cast<T>(event)]
                                 { handler(copy); });
                 }
             }});
        return id;
    }

    void unsubscribe(SubscriptionId id)
    {
        std::shared_ptr<AsyncTaskService> mailbox;
        {
            std::unique_lock lock(handlers_mutex_);
            for (auto &entry : handlers_)
            {
                std::erase_if(entry.second,
                              [id](auto const &slot) { return slot.id == id; });
            }
            if (auto it = mailboxes_.find(id); it != mailboxes_.end())
            {
                mailbox = std::move(it->second);
                mailboxes_.erase(it);
            }
        }
        if (mailbox)
        {
            mailbox->stop();
        }
    }

    template <typename T> void publish(T const &event) const
    {
        // Handlers are copied so none runs under the lock; a handler may
        // subscribe or publish without deadlocking.
        std::vector<Slot> handlers_copy;
        {
            std::shared_lock lock(handlers_mutex_);
            auto it = handlers_.find(std::type_index(typeid(T)));
            if (it != handlers_.end())
            {
                handlers_copy = it->second;
            }
        }

        std::any const boxed = event;
        for (auto const &slot : handlers_copy)
        {
            slot.handler(boxed);
        }
    }

    // Blocks until every queued subscriber has drained its mailbox.
    void wait_idle() const
    {
        std::vector<std::shared_ptr<AsyncTaskService>> boxes;
        {
            std::shared_lock lock(handlers_mutex_);
            for (auto const &entry : mailboxes_)
            {
                boxes.push_back(entry.second);
            }
        }
        for (auto const &box : boxes)
        {
            box->wait_idle();
        }
    }

  private:
    using TypeErasedHandler = std::function<void(std::any const &)>;
    struct Slot
    {
        SubscriptionId id;
        TypeErasedHandler handler;
    };

    std::unordered_map<std::type_index, std::vector<Slot>> handlers_;
    std::unordered_map<SubscriptionId, std::shared_ptr<AsyncTaskService>>
        mailboxes_;
    SubscriptionId next_id_ = 1;
    mutable std::shared_mutex handlers_mutex_;
};

} // namespace kc::engine
