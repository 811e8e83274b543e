#pragma once

#include <aria/color.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace aria
{

struct ExpansionSnapshot
{
    float                progress = 0.0f;
    std::optional<Color> background;
    std::optional<Color> primary;

    bool operator==(const ExpansionSnapshot&) const = default;
};

// One-to-many broadcast of the player's expansion state to surrounding
// chrome. Owned by the overlay; subscribers only ever see published values.
class ExpansionNotifier
{
   public:
    using Callback       = std::function<void(const ExpansionSnapshot&)>;
    using SubscriptionId = uint32_t;

    ExpansionNotifier() = default;

    ExpansionNotifier(const ExpansionNotifier&)            = delete;
    ExpansionNotifier& operator=(const ExpansionNotifier&) = delete;

    const ExpansionSnapshot& value() const { return value_; }

    // The new subscriber is called immediately with the current value.
    SubscriptionId subscribe(Callback cb)
    {
        SubscriptionId id = next_id_++;
        subscribers_.push_back({id, std::move(cb)});
        if (subscribers_.back().cb)
            subscribers_.back().cb(value_);
        return id;
    }

    void unsubscribe(SubscriptionId id)
    {
        std::erase_if(subscribers_, [id](const Subscriber& s) { return s.id == id; });
    }

    size_t subscriber_count() const { return subscribers_.size(); }

    // Notifies only when the value actually changed.
    void publish(const ExpansionSnapshot& snapshot)
    {
        if (snapshot == value_)
            return;
        value_    = snapshot;
        auto subs = subscribers_;
        for (const auto& s : subs)
        {
            if (s.cb)
                s.cb(value_);
        }
    }

   private:
    struct Subscriber
    {
        SubscriptionId id;
        Callback       cb;
    };

    ExpansionSnapshot       value_;
    SubscriptionId          next_id_ = 1;
    std::vector<Subscriber> subscribers_;
};

}   // namespace aria
