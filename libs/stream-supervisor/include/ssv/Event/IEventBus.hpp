#pragma once

#include <ssv/Event/ChannelEvent.hpp>
#include <QString>
#include <QVariant>
#include <functional>

namespace ssv {

/// Topic-keyed fan-out of channel and service events.
/// Subscribers are invoked on the bus's thread (Qt::QueuedConnection),
/// in publish order, and in subscription order within one publish.
class IEventBus {
public:
    virtual ~IEventBus() = default;

    using Callback = std::function<void(const QVariant& payload)>;

    /// Returns a subscription ID for unsubscribe. Thread-safe.
    virtual int subscribe(const QString& topic, Callback callback) = 0;

    /// Like subscribe(), but only ChannelEvent payloads for `channel`
    /// (matched by slug) are delivered.
    virtual int subscribeChannel(const QString& topic, const QString& channel,
                                 Callback callback) = 0;

    /// Thread-safe. Deliveries already queued for the subscription are dropped.
    virtual void unsubscribe(int subscriptionId) = 0;

    /// Thread-safe (can be called from any thread).
    virtual void publish(const QString& topic, const QVariant& payload = {}) = 0;

    /// Publishes on the topic matching the event: channel/log for log lines,
    /// channel/status for channel transitions, service/status otherwise.
    virtual void publish(const ChannelEvent& event) = 0;

    virtual int subscriberCount(const QString& topic) const = 0;
};

} // namespace ssv
