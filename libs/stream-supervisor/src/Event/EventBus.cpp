#include <ssv/Event/EventBus.hpp>
#include <ssv/Channel/ChannelConfig.hpp>
#include <QMetaObject>
#include <algorithm>

namespace ssv {

EventBus::EventBus(QObject* parent) : QObject(parent)
{
    qRegisterMetaType<ChannelEvent>();
}

int EventBus::subscribe(const QString& topic, Callback callback)
{
    return addSubscription(topic, {}, std::move(callback));
}

int EventBus::subscribeChannel(const QString& topic, const QString& channel, Callback callback)
{
    return addSubscription(topic, channelSlug(channel), std::move(callback));
}

int EventBus::addSubscription(const QString& topic, const QString& slug, Callback callback)
{
    QMutexLocker lock(&mutex_);
    int id = nextId_++;
    subscriptions_.insert(id, {topic, slug, std::move(callback)});
    topicIndex_.insert(topic, id);
    return id;
}

void EventBus::unsubscribe(int subscriptionId)
{
    QMutexLocker lock(&mutex_);
    auto it = subscriptions_.find(subscriptionId);
    if (it == subscriptions_.end()) return;
    topicIndex_.remove(it->topic, subscriptionId);
    subscriptions_.erase(it);
}

void EventBus::publish(const QString& topic, const QVariant& payload)
{
    QString eventSlug;
    if (payload.canConvert<ChannelEvent>())
        eventSlug = channelSlug(payload.value<ChannelEvent>().channel);

    QMutexLocker lock(&mutex_);
    auto ids = topicIndex_.values(topic);
    std::sort(ids.begin(), ids.end());

    for (int id : ids) {
        const Subscription& sub = subscriptions_[id];
        if (!sub.channelSlug.isEmpty() && sub.channelSlug != eventSlug)
            continue;

        // Posted under the lock so publishers on different threads cannot
        // interleave one subscriber's deliveries.
        auto cb = sub.callback;
        QMetaObject::invokeMethod(this, [this, id, cb, payload]() {
            {
                QMutexLocker guard(&mutex_);
                if (!subscriptions_.contains(id)) return;
            }
            cb(payload);
        }, Qt::QueuedConnection);
    }
}

void EventBus::publish(const ChannelEvent& event)
{
    publish(topicFor(event), QVariant::fromValue(event));
}

QString EventBus::topicFor(const ChannelEvent& event)
{
    if (event.kind == EventKind::Log)
        return QString::fromLatin1(TOPIC_CHANNEL_LOG);
    if (event.channel.isEmpty())
        return QString::fromLatin1(TOPIC_SERVICE_STATUS);
    return QString::fromLatin1(TOPIC_CHANNEL_STATUS);
}

int EventBus::subscriberCount(const QString& topic) const
{
    QMutexLocker lock(&mutex_);
    return topicIndex_.count(topic);
}

} // namespace ssv
