#pragma once

#include <ssv/Event/IEventBus.hpp>
#include <QObject>
#include <QMutex>
#include <QMap>
#include <QMultiHash>

namespace ssv {

class EventBus : public QObject, public IEventBus {
    Q_OBJECT
public:
    explicit EventBus(QObject* parent = nullptr);

    int subscribe(const QString& topic, Callback callback) override;
    int subscribeChannel(const QString& topic, const QString& channel,
                         Callback callback) override;
    void unsubscribe(int subscriptionId) override;
    void publish(const QString& topic, const QVariant& payload = {}) override;
    void publish(const ChannelEvent& event) override;
    int subscriberCount(const QString& topic) const override;

    static QString topicFor(const ChannelEvent& event);

private:
    struct Subscription {
        QString topic;
        QString channelSlug;  // empty = every channel
        Callback callback;
    };

    int addSubscription(const QString& topic, const QString& channelSlug, Callback callback);

    mutable QMutex mutex_;
    int nextId_ = 1;
    QMap<int, Subscription> subscriptions_;  // ordered by id
    QMultiHash<QString, int> topicIndex_;
};

} // namespace ssv
