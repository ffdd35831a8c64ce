#pragma once

#include <QObject>
#include <QString>
#include <QVariantList>

extern "C" {
#include "nats.h"
}

// Subscribes to a NATS subject carrying CBOR network snapshots and re-emits
// each decoded snapshot on the thread that owns this object.
class NetworkFeed : public QObject
{
    Q_OBJECT
public:
    explicit NetworkFeed(QObject *parent = nullptr);
    ~NetworkFeed();

    void setServerUrl(const QString &url);
    void setSubject(const QString &subject);
    void start();
    void stop();

signals:
    void snapshotReceived(const QVariantList &nodes, const QVariantList &routes);
    void statusMessage(const QString &msg);

private:
    static void onMessage(natsConnection *, natsSubscription *, natsMsg *msg, void *closure);
    void handleMessage(natsMsg *msg);
    void disconnect();

    QString m_serverUrl;
    QString m_subject;
    natsConnection *m_conn {nullptr};
    natsSubscription *m_sub {nullptr};
};
