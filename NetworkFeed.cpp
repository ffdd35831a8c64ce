#include "NetworkFeed.h"

#include "NetworkSnapshot.h"

#include <QByteArray>
#include <QMetaObject>

NetworkFeed::NetworkFeed(QObject *parent)
    : QObject(parent)
{
}

NetworkFeed::~NetworkFeed()
{
    stop();
}

void NetworkFeed::setServerUrl(const QString &url)
{
    m_serverUrl = url;
}

void NetworkFeed::setSubject(const QString &subject)
{
    m_subject = subject;
}

void NetworkFeed::start()
{
    if (m_conn)
        return;

    const QByteArray urlUtf8 = m_serverUrl.isEmpty() ? QByteArrayLiteral("nats://127.0.0.1:4222") : m_serverUrl.toUtf8();
    const QByteArray subjUtf8 = m_subject.isEmpty() ? QByteArrayLiteral("supplychain.network.*") : m_subject.toUtf8();

    natsStatus s = natsConnection_ConnectTo(&m_conn, urlUtf8.constData());
    if (s != NATS_OK) {
        emit statusMessage(QStringLiteral("Network feed: no NATS server at %1 (%2)")
                               .arg(QString::fromUtf8(urlUtf8), QString::fromLatin1(natsStatus_GetText(s))));
        disconnect();
        return;
    }

    s = natsConnection_Subscribe(&m_sub, m_conn, subjUtf8.constData(), &NetworkFeed::onMessage, this);
    if (s != NATS_OK) {
        emit statusMessage(QStringLiteral("Network feed: cannot listen on %1 (%2)")
                               .arg(QString::fromUtf8(subjUtf8), QString::fromLatin1(natsStatus_GetText(s))));
        disconnect();
        return;
    }

    emit statusMessage(QStringLiteral("Network feed: waiting for snapshots on %1 at %2")
                           .arg(QString::fromUtf8(subjUtf8), QString::fromUtf8(urlUtf8)));
}

void NetworkFeed::stop()
{
    disconnect();
}

void NetworkFeed::disconnect()
{
    if (m_sub) {
        natsSubscription_Destroy(m_sub);
        m_sub = nullptr;
    }
    if (m_conn) {
        natsConnection_Destroy(m_conn);
        m_conn = nullptr;
    }
}

// static
void NetworkFeed::onMessage(natsConnection *, natsSubscription *, natsMsg *msg, void *closure)
{
    auto *self = static_cast<NetworkFeed *>(closure);
    if (!self) {
        natsMsg_Destroy(msg);
        return;
    }
    self->handleMessage(msg);
}

// Called on the NATS delivery thread. The payload is copied and the message
// freed here; scene state is only touched from the queued emits below.
void NetworkFeed::handleMessage(natsMsg *msg)
{
    if (!msg)
        return;

    const QByteArray payload(natsMsg_GetData(msg), natsMsg_GetDataLength(msg));
    natsMsg_Destroy(msg);

    NetworkSnapshot snapshot;
    QString error;
    if (!decodeSnapshotCbor(payload, snapshot, &error)) {
        QMetaObject::invokeMethod(
            this,
            [this, error]() { emit statusMessage(QStringLiteral("Network feed: snapshot rejected, %1").arg(error)); },
            Qt::QueuedConnection);
        return;
    }

    QMetaObject::invokeMethod(
        this,
        [this, snapshot]() { emit snapshotReceived(snapshot.nodes, snapshot.routes); },
        Qt::QueuedConnection);
}
