#include "NetworkSnapshot.h"

#include <QCborArray>
#include <QCborMap>
#include <QCborValue>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <initializer_list>

namespace {

QCborValue pick(const QCborMap &m, const std::initializer_list<QCborValue> &keys)
{
    for (const auto &k : keys) {
        auto it = m.constFind(k);
        if (it != m.constEnd())
            return it.value();
    }
    return QCborValue();
}

QVariantList mapEntries(const QCborValue &value)
{
    QVariantList out;
    if (!value.isArray())
        return out;
    for (const QCborValue &entry : value.toArray()) {
        if (entry.isMap())
            out.append(entry.toMap().toVariantMap());
    }
    return out;
}

QVariantList mapEntries(const QJsonValue &value)
{
    QVariantList out;
    if (!value.isArray())
        return out;
    for (const QJsonValue &entry : value.toArray()) {
        if (entry.isObject())
            out.append(entry.toObject().toVariantMap());
    }
    return out;
}

} // namespace

bool decodeSnapshotCbor(const QByteArray &payload, NetworkSnapshot &out, QString *error)
{
    QCborParserError err;
    const QCborValue val = QCborValue::fromCbor(payload, &err);
    if (err.error != QCborError::NoError || !val.isMap()) {
        if (error)
            *error = err.error != QCborError::NoError ? err.errorString() : QStringLiteral("payload is not a map");
        return false;
    }

    const QCborMap map = val.toMap();
    const QCborValue nodes = pick(map, {QCborValue(QStringLiteral("nodes")), QCborValue(QStringLiteral("Nodes"))});
    const QCborValue routes = pick(map, {QCborValue(QStringLiteral("routes")), QCborValue(QStringLiteral("Routes"))});
    if (!nodes.isArray()) {
        if (error)
            *error = QStringLiteral("payload has no node list");
        return false;
    }

    out.nodes = mapEntries(nodes);
    out.routes = mapEntries(routes);
    return true;
}

bool loadSnapshotJson(const QString &path, NetworkSnapshot &out, QString *error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error)
            *error = QStringLiteral("cannot open %1: %2").arg(path, file.errorString());
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (error)
            *error = QStringLiteral("%1: %2").arg(path, parseError.errorString());
        return false;
    }
    if (!doc.isObject()) {
        if (error)
            *error = QStringLiteral("%1: top level is not an object").arg(path);
        return false;
    }

    const QJsonObject root = doc.object();
    if (!root.value(QStringLiteral("nodes")).isArray()) {
        if (error)
            *error = QStringLiteral("%1: no \"nodes\" array").arg(path);
        return false;
    }
    out.nodes = mapEntries(root.value(QStringLiteral("nodes")));
    out.routes = mapEntries(root.value(QStringLiteral("routes")));
    return true;
}
