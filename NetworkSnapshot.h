#pragma once

#include <QByteArray>
#include <QString>
#include <QVariantList>

// One read-only snapshot of the input records, as handed to NetworkScene.
struct NetworkSnapshot {
    QVariantList nodes;
    QVariantList routes;
};

// CBOR map {"nodes": [...], "routes": [...]}. Non-map entries are skipped.
bool decodeSnapshotCbor(const QByteArray &payload, NetworkSnapshot &out, QString *error = nullptr);

// JSON object with the same layout as the CBOR payload.
bool loadSnapshotJson(const QString &path, NetworkSnapshot &out, QString *error = nullptr);
