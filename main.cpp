#include <QCommandLineParser>
#include <QGuiApplication>
#include <QQmlApplicationEngine>
#include <QQmlEngine>

#include "NetworkConfig.h"
#include "NetworkFeed.h"
#include "NetworkSnapshot.h"
#include "NetworkView.h"

int main(int argc, char *argv[])
{
    QGuiApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("supplychainview"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Interactive supply-chain network diagram"));
    parser.addHelpOption();
    const QCommandLineOption configOption(QStringLiteral("config"), QStringLiteral("View configuration (JSON)."), QStringLiteral("file"));
    const QCommandLineOption dataOption(QStringLiteral("data"), QStringLiteral("Network snapshot to show at startup (JSON)."), QStringLiteral("file"));
    const QCommandLineOption natsOption(QStringLiteral("nats"), QStringLiteral("NATS server URL for live snapshots."), QStringLiteral("url"));
    const QCommandLineOption subjectOption(QStringLiteral("subject"), QStringLiteral("NATS subject to subscribe to."),
                                           QStringLiteral("subject"), QStringLiteral("supplychain.network.*"));
    const QCommandLineOption noDragOption(QStringLiteral("no-drag"), QStringLiteral("Disable dragging nodes."));
    parser.addOptions({configOption, dataOption, natsOption, subjectOption, noDragOption});
    parser.process(app);

    qmlRegisterType<NetworkView>("SupplyChainView", 1, 0, "NetworkView");

    QQmlApplicationEngine engine;
    engine.addImportPath(QStringLiteral("qrc:/"));
    QObject::connect(
        &engine,
        &QQmlApplicationEngine::objectCreationFailed,
        &app,
        []() { QCoreApplication::exit(-1); },
        Qt::QueuedConnection);
    engine.loadFromModule("SupplyChainView", "Main");

    if (engine.rootObjects().isEmpty())
        return app.exec();

    QObject *root = engine.rootObjects().first();
    auto *view = root->findChild<NetworkView *>(QStringLiteral("networkView"));
    if (!view) {
        qWarning() << "Main.qml has no NetworkView named networkView";
        return app.exec();
    }

    if (parser.isSet(configOption)) {
        NetworkConfig config;
        QString error;
        if (NetworkConfig::loadFromJsonFile(parser.value(configOption), config, &error))
            view->setNetworkConfig(config);
        else
            qWarning().noquote() << "Ignoring config:" << error;
    }

    if (parser.isSet(noDragOption))
        view->setDragEnabled(false);

    if (parser.isSet(dataOption)) {
        NetworkSnapshot snapshot;
        QString error;
        if (loadSnapshotJson(parser.value(dataOption), snapshot, &error)) {
            view->setNodes(snapshot.nodes);
            view->setRoutes(snapshot.routes);
            qInfo().noquote() << "Loaded" << snapshot.nodes.size() << "facilities and" << snapshot.routes.size() << "routes";
        } else {
            qWarning().noquote() << "Cannot load snapshot:" << error;
        }
    }

    // Live feed is wired here so NetworkView itself stays NATS-agnostic.
    if (parser.isSet(natsOption)) {
        auto *feed = new NetworkFeed(&app);
        QObject::connect(feed, &NetworkFeed::snapshotReceived, view, [view](const QVariantList &nodes, const QVariantList &routes) {
            view->setNodes(nodes);
            view->setRoutes(routes);
        });
        QObject::connect(feed, &NetworkFeed::statusMessage, [](const QString &msg) {
            qInfo().noquote() << msg;
        });
        feed->setServerUrl(parser.value(natsOption));
        feed->setSubject(parser.value(subjectOption));
        feed->start();
    }

    return app.exec();
}
