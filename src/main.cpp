#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QTextStream>

#include <memory>

#include "config/PipelineConfig.hpp"
#include "context/ContextJsonWriter.hpp"
#include "context/ContextPipeline.hpp"
#include "grpc/GatewayClientFactory.hpp"
#include "providers/JsonAssetStore.hpp"

Q_LOGGING_CATEGORY(lcMain, "marketbrief.main")

using namespace marketbrief;

namespace {

void configureParser(QCommandLineParser& parser)
{
    parser.setApplicationDescription(QObject::tr("Buduje kontekst rynkowy dla pytania użytkownika."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOption({{"c", "config"}, QObject::tr("Plik konfiguracji JSON"), QObject::tr("path")});
    parser.addOption({{"e", "endpoint"}, QObject::tr("Adres gRPC host:port bramki akcji"), QObject::tr("endpoint")});
    parser.addOption({"crypto-endpoint", QObject::tr("Adres gRPC host:port bramki krypto"), QObject::tr("endpoint")});
    parser.addOption({"asset-store", QObject::tr("Plik snapshotów bellwether i kalendarza"), QObject::tr("path")});
    parser.addOption({"pretty", QObject::tr("Formatuj wynikowy JSON")});
    parser.addPositionalArgument(QStringLiteral("query"), QObject::tr("Pytanie użytkownika"));
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("marketbrief"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    configureParser(parser);
    parser.process(app);

    PipelineConfig config;
    if (parser.isSet(QStringLiteral("config"))) {
        const Result<PipelineConfig> loaded = PipelineConfig::loadFromFile(parser.value(QStringLiteral("config")));
        if (!loaded.ok()) {
            QTextStream(stderr) << loaded.errorMessage() << Qt::endl;
            return EXIT_FAILURE;
        }
        config = loaded.value();
    }
    config.applyEnvironmentOverrides();
    if (parser.isSet(QStringLiteral("endpoint")))
        config.equityEndpoint = parser.value(QStringLiteral("endpoint")).trimmed();
    if (parser.isSet(QStringLiteral("crypto-endpoint")))
        config.cryptoEndpoint = parser.value(QStringLiteral("crypto-endpoint")).trimmed();
    if (parser.isSet(QStringLiteral("asset-store")))
        config.assetStorePath = parser.value(QStringLiteral("asset-store"));

    const QStringList errors = config.validate();
    if (!errors.isEmpty()) {
        for (const QString& error : errors)
            QTextStream(stderr) << error << Qt::endl;
        return EXIT_FAILURE;
    }

    auto store = std::make_shared<JsonAssetStore>();
    if (!config.assetStorePath.isEmpty()) {
        QString storeError;
        if (!store->loadFromFile(config.assetStorePath, &storeError))
            qCWarning(lcMain) << "Kontynuuję bez snapshotów:" << storeError;
    }

    const ContextPipeline pipeline({makeEquityDataClient(config), makeCryptoDataClient(config), store}, config);
    const AggregatedContext context = pipeline.run(parser.positionalArguments().join(QLatin1Char(' ')));

    const auto format = parser.isSet(QStringLiteral("pretty")) ? QJsonDocument::Indented : QJsonDocument::Compact;
    QTextStream(stdout) << ContextJsonWriter::toJson(context, format) << Qt::endl;
    return EXIT_SUCCESS;
}
