#include "PipelineConfig.hpp"

#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QLoggingCategory>

#include <algorithm>
#include <optional>

#include "utils/PathUtils.hpp"

Q_LOGGING_CATEGORY(lcPipelineConfig, "marketbrief.config")

namespace marketbrief {

namespace {

constexpr auto kEquityEndpointEnv = "MARKETBRIEF_EQUITY_ENDPOINT";
constexpr auto kCryptoEndpointEnv = "MARKETBRIEF_CRYPTO_ENDPOINT";
constexpr auto kAuthTokenEnv = "MARKETBRIEF_AUTH_TOKEN";
constexpr auto kAuthTokenFileEnv = "MARKETBRIEF_AUTH_TOKEN_FILE";
constexpr auto kCallTimeoutEnv = "MARKETBRIEF_CALL_TIMEOUT_MS";
constexpr auto kTlsEnabledEnv = "MARKETBRIEF_TLS_ENABLED";
constexpr auto kTlsRootCaEnv = "MARKETBRIEF_TLS_ROOT_CA";
constexpr auto kAssetStoreEnv = "MARKETBRIEF_ASSET_STORE";

std::optional<QString> envValue(const char* key)
{
    if (!qEnvironmentVariableIsSet(key))
        return std::nullopt;
    return qEnvironmentVariable(key);
}

std::optional<bool> envBool(const char* key)
{
    const auto valueOpt = envValue(key);
    if (!valueOpt.has_value())
        return std::nullopt;
    const QString normalized = valueOpt->trimmed().toLower();
    if (normalized.isEmpty())
        return std::nullopt;
    if (normalized == QStringLiteral("1") || normalized == QStringLiteral("true") ||
        normalized == QStringLiteral("yes") || normalized == QStringLiteral("on"))
        return true;
    if (normalized == QStringLiteral("0") || normalized == QStringLiteral("false") ||
        normalized == QStringLiteral("no") || normalized == QStringLiteral("off"))
        return false;
    qCWarning(lcPipelineConfig) << "Nieprawidłowa wartość" << *valueOpt << "w zmiennej" << key
                                << "- oczekiwano wartości boolowskiej (true/false).";
    return std::nullopt;
}

int intValue(const QJsonObject& object, const QString& key, int fallback)
{
    const QJsonValue value = object.value(key);
    if (!value.isDouble())
        return fallback;
    return value.toInt(fallback);
}

QString pathValue(const QJsonObject& object, const QString& key)
{
    return utils::expandPath(object.value(key).toString());
}

} // namespace

Result<PipelineConfig> PipelineConfig::loadFromFile(const QString& path)
{
    const QString expanded = utils::expandPath(path);
    QFile file(expanded);
    if (!file.exists()) {
        return Result<PipelineConfig>::failure(ErrorKind::NotFound,
                                               QStringLiteral("Plik konfiguracji nie istnieje: %1").arg(expanded));
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcPipelineConfig) << "Nie udało się otworzyć konfiguracji" << expanded << file.errorString();
        return Result<PipelineConfig>::failure(ErrorKind::InvalidArgument,
                                               QStringLiteral("Nie udało się otworzyć %1: %2")
                                                   .arg(expanded, file.errorString()));
    }
    return fromJson(file.readAll());
}

Result<PipelineConfig> PipelineConfig::fromJson(const QByteArray& json)
{
    QJsonParseError parseError{};
    const QJsonDocument document = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        qCWarning(lcPipelineConfig) << "Niepoprawny JSON konfiguracji" << parseError.errorString();
        return Result<PipelineConfig>::failure(ErrorKind::InvalidArgument,
                                               QStringLiteral("Niepoprawny JSON konfiguracji: %1")
                                                   .arg(parseError.errorString()));
    }
    return Result<PipelineConfig>::success(fromJsonObject(document.object()));
}

PipelineConfig PipelineConfig::fromJsonObject(const QJsonObject& object)
{
    PipelineConfig config;
    const QJsonObject gateway = object.value(QStringLiteral("gateway")).toObject();
    config.equityEndpoint = gateway.value(QStringLiteral("equity_endpoint")).toString().trimmed();
    config.cryptoEndpoint = gateway.value(QStringLiteral("crypto_endpoint")).toString().trimmed();
    config.authToken = gateway.value(QStringLiteral("auth_token")).toString().trimmed();
    config.authTokenFile = pathValue(gateway, QStringLiteral("auth_token_file"));
    config.callTimeoutMs = intValue(gateway, QStringLiteral("call_timeout_ms"), config.callTimeoutMs);

    const QJsonObject tls = gateway.value(QStringLiteral("tls")).toObject();
    config.tls.enabled = tls.value(QStringLiteral("enabled")).toBool(false);
    config.tls.requireClientAuth = tls.value(QStringLiteral("require_client_auth")).toBool(false);
    config.tls.rootCertificatePath = pathValue(tls, QStringLiteral("root_ca"));
    config.tls.clientCertificatePath = pathValue(tls, QStringLiteral("client_cert"));
    config.tls.clientKeyPath = pathValue(tls, QStringLiteral("client_key"));
    config.tls.serverNameOverride = tls.value(QStringLiteral("server_name_override")).toString().trimmed();
    config.tls.targetNameOverride = tls.value(QStringLiteral("target_name_override")).toString().trimmed();

    const QJsonObject pipeline = object.value(QStringLiteral("pipeline")).toObject();
    config.maxCandidates = intValue(pipeline, QStringLiteral("max_candidates"), config.maxCandidates);
    config.maxCryptoCandidates = intValue(pipeline, QStringLiteral("max_crypto_candidates"), config.maxCryptoCandidates);
    config.indicatorPointLimit = intValue(pipeline, QStringLiteral("indicator_point_limit"), config.indicatorPointLimit);
    config.indicatorTtlSeconds = intValue(pipeline, QStringLiteral("indicator_ttl_seconds"), config.indicatorTtlSeconds);
    config.lookupTtlSeconds = intValue(pipeline, QStringLiteral("lookup_ttl_seconds"), config.lookupTtlSeconds);
    config.workerThreads = intValue(pipeline, QStringLiteral("worker_threads"), config.workerThreads);
    config.newsLimit = intValue(pipeline, QStringLiteral("news_limit"), config.newsLimit);
    config.assetStorePath = pathValue(pipeline, QStringLiteral("asset_store"));
    return config;
}

void PipelineConfig::applyEnvironmentOverrides()
{
    if (const auto value = envValue(kEquityEndpointEnv))
        equityEndpoint = value->trimmed();
    if (const auto value = envValue(kCryptoEndpointEnv))
        cryptoEndpoint = value->trimmed();
    if (const auto value = envValue(kAuthTokenEnv))
        authToken = value->trimmed();
    if (const auto value = envValue(kAuthTokenFileEnv))
        authTokenFile = utils::expandPath(*value);
    if (const auto value = envValue(kAssetStoreEnv))
        assetStorePath = utils::expandPath(*value);
    if (const auto value = envValue(kTlsRootCaEnv))
        tls.rootCertificatePath = utils::expandPath(*value);
    if (const auto enabled = envBool(kTlsEnabledEnv))
        tls.enabled = *enabled;
    if (const auto value = envValue(kCallTimeoutEnv)) {
        bool ok = false;
        const int candidate = value->trimmed().toInt(&ok);
        if (ok && candidate > 0)
            callTimeoutMs = candidate;
        else
            qCWarning(lcPipelineConfig) << "Nieprawidłowa wartość" << *value << "dla" << kCallTimeoutEnv;
    }
}

QString PipelineConfig::effectiveAuthToken() const
{
    if (!authToken.trimmed().isEmpty() || authTokenFile.trimmed().isEmpty())
        return authToken.trimmed();

    QFile file(authTokenFile);
    if (!file.exists()) {
        qCWarning(lcPipelineConfig) << "Plik z tokenem nie istnieje:" << authTokenFile;
        return {};
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(lcPipelineConfig) << "Nie udało się odczytać pliku z tokenem" << authTokenFile << file.errorString();
        return {};
    }
    const QString token = QString::fromUtf8(file.readAll()).trimmed();
    if (token.isEmpty())
        qCWarning(lcPipelineConfig) << "Plik" << authTokenFile << "nie zawiera tokenu autoryzacyjnego";
    return token;
}

QStringList PipelineConfig::validate() const
{
    QStringList errors;
    if (callTimeoutMs <= 0)
        errors.append(QStringLiteral("Limit czasu wywołania musi być dodatni."));
    if (maxCandidates < 1)
        errors.append(QStringLiteral("Liczba kandydatów musi wynosić co najmniej 1."));
    if (maxCryptoCandidates < 0 || maxCryptoCandidates > std::max(maxCandidates, 0))
        errors.append(QStringLiteral("Limit kandydatów krypto musi mieścić się w zakresie 0..max_candidates."));
    if (indicatorPointLimit < 1)
        errors.append(QStringLiteral("Limit punktów wskaźnika musi wynosić co najmniej 1."));
    if (indicatorTtlSeconds < 0 || lookupTtlSeconds < 0)
        errors.append(QStringLiteral("TTL pamięci podręcznej nie może być ujemny."));
    if (workerThreads < 0)
        errors.append(QStringLiteral("Liczba wątków roboczych nie może być ujemna."));
    if (newsLimit < 0)
        errors.append(QStringLiteral("Limit wiadomości nie może być ujemny."));
    return errors;
}

} // namespace marketbrief
