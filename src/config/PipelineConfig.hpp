#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include "grpc/GatewayTlsConfig.hpp"
#include "models/Result.hpp"

namespace marketbrief {

//! Runtime settings of the pipeline and its gateway clients.
struct PipelineConfig {
    QString          equityEndpoint;
    QString          cryptoEndpoint;
    GatewayTlsConfig tls;
    QString          authToken;
    QString          authTokenFile;
    QString          assetStorePath;

    int callTimeoutMs = 5000;
    int maxCandidates = 4;
    int maxCryptoCandidates = 2;
    int indicatorPointLimit = 12;
    int indicatorTtlSeconds = 3600;
    int lookupTtlSeconds = 300;
    int newsLimit = 30; // 0 wyłącza sekcje wiadomości
    int workerThreads = 0; // 0 -> QThread::idealThreadCount()

    static Result<PipelineConfig> loadFromFile(const QString& path);
    static Result<PipelineConfig> fromJson(const QByteArray& json);
    static PipelineConfig fromJsonObject(const QJsonObject& object);

    //! MARKETBRIEF_* variables take precedence over file values.
    void applyEnvironmentOverrides();

    //! Returns the auth token, reading authTokenFile when no inline token is set.
    QString effectiveAuthToken() const;

    QStringList validate() const;
};

} // namespace marketbrief
