#pragma once

#include <QByteArray>
#include <QPair>
#include <QString>
#include <QStringList>
#include <QVector>

#include <chrono>
#include <memory>
#include <mutex>

#include "grpc/GatewayTlsConfig.hpp"

namespace grpc {
class Channel;
class ClientContext;
} // namespace grpc

namespace marketbrief {

//! Connection settings and lazily created channel shared by one gateway client.
class GatewayChannel {
public:
    struct PreflightResult {
        bool        ok = false;
        QStringList errors;
        QStringList warnings;
    };

    explicit GatewayChannel(QString serviceName);
    ~GatewayChannel();

    void setEndpoint(const QString& endpoint);
    void setTlsConfig(const GatewayTlsConfig& config);
    void setAuthToken(const QString& token);
    void setCallTimeout(std::chrono::milliseconds timeout);

    QString endpoint() const;
    std::chrono::milliseconds callTimeout() const;
    const QString& serviceName() const { return m_serviceName; }

    //! nullptr when no endpoint is configured.
    std::shared_ptr<grpc::Channel> channel();
    //! Carries the authorization metadata and the per-call deadline.
    std::unique_ptr<grpc::ClientContext> buildContext() const;

    QVector<QPair<QByteArray, QByteArray>> authMetadataForTesting() const;
    bool hasChannelForTesting() const;

    PreflightResult runPreflightChecklist() const;

private:
    void ensureChannelLocked();
    void resetChannelLocked();

    const QString             m_serviceName;
    mutable std::mutex        m_mutex;
    QString                   m_endpoint;
    GatewayTlsConfig          m_tlsConfig;
    QString                   m_authToken;
    std::chrono::milliseconds m_callTimeout{5000};

    std::shared_ptr<grpc::Channel> m_channel;
};

} // namespace marketbrief
