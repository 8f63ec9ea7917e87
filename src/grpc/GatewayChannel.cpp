#include "GatewayChannel.hpp"

#include <QFile>
#include <QFileInfo>
#include <QIODevice>
#include <QLoggingCategory>

#include <grpcpp/channel.h>
#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <optional>
#include <utility>

Q_LOGGING_CATEGORY(lcGatewayChannel, "marketbrief.gateway.grpc")

namespace marketbrief {

namespace {

std::optional<QByteArray> readFileBytes(const QString& path)
{
    if (path.trimmed().isEmpty()) {
        return std::nullopt;
    }
    QFile file(path);
    if (!file.exists()) {
        qCWarning(lcGatewayChannel) << "Plik TLS nie istnieje" << path;
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcGatewayChannel) << "Nie można odczytać pliku TLS" << path << file.errorString();
        return std::nullopt;
    }
    return file.readAll();
}

std::string toStdString(const QByteArray& bytes)
{
    return std::string(bytes.constData(), static_cast<std::size_t>(bytes.size()));
}

} // namespace

GatewayChannel::GatewayChannel(QString serviceName)
    : m_serviceName(std::move(serviceName))
{
}

GatewayChannel::~GatewayChannel() = default;

void GatewayChannel::setEndpoint(const QString& endpoint)
{
    const QString sanitized = endpoint.trimmed();
    std::lock_guard<std::mutex> lock(m_mutex);
    if (sanitized == m_endpoint) {
        return;
    }
    m_endpoint = sanitized;
    resetChannelLocked();
}

void GatewayChannel::setTlsConfig(const GatewayTlsConfig& config)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (config == m_tlsConfig) {
        return;
    }
    m_tlsConfig = config;
    resetChannelLocked();
}

void GatewayChannel::setAuthToken(const QString& token)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_authToken = token.trimmed();
}

void GatewayChannel::setCallTimeout(std::chrono::milliseconds timeout)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_callTimeout = timeout.count() > 0 ? timeout : std::chrono::milliseconds(5000);
}

QString GatewayChannel::endpoint() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_endpoint;
}

std::chrono::milliseconds GatewayChannel::callTimeout() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_callTimeout;
}

std::shared_ptr<grpc::Channel> GatewayChannel::channel()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    ensureChannelLocked();
    return m_channel;
}

std::unique_ptr<grpc::ClientContext> GatewayChannel::buildContext() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto context = std::make_unique<grpc::ClientContext>();
    context->set_deadline(std::chrono::system_clock::now() + m_callTimeout);
    if (!m_authToken.isEmpty()) {
        context->AddMetadata("authorization", std::string("Bearer ") + m_authToken.toStdString());
    }
    context->AddMetadata("x-marketbrief-service", m_serviceName.toStdString());
    return context;
}

QVector<QPair<QByteArray, QByteArray>> GatewayChannel::authMetadataForTesting() const
{
    QVector<QPair<QByteArray, QByteArray>> metadata;
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_authToken.isEmpty()) {
        metadata.append({QByteArrayLiteral("authorization"), QByteArrayLiteral("Bearer ") + m_authToken.toUtf8()});
    }
    metadata.append({QByteArrayLiteral("x-marketbrief-service"), m_serviceName.toUtf8()});
    return metadata;
}

bool GatewayChannel::hasChannelForTesting() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<bool>(m_channel);
}

GatewayChannel::PreflightResult GatewayChannel::runPreflightChecklist() const
{
    PreflightResult result;

    QString endpoint;
    GatewayTlsConfig tls;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        endpoint = m_endpoint;
        tls = m_tlsConfig;
    }

    if (endpoint.isEmpty()) {
        result.errors.append(QStringLiteral("Endpoint %1 nie może być pusty.").arg(m_serviceName));
    }

    if (tls.enabled) {
        const QString rootPath = tls.rootCertificatePath.trimmed();
        if (rootPath.isEmpty()) {
            result.warnings.append(
                QStringLiteral("TLS %1 używa systemowych certyfikatów root - nie wskazano pliku root CA.").arg(m_serviceName));
        } else if (!QFileInfo::exists(rootPath)) {
            result.errors.append(QStringLiteral("Plik root CA %1 nie istnieje: %2").arg(m_serviceName, rootPath));
        }

        const bool certProvided = !tls.clientCertificatePath.trimmed().isEmpty();
        const bool keyProvided = !tls.clientKeyPath.trimmed().isEmpty();
        if (tls.requireClientAuth && (!certProvided || !keyProvided)) {
            result.errors.append(QStringLiteral("Konfiguracja mTLS %1 wymaga certyfikatu i klucza klienta.").arg(m_serviceName));
        }
    } else if (!tls.rootCertificatePath.trimmed().isEmpty() || tls.requireClientAuth) {
        result.warnings.append(
            QStringLiteral("Podano ustawienia TLS dla %1, ale TLS jest wyłączony - zostaną pominięte.").arg(m_serviceName));
    }

    result.ok = result.errors.isEmpty();
    return result;
}

void GatewayChannel::ensureChannelLocked()
{
    if (m_channel || m_endpoint.isEmpty()) {
        return;
    }

    if (!m_tlsConfig.enabled) {
        m_channel = grpc::CreateChannel(m_endpoint.toStdString(), grpc::InsecureChannelCredentials());
        return;
    }

    grpc::SslCredentialsOptions options;
    if (const auto root = readFileBytes(m_tlsConfig.rootCertificatePath)) {
        options.pem_root_certs = toStdString(*root);
    }
    if (!m_tlsConfig.clientCertificatePath.trimmed().isEmpty() && !m_tlsConfig.clientKeyPath.trimmed().isEmpty()) {
        const auto cert = readFileBytes(m_tlsConfig.clientCertificatePath);
        const auto key = readFileBytes(m_tlsConfig.clientKeyPath);
        if (cert && key) {
            grpc::SslCredentialsOptions::PemKeyCertPair pair;
            pair.cert_chain = toStdString(*cert);
            pair.private_key = toStdString(*key);
            options.pem_key_cert_pairs.push_back(std::move(pair));
        } else if (m_tlsConfig.requireClientAuth) {
            qCWarning(lcGatewayChannel) << "Brak certyfikatu lub klucza klienta dla" << m_serviceName
                                        << "- kanał nie zostanie utworzony";
            return;
        }
    }

    grpc::ChannelArguments args;
    if (!m_tlsConfig.targetNameOverride.trimmed().isEmpty()) {
        args.SetString(GRPC_SSL_TARGET_NAME_OVERRIDE_ARG, m_tlsConfig.targetNameOverride.toStdString());
    }
    if (!m_tlsConfig.serverNameOverride.trimmed().isEmpty()) {
        args.SetString(GRPC_ARG_OVERRIDE_DEFAULT_AUTHORITY, m_tlsConfig.serverNameOverride.toStdString());
    }
    m_channel = grpc::CreateCustomChannel(m_endpoint.toStdString(), grpc::SslCredentials(options), args);
}

void GatewayChannel::resetChannelLocked()
{
    m_channel.reset();
}

} // namespace marketbrief
