#pragma once

#include <QString>

namespace marketbrief {

struct GatewayTlsConfig {
    bool     enabled = false;
    bool     requireClientAuth = false;
    QString  rootCertificatePath;
    QString  clientCertificatePath;
    QString  clientKeyPath;
    QString  serverNameOverride;
    QString  targetNameOverride;

    bool operator==(const GatewayTlsConfig& other) const
    {
        return enabled == other.enabled && requireClientAuth == other.requireClientAuth
            && rootCertificatePath == other.rootCertificatePath
            && clientCertificatePath == other.clientCertificatePath && clientKeyPath == other.clientKeyPath
            && serverNameOverride == other.serverNameOverride && targetNameOverride == other.targetNameOverride;
    }
    bool operator!=(const GatewayTlsConfig& other) const { return !(*this == other); }
};

} // namespace marketbrief
