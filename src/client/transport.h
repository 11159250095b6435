#pragma once
#include "canonical/result.h"
#include <QByteArray>
#include <QMap>
#include <QString>
#include <QUrl>

struct Credentials {
    enum class Scheme { Bearer, XApiKey };

    QString apiKey;
    Scheme scheme = Scheme::Bearer;
    QMap<QString, QString> extraHeaders;    // e.g. anthropic-version
};

// Outbound HTTP port. One POST per call; the body of a 2xx reply is returned,
// everything else comes back as a transport-domain Failure.
class ITransport {
public:
    virtual ~ITransport() = default;
    virtual Result<QByteArray> send(const QUrl& endpoint, const QByteArray& payload,
                                    const Credentials& credentials) = 0;
};
