#pragma once
#include "transport.h"
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QSslConfiguration>
#include <optional>

// Blocking QtNetwork transport: each send() spins a local event loop until the
// reply finishes or the request timeout fires.
class QtTransport : public ITransport {
public:
    explicit QtTransport(int requestTimeoutMs = 60000,
                         const QSslConfiguration& sslConfig = QSslConfiguration::defaultConfiguration());

    Result<QByteArray> send(const QUrl& endpoint, const QByteArray& payload,
                            const Credentials& credentials) override;

    void setRequestTimeout(int ms) { m_requestTimeout = ms; }
    int requestTimeout() const { return m_requestTimeout; }

    QNetworkRequest buildQtRequest(const QUrl& endpoint, const Credentials& credentials) const;

    // HTTP status / network error -> transport Failure; nullopt for a 2xx reply.
    static std::optional<Failure> classify(int httpStatus, QNetworkReply::NetworkError error,
                                           const QByteArray& body, const QString& errorString);
    static QString providerMessage(const QByteArray& body);

private:
    QNetworkAccessManager m_nam;
    QSslConfiguration m_sslConfig;
    int m_requestTimeout;
};
