#include "qt_transport.h"
#include "core/log_manager.h"
#include <QEventLoop>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTimer>

QtTransport::QtTransport(int requestTimeoutMs, const QSslConfiguration& sslConfig)
    : m_sslConfig(sslConfig)
    , m_requestTimeout(requestTimeoutMs)
{
}

QNetworkRequest QtTransport::buildQtRequest(const QUrl& endpoint, const Credentials& credentials) const {
    QNetworkRequest req{endpoint};
    req.setSslConfiguration(m_sslConfig);
    req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");

    if (credentials.scheme == Credentials::Scheme::XApiKey)
        req.setRawHeader("x-api-key", credentials.apiKey.toUtf8());
    else
        req.setRawHeader("Authorization", QStringLiteral("Bearer %1").arg(credentials.apiKey).toUtf8());

    for (auto it = credentials.extraHeaders.constBegin(); it != credentials.extraHeaders.constEnd(); ++it)
        req.setRawHeader(it.key().toUtf8(), it.value().toUtf8());

    req.setTransferTimeout(m_requestTimeout);
    return req;
}

QString QtTransport::providerMessage(const QByteArray& body) {
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error == QJsonParseError::NoError && doc.isObject()) {
        // {"error": {"message": ...}} in both wire formats
        const QString message = doc.object().value(QStringLiteral("error")).toObject()
                                    .value(QStringLiteral("message")).toString();
        if (!message.isEmpty())
            return message;
    }
    return QString::fromUtf8(body.left(512));
}

std::optional<Failure> QtTransport::classify(int httpStatus, QNetworkReply::NetworkError error,
                                             const QByteArray& body, const QString& errorString) {
    if (httpStatus >= 200 && httpStatus < 300)
        return std::nullopt;

    if (httpStatus == 0) {
        if (error == QNetworkReply::NoError)
            return Failure::malformedResponse(QStringLiteral("reply carried no HTTP status"));
        if (error == QNetworkReply::TimeoutError || error == QNetworkReply::OperationCanceledError)
            return Failure::timeout(errorString);
        return Failure::networkFailure(errorString);
    }

    const QString message = providerMessage(body);
    switch (httpStatus) {
    case 401:
    case 403:
        return Failure::unauthorized(message, httpStatus);
    case 429:
        return Failure::rateLimited(message);
    case 408:
    case 504:
        return Failure::transport(ErrorKind::Timeout, message, httpStatus);
    case 502:
    case 503:
    case 529:
        return Failure::overloaded(message, httpStatus);
    default:
        break;
    }
    if (httpStatus >= 500)
        return Failure::overloaded(message, httpStatus);
    if (httpStatus >= 400)
        return Failure::rejected(httpStatus, QString::fromUtf8(body));
    return Failure::malformedResponse(QStringLiteral("unexpected HTTP status %1").arg(httpStatus));
}

Result<QByteArray> QtTransport::send(const QUrl& endpoint, const QByteArray& payload,
                                     const Credentials& credentials) {
    QNetworkReply* reply = m_nam.post(buildQtRequest(endpoint, credentials), payload);

    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QTimer timeoutTimer;
    timeoutTimer.setSingleShot(true);
    QObject::connect(&timeoutTimer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timeoutTimer.start(m_requestTimeout);
    loop.exec();

    if (reply->isRunning()) {
        reply->abort();
        reply->deleteLater();
        LOG_WARNING(QStringLiteral("transport"),
                    QStringLiteral("POST %1 timed out after %2 ms").arg(endpoint.toString()).arg(m_requestTimeout));
        return std::unexpected(Failure::timeout(QStringLiteral("request timeout")));
    }

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const QByteArray body = reply->readAll();
    const auto failure = classify(status, reply->error(), body, reply->errorString());
    reply->deleteLater();

    if (failure) {
        LOG_WARNING(QStringLiteral("transport"),
                    QStringLiteral("POST %1 failed: %2 (%3)")
                        .arg(endpoint.toString(), failure->kindName(), failure->message));
        return std::unexpected(*failure);
    }
    return body;
}
