#pragma once
#include "types.h"
#include <QString>
#include <QJsonObject>

struct Failure {
    ErrorDomain domain = ErrorDomain::Conversion;
    ErrorKind   kind = ErrorKind::SchemaViolation;
    QString     code;
    QString     message;
    int         httpStatus = 0;     // transport failures only
    bool        retryable = false;

    bool isConversion() const { return domain == ErrorDomain::Conversion; }
    bool isTransport() const { return domain == ErrorDomain::Transport; }

    QString kindName() const;
    QJsonObject toJson() const;

    // Conversion
    static Failure unsupportedConstruct(const QString& code, const QString& msg);
    static Failure malformedInput(const QString& code, const QString& msg);
    static Failure schemaViolation(const QString& code, const QString& msg);

    // Transform
    static Failure unknownEncodedName(const QString& name);

    // Transport
    static Failure transport(ErrorKind kind, const QString& msg, int httpStatus = 0);
    static Failure unauthorized(const QString& msg, int httpStatus = 401);
    static Failure rateLimited(const QString& msg);
    static Failure overloaded(const QString& msg, int httpStatus = 503);
    static Failure timeout(const QString& msg);
    static Failure networkFailure(const QString& msg);
    static Failure malformedResponse(const QString& msg);
    static Failure rejected(int httpStatus, const QString& body);

    // Configuration
    static Failure configuration(ErrorKind kind, const QString& code, const QString& msg);
    static Failure breakpointLimitExceeded(int requested, int limit);

    static bool isRetryableKind(ErrorKind kind);
};
