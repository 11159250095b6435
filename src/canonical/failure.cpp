#include "failure.h"

namespace {

const char* domainName(ErrorDomain domain)
{
    switch (domain) {
    case ErrorDomain::Conversion:    return "conversion";
    case ErrorDomain::Transform:     return "transform";
    case ErrorDomain::Transport:     return "transport";
    case ErrorDomain::Configuration: return "configuration";
    }
    return "unknown";
}

}

QString Failure::kindName() const
{
    switch (kind) {
    case ErrorKind::UnsupportedConstruct:    return QStringLiteral("unsupported_construct");
    case ErrorKind::MalformedInput:          return QStringLiteral("malformed_input");
    case ErrorKind::SchemaViolation:         return QStringLiteral("schema_violation");
    case ErrorKind::UnknownEncodedName:      return QStringLiteral("unknown_encoded_name");
    case ErrorKind::Unauthorized:            return QStringLiteral("unauthorized");
    case ErrorKind::RateLimited:             return QStringLiteral("rate_limited");
    case ErrorKind::Overloaded:              return QStringLiteral("overloaded");
    case ErrorKind::Timeout:                 return QStringLiteral("timeout");
    case ErrorKind::NetworkFailure:          return QStringLiteral("network_failure");
    case ErrorKind::MalformedResponse:       return QStringLiteral("malformed_response");
    case ErrorKind::Rejected:                return QStringLiteral("rejected");
    case ErrorKind::InvalidCredentials:      return QStringLiteral("invalid_credentials");
    case ErrorKind::InvalidModel:            return QStringLiteral("invalid_model");
    case ErrorKind::BreakpointLimitExceeded: return QStringLiteral("breakpoint_limit_exceeded");
    case ErrorKind::InvalidConfig:           return QStringLiteral("invalid_config");
    case ErrorKind::CapabilityDisabled:      return QStringLiteral("capability_disabled");
    }
    return QStringLiteral("unknown");
}

QJsonObject Failure::toJson() const
{
    QJsonObject err;
    err["domain"] = QString::fromLatin1(domainName(domain));
    err["type"] = kindName();
    err["code"] = code;
    err["message"] = message;
    if (httpStatus > 0)
        err["status"] = httpStatus;
    QJsonObject root;
    root["error"] = err;
    return root;
}

bool Failure::isRetryableKind(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::RateLimited:
    case ErrorKind::Overloaded:
    case ErrorKind::Timeout:
    case ErrorKind::NetworkFailure:
        return true;
    default:
        return false;
    }
}

Failure Failure::unsupportedConstruct(const QString& code, const QString& msg) {
    return {ErrorDomain::Conversion, ErrorKind::UnsupportedConstruct, code, msg, 0, false};
}

Failure Failure::malformedInput(const QString& code, const QString& msg) {
    return {ErrorDomain::Conversion, ErrorKind::MalformedInput, code, msg, 0, false};
}

Failure Failure::schemaViolation(const QString& code, const QString& msg) {
    return {ErrorDomain::Conversion, ErrorKind::SchemaViolation, code, msg, 0, false};
}

Failure Failure::unknownEncodedName(const QString& name) {
    return {ErrorDomain::Transform, ErrorKind::UnknownEncodedName, "unknown_encoded_name",
            QStringLiteral("Tool name was not produced by this transform: %1").arg(name),
            0, false};
}

Failure Failure::transport(ErrorKind kind, const QString& msg, int httpStatus) {
    Failure f{ErrorDomain::Transport, kind, {}, msg, httpStatus, isRetryableKind(kind)};
    f.code = f.kindName();
    return f;
}

Failure Failure::unauthorized(const QString& msg, int httpStatus) {
    return transport(ErrorKind::Unauthorized, msg, httpStatus);
}

Failure Failure::rateLimited(const QString& msg) {
    return transport(ErrorKind::RateLimited, msg, 429);
}

Failure Failure::overloaded(const QString& msg, int httpStatus) {
    return transport(ErrorKind::Overloaded, msg, httpStatus);
}

Failure Failure::timeout(const QString& msg) {
    return transport(ErrorKind::Timeout, msg);
}

Failure Failure::networkFailure(const QString& msg) {
    return transport(ErrorKind::NetworkFailure, msg);
}

Failure Failure::malformedResponse(const QString& msg) {
    return transport(ErrorKind::MalformedResponse, msg);
}

Failure Failure::rejected(int httpStatus, const QString& body) {
    return transport(ErrorKind::Rejected,
                     QStringLiteral("API error (HTTP %1): %2").arg(httpStatus).arg(body),
                     httpStatus);
}

Failure Failure::configuration(ErrorKind kind, const QString& code, const QString& msg) {
    return {ErrorDomain::Configuration, kind, code, msg, 0, false};
}

Failure Failure::breakpointLimitExceeded(int requested, int limit) {
    return configuration(ErrorKind::BreakpointLimitExceeded,
                         QStringLiteral("breakpoint_limit_exceeded"),
                         QStringLiteral("Cache placement needs %1 breakpoints, provider allows %2")
                             .arg(requested).arg(limit));
}
