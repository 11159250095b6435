#include "stop_reason.h"
#include "core/log_manager.h"

namespace StopReasons {

namespace {

StopReason other(const QString& value, QString* raw, const char* provider)
{
    if (raw)
        *raw = value;
    LOG_WARNING(QStringLiteral("convert"),
                QStringLiteral("unrecognized %1 stop reason '%2', mapped to Other")
                    .arg(QString::fromLatin1(provider), value));
    return StopReason::Other;
}

}

StopReason fromAnthropic(const QString& value, QString* raw)
{
    if (raw)
        raw->clear();
    if (value == QStringLiteral("end_turn"))      return StopReason::EndTurn;
    if (value == QStringLiteral("tool_use"))      return StopReason::ToolUse;
    if (value == QStringLiteral("max_tokens"))    return StopReason::MaxTokens;
    if (value == QStringLiteral("stop_sequence")) return StopReason::StopSequence;
    return other(value, raw, "anthropic");
}

StopReason fromOpenAI(const QString& value, QString* raw)
{
    if (raw)
        raw->clear();
    if (value == QStringLiteral("stop"))          return StopReason::EndTurn;
    if (value == QStringLiteral("tool_calls"))    return StopReason::ToolUse;
    if (value == QStringLiteral("function_call")) return StopReason::ToolUse;
    if (value == QStringLiteral("length"))        return StopReason::MaxTokens;
    return other(value, raw, "openai");
}

QString toAnthropic(StopReason reason, const QString& raw)
{
    switch (reason) {
    case StopReason::EndTurn:      return QStringLiteral("end_turn");
    case StopReason::ToolUse:      return QStringLiteral("tool_use");
    case StopReason::MaxTokens:    return QStringLiteral("max_tokens");
    case StopReason::StopSequence: return QStringLiteral("stop_sequence");
    case StopReason::Other:        return raw;
    }
    return raw;
}

QString toOpenAI(StopReason reason, const QString& raw)
{
    switch (reason) {
    case StopReason::EndTurn:      return QStringLiteral("stop");
    case StopReason::ToolUse:      return QStringLiteral("tool_calls");
    case StopReason::MaxTokens:    return QStringLiteral("length");
    // OpenAI reports a matched stop sequence as a plain stop.
    case StopReason::StopSequence: return QStringLiteral("stop");
    case StopReason::Other:        return raw;
    }
    return raw;
}

QString name(StopReason reason)
{
    switch (reason) {
    case StopReason::EndTurn:      return QStringLiteral("EndTurn");
    case StopReason::ToolUse:      return QStringLiteral("ToolUse");
    case StopReason::MaxTokens:    return QStringLiteral("MaxTokens");
    case StopReason::StopSequence: return QStringLiteral("StopSequence");
    case StopReason::Other:        return QStringLiteral("Other");
    }
    return QStringLiteral("Other");
}

}
