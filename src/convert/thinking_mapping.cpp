#include "thinking_mapping.h"
#include "canonical/validate.h"
#include <QStringList>
#include <limits>

namespace ThinkingMapping {

namespace {

const QStringList& namedLevels()
{
    static const QStringList levels = {
        QStringLiteral("none"), QStringLiteral("off"), QStringLiteral("disabled"),
        QStringLiteral("low"), QStringLiteral("minimal"), QStringLiteral("medium"),
        QStringLiteral("med"), QStringLiteral("high"), QStringLiteral("xhigh"),
        QStringLiteral("max"), QStringLiteral("auto")
    };
    return levels;
}

EffortLevel effortForBudget(qulonglong tokens)
{
    if (tokens <= 2048)  return EffortLevel::Low;
    if (tokens <= 16384) return EffortLevel::Medium;
    if (tokens <= 49152) return EffortLevel::High;
    return EffortLevel::Max;
}

}

ModelSuffix parseModelSuffix(const QString& model)
{
    const qsizetype open = model.lastIndexOf(QLatin1Char('('));
    if (open < 0 || !model.endsWith(QLatin1Char(')')))
        return {model, {}};

    const QString suffix = model.mid(open + 1, model.size() - open - 2);
    bool numeric = false;
    suffix.toULongLong(&numeric);
    if (!numeric && !namedLevels().contains(suffix.toLower()))
        return {model, {}};
    return {model.left(open), suffix};
}

bool supportsAdaptiveThinking(const QString& model)
{
    const QString lower = model.toLower();
    return lower.contains(QStringLiteral("opus-4-6")) || lower.contains(QStringLiteral("sonnet-4-6"));
}

Result<ThinkingConfig> forModel(const QString& model, const QString& level)
{
    const QString lower = level.trimmed().toLower();
    if (lower == QStringLiteral("none") || lower == QStringLiteral("off")
        || lower == QStringLiteral("disabled")) {
        return ThinkingConfig::disabled();
    }

    bool numeric = false;
    const qulonglong tokens = lower.toULongLong(&numeric);
    if (numeric && tokens == 0)
        return ThinkingConfig::disabled();
    if (numeric && tokens > static_cast<qulonglong>(std::numeric_limits<int>::max()))
        return std::unexpected(Failure::schemaViolation(
            QStringLiteral("thinking_budget_too_large"),
            QStringLiteral("Thinking budget %1 does not fit a token count").arg(lower)));

    if (supportsAdaptiveThinking(model)) {
        if (lower == QStringLiteral("low") || lower == QStringLiteral("minimal"))
            return ThinkingConfig::adaptive(EffortLevel::Low);
        if (lower == QStringLiteral("medium") || lower == QStringLiteral("med")
            || lower == QStringLiteral("auto"))
            return ThinkingConfig::adaptive(EffortLevel::Medium);
        if (lower == QStringLiteral("xhigh") || lower == QStringLiteral("max"))
            return ThinkingConfig::adaptive(EffortLevel::Max);
        if (numeric)
            return ThinkingConfig::adaptive(effortForBudget(tokens));
        return ThinkingConfig::adaptive(EffortLevel::High);
    }

    if (lower == QStringLiteral("low") || lower == QStringLiteral("minimal"))
        return ThinkingConfig::manualBudget(1024);
    if (lower == QStringLiteral("medium") || lower == QStringLiteral("med"))
        return ThinkingConfig::manualBudget(8192);
    if (lower == QStringLiteral("high"))
        return ThinkingConfig::manualBudget(32000);
    if (lower == QStringLiteral("xhigh") || lower == QStringLiteral("max"))
        return ThinkingConfig::manualBudget(64000);
    if (lower == QStringLiteral("auto"))
        return ThinkingConfig::manualBudget(16000);
    if (numeric) {
        const ThinkingConfig config = ThinkingConfig::manualBudget(static_cast<int>(tokens));
        if (auto valid = Validate::thinking(config, std::nullopt); !valid)
            return std::unexpected(valid.error());
        return config;
    }
    return ThinkingConfig::manualBudget(8192);
}

std::optional<QString> toReasoningEffort(const ThinkingConfig& config)
{
    switch (config.mode) {
    case ThinkingMode::Disabled:
        return std::nullopt;
    case ThinkingMode::Adaptive:
        // reasoning_effort tops out at high
        if (config.effort == EffortLevel::Max)
            return QStringLiteral("high");
        return effortName(config.effort);
    case ThinkingMode::ManualBudget:
        if (config.budgetTokens <= 2048)
            return QStringLiteral("low");
        if (config.budgetTokens <= 16384)
            return QStringLiteral("medium");
        return QStringLiteral("high");
    }
    return std::nullopt;
}

}
