#pragma once
#include "canonical/thinking.h"
#include "canonical/result.h"
#include <QString>
#include <optional>

namespace ThinkingMapping {

struct ModelSuffix {
    QString baseModel;
    QString level;      // empty when the model carried no recognised "(level)" suffix
};

// "claude-sonnet-4-5(high)" -> {"claude-sonnet-4-5", "high"}. Unrecognised suffixes
// stay part of the model name.
ModelSuffix parseModelSuffix(const QString& model);

bool supportsAdaptiveThinking(const QString& model);

// Named level (none/off/disabled, minimal/low, med/medium, high, xhigh/max, auto) or a
// token count. Adaptive-capable models get an effort level, older ones a budget.
// Token counts in 1..1023 or above INT_MAX are a SchemaViolation.
Result<ThinkingConfig> forModel(const QString& model, const QString& level);

// Alternate reasoning_effort for a canonical config; nullopt when nothing is emitted.
std::optional<QString> toReasoningEffort(const ThinkingConfig& config);

}
