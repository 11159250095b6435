#pragma once
#include "types.h"
#include <QString>

constexpr int kMinThinkingBudget = 1024;

struct ThinkingConfig {
    ThinkingMode mode = ThinkingMode::Disabled;
    EffortLevel effort = EffortLevel::High;     // Adaptive only
    int budgetTokens = 0;                       // ManualBudget only
    bool defaultEffortExplicit = false;         // output_config carried effort=high

    bool operator==(const ThinkingConfig&) const = default;

    bool isEnabled() const { return mode != ThinkingMode::Disabled; }

    static ThinkingConfig disabled() { return {ThinkingMode::Disabled, EffortLevel::High, 0, false}; }
    static ThinkingConfig adaptive(EffortLevel effort = EffortLevel::High) {
        return {ThinkingMode::Adaptive, effort, 0, false};
    }
    static ThinkingConfig manualBudget(int budgetTokens) {
        return {ThinkingMode::ManualBudget, EffortLevel::High, budgetTokens, false};
    }
};

inline QString effortName(EffortLevel effort)
{
    switch (effort) {
    case EffortLevel::Low:    return QStringLiteral("low");
    case EffortLevel::Medium: return QStringLiteral("medium");
    case EffortLevel::High:   return QStringLiteral("high");
    case EffortLevel::Max:    return QStringLiteral("max");
    }
    return QStringLiteral("high");
}
