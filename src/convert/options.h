#pragma once
#include <QtGlobal>
#include <optional>

// Capabilities of the OpenAI-compatible endpoint a request is converted for.
struct AlternateDialect {
    bool supportsReasoningEffort = false;   // emit reasoning_effort from ThinkingConfig
    bool useMaxCompletionTokens = false;    // max_completion_tokens instead of max_tokens

    bool operator==(const AlternateDialect&) const = default;
};

struct ConversionOptions {
    AlternateDialect dialect;
    std::optional<qint64> createdAt;        // "created" on alternate responses; omitted when unset
};
