#pragma once
#include <QtGlobal>

enum class Role : quint8 {
    User, Assistant, System
};

enum class BlockKind : quint8 {
    Text, Image, ToolUse, ToolResult, Thinking, RedactedThinking
};

enum class ImageSourceKind : quint8 {
    Base64, Url
};

enum class StopReason : quint8 {
    EndTurn, ToolUse, MaxTokens, StopSequence, Other
};

enum class ThinkingMode : quint8 {
    Disabled, Adaptive, ManualBudget
};

enum class EffortLevel : quint8 {
    Low, Medium, High, Max
};

enum class ToolChoiceMode : quint8 {
    Auto, Any, Tool, None
};

enum class Provider : quint8 {
    Anthropic,          // canonical wire format
    OpenAICompatible    // alternate wire format
};

enum class ErrorDomain : quint8 {
    Conversion, Transform, Transport, Configuration
};

enum class ErrorKind : quint8 {
    // Conversion
    UnsupportedConstruct,
    MalformedInput,
    SchemaViolation,
    // Transform
    UnknownEncodedName,
    // Transport
    Unauthorized,        // 401/403
    RateLimited,         // 429  (可重试)
    Overloaded,          // 502/503/529  (可重试)
    Timeout,             // 408/504  (可重试)
    NetworkFailure,      // 连接失败 (可重试)
    MalformedResponse,
    Rejected,            // 其他 4xx
    // Configuration
    InvalidCredentials,
    InvalidModel,
    BreakpointLimitExceeded,
    InvalidConfig,
    CapabilityDisabled
};
