#pragma once
#include "message.h"
#include "tool.h"
#include "thinking.h"
#include <QList>
#include <QString>
#include <QStringList>
#include <optional>

struct SamplingParams {
    std::optional<int> maxTokens;
    std::optional<double> temperature;
    std::optional<double> topP;
    std::optional<int> topK;
    QStringList stopSequences;

    bool operator==(const SamplingParams&) const = default;
};

struct RequestMetadata {
    std::optional<QString> userId;

    bool operator==(const RequestMetadata&) const = default;
};

struct ChatRequest {
    QString model;
    std::optional<SystemPrompt> system;
    QList<Message> messages;
    std::optional<QList<ToolDefinition>> tools;
    std::optional<ToolChoice> toolChoice;
    std::optional<ThinkingConfig> thinking;
    SamplingParams sampling;
    std::optional<bool> stream;
    std::optional<RequestMetadata> metadata;

    bool operator==(const ChatRequest&) const = default;

    bool hasTools() const { return tools.has_value() && !tools->isEmpty(); }
    bool isStreaming() const { return stream.value_or(false); }
    QString userId() const {
        return metadata.has_value() ? metadata->userId.value_or(QString()) : QString();
    }
};
