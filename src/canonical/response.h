#pragma once
#include "content_block.h"
#include <QList>
#include <QString>
#include <optional>

struct Usage {
    qint64 inputTokens = 0;
    qint64 outputTokens = 0;
    std::optional<qint64> thinkingTokens;
    std::optional<qint64> cacheCreationInputTokens;
    std::optional<qint64> cacheReadInputTokens;

    bool operator==(const Usage&) const = default;

    qint64 totalTokens() const { return inputTokens + outputTokens; }
};

struct ChatResponse {
    QString id;
    QString model;
    QList<ContentBlock> content;
    StopReason stopReason = StopReason::EndTurn;
    QString rawStopReason;              // provider value behind StopReason::Other
    std::optional<QString> stopSequence;
    std::optional<Usage> usage;

    bool operator==(const ChatResponse&) const = default;

    QString text() const {
        QString out;
        for (const ContentBlock& b : content) {
            if (b.kind == BlockKind::Text)
                out += b.text;
        }
        return out;
    }

    std::optional<QString> thinkingText() const {
        QString out;
        bool found = false;
        for (const ContentBlock& b : content) {
            if (b.kind == BlockKind::Thinking) {
                out += b.text;
                found = true;
            }
        }
        if (!found)
            return std::nullopt;
        return out;
    }

    QList<ContentBlock> toolUses() const {
        QList<ContentBlock> out;
        for (const ContentBlock& b : content) {
            if (b.kind == BlockKind::ToolUse)
                out.append(b);
        }
        return out;
    }

    bool hasToolUse() const { return stopReason == StopReason::ToolUse; }
};
