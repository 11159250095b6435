#pragma once
#include "content_block.h"
#include <QList>

struct Message {
    Role role = Role::User;
    QList<ContentBlock> content;
    bool textShorthand = false;     // canonical JSON carried "content": "<string>"

    bool operator==(const Message&) const = default;

    bool hasBlock(BlockKind kind) const {
        for (const ContentBlock& b : content) {
            if (b.kind == kind)
                return true;
        }
        return false;
    }

    static Message user(const QList<ContentBlock>& content) {
        return Message{Role::User, content, false};
    }
    static Message assistant(const QList<ContentBlock>& content) {
        return Message{Role::Assistant, content, false};
    }
    static Message userText(const QString& text) {
        return user({ContentBlock::fromText(text)});
    }
    static Message toolResults(const QList<ContentBlock>& results) {
        return user(results);
    }
};

inline QString roleName(Role role)
{
    switch (role) {
    case Role::User:      return QStringLiteral("user");
    case Role::Assistant: return QStringLiteral("assistant");
    case Role::System:    return QStringLiteral("system");
    }
    return QStringLiteral("user");
}

// System prompt: an ordered list of text blocks.
struct SystemPrompt {
    QList<ContentBlock> blocks;
    bool textShorthand = false;     // canonical JSON carried "system": "<string>"

    bool operator==(const SystemPrompt&) const = default;

    bool isEmpty() const { return blocks.isEmpty(); }

    QString joinedText(const QString& separator = QStringLiteral("\n\n")) const {
        QStringList parts;
        for (const ContentBlock& b : blocks)
            parts.append(b.text);
        return parts.join(separator);
    }

    static SystemPrompt fromText(const QString& text) {
        return SystemPrompt{{ContentBlock::fromText(text)}, true};
    }
};
