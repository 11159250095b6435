#pragma once
#include "types.h"
#include <QString>
#include <QStringList>
#include <QJsonValue>
#include <optional>

struct CacheMarker {
    QString type = QStringLiteral("ephemeral");
    QString ttl;        // empty = provider default

    bool operator==(const CacheMarker&) const = default;
};

struct ImageSource {
    ImageSourceKind kind = ImageSourceKind::Base64;
    QString mediaType;
    QString data;       // base64 payload
    QString url;

    bool operator==(const ImageSource&) const = default;
};

// One typed unit of message content. Only the fields of the active kind are meaningful.
struct ContentBlock {
    BlockKind kind = BlockKind::Text;

    QString text;                   // Text; reasoning text for Thinking
    ImageSource image;              // Image

    QString toolCallId;             // ToolUse, ToolResult
    QString toolName;               // ToolUse
    QJsonValue input;               // ToolUse, structured arguments

    QStringList resultParts;        // ToolResult
    bool resultAsBlocks = false;    // ToolResult content was a list of text blocks
    std::optional<bool> isError;    // ToolResult

    std::optional<QString> signature;   // Thinking
    QString data;                   // RedactedThinking

    std::optional<CacheMarker> cacheControl;

    bool operator==(const ContentBlock&) const = default;

    bool acceptsCacheMarker() const {
        return kind != BlockKind::Thinking && kind != BlockKind::RedactedThinking;
    }

    QString resultText() const { return resultParts.join(QString()); }

    static ContentBlock fromText(const QString& text) {
        ContentBlock b;
        b.kind = BlockKind::Text;
        b.text = text;
        return b;
    }
    static ContentBlock fromImageBase64(const QString& mediaType, const QString& data) {
        ContentBlock b;
        b.kind = BlockKind::Image;
        b.image.kind = ImageSourceKind::Base64;
        b.image.mediaType = mediaType;
        b.image.data = data;
        return b;
    }
    static ContentBlock fromImageUrl(const QString& url) {
        ContentBlock b;
        b.kind = BlockKind::Image;
        b.image.kind = ImageSourceKind::Url;
        b.image.url = url;
        return b;
    }
    static ContentBlock toolUse(const QString& id, const QString& name, const QJsonValue& input) {
        ContentBlock b;
        b.kind = BlockKind::ToolUse;
        b.toolCallId = id;
        b.toolName = name;
        b.input = input;
        return b;
    }
    static ContentBlock toolResult(const QString& id, const QString& content,
                                   std::optional<bool> isError = std::nullopt) {
        ContentBlock b;
        b.kind = BlockKind::ToolResult;
        b.toolCallId = id;
        b.resultParts = QStringList{content};
        b.isError = isError;
        return b;
    }
    static ContentBlock thinking(const QString& text,
                                 const std::optional<QString>& signature = std::nullopt) {
        ContentBlock b;
        b.kind = BlockKind::Thinking;
        b.text = text;
        b.signature = signature;
        return b;
    }
    static ContentBlock redactedThinking(const QString& data) {
        ContentBlock b;
        b.kind = BlockKind::RedactedThinking;
        b.data = data;
        return b;
    }
};
