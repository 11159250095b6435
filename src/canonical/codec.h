#pragma once
#include "request.h"
#include "response.h"
#include "embedding.h"
#include "result.h"
#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>

// Canonical wire codec: the Anthropic Messages API JSON schema.
// encode(decode(x)) == x for every valid canonical document.
class CanonicalCodec {
public:
    static QJsonObject encodeRequest(const ChatRequest& request);
    static Result<ChatRequest> decodeRequest(const QJsonObject& root);
    static Result<ChatRequest> decodeRequest(const QByteArray& body);

    static QJsonObject encodeResponse(const ChatResponse& response);
    static Result<ChatResponse> decodeResponse(const QJsonObject& root);
    static Result<ChatResponse> decodeResponse(const QByteArray& body);

    static QJsonObject encodeBlock(const ContentBlock& block);
    static Result<ContentBlock> decodeBlock(const QJsonObject& block);

    static QJsonObject encodeMessage(const Message& message);
    static Result<Message> decodeMessage(const QJsonObject& message);

    static QJsonObject encodeTool(const ToolDefinition& tool);
    static Result<ToolDefinition> decodeTool(const QJsonObject& tool);

    static QJsonObject encodeToolChoice(const ToolChoice& choice);
    static Result<ToolChoice> decodeToolChoice(const QJsonObject& choice);

    // Sets "thinking" (and "output_config" when the adaptive effort is not an implicit high) on body.
    static void encodeThinking(QJsonObject& body, const ThinkingConfig& config);
    static Result<ThinkingConfig> decodeThinking(const QJsonObject& thinking,
                                                 const QJsonObject& outputConfig);

    static QJsonObject encodeUsage(const Usage& usage);
    static Usage decodeUsage(const QJsonObject& usage);

    // Embeddings follow the OpenAI-compatible shape; no other provider schema exists.
    static QJsonObject encodeEmbeddingRequest(const EmbeddingRequest& request);
    static Result<EmbeddingRequest> decodeEmbeddingRequest(const QJsonObject& root);
    static QJsonObject encodeEmbeddingResponse(const EmbeddingResponse& response);
    static Result<EmbeddingResponse> decodeEmbeddingResponse(const QJsonObject& root);

    static Result<QJsonObject> parseObject(const QByteArray& body, const QString& what);

private:
    static QJsonValue encodeContent(const QList<ContentBlock>& blocks, bool shorthand);
    static Result<QList<ContentBlock>> decodeContent(const QJsonValue& content, bool& shorthand,
                                                     const QString& where);
    static QJsonObject encodeCacheMarker(const CacheMarker& marker);
    static Result<std::optional<CacheMarker>> decodeCacheMarker(const QJsonObject& owner);
    static Result<EffortLevel> parseEffort(const QString& effort);
};
