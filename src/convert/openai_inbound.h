#pragma once
#include "canonical/request.h"
#include "canonical/response.h"
#include "canonical/embedding.h"
#include "canonical/result.h"
#include <QJsonArray>
#include <QJsonObject>

// OpenAI chat-completions JSON -> canonical values.
class OpenAIInbound {
public:
    static Result<ChatRequest> decodeRequest(const QJsonObject& root);
    static Result<ChatResponse> decodeResponse(const QJsonObject& root);
    static Result<EmbeddingResponse> decodeEmbeddingResponse(const QJsonObject& root);

    static Result<QList<ContentBlock>> parseContentParts(const QJsonValue& content, const QString& where);
    static Result<ContentBlock> parseImageUrl(const QJsonObject& part);
    static Result<QList<ContentBlock>> parseToolCalls(const QJsonArray& toolCalls);
    static Result<QJsonValue> parseArguments(const QJsonValue& arguments, const QString& callId);
    static Result<ToolDefinition> parseTool(const QJsonObject& tool);
    static Result<ToolChoice> parseToolChoice(const QJsonValue& choice);
    static Usage parseUsage(const QJsonObject& usage);

private:
    static Result<QStringList> textParts(const QJsonValue& content, const QString& where);
};
