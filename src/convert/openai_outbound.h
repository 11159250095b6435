#pragma once
#include "options.h"
#include "canonical/request.h"
#include "canonical/response.h"
#include "canonical/embedding.h"
#include "canonical/result.h"
#include <QJsonArray>
#include <QJsonObject>

// Canonical values -> OpenAI chat-completions JSON.
class OpenAIOutbound {
public:
    static Result<QJsonObject> encodeRequest(const ChatRequest& request, const ConversionOptions& options);
    static Result<QJsonObject> encodeResponse(const ChatResponse& response, const ConversionOptions& options);
    static QJsonObject encodeEmbeddingRequest(const EmbeddingRequest& request);

protected:
    static Result<QJsonArray> buildMessages(const ChatRequest& request);
    static Result<QJsonObject> buildAssistantMessage(const Message& message);
    static Result<QJsonObject> buildUserPart(const ContentBlock& block);
    static QJsonObject buildToolMessage(const ContentBlock& result);
    static QJsonArray buildToolCalls(const QList<ContentBlock>& toolUses);
    static QJsonArray buildToolDefs(const QList<ToolDefinition>& tools);
    static QJsonValue buildToolChoice(const ToolChoice& choice);
    static void buildSampling(QJsonObject& body, const SamplingParams& sampling, const AlternateDialect& dialect);
    static QJsonObject buildUsage(const Usage& usage);
};
