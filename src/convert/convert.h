#pragma once
#include "options.h"
#include "canonical/request.h"
#include "canonical/response.h"
#include "canonical/embedding.h"
#include "canonical/result.h"
#include <QJsonObject>

// Canonical (Anthropic Messages) <-> Alternate (OpenAI chat-completions).
// Pure functions: inputs are never modified and nothing is cached between calls.
namespace Convert {
    Result<ChatRequest> alternateRequestToCanonical(const QJsonObject& request);
    Result<QJsonObject> canonicalResponseToAlternate(const ChatResponse& response,
                                                     const ConversionOptions& options = {});
    Result<QJsonObject> canonicalRequestToAlternate(const ChatRequest& request,
                                                    const ConversionOptions& options = {});
    Result<ChatResponse> alternateResponseToCanonical(const QJsonObject& response);

    QJsonObject canonicalEmbeddingRequestToAlternate(const EmbeddingRequest& request);
    Result<EmbeddingResponse> alternateEmbeddingResponseToCanonical(const QJsonObject& response);
}
