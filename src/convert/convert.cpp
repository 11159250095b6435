#include "convert.h"
#include "openai_inbound.h"
#include "openai_outbound.h"

namespace Convert {

Result<ChatRequest> alternateRequestToCanonical(const QJsonObject& request)
{
    return OpenAIInbound::decodeRequest(request);
}

Result<QJsonObject> canonicalResponseToAlternate(const ChatResponse& response,
                                                 const ConversionOptions& options)
{
    return OpenAIOutbound::encodeResponse(response, options);
}

Result<QJsonObject> canonicalRequestToAlternate(const ChatRequest& request,
                                                const ConversionOptions& options)
{
    return OpenAIOutbound::encodeRequest(request, options);
}

Result<ChatResponse> alternateResponseToCanonical(const QJsonObject& response)
{
    return OpenAIInbound::decodeResponse(response);
}

QJsonObject canonicalEmbeddingRequestToAlternate(const EmbeddingRequest& request)
{
    return OpenAIOutbound::encodeEmbeddingRequest(request);
}

Result<EmbeddingResponse> alternateEmbeddingResponseToCanonical(const QJsonObject& response)
{
    return OpenAIInbound::decodeEmbeddingResponse(response);
}

}
