#include "llm_client.h"
#include "canonical/codec.h"
#include "canonical/stop_reason.h"
#include "canonical/validate.h"
#include "convert/convert.h"
#include "proxy/tool_names.h"
#include "core/log_manager.h"
#include <QJsonDocument>

namespace {

const QString kLogCategory = QStringLiteral("client");

QString providerName(Provider provider)
{
    return provider == Provider::Anthropic ? QStringLiteral("anthropic")
                                           : QStringLiteral("openai-compatible");
}

// Reports state transitions; every failing path ends in Failed.
class CallTracker {
public:
    explicit CallTracker(const std::function<void(CallState)>& observer)
        : m_observer(observer)
    {
        report(CallState::Idle);
    }

    void report(CallState state) const
    {
        if (m_observer)
            m_observer(state);
    }

    template<typename T>
    Result<T> fail(const Failure& failure) const
    {
        LOG_ERROR(kLogCategory, QStringLiteral("call failed: [%1] %2").arg(failure.kindName(), failure.message));
        report(CallState::Failed);
        return std::unexpected(failure);
    }

private:
    const std::function<void(CallState)>& m_observer;
};

}

QString callStateName(CallState state)
{
    switch (state) {
    case CallState::Idle:      return QStringLiteral("Idle");
    case CallState::Building:  return QStringLiteral("Building");
    case CallState::Sent:      return QStringLiteral("Sent");
    case CallState::Awaiting:  return QStringLiteral("Awaiting");
    case CallState::Completed: return QStringLiteral("Completed");
    case CallState::Failed:    return QStringLiteral("Failed");
    }
    return QStringLiteral("Idle");
}

LlmClient::LlmClient(const ClientConfig& config, ITransport* transport)
    : m_config(config)
    , m_transport(transport)
{
}

bool LlmClient::isRetryable(const Failure& failure)
{
    return failure.isTransport() && Failure::isRetryableKind(failure.kind);
}

ChatRequest LlmClient::buildRequest(const QList<Message>& messages, const ChatOptions& options) const
{
    ChatRequest request;
    request.model = m_config.model;
    request.system = options.system;
    request.messages = messages;
    request.tools = options.tools;
    request.toolChoice = options.toolChoice;
    request.thinking = options.thinking;
    request.sampling.maxTokens = options.maxTokens.value_or(m_config.maxTokens);
    request.sampling.temperature = options.temperature;
    return request;
}

Result<ChatResponse> LlmClient::complete(const QString& system, const QString& userText,
                                         const ChatOptions& options) const
{
    ChatOptions opts = options;
    if (!system.isEmpty())
        opts.system = SystemPrompt::fromText(system);
    return chat({Message::userText(userText)}, opts);
}

Result<ChatResponse> LlmClient::chat(const QList<Message>& messages, const ChatOptions& options) const
{
    return dispatch(buildRequest(messages, options), options);
}

Result<QJsonObject> LlmClient::post(const QUrl& endpoint, const QJsonObject& body,
                                    const Credentials& credentials) const
{
    if (!m_transport)
        return std::unexpected(Failure::configuration(
            ErrorKind::InvalidConfig, QStringLiteral("missing_transport"), QStringLiteral("No transport configured")));

    auto reply = m_transport->send(endpoint, QJsonDocument(body).toJson(QJsonDocument::Compact), credentials);
    if (!reply)
        return std::unexpected(reply.error());

    auto root = CanonicalCodec::parseObject(*reply, QStringLiteral("Provider reply"));
    if (!root)
        return std::unexpected(Failure::malformedResponse(root.error().message));
    return *root;
}

Result<ChatResponse> LlmClient::dispatch(ChatRequest request, const ChatOptions& options) const
{
    const CallTracker tracker(options.stateObserver);
    tracker.report(CallState::Building);

    if (auto ok = m_config.validate(); !ok)
        return tracker.fail<ChatResponse>(ok.error());

    std::optional<ToolNameTransform> names;
    if (options.transformToolNames) {
        names.emplace(m_config.toolNamePrefix);
        names->applyToRequest(request);
    }

    if (options.cachePlacement.has_value() && m_config.provider == Provider::Anthropic) {
        if (auto ok = CacheControl::apply(request, *options.cachePlacement); !ok)
            return tracker.fail<ChatResponse>(ok.error());
    }

    if (auto ok = Validate::request(request); !ok)
        return tracker.fail<ChatResponse>(ok.error());

    QJsonObject body;
    if (m_config.provider == Provider::Anthropic) {
        body = CanonicalCodec::encodeRequest(request);
    } else {
        ConversionOptions convOptions;
        convOptions.dialect = m_config.dialect;
        auto converted = Convert::canonicalRequestToAlternate(request, convOptions);
        if (!converted)
            return tracker.fail<ChatResponse>(converted.error());
        body = *converted;
    }

    const QUrl endpoint = m_config.chatEndpoint();
    LOG_INFO(kLogCategory, QStringLiteral("POST %1 (provider: %2, model: %3, messages: %4)")
                               .arg(endpoint.toString(), providerName(m_config.provider), request.model)
                               .arg(request.messages.size()));

    tracker.report(CallState::Sent);
    tracker.report(CallState::Awaiting);
    auto root = post(endpoint, body, m_config.credentials());
    if (!root)
        return tracker.fail<ChatResponse>(root.error());

    auto response = m_config.provider == Provider::Anthropic
        ? CanonicalCodec::decodeResponse(*root)
        : Convert::alternateResponseToCanonical(*root);
    if (!response)
        return tracker.fail<ChatResponse>(response.error());
    if (auto ok = Validate::response(*response); !ok)
        return tracker.fail<ChatResponse>(Failure::malformedResponse(ok.error().message));

    if (names.has_value()) {
        if (auto ok = names->restoreResponse(*response); !ok)
            return tracker.fail<ChatResponse>(ok.error());
    }

    LOG_INFO(kLogCategory, QStringLiteral("response received (stop_reason: %1, content blocks: %2)")
                               .arg(StopReasons::name(response->stopReason))
                               .arg(response->content.size()));
    tracker.report(CallState::Completed);
    return response;
}

Result<EmbeddingResponse> LlmClient::embed(const QStringList& input, const QString& model) const
{
    if (auto ok = m_config.validate(); !ok)
        return std::unexpected(ok.error());
    if (m_config.provider != Provider::OpenAICompatible || !m_config.embeddings.enabled) {
        return std::unexpected(Failure::configuration(
            ErrorKind::CapabilityDisabled, QStringLiteral("embeddings_disabled"),
            QStringLiteral("Embeddings need an OpenAI-compatible provider with embeddings enabled")));
    }

    EmbeddingRequest request;
    request.model = !model.isEmpty() ? model
                  : !m_config.embeddings.model.isEmpty() ? m_config.embeddings.model
                  : m_config.model;
    request.input = input;
    if (auto ok = Validate::embeddingRequest(request); !ok)
        return std::unexpected(ok.error());

    const QUrl endpoint = m_config.embeddingsEndpoint();
    LOG_DEBUG(kLogCategory, QStringLiteral("POST %1 (model: %2, count: %3)")
                                .arg(endpoint.toString(), request.model).arg(input.size()));

    auto root = post(endpoint, Convert::canonicalEmbeddingRequestToAlternate(request), m_config.credentials());
    if (!root)
        return std::unexpected(root.error());

    auto response = Convert::alternateEmbeddingResponseToCanonical(*root);
    if (!response)
        return std::unexpected(response.error());
    if (response->vectors.size() != input.size()) {
        return std::unexpected(Failure::malformedResponse(
            QStringLiteral("Expected %1 embeddings, got %2").arg(input.size()).arg(response->vectors.size())));
    }
    return response;
}

Result<QJsonObject> LlmClient::chatAlternateRaw(const QJsonObject& body) const
{
    if (auto ok = m_config.validate(); !ok)
        return std::unexpected(ok.error());
    if (m_config.provider != Provider::OpenAICompatible) {
        return std::unexpected(Failure::configuration(
            ErrorKind::CapabilityDisabled, QStringLiteral("raw_alternate_unavailable"),
            QStringLiteral("Raw chat-completions calls need an OpenAI-compatible provider")));
    }
    return post(m_config.chatEndpoint(), body, m_config.credentials());
}
