#pragma once
#include "client_config.h"
#include "transport.h"
#include "canonical/request.h"
#include "canonical/response.h"
#include "canonical/embedding.h"
#include "canonical/result.h"
#include "proxy/cache_control.h"
#include <QJsonObject>
#include <QStringList>
#include <functional>
#include <optional>

enum class CallState { Idle, Building, Sent, Awaiting, Completed, Failed };

QString callStateName(CallState state);

struct ChatOptions {
    std::optional<SystemPrompt> system;
    std::optional<QList<ToolDefinition>> tools;
    std::optional<ToolChoice> toolChoice;
    std::optional<ThinkingConfig> thinking;
    std::optional<double> temperature;
    std::optional<int> maxTokens;                   // overrides ClientConfig::maxTokens
    std::optional<CachePlacement> cachePlacement;   // canonical provider only
    bool transformToolNames = false;                // uses ClientConfig::toolNamePrefix
    std::function<void(CallState)> stateObserver;
};

// Sends canonical requests to the configured provider and returns canonical responses.
// Holds only its configuration and a borrowed transport, so one instance can serve
// concurrent calls when the transport allows it.
class LlmClient {
public:
    LlmClient(const ClientConfig& config, ITransport* transport);

    const ClientConfig& config() const { return m_config; }

    Result<ChatResponse> complete(const QString& system, const QString& userText,
                                  const ChatOptions& options = {}) const;
    Result<ChatResponse> chat(const QList<Message>& messages, const ChatOptions& options = {}) const;
    Result<EmbeddingResponse> embed(const QStringList& input, const QString& model = QString()) const;

    // OpenAI-compatible providers only: body in, body out, no canonical conversion.
    Result<QJsonObject> chatAlternateRaw(const QJsonObject& body) const;

    ChatRequest buildRequest(const QList<Message>& messages, const ChatOptions& options) const;

    static bool isRetryable(const Failure& failure);

private:
    Result<ChatResponse> dispatch(ChatRequest request, const ChatOptions& options) const;
    Result<QJsonObject> post(const QUrl& endpoint, const QJsonObject& body,
                             const Credentials& credentials) const;

    ClientConfig m_config;
    ITransport* m_transport;
};
