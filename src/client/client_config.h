#pragma once
#include "transport.h"
#include "convert/options.h"
#include "canonical/types.h"
#include "canonical/result.h"
#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QUrl>

struct EmbeddingsSettings {
    bool enabled = false;
    QString model;              // falls back to ClientConfig::model
    QString baseUrl;            // falls back to ClientConfig::baseUrl
};

// Immutable per-client configuration. Build it with the factories or fromJson,
// then hand a copy to LlmClient.
struct ClientConfig {
    static constexpr int kDefaultMaxTokens = 16384;
    static constexpr int kAnthropicTimeoutMs = 180000;
    static constexpr int kAlternateTimeoutMs = 60000;

    Provider provider = Provider::Anthropic;
    QString baseUrl;
    QString apiKey;
    QString model;
    int maxTokens = kDefaultMaxTokens;
    int timeoutMs = kAnthropicTimeoutMs;
    QString anthropicVersion = QStringLiteral("2023-06-01");
    AlternateDialect dialect;
    QString toolNamePrefix;
    QMap<QString, QString> customHeaders;
    EmbeddingsSettings embeddings;

    static ClientConfig anthropic(const QString& apiKey, const QString& model);
    static ClientConfig openAICompatible(const QString& baseUrl, const QString& apiKey, const QString& model);

    // snake_case or camelCase keys; "api_key_env" names an environment variable holding the key.
    static Result<ClientConfig> fromJson(const QJsonObject& obj);
    static Result<ClientConfig> loadFile(const QString& path);

    VoidResult validate() const;

    QUrl chatEndpoint() const;
    QUrl embeddingsEndpoint() const;
    Credentials credentials() const;
};
