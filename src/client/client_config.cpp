#include "client_config.h"
#include "proxy/tool_names.h"
#include <QFile>
#include <QJsonDocument>
#include <QtGlobal>

namespace {

const QString kAnthropicBaseUrl = QStringLiteral("https://api.anthropic.com");

QJsonValue jsonValueEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey)
{
    const QString snake = QString::fromUtf8(snakeKey);
    if (obj.contains(snake))
        return obj.value(snake);
    return obj.value(QString::fromUtf8(camelKey));
}

QString jsonStringEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey,
                         const QString& fallback = QString())
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isString() ? value.toString() : fallback;
}

int jsonIntEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, int fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toInt(fallback);
}

bool jsonBoolEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, bool fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toBool(fallback);
}

Failure invalidConfig(const QString& code, const QString& msg)
{
    return Failure::configuration(ErrorKind::InvalidConfig, code, msg);
}

// "{base}/v1" + path, without doubling a "/v1" already at the end of base.
QUrl joinEndpoint(QString base, const QString& path)
{
    while (base.endsWith(QLatin1Char('/')))
        base.chop(1);
    QString middleRoute = QStringLiteral("/v1");
    if (base.endsWith(middleRoute))
        middleRoute.clear();
    return QUrl(base + middleRoute + path);
}

}

ClientConfig ClientConfig::anthropic(const QString& apiKey, const QString& model)
{
    ClientConfig config;
    config.provider = Provider::Anthropic;
    config.baseUrl = kAnthropicBaseUrl;
    config.apiKey = apiKey;
    config.model = model;
    config.timeoutMs = kAnthropicTimeoutMs;
    return config;
}

ClientConfig ClientConfig::openAICompatible(const QString& baseUrl, const QString& apiKey,
                                            const QString& model)
{
    ClientConfig config;
    config.provider = Provider::OpenAICompatible;
    config.baseUrl = baseUrl;
    config.apiKey = apiKey;
    config.model = model;
    config.timeoutMs = kAlternateTimeoutMs;
    return config;
}

Result<ClientConfig> ClientConfig::fromJson(const QJsonObject& obj)
{
    const QString provider = jsonStringEither(obj, "provider", "provider",
                                              QStringLiteral("anthropic")).toLower();
    ClientConfig config;
    if (provider == QStringLiteral("anthropic")) {
        config = anthropic(QString(), QString());
    } else if (provider == QStringLiteral("openai") || provider == QStringLiteral("openai_compatible")
               || provider == QStringLiteral("openai-compatible")) {
        config = openAICompatible(QString(), QString(), QString());
    } else {
        return std::unexpected(invalidConfig(QStringLiteral("unknown_provider"),
                                             QStringLiteral("未知的 provider: %1").arg(provider)));
    }

    config.baseUrl = jsonStringEither(obj, "base_url", "baseUrl", config.baseUrl);
    config.model = jsonStringEither(obj, "model", "model");
    config.apiKey = jsonStringEither(obj, "api_key", "apiKey");
    const QString keyEnv = jsonStringEither(obj, "api_key_env", "apiKeyEnv");
    if (config.apiKey.isEmpty() && !keyEnv.isEmpty())
        config.apiKey = qEnvironmentVariable(keyEnv.toUtf8().constData());

    config.maxTokens = jsonIntEither(obj, "max_tokens", "maxTokens", config.maxTokens);
    config.timeoutMs = jsonIntEither(obj, "timeout_ms", "timeoutMs", config.timeoutMs);
    config.anthropicVersion = jsonStringEither(obj, "anthropic_version", "anthropicVersion",
                                               config.anthropicVersion);
    config.toolNamePrefix = jsonStringEither(obj, "tool_name_prefix", "toolNamePrefix");
    config.dialect.supportsReasoningEffort =
        jsonBoolEither(obj, "supports_reasoning_effort", "supportsReasoningEffort", false);
    config.dialect.useMaxCompletionTokens =
        jsonBoolEither(obj, "use_max_completion_tokens", "useMaxCompletionTokens", false);

    const QJsonObject headers = jsonValueEither(obj, "custom_headers", "customHeaders").toObject();
    for (auto it = headers.constBegin(); it != headers.constEnd(); ++it)
        config.customHeaders.insert(it.key(), it.value().toString());

    const QJsonObject emb = obj.value(QStringLiteral("embeddings")).toObject();
    config.embeddings.enabled = jsonBoolEither(emb, "enabled", "enabled", false);
    config.embeddings.model = jsonStringEither(emb, "model", "model");
    config.embeddings.baseUrl = jsonStringEither(emb, "base_url", "baseUrl");
    return config;
}

Result<ClientConfig> ClientConfig::loadFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return std::unexpected(invalidConfig(QStringLiteral("config_unreadable"),
                                             QStringLiteral("无法读取配置文件: %1").arg(path)));
    }
    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseErr);
    if (parseErr.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(invalidConfig(QStringLiteral("config_invalid_json"),
                                             QStringLiteral("配置文件不是有效的 JSON 对象: %1").arg(path)));
    }
    return fromJson(doc.object());
}

VoidResult ClientConfig::validate() const
{
    if (apiKey.trimmed().isEmpty())
        return std::unexpected(Failure::configuration(
            ErrorKind::InvalidCredentials, QStringLiteral("missing_api_key"), QStringLiteral("API key 为空")));
    if (model.trimmed().isEmpty())
        return std::unexpected(Failure::configuration(
            ErrorKind::InvalidModel, QStringLiteral("missing_model"), QStringLiteral("模型名称为空")));

    const QUrl url(baseUrl);
    if (!url.isValid() || (url.scheme() != QStringLiteral("http") && url.scheme() != QStringLiteral("https"))
        || url.host().isEmpty())
        return std::unexpected(invalidConfig(QStringLiteral("invalid_base_url"),
                                             QStringLiteral("base URL 无效: %1").arg(baseUrl)));
    if (maxTokens < 1)
        return std::unexpected(invalidConfig(QStringLiteral("invalid_max_tokens"),
                                             QStringLiteral("max_tokens 必须为正数")));
    if (timeoutMs < 1)
        return std::unexpected(invalidConfig(QStringLiteral("invalid_timeout"),
                                             QStringLiteral("超时时间必须为正数")));
    if (!ToolNameTransform::isValidPrefix(toolNamePrefix))
        return std::unexpected(invalidConfig(QStringLiteral("invalid_tool_name_prefix"),
                                             QStringLiteral("工具名前缀无效: %1").arg(toolNamePrefix)));
    return {};
}

QUrl ClientConfig::chatEndpoint() const
{
    if (provider == Provider::Anthropic)
        return joinEndpoint(baseUrl, QStringLiteral("/messages"));
    return joinEndpoint(baseUrl, QStringLiteral("/chat/completions"));
}

QUrl ClientConfig::embeddingsEndpoint() const
{
    return joinEndpoint(embeddings.baseUrl.isEmpty() ? baseUrl : embeddings.baseUrl,
                        QStringLiteral("/embeddings"));
}

Credentials ClientConfig::credentials() const
{
    Credentials creds;
    creds.apiKey = apiKey;
    creds.extraHeaders = customHeaders;
    if (provider == Provider::Anthropic) {
        creds.scheme = Credentials::Scheme::XApiKey;
        creds.extraHeaders.insert(QStringLiteral("anthropic-version"), anthropicVersion);
    } else {
        creds.scheme = Credentials::Scheme::Bearer;
    }
    return creds;
}
