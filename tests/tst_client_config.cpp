#include <QTest>
#include <QJsonDocument>
#include <QTemporaryFile>
#include "client/client_config.h"

namespace {

QJsonObject parse(const char* json)
{
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

}

class TestClientConfig : public QObject {
    Q_OBJECT

private slots:
    void testAnthropicDefaults() {
        const ClientConfig config = ClientConfig::anthropic(QStringLiteral("sk-ant"), QStringLiteral("claude-sonnet-4-5"));
        QCOMPARE(config.provider, Provider::Anthropic);
        QCOMPARE(config.baseUrl, QStringLiteral("https://api.anthropic.com"));
        QCOMPARE(config.maxTokens, ClientConfig::kDefaultMaxTokens);
        QCOMPARE(config.timeoutMs, ClientConfig::kAnthropicTimeoutMs);
        QVERIFY(config.validate().has_value());
        QCOMPARE(config.chatEndpoint(), QUrl(QStringLiteral("https://api.anthropic.com/v1/messages")));

        const Credentials creds = config.credentials();
        QCOMPARE(creds.scheme, Credentials::Scheme::XApiKey);
        QCOMPARE(creds.apiKey, QStringLiteral("sk-ant"));
        QCOMPARE(creds.extraHeaders.value(QStringLiteral("anthropic-version")), QStringLiteral("2023-06-01"));
    }

    void testOpenAICompatibleEndpoints() {
        ClientConfig config = ClientConfig::openAICompatible(QStringLiteral("https://api.example.com/v1/"),
                                                             QStringLiteral("sk-x"), QStringLiteral("gpt-4o"));
        QCOMPARE(config.timeoutMs, ClientConfig::kAlternateTimeoutMs);
        QCOMPARE(config.chatEndpoint(), QUrl(QStringLiteral("https://api.example.com/v1/chat/completions")));
        QCOMPARE(config.embeddingsEndpoint(), QUrl(QStringLiteral("https://api.example.com/v1/embeddings")));
        QCOMPARE(config.credentials().scheme, Credentials::Scheme::Bearer);
        QVERIFY(!config.credentials().extraHeaders.contains(QStringLiteral("anthropic-version")));

        config.baseUrl = QStringLiteral("http://localhost:11434");
        QCOMPARE(config.chatEndpoint(), QUrl(QStringLiteral("http://localhost:11434/v1/chat/completions")));

        config.embeddings.baseUrl = QStringLiteral("http://embed.local/v1");
        QCOMPARE(config.embeddingsEndpoint(), QUrl(QStringLiteral("http://embed.local/v1/embeddings")));
    }

    void testFromJsonSnakeCase() {
        auto config = ClientConfig::fromJson(parse(R"({
            "provider": "openai_compatible",
            "base_url": "https://api.deepseek.com",
            "api_key": "sk-1",
            "model": "deepseek-chat",
            "max_tokens": 2048,
            "timeout_ms": 30000,
            "tool_name_prefix": "px_",
            "supports_reasoning_effort": true,
            "use_max_completion_tokens": true,
            "custom_headers": {"X-Team": "core"},
            "embeddings": {"enabled": true, "model": "embed-small", "base_url": "https://embed.example.com"}
        })"));
        QVERIFY(config.has_value());
        QCOMPARE(config->provider, Provider::OpenAICompatible);
        QCOMPARE(config->baseUrl, QStringLiteral("https://api.deepseek.com"));
        QCOMPARE(config->maxTokens, 2048);
        QCOMPARE(config->timeoutMs, 30000);
        QCOMPARE(config->toolNamePrefix, QStringLiteral("px_"));
        QVERIFY(config->dialect.supportsReasoningEffort);
        QVERIFY(config->dialect.useMaxCompletionTokens);
        QCOMPARE(config->customHeaders.value(QStringLiteral("X-Team")), QStringLiteral("core"));
        QCOMPARE(config->credentials().extraHeaders.value(QStringLiteral("X-Team")), QStringLiteral("core"));
        QVERIFY(config->embeddings.enabled);
        QCOMPARE(config->embeddings.model, QStringLiteral("embed-small"));
        QVERIFY(config->validate().has_value());
    }

    void testFromJsonCamelCase() {
        auto config = ClientConfig::fromJson(parse(R"({
            "provider": "anthropic",
            "apiKey": "sk-2",
            "model": "claude-opus-4-6",
            "maxTokens": 8192,
            "anthropicVersion": "2024-01-01"
        })"));
        QVERIFY(config.has_value());
        QCOMPARE(config->provider, Provider::Anthropic);
        QCOMPARE(config->baseUrl, QStringLiteral("https://api.anthropic.com"));
        QCOMPARE(config->apiKey, QStringLiteral("sk-2"));
        QCOMPARE(config->maxTokens, 8192);
        QCOMPARE(config->timeoutMs, ClientConfig::kAnthropicTimeoutMs);
        QCOMPARE(config->credentials().extraHeaders.value(QStringLiteral("anthropic-version")),
                 QStringLiteral("2024-01-01"));
    }

    void testApiKeyFromEnvironment() {
        qputenv("LLMBRIDGE_TEST_KEY", "sk-from-env");
        auto config = ClientConfig::fromJson(parse(R"({
            "provider": "openai", "base_url": "https://api.openai.com",
            "api_key_env": "LLMBRIDGE_TEST_KEY", "model": "gpt-4o"
        })"));
        qunsetenv("LLMBRIDGE_TEST_KEY");
        QVERIFY(config.has_value());
        QCOMPARE(config->apiKey, QStringLiteral("sk-from-env"));
    }

    void testUnknownProvider() {
        auto config = ClientConfig::fromJson(parse(R"({"provider": "gemini"})"));
        QVERIFY(!config.has_value());
        QCOMPARE(config.error().kind, ErrorKind::InvalidConfig);
        QCOMPARE(config.error().domain, ErrorDomain::Configuration);
    }

    void testLoadFile() {
        QTemporaryFile file;
        QVERIFY(file.open());
        file.write(R"({"provider": "anthropic", "api_key": "sk-file", "model": "claude-sonnet-4-5"})");
        file.close();

        auto config = ClientConfig::loadFile(file.fileName());
        QVERIFY(config.has_value());
        QCOMPARE(config->apiKey, QStringLiteral("sk-file"));

        QTemporaryFile broken;
        QVERIFY(broken.open());
        broken.write("{ not json");
        broken.close();
        auto bad = ClientConfig::loadFile(broken.fileName());
        QVERIFY(!bad.has_value());
        QCOMPARE(bad.error().code, QStringLiteral("config_invalid_json"));

        auto missing = ClientConfig::loadFile(QStringLiteral("/nonexistent/llmbridge.json"));
        QVERIFY(!missing.has_value());
        QCOMPARE(missing.error().code, QStringLiteral("config_unreadable"));
    }

    void testValidateKinds() {
        ClientConfig config = ClientConfig::anthropic(QString(), QStringLiteral("m"));
        QCOMPARE(config.validate().error().kind, ErrorKind::InvalidCredentials);

        config = ClientConfig::anthropic(QStringLiteral("k"), QStringLiteral("  "));
        QCOMPARE(config.validate().error().kind, ErrorKind::InvalidModel);

        config = ClientConfig::openAICompatible(QStringLiteral("api.example.com"), QStringLiteral("k"), QStringLiteral("m"));
        QCOMPARE(config.validate().error().code, QStringLiteral("invalid_base_url"));

        config = ClientConfig::anthropic(QStringLiteral("k"), QStringLiteral("m"));
        config.maxTokens = 0;
        QCOMPARE(config.validate().error().code, QStringLiteral("invalid_max_tokens"));

        config = ClientConfig::anthropic(QStringLiteral("k"), QStringLiteral("m"));
        config.toolNamePrefix = QStringLiteral("no spaces");
        QCOMPARE(config.validate().error().code, QStringLiteral("invalid_tool_name_prefix"));
    }
};

QTEST_MAIN(TestClientConfig)
#include "tst_client_config.moc"
