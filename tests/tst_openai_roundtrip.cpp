#include <QTest>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include "convert/convert.h"

namespace {

QJsonObject parse(const char* json)
{
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

QJsonObject weatherSchema()
{
    return parse(R"({"type": "object", "properties": {"city": {"type": "string"}}, "required": ["city"]})");
}

}

class TestOpenAIRoundtrip : public QObject {
    Q_OBJECT

private slots:
    void testSimpleChatRoundTrip() {
        ChatRequest req;
        req.model = QStringLiteral("gpt-4o");
        req.system = SystemPrompt::fromText(QStringLiteral("You are helpful."));
        Message hello = Message::userText(QStringLiteral("Hello!"));
        hello.textShorthand = true;
        req.messages.append(hello);
        req.sampling.maxTokens = 1024;

        auto alt = Convert::canonicalRequestToAlternate(req);
        QVERIFY(alt.has_value());
        const QJsonArray messages = alt->value(QStringLiteral("messages")).toArray();
        QCOMPARE(messages.size(), 2);
        QCOMPARE(messages[0].toObject().value(QStringLiteral("role")).toString(), QStringLiteral("system"));
        QCOMPARE(messages[0].toObject().value(QStringLiteral("content")).toString(), QStringLiteral("You are helpful."));
        QCOMPARE(messages[1].toObject().value(QStringLiteral("role")).toString(), QStringLiteral("user"));
        QCOMPARE(messages[1].toObject().value(QStringLiteral("content")).toString(), QStringLiteral("Hello!"));
        QCOMPARE(alt->value(QStringLiteral("max_tokens")).toInt(), 1024);

        auto back = Convert::alternateRequestToCanonical(*alt);
        QVERIFY(back.has_value());
        QCOMPARE(*back, req);
    }

    void testToolResultErrorMarker() {
        ChatRequest req;
        req.model = QStringLiteral("gpt-4o");
        req.messages.append(Message::userText(QStringLiteral("Weather in Paris?")));
        QJsonObject args;
        args[QStringLiteral("city")] = QStringLiteral("Paris");
        req.messages.append(Message::assistant({
            ContentBlock::toolUse(QStringLiteral("tu_1"), QStringLiteral("get_weather"), args)
        }));
        req.messages.append(Message::toolResults({
            ContentBlock::toolResult(QStringLiteral("tu_1"), QStringLiteral("service unavailable"), true)
        }));

        auto alt = Convert::canonicalRequestToAlternate(req);
        QVERIFY(alt.has_value());
        const QJsonArray messages = alt->value(QStringLiteral("messages")).toArray();
        QCOMPARE(messages.size(), 3);

        const QJsonObject assistant = messages[1].toObject();
        QVERIFY(assistant.value(QStringLiteral("content")).isNull());
        const QJsonObject call = assistant.value(QStringLiteral("tool_calls")).toArray().first().toObject();
        QCOMPARE(call.value(QStringLiteral("id")).toString(), QStringLiteral("tu_1"));
        QCOMPARE(call.value(QStringLiteral("function")).toObject().value(QStringLiteral("arguments")).toString(),
                 QStringLiteral("{\"city\":\"Paris\"}"));

        const QJsonObject tool = messages[2].toObject();
        QCOMPARE(tool.value(QStringLiteral("role")).toString(), QStringLiteral("tool"));
        QCOMPARE(tool.value(QStringLiteral("tool_call_id")).toString(), QStringLiteral("tu_1"));
        QCOMPARE(tool.value(QStringLiteral("content")).toString(), QStringLiteral("service unavailable"));
        QCOMPARE(tool.value(QStringLiteral("is_error")).toBool(), true);

        auto back = Convert::alternateRequestToCanonical(*alt);
        QVERIFY(back.has_value());
        QCOMPARE(*back, req);
    }

    void testThinkingWithoutReasoningEffort() {
        ChatRequest req;
        req.model = QStringLiteral("gpt-4o");
        req.messages.append(Message::userText(QStringLiteral("Think about it")));
        req.thinking = ThinkingConfig::manualBudget(2000);

        auto alt = Convert::canonicalRequestToAlternate(req);
        QVERIFY(alt.has_value());
        QVERIFY(!alt->contains(QStringLiteral("reasoning_effort")));
        QVERIFY(!alt->contains(QStringLiteral("thinking")));

        ConversionOptions options;
        options.dialect.supportsReasoningEffort = true;
        alt = Convert::canonicalRequestToAlternate(req, options);
        QVERIFY(alt.has_value());
        QCOMPARE(alt->value(QStringLiteral("reasoning_effort")).toString(), QStringLiteral("low"));
    }

    void testInvalidToolArguments() {
        const QJsonObject body = parse(R"({
            "model": "gpt-4o",
            "messages": [
                {"role": "user", "content": "go"},
                {"role": "assistant", "content": null, "tool_calls": [
                    {"id": "call_1", "type": "function",
                     "function": {"name": "lookup", "arguments": "{invalid json"}}
                ]}
            ]
        })");

        auto req = Convert::alternateRequestToCanonical(body);
        QVERIFY(!req.has_value());
        QCOMPARE(req.error().kind, ErrorKind::MalformedInput);
        QCOMPARE(req.error().code, QStringLiteral("invalid_tool_arguments"));

        QJsonObject array = body;
        QJsonArray messages = array.value(QStringLiteral("messages")).toArray();
        QJsonObject assistant = messages[1].toObject();
        assistant[QStringLiteral("tool_calls")] = parse(R"({"c": [
            {"id": "call_1", "type": "function", "function": {"name": "lookup", "arguments": "[1, 2]"}}
        ]})").value(QStringLiteral("c"));
        messages[1] = assistant;
        array[QStringLiteral("messages")] = messages;
        req = Convert::alternateRequestToCanonical(array);
        QVERIFY(!req.has_value());
        QCOMPARE(req.error().kind, ErrorKind::MalformedInput);
    }

    void testArgumentsSurviveRoundTrip() {
        const QJsonObject body = parse(R"({
            "model": "gpt-4o",
            "messages": [
                {"role": "user", "content": "go"},
                {"role": "assistant", "content": null, "tool_calls": [
                    {"id": "call_1", "type": "function",
                     "function": {"name": "lookup", "arguments": "{\"a\":1,\"b\":[true,null]}"}},
                    {"id": "call_2", "type": "function",
                     "function": {"name": "ping", "arguments": ""}}
                ]}
            ]
        })");

        auto req = Convert::alternateRequestToCanonical(body);
        QVERIFY(req.has_value());
        const ContentBlock& use = req->messages[1].content[0];
        QCOMPARE(use.kind, BlockKind::ToolUse);
        QCOMPARE(use.input.toObject().value(QStringLiteral("a")).toInt(), 1);
        QVERIFY(use.input.toObject().value(QStringLiteral("b")).toArray()[1].isNull());
        QCOMPARE(req->messages[1].content[1].input, QJsonValue(QJsonObject()));

        auto alt = Convert::canonicalRequestToAlternate(*req);
        QVERIFY(alt.has_value());
        const QJsonArray calls = alt->value(QStringLiteral("messages")).toArray()[1].toObject()
                                     .value(QStringLiteral("tool_calls")).toArray();
        QCOMPARE(calls[0].toObject().value(QStringLiteral("function")).toObject()
                     .value(QStringLiteral("arguments")).toString(),
                 QStringLiteral("{\"a\":1,\"b\":[true,null]}"));
        QCOMPARE(calls[1].toObject().value(QStringLiteral("function")).toObject()
                     .value(QStringLiteral("arguments")).toString(),
                 QStringLiteral("{}"));
    }

    void testSystemMerging() {
        auto both = Convert::alternateRequestToCanonical(parse(R"({
            "model": "gpt-4o",
            "system": "Field text.",
            "messages": [
                {"role": "system", "content": "Message text."},
                {"role": "user", "content": "hi"}
            ]
        })"));
        QVERIFY(both.has_value());
        QCOMPARE(both->system->blocks.size(), 1);
        QCOMPARE(both->system->blocks[0].text, QStringLiteral("Field text.\n\nMessage text."));
        QCOMPARE(both->messages.size(), 1);

        auto developer = Convert::alternateRequestToCanonical(parse(R"({
            "model": "gpt-4o",
            "messages": [
                {"role": "developer", "content": "One."},
                {"role": "system", "content": [{"type": "text", "text": "Two."}]},
                {"role": "user", "content": "hi"}
            ]
        })"));
        QVERIFY(developer.has_value());
        QCOMPARE(developer->system->blocks.size(), 2);
        QVERIFY(!developer->system->textShorthand);
        QCOMPARE(developer->system->joinedText(), QStringLiteral("One.\n\nTwo."));
    }

    void testToolResultsCoalesce() {
        auto req = Convert::alternateRequestToCanonical(parse(R"({
            "model": "gpt-4o",
            "messages": [
                {"role": "user", "content": "compare"},
                {"role": "assistant", "content": "Checking both.", "tool_calls": [
                    {"id": "c1", "type": "function", "function": {"name": "w", "arguments": "{}"}},
                    {"id": "c2", "type": "function", "function": {"name": "w", "arguments": "{}"}}
                ]},
                {"role": "tool", "tool_call_id": "c1", "content": "18C"},
                {"role": "tool", "tool_call_id": "c2", "content": [{"type": "text", "text": "12C"}]},
                {"role": "user", "content": "which is warmer?"}
            ]
        })"));
        QVERIFY(req.has_value());
        QCOMPARE(req->messages.size(), 3);

        const Message& assistant = req->messages[1];
        QCOMPARE(assistant.content.size(), 3);
        QCOMPARE(assistant.content[0].text, QStringLiteral("Checking both."));
        QVERIFY(!assistant.textShorthand);

        const Message& results = req->messages[2];
        QCOMPARE(results.role, Role::User);
        QCOMPARE(results.content.size(), 3);
        QCOMPARE(results.content[0].toolCallId, QStringLiteral("c1"));
        QVERIFY(!results.content[0].resultAsBlocks);
        QCOMPARE(results.content[1].toolCallId, QStringLiteral("c2"));
        QVERIFY(results.content[1].resultAsBlocks);
        QCOMPARE(results.content[2].kind, BlockKind::Text);
        QVERIFY(!results.textShorthand);

        // Back out: the trailing text becomes its own user turn after the tool messages.
        auto alt = Convert::canonicalRequestToAlternate(*req);
        QVERIFY(alt.has_value());
        const QJsonArray messages = alt->value(QStringLiteral("messages")).toArray();
        QCOMPARE(messages.size(), 5);
        QCOMPARE(messages[1].toObject().value(QStringLiteral("content")).toString(), QStringLiteral("Checking both."));
        QCOMPARE(messages[2].toObject().value(QStringLiteral("role")).toString(), QStringLiteral("tool"));
        QCOMPARE(messages[3].toObject().value(QStringLiteral("role")).toString(), QStringLiteral("tool"));
        QCOMPARE(messages[4].toObject().value(QStringLiteral("role")).toString(), QStringLiteral("user"));

        auto again = Convert::alternateRequestToCanonical(*alt);
        QVERIFY(again.has_value());
        QCOMPARE(*again, *req);
    }

    void testThinkingOnlyAssistantOmitted() {
        ChatRequest req;
        req.model = QStringLiteral("gpt-4o");
        req.messages.append(Message::userText(QStringLiteral("a")));
        req.messages.append(Message::assistant({
            ContentBlock::thinking(QStringLiteral("private"), QStringLiteral("sig"))
        }));
        req.messages.append(Message::userText(QStringLiteral("b")));

        auto alt = Convert::canonicalRequestToAlternate(req);
        QVERIFY(alt.has_value());
        const QJsonArray messages = alt->value(QStringLiteral("messages")).toArray();
        QCOMPARE(messages.size(), 2);
        QCOMPARE(messages[0].toObject().value(QStringLiteral("role")).toString(), QStringLiteral("user"));
        QCOMPARE(messages[1].toObject().value(QStringLiteral("role")).toString(), QStringLiteral("user"));
    }

    void testToolsAndChoice() {
        ChatRequest req;
        req.model = QStringLiteral("gpt-4o");
        req.messages.append(Message::userText(QStringLiteral("weather?")));
        req.tools = QList<ToolDefinition>{
            ToolDefinition::create(QStringLiteral("get_weather"), QStringLiteral("Current weather"), weatherSchema())
        };
        req.toolChoice = ToolChoice::any();
        req.toolChoice->disableParallelToolUse = true;

        auto alt = Convert::canonicalRequestToAlternate(req);
        QVERIFY(alt.has_value());
        QCOMPARE(alt->value(QStringLiteral("tool_choice")).toString(), QStringLiteral("required"));
        QCOMPARE(alt->value(QStringLiteral("parallel_tool_calls")).toBool(true), false);
        const QJsonObject fn = alt->value(QStringLiteral("tools")).toArray().first().toObject()
                                   .value(QStringLiteral("function")).toObject();
        QCOMPARE(fn.value(QStringLiteral("parameters")).toObject(), weatherSchema());

        auto back = Convert::alternateRequestToCanonical(*alt);
        QVERIFY(back.has_value());
        QCOMPARE(*back, req);

        req.toolChoice = ToolChoice::tool(QStringLiteral("get_weather"));
        alt = Convert::canonicalRequestToAlternate(req);
        QVERIFY(alt.has_value());
        QCOMPARE(alt->value(QStringLiteral("tool_choice")).toObject().value(QStringLiteral("function"))
                     .toObject().value(QStringLiteral("name")).toString(),
                 QStringLiteral("get_weather"));
        back = Convert::alternateRequestToCanonical(*alt);
        QVERIFY(back.has_value());
        QCOMPARE(*back, req);
    }

    void testFunctionWithoutParameters() {
        auto req = Convert::alternateRequestToCanonical(parse(R"({
            "model": "gpt-4o",
            "messages": [{"role": "user", "content": "x"}],
            "tools": [{"type": "function", "function": {"name": "now"}}]
        })"));
        QVERIFY(req.has_value());
        QCOMPARE(req->tools->first().inputSchema,
                 parse(R"({"type": "object", "properties": {}})"));
    }

    void testImages() {
        auto req = Convert::alternateRequestToCanonical(parse(R"({
            "model": "gpt-4o",
            "messages": [{"role": "user", "content": [
                {"type": "text", "text": "What is this?"},
                {"type": "image_url", "image_url": {"url": "data:image/png;base64,iVBORw0K"}},
                {"type": "image_url", "image_url": {"url": "https://example.com/a.jpg"}}
            ]}]
        })"));
        QVERIFY(req.has_value());
        const QList<ContentBlock>& blocks = req->messages[0].content;
        QCOMPARE(blocks[1].image.kind, ImageSourceKind::Base64);
        QCOMPARE(blocks[1].image.mediaType, QStringLiteral("image/png"));
        QCOMPARE(blocks[1].image.data, QStringLiteral("iVBORw0K"));
        QCOMPARE(blocks[2].image.kind, ImageSourceKind::Url);

        auto alt = Convert::canonicalRequestToAlternate(*req);
        QVERIFY(alt.has_value());
        const QJsonArray parts = alt->value(QStringLiteral("messages")).toArray()[0].toObject()
                                     .value(QStringLiteral("content")).toArray();
        QCOMPARE(parts[1].toObject().value(QStringLiteral("image_url")).toObject().value(QStringLiteral("url")).toString(),
                 QStringLiteral("data:image/png;base64,iVBORw0K"));

        auto plain = Convert::alternateRequestToCanonical(parse(R"({
            "model": "gpt-4o",
            "messages": [{"role": "user", "content": [
                {"type": "image_url", "image_url": {"url": "data:image/svg+xml,<svg/>"}}
            ]}]
        })"));
        QVERIFY(!plain.has_value());
        QCOMPARE(plain.error().kind, ErrorKind::MalformedInput);
    }

    void testSamplingAndModelSuffix() {
        auto req = Convert::alternateRequestToCanonical(parse(R"({
            "model": "claude-sonnet-4-5(high)",
            "messages": [{"role": "user", "content": "x"}],
            "max_tokens": 100,
            "max_completion_tokens": 200,
            "temperature": 0.2,
            "stop": "END",
            "user": "u-1",
            "reasoning_effort": "low"
        })"));
        QVERIFY(req.has_value());
        QCOMPARE(req->model, QStringLiteral("claude-sonnet-4-5"));
        QCOMPARE(*req->thinking, ThinkingConfig::manualBudget(32000));
        QCOMPARE(req->sampling.maxTokens, std::optional<int>(200));
        QCOMPARE(req->sampling.stopSequences, QStringList{QStringLiteral("END")});
        QCOMPARE(req->userId(), QStringLiteral("u-1"));

        auto effort = Convert::alternateRequestToCanonical(parse(R"({
            "model": "claude-opus-4-6",
            "messages": [{"role": "user", "content": "x"}],
            "reasoning_effort": "medium"
        })"));
        QVERIFY(effort.has_value());
        QCOMPARE(*effort->thinking, ThinkingConfig::adaptive(EffortLevel::Medium));

        ConversionOptions options;
        options.dialect.useMaxCompletionTokens = true;
        auto alt = Convert::canonicalRequestToAlternate(*req, options);
        QVERIFY(alt.has_value());
        QCOMPARE(alt->value(QStringLiteral("max_completion_tokens")).toInt(), 200);
        QVERIFY(!alt->contains(QStringLiteral("max_tokens")));
        QCOMPARE(alt->value(QStringLiteral("stop")).toArray().size(), 1);
    }

    void testMultipleChoicesUnsupported() {
        auto req = Convert::alternateRequestToCanonical(parse(R"({
            "model": "gpt-4o", "n": 2,
            "messages": [{"role": "user", "content": "x"}]
        })"));
        QVERIFY(!req.has_value());
        QCOMPARE(req.error().kind, ErrorKind::UnsupportedConstruct);
    }

    void testResponseUsageMapping() {
        auto resp = Convert::alternateResponseToCanonical(parse(R"({
            "id": "chatcmpl-123",
            "object": "chat.completion",
            "created": 1700000000,
            "model": "gpt-4o",
            "choices": [{"index": 0, "message": {"role": "assistant", "content": "Hello back"},
                         "finish_reason": "stop"}],
            "usage": {"prompt_tokens": 10, "completion_tokens": 5, "total_tokens": 15,
                      "completion_tokens_details": {"reasoning_tokens": 2},
                      "prompt_tokens_details": {"cached_tokens": 3}}
        })"));
        QVERIFY(resp.has_value());
        QCOMPARE(resp->id, QStringLiteral("chatcmpl-123"));
        QCOMPARE(resp->text(), QStringLiteral("Hello back"));
        QCOMPARE(resp->stopReason, StopReason::EndTurn);
        QCOMPARE(resp->usage->inputTokens, qint64(10));
        QCOMPARE(resp->usage->outputTokens, qint64(5));
        QCOMPARE(resp->usage->thinkingTokens, std::optional<qint64>(2));
        QCOMPARE(resp->usage->cacheReadInputTokens, std::optional<qint64>(3));

        auto alt = Convert::canonicalResponseToAlternate(*resp);
        QVERIFY(alt.has_value());
        QVERIFY(!alt->contains(QStringLiteral("created")));
        const QJsonObject usage = alt->value(QStringLiteral("usage")).toObject();
        QCOMPARE(usage.value(QStringLiteral("total_tokens")).toInt(), 15);
        QCOMPARE(usage.value(QStringLiteral("prompt_tokens_details")).toObject()
                     .value(QStringLiteral("cached_tokens")).toInt(), 3);

        ConversionOptions options;
        options.createdAt = 1700000123;
        alt = Convert::canonicalResponseToAlternate(*resp, options);
        QVERIFY(alt.has_value());
        QCOMPARE(alt->value(QStringLiteral("created")).toInteger(), qint64(1700000123));
    }

    void testResponseToolCallsAndFinishReasons() {
        ChatResponse resp;
        resp.id = QStringLiteral("msg_1");
        resp.model = QStringLiteral("claude-sonnet-4-5");
        resp.content.append(ContentBlock::thinking(QStringLiteral("hidden"), QStringLiteral("s")));
        resp.content.append(ContentBlock::fromText(QStringLiteral("Looking up.")));
        resp.content.append(ContentBlock::toolUse(QStringLiteral("tu_1"), QStringLiteral("lookup"),
                                                  parse(R"({"q": "x"})")));
        resp.stopReason = StopReason::ToolUse;

        auto alt = Convert::canonicalResponseToAlternate(resp);
        QVERIFY(alt.has_value());
        const QJsonObject choice = alt->value(QStringLiteral("choices")).toArray().first().toObject();
        QCOMPARE(choice.value(QStringLiteral("finish_reason")).toString(), QStringLiteral("tool_calls"));
        const QJsonObject message = choice.value(QStringLiteral("message")).toObject();
        QCOMPARE(message.value(QStringLiteral("content")).toString(), QStringLiteral("Looking up."));
        QCOMPARE(message.value(QStringLiteral("tool_calls")).toArray().size(), 1);

        auto back = Convert::alternateResponseToCanonical(*alt);
        QVERIFY(back.has_value());
        QCOMPARE(back->stopReason, StopReason::ToolUse);
        QCOMPARE(back->content.size(), 2);
        QCOMPARE(back->toolUses().first().input, QJsonValue(parse(R"({"q": "x"})")));

        auto filtered = Convert::alternateResponseToCanonical(parse(R"({
            "id": "x", "model": "m",
            "choices": [{"message": {"role": "assistant", "content": null}, "finish_reason": "content_filter"}]
        })"));
        QVERIFY(filtered.has_value());
        QCOMPARE(filtered->stopReason, StopReason::Other);
        QCOMPARE(filtered->rawStopReason, QStringLiteral("content_filter"));
        QVERIFY(filtered->content.isEmpty());
        alt = Convert::canonicalResponseToAlternate(*filtered);
        QVERIFY(alt.has_value());
        QCOMPARE(alt->value(QStringLiteral("choices")).toArray().first().toObject()
                     .value(QStringLiteral("finish_reason")).toString(),
                 QStringLiteral("content_filter"));
    }

    void testInvalidThinkingLevelRejected() {
        auto suffix = Convert::alternateRequestToCanonical(parse(R"({
            "model": "claude-sonnet-4-5(500)",
            "messages": [{"role": "user", "content": "x"}]
        })"));
        QVERIFY(!suffix.has_value());
        QCOMPARE(suffix.error().kind, ErrorKind::SchemaViolation);

        auto effort = Convert::alternateRequestToCanonical(parse(R"({
            "model": "claude-sonnet-4-5",
            "messages": [{"role": "user", "content": "x"}],
            "reasoning_effort": "3000000000"
        })"));
        QVERIFY(!effort.has_value());
        QCOMPARE(effort.error().kind, ErrorKind::SchemaViolation);
    }

    void testToolCallArgumentsMustBeString() {
        auto objectArgs = Convert::alternateRequestToCanonical(parse(R"({
            "model": "m",
            "messages": [
                {"role": "user", "content": "x"},
                {"role": "assistant", "content": null, "tool_calls": [
                    {"id": "c1", "type": "function", "function": {"name": "lookup", "arguments": {"a": 1}}}
                ]}
            ]
        })"));
        QVERIFY(!objectArgs.has_value());
        QCOMPARE(objectArgs.error().kind, ErrorKind::MalformedInput);

        auto missingArgs = Convert::alternateResponseToCanonical(parse(R"({
            "id": "x", "model": "m",
            "choices": [{"message": {"role": "assistant", "content": null, "tool_calls": [
                {"id": "c1", "type": "function", "function": {"name": "lookup"}}
            ]}, "finish_reason": "tool_calls"}]
        })"));
        QVERIFY(!missingArgs.has_value());
        QCOMPARE(missingArgs.error().kind, ErrorKind::MalformedInput);
    }

    void testMissingFinishReason() {
        for (const char* json : {
                 R"({"id": "x", "model": "m", "choices": [{"message": {"role": "assistant", "content": "hi"}}]})",
                 R"({"id": "x", "model": "m", "choices": [{"message": {"role": "assistant", "content": "hi"}, "finish_reason": null}]})"}) {
            auto resp = Convert::alternateResponseToCanonical(parse(json));
            QVERIFY(resp.has_value());
            QCOMPARE(resp->stopReason, StopReason::Other);
            QVERIFY(resp->rawStopReason.isEmpty());

            auto alt = Convert::canonicalResponseToAlternate(*resp);
            QVERIFY(alt.has_value());
            QVERIFY(alt->value(QStringLiteral("choices")).toArray().first().toObject()
                        .value(QStringLiteral("finish_reason")).isNull());
        }
    }

    void testEmptyMessagesRejected() {
        ChatRequest req;
        req.model = QStringLiteral("m");
        req.messages.append(Message::userText(QStringLiteral("hi")));
        req.messages.append(Message::user({}));
        auto emptyUser = Convert::canonicalRequestToAlternate(req);
        QVERIFY(!emptyUser.has_value());
        QCOMPARE(emptyUser.error().code, QStringLiteral("empty_message"));

        req.messages.last() = Message::assistant({});
        auto emptyAssistant = Convert::canonicalRequestToAlternate(req);
        QVERIFY(!emptyAssistant.has_value());
        QCOMPARE(emptyAssistant.error().code, QStringLiteral("empty_message"));

        auto noMessages = Convert::alternateRequestToCanonical(parse(R"({"model": "m", "messages": []})"));
        QVERIFY(!noMessages.has_value());
        QCOMPARE(noMessages.error().code, QStringLiteral("empty_messages"));

        auto blankAssistant = Convert::alternateRequestToCanonical(parse(R"({
            "model": "m",
            "messages": [{"role": "user", "content": "x"}, {"role": "assistant", "content": null}]
        })"));
        QVERIFY(!blankAssistant.has_value());
        QCOMPARE(blankAssistant.error().code, QStringLiteral("empty_message"));
    }

    void testResponseErrors() {
        auto noChoices = Convert::alternateResponseToCanonical(parse(R"({"id": "x", "choices": []})"));
        QVERIFY(!noChoices.has_value());
        QCOMPARE(noChoices.error().kind, ErrorKind::SchemaViolation);

        auto error = Convert::alternateResponseToCanonical(
            parse(R"({"error": {"message": "bad key", "type": "invalid_request_error"}})"));
        QVERIFY(!error.has_value());
        QCOMPARE(error.error().message, QStringLiteral("bad key"));
    }

    void testEmbeddings() {
        EmbeddingRequest req;
        req.model = QStringLiteral("text-embedding-3-small");
        req.input = QStringList{QStringLiteral("a"), QStringLiteral("b")};
        const QJsonObject body = Convert::canonicalEmbeddingRequestToAlternate(req);
        QCOMPARE(body.value(QStringLiteral("input")).toArray().size(), 2);

        auto resp = Convert::alternateEmbeddingResponseToCanonical(parse(R"({
            "data": [{"index": 1, "embedding": [2]}, {"index": 0, "embedding": [1]}],
            "model": "text-embedding-3-small"
        })"));
        QVERIFY(resp.has_value());
        QCOMPARE(resp->vectors[0], QList<float>{1.0f});
        QCOMPARE(resp->vectors[1], QList<float>{2.0f});
    }
};

QTEST_MAIN(TestOpenAIRoundtrip)
#include "tst_openai_roundtrip.moc"
