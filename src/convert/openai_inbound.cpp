#include "openai_inbound.h"
#include "thinking_mapping.h"
#include "canonical/codec.h"
#include "canonical/stop_reason.h"
#include "core/log_manager.h"
#include <QJsonDocument>
#include <QSet>
#include <cmath>

namespace {

const QString kLogCategory = QStringLiteral("convert");

Result<std::optional<int>> optionalInt(const QJsonObject& root, const QString& key)
{
    const QJsonValue v = root.value(key);
    if (v.isUndefined() || v.isNull())
        return std::optional<int>{};
    if (!v.isDouble() || v.toDouble() != std::floor(v.toDouble()))
        return std::unexpected(Failure::malformedInput(
            QStringLiteral("wrong_type"), QStringLiteral("%1 must be an integer").arg(key)));
    return std::optional<int>(v.toInt());
}

Result<std::optional<double>> optionalDouble(const QJsonObject& root, const QString& key)
{
    const QJsonValue v = root.value(key);
    if (v.isUndefined() || v.isNull())
        return std::optional<double>{};
    if (!v.isDouble())
        return std::unexpected(Failure::malformedInput(
            QStringLiteral("wrong_type"), QStringLiteral("%1 must be a number").arg(key)));
    return std::optional<double>(v.toDouble());
}

void logDroppedFields(const QJsonObject& root)
{
    static const QSet<QString> known = {
        QStringLiteral("model"), QStringLiteral("messages"), QStringLiteral("system"),
        QStringLiteral("tools"), QStringLiteral("tool_choice"), QStringLiteral("parallel_tool_calls"),
        QStringLiteral("reasoning_effort"), QStringLiteral("max_tokens"),
        QStringLiteral("max_completion_tokens"), QStringLiteral("temperature"),
        QStringLiteral("top_p"), QStringLiteral("top_k"), QStringLiteral("stop"),
        QStringLiteral("stream"), QStringLiteral("user"), QStringLiteral("n")
    };
    for (auto it = root.constBegin(); it != root.constEnd(); ++it) {
        if (!known.contains(it.key()))
            LOG_DEBUG(kLogCategory, QStringLiteral("dropping request field '%1' (no canonical counterpart)")
                                        .arg(it.key()));
    }
}

// Tool results and a user turn that directly follows them share one canonical user message.
void appendUserContent(QList<Message>& messages, const QList<ContentBlock>& blocks, bool shorthand)
{
    if (!messages.isEmpty()) {
        Message& last = messages.last();
        if (last.role == Role::User && !last.content.isEmpty()
            && last.content.last().kind == BlockKind::ToolResult) {
            last.content.append(blocks);
            last.textShorthand = false;
            return;
        }
    }
    messages.append(Message{Role::User, blocks, shorthand});
}

}

// ---------------------------------------------------------------------------
// Content helpers
// ---------------------------------------------------------------------------

Result<QStringList> OpenAIInbound::textParts(const QJsonValue& content, const QString& where)
{
    QStringList parts;
    if (content.isUndefined() || content.isNull())
        return parts;
    if (content.isString()) {
        parts.append(content.toString());
        return parts;
    }
    if (!content.isArray())
        return std::unexpected(Failure::malformedInput(
            QStringLiteral("wrong_type"),
            QStringLiteral("%1 content must be a string or an array").arg(where)));

    for (const QJsonValue& pv : content.toArray()) {
        const QJsonObject p = pv.toObject();
        const QString type = p.value(QStringLiteral("type")).toString();
        if (type != QStringLiteral("text")) {
            return std::unexpected(Failure::unsupportedConstruct(
                QStringLiteral("non_text_content"),
                QStringLiteral("%1 content part '%2' is not text").arg(where, type)));
        }
        parts.append(p.value(QStringLiteral("text")).toString());
    }
    return parts;
}

Result<ContentBlock> OpenAIInbound::parseImageUrl(const QJsonObject& part)
{
    const QJsonValue imageVal = part.value(QStringLiteral("image_url"));
    const QString url = imageVal.isString()
        ? imageVal.toString()
        : imageVal.toObject().value(QStringLiteral("url")).toString();
    if (url.isEmpty())
        return std::unexpected(Failure::schemaViolation(
            QStringLiteral("missing_image_url"), QStringLiteral("image_url part has no url")));

    if (!url.startsWith(QStringLiteral("data:")))
        return ContentBlock::fromImageUrl(url);

    // data:<media type>;base64,<payload>
    const qsizetype comma = url.indexOf(QLatin1Char(','));
    const QString header = comma > 0 ? url.mid(5, comma - 5) : QString();
    if (comma < 0 || !header.endsWith(QStringLiteral(";base64"))) {
        return std::unexpected(Failure::malformedInput(
            QStringLiteral("invalid_data_url"),
            QStringLiteral("Image data URL must be base64 encoded")));
    }
    return ContentBlock::fromImageBase64(header.chopped(7), url.mid(comma + 1));
}

Result<QList<ContentBlock>> OpenAIInbound::parseContentParts(const QJsonValue& content,
                                                             const QString& where)
{
    QList<ContentBlock> blocks;
    if (content.isString()) {
        blocks.append(ContentBlock::fromText(content.toString()));
        return blocks;
    }
    if (!content.isArray())
        return std::unexpected(Failure::malformedInput(
            QStringLiteral("wrong_type"),
            QStringLiteral("%1 content must be a string or an array").arg(where)));

    for (const QJsonValue& pv : content.toArray()) {
        const QJsonObject p = pv.toObject();
        const QString type = p.value(QStringLiteral("type")).toString();
        if (type == QStringLiteral("text")) {
            blocks.append(ContentBlock::fromText(p.value(QStringLiteral("text")).toString()));
        } else if (type == QStringLiteral("image_url")) {
            auto image = parseImageUrl(p);
            if (!image)
                return std::unexpected(image.error());
            blocks.append(*image);
        } else {
            return std::unexpected(Failure::unsupportedConstruct(
                QStringLiteral("unsupported_content_part"),
                QStringLiteral("%1 content part '%2' is not supported").arg(where, type)));
        }
    }
    return blocks;
}

Result<QJsonValue> OpenAIInbound::parseArguments(const QJsonValue& value, const QString& callId)
{
    if (!value.isString()) {
        return std::unexpected(Failure::malformedInput(
            QStringLiteral("invalid_tool_arguments"),
            QStringLiteral("Tool call %1 arguments must be a JSON-encoded string").arg(callId)));
    }
    const QString arguments = value.toString();
    // An empty string is how the alternate format spells "no arguments".
    if (arguments.isEmpty())
        return QJsonValue(QJsonObject());

    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson(arguments.toUtf8(), &parseErr);
    if (parseErr.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(Failure::malformedInput(
            QStringLiteral("invalid_tool_arguments"),
            QStringLiteral("Tool call %1 arguments are not a JSON object: %2")
                .arg(callId, parseErr.error != QJsonParseError::NoError
                                 ? parseErr.errorString() : QStringLiteral("not an object"))));
    }
    return QJsonValue(doc.object());
}

Result<QList<ContentBlock>> OpenAIInbound::parseToolCalls(const QJsonArray& toolCalls)
{
    QList<ContentBlock> blocks;
    for (const QJsonValue& tcv : toolCalls) {
        const QJsonObject tc = tcv.toObject();
        const QString type = tc.value(QStringLiteral("type")).toString(QStringLiteral("function"));
        if (type != QStringLiteral("function")) {
            return std::unexpected(Failure::unsupportedConstruct(
                QStringLiteral("unsupported_tool_call"),
                QStringLiteral("Tool call type '%1' is not supported").arg(type)));
        }
        const QString id = tc.value(QStringLiteral("id")).toString();
        const QJsonObject fn = tc.value(QStringLiteral("function")).toObject();
        const QString name = fn.value(QStringLiteral("name")).toString();
        if (id.isEmpty() || name.isEmpty()) {
            return std::unexpected(Failure::schemaViolation(
                QStringLiteral("incomplete_tool_call"),
                QStringLiteral("Tool call requires an id and a function name")));
        }

        auto input = parseArguments(fn.value(QStringLiteral("arguments")), id);
        if (!input)
            return std::unexpected(input.error());
        blocks.append(ContentBlock::toolUse(id, name, *input));
    }
    return blocks;
}

Result<ToolDefinition> OpenAIInbound::parseTool(const QJsonObject& tool)
{
    const QString type = tool.value(QStringLiteral("type")).toString();
    if (type != QStringLiteral("function")) {
        return std::unexpected(Failure::unsupportedConstruct(
            QStringLiteral("unsupported_tool_type"),
            QStringLiteral("Tool type '%1' is not supported").arg(type)));
    }
    const QJsonObject fn = tool.value(QStringLiteral("function")).toObject();
    const QString name = fn.value(QStringLiteral("name")).toString();
    if (name.isEmpty())
        return std::unexpected(Failure::schemaViolation(
            QStringLiteral("missing_tool_name"), QStringLiteral("Tool function has no name")));

    // A function without parameters takes an empty object.
    QJsonObject schema = fn.value(QStringLiteral("parameters")).toObject();
    if (!fn.value(QStringLiteral("parameters")).isObject()) {
        schema[QStringLiteral("type")] = QStringLiteral("object");
        schema[QStringLiteral("properties")] = QJsonObject();
    }
    ToolDefinition def = ToolDefinition::create(name, QString(), schema);
    if (fn.value(QStringLiteral("description")).isString())
        def.description = fn.value(QStringLiteral("description")).toString();
    return def;
}

Result<ToolChoice> OpenAIInbound::parseToolChoice(const QJsonValue& choice)
{
    if (choice.isString()) {
        const QString mode = choice.toString();
        if (mode == QStringLiteral("auto"))     return ToolChoice::autoChoice();
        if (mode == QStringLiteral("none"))     return ToolChoice::none();
        if (mode == QStringLiteral("required")) return ToolChoice::any();
        return std::unexpected(Failure::unsupportedConstruct(
            QStringLiteral("unsupported_tool_choice"),
            QStringLiteral("tool_choice '%1' is not supported").arg(mode)));
    }

    const QJsonObject obj = choice.toObject();
    const QString name = obj.value(QStringLiteral("function")).toObject()
                             .value(QStringLiteral("name")).toString();
    if (obj.value(QStringLiteral("type")).toString() != QStringLiteral("function") || name.isEmpty()) {
        return std::unexpected(Failure::unsupportedConstruct(
            QStringLiteral("unsupported_tool_choice"),
            QStringLiteral("tool_choice object must name a function")));
    }
    return ToolChoice::tool(name);
}

Usage OpenAIInbound::parseUsage(const QJsonObject& usage)
{
    Usage u;
    u.inputTokens = usage.value(QStringLiteral("prompt_tokens")).toInteger();
    u.outputTokens = usage.value(QStringLiteral("completion_tokens")).toInteger();

    const QJsonValue reasoning = usage.value(QStringLiteral("completion_tokens_details")).toObject()
                                     .value(QStringLiteral("reasoning_tokens"));
    if (reasoning.isDouble())
        u.thinkingTokens = reasoning.toInteger();
    const QJsonValue cached = usage.value(QStringLiteral("prompt_tokens_details")).toObject()
                                  .value(QStringLiteral("cached_tokens"));
    if (cached.isDouble())
        u.cacheReadInputTokens = cached.toInteger();
    return u;
}

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------

Result<ChatRequest> OpenAIInbound::decodeRequest(const QJsonObject& root)
{
    ChatRequest req;
    logDroppedFields(root);

    if (root.value(QStringLiteral("n")).toInt(1) > 1) {
        return std::unexpected(Failure::unsupportedConstruct(
            QStringLiteral("multiple_choices"), QStringLiteral("n > 1 is not supported")));
    }

    const ThinkingMapping::ModelSuffix model =
        ThinkingMapping::parseModelSuffix(root.value(QStringLiteral("model")).toString());
    req.model = model.baseModel;
    QString level = model.level;
    if (level.isEmpty() && root.value(QStringLiteral("reasoning_effort")).isString())
        level = root.value(QStringLiteral("reasoning_effort")).toString();
    if (!level.isEmpty()) {
        auto thinking = ThinkingMapping::forModel(req.model, level);
        if (!thinking)
            return std::unexpected(thinking.error());
        req.thinking = *thinking;
    }

    // System text: top-level field plus system/developer messages, in order.
    QStringList systemField;
    bool systemFieldIsString = false;
    if (root.contains(QStringLiteral("system"))) {
        auto parts = textParts(root.value(QStringLiteral("system")), QStringLiteral("system"));
        if (!parts)
            return std::unexpected(parts.error());
        systemField = *parts;
        systemFieldIsString = root.value(QStringLiteral("system")).isString();
    }
    QStringList systemMessages;
    bool singleStringSystemMessage = false;
    int systemMessageCount = 0;

    const QJsonValue msgsVal = root.value(QStringLiteral("messages"));
    if (!msgsVal.isArray())
        return std::unexpected(Failure::schemaViolation(
            QStringLiteral("missing_messages"), QStringLiteral("messages must be an array")));
    if (msgsVal.toArray().isEmpty())
        return std::unexpected(Failure::schemaViolation(
            QStringLiteral("empty_messages"), QStringLiteral("messages must not be empty")));

    for (const QJsonValue& mv : msgsVal.toArray()) {
        const QJsonObject m = mv.toObject();
        const QString role = m.value(QStringLiteral("role")).toString();
        const QJsonValue content = m.value(QStringLiteral("content"));

        if (role == QStringLiteral("system") || role == QStringLiteral("developer")) {
            auto parts = textParts(content, role);
            if (!parts)
                return std::unexpected(parts.error());
            systemMessages.append(*parts);
            singleStringSystemMessage = content.isString();
            ++systemMessageCount;
        } else if (role == QStringLiteral("user")) {
            QList<ContentBlock> blocks;
            if (content.isUndefined() || content.isNull()) {
                blocks.append(ContentBlock::fromText(QString()));
            } else {
                auto parsed = parseContentParts(content, QStringLiteral("user"));
                if (!parsed)
                    return std::unexpected(parsed.error());
                blocks = *parsed;
            }
            if (blocks.isEmpty())
                return std::unexpected(Failure::schemaViolation(
                    QStringLiteral("empty_content"), QStringLiteral("user message has no content parts")));
            appendUserContent(req.messages, blocks, content.isString());
        } else if (role == QStringLiteral("assistant")) {
            auto parts = textParts(content, QStringLiteral("assistant"));
            if (!parts)
                return std::unexpected(parts.error());
            QList<ContentBlock> blocks;
            for (const QString& text : *parts) {
                if (!text.isEmpty())
                    blocks.append(ContentBlock::fromText(text));
            }
            const QJsonArray toolCalls = m.value(QStringLiteral("tool_calls")).toArray();
            auto calls = parseToolCalls(toolCalls);
            if (!calls)
                return std::unexpected(calls.error());
            blocks.append(*calls);

            if (blocks.isEmpty())
                return std::unexpected(Failure::schemaViolation(
                    QStringLiteral("empty_message"),
                    QStringLiteral("assistant message has neither text nor tool calls")));
            req.messages.append(Message{Role::Assistant, blocks,
                                        content.isString() && toolCalls.isEmpty() && blocks.size() == 1});
        } else if (role == QStringLiteral("tool")) {
            const QString callId = m.value(QStringLiteral("tool_call_id")).toString();
            if (callId.isEmpty())
                return std::unexpected(Failure::schemaViolation(
                    QStringLiteral("missing_tool_call_id"), QStringLiteral("tool message has no tool_call_id")));
            auto parts = textParts(content, QStringLiteral("tool"));
            if (!parts)
                return std::unexpected(parts.error());

            ContentBlock result;
            result.kind = BlockKind::ToolResult;
            result.toolCallId = callId;
            result.resultParts = *parts;
            result.resultAsBlocks = content.isArray();
            if (content.isString() && parts->size() == 1 && parts->first().isEmpty())
                result.resultParts.clear();
            const QJsonValue isError = m.value(QStringLiteral("is_error"));
            if (isError.isBool())
                result.isError = isError.toBool();
            appendUserContent(req.messages, {result}, false);
        } else {
            return std::unexpected(Failure::unsupportedConstruct(
                QStringLiteral("unsupported_role"),
                QStringLiteral("Message role '%1' is not supported").arg(role)));
        }
    }

    if (!systemField.isEmpty() && !systemMessages.isEmpty()) {
        const QStringList all = systemField + systemMessages;
        req.system = SystemPrompt{{ContentBlock::fromText(all.join(QStringLiteral("\n\n")))}, false};
    } else if (!systemField.isEmpty()) {
        SystemPrompt system;
        for (const QString& text : systemField)
            system.blocks.append(ContentBlock::fromText(text));
        system.textShorthand = systemFieldIsString;
        req.system = system;
    } else if (!systemMessages.isEmpty()) {
        SystemPrompt system;
        for (const QString& text : systemMessages)
            system.blocks.append(ContentBlock::fromText(text));
        system.textShorthand = systemMessageCount == 1 && singleStringSystemMessage;
        req.system = system;
    }

    if (root.contains(QStringLiteral("tools"))) {
        QList<ToolDefinition> tools;
        for (const QJsonValue& tv : root.value(QStringLiteral("tools")).toArray()) {
            auto tool = parseTool(tv.toObject());
            if (!tool)
                return std::unexpected(tool.error());
            tools.append(*tool);
        }
        req.tools = tools;
    }

    if (root.contains(QStringLiteral("tool_choice"))) {
        auto choice = parseToolChoice(root.value(QStringLiteral("tool_choice")));
        if (!choice)
            return std::unexpected(choice.error());
        req.toolChoice = *choice;
    }
    if (root.value(QStringLiteral("parallel_tool_calls")).isBool()
        && !root.value(QStringLiteral("parallel_tool_calls")).toBool()) {
        if (!req.toolChoice.has_value())
            req.toolChoice = ToolChoice::autoChoice();
        req.toolChoice->disableParallelToolUse = true;
    }

    auto maxCompletion = optionalInt(root, QStringLiteral("max_completion_tokens"));
    if (!maxCompletion)
        return std::unexpected(maxCompletion.error());
    auto maxTokens = optionalInt(root, QStringLiteral("max_tokens"));
    if (!maxTokens)
        return std::unexpected(maxTokens.error());
    req.sampling.maxTokens = maxCompletion->has_value() ? *maxCompletion : *maxTokens;

    auto topK = optionalInt(root, QStringLiteral("top_k"));
    if (!topK)
        return std::unexpected(topK.error());
    req.sampling.topK = *topK;

    auto temperature = optionalDouble(root, QStringLiteral("temperature"));
    if (!temperature)
        return std::unexpected(temperature.error());
    req.sampling.temperature = *temperature;

    auto topP = optionalDouble(root, QStringLiteral("top_p"));
    if (!topP)
        return std::unexpected(topP.error());
    req.sampling.topP = *topP;

    const QJsonValue stopVal = root.value(QStringLiteral("stop"));
    if (stopVal.isString()) {
        req.sampling.stopSequences.append(stopVal.toString());
    } else if (stopVal.isArray()) {
        for (const QJsonValue& sv : stopVal.toArray())
            req.sampling.stopSequences.append(sv.toString());
    }

    if (root.value(QStringLiteral("stream")).isBool())
        req.stream = root.value(QStringLiteral("stream")).toBool();
    if (root.value(QStringLiteral("user")).isString())
        req.metadata = RequestMetadata{root.value(QStringLiteral("user")).toString()};
    return req;
}

// ---------------------------------------------------------------------------
// Responses
// ---------------------------------------------------------------------------

Result<ChatResponse> OpenAIInbound::decodeResponse(const QJsonObject& root)
{
    if (root.value(QStringLiteral("error")).isObject()) {
        return std::unexpected(Failure::schemaViolation(
            QStringLiteral("error_payload"),
            root.value(QStringLiteral("error")).toObject().value(QStringLiteral("message")).toString()));
    }

    const QJsonArray choices = root.value(QStringLiteral("choices")).toArray();
    if (choices.isEmpty())
        return std::unexpected(Failure::schemaViolation(
            QStringLiteral("no_choices"), QStringLiteral("Response has no choices")));
    if (choices.size() > 1)
        LOG_WARNING(kLogCategory, QStringLiteral("response has %1 choices, only the first is kept")
                                      .arg(choices.size()));

    ChatResponse resp;
    resp.id = root.value(QStringLiteral("id")).toString();
    resp.model = root.value(QStringLiteral("model")).toString();

    const QJsonObject choice = choices.first().toObject();
    const QJsonObject message = choice.value(QStringLiteral("message")).toObject();

    auto parts = textParts(message.value(QStringLiteral("content")), QStringLiteral("response"));
    if (!parts)
        return std::unexpected(parts.error());
    for (const QString& text : *parts) {
        if (!text.isEmpty())
            resp.content.append(ContentBlock::fromText(text));
    }

    auto calls = parseToolCalls(message.value(QStringLiteral("tool_calls")).toArray());
    if (!calls)
        return std::unexpected(calls.error());
    resp.content.append(*calls);

    // No finish_reason means the provider did not say why; same as a null stop_reason.
    const QJsonValue finish = choice.value(QStringLiteral("finish_reason"));
    if (finish.isString()) {
        resp.stopReason = StopReasons::fromOpenAI(finish.toString(), &resp.rawStopReason);
    } else {
        resp.stopReason = StopReason::Other;
        resp.rawStopReason.clear();
    }

    if (root.value(QStringLiteral("usage")).isObject())
        resp.usage = parseUsage(root.value(QStringLiteral("usage")).toObject());
    return resp;
}

Result<EmbeddingResponse> OpenAIInbound::decodeEmbeddingResponse(const QJsonObject& root)
{
    return CanonicalCodec::decodeEmbeddingResponse(root);
}
