#include "codec.h"
#include "stop_reason.h"
#include <QJsonDocument>
#include <algorithm>
#include <cmath>

namespace {

Failure wrongType(const QString& where, const QString& expected)
{
    return Failure::malformedInput(QStringLiteral("wrong_type"),
                                   QStringLiteral("%1 must be %2").arg(where, expected));
}

Result<std::optional<qint64>> readInteger(const QJsonObject& obj, const QString& key,
                                          const QString& where)
{
    const QJsonValue v = obj.value(key);
    if (v.isUndefined() || v.isNull())
        return std::optional<qint64>{};
    if (!v.isDouble() || v.toDouble() != std::floor(v.toDouble()))
        return std::unexpected(wrongType(where + QLatin1Char('.') + key, QStringLiteral("an integer")));
    return std::optional<qint64>(static_cast<qint64>(v.toDouble()));
}

Result<std::optional<double>> readNumber(const QJsonObject& obj, const QString& key,
                                         const QString& where)
{
    const QJsonValue v = obj.value(key);
    if (v.isUndefined() || v.isNull())
        return std::optional<double>{};
    if (!v.isDouble())
        return std::unexpected(wrongType(where + QLatin1Char('.') + key, QStringLiteral("a number")));
    return std::optional<double>(v.toDouble());
}

Result<QString> readString(const QJsonObject& obj, const QString& key, const QString& where,
                           bool required)
{
    const QJsonValue v = obj.value(key);
    if (v.isUndefined() || v.isNull()) {
        if (required)
            return std::unexpected(Failure::schemaViolation(
                QStringLiteral("missing_field"),
                QStringLiteral("%1.%2 is required").arg(where, key)));
        return QString();
    }
    if (!v.isString())
        return std::unexpected(wrongType(where + QLatin1Char('.') + key, QStringLiteral("a string")));
    return v.toString();
}

}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

Result<QJsonObject> CanonicalCodec::parseObject(const QByteArray& body, const QString& what)
{
    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseErr);
    if (parseErr.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(Failure::malformedInput(
            QStringLiteral("invalid_json"),
            QStringLiteral("%1 is not a JSON object: %2").arg(what, parseErr.errorString())));
    }
    return doc.object();
}

QJsonObject CanonicalCodec::encodeCacheMarker(const CacheMarker& marker)
{
    QJsonObject cc;
    cc[QStringLiteral("type")] = marker.type;
    if (!marker.ttl.isEmpty())
        cc[QStringLiteral("ttl")] = marker.ttl;
    return cc;
}

Result<std::optional<CacheMarker>> CanonicalCodec::decodeCacheMarker(const QJsonObject& owner)
{
    const QJsonValue v = owner.value(QStringLiteral("cache_control"));
    if (v.isUndefined() || v.isNull())
        return std::optional<CacheMarker>{};
    if (!v.isObject())
        return std::unexpected(wrongType(QStringLiteral("cache_control"), QStringLiteral("an object")));
    const QJsonObject cc = v.toObject();
    CacheMarker marker;
    marker.type = cc.value(QStringLiteral("type")).toString(QStringLiteral("ephemeral"));
    marker.ttl = cc.value(QStringLiteral("ttl")).toString();
    return std::optional<CacheMarker>(marker);
}

Result<EffortLevel> CanonicalCodec::parseEffort(const QString& effort)
{
    if (effort == QStringLiteral("low"))    return EffortLevel::Low;
    if (effort == QStringLiteral("medium")) return EffortLevel::Medium;
    if (effort == QStringLiteral("high"))   return EffortLevel::High;
    if (effort == QStringLiteral("max"))    return EffortLevel::Max;
    return std::unexpected(Failure::unsupportedConstruct(
        QStringLiteral("unknown_effort"),
        QStringLiteral("Unknown thinking effort '%1'").arg(effort)));
}

// ---------------------------------------------------------------------------
// Content blocks
// ---------------------------------------------------------------------------

QJsonObject CanonicalCodec::encodeBlock(const ContentBlock& block)
{
    QJsonObject obj;
    switch (block.kind) {
    case BlockKind::Text:
        obj[QStringLiteral("type")] = QStringLiteral("text");
        obj[QStringLiteral("text")] = block.text;
        break;
    case BlockKind::Image: {
        obj[QStringLiteral("type")] = QStringLiteral("image");
        QJsonObject source;
        if (block.image.kind == ImageSourceKind::Base64) {
            source[QStringLiteral("type")] = QStringLiteral("base64");
            source[QStringLiteral("media_type")] = block.image.mediaType;
            source[QStringLiteral("data")] = block.image.data;
        } else {
            source[QStringLiteral("type")] = QStringLiteral("url");
            source[QStringLiteral("url")] = block.image.url;
        }
        obj[QStringLiteral("source")] = source;
        break;
    }
    case BlockKind::ToolUse:
        obj[QStringLiteral("type")] = QStringLiteral("tool_use");
        obj[QStringLiteral("id")] = block.toolCallId;
        obj[QStringLiteral("name")] = block.toolName;
        obj[QStringLiteral("input")] = block.input;
        break;
    case BlockKind::ToolResult: {
        obj[QStringLiteral("type")] = QStringLiteral("tool_result");
        obj[QStringLiteral("tool_use_id")] = block.toolCallId;
        if (block.resultAsBlocks) {
            QJsonArray parts;
            for (const QString& part : block.resultParts) {
                QJsonObject textBlock;
                textBlock[QStringLiteral("type")] = QStringLiteral("text");
                textBlock[QStringLiteral("text")] = part;
                parts.append(textBlock);
            }
            obj[QStringLiteral("content")] = parts;
        } else if (!block.resultParts.isEmpty()) {
            obj[QStringLiteral("content")] = block.resultText();
        }
        if (block.isError.has_value())
            obj[QStringLiteral("is_error")] = *block.isError;
        break;
    }
    case BlockKind::Thinking:
        obj[QStringLiteral("type")] = QStringLiteral("thinking");
        obj[QStringLiteral("thinking")] = block.text;
        if (block.signature.has_value())
            obj[QStringLiteral("signature")] = *block.signature;
        break;
    case BlockKind::RedactedThinking:
        obj[QStringLiteral("type")] = QStringLiteral("redacted_thinking");
        obj[QStringLiteral("data")] = block.data;
        break;
    }

    if (block.cacheControl.has_value())
        obj[QStringLiteral("cache_control")] = encodeCacheMarker(*block.cacheControl);
    return obj;
}

Result<ContentBlock> CanonicalCodec::decodeBlock(const QJsonObject& obj)
{
    const QString type = obj.value(QStringLiteral("type")).toString();
    ContentBlock block;

    if (type == QStringLiteral("text")) {
        auto text = readString(obj, QStringLiteral("text"), QStringLiteral("text block"), true);
        if (!text)
            return std::unexpected(text.error());
        block = ContentBlock::fromText(*text);
    } else if (type == QStringLiteral("image")) {
        const QJsonObject source = obj.value(QStringLiteral("source")).toObject();
        const QString sourceType = source.value(QStringLiteral("type")).toString();
        if (sourceType == QStringLiteral("base64")) {
            block = ContentBlock::fromImageBase64(
                source.value(QStringLiteral("media_type")).toString(),
                source.value(QStringLiteral("data")).toString());
        } else if (sourceType == QStringLiteral("url")) {
            block = ContentBlock::fromImageUrl(source.value(QStringLiteral("url")).toString());
        } else {
            return std::unexpected(Failure::unsupportedConstruct(
                QStringLiteral("unsupported_image_source"),
                QStringLiteral("Image source type '%1' is not supported").arg(sourceType)));
        }
    } else if (type == QStringLiteral("tool_use")) {
        auto id = readString(obj, QStringLiteral("id"), QStringLiteral("tool_use"), true);
        if (!id)
            return std::unexpected(id.error());
        auto name = readString(obj, QStringLiteral("name"), QStringLiteral("tool_use"), true);
        if (!name)
            return std::unexpected(name.error());
        const QJsonValue input = obj.value(QStringLiteral("input"));
        if (!input.isObject())
            return std::unexpected(wrongType(QStringLiteral("tool_use.input"), QStringLiteral("an object")));
        block = ContentBlock::toolUse(*id, *name, input);
    } else if (type == QStringLiteral("tool_result")) {
        auto id = readString(obj, QStringLiteral("tool_use_id"), QStringLiteral("tool_result"), true);
        if (!id)
            return std::unexpected(id.error());
        block.kind = BlockKind::ToolResult;
        block.toolCallId = *id;

        const QJsonValue content = obj.value(QStringLiteral("content"));
        if (content.isString()) {
            block.resultParts.append(content.toString());
        } else if (content.isArray()) {
            block.resultAsBlocks = true;
            for (const QJsonValue& pv : content.toArray()) {
                const QJsonObject part = pv.toObject();
                if (part.value(QStringLiteral("type")).toString() != QStringLiteral("text")) {
                    return std::unexpected(Failure::unsupportedConstruct(
                        QStringLiteral("non_text_tool_result"),
                        QStringLiteral("tool_result %1 contains a non-text part").arg(*id)));
                }
                block.resultParts.append(part.value(QStringLiteral("text")).toString());
            }
        } else if (!content.isUndefined() && !content.isNull()) {
            return std::unexpected(wrongType(QStringLiteral("tool_result.content"),
                                             QStringLiteral("a string or an array")));
        }

        const QJsonValue isError = obj.value(QStringLiteral("is_error"));
        if (isError.isBool())
            block.isError = isError.toBool();
    } else if (type == QStringLiteral("thinking")) {
        auto text = readString(obj, QStringLiteral("thinking"), QStringLiteral("thinking block"), true);
        if (!text)
            return std::unexpected(text.error());
        block = ContentBlock::thinking(*text);
        if (obj.contains(QStringLiteral("signature"))) {
            auto signature = readString(obj, QStringLiteral("signature"), QStringLiteral("thinking block"), false);
            if (!signature)
                return std::unexpected(signature.error());
            block.signature = *signature;
        }
    } else if (type == QStringLiteral("redacted_thinking")) {
        block = ContentBlock::redactedThinking(obj.value(QStringLiteral("data")).toString());
    } else {
        return std::unexpected(Failure::unsupportedConstruct(
            QStringLiteral("unsupported_block_type"),
            QStringLiteral("Content block type '%1' is not supported").arg(type)));
    }

    auto marker = decodeCacheMarker(obj);
    if (!marker)
        return std::unexpected(marker.error());
    block.cacheControl = *marker;
    return block;
}

QJsonValue CanonicalCodec::encodeContent(const QList<ContentBlock>& blocks, bool shorthand)
{
    if (shorthand && blocks.size() == 1 && blocks.first().kind == BlockKind::Text
        && !blocks.first().cacheControl.has_value()) {
        return blocks.first().text;
    }
    QJsonArray arr;
    for (const ContentBlock& b : blocks)
        arr.append(encodeBlock(b));
    return arr;
}

Result<QList<ContentBlock>> CanonicalCodec::decodeContent(const QJsonValue& content, bool& shorthand,
                                                          const QString& where)
{
    QList<ContentBlock> blocks;
    shorthand = false;
    if (content.isString()) {
        shorthand = true;
        blocks.append(ContentBlock::fromText(content.toString()));
        return blocks;
    }
    if (!content.isArray())
        return std::unexpected(wrongType(where, QStringLiteral("a string or an array of blocks")));

    for (const QJsonValue& bv : content.toArray()) {
        if (!bv.isObject())
            return std::unexpected(wrongType(where + QStringLiteral("[]"), QStringLiteral("an object")));
        auto block = decodeBlock(bv.toObject());
        if (!block)
            return std::unexpected(block.error());
        blocks.append(*block);
    }
    return blocks;
}

// ---------------------------------------------------------------------------
// Messages, tools, thinking
// ---------------------------------------------------------------------------

QJsonObject CanonicalCodec::encodeMessage(const Message& message)
{
    QJsonObject obj;
    obj[QStringLiteral("role")] = roleName(message.role);
    obj[QStringLiteral("content")] = encodeContent(message.content, message.textShorthand);
    return obj;
}

Result<Message> CanonicalCodec::decodeMessage(const QJsonObject& obj)
{
    Message message;
    const QString role = obj.value(QStringLiteral("role")).toString();
    if (role == QStringLiteral("user")) {
        message.role = Role::User;
    } else if (role == QStringLiteral("assistant")) {
        message.role = Role::Assistant;
    } else {
        return std::unexpected(Failure::schemaViolation(
            QStringLiteral("invalid_role"),
            QStringLiteral("Message role '%1' is not user or assistant").arg(role)));
    }

    bool shorthand = false;
    auto content = decodeContent(obj.value(QStringLiteral("content")), shorthand,
                                 QStringLiteral("message.content"));
    if (!content)
        return std::unexpected(content.error());
    message.content = *content;
    message.textShorthand = shorthand;
    return message;
}

QJsonObject CanonicalCodec::encodeTool(const ToolDefinition& tool)
{
    QJsonObject obj;
    obj[QStringLiteral("name")] = tool.name;
    if (tool.description.has_value())
        obj[QStringLiteral("description")] = *tool.description;
    obj[QStringLiteral("input_schema")] = tool.inputSchema;
    if (tool.cacheControl.has_value())
        obj[QStringLiteral("cache_control")] = encodeCacheMarker(*tool.cacheControl);
    return obj;
}

Result<ToolDefinition> CanonicalCodec::decodeTool(const QJsonObject& obj)
{
    // Server tools (web_search, bash, ...) carry a "type" and have no schema.
    const QString type = obj.value(QStringLiteral("type")).toString();
    if (!type.isEmpty() && type != QStringLiteral("custom")) {
        return std::unexpected(Failure::unsupportedConstruct(
            QStringLiteral("unsupported_tool_type"),
            QStringLiteral("Tool type '%1' is not supported").arg(type)));
    }

    auto name = readString(obj, QStringLiteral("name"), QStringLiteral("tool"), true);
    if (!name)
        return std::unexpected(name.error());
    auto description = readString(obj, QStringLiteral("description"), QStringLiteral("tool"), false);
    if (!description)
        return std::unexpected(description.error());
    const QJsonValue schema = obj.value(QStringLiteral("input_schema"));
    if (!schema.isObject())
        return std::unexpected(Failure::schemaViolation(
            QStringLiteral("missing_input_schema"),
            QStringLiteral("Tool '%1' has no input_schema object").arg(*name)));

    ToolDefinition tool = ToolDefinition::create(*name, QString(), schema.toObject());
    if (obj.contains(QStringLiteral("description")))
        tool.description = *description;
    auto marker = decodeCacheMarker(obj);
    if (!marker)
        return std::unexpected(marker.error());
    tool.cacheControl = *marker;
    return tool;
}

QJsonObject CanonicalCodec::encodeToolChoice(const ToolChoice& choice)
{
    QJsonObject obj;
    switch (choice.mode) {
    case ToolChoiceMode::Auto: obj[QStringLiteral("type")] = QStringLiteral("auto"); break;
    case ToolChoiceMode::Any:  obj[QStringLiteral("type")] = QStringLiteral("any"); break;
    case ToolChoiceMode::None: obj[QStringLiteral("type")] = QStringLiteral("none"); break;
    case ToolChoiceMode::Tool:
        obj[QStringLiteral("type")] = QStringLiteral("tool");
        obj[QStringLiteral("name")] = choice.toolName;
        break;
    }
    if (choice.disableParallelToolUse.has_value())
        obj[QStringLiteral("disable_parallel_tool_use")] = *choice.disableParallelToolUse;
    return obj;
}

Result<ToolChoice> CanonicalCodec::decodeToolChoice(const QJsonObject& obj)
{
    ToolChoice choice;
    const QString type = obj.value(QStringLiteral("type")).toString();
    if (type == QStringLiteral("auto")) {
        choice.mode = ToolChoiceMode::Auto;
    } else if (type == QStringLiteral("any")) {
        choice.mode = ToolChoiceMode::Any;
    } else if (type == QStringLiteral("none")) {
        choice.mode = ToolChoiceMode::None;
    } else if (type == QStringLiteral("tool")) {
        auto name = readString(obj, QStringLiteral("name"), QStringLiteral("tool_choice"), true);
        if (!name)
            return std::unexpected(name.error());
        choice.mode = ToolChoiceMode::Tool;
        choice.toolName = *name;
    } else {
        return std::unexpected(Failure::unsupportedConstruct(
            QStringLiteral("unsupported_tool_choice"),
            QStringLiteral("tool_choice type '%1' is not supported").arg(type)));
    }
    const QJsonValue parallel = obj.value(QStringLiteral("disable_parallel_tool_use"));
    if (parallel.isBool())
        choice.disableParallelToolUse = parallel.toBool();
    else if (!parallel.isUndefined() && !parallel.isNull())
        return std::unexpected(wrongType(QStringLiteral("tool_choice.disable_parallel_tool_use"),
                                         QStringLiteral("a boolean")));
    return choice;
}

void CanonicalCodec::encodeThinking(QJsonObject& body, const ThinkingConfig& config)
{
    QJsonObject thinking;
    switch (config.mode) {
    case ThinkingMode::Disabled:
        thinking[QStringLiteral("type")] = QStringLiteral("disabled");
        break;
    case ThinkingMode::Adaptive:
        thinking[QStringLiteral("type")] = QStringLiteral("adaptive");
        // high is the provider default and is left implicit unless it was written out
        if (config.effort != EffortLevel::High || config.defaultEffortExplicit) {
            QJsonObject output;
            output[QStringLiteral("effort")] = effortName(config.effort);
            body[QStringLiteral("output_config")] = output;
        }
        break;
    case ThinkingMode::ManualBudget:
        thinking[QStringLiteral("type")] = QStringLiteral("enabled");
        thinking[QStringLiteral("budget_tokens")] = config.budgetTokens;
        break;
    }
    body[QStringLiteral("thinking")] = thinking;
}

Result<ThinkingConfig> CanonicalCodec::decodeThinking(const QJsonObject& thinking,
                                                      const QJsonObject& outputConfig)
{
    const QString type = thinking.value(QStringLiteral("type")).toString();
    if (type == QStringLiteral("disabled"))
        return ThinkingConfig::disabled();

    if (type == QStringLiteral("enabled")) {
        auto budget = readInteger(thinking, QStringLiteral("budget_tokens"), QStringLiteral("thinking"));
        if (!budget)
            return std::unexpected(budget.error());
        if (!budget->has_value())
            return std::unexpected(Failure::schemaViolation(
                QStringLiteral("missing_budget_tokens"),
                QStringLiteral("thinking.type=enabled requires budget_tokens")));
        return ThinkingConfig::manualBudget(static_cast<int>(**budget));
    }

    if (type == QStringLiteral("adaptive")) {
        const QString effort = outputConfig.value(QStringLiteral("effort")).toString();
        if (effort.isEmpty())
            return ThinkingConfig::adaptive(EffortLevel::High);
        auto level = parseEffort(effort);
        if (!level)
            return std::unexpected(level.error());
        ThinkingConfig config = ThinkingConfig::adaptive(*level);
        config.defaultEffortExplicit = (*level == EffortLevel::High);
        return config;
    }

    return std::unexpected(Failure::unsupportedConstruct(
        QStringLiteral("unsupported_thinking_type"),
        QStringLiteral("thinking type '%1' is not supported").arg(type)));
}

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------

QJsonObject CanonicalCodec::encodeRequest(const ChatRequest& request)
{
    QJsonObject body;
    body[QStringLiteral("model")] = request.model;

    if (request.system.has_value())
        body[QStringLiteral("system")] = encodeContent(request.system->blocks,
                                                       request.system->textShorthand);

    QJsonArray messages;
    for (const Message& m : request.messages)
        messages.append(encodeMessage(m));
    body[QStringLiteral("messages")] = messages;

    if (request.tools.has_value()) {
        QJsonArray tools;
        for (const ToolDefinition& t : *request.tools)
            tools.append(encodeTool(t));
        body[QStringLiteral("tools")] = tools;
    }
    if (request.toolChoice.has_value())
        body[QStringLiteral("tool_choice")] = encodeToolChoice(*request.toolChoice);
    if (request.thinking.has_value())
        encodeThinking(body, *request.thinking);

    const SamplingParams& s = request.sampling;
    if (s.maxTokens.has_value())
        body[QStringLiteral("max_tokens")] = *s.maxTokens;
    if (s.temperature.has_value())
        body[QStringLiteral("temperature")] = *s.temperature;
    if (s.topP.has_value())
        body[QStringLiteral("top_p")] = *s.topP;
    if (s.topK.has_value())
        body[QStringLiteral("top_k")] = *s.topK;
    if (!s.stopSequences.isEmpty())
        body[QStringLiteral("stop_sequences")] = QJsonArray::fromStringList(s.stopSequences);

    if (request.stream.has_value())
        body[QStringLiteral("stream")] = *request.stream;
    if (request.metadata.has_value()) {
        QJsonObject metadata;
        if (request.metadata->userId.has_value())
            metadata[QStringLiteral("user_id")] = *request.metadata->userId;
        body[QStringLiteral("metadata")] = metadata;
    }
    return body;
}

Result<ChatRequest> CanonicalCodec::decodeRequest(const QByteArray& body)
{
    auto root = parseObject(body, QStringLiteral("Request body"));
    if (!root)
        return std::unexpected(root.error());
    return decodeRequest(*root);
}

Result<ChatRequest> CanonicalCodec::decodeRequest(const QJsonObject& root)
{
    ChatRequest req;
    auto model = readString(root, QStringLiteral("model"), QStringLiteral("request"), false);
    if (!model)
        return std::unexpected(model.error());
    req.model = *model;

    // System prompt is top-level in the canonical format
    if (root.contains(QStringLiteral("system"))) {
        bool shorthand = false;
        auto blocks = decodeContent(root.value(QStringLiteral("system")), shorthand,
                                    QStringLiteral("system"));
        if (!blocks)
            return std::unexpected(blocks.error());
        for (const ContentBlock& b : *blocks) {
            if (b.kind != BlockKind::Text)
                return std::unexpected(Failure::schemaViolation(
                    QStringLiteral("non_text_system"),
                    QStringLiteral("System prompt may only contain text blocks")));
        }
        req.system = SystemPrompt{*blocks, shorthand};
    }

    const QJsonValue msgs = root.value(QStringLiteral("messages"));
    if (!msgs.isArray())
        return std::unexpected(Failure::schemaViolation(
            QStringLiteral("missing_messages"), QStringLiteral("request.messages must be an array")));
    for (const QJsonValue& mv : msgs.toArray()) {
        auto message = decodeMessage(mv.toObject());
        if (!message)
            return std::unexpected(message.error());
        req.messages.append(*message);
    }

    if (root.contains(QStringLiteral("tools"))) {
        QList<ToolDefinition> tools;
        for (const QJsonValue& tv : root.value(QStringLiteral("tools")).toArray()) {
            auto tool = decodeTool(tv.toObject());
            if (!tool)
                return std::unexpected(tool.error());
            tools.append(*tool);
        }
        req.tools = tools;
    }

    if (root.contains(QStringLiteral("tool_choice"))) {
        auto choice = decodeToolChoice(root.value(QStringLiteral("tool_choice")).toObject());
        if (!choice)
            return std::unexpected(choice.error());
        req.toolChoice = *choice;
    }

    if (root.contains(QStringLiteral("thinking"))) {
        auto thinking = decodeThinking(root.value(QStringLiteral("thinking")).toObject(),
                                       root.value(QStringLiteral("output_config")).toObject());
        if (!thinking)
            return std::unexpected(thinking.error());
        req.thinking = *thinking;
    }

    auto maxTokens = readInteger(root, QStringLiteral("max_tokens"), QStringLiteral("request"));
    if (!maxTokens)
        return std::unexpected(maxTokens.error());
    if (maxTokens->has_value())
        req.sampling.maxTokens = static_cast<int>(**maxTokens);

    auto topK = readInteger(root, QStringLiteral("top_k"), QStringLiteral("request"));
    if (!topK)
        return std::unexpected(topK.error());
    if (topK->has_value())
        req.sampling.topK = static_cast<int>(**topK);

    auto temperature = readNumber(root, QStringLiteral("temperature"), QStringLiteral("request"));
    if (!temperature)
        return std::unexpected(temperature.error());
    req.sampling.temperature = *temperature;

    auto topP = readNumber(root, QStringLiteral("top_p"), QStringLiteral("request"));
    if (!topP)
        return std::unexpected(topP.error());
    req.sampling.topP = *topP;

    for (const QJsonValue& sv : root.value(QStringLiteral("stop_sequences")).toArray())
        req.sampling.stopSequences.append(sv.toString());

    const QJsonValue stream = root.value(QStringLiteral("stream"));
    if (stream.isBool())
        req.stream = stream.toBool();
    else if (!stream.isUndefined() && !stream.isNull())
        return std::unexpected(wrongType(QStringLiteral("request.stream"), QStringLiteral("a boolean")));

    const QJsonValue metadata = root.value(QStringLiteral("metadata"));
    if (metadata.isObject()) {
        RequestMetadata meta;
        if (metadata.toObject().contains(QStringLiteral("user_id"))) {
            auto userId = readString(metadata.toObject(), QStringLiteral("user_id"),
                                     QStringLiteral("metadata"), false);
            if (!userId)
                return std::unexpected(userId.error());
            meta.userId = *userId;
        }
        req.metadata = meta;
    } else if (!metadata.isUndefined() && !metadata.isNull()) {
        return std::unexpected(wrongType(QStringLiteral("request.metadata"), QStringLiteral("an object")));
    }
    return req;
}

// ---------------------------------------------------------------------------
// Responses
// ---------------------------------------------------------------------------

QJsonObject CanonicalCodec::encodeUsage(const Usage& usage)
{
    QJsonObject obj;
    obj[QStringLiteral("input_tokens")] = usage.inputTokens;
    obj[QStringLiteral("output_tokens")] = usage.outputTokens;
    if (usage.cacheCreationInputTokens.has_value())
        obj[QStringLiteral("cache_creation_input_tokens")] = *usage.cacheCreationInputTokens;
    if (usage.cacheReadInputTokens.has_value())
        obj[QStringLiteral("cache_read_input_tokens")] = *usage.cacheReadInputTokens;
    return obj;
}

Usage CanonicalCodec::decodeUsage(const QJsonObject& obj)
{
    Usage usage;
    usage.inputTokens = obj.value(QStringLiteral("input_tokens")).toInteger();
    usage.outputTokens = obj.value(QStringLiteral("output_tokens")).toInteger();
    const QJsonValue creation = obj.value(QStringLiteral("cache_creation_input_tokens"));
    if (creation.isDouble())
        usage.cacheCreationInputTokens = creation.toInteger();
    const QJsonValue read = obj.value(QStringLiteral("cache_read_input_tokens"));
    if (read.isDouble())
        usage.cacheReadInputTokens = read.toInteger();
    return usage;
}

QJsonObject CanonicalCodec::encodeResponse(const ChatResponse& response)
{
    QJsonObject root;
    root[QStringLiteral("id")] = response.id;
    root[QStringLiteral("type")] = QStringLiteral("message");
    root[QStringLiteral("role")] = QStringLiteral("assistant");
    root[QStringLiteral("model")] = response.model;

    QJsonArray content;
    for (const ContentBlock& b : response.content)
        content.append(encodeBlock(b));
    root[QStringLiteral("content")] = content;

    const QString stop = StopReasons::toAnthropic(response.stopReason, response.rawStopReason);
    root[QStringLiteral("stop_reason")] = stop.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(stop);
    root[QStringLiteral("stop_sequence")] = response.stopSequence.has_value()
        ? QJsonValue(*response.stopSequence) : QJsonValue(QJsonValue::Null);

    if (response.usage.has_value())
        root[QStringLiteral("usage")] = encodeUsage(*response.usage);
    return root;
}

Result<ChatResponse> CanonicalCodec::decodeResponse(const QByteArray& body)
{
    auto root = parseObject(body, QStringLiteral("Response body"));
    if (!root)
        return std::unexpected(root.error());
    return decodeResponse(*root);
}

Result<ChatResponse> CanonicalCodec::decodeResponse(const QJsonObject& root)
{
    const QString type = root.value(QStringLiteral("type")).toString(QStringLiteral("message"));
    if (type != QStringLiteral("message"))
        return std::unexpected(Failure::schemaViolation(
            QStringLiteral("unexpected_type"),
            QStringLiteral("Expected a message object, got '%1'").arg(type)));

    ChatResponse resp;
    resp.id = root.value(QStringLiteral("id")).toString();
    resp.model = root.value(QStringLiteral("model")).toString();

    const QJsonValue content = root.value(QStringLiteral("content"));
    if (!content.isArray())
        return std::unexpected(Failure::schemaViolation(
            QStringLiteral("missing_content"), QStringLiteral("response.content must be an array")));
    for (const QJsonValue& bv : content.toArray()) {
        auto block = decodeBlock(bv.toObject());
        if (!block)
            return std::unexpected(block.error());
        resp.content.append(*block);
    }

    const QJsonValue stop = root.value(QStringLiteral("stop_reason"));
    if (stop.isString()) {
        resp.stopReason = StopReasons::fromAnthropic(stop.toString(), &resp.rawStopReason);
    } else {
        resp.stopReason = StopReason::Other;
        resp.rawStopReason.clear();
    }

    const QJsonValue stopSequence = root.value(QStringLiteral("stop_sequence"));
    if (stopSequence.isString())
        resp.stopSequence = stopSequence.toString();

    if (root.value(QStringLiteral("usage")).isObject())
        resp.usage = decodeUsage(root.value(QStringLiteral("usage")).toObject());
    return resp;
}

// ---------------------------------------------------------------------------
// Embeddings
// ---------------------------------------------------------------------------

QJsonObject CanonicalCodec::encodeEmbeddingRequest(const EmbeddingRequest& request)
{
    QJsonObject body;
    body[QStringLiteral("model")] = request.model;
    if (request.singleInput && request.input.size() == 1)
        body[QStringLiteral("input")] = request.input.first();
    else
        body[QStringLiteral("input")] = QJsonArray::fromStringList(request.input);
    return body;
}

Result<EmbeddingRequest> CanonicalCodec::decodeEmbeddingRequest(const QJsonObject& root)
{
    EmbeddingRequest req;
    req.model = root.value(QStringLiteral("model")).toString();
    const QJsonValue input = root.value(QStringLiteral("input"));
    if (input.isString()) {
        req.input.append(input.toString());
        req.singleInput = true;
    } else if (input.isArray()) {
        for (const QJsonValue& v : input.toArray()) {
            if (!v.isString())
                return std::unexpected(Failure::unsupportedConstruct(
                    QStringLiteral("token_input"),
                    QStringLiteral("Only string embedding inputs are supported")));
            req.input.append(v.toString());
        }
    } else {
        return std::unexpected(wrongType(QStringLiteral("input"), QStringLiteral("a string or an array")));
    }
    return req;
}

QJsonObject CanonicalCodec::encodeEmbeddingResponse(const EmbeddingResponse& response)
{
    QJsonObject root;
    root[QStringLiteral("object")] = QStringLiteral("list");
    QJsonArray data;
    for (int i = 0; i < response.vectors.size(); ++i) {
        QJsonArray values;
        for (float f : response.vectors[i])
            values.append(static_cast<double>(f));
        QJsonObject item;
        item[QStringLiteral("object")] = QStringLiteral("embedding");
        item[QStringLiteral("index")] = i;
        item[QStringLiteral("embedding")] = values;
        data.append(item);
    }
    root[QStringLiteral("data")] = data;
    root[QStringLiteral("model")] = response.model;
    if (response.usage.has_value()) {
        QJsonObject usage;
        usage[QStringLiteral("prompt_tokens")] = response.usage->promptTokens;
        usage[QStringLiteral("total_tokens")] = response.usage->totalTokens;
        root[QStringLiteral("usage")] = usage;
    }
    return root;
}

Result<EmbeddingResponse> CanonicalCodec::decodeEmbeddingResponse(const QJsonObject& root)
{
    const QJsonValue dataVal = root.value(QStringLiteral("data"));
    if (!dataVal.isArray())
        return std::unexpected(Failure::schemaViolation(
            QStringLiteral("missing_data"), QStringLiteral("Embedding response has no data array")));

    struct Indexed { qint64 index; QList<float> vector; };
    QList<Indexed> items;
    for (const QJsonValue& iv : dataVal.toArray()) {
        const QJsonObject item = iv.toObject();
        const QJsonValue embedding = item.value(QStringLiteral("embedding"));
        if (!embedding.isArray())
            return std::unexpected(Failure::unsupportedConstruct(
                QStringLiteral("non_float_embedding"),
                QStringLiteral("Only float-array embeddings are supported")));
        Indexed entry;
        entry.index = item.value(QStringLiteral("index")).toInteger(items.size());
        for (const QJsonValue& v : embedding.toArray())
            entry.vector.append(static_cast<float>(v.toDouble()));
        items.append(entry);
    }

    std::stable_sort(items.begin(), items.end(),
                     [](const Indexed& a, const Indexed& b) { return a.index < b.index; });
    EmbeddingResponse resp;
    for (int i = 0; i < items.size(); ++i) {
        if (items[i].index != i)
            return std::unexpected(Failure::malformedInput(
                QStringLiteral("embedding_index_gap"),
                QStringLiteral("Embedding indices are not a dense 0..%1 range").arg(items.size() - 1)));
        resp.vectors.append(items[i].vector);
    }

    resp.model = root.value(QStringLiteral("model")).toString();
    const QJsonValue usage = root.value(QStringLiteral("usage"));
    if (usage.isObject()) {
        EmbeddingUsage u;
        u.promptTokens = usage.toObject().value(QStringLiteral("prompt_tokens")).toInteger();
        u.totalTokens = usage.toObject().value(QStringLiteral("total_tokens")).toInteger();
        resp.usage = u;
    }
    return resp;
}
