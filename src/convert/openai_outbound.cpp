#include "openai_outbound.h"
#include "thinking_mapping.h"
#include "canonical/codec.h"
#include "canonical/stop_reason.h"
#include "core/log_manager.h"
#include <QJsonDocument>

namespace {

const QString kLogCategory = QStringLiteral("convert");

QJsonObject textPart(const QString& text)
{
    QJsonObject part;
    part[QStringLiteral("type")] = QStringLiteral("text");
    part[QStringLiteral("text")] = text;
    return part;
}

}

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------

Result<QJsonObject> OpenAIOutbound::encodeRequest(const ChatRequest& request,
                                                  const ConversionOptions& options)
{
    QJsonObject body;
    body[QStringLiteral("model")] = request.model;

    auto messages = buildMessages(request);
    if (!messages)
        return std::unexpected(messages.error());
    body[QStringLiteral("messages")] = *messages;

    if (request.tools.has_value())
        body[QStringLiteral("tools")] = buildToolDefs(*request.tools);

    if (request.toolChoice.has_value()) {
        body[QStringLiteral("tool_choice")] = buildToolChoice(*request.toolChoice);
        if (request.toolChoice->disableParallelToolUse.value_or(false))
            body[QStringLiteral("parallel_tool_calls")] = false;
    }

    if (request.thinking.has_value()) {
        const auto effort = ThinkingMapping::toReasoningEffort(*request.thinking);
        if (effort.has_value() && options.dialect.supportsReasoningEffort) {
            body[QStringLiteral("reasoning_effort")] = *effort;
        } else if (effort.has_value()) {
            LOG_DEBUG(kLogCategory, QStringLiteral("target has no reasoning_effort, thinking config dropped"));
        }
    }

    buildSampling(body, request.sampling, options.dialect);

    if (request.stream.has_value())
        body[QStringLiteral("stream")] = *request.stream;
    if (!request.userId().isEmpty())
        body[QStringLiteral("user")] = request.userId();
    return body;
}

Result<QJsonArray> OpenAIOutbound::buildMessages(const ChatRequest& request)
{
    QJsonArray messages;

    if (request.system.has_value() && !request.system->isEmpty()) {
        const SystemPrompt& system = *request.system;
        QJsonObject msg;
        msg[QStringLiteral("role")] = QStringLiteral("system");
        if (system.textShorthand && system.blocks.size() == 1) {
            msg[QStringLiteral("content")] = system.blocks.first().text;
        } else {
            QJsonArray parts;
            for (const ContentBlock& b : system.blocks)
                parts.append(textPart(b.text));
            msg[QStringLiteral("content")] = parts;
        }
        messages.append(msg);
    }

    for (int i = 0; i < request.messages.size(); ++i) {
        const Message& message = request.messages[i];
        if (message.content.isEmpty())
            return std::unexpected(Failure::schemaViolation(
                QStringLiteral("empty_message"),
                QStringLiteral("messages[%1] has no content blocks").arg(i)));
        if (message.role == Role::Assistant) {
            auto msg = buildAssistantMessage(message);
            if (!msg)
                return std::unexpected(msg.error());
            if (!msg->isEmpty())
                messages.append(*msg);
            continue;
        }
        if (message.role != Role::User) {
            return std::unexpected(Failure::schemaViolation(
                QStringLiteral("system_role_message"),
                QStringLiteral("System instructions belong in the system prompt, not in messages")));
        }

        // Tool results become tool-role messages; the text around them is kept in order.
        QJsonArray pending;
        const auto flush = [&]() {
            if (pending.isEmpty())
                return;
            QJsonObject msg;
            msg[QStringLiteral("role")] = QStringLiteral("user");
            if (message.textShorthand && pending.size() == 1
                && pending.first().toObject().value(QStringLiteral("type")).toString() == QStringLiteral("text")) {
                msg[QStringLiteral("content")] = pending.first().toObject().value(QStringLiteral("text"));
            } else {
                msg[QStringLiteral("content")] = pending;
            }
            messages.append(msg);
            pending = QJsonArray();
        };

        for (const ContentBlock& block : message.content) {
            if (block.kind == BlockKind::ToolResult) {
                flush();
                messages.append(buildToolMessage(block));
                continue;
            }
            auto part = buildUserPart(block);
            if (!part)
                return std::unexpected(part.error());
            pending.append(*part);
        }
        flush();
    }
    return messages;
}

Result<QJsonObject> OpenAIOutbound::buildUserPart(const ContentBlock& block)
{
    switch (block.kind) {
    case BlockKind::Text:
        return textPart(block.text);
    case BlockKind::Image: {
        QJsonObject imageUrl;
        if (block.image.kind == ImageSourceKind::Base64) {
            imageUrl[QStringLiteral("url")] = QStringLiteral("data:%1;base64,%2")
                                                  .arg(block.image.mediaType, block.image.data);
        } else {
            imageUrl[QStringLiteral("url")] = block.image.url;
        }
        QJsonObject part;
        part[QStringLiteral("type")] = QStringLiteral("image_url");
        part[QStringLiteral("image_url")] = imageUrl;
        return part;
    }
    default:
        break;
    }
    return std::unexpected(Failure::schemaViolation(
        QStringLiteral("invalid_user_block"),
        QStringLiteral("User messages may only carry text, image and tool_result blocks")));
}

QJsonObject OpenAIOutbound::buildToolMessage(const ContentBlock& result)
{
    QJsonObject msg;
    msg[QStringLiteral("role")] = QStringLiteral("tool");
    msg[QStringLiteral("tool_call_id")] = result.toolCallId;
    if (result.resultAsBlocks) {
        QJsonArray parts;
        for (const QString& text : result.resultParts)
            parts.append(textPart(text));
        msg[QStringLiteral("content")] = parts;
    } else {
        msg[QStringLiteral("content")] = result.resultText();
    }
    if (result.isError.has_value())
        msg[QStringLiteral("is_error")] = *result.isError;
    return msg;
}

Result<QJsonObject> OpenAIOutbound::buildAssistantMessage(const Message& message)
{
    QStringList texts;
    QList<ContentBlock> toolUses;
    for (const ContentBlock& block : message.content) {
        switch (block.kind) {
        case BlockKind::Text:
            texts.append(block.text);
            break;
        case BlockKind::ToolUse:
            toolUses.append(block);
            break;
        case BlockKind::Thinking:
        case BlockKind::RedactedThinking:
            break;
        case BlockKind::Image:
            return std::unexpected(Failure::unsupportedConstruct(
                QStringLiteral("assistant_image"),
                QStringLiteral("Assistant images have no chat-completions equivalent")));
        case BlockKind::ToolResult:
            return std::unexpected(Failure::schemaViolation(
                QStringLiteral("invalid_assistant_block"),
                QStringLiteral("tool_result blocks belong in user messages")));
        }
    }

    // Nothing left once thinking is dropped
    if (texts.isEmpty() && toolUses.isEmpty()) {
        LOG_DEBUG(kLogCategory, QStringLiteral("omitting thinking-only assistant message"));
        return QJsonObject();
    }

    QJsonObject msg;
    msg[QStringLiteral("role")] = QStringLiteral("assistant");
    if (texts.isEmpty()) {
        msg[QStringLiteral("content")] = QJsonValue::Null;
    } else if (texts.size() == 1 && (message.textShorthand || !toolUses.isEmpty())) {
        msg[QStringLiteral("content")] = texts.first();
    } else {
        QJsonArray parts;
        for (const QString& text : texts)
            parts.append(textPart(text));
        msg[QStringLiteral("content")] = parts;
    }
    if (!toolUses.isEmpty())
        msg[QStringLiteral("tool_calls")] = buildToolCalls(toolUses);
    return msg;
}

QJsonArray OpenAIOutbound::buildToolCalls(const QList<ContentBlock>& toolUses)
{
    QJsonArray arr;
    for (const ContentBlock& use : toolUses) {
        QJsonObject fn;
        fn[QStringLiteral("name")] = use.toolName;
        fn[QStringLiteral("arguments")] = QString::fromUtf8(
            QJsonDocument(use.input.toObject()).toJson(QJsonDocument::Compact));

        QJsonObject tc;
        tc[QStringLiteral("id")] = use.toolCallId;
        tc[QStringLiteral("type")] = QStringLiteral("function");
        tc[QStringLiteral("function")] = fn;
        arr.append(tc);
    }
    return arr;
}

QJsonArray OpenAIOutbound::buildToolDefs(const QList<ToolDefinition>& tools)
{
    QJsonArray arr;
    for (const ToolDefinition& tool : tools) {
        QJsonObject fn;
        fn[QStringLiteral("name")] = tool.name;
        if (tool.description.has_value())
            fn[QStringLiteral("description")] = *tool.description;
        fn[QStringLiteral("parameters")] = tool.inputSchema;

        QJsonObject toolObj;
        toolObj[QStringLiteral("type")] = QStringLiteral("function");
        toolObj[QStringLiteral("function")] = fn;
        arr.append(toolObj);
    }
    return arr;
}

QJsonValue OpenAIOutbound::buildToolChoice(const ToolChoice& choice)
{
    switch (choice.mode) {
    case ToolChoiceMode::Auto: return QStringLiteral("auto");
    case ToolChoiceMode::Any:  return QStringLiteral("required");
    case ToolChoiceMode::None: return QStringLiteral("none");
    case ToolChoiceMode::Tool: {
        QJsonObject fn;
        fn[QStringLiteral("name")] = choice.toolName;
        QJsonObject obj;
        obj[QStringLiteral("type")] = QStringLiteral("function");
        obj[QStringLiteral("function")] = fn;
        return obj;
    }
    }
    return QStringLiteral("auto");
}

void OpenAIOutbound::buildSampling(QJsonObject& body, const SamplingParams& sampling,
                                   const AlternateDialect& dialect)
{
    if (sampling.maxTokens.has_value()) {
        body[dialect.useMaxCompletionTokens ? QStringLiteral("max_completion_tokens")
                                            : QStringLiteral("max_tokens")] = *sampling.maxTokens;
    }
    if (sampling.temperature.has_value())
        body[QStringLiteral("temperature")] = *sampling.temperature;
    if (sampling.topP.has_value())
        body[QStringLiteral("top_p")] = *sampling.topP;
    if (sampling.topK.has_value())
        LOG_DEBUG(kLogCategory, QStringLiteral("top_k has no chat-completions field, dropped"));
    if (!sampling.stopSequences.isEmpty())
        body[QStringLiteral("stop")] = QJsonArray::fromStringList(sampling.stopSequences);
}

// ---------------------------------------------------------------------------
// Responses
// ---------------------------------------------------------------------------

QJsonObject OpenAIOutbound::buildUsage(const Usage& usage)
{
    QJsonObject obj;
    obj[QStringLiteral("prompt_tokens")] = usage.inputTokens;
    obj[QStringLiteral("completion_tokens")] = usage.outputTokens;
    obj[QStringLiteral("total_tokens")] = usage.totalTokens();
    if (usage.thinkingTokens.has_value()) {
        QJsonObject details;
        details[QStringLiteral("reasoning_tokens")] = *usage.thinkingTokens;
        obj[QStringLiteral("completion_tokens_details")] = details;
    }
    if (usage.cacheReadInputTokens.has_value()) {
        QJsonObject details;
        details[QStringLiteral("cached_tokens")] = *usage.cacheReadInputTokens;
        obj[QStringLiteral("prompt_tokens_details")] = details;
    }
    return obj;
}

Result<QJsonObject> OpenAIOutbound::encodeResponse(const ChatResponse& response,
                                                   const ConversionOptions& options)
{
    QString text;
    bool hasText = false;
    QList<ContentBlock> toolUses;
    for (const ContentBlock& block : response.content) {
        switch (block.kind) {
        case BlockKind::Text:
            text += block.text;
            hasText = true;
            break;
        case BlockKind::ToolUse:
            toolUses.append(block);
            break;
        case BlockKind::Thinking:
        case BlockKind::RedactedThinking:
            break;
        case BlockKind::Image:
            return std::unexpected(Failure::unsupportedConstruct(
                QStringLiteral("response_image"),
                QStringLiteral("Image output has no chat-completions equivalent")));
        case BlockKind::ToolResult:
            return std::unexpected(Failure::schemaViolation(
                QStringLiteral("invalid_response_block"),
                QStringLiteral("A response cannot carry tool_result blocks")));
        }
    }

    QJsonObject message;
    message[QStringLiteral("role")] = QStringLiteral("assistant");
    message[QStringLiteral("content")] = hasText ? QJsonValue(text) : QJsonValue(QJsonValue::Null);
    if (!toolUses.isEmpty())
        message[QStringLiteral("tool_calls")] = buildToolCalls(toolUses);

    QJsonObject choice;
    choice[QStringLiteral("index")] = 0;
    choice[QStringLiteral("message")] = message;
    const QString finish = StopReasons::toOpenAI(response.stopReason, response.rawStopReason);
    choice[QStringLiteral("finish_reason")] = finish.isEmpty() ? QJsonValue(QJsonValue::Null)
                                                               : QJsonValue(finish);

    QJsonObject root;
    root[QStringLiteral("id")] = response.id;
    root[QStringLiteral("object")] = QStringLiteral("chat.completion");
    if (options.createdAt.has_value())
        root[QStringLiteral("created")] = *options.createdAt;
    root[QStringLiteral("model")] = response.model;
    root[QStringLiteral("choices")] = QJsonArray{choice};
    if (response.usage.has_value())
        root[QStringLiteral("usage")] = buildUsage(*response.usage);
    return root;
}

QJsonObject OpenAIOutbound::encodeEmbeddingRequest(const EmbeddingRequest& request)
{
    return CanonicalCodec::encodeEmbeddingRequest(request);
}
