#include "validate.h"
#include <QSet>

namespace Validate {

bool isValidToolName(const QString& name)
{
    if (name.isEmpty() || name.size() > kMaxToolNameLength)
        return false;
    for (const QChar c : name) {
        const ushort u = c.unicode();
        const bool ok = (u >= 'a' && u <= 'z') || (u >= 'A' && u <= 'Z')
                        || (u >= '0' && u <= '9') || u == '_' || u == '-';
        if (!ok)
            return false;
    }
    return true;
}

VoidResult toolName(const QString& name)
{
    if (!isValidToolName(name))
        return std::unexpected(Failure::schemaViolation(
            QStringLiteral("invalid_tool_name"),
            QStringLiteral("工具名 '%1' 必须匹配 [A-Za-z0-9_-]{1,%2}")
                .arg(name).arg(kMaxToolNameLength)));
    return {};
}

VoidResult toolDefinition(const ToolDefinition& tool)
{
    if (auto r = toolName(tool.name); !r)
        return r;
    if (tool.inputSchema.isEmpty())
        return std::unexpected(Failure::schemaViolation(
            QStringLiteral("missing_input_schema"),
            QStringLiteral("工具 '%1' 缺少 input_schema").arg(tool.name)));
    return {};
}

VoidResult thinking(const ThinkingConfig& config, std::optional<int> maxTokens)
{
    if (config.mode != ThinkingMode::ManualBudget)
        return {};
    if (config.budgetTokens < kMinThinkingBudget)
        return std::unexpected(Failure::schemaViolation(
            QStringLiteral("thinking_budget_too_small"),
            QStringLiteral("思考预算 %1 低于最小值 %2")
                .arg(config.budgetTokens).arg(kMinThinkingBudget)));
    if (maxTokens.has_value() && config.budgetTokens >= *maxTokens)
        return std::unexpected(Failure::schemaViolation(
            QStringLiteral("thinking_budget_exceeds_max_tokens"),
            QStringLiteral("思考预算 %1 必须小于 max_tokens %2")
                .arg(config.budgetTokens).arg(*maxTokens)));
    return {};
}

VoidResult message(const Message& msg, int index)
{
    if (msg.role == Role::System)
        return std::unexpected(Failure::schemaViolation(
            QStringLiteral("system_role_message"),
            QStringLiteral("messages[%1]: system 内容应放在 system 字段").arg(index)));
    if (msg.content.isEmpty())
        return std::unexpected(Failure::schemaViolation(
            QStringLiteral("empty_message"),
            QStringLiteral("messages[%1] 没有内容块").arg(index)));

    for (const ContentBlock& b : msg.content) {
        if (b.kind == BlockKind::ToolResult && msg.role != Role::User)
            return std::unexpected(Failure::schemaViolation(
                QStringLiteral("tool_result_outside_user"),
                QStringLiteral("messages[%1]: tool_result 只能出现在 user 消息中").arg(index)));
        if ((b.kind == BlockKind::ToolUse || b.kind == BlockKind::Thinking
             || b.kind == BlockKind::RedactedThinking) && msg.role != Role::Assistant)
            return std::unexpected(Failure::schemaViolation(
                QStringLiteral("assistant_block_outside_assistant"),
                QStringLiteral("messages[%1]: tool_use 和 thinking 只能出现在 assistant 消息中")
                    .arg(index)));
        if ((b.kind == BlockKind::ToolUse || b.kind == BlockKind::ToolResult) && b.toolCallId.isEmpty())
            return std::unexpected(Failure::schemaViolation(
                QStringLiteral("missing_tool_call_id"),
                QStringLiteral("messages[%1]: 工具块缺少 id").arg(index)));
    }
    return {};
}

VoidResult request(const ChatRequest& req)
{
    if (req.model.isEmpty())
        return std::unexpected(Failure::schemaViolation(
            QStringLiteral("empty_model"), QStringLiteral("请求模型不能为空")));
    if (req.messages.isEmpty())
        return std::unexpected(Failure::schemaViolation(
            QStringLiteral("empty_messages"), QStringLiteral("请求消息列表不能为空")));

    for (int i = 0; i < req.messages.size(); ++i) {
        if (auto r = message(req.messages[i], i); !r)
            return r;
    }

    if (req.system.has_value()) {
        for (const ContentBlock& b : req.system->blocks) {
            if (b.kind != BlockKind::Text)
                return std::unexpected(Failure::schemaViolation(
                    QStringLiteral("non_text_system"),
                    QStringLiteral("system 提示只能包含文本块")));
        }
    }

    QSet<QString> names;
    if (req.tools.has_value()) {
        for (const ToolDefinition& tool : *req.tools) {
            if (auto r = toolDefinition(tool); !r)
                return r;
            if (names.contains(tool.name))
                return std::unexpected(Failure::schemaViolation(
                    QStringLiteral("duplicate_tool_name"),
                    QStringLiteral("工具名 '%1' 重复定义").arg(tool.name)));
            names.insert(tool.name);
        }
    }

    if (req.toolChoice.has_value() && req.toolChoice->mode == ToolChoiceMode::Tool
        && !names.contains(req.toolChoice->toolName))
        return std::unexpected(Failure::schemaViolation(
            QStringLiteral("unknown_tool_choice"),
            QStringLiteral("tool_choice 指定了未定义的工具 '%1'").arg(req.toolChoice->toolName)));

    if (req.thinking.has_value()) {
        if (auto r = thinking(*req.thinking, req.sampling.maxTokens); !r)
            return r;
    }
    return {};
}

VoidResult response(const ChatResponse& resp)
{
    for (const ContentBlock& b : resp.content) {
        if (b.kind == BlockKind::ToolResult)
            return std::unexpected(Failure::schemaViolation(
                QStringLiteral("tool_result_in_response"),
                QStringLiteral("响应中不应包含 tool_result")));
    }
    return {};
}

VoidResult embeddingRequest(const EmbeddingRequest& req)
{
    if (req.model.isEmpty())
        return std::unexpected(Failure::schemaViolation(
            QStringLiteral("empty_model"), QStringLiteral("嵌入模型不能为空")));
    if (req.input.isEmpty())
        return std::unexpected(Failure::schemaViolation(
            QStringLiteral("empty_input"), QStringLiteral("嵌入输入不能为空")));
    return {};
}

}
