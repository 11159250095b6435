#pragma once
#include "content_block.h"
#include <QString>
#include <QJsonObject>
#include <optional>

struct ToolDefinition {
    QString name;
    std::optional<QString> description;
    QJsonObject inputSchema;
    std::optional<CacheMarker> cacheControl;

    bool operator==(const ToolDefinition&) const = default;

    static ToolDefinition create(const QString& name, const QString& description,
                                 const QJsonObject& inputSchema) {
        ToolDefinition tool{name, std::nullopt, inputSchema, std::nullopt};
        if (!description.isEmpty())
            tool.description = description;
        return tool;
    }
};

struct ToolChoice {
    ToolChoiceMode mode = ToolChoiceMode::Auto;
    QString toolName;                       // Tool mode only
    std::optional<bool> disableParallelToolUse;

    bool operator==(const ToolChoice&) const = default;

    static ToolChoice autoChoice() { return {ToolChoiceMode::Auto, {}, std::nullopt}; }
    static ToolChoice any() { return {ToolChoiceMode::Any, {}, std::nullopt}; }
    static ToolChoice none() { return {ToolChoiceMode::None, {}, std::nullopt}; }
    static ToolChoice tool(const QString& name) { return {ToolChoiceMode::Tool, name, std::nullopt}; }
};
