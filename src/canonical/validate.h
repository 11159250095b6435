#pragma once
#include "request.h"
#include "response.h"
#include "embedding.h"
#include "result.h"

namespace Validate {
    constexpr int kMaxToolNameLength = 64;

    bool isValidToolName(const QString& name);

    VoidResult toolName(const QString& name);
    VoidResult toolDefinition(const ToolDefinition& tool);
    VoidResult thinking(const ThinkingConfig& config, std::optional<int> maxTokens);
    VoidResult message(const Message& msg, int index);
    VoidResult request(const ChatRequest& req);
    VoidResult response(const ChatResponse& resp);
    VoidResult embeddingRequest(const EmbeddingRequest& req);
}
