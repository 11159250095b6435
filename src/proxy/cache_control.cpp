#include "cache_control.h"
#include "core/log_manager.h"

namespace CacheControl {

namespace {

struct Position {
    enum class Area { Tool, System, Message } area;
    int index = -1;         // tool / system block / message index
    int block = -1;         // block index inside a message

    bool operator==(const Position&) const = default;
};

int lastMarkable(const QList<ContentBlock>& blocks)
{
    for (int i = static_cast<int>(blocks.size()) - 1; i >= 0; --i) {
        if (blocks[i].acceptsCacheMarker())
            return i;
    }
    return -1;
}

std::optional<Position> messagePosition(const ChatRequest& request, int messageIndex)
{
    if (messageIndex < 0 || messageIndex >= request.messages.size())
        return std::nullopt;
    const int block = lastMarkable(request.messages[messageIndex].content);
    if (block < 0)
        return std::nullopt;
    return Position{Position::Area::Message, messageIndex, block};
}

std::optional<Position> resolve(const ChatRequest& request, const CacheTarget& target)
{
    switch (target.kind) {
    case CacheTarget::Kind::Tools:
        if (!request.hasTools())
            return std::nullopt;
        return Position{Position::Area::Tool, static_cast<int>(request.tools->size()) - 1, -1};
    case CacheTarget::Kind::System: {
        if (!request.system.has_value() || request.system->isEmpty())
            return std::nullopt;
        return Position{Position::Area::System, static_cast<int>(request.system->blocks.size()) - 1, -1};
    }
    case CacheTarget::Kind::MessageFromEnd:
        if (target.fromEnd < 1)
            return std::nullopt;
        return messagePosition(request, static_cast<int>(request.messages.size()) - target.fromEnd);
    case CacheTarget::Kind::UserTurnFromEnd: {
        int seen = 0;
        for (int i = static_cast<int>(request.messages.size()) - 1; i >= 0; --i) {
            if (request.messages[i].role != Role::User)
                continue;
            if (++seen == target.fromEnd)
                return messagePosition(request, i);
        }
        return std::nullopt;
    }
    }
    return std::nullopt;
}

bool isMarked(const ChatRequest& request, const Position& pos)
{
    switch (pos.area) {
    case Position::Area::Tool:    return (*request.tools)[pos.index].cacheControl.has_value();
    case Position::Area::System:  return request.system->blocks[pos.index].cacheControl.has_value();
    case Position::Area::Message: return request.messages[pos.index].content[pos.block].cacheControl.has_value();
    }
    return false;
}

void mark(ChatRequest& request, const Position& pos, const CacheMarker& marker)
{
    switch (pos.area) {
    case Position::Area::Tool:
        (*request.tools)[pos.index].cacheControl = marker;
        break;
    case Position::Area::System:
        request.system->blocks[pos.index].cacheControl = marker;
        break;
    case Position::Area::Message:
        request.messages[pos.index].content[pos.block].cacheControl = marker;
        break;
    }
}

}

int countMarkers(const ChatRequest& request)
{
    int count = 0;
    if (request.tools.has_value()) {
        for (const ToolDefinition& tool : *request.tools)
            count += tool.cacheControl.has_value() ? 1 : 0;
    }
    if (request.system.has_value()) {
        for (const ContentBlock& b : request.system->blocks)
            count += b.cacheControl.has_value() ? 1 : 0;
    }
    for (const Message& m : request.messages) {
        for (const ContentBlock& b : m.content)
            count += b.cacheControl.has_value() ? 1 : 0;
    }
    return count;
}

VoidResult apply(ChatRequest& request, const CachePlacement& placement)
{
    if (placement.maxBreakpoints < 1 || placement.maxBreakpoints > kProviderBreakpointLimit) {
        return std::unexpected(Failure::configuration(
            ErrorKind::InvalidConfig, QStringLiteral("invalid_breakpoint_limit"),
            QStringLiteral("Breakpoint limit must be between 1 and %1").arg(kProviderBreakpointLimit)));
    }

    QList<Position> positions;
    for (const CacheTarget& target : placement.targets) {
        const std::optional<Position> pos = resolve(request, target);
        if (!pos.has_value()) {
            LOG_DEBUG(QStringLiteral("cache"), QStringLiteral("cache target not present in request, skipped"));
            continue;
        }
        if (!positions.contains(*pos))
            positions.append(*pos);
    }

    int newMarkers = 0;
    for (const Position& pos : positions)
        newMarkers += isMarked(request, pos) ? 0 : 1;
    const int total = countMarkers(request) + newMarkers;
    if (total > placement.maxBreakpoints)
        return std::unexpected(Failure::breakpointLimitExceeded(total, placement.maxBreakpoints));

    CacheMarker marker;
    marker.ttl = placement.ttl;
    for (const Position& pos : positions)
        mark(request, pos, marker);
    return {};
}

}
