#pragma once
#include "canonical/request.h"
#include "canonical/result.h"
#include <QList>
#include <QString>

// Where a prompt-cache breakpoint goes.
struct CacheTarget {
    enum class Kind { Tools, System, MessageFromEnd, UserTurnFromEnd };

    Kind kind = Kind::System;
    int fromEnd = 1;    // 1 = last message / last user turn

    bool operator==(const CacheTarget&) const = default;

    static CacheTarget tools() { return {Kind::Tools, 1}; }
    static CacheTarget system() { return {Kind::System, 1}; }
    static CacheTarget messageFromEnd(int n) { return {Kind::MessageFromEnd, n}; }
    static CacheTarget userTurnFromEnd(int n) { return {Kind::UserTurnFromEnd, n}; }
};

struct CachePlacement {
    QList<CacheTarget> targets;
    QString ttl;                    // empty = provider default (5m)
    int maxBreakpoints = 4;

    // Last system block and the last block of the second-to-last message.
    static CachePlacement defaults() {
        return CachePlacement{{CacheTarget::system(), CacheTarget::messageFromEnd(2)}, {}, 4};
    }
};

namespace CacheControl {
    constexpr int kProviderBreakpointLimit = 4;

    // Marks the last markable block of every target that exists in the request.
    // Re-applying is a no-op; going over maxBreakpoints fails without touching the request.
    VoidResult apply(ChatRequest& request, const CachePlacement& placement = CachePlacement::defaults());

    int countMarkers(const ChatRequest& request);
}
