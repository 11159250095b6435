#pragma once
#include "canonical/request.h"
#include "canonical/response.h"
#include "canonical/result.h"
#include <QHash>
#include <QString>

// Maps caller tool names onto the provider-safe grammar [A-Za-z0-9_-]{1,64}.
//
// Every byte outside [A-Za-z0-9-] is escaped with '_': "__" for '_' and "_hh"
// (lowercase hex) for anything else. An optional fixed prefix goes in front.
// Encodings longer than 64 characters are cut at an escape boundary and end in
// "_h" plus 16 hex digits of the SHA-256 of the original name; "_h" never starts
// an escape, so shortened names cannot collide with unshortened ones.
//
// One instance per request cycle: restore() only knows names this instance produced.
class ToolNameTransform {
public:
    static constexpr int kMaxPrefixLength = 32;
    static constexpr int kHashSuffixLength = 18;   // "_h" + 16 hex

    explicit ToolNameTransform(const QString& prefix = QString());

    const QString& prefix() const { return m_prefix; }

    QString transform(const QString& name);
    Result<QString> restore(const QString& encoded) const;

    // Tool definitions, a named tool_choice and ToolUse blocks in history.
    void applyToRequest(ChatRequest& request);
    // ToolUse blocks of a provider reply.
    VoidResult restoreResponse(ChatResponse& response) const;

    static QString encode(const QString& name, const QString& prefix);
    static bool isValidPrefix(const QString& prefix);

private:
    QString m_prefix;
    QHash<QString, QString> m_inverse;   // encoded -> original
};
