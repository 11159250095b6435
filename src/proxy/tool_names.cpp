#include "tool_names.h"
#include "canonical/validate.h"
#include <QCryptographicHash>
#include <QStringList>

namespace {

bool passesThrough(char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
}

QStringList escapeTokens(const QString& name)
{
    static const char kHex[] = "0123456789abcdef";
    QStringList tokens;
    const QByteArray utf8 = name.toUtf8();
    for (const char c : utf8) {
        if (passesThrough(c)) {
            tokens.append(QString(QLatin1Char(c)));
        } else if (c == '_') {
            tokens.append(QStringLiteral("__"));
        } else {
            const auto byte = static_cast<unsigned char>(c);
            QString escaped(QLatin1Char('_'));
            escaped += QLatin1Char(kHex[byte >> 4]);
            escaped += QLatin1Char(kHex[byte & 0x0f]);
            tokens.append(escaped);
        }
    }
    return tokens;
}

}

ToolNameTransform::ToolNameTransform(const QString& prefix)
    : m_prefix(prefix)
{
}

bool ToolNameTransform::isValidPrefix(const QString& prefix)
{
    return prefix.isEmpty()
        || (prefix.size() <= kMaxPrefixLength && Validate::isValidToolName(prefix));
}

QString ToolNameTransform::encode(const QString& name, const QString& prefix)
{
    const QStringList tokens = escapeTokens(name);
    QString encoded = prefix + tokens.join(QString());
    if (encoded.size() <= Validate::kMaxToolNameLength && !encoded.isEmpty())
        return encoded;

    const int budget = Validate::kMaxToolNameLength - kHashSuffixLength;
    encoded = prefix;
    for (const QString& token : tokens) {
        if (encoded.size() + token.size() > budget)
            break;
        encoded += token;
    }
    const QByteArray digest = QCryptographicHash::hash(name.toUtf8(), QCryptographicHash::Sha256).toHex();
    return encoded + QStringLiteral("_h") + QString::fromLatin1(digest.left(16));
}

QString ToolNameTransform::transform(const QString& name)
{
    const QString encoded = encode(name, m_prefix);
    m_inverse.insert(encoded, name);
    return encoded;
}

Result<QString> ToolNameTransform::restore(const QString& encoded) const
{
    const auto it = m_inverse.constFind(encoded);
    if (it == m_inverse.constEnd())
        return std::unexpected(Failure::unknownEncodedName(encoded));
    return it.value();
}

void ToolNameTransform::applyToRequest(ChatRequest& request)
{
    if (request.tools.has_value()) {
        for (ToolDefinition& tool : *request.tools)
            tool.name = transform(tool.name);
    }
    if (request.toolChoice.has_value() && request.toolChoice->mode == ToolChoiceMode::Tool)
        request.toolChoice->toolName = transform(request.toolChoice->toolName);

    for (Message& message : request.messages) {
        for (ContentBlock& block : message.content) {
            if (block.kind == BlockKind::ToolUse)
                block.toolName = transform(block.toolName);
        }
    }
}

VoidResult ToolNameTransform::restoreResponse(ChatResponse& response) const
{
    // Resolve everything first so a failure leaves the response untouched.
    QList<QString> restored;
    for (const ContentBlock& block : response.content) {
        if (block.kind != BlockKind::ToolUse)
            continue;
        auto original = restore(block.toolName);
        if (!original)
            return std::unexpected(original.error());
        restored.append(*original);
    }

    int next = 0;
    for (ContentBlock& block : response.content) {
        if (block.kind == BlockKind::ToolUse)
            block.toolName = restored[next++];
    }
    return {};
}
