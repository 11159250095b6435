#pragma once
#include <QList>
#include <QString>
#include <QStringList>
#include <optional>

struct EmbeddingRequest {
    QString model;
    QStringList input;
    bool singleInput = false;   // wire "input" was a bare string

    bool operator==(const EmbeddingRequest&) const = default;
};

struct EmbeddingUsage {
    qint64 promptTokens = 0;
    qint64 totalTokens = 0;

    bool operator==(const EmbeddingUsage&) const = default;
};

struct EmbeddingResponse {
    QString model;
    QList<QList<float>> vectors;    // ordered by input index
    std::optional<EmbeddingUsage> usage;

    bool operator==(const EmbeddingResponse&) const = default;
};
