#pragma once

#include <QByteArray>
#include <QString>
#include <QVector>
#include <QtGlobal>
#include <optional>
#include <variant>

namespace binfiddle {

struct ExactPattern {
    QByteArray bytes;
};

// One slot per byte; std::nullopt is a wildcard.
struct MaskPattern {
    QVector<std::optional<quint8>> slots;
};

struct RegexPattern {
    QString expression;
};

using SearchPattern = std::variant<ExactPattern, MaskPattern, RegexPattern>;

struct SearchMatch {
    quint64 offset = 0;
    QByteArray data;

    bool operator==(const SearchMatch& other) const {
        return offset == other.offset && data == other.data;
    }
    bool operator!=(const SearchMatch& other) const { return !(*this == other); }
};

struct SearchConfig {
    SearchPattern pattern = ExactPattern{};
    QString format = QStringLiteral("hex");
    int chunkSize = 8;
    bool findAll = false;
    bool countOnly = false;
    bool offsetsOnly = false;
    int context = 0;
    bool noOverlap = false;
};

// A slice of the haystack handed to one worker. Matches at or past reportLimit (relative to
// offset) belong to the next chunk unless isLast is set.
struct SearchChunk {
    quint64 offset = 0;
    quint64 size = 0;
    quint64 reportLimit = 0;
    bool isLast = false;
};

}  // namespace binfiddle
