#pragma once

#include <QByteArray>
#include <QString>
#include <QVector>
#include <optional>

#include "core/Error.h"
#include "scan/SearchTypes.h"

namespace binfiddle {

// Sequential pattern search over an in-memory buffer. Results are in strictly increasing
// offset order.
class PatternMatcher {
public:
    static std::optional<QVector<SearchMatch>> search(const QByteArray& haystack,
                                                      const SearchConfig& config, Error* error);

    static std::optional<QVector<SearchMatch>> searchExact(const QByteArray& haystack,
                                                           const QByteArray& needle,
                                                           bool findAll, bool noOverlap,
                                                           Error* error);
    static std::optional<QVector<SearchMatch>> searchMask(
        const QByteArray& haystack, const QVector<std::optional<quint8>>& mask, bool findAll,
        bool noOverlap, Error* error);
    // Bytes are mapped one-to-one onto Latin-1 code units before matching, so \xNN matches
    // byte NN and match offsets are byte offsets.
    static std::optional<QVector<SearchMatch>> searchRegex(const QByteArray& haystack,
                                                           const QString& expression,
                                                           bool findAll, bool noOverlap,
                                                           Error* error);

    static bool matchesMask(const char* window, const QVector<std::optional<quint8>>& mask);
    // Fixed match length of an Exact or Mask pattern, 0 for Regex.
    static qsizetype patternLength(const SearchPattern& pattern);
};

}  // namespace binfiddle
