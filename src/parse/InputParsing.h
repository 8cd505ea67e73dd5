#pragma once

#include <QByteArray>
#include <QString>
#include <QVector>
#include <QtGlobal>
#include <optional>

#include "core/Error.h"
#include "diff/DiffTypes.h"
#include "scan/SearchTypes.h"

namespace binfiddle {

struct ParsedRange {
    quint64 start = 0;
    std::optional<quint64> end;
};

// Accepts "N", "A..B", "..B", "A..", "..". A single index N yields [N, N+1) and must be
// inside the data; slice bounds may reach dataLength.
std::optional<ParsedRange> parseRange(const QString& text, quint64 dataLength, Error* error);

// "0x1F" and "01F" (leading zero followed only by hex digits) are hexadecimal, anything else
// is decimal.
std::optional<quint64> parseNumber(const QString& text, Error* error);

// hex ignores every non-hex character; dec/oct/bin take whitespace-separated byte values;
// ascii takes the UTF-8 bytes verbatim.
std::optional<QByteArray> parseInput(const QString& input, const QString& format, Error* error);

std::optional<SearchPattern> parseSearchPattern(const QString& input, const QString& format,
                                                Error* error);
std::optional<MaskPattern> parseMaskPattern(const QString& input, Error* error);

// Comma-separated ranges, e.g. "0x0..0x10,0x100..0x200". A single index N ignores [N, N+1).
std::optional<QVector<ByteRange>> parseIgnoreRanges(const QString& text, Error* error);

}  // namespace binfiddle
