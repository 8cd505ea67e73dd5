#include "parse/InputParsing.h"

#include <QStringList>

#include <limits>

namespace binfiddle {

namespace {
bool isHexDigit(QChar c) {
    const char16_t u = c.unicode();
    return (u >= u'0' && u <= u'9') || (u >= u'a' && u <= u'f') || (u >= u'A' && u <= u'F');
}

bool allHexDigits(QStringView text) {
    for (const QChar c : text) {
        if (!isHexDigit(c)) {
            return false;
        }
    }
    return true;
}

QStringList whitespaceTokens(const QString& input) {
    return input.simplified().split(QLatin1Char(' '), Qt::SkipEmptyParts);
}

std::optional<QByteArray> parseHexInput(const QString& input, Error* error) {
    QByteArray digits;
    digits.reserve(input.size());
    for (const QChar c : input) {
        if (isHexDigit(c)) {
            digits.append(static_cast<char>(c.unicode()));
        }
    }
    if (digits.size() % 2 != 0) {
        setError(error, ErrorKind::Parse,
                 QStringLiteral("Hex input must have even number of digits, got %1 digits")
                     .arg(digits.size()));
        return std::nullopt;
    }
    return QByteArray::fromHex(digits);
}

std::optional<QByteArray> parseRadixInput(const QString& input, int base, Error* error) {
    const char* label = base == 10 ? "decimal" : (base == 8 ? "octal" : "binary");
    QByteArray bytes;
    for (const QString& token : whitespaceTokens(input)) {
        if (base == 2 && token.size() > 8) {
            setError(error, ErrorKind::Parse,
                     QStringLiteral("Binary value '%1' exceeds 8 bits").arg(token));
            return std::nullopt;
        }
        bool ok = false;
        const uint value = token.toUInt(&ok, base);
        if (!ok) {
            setError(error, ErrorKind::Parse,
                     QStringLiteral("Invalid %1 value '%2'").arg(QLatin1String(label), token));
            return std::nullopt;
        }
        if (value > 255) {
            setError(error, ErrorKind::Parse,
                     QStringLiteral("%1 value '%2' exceeds byte range (0-255)")
                         .arg(QLatin1String(label), token));
            return std::nullopt;
        }
        bytes.append(static_cast<char>(value));
    }
    if (bytes.isEmpty()) {
        setError(error, ErrorKind::Parse,
                 QStringLiteral("Empty %1 input").arg(QLatin1String(label)));
        return std::nullopt;
    }
    return bytes;
}
}  // namespace

std::optional<quint64> parseNumber(const QString& text, Error* error) {
    const QString s = text.trimmed();
    if (s.isEmpty()) {
        setError(error, ErrorKind::Parse, QStringLiteral("Empty number string"));
        return std::nullopt;
    }

    QStringView digits(s);
    int base = 10;
    if (s.startsWith(QStringLiteral("0x"), Qt::CaseInsensitive)) {
        digits = digits.mid(2);
        base = 16;
    } else if (s.size() > 1 && s.at(0) == QLatin1Char('0') && allHexDigits(digits.mid(1))) {
        digits = digits.mid(1);
        base = 16;
    }

    bool ok = false;
    quint64 value = 0;
    if (base != 16 || (!digits.isEmpty() && allHexDigits(digits))) {
        value = digits.toULongLong(&ok, base);
    }
    if (!ok) {
        setError(error, ErrorKind::Parse,
                 QStringLiteral("Invalid %1 number '%2'")
                     .arg(base == 16 ? QStringLiteral("hexadecimal") : QStringLiteral("decimal"),
                          s));
        return std::nullopt;
    }
    return value;
}

std::optional<ParsedRange> parseRange(const QString& text, quint64 dataLength, Error* error) {
    const QString range = text.trimmed();

    if (!range.contains(QStringLiteral(".."))) {
        const std::optional<quint64> index = parseNumber(range, error);
        if (!index.has_value()) {
            return std::nullopt;
        }
        if (*index >= dataLength) {
            setError(error, ErrorKind::InvalidRange,
                     QStringLiteral("Index %1 out of bounds (data length: %2)")
                         .arg(*index)
                         .arg(dataLength));
            return std::nullopt;
        }
        return ParsedRange{*index, *index + 1};
    }

    const QStringList parts = range.split(QStringLiteral(".."));
    if (parts.size() != 2) {
        setError(error, ErrorKind::Parse,
                 QStringLiteral("Invalid range format: '%1'. Expected 'start..end', '..end', "
                                "'start..', or '..'")
                     .arg(range));
        return std::nullopt;
    }

    ParsedRange parsed;
    if (!parts.at(0).isEmpty()) {
        const std::optional<quint64> start = parseNumber(parts.at(0), error);
        if (!start.has_value()) {
            return std::nullopt;
        }
        parsed.start = *start;
    }
    if (!parts.at(1).isEmpty()) {
        parsed.end = parseNumber(parts.at(1), error);
        if (!parsed.end.has_value()) {
            return std::nullopt;
        }
    }

    if (parsed.start > dataLength) {
        setError(error, ErrorKind::InvalidRange,
                 QStringLiteral("Start index %1 exceeds data length %2")
                     .arg(parsed.start)
                     .arg(dataLength));
        return std::nullopt;
    }
    if (parsed.end.has_value()) {
        if (*parsed.end > dataLength) {
            setError(error, ErrorKind::InvalidRange,
                     QStringLiteral("End index %1 exceeds data length %2")
                         .arg(*parsed.end)
                         .arg(dataLength));
            return std::nullopt;
        }
        if (parsed.start >= *parsed.end) {
            setError(error, ErrorKind::InvalidRange,
                     QStringLiteral("Start index %1 must be less than end index %2")
                         .arg(parsed.start)
                         .arg(*parsed.end));
            return std::nullopt;
        }
    }
    return parsed;
}

std::optional<QByteArray> parseInput(const QString& input, const QString& format, Error* error) {
    const QString name = format.toLower();
    if (name == QStringLiteral("hex")) {
        return parseHexInput(input, error);
    }
    if (name == QStringLiteral("dec")) {
        return parseRadixInput(input, 10, error);
    }
    if (name == QStringLiteral("oct")) {
        return parseRadixInput(input, 8, error);
    }
    if (name == QStringLiteral("bin")) {
        return parseRadixInput(input, 2, error);
    }
    if (name == QStringLiteral("ascii")) {
        return input.toUtf8();
    }
    setError(error, ErrorKind::InvalidInput,
             QStringLiteral("Unknown input format: '%1'. Supported: hex, dec, oct, bin, ascii")
                 .arg(format));
    return std::nullopt;
}

std::optional<MaskPattern> parseMaskPattern(const QString& input, Error* error) {
    QString cleaned;
    for (const QChar c : input) {
        if (isHexDigit(c) || c == QLatin1Char('?') || c == QLatin1Char('x') ||
            c == QLatin1Char('X')) {
            cleaned += c;
        }
    }
    if (cleaned.size() % 2 != 0) {
        setError(error, ErrorKind::Parse,
                 QStringLiteral("Mask pattern must have pairs of characters, got %1 characters")
                     .arg(cleaned.size()));
        return std::nullopt;
    }

    MaskPattern mask;
    for (qsizetype i = 0; i < cleaned.size(); i += 2) {
        const QString pair = cleaned.mid(i, 2).toUpper();
        if (pair == QStringLiteral("??") || pair == QStringLiteral("XX")) {
            mask.slots.push_back(std::nullopt);
            continue;
        }
        bool ok = allHexDigits(pair);
        const uint value = ok ? pair.toUInt(&ok, 16) : 0;
        if (!ok) {
            setError(error, ErrorKind::Parse, QStringLiteral("Invalid mask byte '%1'").arg(pair));
            return std::nullopt;
        }
        mask.slots.push_back(static_cast<quint8>(value));
    }

    if (mask.slots.isEmpty()) {
        setError(error, ErrorKind::Parse, QStringLiteral("Empty mask pattern"));
        return std::nullopt;
    }
    return mask;
}

std::optional<SearchPattern> parseSearchPattern(const QString& input, const QString& format,
                                                Error* error) {
    const QString name = format.toLower();
    if (name == QStringLiteral("regex")) {
        return SearchPattern{RegexPattern{input}};
    }
    if (name == QStringLiteral("mask")) {
        std::optional<MaskPattern> mask = parseMaskPattern(input, error);
        if (!mask.has_value()) {
            return std::nullopt;
        }
        return SearchPattern{std::move(*mask)};
    }
    if (name == QStringLiteral("hex") || name == QStringLiteral("ascii") ||
        name == QStringLiteral("dec") || name == QStringLiteral("oct") ||
        name == QStringLiteral("bin")) {
        std::optional<QByteArray> bytes = parseInput(input, name, error);
        if (!bytes.has_value()) {
            return std::nullopt;
        }
        return SearchPattern{ExactPattern{std::move(*bytes)}};
    }
    setError(error, ErrorKind::InvalidInput,
             QStringLiteral("Unknown search pattern format: '%1'. Supported: hex, ascii, dec, "
                            "oct, bin, regex, mask")
                 .arg(format));
    return std::nullopt;
}

std::optional<QVector<ByteRange>> parseIgnoreRanges(const QString& text, Error* error) {
    QVector<ByteRange> ranges;
    const QStringList parts = text.split(QLatin1Char(','));
    for (const QString& rawPart : parts) {
        const QString part = rawPart.trimmed();
        if (part.isEmpty()) {
            continue;
        }
        const std::optional<ParsedRange> parsed =
            parseRange(part, std::numeric_limits<quint64>::max(), error);
        if (!parsed.has_value()) {
            return std::nullopt;
        }
        ranges.push_back({parsed->start, parsed->end.value_or(parsed->start + 1)});
    }
    return ranges;
}

}  // namespace binfiddle
