#include "text/ByteDisplay.h"

namespace binfiddle {

namespace {
constexpr int kMaxChunkBits = 64;

enum class Radix {
    Hex,
    Dec,
    Oct,
    Bin,
};

QString formatChunk(quint64 value, int bitCount, Radix radix) {
    switch (radix) {
        case Radix::Hex:
            return QStringLiteral("%1").arg(value, (bitCount + 3) / 4, 16, QLatin1Char('0'));
        case Radix::Dec:
            return QString::number(value);
        case Radix::Oct:
            return QString::number(value, 8);
        case Radix::Bin:
            return QStringLiteral("%1").arg(value, bitCount, 2, QLatin1Char('0'));
    }
    return QString();
}

QString formatChunked(const QByteArray& bytes, int chunkSize, int width, Radix radix) {
    QString out;
    const quint64 totalBits = static_cast<quint64>(bytes.size()) * 8ULL;
    quint64 bitOffset = 0;
    int chunksOnLine = 0;
    while (bitOffset < totalBits) {
        const int bits = static_cast<int>(qMin<quint64>(chunkSize, totalBits - bitOffset));
        if (chunksOnLine > 0) {
            out += QLatin1Char(' ');
        }
        out += formatChunk(extractBits(bytes, bitOffset, bits), bits, radix);
        ++chunksOnLine;
        bitOffset += static_cast<quint64>(chunkSize);

        if (width > 0 && chunksOnLine >= width && bitOffset < totalBits) {
            out += QLatin1Char('\n');
            chunksOnLine = 0;
        }
    }
    return out;
}

QString formatAscii(const QByteArray& bytes, int width) {
    QString out;
    out.reserve(bytes.size() + (width > 0 ? bytes.size() / width : 0));
    int charsOnLine = 0;
    for (qsizetype i = 0; i < bytes.size(); ++i) {
        const quint8 byte = static_cast<quint8>(bytes.at(i));
        out += isPrintableAscii(byte) ? QLatin1Char(static_cast<char>(byte)) : QLatin1Char('.');
        ++charsOnLine;
        if (width > 0 && charsOnLine >= width && i + 1 < bytes.size()) {
            out += QLatin1Char('\n');
            charsOnLine = 0;
        }
    }
    return out;
}
}  // namespace

quint64 extractBits(const QByteArray& bytes, quint64 bitOffset, int bitCount) {
    if (bitCount <= 0 || bitCount > kMaxChunkBits) {
        return 0;
    }
    quint64 value = 0;
    for (int collected = 0; collected < bitCount; ++collected) {
        const quint64 bitPos = bitOffset + static_cast<quint64>(collected);
        const quint64 byteIdx = bitPos / 8ULL;
        if (byteIdx >= static_cast<quint64>(bytes.size())) {
            break;
        }
        const int shift = 7 - static_cast<int>(bitPos % 8ULL);
        const quint8 byte = static_cast<quint8>(bytes.at(static_cast<qsizetype>(byteIdx)));
        value = (value << 1) | static_cast<quint64>((byte >> shift) & 1U);
    }
    return value;
}

bool isPrintableAscii(quint8 byte) { return byte >= 0x20 && byte <= 0x7E; }

QString formatOffset(quint64 offset) {
    return QStringLiteral("0x%1").arg(offset, 8, 16, QLatin1Char('0'));
}

std::optional<QString> displayBytes(const QByteArray& bytes, const QString& format,
                                    int chunkSize, int width, Error* error) {
    if (bytes.isEmpty()) {
        return QString();
    }
    if (chunkSize <= 0 || chunkSize > kMaxChunkBits) {
        setError(error, ErrorKind::InvalidChunkSize, QString::number(chunkSize));
        return std::nullopt;
    }

    const QString name = format.toLower();
    if (name == QStringLiteral("hex")) {
        return formatChunked(bytes, chunkSize, width, Radix::Hex);
    }
    if (name == QStringLiteral("dec")) {
        return formatChunked(bytes, chunkSize, width, Radix::Dec);
    }
    if (name == QStringLiteral("oct")) {
        return formatChunked(bytes, chunkSize, width, Radix::Oct);
    }
    if (name == QStringLiteral("bin")) {
        return formatChunked(bytes, chunkSize, width, Radix::Bin);
    }
    if (name == QStringLiteral("ascii")) {
        if (chunkSize != 8) {
            setError(error, ErrorKind::InvalidInput,
                     QStringLiteral("ASCII output only supported for 8-bit chunks"));
            return std::nullopt;
        }
        return formatAscii(bytes, width);
    }

    setError(error, ErrorKind::InvalidInput,
             QStringLiteral("Unknown output format: '%1'. Supported: hex, dec, oct, bin, ascii")
                 .arg(format));
    return std::nullopt;
}

std::optional<QString> formatMatch(quint64 offset, const QByteArray& data, const QString& format,
                                   int chunkSize, Error* error) {
    const std::optional<QString> body = displayBytes(data, format, chunkSize, 0, error);
    if (!body.has_value()) {
        return std::nullopt;
    }
    return QStringLiteral("%1: %2").arg(formatOffset(offset), *body);
}

std::optional<QString> formatMatchWithContext(quint64 offset, const QByteArray& data,
                                              const QByteArray& before, const QByteArray& after,
                                              const QString& format, int chunkSize,
                                              Error* error) {
    QString out = QStringLiteral("Match at %1:\n").arg(formatOffset(offset));

    if (!before.isEmpty()) {
        const std::optional<QString> text = displayBytes(before, format, chunkSize, 0, error);
        if (!text.has_value()) {
            return std::nullopt;
        }
        out += QStringLiteral("  Before: %1\n").arg(*text);
    }

    const std::optional<QString> matchText = displayBytes(data, format, chunkSize, 0, error);
    if (!matchText.has_value()) {
        return std::nullopt;
    }
    out += QStringLiteral("  Match:  %1\n").arg(*matchText);

    if (!after.isEmpty()) {
        const std::optional<QString> text = displayBytes(after, format, chunkSize, 0, error);
        if (!text.has_value()) {
            return std::nullopt;
        }
        out += QStringLiteral("  After:  %1").arg(*text);
    }
    return out;
}

}  // namespace binfiddle
