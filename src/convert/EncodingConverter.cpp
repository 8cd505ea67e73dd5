#include "convert/EncodingConverter.h"

#include <QStringDecoder>
#include <QStringEncoder>

#include <utility>

namespace binfiddle {

namespace {
const QByteArray kUtf8Bom = QByteArrayLiteral("\xEF\xBB\xBF");
const QByteArray kUtf16BeBom = QByteArrayLiteral("\xFE\xFF");
const QByteArray kUtf16LeBom = QByteArrayLiteral("\xFF\xFE");
constexpr const char* kWindows1252Name = "windows-1252";

QStringDecoder makeDecoder(TextEncoding encoding) {
    switch (encoding) {
        case TextEncoding::Utf8:
            return QStringDecoder(QStringConverter::Utf8);
        case TextEncoding::Utf16LE:
            return QStringDecoder(QStringConverter::Utf16LE);
        case TextEncoding::Utf16BE:
            return QStringDecoder(QStringConverter::Utf16BE);
        case TextEncoding::Latin1:
            return QStringDecoder(QStringConverter::Latin1);
        case TextEncoding::Windows1252:
            return QStringDecoder(kWindows1252Name);
    }
    return QStringDecoder(QStringConverter::Utf8);
}

QStringEncoder makeEncoder(TextEncoding encoding) {
    switch (encoding) {
        case TextEncoding::Utf8:
            return QStringEncoder(QStringConverter::Utf8);
        case TextEncoding::Utf16LE:
            return QStringEncoder(QStringConverter::Utf16LE);
        case TextEncoding::Utf16BE:
            return QStringEncoder(QStringConverter::Utf16BE);
        case TextEncoding::Latin1:
            return QStringEncoder(QStringConverter::Latin1);
        case TextEncoding::Windows1252:
            return QStringEncoder(kWindows1252Name);
    }
    return QStringEncoder(QStringConverter::Utf8);
}

QString unavailable(TextEncoding encoding) {
    return QStringLiteral("%1 conversion is not available in this Qt build")
        .arg(EncodingConverter::encodingName(encoding));
}
}  // namespace

EncodingConverter::EncodingConverter(ConvertConfig config) : m_config(std::move(config)) {}

std::optional<QByteArray> EncodingConverter::convert(const QByteArray& input, Error* error) const {
    bool hadBom = false;
    const QByteArray body = stripByteOrderMark(input, &hadBom);

    const std::optional<QString> decoded = decode(body, error);
    if (!decoded.has_value()) {
        return std::nullopt;
    }

    std::optional<QByteArray> encoded = encode(convertNewlines(*decoded, m_config.newlines), error);
    if (!encoded.has_value()) {
        return std::nullopt;
    }

    const bool addBom =
        m_config.bom == BomMode::Add || (m_config.bom == BomMode::Keep && hadBom);
    if (addBom) {
        encoded->prepend(byteOrderMark(m_config.to));
    }
    return encoded;
}

std::optional<QString> EncodingConverter::decode(const QByteArray& bytes, Error* error) const {
    QStringDecoder decoder = makeDecoder(m_config.from);
    if (!decoder.isValid()) {
        setError(error, ErrorKind::UnsupportedOperation, unavailable(m_config.from));
        return std::nullopt;
    }

    QString text = decoder.decode(bytes);
    if (!decoder.hasError()) {
        return text;
    }
    if (m_config.onError == DecodeErrorMode::Strict) {
        setError(error, ErrorKind::Parse,
                 QStringLiteral("Decoding error: input contains invalid sequences for %1 encoding")
                     .arg(encodingName(m_config.from)));
        return std::nullopt;
    }
    if (m_config.onError == DecodeErrorMode::Ignore) {
        text.remove(QChar::ReplacementCharacter);
    }
    return text;
}

std::optional<QByteArray> EncodingConverter::encode(const QString& text, Error* error) const {
    QStringEncoder encoder = makeEncoder(m_config.to);
    if (!encoder.isValid()) {
        setError(error, ErrorKind::UnsupportedOperation, unavailable(m_config.to));
        return std::nullopt;
    }

    QByteArray bytes = encoder.encode(text);
    if (encoder.hasError() && m_config.onError == DecodeErrorMode::Strict) {
        setError(error, ErrorKind::Parse,
                 QStringLiteral("Encoding error: text contains characters that cannot be "
                                "represented in %1 encoding")
                     .arg(encodingName(m_config.to)));
        return std::nullopt;
    }
    return bytes;
}

QString EncodingConverter::describe() const {
    static const char* kNewlineNames[] = {"unix", "windows", "mac", "keep"};
    static const char* kBomNames[] = {"add", "remove", "keep"};
    static const char* kErrorNames[] = {"strict", "replace", "ignore"};
    return QStringLiteral("convert %1 -> %2 newlines=%3 bom=%4 on_error=%5")
        .arg(encodingName(m_config.from), encodingName(m_config.to),
             QLatin1String(kNewlineNames[static_cast<int>(m_config.newlines)]),
             QLatin1String(kBomNames[static_cast<int>(m_config.bom)]),
             QLatin1String(kErrorNames[static_cast<int>(m_config.onError)]));
}

QString EncodingConverter::encodingName(TextEncoding encoding) {
    switch (encoding) {
        case TextEncoding::Utf8:
            return QStringLiteral("UTF-8");
        case TextEncoding::Utf16LE:
            return QStringLiteral("UTF-16LE");
        case TextEncoding::Utf16BE:
            return QStringLiteral("UTF-16BE");
        case TextEncoding::Latin1:
            return QStringLiteral("ISO-8859-1");
        case TextEncoding::Windows1252:
            return QStringLiteral("windows-1252");
    }
    return QString();
}

QByteArray EncodingConverter::byteOrderMark(TextEncoding encoding) {
    switch (encoding) {
        case TextEncoding::Utf8:
            return kUtf8Bom;
        case TextEncoding::Utf16BE:
            return kUtf16BeBom;
        case TextEncoding::Utf16LE:
            return kUtf16LeBom;
        case TextEncoding::Latin1:
        case TextEncoding::Windows1252:
            return QByteArray();
    }
    return QByteArray();
}

QByteArray EncodingConverter::stripByteOrderMark(const QByteArray& input, bool* hadBom) {
    for (const QByteArray& bom : {kUtf8Bom, kUtf16BeBom, kUtf16LeBom}) {
        if (input.startsWith(bom)) {
            if (hadBom != nullptr) {
                *hadBom = true;
            }
            return input.mid(bom.size());
        }
    }
    if (hadBom != nullptr) {
        *hadBom = false;
    }
    return input;
}

QString EncodingConverter::convertNewlines(const QString& text, NewlineMode mode) {
    QString out = text;
    switch (mode) {
        case NewlineMode::Keep:
            return out;
        case NewlineMode::Unix:
            out.replace(QStringLiteral("\r\n"), QStringLiteral("\n"));
            out.replace(QLatin1Char('\r'), QLatin1Char('\n'));
            return out;
        case NewlineMode::Windows:
            out.replace(QStringLiteral("\r\n"), QStringLiteral("\n"));
            out.replace(QLatin1Char('\r'), QLatin1Char('\n'));
            out.replace(QLatin1Char('\n'), QStringLiteral("\r\n"));
            return out;
        case NewlineMode::Mac:
            out.replace(QStringLiteral("\r\n"), QStringLiteral("\r"));
            out.replace(QLatin1Char('\n'), QLatin1Char('\r'));
            return out;
    }
    return out;
}

std::optional<TextEncoding> EncodingConverter::parseEncoding(const QString& text, Error* error) {
    const QString name = text.toLower();
    if (name == QStringLiteral("utf-8") || name == QStringLiteral("utf8")) {
        return TextEncoding::Utf8;
    }
    if (name == QStringLiteral("utf-16le") || name == QStringLiteral("utf16le")) {
        return TextEncoding::Utf16LE;
    }
    if (name == QStringLiteral("utf-16be") || name == QStringLiteral("utf16be")) {
        return TextEncoding::Utf16BE;
    }
    if (name == QStringLiteral("latin-1") || name == QStringLiteral("latin1") ||
        name == QStringLiteral("iso-8859-1")) {
        return TextEncoding::Latin1;
    }
    if (name == QStringLiteral("windows-1252") || name == QStringLiteral("cp1252")) {
        return TextEncoding::Windows1252;
    }
    setError(error, ErrorKind::InvalidInput,
             QStringLiteral("Unsupported encoding: '%1'. Supported: utf-8, utf-16le, utf-16be, "
                            "latin-1, windows-1252")
                 .arg(text));
    return std::nullopt;
}

std::optional<NewlineMode> EncodingConverter::parseNewlineMode(const QString& text,
                                                               Error* error) {
    const QString name = text.toLower();
    if (name == QStringLiteral("unix") || name == QStringLiteral("lf")) {
        return NewlineMode::Unix;
    }
    if (name == QStringLiteral("windows") || name == QStringLiteral("crlf") ||
        name == QStringLiteral("dos")) {
        return NewlineMode::Windows;
    }
    if (name == QStringLiteral("mac") || name == QStringLiteral("cr")) {
        return NewlineMode::Mac;
    }
    if (name == QStringLiteral("keep") || name == QStringLiteral("preserve")) {
        return NewlineMode::Keep;
    }
    setError(error, ErrorKind::InvalidInput,
             QStringLiteral("Unknown newline mode: '%1'. Supported: unix, windows, mac, keep")
                 .arg(text));
    return std::nullopt;
}

std::optional<BomMode> EncodingConverter::parseBomMode(const QString& text, Error* error) {
    const QString name = text.toLower();
    if (name == QStringLiteral("add") || name == QStringLiteral("yes") ||
        name == QStringLiteral("true")) {
        return BomMode::Add;
    }
    if (name == QStringLiteral("remove") || name == QStringLiteral("strip") ||
        name == QStringLiteral("no") || name == QStringLiteral("false")) {
        return BomMode::Remove;
    }
    if (name == QStringLiteral("keep") || name == QStringLiteral("preserve")) {
        return BomMode::Keep;
    }
    setError(error, ErrorKind::InvalidInput,
             QStringLiteral("Unknown BOM mode: '%1'. Supported: add, remove, keep").arg(text));
    return std::nullopt;
}

std::optional<DecodeErrorMode> EncodingConverter::parseErrorMode(const QString& text,
                                                                 Error* error) {
    const QString name = text.toLower();
    if (name == QStringLiteral("strict") || name == QStringLiteral("error") ||
        name == QStringLiteral("fail")) {
        return DecodeErrorMode::Strict;
    }
    if (name == QStringLiteral("replace") || name == QStringLiteral("substitute")) {
        return DecodeErrorMode::Replace;
    }
    if (name == QStringLiteral("ignore") || name == QStringLiteral("skip")) {
        return DecodeErrorMode::Ignore;
    }
    setError(error, ErrorKind::InvalidInput,
             QStringLiteral("Unknown error mode: '%1'. Supported: strict, replace, ignore")
                 .arg(text));
    return std::nullopt;
}

}  // namespace binfiddle
