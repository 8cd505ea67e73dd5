#pragma once

#include <QByteArray>
#include <QString>
#include <optional>

#include "core/Error.h"

namespace binfiddle {

enum class TextEncoding {
    Utf8 = 0,
    Utf16LE,
    Utf16BE,
    Latin1,
    Windows1252
};

enum class NewlineMode {
    Unix = 0,
    Windows,
    Mac,
    Keep
};

enum class BomMode {
    Add = 0,
    Remove,
    Keep
};

enum class DecodeErrorMode {
    Strict = 0,
    Replace,
    Ignore
};

struct ConvertConfig {
    TextEncoding from = TextEncoding::Utf8;
    TextEncoding to = TextEncoding::Utf8;
    NewlineMode newlines = NewlineMode::Keep;
    BomMode bom = BomMode::Keep;
    DecodeErrorMode onError = DecodeErrorMode::Replace;
};

// strip BOM -> decode -> newline conversion -> encode -> BOM policy.
class EncodingConverter {
public:
    explicit EncodingConverter(ConvertConfig config);

    std::optional<QByteArray> convert(const QByteArray& input, Error* error) const;
    QString describe() const;

    static std::optional<TextEncoding> parseEncoding(const QString& text, Error* error);
    static std::optional<NewlineMode> parseNewlineMode(const QString& text, Error* error);
    static std::optional<BomMode> parseBomMode(const QString& text, Error* error);
    static std::optional<DecodeErrorMode> parseErrorMode(const QString& text, Error* error);

    static QString encodingName(TextEncoding encoding);
    // Empty for the single-byte encodings.
    static QByteArray byteOrderMark(TextEncoding encoding);
    // Returns the input without a leading UTF-8, UTF-16BE or UTF-16LE mark.
    static QByteArray stripByteOrderMark(const QByteArray& input, bool* hadBom);
    static QString convertNewlines(const QString& text, NewlineMode mode);

private:
    std::optional<QString> decode(const QByteArray& bytes, Error* error) const;
    std::optional<QByteArray> encode(const QString& text, Error* error) const;

    ConvertConfig m_config;
};

}  // namespace binfiddle
