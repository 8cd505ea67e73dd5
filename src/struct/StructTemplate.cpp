#include "struct/StructTemplate.h"

#include <QSet>
#include <QStringList>

#include <algorithm>
#include <limits>
#include <string>
#include <utility>

#include <yaml-cpp/yaml.h>

#include "io/ByteSource.h"

namespace binfiddle {

namespace {
struct TypeAlias {
    const char* name;
    FieldType type;
};

constexpr TypeAlias kTypeAliases[] = {
    {"u8", FieldType::U8},
    {"uint8", FieldType::U8},
    {"byte", FieldType::U8},
    {"u16", FieldType::U16},
    {"uint16", FieldType::U16},
    {"word", FieldType::U16},
    {"ushort", FieldType::U16},
    {"u32", FieldType::U32},
    {"uint32", FieldType::U32},
    {"dword", FieldType::U32},
    {"uint", FieldType::U32},
    {"u64", FieldType::U64},
    {"uint64", FieldType::U64},
    {"qword", FieldType::U64},
    {"ulong", FieldType::U64},
    {"i8", FieldType::I8},
    {"int8", FieldType::I8},
    {"sbyte", FieldType::I8},
    {"i16", FieldType::I16},
    {"int16", FieldType::I16},
    {"short", FieldType::I16},
    {"i32", FieldType::I32},
    {"int32", FieldType::I32},
    {"int", FieldType::I32},
    {"i64", FieldType::I64},
    {"int64", FieldType::I64},
    {"long", FieldType::I64},
    {"hex_string", FieldType::HexString},
    {"hexstring", FieldType::HexString},
    {"hex", FieldType::HexString},
    {"string", FieldType::String},
    {"str", FieldType::String},
    {"ascii", FieldType::String},
    {"utf8", FieldType::String},
    {"bytes", FieldType::Bytes},
    {"raw", FieldType::Bytes},
    {"data", FieldType::Bytes},
};

// Missing and null keys read as nullopt.
std::optional<QString> scalarText(const YAML::Node& parent, const char* key) {
    const YAML::Node node = parent[key];
    if (!node.IsDefined() || node.IsNull()) {
        return std::nullopt;
    }
    return QString::fromStdString(node.as<std::string>()).trimmed();
}

std::optional<QString> requiredText(const YAML::Node& parent, const char* key,
                                    const QString& owner, Error* error) {
    std::optional<QString> text = scalarText(parent, key);
    if (!text.has_value()) {
        setError(error, ErrorKind::Parse,
                 QStringLiteral("%1 is missing '%2'").arg(owner, QString::fromLatin1(key)));
    }
    return text;
}

std::optional<quint64> templateNumber(const QString& text) {
    bool ok = false;
    quint64 value = 0;
    if (text.startsWith(QStringLiteral("0x"), Qt::CaseInsensitive)) {
        value = text.mid(2).toULongLong(&ok, 16);
    } else {
        value = text.toULongLong(&ok, 10);
    }
    if (!ok) {
        return std::nullopt;
    }
    return value;
}

std::optional<quint64> fieldNumber(const YAML::Node& node, const char* key,
                                   const QString& fieldName, Error* error) {
    const std::optional<QString> text =
        requiredText(node, key, QStringLiteral("Field '%1'").arg(fieldName), error);
    if (!text.has_value()) {
        return std::nullopt;
    }
    const std::optional<quint64> value = templateNumber(*text);
    if (!value.has_value()) {
        setError(error, ErrorKind::Parse,
                 QStringLiteral("Invalid %1 '%2' for field '%3'")
                     .arg(QString::fromLatin1(key), *text, fieldName));
    }
    return value;
}

// "0x7f 45 4c 46" and "7f454c46" name the same bytes.
std::optional<QByteArray> expectedBytes(const QString& text, const QString& fieldName,
                                        Error* error) {
    QString digits = text;
    if (digits.startsWith(QStringLiteral("0x"), Qt::CaseInsensitive)) {
        digits = digits.mid(2);
    }
    digits.remove(QLatin1Char(' '));
    const bool allHex = std::all_of(digits.cbegin(), digits.cend(), [](QChar c) {
        const char16_t u = c.toLower().unicode();
        return (u >= u'0' && u <= u'9') || (u >= u'a' && u <= u'f');
    });
    if (digits.isEmpty() || digits.size() % 2 != 0 || !allHex) {
        setError(error, ErrorKind::Parse,
                 QStringLiteral("Invalid assert value '%1' for field '%2'").arg(text, fieldName));
        return std::nullopt;
    }
    return QByteArray::fromHex(digits.toLatin1());
}

// Hex keys are normalized to decimal so lookups can use the decoded value.
QString enumKey(const QString& text) {
    if (text.startsWith(QStringLiteral("0x"), Qt::CaseInsensitive)) {
        const std::optional<quint64> value = templateNumber(text);
        if (value.has_value()) {
            return QString::number(*value);
        }
    }
    return text;
}

std::optional<FieldDefinition> fieldFromNode(const YAML::Node& node, int index, Error* error) {
    if (!node.IsMap()) {
        setError(error, ErrorKind::Parse,
                 QStringLiteral("Field %1 must be a mapping").arg(index + 1));
        return std::nullopt;
    }

    FieldDefinition field;
    const std::optional<QString> name =
        requiredText(node, "name", QStringLiteral("Field %1").arg(index + 1), error);
    if (!name.has_value()) {
        return std::nullopt;
    }
    field.name = *name;

    const std::optional<quint64> offset = fieldNumber(node, "offset", field.name, error);
    if (!offset.has_value()) {
        return std::nullopt;
    }
    const std::optional<quint64> size = fieldNumber(node, "size", field.name, error);
    if (!size.has_value()) {
        return std::nullopt;
    }
    field.offset = *offset;
    field.size = *size;

    if (const std::optional<QString> type = scalarText(node, "type"); type.has_value()) {
        const std::optional<FieldType> parsed = TemplateLoader::parseFieldType(*type, error);
        if (!parsed.has_value()) {
            return std::nullopt;
        }
        field.type = *parsed;
    }
    if (const std::optional<QString> display = scalarText(node, "display"); display.has_value()) {
        const std::optional<FieldDisplay> parsed = TemplateLoader::parseDisplay(*display, error);
        if (!parsed.has_value()) {
            return std::nullopt;
        }
        field.display = *parsed;
    }
    if (const std::optional<QString> expected = scalarText(node, "assert");
        expected.has_value()) {
        field.expected = expectedBytes(*expected, field.name, error);
        if (!field.expected.has_value()) {
            return std::nullopt;
        }
    }
    field.description = scalarText(node, "description").value_or(QString());

    const YAML::Node names = node["enum"];
    if (names.IsDefined() && !names.IsNull()) {
        if (!names.IsMap()) {
            setError(error, ErrorKind::Parse,
                     QStringLiteral("Field '%1' has an enum that is not a mapping")
                         .arg(field.name));
            return std::nullopt;
        }
        for (YAML::const_iterator it = names.begin(); it != names.end(); ++it) {
            const QString key = QString::fromStdString(it->first.as<std::string>()).trimmed();
            field.enumNames.insert(enumKey(key),
                                   QString::fromStdString(it->second.as<std::string>()));
        }
    }
    return field;
}

std::optional<StructTemplate> templateFromNode(const YAML::Node& root, Error* error) {
    if (!root.IsMap()) {
        setError(error, ErrorKind::Parse, QStringLiteral("Template must be a YAML mapping"));
        return std::nullopt;
    }

    StructTemplate structTemplate;
    const std::optional<QString> name =
        requiredText(root, "name", QStringLiteral("Template"), error);
    if (!name.has_value()) {
        return std::nullopt;
    }
    structTemplate.name = *name;
    structTemplate.description = scalarText(root, "description").value_or(QString());
    if (const std::optional<QString> endian = scalarText(root, "endian"); endian.has_value()) {
        const std::optional<Endianness> parsed = TemplateLoader::parseEndianness(*endian, error);
        if (!parsed.has_value()) {
            return std::nullopt;
        }
        structTemplate.endian = *parsed;
    }

    const YAML::Node fields = root["fields"];
    if (!fields.IsDefined() || !fields.IsSequence()) {
        setError(error, ErrorKind::Parse, QStringLiteral("Template 'fields' must be a list"));
        return std::nullopt;
    }
    for (std::size_t i = 0; i < fields.size(); ++i) {
        std::optional<FieldDefinition> field =
            fieldFromNode(fields[i], static_cast<int>(i), error);
        if (!field.has_value()) {
            return std::nullopt;
        }
        structTemplate.fields.push_back(std::move(*field));
    }
    return structTemplate;
}
}  // namespace

quint64 StructTemplate::totalSize() const {
    quint64 total = 0;
    for (const FieldDefinition& field : fields) {
        total = std::max(total, field.offset + field.size);
    }
    return total;
}

std::optional<StructTemplate> TemplateLoader::fromYaml(const QString& text, Error* error) {
    std::optional<StructTemplate> structTemplate;
    try {
        structTemplate = templateFromNode(YAML::Load(text.toStdString()), error);
    } catch (const YAML::Exception& e) {
        setError(error, ErrorKind::Parse,
                 QStringLiteral("Failed to parse template YAML: %1")
                     .arg(QString::fromUtf8(e.what())));
        return std::nullopt;
    }
    if (!structTemplate.has_value() || !validate(*structTemplate, error)) {
        return std::nullopt;
    }
    return structTemplate;
}

std::optional<StructTemplate> TemplateLoader::fromFile(const QString& filePath, Error* error) {
    Error readError;
    const std::optional<QByteArray> bytes = ByteSource::readFile(filePath, &readError);
    if (!bytes.has_value()) {
        setError(error, ErrorKind::Io,
                 QStringLiteral("Failed to read template file '%1': %2")
                     .arg(filePath, readError.message));
        return std::nullopt;
    }
    return fromYaml(QString::fromUtf8(*bytes), error);
}

std::optional<Endianness> TemplateLoader::parseEndianness(const QString& text, Error* error) {
    const QString name = text.toLower();
    static const QStringList kLittle{QStringLiteral("little"), QStringLiteral("le"),
                                     QStringLiteral("little-endian"),
                                     QStringLiteral("littleendian")};
    static const QStringList kBig{QStringLiteral("big"), QStringLiteral("be"),
                                  QStringLiteral("big-endian"), QStringLiteral("bigendian")};
    if (kLittle.contains(name)) {
        return Endianness::Little;
    }
    if (kBig.contains(name)) {
        return Endianness::Big;
    }
    setError(error, ErrorKind::Parse,
             QStringLiteral("Invalid endianness '%1': expected 'little' or 'big'").arg(text));
    return std::nullopt;
}

std::optional<FieldType> TemplateLoader::parseFieldType(const QString& text, Error* error) {
    const QString name = text.toLower();
    for (const TypeAlias& alias : kTypeAliases) {
        if (name == QLatin1String(alias.name)) {
            return alias.type;
        }
    }
    setError(error, ErrorKind::Parse,
             QStringLiteral("Invalid field type '%1': expected u8, u16, u32, u64, i8, i16, i32, "
                            "i64, hex_string, string, or bytes")
                 .arg(text));
    return std::nullopt;
}

std::optional<FieldDisplay> TemplateLoader::parseDisplay(const QString& text, Error* error) {
    const QString name = text.toLower();
    if (name == QStringLiteral("dec") || name == QStringLiteral("decimal")) {
        return FieldDisplay::Decimal;
    }
    if (name == QStringLiteral("hex") || name == QStringLiteral("hexadecimal")) {
        return FieldDisplay::Hex;
    }
    if (name == QStringLiteral("oct") || name == QStringLiteral("octal")) {
        return FieldDisplay::Octal;
    }
    if (name == QStringLiteral("bin") || name == QStringLiteral("binary")) {
        return FieldDisplay::Binary;
    }
    setError(error, ErrorKind::Parse,
             QStringLiteral("Invalid display '%1': expected dec, hex, oct, or bin").arg(text));
    return std::nullopt;
}

bool TemplateLoader::validate(const StructTemplate& structTemplate, Error* error) {
    QSet<QString> seen;
    for (const FieldDefinition& field : structTemplate.fields) {
        if (seen.contains(field.name)) {
            return setError(error, ErrorKind::Parse,
                            QStringLiteral("Duplicate field name '%1' in template")
                                .arg(field.name));
        }
        seen.insert(field.name);

        const int width = fixedSize(field.type);
        if (width > 0 && field.size != static_cast<quint64>(width)) {
            return setError(error, ErrorKind::Parse,
                            QStringLiteral("Field '%1' has type %2 which requires %3 bytes, but "
                                           "size is %4")
                                .arg(field.name, typeName(field.type))
                                .arg(width)
                                .arg(field.size));
        }
        if (field.size > std::numeric_limits<quint64>::max() - field.offset) {
            return setError(error, ErrorKind::Parse,
                            QStringLiteral("Field '%1' ends past the addressable range")
                                .arg(field.name));
        }
    }
    return true;
}

int TemplateLoader::fixedSize(FieldType type) {
    switch (type) {
        case FieldType::U8:
        case FieldType::I8:
            return 1;
        case FieldType::U16:
        case FieldType::I16:
            return 2;
        case FieldType::U32:
        case FieldType::I32:
            return 4;
        case FieldType::U64:
        case FieldType::I64:
            return 8;
        case FieldType::HexString:
        case FieldType::String:
        case FieldType::Bytes:
            return 0;
    }
    return 0;
}

bool TemplateLoader::isInteger(FieldType type) { return fixedSize(type) > 0; }

bool TemplateLoader::isSigned(FieldType type) {
    return type == FieldType::I8 || type == FieldType::I16 || type == FieldType::I32 ||
           type == FieldType::I64;
}

QString TemplateLoader::typeName(FieldType type) {
    switch (type) {
        case FieldType::U8:
            return QStringLiteral("u8");
        case FieldType::U16:
            return QStringLiteral("u16");
        case FieldType::U32:
            return QStringLiteral("u32");
        case FieldType::U64:
            return QStringLiteral("u64");
        case FieldType::I8:
            return QStringLiteral("i8");
        case FieldType::I16:
            return QStringLiteral("i16");
        case FieldType::I32:
            return QStringLiteral("i32");
        case FieldType::I64:
            return QStringLiteral("i64");
        case FieldType::HexString:
            return QStringLiteral("hex_string");
        case FieldType::String:
            return QStringLiteral("string");
        case FieldType::Bytes:
            return QStringLiteral("bytes");
    }
    return QString();
}

}  // namespace binfiddle
