#include "struct/StructParser.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QtEndian>

#include <algorithm>
#include <string>

#include <yaml-cpp/yaml.h>

namespace binfiddle {

namespace {
const QChar kCheckMark(0x2713);
const QChar kCrossMark(0x2717);

constexpr int kOffsetColumn = 10;
constexpr int kSizeColumn = 4;
constexpr int kTypeColumn = 10;

QString offsetText(quint64 offset) {
    return QStringLiteral("0x%1").arg(offset, 8, 16, QLatin1Char('0'));
}

quint64 readUnsigned(const QByteArray& raw, Endianness endian) {
    const uchar* bytes = reinterpret_cast<const uchar*>(raw.constData());
    const bool little = endian == Endianness::Little;
    switch (raw.size()) {
        case 1:
            return bytes[0];
        case 2:
            return little ? qFromLittleEndian<quint16>(bytes) : qFromBigEndian<quint16>(bytes);
        case 4:
            return little ? qFromLittleEndian<quint32>(bytes) : qFromBigEndian<quint32>(bytes);
        default:
            return little ? qFromLittleEndian<quint64>(bytes) : qFromBigEndian<quint64>(bytes);
    }
}

qint64 signExtend(quint64 bits, int width) {
    switch (width) {
        case 1:
            return static_cast<qint8>(static_cast<quint8>(bits));
        case 2:
            return static_cast<qint16>(static_cast<quint16>(bits));
        case 4:
            return static_cast<qint32>(static_cast<quint32>(bits));
        default:
            return static_cast<qint64>(bits);
    }
}

// Hex, octal and binary show the two's complement bits at the field width.
QString displayText(quint64 bits, int width, FieldDisplay display) {
    switch (display) {
        case FieldDisplay::Hex:
            return QStringLiteral("0x%1").arg(bits, width * 2, 16, QLatin1Char('0'));
        case FieldDisplay::Octal:
            return QStringLiteral("0o%1").arg(bits, 0, 8);
        case FieldDisplay::Binary:
            return QStringLiteral("0b%1").arg(bits, width * 8, 2, QLatin1Char('0'));
        case FieldDisplay::Decimal:
            break;
    }
    return QString();
}

void decodeField(const FieldDefinition& field, const QByteArray& raw, Endianness endian,
                 ParsedField& parsed) {
    if (TemplateLoader::isInteger(field.type)) {
        const int width = TemplateLoader::fixedSize(field.type);
        const quint64 bits = readUnsigned(raw, endian);
        parsed.numericValue = TemplateLoader::isSigned(field.type)
                                  ? QString::number(signExtend(bits, width))
                                  : QString::number(bits);
        parsed.value = field.display == FieldDisplay::Decimal
                           ? *parsed.numericValue
                           : displayText(bits, width, field.display);
        return;
    }
    if (field.type == FieldType::String) {
        const qsizetype end = raw.indexOf('\0');
        const QByteArray text = end < 0 ? raw : raw.left(end);
        parsed.value = QStringLiteral("\"%1\"").arg(QString::fromUtf8(text));
        return;
    }
    parsed.value = QString::fromLatin1(raw.toHex(' '));
}

// Rows are padded column by column; trailing blanks of empty last columns are dropped.
QString row(const QStringList& cells) {
    QString line = cells.join(QStringLiteral("  "));
    while (line.endsWith(QLatin1Char(' '))) {
        line.chop(1);
    }
    return line;
}

void emitNumber(YAML::Emitter& out, const QString& decimal) {
    bool ok = false;
    const qlonglong value = decimal.toLongLong(&ok);
    if (ok) {
        out << static_cast<long long>(value);
        return;
    }
    out << static_cast<unsigned long long>(decimal.toULongLong());
}

QJsonValue jsonNumber(const QString& decimal) {
    bool ok = false;
    const qint64 value = decimal.toLongLong(&ok);
    return ok ? QJsonValue(value) : QJsonValue(decimal);
}
}  // namespace

std::optional<StructOutputFormat> StructParser::parseFormat(const QString& text, Error* error) {
    const QString name = text.toLower();
    if (name == QStringLiteral("human") || name == QStringLiteral("table") ||
        name == QStringLiteral("text")) {
        return StructOutputFormat::Human;
    }
    if (name == QStringLiteral("json")) {
        return StructOutputFormat::Json;
    }
    if (name == QStringLiteral("yaml") || name == QStringLiteral("yml")) {
        return StructOutputFormat::Yaml;
    }
    setError(error, ErrorKind::InvalidInput,
             QStringLiteral("Unknown output format: '%1'. Supported: human, json, yaml")
                 .arg(text));
    return std::nullopt;
}

std::optional<ParsedStruct> StructParser::parse(const QByteArray& data,
                                                const StructTemplate& structTemplate,
                                                const QStringList& selection, Error* error) {
    if (!TemplateLoader::validate(structTemplate, error)) {
        return std::nullopt;
    }
    for (const QString& name : selection) {
        const bool known = std::any_of(
            structTemplate.fields.cbegin(), structTemplate.fields.cend(),
            [&name](const FieldDefinition& field) { return field.name == name; });
        if (!known) {
            setError(error, ErrorKind::InvalidInput,
                     QStringLiteral("Field '%1' not found in template '%2'")
                         .arg(name, structTemplate.name));
            return std::nullopt;
        }
    }

    ParsedStruct parsed;
    parsed.name = structTemplate.name;
    parsed.description = structTemplate.description;
    const quint64 length = static_cast<quint64>(data.size());
    for (const FieldDefinition& field : structTemplate.fields) {
        if (!selection.isEmpty() && !selection.contains(field.name)) {
            continue;
        }
        if (field.offset > length || field.size > length - field.offset) {
            setError(error, ErrorKind::InvalidRange,
                     QStringLiteral("Field '%1' at offset 0x%2 with size %3 exceeds data "
                                    "length %4")
                         .arg(field.name)
                         .arg(field.offset, 0, 16)
                         .arg(field.size)
                         .arg(length));
            return std::nullopt;
        }

        const QByteArray raw = data.mid(static_cast<qsizetype>(field.offset),
                                        static_cast<qsizetype>(field.size));
        ParsedField entry;
        entry.name = field.name;
        entry.offset = field.offset;
        entry.size = field.size;
        entry.description = field.description;
        decodeField(field, raw, structTemplate.endian, entry);

        if (entry.numericValue.has_value()) {
            const auto named = field.enumNames.constFind(*entry.numericValue);
            if (named != field.enumNames.cend()) {
                entry.enumName = named.value();
                entry.value = QStringLiteral("%1 (%2)").arg(entry.value, named.value());
            }
        }
        if (field.expected.has_value()) {
            entry.assertionPassed = *field.expected == raw;
            parsed.allAssertionsPassed = parsed.allAssertionsPassed && *entry.assertionPassed;
        }
        parsed.fields.push_back(entry);
    }
    return parsed;
}

std::optional<QString> StructParser::fieldValue(const QByteArray& data,
                                                const StructTemplate& structTemplate,
                                                const QString& name, Error* error) {
    const std::optional<ParsedStruct> parsed = parse(data, structTemplate, {name}, error);
    if (!parsed.has_value()) {
        return std::nullopt;
    }
    return parsed->fields.first().value;
}

std::optional<QString> StructParser::format(const ParsedStruct& parsed,
                                            StructOutputFormat outputFormat, Error* error) {
    switch (outputFormat) {
        case StructOutputFormat::Human:
            return formatHuman(parsed);
        case StructOutputFormat::Json:
            return formatJson(parsed);
        case StructOutputFormat::Yaml:
            return formatYaml(parsed, error);
    }
    setError(error, ErrorKind::UnsupportedOperation, QStringLiteral("Unknown output format"));
    return std::nullopt;
}

QString StructParser::formatHuman(const ParsedStruct& parsed) {
    QString out = QStringLiteral("Structure: %1\n").arg(parsed.name);
    if (!parsed.description.isEmpty()) {
        out += QStringLiteral("Description: %1\n").arg(parsed.description);
    }
    out += parsed.allAssertionsPassed
               ? QStringLiteral("Assertions: %1 All passed\n\n").arg(kCheckMark)
               : QStringLiteral("Assertions: %1 Some failed\n\n").arg(kCrossMark);

    qsizetype nameWidth = 4;
    qsizetype valueWidth = 5;
    for (const ParsedField& field : parsed.fields) {
        nameWidth = std::max(nameWidth, field.name.size());
        valueWidth = std::max(valueWidth, field.value.size());
    }

    out += row({QStringLiteral("Name").leftJustified(nameWidth),
                QStringLiteral("Offset").rightJustified(kOffsetColumn),
                QStringLiteral("Size").rightJustified(kSizeColumn),
                QStringLiteral("Value").leftJustified(valueWidth), QStringLiteral("Status")});
    out += QLatin1Char('\n');
    out += QString(nameWidth + kOffsetColumn + kSizeColumn + valueWidth + 6 + 8, QLatin1Char('-'));

    for (const ParsedField& field : parsed.fields) {
        QString status;
        if (field.assertionPassed.has_value()) {
            status = *field.assertionPassed ? QString(kCheckMark)
                                            : QStringLiteral("%1 FAIL").arg(kCrossMark);
        }
        out += QLatin1Char('\n');
        out += row({field.name.leftJustified(nameWidth), offsetText(field.offset),
                    QString::number(field.size).rightJustified(kSizeColumn),
                    field.value.leftJustified(valueWidth), status});
    }
    return out;
}

QString StructParser::formatJson(const ParsedStruct& parsed) {
    QJsonArray fields;
    for (const ParsedField& field : parsed.fields) {
        QJsonObject entry;
        entry.insert(QStringLiteral("name"), field.name);
        entry.insert(QStringLiteral("offset"), static_cast<qint64>(field.offset));
        entry.insert(QStringLiteral("size"), static_cast<qint64>(field.size));
        entry.insert(QStringLiteral("value"), field.value);
        if (field.numericValue.has_value()) {
            entry.insert(QStringLiteral("numeric_value"), jsonNumber(*field.numericValue));
        }
        if (field.enumName.has_value()) {
            entry.insert(QStringLiteral("enum_name"), *field.enumName);
        }
        if (field.assertionPassed.has_value()) {
            entry.insert(QStringLiteral("assertion_passed"), *field.assertionPassed);
        }
        if (!field.description.isEmpty()) {
            entry.insert(QStringLiteral("description"), field.description);
        }
        fields.append(entry);
    }

    QJsonObject root;
    root.insert(QStringLiteral("name"), parsed.name);
    if (!parsed.description.isEmpty()) {
        root.insert(QStringLiteral("description"), parsed.description);
    }
    root.insert(QStringLiteral("fields"), fields);
    root.insert(QStringLiteral("all_assertions_passed"), parsed.allAssertionsPassed);
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented)).trimmed();
}

std::optional<QString> StructParser::formatYaml(const ParsedStruct& parsed, Error* error) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << parsed.name.toStdString();
    if (!parsed.description.isEmpty()) {
        out << YAML::Key << "description" << YAML::Value << parsed.description.toStdString();
    }
    out << YAML::Key << "fields" << YAML::Value << YAML::BeginSeq;
    for (const ParsedField& field : parsed.fields) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << field.name.toStdString();
        out << YAML::Key << "offset" << YAML::Value
            << static_cast<unsigned long long>(field.offset);
        out << YAML::Key << "size" << YAML::Value << static_cast<unsigned long long>(field.size);
        out << YAML::Key << "value" << YAML::Value << field.value.toStdString();
        if (field.numericValue.has_value()) {
            out << YAML::Key << "numeric_value" << YAML::Value;
            emitNumber(out, *field.numericValue);
        }
        if (field.enumName.has_value()) {
            out << YAML::Key << "enum_name" << YAML::Value << field.enumName->toStdString();
        }
        if (field.assertionPassed.has_value()) {
            out << YAML::Key << "assertion_passed" << YAML::Value << *field.assertionPassed;
        }
        if (!field.description.isEmpty()) {
            out << YAML::Key << "description" << YAML::Value << field.description.toStdString();
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::Key << "all_assertions_passed" << YAML::Value << parsed.allAssertionsPassed;
    out << YAML::EndMap;

    if (!out.good()) {
        setError(error, ErrorKind::Parse,
                 QStringLiteral("Failed to serialize structure as YAML: %1")
                     .arg(QString::fromStdString(out.GetLastError())));
        return std::nullopt;
    }
    return QString::fromUtf8(out.c_str());
}

QString StructParser::listFields(const StructTemplate& structTemplate) {
    QString out = QStringLiteral("Template: %1\n").arg(structTemplate.name);
    if (!structTemplate.description.isEmpty()) {
        out += QStringLiteral("Description: %1\n").arg(structTemplate.description);
    }
    out += QStringLiteral("Endianness: %1\n")
               .arg(structTemplate.endian == Endianness::Little ? QStringLiteral("Little")
                                                                : QStringLiteral("Big"));
    out += QStringLiteral("Total size: %1 bytes\n").arg(structTemplate.totalSize());
    out += QStringLiteral("Fields: %1\n\n").arg(structTemplate.fields.size());

    qsizetype nameWidth = 4;
    for (const FieldDefinition& field : structTemplate.fields) {
        nameWidth = std::max(nameWidth, field.name.size());
    }
    out += row({QStringLiteral("Name").leftJustified(nameWidth),
                QStringLiteral("Offset").rightJustified(kOffsetColumn),
                QStringLiteral("Size").rightJustified(kSizeColumn),
                QStringLiteral("Type").leftJustified(kTypeColumn), QStringLiteral("Description")});
    out += QLatin1Char('\n');
    out += QString(nameWidth + kOffsetColumn + kSizeColumn + kTypeColumn + 8 + 11,
                   QLatin1Char('-'));

    for (const FieldDefinition& field : structTemplate.fields) {
        out += QLatin1Char('\n');
        out += row({field.name.leftJustified(nameWidth), offsetText(field.offset),
                    QString::number(field.size).rightJustified(kSizeColumn),
                    TemplateLoader::typeName(field.type).leftJustified(kTypeColumn),
                    field.description.isEmpty() ? QStringLiteral("-") : field.description});
    }
    return out;
}

}  // namespace binfiddle
