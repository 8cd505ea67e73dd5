#pragma once

#include <QByteArray>
#include <QHash>
#include <QString>
#include <QVector>
#include <QtGlobal>
#include <optional>

#include "core/Error.h"

namespace binfiddle {

enum class Endianness {
    Little = 0,
    Big
};

enum class FieldType {
    U8 = 0,
    U16,
    U32,
    U64,
    I8,
    I16,
    I32,
    I64,
    HexString,
    String,
    Bytes
};

// Rendering of integer field values. Non-integer fields ignore it.
enum class FieldDisplay {
    Decimal = 0,
    Hex,
    Octal,
    Binary
};

struct FieldDefinition {
    QString name;
    quint64 offset = 0;
    quint64 size = 0;
    FieldType type = FieldType::Bytes;
    // Expected raw bytes of the field.
    std::optional<QByteArray> expected;
    // Decimal value -> symbolic name.
    QHash<QString, QString> enumNames;
    QString description;
    FieldDisplay display = FieldDisplay::Decimal;
};

struct StructTemplate {
    QString name;
    QString description;
    Endianness endian = Endianness::Little;
    QVector<FieldDefinition> fields;

    // Largest offset + size over all fields, 0 without fields.
    quint64 totalSize() const;
};

// Builds structure templates from YAML documents of the form
//
//   name: ELF Header
//   endian: little
//   fields:
//     - name: magic
//       offset: 0x0
//       size: 4
//       type: hex_string
//       assert: "7f454c46"
//
// Offsets and sizes take decimal or 0x-prefixed hexadecimal values.
class TemplateLoader {
public:
    static std::optional<StructTemplate> fromYaml(const QString& text, Error* error);
    static std::optional<StructTemplate> fromFile(const QString& filePath, Error* error);

    static std::optional<Endianness> parseEndianness(const QString& text, Error* error);
    static std::optional<FieldType> parseFieldType(const QString& text, Error* error);
    static std::optional<FieldDisplay> parseDisplay(const QString& text, Error* error);

    // Rejects duplicate field names and integer fields whose size differs from the type width.
    static bool validate(const StructTemplate& structTemplate, Error* error);

    // Byte width of an integer type, 0 for variable-width types.
    static int fixedSize(FieldType type);
    static bool isInteger(FieldType type);
    static bool isSigned(FieldType type);
    static QString typeName(FieldType type);
};

}  // namespace binfiddle
