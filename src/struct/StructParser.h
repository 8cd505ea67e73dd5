#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>
#include <optional>

#include "core/Error.h"
#include "struct/StructTemplate.h"

namespace binfiddle {

enum class StructOutputFormat {
    Human = 0,
    Json,
    Yaml
};

struct ParsedField {
    QString name;
    quint64 offset = 0;
    quint64 size = 0;
    // Display text; integer fields with an enum match read "value (name)".
    QString value;
    // Decimal value of integer fields.
    std::optional<QString> numericValue;
    std::optional<QString> enumName;
    // Set only for fields with an expected value.
    std::optional<bool> assertionPassed;
    QString description;
};

struct ParsedStruct {
    QString name;
    QString description;
    QVector<ParsedField> fields;
    bool allAssertionsPassed = true;
};

// Decodes binary data through a structure template and renders the result.
class StructParser {
public:
    static std::optional<StructOutputFormat> parseFormat(const QString& text, Error* error);

    // An empty selection decodes every field, otherwise only the named ones in template order.
    static std::optional<ParsedStruct> parse(const QByteArray& data,
                                             const StructTemplate& structTemplate,
                                             const QStringList& selection, Error* error);
    static std::optional<QString> fieldValue(const QByteArray& data,
                                             const StructTemplate& structTemplate,
                                             const QString& name, Error* error);

    static std::optional<QString> format(const ParsedStruct& parsed,
                                         StructOutputFormat outputFormat, Error* error);
    static QString formatHuman(const ParsedStruct& parsed);
    static QString formatJson(const ParsedStruct& parsed);
    static std::optional<QString> formatYaml(const ParsedStruct& parsed, Error* error);

    static QString listFields(const StructTemplate& structTemplate);
};

}  // namespace binfiddle
