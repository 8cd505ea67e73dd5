#pragma once

#include <QByteArray>
#include <QString>
#include <QVector>
#include <QtGlobal>
#include <optional>

#include "core/Error.h"
#include "diff/DiffTypes.h"

namespace binfiddle {

class DiffEngine {
public:
    explicit DiffEngine(DiffConfig config);

    const DiffConfig& config() const { return m_config; }

    // One entry per offset in [0, max(len1, len2)) whose bytes differ, skipping ignored
    // ranges.
    QVector<DiffEntry> compare(const QByteArray& data1, const QByteArray& data2) const;
    bool isIgnored(quint64 offset) const;

    // Greedy left-to-right grouping. An entry joins the current hunk when the gap g to the
    // hunk's last offset satisfies, in order: g <= 16; n > 100 and g <= 256; n > 20 and
    // g <= 128; g <= 64; g <= 2 * context + 1 (n is the current hunk size).
    QVector<Hunk> groupIntoHunks(const QVector<DiffEntry>& diffs) const;

    QString summary(const QVector<DiffEntry>& diffs, quint64 length1, quint64 length2) const;

    // Accepts every keyword except "auto", which the caller resolves through autoSelect().
    static std::optional<DiffFormat> parseFormat(const QString& text, Error* error);
    static std::optional<ColorMode> parseColorMode(const QString& text, Error* error);
    static DiffFormat autoSelect(quint64 totalDiffs, quint64 fileSize);

private:
    DiffConfig m_config;
};

}  // namespace binfiddle
