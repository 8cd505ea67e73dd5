#pragma once

#include <QByteArray>
#include <QSet>
#include <QString>
#include <QVector>
#include <QtGlobal>

#include "diff/DiffEngine.h"
#include "diff/DiffTypes.h"

namespace binfiddle {

// Turns a difference list into text. Rendered output never ends with a newline except the
// summary report.
class DiffRenderer {
public:
    explicit DiffRenderer(const DiffEngine& engine);

    QString render(const QByteArray& data1, const QByteArray& data2,
                   const QVector<DiffEntry>& diffs, const QString& name1,
                   const QString& name2) const;

    QString renderSimple(const QVector<DiffEntry>& diffs, bool color) const;
    QString renderUnified(const QByteArray& data1, const QByteArray& data2,
                          const QVector<DiffEntry>& diffs, const QString& name1,
                          const QString& name2, bool color) const;
    QString renderSideBySide(const QByteArray& data1, const QByteArray& data2,
                             const QVector<DiffEntry>& diffs, const QString& name1,
                             const QString& name2, bool color) const;
    QString renderPatch(const QVector<DiffEntry>& diffs, const QString& name1,
                        const QString& name2) const;
    QString renderSummary(const QByteArray& data1, const QByteArray& data2,
                          const QVector<DiffEntry>& diffs, const QString& name1,
                          const QString& name2) const;

    // Auto resolves to whether stdout is a terminal.
    static bool shouldUseColor(ColorMode mode);
    static QString formatSize(quint64 bytes);

private:
    struct HunkSpan {
        quint64 start = 0;
        quint64 end1 = 0;
        quint64 end2 = 0;
    };

    HunkSpan spanOf(const QVector<DiffEntry>& diffs, const Hunk& hunk, quint64 length1,
                    quint64 length2) const;
    void appendUnifiedRow(QString& out, const QByteArray& data, quint64 start, quint64 end,
                          QChar marker, bool color, const QSet<quint64>& diffOffsets) const;
    QString sideRow(const QByteArray& data, quint64 start, quint64 end, bool color,
                    const QSet<quint64>& diffOffsets, bool left) const;
    int rowWidth() const;

    const DiffEngine& m_engine;
};

}  // namespace binfiddle
