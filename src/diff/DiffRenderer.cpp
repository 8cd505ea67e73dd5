#include "diff/DiffRenderer.h"

#include <QStringList>

#include <cstdio>
#ifdef Q_OS_WIN
#include <io.h>
#else
#include <unistd.h>
#endif

#include "text/ByteDisplay.h"

namespace binfiddle {

namespace {
const QString kReset = QStringLiteral("\x1b[0m");
const QString kBoldRed = QStringLiteral("\x1b[1;31m");
const QString kBoldGreen = QStringLiteral("\x1b[1;32m");
const QString kBoldYellow = QStringLiteral("\x1b[1;33m");
const QString kCyan = QStringLiteral("\x1b[36m");
const QString kDim = QStringLiteral("\x1b[2m");
const QString kMagenta = QStringLiteral("\x1b[35m");

QString paint(const QString& text, const QString& colour) { return colour + text + kReset; }

QString byteHex(quint8 value) {
    return QStringLiteral("%1").arg(static_cast<uint>(value), 2, 16, QLatin1Char('0'));
}

QString rowOffset(quint64 offset) { return formatOffset(offset) + QStringLiteral(": "); }

bool rowHasDiff(quint64 start, quint64 end, const QSet<quint64>& diffOffsets) {
    for (quint64 offset = start; offset < end; ++offset) {
        if (diffOffsets.contains(offset)) {
            return true;
        }
    }
    return false;
}

quint8 byteAt(const QByteArray& data, quint64 offset) {
    return static_cast<quint8>(data.at(static_cast<qsizetype>(offset)));
}

void chopTrailingNewline(QString& text) {
    if (text.endsWith(QLatin1Char('\n'))) {
        text.chop(1);
    }
}

QString percent(double value, int width, int precision) {
    return QStringLiteral("%1").arg(value, width, 'f', precision);
}
}  // namespace

DiffRenderer::DiffRenderer(const DiffEngine& engine) : m_engine(engine) {}

bool DiffRenderer::shouldUseColor(ColorMode mode) {
    switch (mode) {
        case ColorMode::Always:
            return true;
        case ColorMode::Never:
            return false;
        case ColorMode::Auto:
#ifdef Q_OS_WIN
            return ::_isatty(::_fileno(stdout)) != 0;
#else
            return ::isatty(::fileno(stdout)) != 0;
#endif
    }
    return false;
}

QString DiffRenderer::formatSize(quint64 bytes) {
    if (bytes < 1024ULL) {
        return QStringLiteral("%1 bytes").arg(bytes);
    }
    if (bytes < 1024ULL * 1024ULL) {
        return QStringLiteral("%1 KB").arg(static_cast<double>(bytes) / 1024.0, 0, 'f', 1);
    }
    return QStringLiteral("%1 MB").arg(static_cast<double>(bytes) / (1024.0 * 1024.0), 0, 'f', 2);
}

int DiffRenderer::rowWidth() const { return qMax(1, m_engine.config().width); }

QString DiffRenderer::render(const QByteArray& data1, const QByteArray& data2,
                             const QVector<DiffEntry>& diffs, const QString& name1,
                             const QString& name2) const {
    const bool color = shouldUseColor(m_engine.config().color);
    switch (m_engine.config().format) {
        case DiffFormat::Simple:
            return renderSimple(diffs, color);
        case DiffFormat::Unified:
            return renderUnified(data1, data2, diffs, name1, name2, color);
        case DiffFormat::SideBySide:
            return renderSideBySide(data1, data2, diffs, name1, name2, color);
        case DiffFormat::Patch:
            return renderPatch(diffs, name1, name2);
        case DiffFormat::Summary:
            return renderSummary(data1, data2, diffs, name1, name2);
    }
    return QString();
}

QString DiffRenderer::renderSimple(const QVector<DiffEntry>& diffs, bool color) const {
    QStringList lines;
    lines.reserve(diffs.size());
    const QString eof = QStringLiteral("EOF");
    for (const DiffEntry& entry : diffs) {
        QString left = entry.byte1.has_value() ? QStringLiteral("0x") + byteHex(*entry.byte1) : eof;
        QString right =
            entry.byte2.has_value() ? QStringLiteral("0x") + byteHex(*entry.byte2) : eof;
        QString offset = formatOffset(entry.offset);
        if (color) {
            left = paint(left, entry.byte1.has_value() ? kBoldRed : kDim);
            right = paint(right, entry.byte2.has_value() ? kBoldGreen : kDim);
            offset = paint(offset, kCyan);
        }
        lines.push_back(QStringLiteral("%1: %2 != %3").arg(offset, left, right));
    }
    return lines.join(QLatin1Char('\n'));
}

DiffRenderer::HunkSpan DiffRenderer::spanOf(const QVector<DiffEntry>& diffs, const Hunk& hunk,
                                            quint64 length1, quint64 length2) const {
    const quint64 context = static_cast<quint64>(qMax(0, m_engine.config().context));
    const quint64 first = diffs.at(hunk.first()).offset;
    const quint64 last = diffs.at(hunk.last()).offset;

    HunkSpan span;
    span.start = first > context ? first - context : 0;
    span.end1 = qMin(last + context + 1, length1);
    span.end2 = qMin(last + context + 1, length2);
    return span;
}

void DiffRenderer::appendUnifiedRow(QString& out, const QByteArray& data, quint64 start,
                                    quint64 end, QChar marker, bool color,
                                    const QSet<quint64>& diffOffsets) const {
    const quint64 length = static_cast<quint64>(data.size());
    QString highlight = kBoldYellow;
    if (marker == QLatin1Char('-')) {
        highlight = kBoldRed;
    } else if (marker == QLatin1Char('+')) {
        highlight = kBoldGreen;
    }

    if (color && marker != QLatin1Char(' ')) {
        out += paint(QString(marker), highlight);
    } else {
        out += marker;
    }
    out += rowOffset(start);

    for (quint64 offset = start; offset < end; ++offset) {
        if (offset >= length) {
            out += color ? paint(QStringLiteral("--"), kDim) + QLatin1Char(' ')
                         : QStringLiteral("-- ");
            continue;
        }
        const QString hex = byteHex(byteAt(data, offset));
        out += (color && diffOffsets.contains(offset)) ? paint(hex, highlight) : hex;
        out += QLatin1Char(' ');
    }

    out += QStringLiteral(" |");
    for (quint64 offset = start; offset < end; ++offset) {
        if (offset >= length) {
            out += QLatin1Char(' ');
            continue;
        }
        const quint8 byte = byteAt(data, offset);
        const QString ch(QChar(isPrintableAscii(byte) ? static_cast<char16_t>(byte) : u'.'));
        out += (color && diffOffsets.contains(offset)) ? paint(ch, highlight) : ch;
    }
    out += QStringLiteral("|\n");
}

QString DiffRenderer::renderUnified(const QByteArray& data1, const QByteArray& data2,
                                    const QVector<DiffEntry>& diffs, const QString& name1,
                                    const QString& name2, bool color) const {
    if (diffs.isEmpty()) {
        return QString();
    }

    QString out;
    const QString header1 = QStringLiteral("--- ") + name1;
    const QString header2 = QStringLiteral("+++ ") + name2;
    out += (color ? paint(header1, kBoldRed) : header1) + QLatin1Char('\n');
    out += (color ? paint(header2, kBoldGreen) : header2) + QLatin1Char('\n');

    const quint64 length1 = static_cast<quint64>(data1.size());
    const quint64 length2 = static_cast<quint64>(data2.size());
    const quint64 width = static_cast<quint64>(rowWidth());

    for (const Hunk& hunk : m_engine.groupIntoHunks(diffs)) {
        const HunkSpan span = spanOf(diffs, hunk, length1, length2);
        const quint64 end = qMax(span.end1, span.end2);

        const QString hunkHeader =
            QStringLiteral("@@ -0x%1,0x%2 +0x%3,0x%4 @@")
                .arg(QString::number(span.start, 16),
                     QString::number(span.end1 > span.start ? span.end1 - span.start : 0, 16),
                     QString::number(span.start, 16),
                     QString::number(span.end2 > span.start ? span.end2 - span.start : 0, 16));
        out += (color ? paint(hunkHeader, kMagenta) : hunkHeader) + QLatin1Char('\n');

        QSet<quint64> diffOffsets;
        for (const qsizetype idx : hunk) {
            diffOffsets.insert(diffs.at(idx).offset);
        }

        for (quint64 offset = span.start; offset < end;) {
            const quint64 rowEnd = qMin(offset + width, end);
            if (rowHasDiff(offset, rowEnd, diffOffsets)) {
                appendUnifiedRow(out, data1, offset, rowEnd, QLatin1Char('-'), color, diffOffsets);
                appendUnifiedRow(out, data2, offset, rowEnd, QLatin1Char('+'), color, diffOffsets);
            } else {
                appendUnifiedRow(out, data1, offset, rowEnd, QLatin1Char(' '), color, diffOffsets);
            }
            offset = rowEnd;
        }
    }

    chopTrailingNewline(out);
    return out;
}

QString DiffRenderer::sideRow(const QByteArray& data, quint64 start, quint64 end, bool color,
                              const QSet<quint64>& diffOffsets, bool left) const {
    const quint64 length = static_cast<quint64>(data.size());
    QString out = rowOffset(start);
    for (quint64 offset = start; offset < end; ++offset) {
        if (offset >= length) {
            out += QStringLiteral("   ");
            continue;
        }
        const QString hex = byteHex(byteAt(data, offset));
        if (color && diffOffsets.contains(offset)) {
            out += paint(hex, left ? kBoldRed : kBoldGreen);
        } else {
            out += hex;
        }
        out += QLatin1Char(' ');
    }
    return out;
}

QString DiffRenderer::renderSideBySide(const QByteArray& data1, const QByteArray& data2,
                                       const QVector<DiffEntry>& diffs, const QString& name1,
                                       const QString& name2, bool color) const {
    if (diffs.isEmpty()) {
        return QString();
    }

    const int width = rowWidth();
    const int halfWidth = width * 3 + 12;
    QString out;
    const QString left = name1.leftJustified(halfWidth);
    const QString right = name2.leftJustified(halfWidth);
    if (color) {
        out += paint(left, kBoldRed) + QStringLiteral(" | ") + paint(right, kBoldGreen);
    } else {
        out += left + QStringLiteral(" | ") + right;
    }
    out += QLatin1Char('\n');
    out += QString(halfWidth, QLatin1Char('-')) + QStringLiteral("-+-") +
           QString(halfWidth, QLatin1Char('-')) + QLatin1Char('\n');

    QSet<quint64> diffOffsets;
    diffOffsets.reserve(diffs.size());
    for (const DiffEntry& entry : diffs) {
        diffOffsets.insert(entry.offset);
    }

    const quint64 length1 = static_cast<quint64>(data1.size());
    const quint64 length2 = static_cast<quint64>(data2.size());
    const quint64 step = static_cast<quint64>(width);
    const QString changedSeparator =
        color ? QStringLiteral(" ") + paint(QStringLiteral("!"), kBoldYellow) + QStringLiteral(" ")
              : QStringLiteral(" ! ");

    for (const Hunk& hunk : m_engine.groupIntoHunks(diffs)) {
        const HunkSpan span = spanOf(diffs, hunk, length1, length2);
        const quint64 end = qMax(span.end1, span.end2);
        const quint64 start = (span.start / step) * step;

        for (quint64 offset = start; offset < end;) {
            const quint64 rowEnd = qMin(offset + step, end);
            const bool changed = rowHasDiff(offset, rowEnd, diffOffsets);
            out += sideRow(data1, offset, rowEnd, color, diffOffsets, true);
            out += changed ? changedSeparator : QStringLiteral(" | ");
            out += sideRow(data2, offset, rowEnd, color, diffOffsets, false);
            out += QLatin1Char('\n');
            offset = rowEnd;
        }
        out += QLatin1Char('\n');
    }

    while (out.endsWith(QLatin1Char('\n'))) {
        out.chop(1);
    }
    return out;
}

QString DiffRenderer::renderPatch(const QVector<DiffEntry>& diffs, const QString& name1,
                                  const QString& name2) const {
    QString out;
    out += QStringLiteral("# binfiddle patch file\n");
    out += QStringLiteral("# source: %1\n").arg(name1);
    out += QStringLiteral("# target: %1\n").arg(name2);
    out += QStringLiteral("# format: OFFSET:OLD_HEX:NEW_HEX\n");
    out += QStringLiteral("# differences: %1\n").arg(diffs.size());
    out += QStringLiteral("#\n");
    for (const DiffEntry& entry : diffs) {
        out += QStringLiteral("%1:%2:%3\n")
                   .arg(formatOffset(entry.offset),
                        entry.byte1.has_value() ? byteHex(*entry.byte1) : QString(),
                        entry.byte2.has_value() ? byteHex(*entry.byte2) : QString());
    }
    chopTrailingNewline(out);
    return out;
}

QString DiffRenderer::renderSummary(const QByteArray& data1, const QByteArray& data2,
                                    const QVector<DiffEntry>& diffs, const QString& name1,
                                    const QString& name2) const {
    const quint64 length1 = static_cast<quint64>(data1.size());
    const quint64 length2 = static_cast<quint64>(data2.size());

    QString out = QStringLiteral("Binary Diff Summary\n===================\n\n");
    out += QStringLiteral("File 1: %1 (%2)\n").arg(name1, formatSize(length1));
    out += QStringLiteral("File 2: %1 (%2)\n\n").arg(name2, formatSize(length2));

    const quint64 maxSize = qMax(length1, length2);
    if (maxSize == 0) {
        out += QStringLiteral("Both files are empty\n");
        return out;
    }

    quint64 changed = 0;
    quint64 deleted = 0;
    quint64 added = 0;
    for (const DiffEntry& entry : diffs) {
        if (entry.isChange()) {
            ++changed;
        } else if (entry.isDeletion()) {
            ++deleted;
        } else if (entry.isAddition()) {
            ++added;
        }
    }
    const quint64 total = static_cast<quint64>(diffs.size());
    const double diffPercent = static_cast<double>(total) / static_cast<double>(maxSize) * 100.0;

    out += QStringLiteral("Overview:\n");
    out += QStringLiteral("  Total differences: %1 bytes (%2% of file)\n")
               .arg(total, 10)
               .arg(percent(diffPercent, 5, 1));
    out += QStringLiteral("  Changed bytes:     %1       (%2%)\n")
               .arg(changed, 10)
               .arg(percent(static_cast<double>(changed) / static_cast<double>(maxSize) * 100.0,
                            5, 1));
    if (deleted > 0) {
        out += QStringLiteral("  Deleted bytes:     %1       (%2%) - file1 larger\n")
                   .arg(deleted, 10)
                   .arg(percent(
                       static_cast<double>(deleted) / static_cast<double>(length1) * 100.0, 5, 1));
    }
    if (added > 0) {
        out += QStringLiteral("  Added bytes:       %1       (%2%) - file2 larger\n")
                   .arg(added, 10)
                   .arg(percent(static_cast<double>(added) / static_cast<double>(length2) * 100.0,
                                5, 1));
    }
    if (length1 != length2) {
        const quint64 sizeChange = length2 > length1 ? length2 - length1 : length1 - length2;
        const QString sign = length2 > length1 ? QStringLiteral("+") : QStringLiteral("-");
        // An empty file1 has no baseline to compare the growth against.
        const QString ratio =
            length1 == 0
                ? QStringLiteral(" inf")
                : percent(static_cast<double>(sizeChange) / static_cast<double>(length1) * 100.0,
                          4, 1);
        out += QStringLiteral("  File size change:  %1 bytes (%2%3%)\n")
                   .arg(sizeChange, 10)
                   .arg(sign, ratio);
    }
    out += QLatin1Char('\n');

    out += QStringLiteral("Assessment:\n");
    if (diffPercent > 80.0) {
        out += QStringLiteral("  Files are substantially different (>80% changed)\n");
        out += QStringLiteral(
            "  Likely: Major version update, recompilation, or different builds\n");
    } else if (diffPercent > 50.0) {
        out += QStringLiteral("  Files have major differences (50-80% changed)\n");
        out += QStringLiteral("  Likely: Significant refactoring or feature additions\n");
    } else if (diffPercent > 10.0) {
        out += QStringLiteral("  Files have moderate differences (10-50% changed)\n");
        out += QStringLiteral("  Likely: Bug fixes, minor updates, or targeted changes\n");
    } else if (diffPercent > 0.0) {
        out += QStringLiteral("  Files have minor differences (<10% changed)\n");
        out += QStringLiteral("  Likely: Patch, hotfix, or configuration change\n");
    } else {
        out += QStringLiteral("  Files are identical\n");
    }
    out += QLatin1Char('\n');

    if (total > 0) {
        out += QStringLiteral("Suggestions:\n");
        out += QStringLiteral("  --diff-format unified      : View grouped changes with context\n");
        out += QStringLiteral("  --diff-format patch        : Generate machine-readable patch\n");
        out += QStringLiteral("  --diff-format side-by-side : Two-column hex comparison\n");
    }
    return out;
}

}  // namespace binfiddle
