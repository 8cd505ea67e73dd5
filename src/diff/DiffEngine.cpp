#include "diff/DiffEngine.h"

#include <utility>

namespace binfiddle {

DiffEngine::DiffEngine(DiffConfig config) : m_config(std::move(config)) {}

bool DiffEngine::isIgnored(quint64 offset) const {
    for (const ByteRange& range : m_config.ignoreRanges) {
        if (range.contains(offset)) {
            return true;
        }
    }
    return false;
}

QVector<DiffEntry> DiffEngine::compare(const QByteArray& data1, const QByteArray& data2) const {
    QVector<DiffEntry> diffs;
    const qsizetype maxLength = qMax(data1.size(), data2.size());
    for (qsizetype i = 0; i < maxLength; ++i) {
        const quint64 offset = static_cast<quint64>(i);
        if (isIgnored(offset)) {
            continue;
        }
        DiffEntry entry;
        entry.offset = offset;
        if (i < data1.size()) {
            entry.byte1 = static_cast<quint8>(data1.at(i));
        }
        if (i < data2.size()) {
            entry.byte2 = static_cast<quint8>(data2.at(i));
        }
        if (entry.byte1 != entry.byte2) {
            diffs.push_back(entry);
        }
    }
    return diffs;
}

QVector<Hunk> DiffEngine::groupIntoHunks(const QVector<DiffEntry>& diffs) const {
    QVector<Hunk> hunks;
    Hunk current;
    const quint64 contextGap = 2ULL * static_cast<quint64>(qMax(0, m_config.context)) + 1ULL;

    for (qsizetype idx = 0; idx < diffs.size(); ++idx) {
        if (current.isEmpty()) {
            current.push_back(idx);
            continue;
        }

        const quint64 lastOffset = diffs.at(current.last()).offset;
        const quint64 offset = diffs.at(idx).offset;
        const quint64 gap = offset > lastOffset ? offset - lastOffset : 0;
        const qsizetype n = current.size();

        bool merge = false;
        if (gap <= 16) {
            merge = true;
        } else if (n > 100 && gap <= 256) {
            merge = true;
        } else if (n > 20 && gap <= 128) {
            merge = true;
        } else if (gap <= 64) {
            merge = true;
        } else if (gap <= contextGap) {
            merge = true;
        }

        if (merge) {
            current.push_back(idx);
        } else {
            hunks.push_back(current);
            current = Hunk{idx};
        }
    }
    if (!current.isEmpty()) {
        hunks.push_back(current);
    }
    return hunks;
}

QString DiffEngine::summary(const QVector<DiffEntry>& diffs, quint64 length1,
                            quint64 length2) const {
    qsizetype changed = 0;
    qsizetype deleted = 0;
    qsizetype added = 0;
    for (const DiffEntry& entry : diffs) {
        if (entry.isChange()) {
            ++changed;
        } else if (entry.isDeletion()) {
            ++deleted;
        } else if (entry.isAddition()) {
            ++added;
        }
    }
    return QStringLiteral(
               "%1 difference(s): %2 changed, %3 deleted, %4 added (file1: %5 bytes, file2: %6 "
               "bytes)")
        .arg(diffs.size())
        .arg(changed)
        .arg(deleted)
        .arg(added)
        .arg(length1)
        .arg(length2);
}

std::optional<DiffFormat> DiffEngine::parseFormat(const QString& text, Error* error) {
    const QString name = text.toLower();
    if (name == QStringLiteral("simple")) {
        return DiffFormat::Simple;
    }
    if (name == QStringLiteral("unified")) {
        return DiffFormat::Unified;
    }
    if (name == QStringLiteral("side-by-side") || name == QStringLiteral("sidebyside") ||
        name == QStringLiteral("side")) {
        return DiffFormat::SideBySide;
    }
    if (name == QStringLiteral("patch")) {
        return DiffFormat::Patch;
    }
    if (name == QStringLiteral("summary")) {
        return DiffFormat::Summary;
    }
    setError(error, ErrorKind::InvalidInput,
             QStringLiteral("Unknown diff format: '%1'. Supported: simple, unified, "
                            "side-by-side, patch, summary, auto")
                 .arg(text));
    return std::nullopt;
}

std::optional<ColorMode> DiffEngine::parseColorMode(const QString& text, Error* error) {
    const QString name = text.toLower();
    if (name == QStringLiteral("always")) {
        return ColorMode::Always;
    }
    if (name == QStringLiteral("auto")) {
        return ColorMode::Auto;
    }
    if (name == QStringLiteral("never")) {
        return ColorMode::Never;
    }
    setError(error, ErrorKind::InvalidInput,
             QStringLiteral("Unknown color mode: '%1'. Supported: always, auto, never")
                 .arg(text));
    return std::nullopt;
}

DiffFormat DiffEngine::autoSelect(quint64 totalDiffs, quint64 fileSize) {
    if (fileSize == 0 || totalDiffs == 0) {
        return DiffFormat::Simple;
    }
    const double ratio = static_cast<double>(totalDiffs) / static_cast<double>(fileSize);
    if (ratio < 0.01) {
        return DiffFormat::Simple;
    }
    if (ratio < 0.50) {
        return DiffFormat::Unified;
    }
    return DiffFormat::Summary;
}

}  // namespace binfiddle
