#pragma once

#include <QVector>
#include <QtGlobal>
#include <optional>

namespace binfiddle {

enum class DiffFormat {
    Simple = 0,
    Unified,
    SideBySide,
    Patch,
    Summary
};

enum class ColorMode {
    Always = 0,
    Auto,
    Never
};

// Half-open [start, end).
struct ByteRange {
    quint64 start = 0;
    quint64 end = 0;

    bool contains(quint64 offset) const { return offset >= start && offset < end; }
};

// byte1/byte2 are empty past the end of the respective buffer.
struct DiffEntry {
    quint64 offset = 0;
    std::optional<quint8> byte1;
    std::optional<quint8> byte2;

    bool isChange() const { return byte1.has_value() && byte2.has_value(); }
    bool isDeletion() const { return byte1.has_value() && !byte2.has_value(); }
    bool isAddition() const { return !byte1.has_value() && byte2.has_value(); }

    bool operator==(const DiffEntry& other) const {
        return offset == other.offset && byte1 == other.byte1 && byte2 == other.byte2;
    }
};

// Indices into the DiffEntry list, ascending.
using Hunk = QVector<qsizetype>;

struct DiffConfig {
    DiffFormat format = DiffFormat::Simple;
    int context = 3;
    ColorMode color = ColorMode::Auto;
    QVector<ByteRange> ignoreRanges;
    int width = 16;
};

}  // namespace binfiddle
