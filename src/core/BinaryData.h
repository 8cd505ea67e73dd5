#pragma once

#include <QByteArray>
#include <QtGlobal>
#include <optional>

#include "core/Error.h"

namespace binfiddle {

// Slice copied out of a BinaryData buffer. bitLength is the display chunk size that
// applies to the slice, capped at the slice's own bit count.
struct Chunk {
    QByteArray bytes;
    int bitLength = 0;
};

class BinaryData {
public:
    // Fails with InvalidChunkSize when chunkSize is 0 or exceeds the buffer's bit count.
    static std::optional<BinaryData> fromBytes(QByteArray bytes, int chunkSize, int width,
                                               Error* error);

    std::optional<Chunk> readRange(quint64 start, std::optional<quint64> end,
                                   Error* error) const;
    bool writeRange(quint64 start, const QByteArray& bytes, Error* error);
    bool insertData(quint64 position, const QByteArray& bytes, Error* error);
    bool removeRange(quint64 start, quint64 end, Error* error);

    bool setChunkSize(int chunkSize, Error* error);
    int chunkSize() const { return m_chunkSize; }
    int width() const { return m_width; }

    quint64 size() const { return static_cast<quint64>(m_bytes.size()); }
    bool isEmpty() const { return m_bytes.isEmpty(); }
    const QByteArray& bytes() const { return m_bytes; }

private:
    BinaryData(QByteArray bytes, int chunkSize, int width);

    bool validRange(quint64 start, quint64 end) const;

    QByteArray m_bytes;
    int m_chunkSize = 8;
    int m_width = 16;
};

}  // namespace binfiddle
