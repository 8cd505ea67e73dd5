#include "core/BinaryData.h"

#include <utility>

namespace binfiddle {

namespace {
bool chunkSizeFits(int chunkSize, qsizetype byteCount) {
    return chunkSize > 0 &&
           static_cast<quint64>(chunkSize) <= static_cast<quint64>(byteCount) * 8ULL;
}

QString rangeText(quint64 start, quint64 end) {
    return QStringLiteral("Invalid range [%1, %2)").arg(start).arg(end);
}
}  // namespace

BinaryData::BinaryData(QByteArray bytes, int chunkSize, int width)
    : m_bytes(std::move(bytes)), m_chunkSize(chunkSize), m_width(width) {}

std::optional<BinaryData> BinaryData::fromBytes(QByteArray bytes, int chunkSize, int width,
                                                Error* error) {
    if (!chunkSizeFits(chunkSize, bytes.size())) {
        setError(error, ErrorKind::InvalidChunkSize, QString::number(chunkSize));
        return std::nullopt;
    }
    return BinaryData(std::move(bytes), chunkSize, width);
}

bool BinaryData::validRange(quint64 start, quint64 end) const {
    return start < size() && end <= size() && start < end;
}

std::optional<Chunk> BinaryData::readRange(quint64 start, std::optional<quint64> end,
                                           Error* error) const {
    const quint64 stop = end.value_or(size());
    if (!validRange(start, stop)) {
        setError(error, ErrorKind::InvalidRange, rangeText(start, stop));
        return std::nullopt;
    }

    const quint64 bitCount = (stop - start) * 8ULL;
    Chunk chunk;
    chunk.bytes = m_bytes.mid(static_cast<qsizetype>(start), static_cast<qsizetype>(stop - start));
    chunk.bitLength = static_cast<quint64>(m_chunkSize) > bitCount ? static_cast<int>(bitCount)
                                                                  : m_chunkSize;
    return chunk;
}

bool BinaryData::writeRange(quint64 start, const QByteArray& bytes, Error* error) {
    if (start > size() || static_cast<quint64>(bytes.size()) > size() - start) {
        return setError(error, ErrorKind::InvalidRange,
                        QStringLiteral("Write operation would exceed data bounds"));
    }
    m_bytes.replace(static_cast<qsizetype>(start), bytes.size(), bytes);
    return true;
}

bool BinaryData::insertData(quint64 position, const QByteArray& bytes, Error* error) {
    if (position > size()) {
        return setError(error, ErrorKind::InvalidRange,
                        QStringLiteral("Insert position out of bounds"));
    }
    m_bytes.insert(static_cast<qsizetype>(position), bytes);
    return true;
}

bool BinaryData::removeRange(quint64 start, quint64 end, Error* error) {
    if (!validRange(start, end)) {
        return setError(error, ErrorKind::InvalidRange, rangeText(start, end));
    }
    m_bytes.remove(static_cast<qsizetype>(start), static_cast<qsizetype>(end - start));
    return true;
}

bool BinaryData::setChunkSize(int chunkSize, Error* error) {
    if (!chunkSizeFits(chunkSize, m_bytes.size())) {
        return setError(error, ErrorKind::InvalidChunkSize, QString::number(chunkSize));
    }
    m_chunkSize = chunkSize;
    return true;
}

}  // namespace binfiddle
