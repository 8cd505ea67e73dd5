#pragma once

#include <QByteArray>
#include <QString>
#include <QtGlobal>
#include <optional>

#include "core/Error.h"

namespace binfiddle {

// Renders bytes as hex|dec|oct|bin|ascii. Values are cut into chunkSize-bit groups read MSB
// first; a newline follows every `width` groups while more data remains (width 0 never
// wraps). ascii requires 8-bit chunks.
std::optional<QString> displayBytes(const QByteArray& bytes, const QString& format,
                                    int chunkSize, int width, Error* error);

// Up to 64 bits starting at bitOffset, MSB first. Collection stops at the end of bytes.
quint64 extractBits(const QByteArray& bytes, quint64 bitOffset, int bitCount);

bool isPrintableAscii(quint8 byte);
QString formatOffset(quint64 offset);

std::optional<QString> formatMatch(quint64 offset, const QByteArray& data, const QString& format,
                                   int chunkSize, Error* error);
std::optional<QString> formatMatchWithContext(quint64 offset, const QByteArray& data,
                                              const QByteArray& before, const QByteArray& after,
                                              const QString& format, int chunkSize,
                                              Error* error);

}  // namespace binfiddle
