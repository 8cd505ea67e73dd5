#pragma once

#include <QByteArray>
#include <QByteArrayView>
#include <QVector>
#include <QtGlobal>
#include <array>

namespace binfiddle {

struct EntropyResult {
    quint64 offset = 0;
    quint64 size = 0;
    double entropy = 0.0;
};

struct IcResult {
    quint64 offset = 0;
    quint64 size = 0;
    double ic = 0.0;
};

struct ByteFrequency {
    quint8 byteValue = 0;
    quint64 count = 0;
    double percentage = 0.0;
};

class ByteStatistics {
public:
    static std::array<quint64, 256> frequencyTable(QByteArrayView data);

    // Shannon entropy in bits per byte, 0.0 for empty input.
    static double entropy(QByteArrayView data);
    // Non-zero counts, most frequent first; equal counts keep ascending byte order.
    static QVector<ByteFrequency> histogram(QByteArrayView data);
    // All 256 values in byte order, zero counts included.
    static QVector<ByteFrequency> fullHistogram(QByteArrayView data);
    // sum(n_i * (n_i - 1)) / (N * (N - 1)), 0.0 below two bytes.
    static double indexOfCoincidence(QByteArrayView data);

    // blockSize 0 treats the whole input as one block. Empty input yields one zero record.
    static QVector<EntropyResult> entropyBlocks(QByteArrayView data, quint64 blockSize);
    static QVector<IcResult> icBlocks(QByteArrayView data, quint64 blockSize);
};

}  // namespace binfiddle
