#include "analysis/ByteStatistics.h"

#include <algorithm>
#include <cmath>

namespace binfiddle {

namespace {
template <typename Result, typename Metric>
QVector<Result> perBlock(QByteArrayView data, quint64 blockSize, Metric metric) {
    QVector<Result> results;
    if (data.isEmpty()) {
        results.push_back(Result{});
        return results;
    }

    const quint64 total = static_cast<quint64>(data.size());
    const quint64 step = blockSize == 0 ? total : blockSize;
    results.reserve(static_cast<qsizetype>((total + step - 1) / step));
    for (quint64 offset = 0; offset < total; offset += step) {
        const quint64 size = qMin(step, total - offset);
        const QByteArrayView block =
            data.sliced(static_cast<qsizetype>(offset), static_cast<qsizetype>(size));
        results.push_back(Result{offset, size, metric(block)});
    }
    return results;
}
}  // namespace

std::array<quint64, 256> ByteStatistics::frequencyTable(QByteArrayView data) {
    std::array<quint64, 256> counts{};
    for (const char c : data) {
        ++counts[static_cast<quint8>(c)];
    }
    return counts;
}

double ByteStatistics::entropy(QByteArrayView data) {
    if (data.isEmpty()) {
        return 0.0;
    }
    const std::array<quint64, 256> counts = frequencyTable(data);
    const double length = static_cast<double>(data.size());
    double bits = 0.0;
    for (const quint64 count : counts) {
        if (count > 0) {
            const double p = static_cast<double>(count) / length;
            bits -= p * std::log2(p);
        }
    }
    return bits;
}

QVector<ByteFrequency> ByteStatistics::histogram(QByteArrayView data) {
    QVector<ByteFrequency> entries;
    if (data.isEmpty()) {
        return entries;
    }
    const std::array<quint64, 256> counts = frequencyTable(data);
    const double length = static_cast<double>(data.size());
    for (int value = 0; value < 256; ++value) {
        if (counts[value] > 0) {
            entries.push_back({static_cast<quint8>(value), counts[value],
                               static_cast<double>(counts[value]) / length * 100.0});
        }
    }
    std::stable_sort(entries.begin(), entries.end(),
                     [](const ByteFrequency& lhs, const ByteFrequency& rhs) {
                         return lhs.count > rhs.count;
                     });
    return entries;
}

QVector<ByteFrequency> ByteStatistics::fullHistogram(QByteArrayView data) {
    const std::array<quint64, 256> counts = frequencyTable(data);
    const double length = data.isEmpty() ? 1.0 : static_cast<double>(data.size());
    QVector<ByteFrequency> entries;
    entries.reserve(256);
    for (int value = 0; value < 256; ++value) {
        entries.push_back({static_cast<quint8>(value), counts[value],
                           static_cast<double>(counts[value]) / length * 100.0});
    }
    return entries;
}

double ByteStatistics::indexOfCoincidence(QByteArrayView data) {
    if (data.size() < 2) {
        return 0.0;
    }
    const std::array<quint64, 256> counts = frequencyTable(data);
    const double n = static_cast<double>(data.size());
    double numerator = 0.0;
    for (const quint64 count : counts) {
        if (count > 1) {
            const double c = static_cast<double>(count);
            numerator += c * (c - 1.0);
        }
    }
    return numerator / (n * (n - 1.0));
}

QVector<EntropyResult> ByteStatistics::entropyBlocks(QByteArrayView data, quint64 blockSize) {
    return perBlock<EntropyResult>(data, blockSize,
                                   [](QByteArrayView block) { return entropy(block); });
}

QVector<IcResult> ByteStatistics::icBlocks(QByteArrayView data, quint64 blockSize) {
    return perBlock<IcResult>(data, blockSize,
                              [](QByteArrayView block) { return indexOfCoincidence(block); });
}

}  // namespace binfiddle
