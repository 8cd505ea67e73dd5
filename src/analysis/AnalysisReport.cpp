#include "analysis/AnalysisReport.h"

#include <QStringList>

#include <algorithm>
#include <cmath>

#include "text/ByteDisplay.h"

namespace binfiddle {

namespace {
constexpr int kHistogramTopRows = 20;
constexpr int kHistogramMaxBar = 25;

const QString kIcReference = QStringLiteral(
    "\nReference values:\n"
    "  Random data:  ~0.0039 (1/256)\n"
    "  English text: ~0.0667\n");

QString fixed(double value, int precision) { return QString::number(value, 'f', precision); }

QString hexByte(quint8 value) {
    return QStringLiteral("0x%1").arg(static_cast<uint>(value), 2, 16, QLatin1Char('0'));
}

template <typename Result, typename Value>
void appendSpread(QString& out, const QVector<Result>& results, Value value, const QString& label,
                  const QString& unit, int precision) {
    double minValue = value(results.first());
    double maxValue = minValue;
    double sum = 0.0;
    for (const Result& result : results) {
        const double v = value(result);
        minValue = std::min(minValue, v);
        maxValue = std::max(maxValue, v);
        sum += v;
    }
    const double avg = sum / static_cast<double>(results.size());
    out += QStringLiteral("Min %1: %2%3\n").arg(label, fixed(minValue, precision), unit);
    out += QStringLiteral("Max %1: %2%3\n").arg(label, fixed(maxValue, precision), unit);
    out += QStringLiteral("Avg %1: %2%3\n").arg(label, fixed(avg, precision), unit);
}
}  // namespace

std::optional<AnalysisType> AnalysisReport::parseType(const QString& text, Error* error) {
    const QString name = text.toLower();
    if (name == QStringLiteral("entropy")) {
        return AnalysisType::Entropy;
    }
    if (name == QStringLiteral("histogram") || name == QStringLiteral("hist")) {
        return AnalysisType::Histogram;
    }
    if (name == QStringLiteral("ic") || name == QStringLiteral("ioc") ||
        name == QStringLiteral("index-of-coincidence")) {
        return AnalysisType::IndexOfCoincidence;
    }
    setError(error, ErrorKind::InvalidInput,
             QStringLiteral("Unknown analysis type: '%1'. Supported: entropy, histogram, ic")
                 .arg(text));
    return std::nullopt;
}

std::optional<AnalyzeOutputFormat> AnalysisReport::parseFormat(const QString& text,
                                                               Error* error) {
    const QString name = text.toLower();
    if (name == QStringLiteral("human") || name == QStringLiteral("text")) {
        return AnalyzeOutputFormat::Human;
    }
    if (name == QStringLiteral("csv")) {
        return AnalyzeOutputFormat::Csv;
    }
    if (name == QStringLiteral("json")) {
        return AnalyzeOutputFormat::Json;
    }
    setError(error, ErrorKind::InvalidInput,
             QStringLiteral("Unknown output format: '%1'. Supported: human, csv, json").arg(text));
    return std::nullopt;
}

std::optional<QString> AnalysisReport::analyze(const QByteArray& data,
                                               const AnalyzeConfig& config, Error* error) {
    QByteArrayView slice(data);
    if (config.range.has_value()) {
        const quint64 start = config.range->first;
        const quint64 end = config.range->second;
        const quint64 length = static_cast<quint64>(data.size());
        if (start >= length || end > length || start >= end) {
            setError(error, ErrorKind::InvalidRange,
                     QStringLiteral("Invalid range [%1, %2) for data of length %3")
                         .arg(start)
                         .arg(end)
                         .arg(length));
            return std::nullopt;
        }
        slice = slice.sliced(static_cast<qsizetype>(start), static_cast<qsizetype>(end - start));
    }

    switch (config.type) {
        case AnalysisType::Entropy:
            return formatEntropy(ByteStatistics::entropyBlocks(slice, config.blockSize), config);
        case AnalysisType::Histogram:
            return formatHistogram(ByteStatistics::histogram(slice),
                                   static_cast<quint64>(slice.size()), config);
        case AnalysisType::IndexOfCoincidence:
            return formatIc(ByteStatistics::icBlocks(slice, config.blockSize), config);
    }
    setError(error, ErrorKind::UnsupportedOperation, QStringLiteral("Unknown analysis type"));
    return std::nullopt;
}

QString AnalysisReport::formatEntropy(const QVector<EntropyResult>& results,
                                      const AnalyzeConfig& config) {
    if (config.format == AnalyzeOutputFormat::Csv) {
        QString out = QStringLiteral("offset,size,entropy\n");
        for (const EntropyResult& r : results) {
            out += QStringLiteral("%1,%2,%3\n").arg(r.offset).arg(r.size).arg(fixed(r.entropy, 6));
        }
        return out;
    }
    if (config.format == AnalyzeOutputFormat::Json) {
        QStringList blocks;
        for (const EntropyResult& r : results) {
            blocks.push_back(QStringLiteral("{\"offset\":%1,\"size\":%2,\"entropy\":%3}")
                                 .arg(r.offset)
                                 .arg(r.size)
                                 .arg(fixed(r.entropy, 6)));
        }
        if (blocks.size() == 1) {
            return blocks.first();
        }
        return QStringLiteral("{\"blocks\":[%1]}").arg(blocks.join(QLatin1Char(',')));
    }

    QString out = QStringLiteral("=== Entropy Analysis ===\n");
    if (results.size() > 1) {
        out += QStringLiteral("Blocks: %1\n").arg(results.size());
        out += QStringLiteral("Block size: %1 bytes\n").arg(config.blockSize);
        appendSpread(out, results, [](const EntropyResult& r) { return r.entropy; },
                     QStringLiteral("entropy"), QStringLiteral(" bits/byte"), 4);
        out += QStringLiteral("\n--- Block Details ---\n");
        for (const EntropyResult& r : results) {
            out += QStringLiteral("Offset %1: %2 bits/byte (%3)\n")
                       .arg(formatOffset(r.offset), fixed(r.entropy, 4),
                            interpretEntropy(r.entropy));
        }
        return out;
    }
    for (const EntropyResult& r : results) {
        out += QStringLiteral("Size: %1 bytes\n").arg(r.size);
        out += QStringLiteral("Entropy: %1 bits/byte\n").arg(fixed(r.entropy, 4));
        out += QStringLiteral("Interpretation: %1\n").arg(interpretEntropy(r.entropy));
    }
    return out;
}

QString AnalysisReport::formatHistogram(const QVector<ByteFrequency>& histogram,
                                        quint64 totalBytes, const AnalyzeConfig& config) {
    if (config.format == AnalyzeOutputFormat::Csv) {
        QString out = QStringLiteral("byte_value,hex,count,percentage\n");
        for (const ByteFrequency& f : histogram) {
            out += QStringLiteral("%1,%2,%3,%4\n")
                       .arg(static_cast<uint>(f.byteValue))
                       .arg(hexByte(f.byteValue))
                       .arg(f.count)
                       .arg(fixed(f.percentage, 4));
        }
        return out;
    }
    if (config.format == AnalyzeOutputFormat::Json) {
        QStringList entries;
        for (const ByteFrequency& f : histogram) {
            entries.push_back(
                QStringLiteral("{\"byte\":%1,\"hex\":\"%2\",\"count\":%3,\"percentage\":%4}")
                    .arg(static_cast<uint>(f.byteValue))
                    .arg(hexByte(f.byteValue))
                    .arg(f.count)
                    .arg(fixed(f.percentage, 4)));
        }
        return QStringLiteral("{\"total_bytes\":%1,\"unique_values\":%2,\"frequencies\":[%3]}")
            .arg(totalBytes)
            .arg(histogram.size())
            .arg(entries.join(QLatin1Char(',')));
    }

    QString out = QStringLiteral("=== Byte Frequency Histogram ===\n");
    out += QStringLiteral("Total bytes: %1\n").arg(totalBytes);
    out += QStringLiteral("Unique byte values: %1\n\n").arg(histogram.size());
    out += QStringLiteral("Top 20 most frequent bytes:\n");
    out += QStringLiteral("Byte   Hex   Count      Percentage  Bar\n");
    out += QString(41, QChar(0x2500)) + QLatin1Char('\n');

    const qsizetype rows = qMin<qsizetype>(histogram.size(), kHistogramTopRows);
    for (qsizetype i = 0; i < rows; ++i) {
        const ByteFrequency& f = histogram.at(i);
        const int barLength =
            qMin(static_cast<int>(std::lround(f.percentage / 2.0)), kHistogramMaxBar);
        const QString printable = isPrintableAscii(f.byteValue)
                                      ? QStringLiteral("'%1'").arg(QLatin1Char(
                                            static_cast<char>(f.byteValue)))
                                      : QStringLiteral("   ");
        out += QStringLiteral("%1  %2 %3  %4%     %5\n")
                   .arg(printable, hexByte(f.byteValue))
                   .arg(f.count, 10)
                   .arg(f.percentage, 6, 'f', 2)
                   .arg(QString(barLength, QChar(0x2588)));
    }
    return out;
}

QString AnalysisReport::formatIc(const QVector<IcResult>& results, const AnalyzeConfig& config) {
    if (config.format == AnalyzeOutputFormat::Csv) {
        QString out = QStringLiteral("offset,size,ic\n");
        for (const IcResult& r : results) {
            out += QStringLiteral("%1,%2,%3\n").arg(r.offset).arg(r.size).arg(fixed(r.ic, 8));
        }
        return out;
    }
    if (config.format == AnalyzeOutputFormat::Json) {
        QStringList blocks;
        for (const IcResult& r : results) {
            blocks.push_back(QStringLiteral("{\"offset\":%1,\"size\":%2,\"ic\":%3}")
                                 .arg(r.offset)
                                 .arg(r.size)
                                 .arg(fixed(r.ic, 8)));
        }
        if (blocks.size() == 1) {
            return blocks.first();
        }
        return QStringLiteral("{\"blocks\":[%1]}").arg(blocks.join(QLatin1Char(',')));
    }

    QString out = QStringLiteral("=== Index of Coincidence Analysis ===\n");
    if (results.size() > 1) {
        out += QStringLiteral("Blocks: %1\n").arg(results.size());
        out += QStringLiteral("Block size: %1 bytes\n").arg(config.blockSize);
        appendSpread(out, results, [](const IcResult& r) { return r.ic; }, QStringLiteral("IC"),
                     QString(), 6);
        out += kIcReference;
        out += QStringLiteral("\n--- Block Details ---\n");
        for (const IcResult& r : results) {
            out += QStringLiteral("Offset %1: %2 (%3)\n")
                       .arg(formatOffset(r.offset), fixed(r.ic, 6), interpretIc(r.ic));
        }
        return out;
    }
    for (const IcResult& r : results) {
        out += QStringLiteral("Size: %1 bytes\n").arg(r.size);
        out += QStringLiteral("IC: %1\n").arg(fixed(r.ic, 6));
        out += QStringLiteral("Interpretation: %1\n").arg(interpretIc(r.ic));
        out += kIcReference;
    }
    return out;
}

QString AnalysisReport::interpretEntropy(double entropy) {
    if (entropy < 1.0) {
        return QStringLiteral("highly repetitive/uniform");
    }
    if (entropy < 4.0) {
        return QStringLiteral("structured data/text/code");
    }
    if (entropy < 6.0) {
        return QStringLiteral("mixed content");
    }
    if (entropy < 7.5) {
        return QStringLiteral("likely compressed");
    }
    return QStringLiteral("encrypted or random");
}

QString AnalysisReport::interpretIc(double ic) {
    if (ic < 0.006) {
        return QStringLiteral("random/encrypted");
    }
    if (ic < 0.02) {
        return QStringLiteral("possibly compressed");
    }
    if (ic < 0.05) {
        return QStringLiteral("structured binary");
    }
    return QStringLiteral("text-like patterns");
}

}  // namespace binfiddle
