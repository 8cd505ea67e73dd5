#pragma once

#include <QByteArray>
#include <QString>
#include <QVector>
#include <QtGlobal>
#include <optional>
#include <utility>

#include "analysis/ByteStatistics.h"
#include "core/Error.h"

namespace binfiddle {

enum class AnalysisType {
    Entropy = 0,
    Histogram,
    IndexOfCoincidence
};

enum class AnalyzeOutputFormat {
    Human = 0,
    Csv,
    Json
};

struct AnalyzeConfig {
    AnalysisType type = AnalysisType::Entropy;
    quint64 blockSize = 256;
    AnalyzeOutputFormat format = AnalyzeOutputFormat::Human;
    // [start, end) of the input to analyze; block offsets are relative to start.
    std::optional<std::pair<quint64, quint64>> range;
};

class AnalysisReport {
public:
    static std::optional<AnalysisType> parseType(const QString& text, Error* error);
    static std::optional<AnalyzeOutputFormat> parseFormat(const QString& text, Error* error);

    static std::optional<QString> analyze(const QByteArray& data, const AnalyzeConfig& config,
                                          Error* error);

    static QString formatEntropy(const QVector<EntropyResult>& results,
                                 const AnalyzeConfig& config);
    static QString formatHistogram(const QVector<ByteFrequency>& histogram, quint64 totalBytes,
                                   const AnalyzeConfig& config);
    static QString formatIc(const QVector<IcResult>& results, const AnalyzeConfig& config);

    static QString interpretEntropy(double entropy);
    static QString interpretIc(double ic);
};

}  // namespace binfiddle
