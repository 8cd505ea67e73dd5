#pragma once

#include <QByteArray>
#include <QVector>
#include <QtGlobal>
#include <optional>

#include "core/Error.h"
#include "scan/SearchTypes.h"

namespace binfiddle {

constexpr quint64 kParallelThresholdBytes = 1024ULL * 1024ULL;
constexpr quint64 kParallelChunkBytes = 256ULL * 1024ULL;

struct ParallelSearchOptions {
    quint64 thresholdBytes = kParallelThresholdBytes;
    quint64 chunkBytes = kParallelChunkBytes;
    // 0 picks QThread::idealThreadCount().
    int workerCount = 0;
};

// Fork-join front end for PatternMatcher. Large Exact/Mask searches with findAll are split
// into overlapping chunks and matched on worker threads; everything else runs sequentially.
// Either way the result equals PatternMatcher::search() for the same input.
class ParallelSearch {
public:
    static std::optional<QVector<SearchMatch>> search(
        const QByteArray& haystack, const SearchConfig& config, Error* error,
        const ParallelSearchOptions& options = ParallelSearchOptions());

    static bool shouldParallelize(const QByteArray& haystack, const SearchConfig& config,
                                  const ParallelSearchOptions& options);
    static QVector<SearchChunk> planChunks(quint64 haystackSize, quint64 patternLength,
                                           quint64 chunkBytes);
    // Sorts, drops duplicate offsets and, with noOverlap, keeps matches greedily left to right.
    static QVector<SearchMatch> mergeMatches(QVector<SearchMatch> matches, bool noOverlap);
};

}  // namespace binfiddle
