#include "scan/ParallelSearch.h"

#include <QThread>

#include <algorithm>
#include <memory>
#include <vector>

#include "scan/PatternMatcher.h"
#include "scan/SearchWorker.h"

namespace binfiddle {

bool ParallelSearch::shouldParallelize(const QByteArray& haystack, const SearchConfig& config,
                                       const ParallelSearchOptions& options) {
    if (std::holds_alternative<RegexPattern>(config.pattern)) {
        return false;
    }
    if (!config.findAll || PatternMatcher::patternLength(config.pattern) == 0) {
        return false;
    }
    return static_cast<quint64>(haystack.size()) >= options.thresholdBytes &&
           options.chunkBytes > 0;
}

QVector<SearchChunk> ParallelSearch::planChunks(quint64 haystackSize, quint64 patternLength,
                                                quint64 chunkBytes) {
    QVector<SearchChunk> chunks;
    if (haystackSize == 0 || chunkBytes == 0) {
        return chunks;
    }

    const quint64 overlap = patternLength > 0 ? patternLength - 1 : 0;
    quint64 offset = 0;
    while (offset < haystackSize) {
        const quint64 primary = qMin(chunkBytes, haystackSize - offset);
        const quint64 tail = haystackSize - offset - primary;

        SearchChunk chunk;
        chunk.offset = offset;
        chunk.reportLimit = primary;
        chunk.isLast = tail == 0;
        chunk.size = primary + qMin(overlap, tail);
        chunks.push_back(chunk);

        offset += primary;
    }
    return chunks;
}

QVector<SearchMatch> ParallelSearch::mergeMatches(QVector<SearchMatch> matches, bool noOverlap) {
    std::sort(matches.begin(), matches.end(), [](const SearchMatch& lhs, const SearchMatch& rhs) {
        return lhs.offset < rhs.offset;
    });
    matches.erase(std::unique(matches.begin(), matches.end(),
                              [](const SearchMatch& lhs, const SearchMatch& rhs) {
                                  return lhs.offset == rhs.offset;
                              }),
                  matches.end());
    if (!noOverlap) {
        return matches;
    }

    QVector<SearchMatch> kept;
    kept.reserve(matches.size());
    quint64 keptEnd = 0;
    for (SearchMatch& match : matches) {
        if (!kept.isEmpty() && match.offset < keptEnd) {
            continue;
        }
        keptEnd = match.offset + static_cast<quint64>(match.data.size());
        kept.push_back(std::move(match));
    }
    return kept;
}

std::optional<QVector<SearchMatch>> ParallelSearch::search(const QByteArray& haystack,
                                                           const SearchConfig& config,
                                                           Error* error,
                                                           const ParallelSearchOptions& options) {
    if (!shouldParallelize(haystack, config, options)) {
        return PatternMatcher::search(haystack, config, error);
    }

    const QVector<SearchChunk> chunks =
        planChunks(static_cast<quint64>(haystack.size()),
                   static_cast<quint64>(PatternMatcher::patternLength(config.pattern)),
                   options.chunkBytes);

    int workerCount = options.workerCount;
    if (workerCount <= 0) {
        workerCount = qMax(1, QThread::idealThreadCount());
    }
    workerCount = qMin(workerCount, static_cast<int>(chunks.size()));

    std::vector<std::unique_ptr<SearchWorker>> workers;
    workers.reserve(static_cast<size_t>(workerCount));
    for (int workerIdx = 0; workerIdx < workerCount; ++workerIdx) {
        workers.push_back(std::make_unique<SearchWorker>(workerIdx, haystack, config.pattern));
    }
    for (qsizetype chunkIdx = 0; chunkIdx < chunks.size(); ++chunkIdx) {
        workers[static_cast<size_t>(chunkIdx % workerCount)]->assignChunk(chunks.at(chunkIdx));
    }

    for (const auto& worker : workers) {
        worker->start();
    }
    for (const auto& worker : workers) {
        worker->join();
    }

    QVector<SearchMatch> collected;
    for (const auto& worker : workers) {
        if (worker->failed()) {
            if (error != nullptr) {
                *error = worker->error();
            }
            return std::nullopt;
        }
        collected += worker->matches();
    }
    return mergeMatches(std::move(collected), config.noOverlap);
}

}  // namespace binfiddle
