#include "scan/SearchWorker.h"

#include <utility>

#include "scan/PatternMatcher.h"

namespace binfiddle {

SearchWorker::SearchWorker(int workerId, QByteArray haystack, SearchPattern pattern)
    : m_workerId(workerId), m_haystack(std::move(haystack)) {
    m_config.pattern = std::move(pattern);
    // Chunks collect every candidate; overlap filtering happens after the merge.
    m_config.findAll = true;
    m_config.noOverlap = false;
}

SearchWorker::~SearchWorker() { join(); }

void SearchWorker::assignChunk(const SearchChunk& chunk) { m_chunks.push_back(chunk); }

void SearchWorker::start() { m_thread = std::thread([this]() { run(); }); }

void SearchWorker::join() {
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

const QVector<SearchMatch>& SearchWorker::matches() const { return m_matches; }

void SearchWorker::run() {
    for (const SearchChunk& chunk : std::as_const(m_chunks)) {
        if (!processChunk(chunk)) {
            m_failed = true;
            return;
        }
    }
}

bool SearchWorker::processChunk(const SearchChunk& chunk) {
    if (chunk.size == 0) {
        return true;
    }
    const QByteArray view = QByteArray::fromRawData(
        m_haystack.constData() + static_cast<qsizetype>(chunk.offset),
        static_cast<qsizetype>(chunk.size));

    const std::optional<QVector<SearchMatch>> found =
        PatternMatcher::search(view, m_config, &m_error);
    if (!found.has_value()) {
        return false;
    }

    for (const SearchMatch& match : *found) {
        if (!chunk.isLast && match.offset >= chunk.reportLimit) {
            continue;
        }
        // Copy the bytes out: the chunk view does not own its storage.
        m_matches.push_back({chunk.offset + match.offset,
                             QByteArray(match.data.constData(), match.data.size())});
    }
    return true;
}

}  // namespace binfiddle
