#pragma once

#include <QByteArray>
#include <QVector>
#include <thread>

#include "core/Error.h"
#include "scan/SearchTypes.h"

namespace binfiddle {

// Runs the sequential matcher over a fixed list of chunks on its own thread. The haystack
// is shared read-only; matches land in a private list that is only read after join().
class SearchWorker {
public:
    SearchWorker(int workerId, QByteArray haystack, SearchPattern pattern);
    ~SearchWorker();

    void assignChunk(const SearchChunk& chunk);
    void start();
    void join();

    int workerId() const { return m_workerId; }
    bool failed() const { return m_failed; }
    const Error& error() const { return m_error; }
    const QVector<SearchMatch>& matches() const;

private:
    void run();
    bool processChunk(const SearchChunk& chunk);

    int m_workerId = 0;
    QByteArray m_haystack;
    SearchConfig m_config;
    QVector<SearchChunk> m_chunks;
    QVector<SearchMatch> m_matches;
    Error m_error;
    bool m_failed = false;
    std::thread m_thread;
};

}  // namespace binfiddle
