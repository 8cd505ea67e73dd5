#include "scan/SearchReport.h"

#include <QStringList>

#include "text/ByteDisplay.h"

namespace binfiddle {

std::optional<QString> SearchReport::format(const QByteArray& haystack,
                                            const QVector<SearchMatch>& matches,
                                            const SearchConfig& config, Error* error) {
    if (config.countOnly) {
        return QString::number(matches.size());
    }

    QStringList entries;
    entries.reserve(matches.size());
    const quint64 context = static_cast<quint64>(qMax(0, config.context));
    const quint64 haystackSize = static_cast<quint64>(haystack.size());

    for (const SearchMatch& match : matches) {
        if (config.offsetsOnly) {
            entries.push_back(formatOffset(match.offset));
            continue;
        }

        std::optional<QString> entry;
        if (context > 0) {
            const quint64 matchEnd = match.offset + static_cast<quint64>(match.data.size());
            const quint64 beforeStart = match.offset > context ? match.offset - context : 0;
            const quint64 afterEnd = qMin(matchEnd + context, haystackSize);
            const QByteArray before =
                haystack.mid(static_cast<qsizetype>(beforeStart),
                             static_cast<qsizetype>(match.offset - beforeStart));
            const QByteArray after =
                afterEnd > matchEnd ? haystack.mid(static_cast<qsizetype>(matchEnd),
                                                   static_cast<qsizetype>(afterEnd - matchEnd))
                                    : QByteArray();
            entry = formatMatchWithContext(match.offset, match.data, before, after, config.format,
                                           config.chunkSize, error);
        } else {
            entry = formatMatch(match.offset, match.data, config.format, config.chunkSize, error);
        }
        if (!entry.has_value()) {
            return std::nullopt;
        }
        entries.push_back(*entry);
    }
    return entries.join(QLatin1Char('\n'));
}

}  // namespace binfiddle
