#include "scan/PatternMatcher.h"

#include <QByteArrayMatcher>
#include <QRegularExpression>
#include <QRegularExpressionMatchIterator>

namespace binfiddle {

namespace {
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;
}  // namespace

std::optional<QVector<SearchMatch>> PatternMatcher::search(const QByteArray& haystack,
                                                           const SearchConfig& config,
                                                           Error* error) {
    return std::visit(
        Overloaded{
            [&](const ExactPattern& exact) {
                return searchExact(haystack, exact.bytes, config.findAll, config.noOverlap,
                                   error);
            },
            [&](const MaskPattern& mask) {
                return searchMask(haystack, mask.slots, config.findAll, config.noOverlap,
                                  error);
            },
            [&](const RegexPattern& regex) {
                return searchRegex(haystack, regex.expression, config.findAll,
                                   config.noOverlap, error);
            },
        },
        config.pattern);
}

std::optional<QVector<SearchMatch>> PatternMatcher::searchExact(const QByteArray& haystack,
                                                                const QByteArray& needle,
                                                                bool findAll, bool noOverlap,
                                                                Error* error) {
    if (needle.isEmpty()) {
        setError(error, ErrorKind::InvalidInput,
                 QStringLiteral("Search pattern cannot be empty"));
        return std::nullopt;
    }

    QVector<SearchMatch> matches;
    const QByteArrayMatcher matcher(needle);
    qsizetype from = 0;
    while (from < haystack.size()) {
        const qsizetype pos = matcher.indexIn(haystack, from);
        if (pos < 0) {
            break;
        }
        matches.push_back({static_cast<quint64>(pos), needle});
        if (!findAll) {
            break;
        }
        from = noOverlap ? pos + needle.size() : pos + 1;
    }
    return matches;
}

std::optional<QVector<SearchMatch>> PatternMatcher::searchMask(
    const QByteArray& haystack, const QVector<std::optional<quint8>>& mask, bool findAll,
    bool noOverlap, Error* error) {
    if (mask.isEmpty()) {
        setError(error, ErrorKind::InvalidInput, QStringLiteral("Mask pattern cannot be empty"));
        return std::nullopt;
    }

    QVector<SearchMatch> matches;
    const qsizetype maskLen = mask.size();
    if (haystack.size() < maskLen) {
        return matches;
    }

    const qsizetype last = haystack.size() - maskLen;
    qsizetype pos = 0;
    while (pos <= last) {
        if (!matchesMask(haystack.constData() + pos, mask)) {
            ++pos;
            continue;
        }
        matches.push_back(
            {static_cast<quint64>(pos), QByteArray(haystack.constData() + pos, maskLen)});
        if (!findAll) {
            break;
        }
        pos += noOverlap ? maskLen : 1;
    }
    return matches;
}

std::optional<QVector<SearchMatch>> PatternMatcher::searchRegex(const QByteArray& haystack,
                                                                const QString& expression,
                                                                bool findAll, bool noOverlap,
                                                                Error* error) {
    const QRegularExpression regex(expression);
    if (!regex.isValid()) {
        setError(error, ErrorKind::Parse,
                 QStringLiteral("Invalid regex pattern '%1': %2 at offset %3")
                     .arg(expression, regex.errorString())
                     .arg(regex.patternErrorOffset()));
        return std::nullopt;
    }

    QVector<SearchMatch> matches;
    const QString text = QString::fromLatin1(haystack);
    qsizetype acceptedEnd = 0;
    QRegularExpressionMatchIterator it = regex.globalMatch(text);
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        const qsizetype start = match.capturedStart(0);
        const qsizetype length = match.capturedLength(0);
        if (noOverlap && start < acceptedEnd) {
            continue;
        }
        matches.push_back({static_cast<quint64>(start), haystack.mid(start, length)});
        if (!findAll) {
            break;
        }
        if (noOverlap) {
            acceptedEnd = start + length;
        }
    }
    return matches;
}

bool PatternMatcher::matchesMask(const char* window, const QVector<std::optional<quint8>>& mask) {
    for (qsizetype i = 0; i < mask.size(); ++i) {
        const std::optional<quint8>& slot = mask.at(i);
        if (slot.has_value() && static_cast<quint8>(window[i]) != *slot) {
            return false;
        }
    }
    return true;
}

qsizetype PatternMatcher::patternLength(const SearchPattern& pattern) {
    if (const auto* exact = std::get_if<ExactPattern>(&pattern)) {
        return exact->bytes.size();
    }
    if (const auto* mask = std::get_if<MaskPattern>(&pattern)) {
        return mask->slots.size();
    }
    return 0;
}

}  // namespace binfiddle
