#pragma once

#include <QByteArray>
#include <QString>
#include <QVector>
#include <optional>

#include "core/Error.h"
#include "scan/SearchTypes.h"

namespace binfiddle {

class SearchReport {
public:
    // countOnly wins over offsetsOnly, which wins over context. Entries are newline-joined.
    static std::optional<QString> format(const QByteArray& haystack,
                                         const QVector<SearchMatch>& matches,
                                         const SearchConfig& config, Error* error);
};

}  // namespace binfiddle
