#pragma once

#include <QByteArray>
#include <QString>
#include <optional>

#include "core/Error.h"

class QIODevice;

namespace binfiddle {

// Whole-buffer loading and storing. A path of "-" (or an empty path for reads) stands for
// the process's standard streams.
class ByteSource {
public:
    static std::optional<QByteArray> readFile(const QString& filePath, Error* error);
    static std::optional<QByteArray> readDevice(QIODevice* device, Error* error);
    static std::optional<QByteArray> readStdin(Error* error);
    static std::optional<QByteArray> load(const QString& pathOrDash, Error* error);

    static bool writeFile(const QString& filePath, const QByteArray& bytes, Error* error);
    static bool writeDevice(QIODevice* device, const QByteArray& bytes, Error* error);
};

}  // namespace binfiddle
