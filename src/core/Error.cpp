#include "core/Error.h"

namespace binfiddle {

QString Error::toString() const {
    switch (kind) {
        case ErrorKind::None:
            return QString();
        case ErrorKind::Io:
            return QStringLiteral("I/O error: %1").arg(message);
        case ErrorKind::Parse:
            return QStringLiteral("Parse error: %1").arg(message);
        case ErrorKind::InvalidRange:
            return QStringLiteral("Invalid range: %1").arg(message);
        case ErrorKind::InvalidChunkSize:
            return QStringLiteral("Invalid chunk size: %1").arg(message);
        case ErrorKind::InvalidInput:
            return QStringLiteral("Invalid input: %1").arg(message);
        case ErrorKind::UnsupportedOperation:
            return QStringLiteral("Operation not supported: %1").arg(message);
    }
    return message;
}

bool setError(Error* error, ErrorKind kind, const QString& message) {
    if (error != nullptr) {
        error->kind = kind;
        error->message = message;
    }
    return false;
}

}  // namespace binfiddle
