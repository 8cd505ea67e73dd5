#pragma once

#include <QString>

namespace binfiddle {

enum class ErrorKind {
    None = 0,
    Io,
    Parse,
    InvalidRange,
    InvalidChunkSize,
    InvalidInput,
    UnsupportedOperation,
};

struct Error {
    ErrorKind kind = ErrorKind::None;
    QString message;

    bool isSet() const { return kind != ErrorKind::None; }
    QString toString() const;
};

// Writes kind/message into error when the caller asked for it. Always returns false so
// failure paths can read "return fail(...)".
bool setError(Error* error, ErrorKind kind, const QString& message);

}  // namespace binfiddle
