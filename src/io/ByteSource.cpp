#include "io/ByteSource.h"

#include <QFile>
#include <QIODevice>
#include <QSaveFile>

#include <cstdio>

namespace binfiddle {

namespace {
constexpr qint64 kReadBlockBytes = 64 * 1024;

QString describe(const QString& filePath, const QString& reason) {
    return QStringLiteral("%1: %2").arg(filePath, reason);
}
}  // namespace

std::optional<QByteArray> ByteSource::readFile(const QString& filePath, Error* error) {
    if (filePath.isEmpty()) {
        setError(error, ErrorKind::Io, QStringLiteral("No file path given"));
        return std::nullopt;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(error, ErrorKind::Io, describe(filePath, file.errorString()));
        return std::nullopt;
    }
    return readDevice(&file, error);
}

std::optional<QByteArray> ByteSource::readDevice(QIODevice* device, Error* error) {
    if (device == nullptr || !device->isReadable()) {
        setError(error, ErrorKind::Io, QStringLiteral("Input stream is not readable"));
        return std::nullopt;
    }

    QByteArray bytes;
    char block[kReadBlockBytes];
    for (;;) {
        const qint64 count = device->read(block, sizeof(block));
        if (count < 0) {
            setError(error, ErrorKind::Io,
                     describe(QStringLiteral("<input>"), device->errorString()));
            return std::nullopt;
        }
        if (count == 0) {
            break;
        }
        bytes.append(block, static_cast<qsizetype>(count));
    }
    return bytes;
}

std::optional<QByteArray> ByteSource::readStdin(Error* error) {
    QFile input;
    if (!input.open(stdin, QIODevice::ReadOnly)) {
        setError(error, ErrorKind::Io, describe(QStringLiteral("<stdin>"), input.errorString()));
        return std::nullopt;
    }
    return readDevice(&input, error);
}

std::optional<QByteArray> ByteSource::load(const QString& pathOrDash, Error* error) {
    if (pathOrDash.isEmpty() || pathOrDash == QStringLiteral("-")) {
        return readStdin(error);
    }
    return readFile(pathOrDash, error);
}

bool ByteSource::writeFile(const QString& filePath, const QByteArray& bytes, Error* error) {
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        return setError(error, ErrorKind::Io, describe(filePath, file.errorString()));
    }
    if (file.write(bytes) != bytes.size()) {
        const QString reason = file.errorString();
        file.cancelWriting();
        return setError(error, ErrorKind::Io, describe(filePath, reason));
    }
    if (!file.commit()) {
        return setError(error, ErrorKind::Io, describe(filePath, file.errorString()));
    }
    return true;
}

bool ByteSource::writeDevice(QIODevice* device, const QByteArray& bytes, Error* error) {
    if (device == nullptr || !device->isWritable()) {
        return setError(error, ErrorKind::Io, QStringLiteral("Output stream is not writable"));
    }
    if (device->write(bytes) != bytes.size()) {
        return setError(error, ErrorKind::Io, device->errorString());
    }
    return true;
}

}  // namespace binfiddle
