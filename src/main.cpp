#include <QCoreApplication>
#include <QFile>
#include <cstdio>

#include "app/CommandRunner.h"

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("binfiddle"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.3.0"));

    QFile out;
    QFile err;
    if (!out.open(stdout, QIODevice::WriteOnly) || !err.open(stderr, QIODevice::WriteOnly)) {
        std::fputs("Error: I/O error: cannot open standard streams\n", stderr);
        return 1;
    }

    binfiddle::CommandRunner runner(&out, &err);
    return runner.run(QCoreApplication::arguments());
}
