#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <optional>

#include "core/BinaryData.h"
#include "core/Error.h"

class QCommandLineParser;
class QIODevice;

namespace binfiddle {

// Options shared by every command, resolved against the stored defaults.
struct GlobalOptions {
    QString input;
    bool inFile = false;
    std::optional<QString> output;
    QString inputFormat;
    QString format;
    bool silent = false;
    int chunkSize = 8;
    int width = 16;
};

// Parses a binfiddle command line and runs one command. Command output goes to out,
// diagnostics and warnings to err. Returns the process exit code.
class CommandRunner {
public:
    CommandRunner(QIODevice* out, QIODevice* err);

    int run(const QStringList& arguments);

private:
    bool dispatch(const QCommandLineParser& parser, const QStringList& positional,
                  Error* error);

    bool runRead(const GlobalOptions& options, const QStringList& args, Error* error);
    bool runWrite(const GlobalOptions& options, const QStringList& args, Error* error);
    bool runEdit(const GlobalOptions& options, const QStringList& args, Error* error);
    bool runSearch(const QCommandLineParser& parser, const GlobalOptions& options,
                   const QStringList& args, Error* error);
    bool runAnalyze(const QCommandLineParser& parser, const GlobalOptions& options,
                    const QStringList& args, Error* error);
    bool runDiff(const QCommandLineParser& parser, const GlobalOptions& options,
                 const QStringList& args, Error* error);
    bool runConvert(const QCommandLineParser& parser, const GlobalOptions& options,
                    Error* error);
    bool runStruct(const QCommandLineParser& parser, const GlobalOptions& options,
                   const QStringList& args, Error* error);

    std::optional<BinaryData> loadInput(const GlobalOptions& options, Error* error) const;
    bool storeChanges(const GlobalOptions& options, const BinaryData& data, Error* error);

    void printLine(const QString& text);
    void warn(const QString& text);

    QIODevice* m_out = nullptr;
    QIODevice* m_err = nullptr;
};

}  // namespace binfiddle
