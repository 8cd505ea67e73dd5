#include "app/CommandRunner.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QIODevice>

#include <algorithm>
#include <utility>

#include "analysis/AnalysisReport.h"
#include "convert/EncodingConverter.h"
#include "debug/Trace.h"
#include "diff/DiffEngine.h"
#include "diff/DiffRenderer.h"
#include "io/ByteSource.h"
#include "parse/InputParsing.h"
#include "scan/ParallelSearch.h"
#include "scan/PatternMatcher.h"
#include "scan/SearchReport.h"
#include "settings/AppSettings.h"
#include "struct/StructParser.h"
#include "struct/StructTemplate.h"

namespace binfiddle {

namespace {
constexpr quint64 kLargeDiffWarningCount = 10000;

constexpr const char* kInputOption = "input";
constexpr const char* kInFileOption = "in-file";
constexpr const char* kOutputOption = "output";
constexpr const char* kInputFormatOption = "input-format";
constexpr const char* kFormatOption = "format";
constexpr const char* kSilentOption = "silent";
constexpr const char* kChunkSizeOption = "chunk-size";
constexpr const char* kWidthOption = "width";
constexpr const char* kAllOption = "all";
constexpr const char* kCountOption = "count";
constexpr const char* kOffsetsOnlyOption = "offsets-only";
constexpr const char* kContextOption = "context";
constexpr const char* kNoOverlapOption = "no-overlap";
constexpr const char* kThreadsOption = "threads";
constexpr const char* kBlockSizeOption = "block-size";
constexpr const char* kOutputFormatOption = "output-format";
constexpr const char* kRangeOption = "range";
constexpr const char* kDiffFormatOption = "diff-format";
constexpr const char* kColorOption = "color";
constexpr const char* kIgnoreOffsetsOption = "ignore-offsets";
constexpr const char* kDiffWidthOption = "diff-width";
constexpr const char* kSummaryOption = "summary";
constexpr const char* kFromOption = "from";
constexpr const char* kToOption = "to";
constexpr const char* kNewlinesOption = "newlines";
constexpr const char* kBomOption = "bom";
constexpr const char* kOnErrorOption = "on-error";
constexpr const char* kGetOption = "get";
constexpr const char* kListFieldsOption = "list-fields";

QString option(const char* name) { return QString::fromLatin1(name); }

QString yesNo(bool value) { return value ? QStringLiteral("yes") : QStringLiteral("no"); }

void addOptions(QCommandLineParser& parser) {
    parser.setApplicationDescription(
        QStringLiteral("Read, modify, search, analyze and compare binary data."));
    parser.addPositionalArgument(
        QStringLiteral("command"),
        QStringLiteral("read, write, edit, search, analyze, diff, convert or struct"));
    parser.addPositionalArgument(QStringLiteral("args"), QStringLiteral("Command arguments"),
                                 QStringLiteral("[args...]"));

    parser.addOptions({
        {{QStringLiteral("i"), option(kInputOption)},
         QStringLiteral("Input file (use '-' for stdin)."),
         QStringLiteral("file")},
        {option(kInFileOption), QStringLiteral("Modify the input file directly.")},
        {{QStringLiteral("o"), option(kOutputOption)},
         QStringLiteral("Output file (use '-' for stdout)."),
         QStringLiteral("file")},
        {option(kInputFormatOption),
         QStringLiteral("Input format for values and patterns (hex, dec, oct, bin, ascii, "
                        "regex, mask)."),
         QStringLiteral("format")},
        {{QStringLiteral("f"), option(kFormatOption)},
         QStringLiteral("Output format (hex, dec, oct, bin, ascii)."),
         QStringLiteral("format")},
        {option(kSilentOption), QStringLiteral("Suppress informational output.")},
        {{QStringLiteral("c"), option(kChunkSizeOption)},
         QStringLiteral("Chunk size in bits."),
         QStringLiteral("bits")},
        {option(kWidthOption), QStringLiteral("Chunks per output line."),
         QStringLiteral("count")},
        {option(kAllOption), QStringLiteral("search: report every match.")},
        {option(kCountOption), QStringLiteral("search: print only the match count.")},
        {option(kOffsetsOnlyOption), QStringLiteral("search: print only match offsets.")},
        {option(kContextOption),
         QStringLiteral("search: context bytes around each match. diff: context bytes "
                        "around each hunk."),
         QStringLiteral("bytes")},
        {option(kNoOverlapOption), QStringLiteral("search: skip overlapping matches.")},
        {option(kThreadsOption),
         QStringLiteral("search: worker threads for large inputs (0 = automatic)."),
         QStringLiteral("count"), QStringLiteral("0")},
        {option(kBlockSizeOption),
         QStringLiteral("analyze: block size in bytes (0 = whole input)."),
         QStringLiteral("bytes")},
        {option(kOutputFormatOption),
         QStringLiteral("analyze: human, csv or json. struct: human, json or yaml."),
         QStringLiteral("format"), QStringLiteral("human")},
        {option(kRangeOption), QStringLiteral("analyze: range of the input to analyze."),
         QStringLiteral("range")},
        {option(kDiffFormatOption),
         QStringLiteral("diff: simple, unified, side-by-side, patch, summary or auto."),
         QStringLiteral("format"), QStringLiteral("auto")},
        {option(kColorOption), QStringLiteral("diff: always, auto or never."),
         QStringLiteral("mode")},
        {option(kIgnoreOffsetsOption),
         QStringLiteral("diff: comma-separated ranges to skip."),
         QStringLiteral("ranges")},
        {option(kDiffWidthOption), QStringLiteral("diff: bytes per output line."),
         QStringLiteral("count")},
        {option(kSummaryOption), QStringLiteral("diff: append a summary.")},
        {option(kFromOption), QStringLiteral("convert: source encoding."),
         QStringLiteral("encoding"), QStringLiteral("utf-8")},
        {option(kToOption), QStringLiteral("convert: target encoding."),
         QStringLiteral("encoding"), QStringLiteral("utf-8")},
        {option(kNewlinesOption), QStringLiteral("convert: unix, windows, mac or keep."),
         QStringLiteral("mode"), QStringLiteral("keep")},
        {option(kBomOption), QStringLiteral("convert: add, remove or keep."),
         QStringLiteral("mode"), QStringLiteral("keep")},
        {option(kOnErrorOption), QStringLiteral("convert: strict, replace or ignore."),
         QStringLiteral("mode"), QStringLiteral("replace")},
        {option(kGetOption), QStringLiteral("struct: comma-separated fields to decode."),
         QStringLiteral("fields")},
        {option(kListFieldsOption), QStringLiteral("struct: list the template fields.")},
    });
}

// Unset options fall back to defaultValue; set ones must be integers >= minimum.
std::optional<int> intOption(const QCommandLineParser& parser, const char* name,
                             int defaultValue, int minimum, Error* error) {
    if (!parser.isSet(option(name))) {
        return defaultValue;
    }
    const QString text = parser.value(option(name));
    bool ok = false;
    const int value = text.trimmed().toInt(&ok);
    if (!ok || value < minimum) {
        setError(error, ErrorKind::InvalidInput,
                 QStringLiteral("Invalid value for --%1: '%2'").arg(option(name), text));
        return std::nullopt;
    }
    return value;
}

QString stringOption(const QCommandLineParser& parser, const char* name,
                     const QString& defaultValue) {
    return parser.isSet(option(name)) ? parser.value(option(name)) : defaultValue;
}

bool requireArguments(const QString& command, const QStringList& args, int count,
                      const QString& usage, Error* error) {
    if (args.size() >= count) {
        return true;
    }
    return setError(error, ErrorKind::InvalidInput,
                    QStringLiteral("Missing arguments for '%1'. Usage: %2").arg(command, usage));
}

std::optional<GlobalOptions> globalOptions(const QCommandLineParser& parser, Error* error) {
    GlobalOptions options;
    options.input = parser.value(option(kInputOption));
    options.inFile = parser.isSet(option(kInFileOption));
    if (parser.isSet(option(kOutputOption))) {
        options.output = parser.value(option(kOutputOption));
    }
    options.inputFormat =
        stringOption(parser, kInputFormatOption, AppSettings::defaultInputFormat());
    options.format = stringOption(parser, kFormatOption, AppSettings::defaultOutputFormat());
    options.silent = parser.isSet(option(kSilentOption));

    if (options.inFile && options.output.has_value()) {
        setError(error, ErrorKind::InvalidInput,
                 QStringLiteral("--in-file cannot be combined with --output"));
        return std::nullopt;
    }
    if (options.inFile && (options.input.isEmpty() || options.input == QStringLiteral("-"))) {
        setError(error, ErrorKind::InvalidInput,
                 QStringLiteral("--in-file requires an input file"));
        return std::nullopt;
    }

    const std::optional<int> chunkSize =
        intOption(parser, kChunkSizeOption, AppSettings::chunkSize(), 0, error);
    if (!chunkSize.has_value()) {
        return std::nullopt;
    }
    const std::optional<int> width =
        intOption(parser, kWidthOption, AppSettings::displayWidth(), 0, error);
    if (!width.has_value()) {
        return std::nullopt;
    }
    options.chunkSize = *chunkSize;
    options.width = *width;
    return options;
}
}  // namespace

CommandRunner::CommandRunner(QIODevice* out, QIODevice* err) : m_out(out), m_err(err) {}

int CommandRunner::run(const QStringList& arguments) {
    QCommandLineParser parser;
    addOptions(parser);
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption = parser.addVersionOption();

    Error error;
    if (!parser.parse(arguments)) {
        setError(&error, ErrorKind::InvalidInput, parser.errorText());
    } else if (parser.isSet(helpOption)) {
        m_out->write(parser.helpText().toUtf8());
        return 0;
    } else if (parser.isSet(versionOption)) {
        printLine(QStringLiteral("%1 %2").arg(QCoreApplication::applicationName(),
                                              QCoreApplication::applicationVersion()));
        return 0;
    } else if (parser.positionalArguments().isEmpty()) {
        setError(&error, ErrorKind::InvalidInput,
                 QStringLiteral("No command given. Run with --help for usage."));
    } else {
        dispatch(parser, parser.positionalArguments(), &error);
    }

    if (error.isSet()) {
        BINFIDDLE_TRACE(QStringLiteral("[cli] failed: %1").arg(error.toString()));
        warn(QStringLiteral("Error: %1").arg(error.toString()));
        return 1;
    }
    return 0;
}

bool CommandRunner::dispatch(const QCommandLineParser& parser, const QStringList& positional,
                             Error* error) {
    const std::optional<GlobalOptions> options = globalOptions(parser, error);
    if (!options.has_value()) {
        return false;
    }

    const QString command = positional.first();
    const QStringList args = positional.mid(1);
    BINFIDDLE_TRACE(QStringLiteral("[cli] command=%1 args=%2 input=%3")
                        .arg(command)
                        .arg(args.size())
                        .arg(options->input.isEmpty() ? QStringLiteral("-") : options->input));

    if (command == QStringLiteral("read")) {
        return runRead(*options, args, error);
    }
    if (command == QStringLiteral("write")) {
        return runWrite(*options, args, error);
    }
    if (command == QStringLiteral("edit")) {
        return runEdit(*options, args, error);
    }
    if (command == QStringLiteral("search")) {
        return runSearch(parser, *options, args, error);
    }
    if (command == QStringLiteral("analyze")) {
        return runAnalyze(parser, *options, args, error);
    }
    if (command == QStringLiteral("diff")) {
        return runDiff(parser, *options, args, error);
    }
    if (command == QStringLiteral("convert")) {
        return runConvert(parser, *options, error);
    }
    if (command == QStringLiteral("struct")) {
        return runStruct(parser, *options, args, error);
    }
    return setError(error, ErrorKind::InvalidInput,
                    QStringLiteral("Unknown command '%1'. Run with --help for usage.")
                        .arg(command));
}

std::optional<BinaryData> CommandRunner::loadInput(const GlobalOptions& options,
                                                   Error* error) const {
    std::optional<QByteArray> bytes = ByteSource::load(options.input, error);
    if (!bytes.has_value()) {
        return std::nullopt;
    }
    BINFIDDLE_TRACE(QStringLiteral("[io] loaded %1 bytes").arg(bytes->size()));
    return BinaryData::fromBytes(std::move(*bytes), options.chunkSize, options.width, error);
}

bool CommandRunner::storeChanges(const GlobalOptions& options, const BinaryData& data,
                                 Error* error) {
    if (options.inFile) {
        BINFIDDLE_TRACE(QStringLiteral("[io] writing %1 bytes to %2")
                            .arg(data.size())
                            .arg(options.input));
        return ByteSource::writeFile(options.input, data.bytes(), error);
    }
    if (options.output.has_value()) {
        if (*options.output == QStringLiteral("-")) {
            return ByteSource::writeDevice(m_out, data.bytes(), error);
        }
        BINFIDDLE_TRACE(QStringLiteral("[io] writing %1 bytes to %2")
                            .arg(data.size())
                            .arg(*options.output));
        return ByteSource::writeFile(*options.output, data.bytes(), error);
    }
    if (!options.silent) {
        warn(QStringLiteral("Warning: Changes were made but no output specified"));
        warn(QStringLiteral("Use --in-file to modify input file or --output to specify output"));
    }
    return true;
}

bool CommandRunner::runRead(const GlobalOptions& options, const QStringList& args,
                            Error* error) {
    if (!requireArguments(QStringLiteral("read"), args, 1, QStringLiteral("read RANGE"),
                          error)) {
        return false;
    }
    const std::optional<BinaryData> data = loadInput(options, error);
    if (!data.has_value()) {
        return false;
    }
    const std::optional<ParsedRange> range = parseRange(args.at(0), data->size(), error);
    if (!range.has_value()) {
        return false;
    }
    const std::optional<Chunk> chunk = data->readRange(range->start, range->end, error);
    if (!chunk.has_value()) {
        return false;
    }
    const std::optional<QString> text =
        displayBytes(chunk->bytes, options.format, data->chunkSize(), options.width, error);
    if (!text.has_value()) {
        return false;
    }
    printLine(*text);
    return true;
}

bool CommandRunner::runWrite(const GlobalOptions& options, const QStringList& args,
                             Error* error) {
    if (!requireArguments(QStringLiteral("write"), args, 2,
                          QStringLiteral("write POSITION VALUE"), error)) {
        return false;
    }
    std::optional<BinaryData> data = loadInput(options, error);
    if (!data.has_value()) {
        return false;
    }
    const std::optional<quint64> position = parseNumber(args.at(0), error);
    if (!position.has_value()) {
        return false;
    }
    const std::optional<QByteArray> bytes = parseInput(args.at(1), options.inputFormat, error);
    if (!bytes.has_value()) {
        return false;
    }
    const std::optional<Chunk> previous =
        data->readRange(*position, *position + static_cast<quint64>(bytes->size()), error);
    if (!previous.has_value() || !data->writeRange(*position, *bytes, error)) {
        return false;
    }
    if (!options.silent) {
        printLine(
            QStringLiteral("Previous: %1").arg(QString::fromLatin1(previous->bytes.toHex())));
        printLine(QStringLiteral("New:     %1").arg(QString::fromLatin1(bytes->toHex())));
    }
    return storeChanges(options, *data, error);
}

bool CommandRunner::runEdit(const GlobalOptions& options, const QStringList& args,
                            Error* error) {
    if (!requireArguments(QStringLiteral("edit"), args, 2,
                          QStringLiteral("edit insert|remove|replace RANGE [DATA]"), error)) {
        return false;
    }
    const QString operation = args.at(0);
    const bool needsData =
        operation == QStringLiteral("insert") || operation == QStringLiteral("replace");
    if (!needsData && operation != QStringLiteral("remove")) {
        return setError(error, ErrorKind::UnsupportedOperation,
                        QStringLiteral("Unknown edit operation: %1").arg(operation));
    }
    if (needsData && args.size() < 3) {
        return setError(error, ErrorKind::InvalidInput,
                        QStringLiteral("Data required for %1").arg(operation));
    }

    std::optional<BinaryData> data = loadInput(options, error);
    if (!data.has_value()) {
        return false;
    }
    const std::optional<ParsedRange> range = parseRange(args.at(1), data->size(), error);
    if (!range.has_value()) {
        return false;
    }
    const quint64 start = range->start;
    const quint64 end = range->end.value_or(start + 1);

    QByteArray bytes;
    if (needsData) {
        const std::optional<QByteArray> parsed =
            parseInput(args.at(2), options.inputFormat, error);
        if (!parsed.has_value()) {
            return false;
        }
        bytes = *parsed;
    }

    if (operation == QStringLiteral("insert")) {
        if (!options.silent) {
            printLine(QStringLiteral("Inserting %1 bytes at position %2")
                          .arg(bytes.size())
                          .arg(start));
        }
        if (!data->insertData(start, bytes, error)) {
            return false;
        }
    } else if (operation == QStringLiteral("remove")) {
        if (!options.silent) {
            const std::optional<Chunk> original = data->readRange(start, end, error);
            if (!original.has_value()) {
                return false;
            }
            printLine(QStringLiteral("Removing %1 bytes from position %2:")
                          .arg(original->bytes.size())
                          .arg(start));
            printLine(QStringLiteral("Data removed: %1")
                          .arg(QString::fromLatin1(original->bytes.toHex())));
        }
        if (!data->removeRange(start, end, error)) {
            return false;
        }
    } else {
        if (!options.silent) {
            const std::optional<Chunk> original = data->readRange(start, end, error);
            if (!original.has_value()) {
                return false;
            }
            printLine(QStringLiteral("Replacing %1 bytes at position %2:")
                          .arg(original->bytes.size())
                          .arg(start));
            printLine(QStringLiteral("Previous: %1")
                          .arg(QString::fromLatin1(original->bytes.toHex())));
            printLine(QStringLiteral("New:     %1").arg(QString::fromLatin1(bytes.toHex())));
        }
        if (!data->removeRange(start, end, error) || !data->insertData(start, bytes, error)) {
            return false;
        }
    }
    return storeChanges(options, *data, error);
}

bool CommandRunner::runSearch(const QCommandLineParser& parser, const GlobalOptions& options,
                              const QStringList& args, Error* error) {
    if (!requireArguments(QStringLiteral("search"), args, 1, QStringLiteral("search PATTERN"),
                          error)) {
        return false;
    }
    const std::optional<int> context = intOption(parser, kContextOption, 0, 0, error);
    if (!context.has_value()) {
        return false;
    }
    const std::optional<int> threads = intOption(parser, kThreadsOption, 0, 0, error);
    if (!threads.has_value()) {
        return false;
    }

    const std::optional<BinaryData> data = loadInput(options, error);
    if (!data.has_value()) {
        return false;
    }
    const std::optional<SearchPattern> pattern =
        parseSearchPattern(args.at(0), options.inputFormat, error);
    if (!pattern.has_value()) {
        return false;
    }

    SearchConfig config;
    config.pattern = *pattern;
    config.format = options.format;
    config.chunkSize = options.chunkSize;
    config.findAll = parser.isSet(option(kAllOption));
    config.countOnly = parser.isSet(option(kCountOption));
    config.offsetsOnly = parser.isSet(option(kOffsetsOnlyOption));
    config.context = *context;
    config.noOverlap = parser.isSet(option(kNoOverlapOption));

    const QByteArray& haystack = data->bytes();
    const bool parallel = AppSettings::parallelSearchEnabled() && *threads != 1;
    BINFIDDLE_TRACE(QStringLiteral("[search] start bytes=%1 all=%2 noOverlap=%3 parallel=%4")
                        .arg(haystack.size())
                        .arg(yesNo(config.findAll), yesNo(config.noOverlap), yesNo(parallel)));

    std::optional<QVector<SearchMatch>> matches;
    if (parallel) {
        ParallelSearchOptions searchOptions;
        searchOptions.workerCount = *threads;
        matches = ParallelSearch::search(haystack, config, error, searchOptions);
    } else {
        matches = PatternMatcher::search(haystack, config, error);
    }
    if (!matches.has_value()) {
        return false;
    }
    BINFIDDLE_TRACE(QStringLiteral("[search] done matches=%1").arg(matches->size()));

    if (matches->isEmpty()) {
        if (!options.silent) {
            warn(QStringLiteral("No matches found"));
        }
        return true;
    }
    const std::optional<QString> report = SearchReport::format(haystack, *matches, config, error);
    if (!report.has_value()) {
        return false;
    }
    printLine(*report);
    return true;
}

bool CommandRunner::runAnalyze(const QCommandLineParser& parser, const GlobalOptions& options,
                               const QStringList& args, Error* error) {
    if (!requireArguments(QStringLiteral("analyze"), args, 1,
                          QStringLiteral("analyze entropy|histogram|ic"), error)) {
        return false;
    }
    AnalyzeConfig config;
    const std::optional<AnalysisType> type = AnalysisReport::parseType(args.at(0), error);
    if (!type.has_value()) {
        return false;
    }
    const std::optional<AnalyzeOutputFormat> format =
        AnalysisReport::parseFormat(parser.value(option(kOutputFormatOption)), error);
    if (!format.has_value()) {
        return false;
    }
    const std::optional<int> blockSize =
        intOption(parser, kBlockSizeOption, AppSettings::analyzeBlockSize(), 0, error);
    if (!blockSize.has_value()) {
        return false;
    }
    config.type = *type;
    config.format = *format;
    config.blockSize = static_cast<quint64>(*blockSize);

    const std::optional<BinaryData> data = loadInput(options, error);
    if (!data.has_value()) {
        return false;
    }
    if (parser.isSet(option(kRangeOption))) {
        const std::optional<ParsedRange> range =
            parseRange(parser.value(option(kRangeOption)), data->size(), error);
        if (!range.has_value()) {
            return false;
        }
        config.range = std::make_pair(range->start, range->end.value_or(data->size()));
    }

    BINFIDDLE_TRACE(QStringLiteral("[analyze] type=%1 blockSize=%2 bytes=%3")
                        .arg(args.at(0))
                        .arg(config.blockSize)
                        .arg(data->size()));
    const std::optional<QString> report = AnalysisReport::analyze(data->bytes(), config, error);
    if (!report.has_value()) {
        return false;
    }
    printLine(*report);
    return true;
}

bool CommandRunner::runDiff(const QCommandLineParser& parser, const GlobalOptions& options,
                            const QStringList& args, Error* error) {
    if (!requireArguments(QStringLiteral("diff"), args, 2, QStringLiteral("diff FILE1 FILE2"),
                          error)) {
        return false;
    }
    const QString& name1 = args.at(0);
    const QString& name2 = args.at(1);

    DiffConfig config;
    const std::optional<int> context =
        intOption(parser, kContextOption, AppSettings::diffContext(), 0, error);
    if (!context.has_value()) {
        return false;
    }
    const std::optional<int> width = intOption(parser, kDiffWidthOption, 16, 0, error);
    if (!width.has_value()) {
        return false;
    }
    const std::optional<ColorMode> color = DiffEngine::parseColorMode(
        stringOption(parser, kColorOption, AppSettings::colorMode()), error);
    if (!color.has_value()) {
        return false;
    }
    std::optional<QVector<ByteRange>> ignoreRanges =
        parseIgnoreRanges(parser.value(option(kIgnoreOffsetsOption)), error);
    if (!ignoreRanges.has_value()) {
        return false;
    }
    config.context = *context;
    config.width = *width;
    config.color = *color;
    config.ignoreRanges = std::move(*ignoreRanges);

    const QString formatText = parser.value(option(kDiffFormatOption));
    if (formatText != QStringLiteral("auto")) {
        const std::optional<DiffFormat> format = DiffEngine::parseFormat(formatText, error);
        if (!format.has_value()) {
            return false;
        }
        config.format = *format;
    }

    const std::optional<QByteArray> data1 = ByteSource::readFile(name1, error);
    if (!data1.has_value()) {
        return false;
    }
    const std::optional<QByteArray> data2 = ByteSource::readFile(name2, error);
    if (!data2.has_value()) {
        return false;
    }

    const quint64 maxSize =
        static_cast<quint64>(std::max(data1->size(), data2->size()));
    const QVector<DiffEntry> diffs = DiffEngine(config).compare(*data1, *data2);
    const quint64 totalDiffs = static_cast<quint64>(diffs.size());
    if (formatText == QStringLiteral("auto")) {
        config.format = DiffEngine::autoSelect(totalDiffs, maxSize);
    }
    BINFIDDLE_TRACE(QStringLiteral("[diff] sizes=%1/%2 diffs=%3 format=%4")
                        .arg(data1->size())
                        .arg(data2->size())
                        .arg(totalDiffs)
                        .arg(static_cast<int>(config.format)));

    if (totalDiffs > kLargeDiffWarningCount && !options.silent) {
        warn(QString());
        warn(QStringLiteral("Warning: Large diff detected: %1 differences (%2% of file)")
                 .arg(totalDiffs)
                 .arg(static_cast<double>(totalDiffs) / static_cast<double>(maxSize) * 100.0,
                      0, 'f', 1));
        if (config.format == DiffFormat::Simple) {
            warn(QStringLiteral("   Output will be very large. Consider:"));
            warn(QStringLiteral("   - Use --diff-format summary for overview"));
            warn(QStringLiteral("   - Use --diff-format unified for grouped view"));
            warn(QString());
        } else if (config.format == DiffFormat::Summary) {
            warn(QStringLiteral("   Showing summary. Use --diff-format unified for details."));
            warn(QString());
        }
    }

    if (diffs.isEmpty()) {
        if (!options.silent) {
            warn(QStringLiteral("Files are identical"));
        }
        return true;
    }

    const DiffEngine engine(config);
    const DiffRenderer renderer(engine);
    printLine(renderer.render(*data1, *data2, diffs, name1, name2));
    if (parser.isSet(option(kSummaryOption))) {
        printLine(QString());
        printLine(engine.summary(diffs, static_cast<quint64>(data1->size()),
                                 static_cast<quint64>(data2->size())));
    }
    return true;
}

bool CommandRunner::runConvert(const QCommandLineParser& parser, const GlobalOptions& options,
                               Error* error) {
    ConvertConfig config;
    const std::optional<TextEncoding> from =
        EncodingConverter::parseEncoding(parser.value(option(kFromOption)), error);
    if (!from.has_value()) {
        return false;
    }
    const std::optional<TextEncoding> to =
        EncodingConverter::parseEncoding(parser.value(option(kToOption)), error);
    if (!to.has_value()) {
        return false;
    }
    const std::optional<NewlineMode> newlines =
        EncodingConverter::parseNewlineMode(parser.value(option(kNewlinesOption)), error);
    if (!newlines.has_value()) {
        return false;
    }
    const std::optional<BomMode> bom =
        EncodingConverter::parseBomMode(parser.value(option(kBomOption)), error);
    if (!bom.has_value()) {
        return false;
    }
    const std::optional<DecodeErrorMode> onError =
        EncodingConverter::parseErrorMode(parser.value(option(kOnErrorOption)), error);
    if (!onError.has_value()) {
        return false;
    }
    config.from = *from;
    config.to = *to;
    config.newlines = *newlines;
    config.bom = *bom;
    config.onError = *onError;

    const std::optional<BinaryData> data = loadInput(options, error);
    if (!data.has_value()) {
        return false;
    }
    const EncodingConverter converter(config);
    BINFIDDLE_TRACE(QStringLiteral("[convert] %1 bytes=%2")
                        .arg(converter.describe())
                        .arg(data->size()));
    const std::optional<QByteArray> converted = converter.convert(data->bytes(), error);
    if (!converted.has_value()) {
        return false;
    }

    if (options.output.has_value() && *options.output != QStringLiteral("-")) {
        return ByteSource::writeFile(*options.output, *converted, error);
    }
    if (!options.output.has_value() && options.inFile) {
        return ByteSource::writeFile(options.input, *converted, error);
    }
    return ByteSource::writeDevice(m_out, *converted, error);
}

bool CommandRunner::runStruct(const QCommandLineParser& parser, const GlobalOptions& options,
                              const QStringList& args, Error* error) {
    if (!requireArguments(QStringLiteral("struct"), args, 1,
                          QStringLiteral("struct TEMPLATE [--list-fields] [--get FIELDS]"),
                          error)) {
        return false;
    }
    const std::optional<StructTemplate> structTemplate =
        TemplateLoader::fromFile(args.at(0), error);
    if (!structTemplate.has_value()) {
        return false;
    }
    if (parser.isSet(option(kListFieldsOption))) {
        printLine(StructParser::listFields(*structTemplate));
        return true;
    }
    const std::optional<StructOutputFormat> format =
        StructParser::parseFormat(parser.value(option(kOutputFormatOption)), error);
    if (!format.has_value()) {
        return false;
    }

    QStringList selection;
    for (const QString& value : parser.values(option(kGetOption))) {
        for (const QString& name : value.split(QLatin1Char(','), Qt::SkipEmptyParts)) {
            selection.push_back(name.trimmed());
        }
    }

    const std::optional<BinaryData> data = loadInput(options, error);
    if (!data.has_value()) {
        return false;
    }
    BINFIDDLE_TRACE(QStringLiteral("[struct] template=%1 fields=%2 bytes=%3")
                        .arg(structTemplate->name)
                        .arg(structTemplate->fields.size())
                        .arg(data->size()));
    const std::optional<ParsedStruct> parsed =
        StructParser::parse(data->bytes(), *structTemplate, selection, error);
    if (!parsed.has_value()) {
        return false;
    }
    if (selection.size() == 1 && *format == StructOutputFormat::Human) {
        printLine(parsed->fields.first().value);
        return true;
    }
    const std::optional<QString> report = StructParser::format(*parsed, *format, error);
    if (!report.has_value()) {
        return false;
    }
    printLine(*report);
    return true;
}

void CommandRunner::printLine(const QString& text) {
    m_out->write(text.toUtf8());
    m_out->write("\n", 1);
}

void CommandRunner::warn(const QString& text) {
    m_err->write(text.toUtf8());
    m_err->write("\n", 1);
}

}  // namespace binfiddle
