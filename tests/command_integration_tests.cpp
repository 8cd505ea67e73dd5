#include <QBuffer>
#include <QCoreApplication>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>
#include <QTest>

#include "app/CommandRunner.h"

namespace {

struct RunResult {
    int exitCode = 0;
    QByteArray out;
    QString err;
};

class CommandIntegrationTests : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void helpAndVersionExitCleanly();
    void readPrintsRangeInRequestedFormat();
    void readReportsOutOfBoundsIndex();
    void writeStoresToOutputFile();
    void writeWithoutDestinationWarns();
    void editInsertModifiesInputInPlace();
    void editRemoveAndReplaceReportChanges();
    void editRejectsUnknownOperation();
    void searchListsCountsAndOffsets();
    void searchReportsMissingPattern();
    void analyzeEmitsCsv();
    void diffRendersSimpleWithSummary();
    void diffRendersPatch();
    void diffReportsIdenticalFiles();
    void diffFailsOnMissingFile();
    void convertRewritesEncodingAndNewlines();
    void invalidInvocationsExitWithError();
    void structDecodesTemplateFields();
    void structReportsTemplateErrors();

private:
    RunResult run(const QStringList& arguments) const;
    QString writeFixture(const QString& name, const QByteArray& bytes) const;
    QByteArray readFixture(const QString& name) const;
    QString writePacketTemplate() const;

    QTemporaryDir m_dir;
};

RunResult CommandIntegrationTests::run(const QStringList& arguments) const {
    QByteArray outBytes;
    QByteArray errBytes;
    QBuffer out(&outBytes);
    QBuffer err(&errBytes);
    out.open(QIODevice::WriteOnly);
    err.open(QIODevice::WriteOnly);

    binfiddle::CommandRunner runner(&out, &err);
    RunResult result;
    result.exitCode = runner.run(QStringList{QStringLiteral("binfiddle")} + arguments);
    result.out = outBytes;
    result.err = QString::fromUtf8(errBytes);
    return result;
}

QString CommandIntegrationTests::writeFixture(const QString& name, const QByteArray& bytes) const {
    const QString path = m_dir.filePath(name);
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return QString();
    }
    file.write(bytes);
    return path;
}

QByteArray CommandIntegrationTests::readFixture(const QString& name) const {
    QFile file(m_dir.filePath(name));
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return file.readAll();
}

void CommandIntegrationTests::initTestCase() {
    QVERIFY(m_dir.isValid());
    QCoreApplication::setApplicationName(QStringLiteral("binfiddle"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.3.0"));
    // Keep stored user preferences out of the defaults under test.
    qputenv("BINFIDDLE_CONFIG", m_dir.filePath(QStringLiteral("settings.ini")).toLocal8Bit());
}

void CommandIntegrationTests::helpAndVersionExitCleanly() {
    const RunResult help = run({QStringLiteral("--help")});
    QCOMPARE(help.exitCode, 0);
    QVERIFY(help.out.contains("--diff-format"));
    QVERIFY(help.out.contains("--list-fields"));

    const RunResult version = run({QStringLiteral("--version")});
    QCOMPARE(version.exitCode, 0);
    QCOMPARE(version.out, QByteArray("binfiddle 0.3.0\n"));
}

void CommandIntegrationTests::readPrintsRangeInRequestedFormat() {
    const QString input = writeFixture(QStringLiteral("read.bin"), QByteArray::fromHex("DEADBEEF"));

    const RunResult hex = run({QStringLiteral("read"), QStringLiteral("1..3"),
                               QStringLiteral("-i"), input});
    QCOMPARE(hex.exitCode, 0);
    QCOMPARE(hex.out, QByteArray("ad be\n"));

    const RunResult bin = run({QStringLiteral("read"), QStringLiteral("0"), QStringLiteral("-i"),
                               input, QStringLiteral("-f"), QStringLiteral("bin")});
    QCOMPARE(bin.exitCode, 0);
    QCOMPARE(bin.out, QByteArray("11011110\n"));

    const RunResult wrapped = run({QStringLiteral("read"), QStringLiteral(".."),
                                   QStringLiteral("-i"), input, QStringLiteral("--width"),
                                   QStringLiteral("2")});
    QCOMPARE(wrapped.out, QByteArray("de ad\nbe ef\n"));
}

void CommandIntegrationTests::readReportsOutOfBoundsIndex() {
    const QString input = writeFixture(QStringLiteral("short.bin"), QByteArray::fromHex("0102"));
    const RunResult result =
        run({QStringLiteral("read"), QStringLiteral("10"), QStringLiteral("-i"), input});
    QCOMPARE(result.exitCode, 1);
    QVERIFY(result.out.isEmpty());
    QVERIFY(result.err.startsWith(QStringLiteral("Error: Invalid range: Index 10 out of bounds")));
}

void CommandIntegrationTests::writeStoresToOutputFile() {
    const QString input =
        writeFixture(QStringLiteral("write.bin"), QByteArray::fromHex("DEADBEEF"));
    const QString output = m_dir.filePath(QStringLiteral("write-out.bin"));

    const RunResult result = run({QStringLiteral("write"), QStringLiteral("0x1"),
                                  QStringLiteral("FF"), QStringLiteral("-i"), input,
                                  QStringLiteral("-o"), output});
    QCOMPARE(result.exitCode, 0);
    QCOMPARE(result.out, QByteArray("Previous: ad\nNew:     ff\n"));
    QCOMPARE(readFixture(QStringLiteral("write-out.bin")), QByteArray::fromHex("DEFFBEEF"));
    QCOMPARE(readFixture(QStringLiteral("write.bin")), QByteArray::fromHex("DEADBEEF"));

    const RunResult silent = run({QStringLiteral("write"), QStringLiteral("0"),
                                  QStringLiteral("00"), QStringLiteral("-i"), input,
                                  QStringLiteral("-o"), QStringLiteral("-"),
                                  QStringLiteral("--silent")});
    QCOMPARE(silent.exitCode, 0);
    QCOMPARE(silent.out, QByteArray::fromHex("00ADBEEF"));
}

void CommandIntegrationTests::writeWithoutDestinationWarns() {
    const QString input = writeFixture(QStringLiteral("nodest.bin"), QByteArray::fromHex("0102"));
    const RunResult result = run({QStringLiteral("write"), QStringLiteral("0"),
                                  QStringLiteral("FF"), QStringLiteral("-i"), input});
    QCOMPARE(result.exitCode, 0);
    QVERIFY(result.err.contains(QStringLiteral("Warning: Changes were made but no output "
                                               "specified")));
    QCOMPARE(readFixture(QStringLiteral("nodest.bin")), QByteArray::fromHex("0102"));
}

void CommandIntegrationTests::editInsertModifiesInputInPlace() {
    const QString input = writeFixture(QStringLiteral("insert.bin"), QByteArray::fromHex("DEAD"));
    const RunResult result = run({QStringLiteral("edit"), QStringLiteral("insert"),
                                  QStringLiteral("0"), QStringLiteral("0102"),
                                  QStringLiteral("-i"), input, QStringLiteral("--in-file")});
    QCOMPARE(result.exitCode, 0);
    QCOMPARE(result.out, QByteArray("Inserting 2 bytes at position 0\n"));
    QCOMPARE(readFixture(QStringLiteral("insert.bin")), QByteArray::fromHex("0102DEAD"));
}

void CommandIntegrationTests::editRemoveAndReplaceReportChanges() {
    const QString input = writeFixture(QStringLiteral("edit.bin"), QByteArray::fromHex("DEADBEEF"));
    const QString removed = m_dir.filePath(QStringLiteral("removed.bin"));
    const RunResult remove = run({QStringLiteral("edit"), QStringLiteral("remove"),
                                  QStringLiteral("1..3"), QStringLiteral("-i"), input,
                                  QStringLiteral("-o"), removed});
    QCOMPARE(remove.exitCode, 0);
    QCOMPARE(remove.out, QByteArray("Removing 2 bytes from position 1:\nData removed: adbe\n"));
    QCOMPARE(readFixture(QStringLiteral("removed.bin")), QByteArray::fromHex("DEEF"));

    const QString replaced = m_dir.filePath(QStringLiteral("replaced.bin"));
    const RunResult replace = run({QStringLiteral("edit"), QStringLiteral("replace"),
                                   QStringLiteral("0..2"), QStringLiteral("CAFE00"),
                                   QStringLiteral("-i"), input, QStringLiteral("-o"), replaced});
    QCOMPARE(replace.exitCode, 0);
    QCOMPARE(replace.out,
             QByteArray("Replacing 2 bytes at position 0:\nPrevious: dead\nNew:     cafe00\n"));
    QCOMPARE(readFixture(QStringLiteral("replaced.bin")), QByteArray::fromHex("CAFE00BEEF"));
}

void CommandIntegrationTests::editRejectsUnknownOperation() {
    const QString input = writeFixture(QStringLiteral("frob.bin"), QByteArray::fromHex("00"));
    const RunResult result = run({QStringLiteral("edit"), QStringLiteral("frob"),
                                  QStringLiteral("0"), QStringLiteral("-i"), input});
    QCOMPARE(result.exitCode, 1);
    QCOMPARE(result.err,
             QStringLiteral("Error: Operation not supported: Unknown edit operation: frob\n"));

    const RunResult missingData = run({QStringLiteral("edit"), QStringLiteral("insert"),
                                       QStringLiteral("0"), QStringLiteral("-i"), input});
    QCOMPARE(missingData.exitCode, 1);
    QCOMPARE(missingData.err, QStringLiteral("Error: Invalid input: Data required for insert\n"));
}

void CommandIntegrationTests::searchListsCountsAndOffsets() {
    const QString input =
        writeFixture(QStringLiteral("search.bin"), QByteArray::fromHex("DEADBEEFBEEF"));

    const RunResult all = run({QStringLiteral("search"), QStringLiteral("BEEF"),
                               QStringLiteral("-i"), input, QStringLiteral("--all")});
    QCOMPARE(all.exitCode, 0);
    QCOMPARE(all.out, QByteArray("0x00000002: be ef\n0x00000004: be ef\n"));

    const RunResult first =
        run({QStringLiteral("search"), QStringLiteral("BEEF"), QStringLiteral("-i"), input});
    QCOMPARE(first.out, QByteArray("0x00000002: be ef\n"));

    const RunResult count = run({QStringLiteral("search"), QStringLiteral("BEEF"),
                                 QStringLiteral("-i"), input, QStringLiteral("--all"),
                                 QStringLiteral("--count")});
    QCOMPARE(count.out, QByteArray("2\n"));

    const RunResult offsets = run({QStringLiteral("search"), QStringLiteral("DE??BE"),
                                   QStringLiteral("-i"), input, QStringLiteral("--input-format"),
                                   QStringLiteral("mask"), QStringLiteral("--all"),
                                   QStringLiteral("--offsets-only")});
    QCOMPARE(offsets.out, QByteArray("0x00000000\n"));

    const RunResult sequential = run({QStringLiteral("search"), QStringLiteral("be.f"),
                                      QStringLiteral("-i"), input, QStringLiteral("--input-format"),
                                      QStringLiteral("regex"), QStringLiteral("--all"),
                                      QStringLiteral("--threads"), QStringLiteral("1")});
    QCOMPARE(sequential.exitCode, 0);
    QVERIFY(sequential.out.isEmpty());
    QCOMPARE(sequential.err, QStringLiteral("No matches found\n"));
}

void CommandIntegrationTests::searchReportsMissingPattern() {
    const QString input = writeFixture(QStringLiteral("text.bin"), QByteArrayLiteral("xxHixHi"));
    const RunResult ascii = run({QStringLiteral("search"), QStringLiteral("Hi"),
                                 QStringLiteral("-i"), input, QStringLiteral("--input-format"),
                                 QStringLiteral("ascii"), QStringLiteral("--all"),
                                 QStringLiteral("--offsets-only")});
    QCOMPARE(ascii.out, QByteArray("0x00000002\n0x00000005\n"));

    const RunResult missing = run({QStringLiteral("search"), QStringLiteral("0000"),
                                   QStringLiteral("-i"), input, QStringLiteral("--silent")});
    QCOMPARE(missing.exitCode, 0);
    QVERIFY(missing.out.isEmpty());
    QVERIFY(missing.err.isEmpty());

    const RunResult badThreads = run({QStringLiteral("search"), QStringLiteral("00"),
                                      QStringLiteral("-i"), input, QStringLiteral("--threads"),
                                      QStringLiteral("many")});
    QCOMPARE(badThreads.exitCode, 1);
    QCOMPARE(badThreads.err,
             QStringLiteral("Error: Invalid input: Invalid value for --threads: 'many'\n"));
}

void CommandIntegrationTests::analyzeEmitsCsv() {
    const QString input = writeFixture(QStringLiteral("zeros.bin"), QByteArray(1000, '\0'));
    const RunResult entropy = run({QStringLiteral("analyze"), QStringLiteral("entropy"),
                                   QStringLiteral("-i"), input, QStringLiteral("--block-size"),
                                   QStringLiteral("0"), QStringLiteral("--output-format"),
                                   QStringLiteral("csv")});
    QCOMPARE(entropy.exitCode, 0);
    QVERIFY(entropy.out.startsWith("offset,size,entropy\n0,1000,0.000000\n"));

    const RunResult blocks = run({QStringLiteral("analyze"), QStringLiteral("ic"),
                                  QStringLiteral("-i"), input, QStringLiteral("--block-size"),
                                  QStringLiteral("400"), QStringLiteral("--output-format"),
                                  QStringLiteral("csv")});
    QCOMPARE(blocks.exitCode, 0);
    QVERIFY(blocks.out.startsWith("offset,size,ic\n0,400,1.00000000\n400,400,1.00000000\n"
                                  "800,200,1.00000000\n"));

    const RunResult badType = run({QStringLiteral("analyze"), QStringLiteral("fft"),
                                   QStringLiteral("-i"), input});
    QCOMPARE(badType.exitCode, 1);
    QVERIFY(badType.err.startsWith(QStringLiteral("Error: ")));
}

void CommandIntegrationTests::diffRendersSimpleWithSummary() {
    const QString left = writeFixture(QStringLiteral("a.bin"), QByteArray::fromHex("00112233"));
    const QString right = writeFixture(QStringLiteral("b.bin"), QByteArray::fromHex("FF1122CC"));

    const RunResult result = run({QStringLiteral("diff"), left, right,
                                  QStringLiteral("--diff-format"), QStringLiteral("simple"),
                                  QStringLiteral("--color"), QStringLiteral("never"),
                                  QStringLiteral("--summary")});
    QCOMPARE(result.exitCode, 0);
    QCOMPARE(result.out,
             QByteArray("0x00000000: 0x00 != 0xff\n"
                        "0x00000003: 0x33 != 0xcc\n"
                        "\n"
                        "2 difference(s): 2 changed, 0 deleted, 0 added "
                        "(file1: 4 bytes, file2: 4 bytes)\n"));

    const RunResult ignored = run({QStringLiteral("diff"), left, right,
                                   QStringLiteral("--color"), QStringLiteral("never"),
                                   QStringLiteral("--ignore-offsets"), QStringLiteral("0,3")});
    QCOMPARE(ignored.exitCode, 0);
    QVERIFY(ignored.out.isEmpty());
    QCOMPARE(ignored.err, QStringLiteral("Files are identical\n"));
}

void CommandIntegrationTests::diffRendersPatch() {
    const QString left = writeFixture(QStringLiteral("p1.bin"), QByteArray::fromHex("0011"));
    const QString right = writeFixture(QStringLiteral("p2.bin"), QByteArray::fromHex("00FF22"));

    const RunResult result = run({QStringLiteral("diff"), left, right,
                                  QStringLiteral("--diff-format"), QStringLiteral("patch")});
    QCOMPARE(result.exitCode, 0);
    const QString text = QString::fromUtf8(result.out);
    QVERIFY(text.startsWith(QStringLiteral("# binfiddle patch file\n# source: %1\n# target: %2\n")
                                .arg(left, right)));
    QVERIFY(text.contains(QStringLiteral("# differences: 2\n")));
    QVERIFY(text.endsWith(QStringLiteral("0x00000001:11:ff\n0x00000002::22\n")));
}

void CommandIntegrationTests::diffReportsIdenticalFiles() {
    const QString left = writeFixture(QStringLiteral("same1.bin"), QByteArray::fromHex("ABCD"));
    const QString right = writeFixture(QStringLiteral("same2.bin"), QByteArray::fromHex("ABCD"));

    const RunResult result = run({QStringLiteral("diff"), left, right});
    QCOMPARE(result.exitCode, 0);
    QVERIFY(result.out.isEmpty());
    QCOMPARE(result.err, QStringLiteral("Files are identical\n"));

    const RunResult silent = run({QStringLiteral("diff"), left, right, QStringLiteral("--silent")});
    QVERIFY(silent.err.isEmpty());
}

void CommandIntegrationTests::diffFailsOnMissingFile() {
    const QString left = writeFixture(QStringLiteral("present.bin"), QByteArray::fromHex("00"));
    const RunResult result =
        run({QStringLiteral("diff"), left, m_dir.filePath(QStringLiteral("absent.bin"))});
    QCOMPARE(result.exitCode, 1);
    QVERIFY(result.err.startsWith(QStringLiteral("Error: I/O error: ")));
}

void CommandIntegrationTests::convertRewritesEncodingAndNewlines() {
    const QString input = writeFixture(QStringLiteral("text.txt"), QByteArrayLiteral("a\nb"));

    const RunResult toStdout = run({QStringLiteral("convert"), QStringLiteral("-i"), input,
                                    QStringLiteral("--to"), QStringLiteral("utf-16le"),
                                    QStringLiteral("--newlines"), QStringLiteral("windows")});
    QCOMPARE(toStdout.exitCode, 0);
    QCOMPARE(toStdout.out, QByteArray::fromHex("61000d000a006200"));

    const QString output = m_dir.filePath(QStringLiteral("text-bom.txt"));
    const RunResult toFile = run({QStringLiteral("convert"), QStringLiteral("-i"), input,
                                  QStringLiteral("--bom"), QStringLiteral("add"),
                                  QStringLiteral("-o"), output});
    QCOMPARE(toFile.exitCode, 0);
    QVERIFY(toFile.out.isEmpty());
    QCOMPARE(readFixture(QStringLiteral("text-bom.txt")), QByteArray::fromHex("EFBBBF610A62"));

    const QString invalid = writeFixture(QStringLiteral("bad.txt"), QByteArray::fromHex("41FF"));
    const RunResult strict = run({QStringLiteral("convert"), QStringLiteral("-i"), invalid,
                                  QStringLiteral("--on-error"), QStringLiteral("strict")});
    QCOMPARE(strict.exitCode, 1);
    QVERIFY(strict.err.startsWith(QStringLiteral("Error: Parse error: Decoding error")));

    const RunResult unknown = run({QStringLiteral("convert"), QStringLiteral("-i"), input,
                                   QStringLiteral("--to"), QStringLiteral("ebcdic")});
    QCOMPARE(unknown.exitCode, 1);
    QVERIFY(unknown.err.startsWith(
        QStringLiteral("Error: Invalid input: Unsupported encoding: 'ebcdic'")));
}

void CommandIntegrationTests::invalidInvocationsExitWithError() {
    const RunResult noCommand = run({});
    QCOMPARE(noCommand.exitCode, 1);
    QCOMPARE(noCommand.err,
             QStringLiteral("Error: Invalid input: No command given. Run with --help for "
                            "usage.\n"));

    const RunResult unknown = run({QStringLiteral("explode")});
    QCOMPARE(unknown.exitCode, 1);
    QCOMPARE(unknown.err, QStringLiteral("Error: Invalid input: Unknown command 'explode'. Run "
                                         "with --help for usage.\n"));

    const QString input = writeFixture(QStringLiteral("misc.bin"), QByteArray::fromHex("DEAD"));
    const RunResult conflicting = run({QStringLiteral("write"), QStringLiteral("0"),
                                       QStringLiteral("00"), QStringLiteral("-i"), input,
                                       QStringLiteral("--in-file"), QStringLiteral("-o"),
                                       QStringLiteral("-")});
    QCOMPARE(conflicting.exitCode, 1);
    QCOMPARE(conflicting.err,
             QStringLiteral("Error: Invalid input: --in-file cannot be combined with --output\n"));

    const RunResult zeroChunk = run({QStringLiteral("read"), QStringLiteral("0"),
                                     QStringLiteral("-i"), input, QStringLiteral("-c"),
                                     QStringLiteral("0")});
    QCOMPARE(zeroChunk.exitCode, 1);
    QVERIFY(zeroChunk.err.startsWith(QStringLiteral("Error: Invalid chunk size: ")));

    const RunResult missingArgs = run({QStringLiteral("read"), QStringLiteral("-i"), input});
    QCOMPARE(missingArgs.exitCode, 1);
    QVERIFY(missingArgs.err.contains(QStringLiteral("Missing arguments for 'read'")));
}

QString CommandIntegrationTests::writePacketTemplate() const {
    return writeFixture(QStringLiteral("packet.yaml"),
                        QByteArrayLiteral("name: Packet\n"
                                          "endian: big\n"
                                          "fields:\n"
                                          "  - name: magic\n"
                                          "    offset: 0\n"
                                          "    size: 2\n"
                                          "    type: hex\n"
                                          "    assert: \"CAFE\"\n"
                                          "  - name: length\n"
                                          "    offset: 0x2\n"
                                          "    size: 2\n"
                                          "    type: u16\n"
                                          "  - name: kind\n"
                                          "    offset: 4\n"
                                          "    size: 1\n"
                                          "    type: u8\n"
                                          "    enum: {1: ping, 2: pong}\n"
                                          "  - name: label\n"
                                          "    offset: 5\n"
                                          "    size: 4\n"
                                          "    type: string\n"));
}

void CommandIntegrationTests::structDecodesTemplateFields() {
    const QString layout = writePacketTemplate();
    QByteArray packet = QByteArray::fromHex("CAFE001002");
    packet.append(QByteArrayLiteral("Hi\0\0"));
    const QString input = writeFixture(QStringLiteral("packet.bin"), packet);

    const RunResult human = run({QStringLiteral("struct"), layout, QStringLiteral("-i"), input});
    QCOMPARE(human.exitCode, 0);
    const QString table = QString::fromUtf8(human.out);
    QVERIFY(table.startsWith(QStringLiteral("Structure: Packet\n")));
    QVERIFY(table.contains(QStringLiteral("2 (pong)")));
    QVERIFY(table.contains(QStringLiteral("\"Hi\"")));

    const RunResult single = run({QStringLiteral("struct"), layout, QStringLiteral("-i"), input,
                                  QStringLiteral("--get"), QStringLiteral("length")});
    QCOMPARE(single.exitCode, 0);
    QCOMPARE(single.out, QByteArray("16\n"));

    const RunResult json = run({QStringLiteral("struct"), layout, QStringLiteral("-i"), input,
                                QStringLiteral("--get"), QStringLiteral("kind,magic"),
                                QStringLiteral("--output-format"), QStringLiteral("json")});
    QCOMPARE(json.exitCode, 0);
    const QJsonObject root = QJsonDocument::fromJson(json.out).object();
    QCOMPARE(root.value(QStringLiteral("name")).toString(), QStringLiteral("Packet"));
    const QJsonArray fields = root.value(QStringLiteral("fields")).toArray();
    QCOMPARE(fields.size(), 2);
    QCOMPARE(fields.at(0).toObject().value(QStringLiteral("value")).toString(),
             QStringLiteral("ca fe"));
    QCOMPARE(fields.at(1).toObject().value(QStringLiteral("enum_name")).toString(),
             QStringLiteral("pong"));
    QVERIFY(root.value(QStringLiteral("all_assertions_passed")).toBool());

    const RunResult yaml = run({QStringLiteral("struct"), layout, QStringLiteral("-i"), input,
                                QStringLiteral("--output-format"), QStringLiteral("yaml")});
    QCOMPARE(yaml.exitCode, 0);
    QVERIFY(yaml.out.startsWith("name: Packet\n"));
    QVERIFY(yaml.out.contains("numeric_value: 16"));

    const RunResult listing = run({QStringLiteral("struct"), layout,
                                   QStringLiteral("--list-fields")});
    QCOMPARE(listing.exitCode, 0);
    QVERIFY(listing.out.startsWith("Template: Packet\nEndianness: Big\nTotal size: 9 bytes\n"
                                   "Fields: 4\n"));
}

void CommandIntegrationTests::structReportsTemplateErrors() {
    const QString layout = writePacketTemplate();
    const QString truncated =
        writeFixture(QStringLiteral("truncated.bin"), QByteArray::fromHex("CAFE0010"));

    const RunResult shortInput =
        run({QStringLiteral("struct"), layout, QStringLiteral("-i"), truncated});
    QCOMPARE(shortInput.exitCode, 1);
    QCOMPARE(shortInput.err,
             QStringLiteral("Error: Invalid range: Field 'kind' at offset 0x4 with size 1 "
                            "exceeds data length 4\n"));

    const RunResult unknownField = run({QStringLiteral("struct"), layout, QStringLiteral("-i"),
                                        truncated, QStringLiteral("--get"),
                                        QStringLiteral("checksum")});
    QCOMPARE(unknownField.exitCode, 1);
    QVERIFY(unknownField.err.startsWith(
        QStringLiteral("Error: Invalid input: Field 'checksum' not found")));

    const RunResult missingTemplate =
        run({QStringLiteral("struct"), m_dir.filePath(QStringLiteral("absent.yaml")),
             QStringLiteral("-i"), truncated});
    QCOMPARE(missingTemplate.exitCode, 1);
    QVERIFY(missingTemplate.err.startsWith(
        QStringLiteral("Error: I/O error: Failed to read template file")));

    const QString broken =
        writeFixture(QStringLiteral("broken.yaml"), QByteArrayLiteral("name: [Packet\n"));
    const RunResult badYaml = run({QStringLiteral("struct"), broken, QStringLiteral("-i"),
                                   truncated});
    QCOMPARE(badYaml.exitCode, 1);
    QVERIFY(badYaml.err.startsWith(
        QStringLiteral("Error: Parse error: Failed to parse template YAML")));

    const RunResult badFormat = run({QStringLiteral("struct"), layout, QStringLiteral("-i"),
                                     truncated, QStringLiteral("--output-format"),
                                     QStringLiteral("csv")});
    QCOMPARE(badFormat.exitCode, 1);
    QVERIFY(badFormat.err.startsWith(QStringLiteral("Error: Invalid input: ")));

    const RunResult noTemplate = run({QStringLiteral("struct")});
    QCOMPARE(noTemplate.exitCode, 1);
    QVERIFY(noTemplate.err.contains(QStringLiteral("Missing arguments for 'struct'")));
}

}  // namespace

QTEST_GUILESS_MAIN(CommandIntegrationTests)
#include "command_integration_tests.moc"
