#include "settings/AppSettings.h"

#include <QSettings>
#include <QtGlobal>

#include <memory>

namespace binfiddle {

namespace {
constexpr const char* kOrg = "binfiddle";
constexpr const char* kApp = "binfiddle";
constexpr const char* kConfigEnv = "BINFIDDLE_CONFIG";
constexpr const char* kOutputFormatKey = "display/outputFormat";
constexpr const char* kInputFormatKey = "display/inputFormat";
constexpr const char* kDisplayWidthKey = "display/width";
constexpr const char* kChunkSizeKey = "display/chunkSize";
constexpr const char* kDiffContextKey = "diff/context";
constexpr const char* kColorModeKey = "diff/color";
constexpr const char* kParallelSearchKey = "search/parallel";
constexpr const char* kAnalyzeBlockSizeKey = "analyze/blockSize";

std::unique_ptr<QSettings> openSettings() {
    const QString overridePath = qEnvironmentVariable(kConfigEnv);
    if (!overridePath.isEmpty()) {
        return std::make_unique<QSettings>(overridePath, QSettings::IniFormat);
    }
    return std::make_unique<QSettings>(kOrg, kApp);
}

int positiveInt(const char* key, int defaultValue) {
    const std::unique_ptr<QSettings> settings = openSettings();
    bool ok = false;
    const int value = settings->value(key, defaultValue).toInt(&ok);
    return (ok && value > 0) ? value : defaultValue;
}
}  // namespace

QString AppSettings::defaultOutputFormat() {
    const std::unique_ptr<QSettings> settings = openSettings();
    return settings->value(kOutputFormatKey, QStringLiteral("hex")).toString();
}

QString AppSettings::defaultInputFormat() {
    const std::unique_ptr<QSettings> settings = openSettings();
    return settings->value(kInputFormatKey, QStringLiteral("hex")).toString();
}

int AppSettings::displayWidth() { return positiveInt(kDisplayWidthKey, 16); }

int AppSettings::chunkSize() { return positiveInt(kChunkSizeKey, 8); }

int AppSettings::diffContext() {
    const std::unique_ptr<QSettings> settings = openSettings();
    bool ok = false;
    const int value = settings->value(kDiffContextKey, 3).toInt(&ok);
    return (ok && value >= 0) ? value : 3;
}

QString AppSettings::colorMode() {
    const std::unique_ptr<QSettings> settings = openSettings();
    return settings->value(kColorModeKey, QStringLiteral("auto")).toString();
}

bool AppSettings::parallelSearchEnabled() {
    const std::unique_ptr<QSettings> settings = openSettings();
    return settings->value(kParallelSearchKey, true).toBool();
}

int AppSettings::analyzeBlockSize() { return positiveInt(kAnalyzeBlockSizeKey, 256); }

QString AppSettings::storeLocation() {
    const std::unique_ptr<QSettings> settings = openSettings();
    return settings->fileName();
}

}  // namespace binfiddle
