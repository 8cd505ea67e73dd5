#pragma once

#include <QString>

namespace binfiddle {

// Stored defaults for the command line. BINFIDDLE_CONFIG points at an INI file
// that replaces the per-user store.
class AppSettings {
public:
    static QString defaultOutputFormat();
    static QString defaultInputFormat();
    static int displayWidth();
    static int chunkSize();
    static int diffContext();
    static QString colorMode();
    static bool parallelSearchEnabled();
    static int analyzeBlockSize();
    static QString storeLocation();
};

}  // namespace binfiddle
