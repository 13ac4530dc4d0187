#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace podcapture {
namespace core {

// Process-wide log. Info/debug go to stdout, warnings and errors to stderr,
// and every line is mirrored to the log file once one is configured.
class Logger {
public:
    // Rotates `file` when it grows past maxBytes, keeping maxFiles old copies
    // (file.1 is the newest).
    static void setLogFile(const std::filesystem::path& file, std::uintmax_t maxBytes, int maxFiles);
    static void closeLogFile();

    static void info(const std::string& line);
    static void debug(const std::string& line);
    static void warn(const std::string& line);
    static void error(const std::string& line);

private:
    static void write(const char* level, const std::string& line, bool toStderr);
    static void rotateIfNeeded();

    static std::mutex mutex_;
    static std::ofstream file_;
    static std::filesystem::path filePath_;
    static std::uintmax_t maxBytes_;
    static int maxFiles_;
};

} // namespace core
} // namespace podcapture
