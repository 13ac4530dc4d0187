#include "core/Logger.hpp"
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <system_error>

namespace podcapture {
namespace core {

std::mutex Logger::mutex_;
std::ofstream Logger::file_;
std::filesystem::path Logger::filePath_;
std::uintmax_t Logger::maxBytes_ = 0;
int Logger::maxFiles_ = 0;

namespace {

std::string localTimestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

} // namespace

void Logger::setLogFile(const std::filesystem::path& file, std::uintmax_t maxBytes, int maxFiles) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    filePath_ = file;
    maxBytes_ = maxBytes;
    maxFiles_ = maxFiles;

    if (filePath_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(filePath_.parent_path(), ec);
    }
    rotateIfNeeded();
    file_.open(filePath_, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "[WARN] Could not open log file: " << filePath_.string() << std::endl;
    }
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    filePath_.clear();
}

void Logger::info(const std::string& line) {
    write("INFO", line, false);
}

void Logger::debug(const std::string& line) {
    if (std::getenv("PODCAPTURE_DEBUG") == nullptr) return;
    write("DEBUG", line, false);
}

void Logger::warn(const std::string& line) {
    write("WARN", line, true);
}

void Logger::error(const std::string& line) {
    write("ERROR", line, true);
}

void Logger::write(const char* level, const std::string& line, bool toStderr) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream& console = toStderr ? std::cerr : std::cout;
    console << "[" << level << "] " << line << std::endl;

    if (!file_.is_open()) return;

    file_ << localTimestamp() << " [" << level << "] " << line << '\n';
    file_.flush();

    if (maxBytes_ > 0 && static_cast<std::uintmax_t>(file_.tellp()) >= maxBytes_) {
        file_.close();
        rotateIfNeeded();
        file_.open(filePath_, std::ios::app);
    }
}

// Caller holds mutex_ and has closed file_.
void Logger::rotateIfNeeded() {
    if (filePath_.empty() || maxBytes_ == 0) return;

    std::error_code ec;
    auto size = std::filesystem::file_size(filePath_, ec);
    if (ec || size < maxBytes_) return;

    if (maxFiles_ <= 0) {
        std::filesystem::remove(filePath_, ec);
        return;
    }

    const std::string base = filePath_.string();
    auto rotated = [&base](int n) {
        return std::filesystem::path(base + "." + std::to_string(n));
    };

    std::filesystem::remove(rotated(maxFiles_), ec);
    for (int i = maxFiles_ - 1; i >= 1; --i) {
        if (std::filesystem::exists(rotated(i), ec)) {
            std::filesystem::rename(rotated(i), rotated(i + 1), ec);
        }
    }
    std::filesystem::rename(filePath_, rotated(1), ec);
    if (ec) {
        std::cerr << "[WARN] Log rotation failed: " << ec.message() << std::endl;
    }
}

} // namespace core
} // namespace podcapture
