#pragma once

#include "core/MediaTools.hpp"
#include "core/MetadataProvider.hpp"
#include "core/Notifier.hpp"
#include "core/Schedule.hpp"
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace podcapture {
namespace test {

namespace fs = std::filesystem;

// Scratch directory removed with everything in it on destruction.
class TempDir {
public:
    TempDir() {
        std::string pattern = (fs::temp_directory_path() / "podcapture-test-XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (mkdtemp(buffer.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = buffer.data();
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    fs::path operator/(const std::string& name) const { return path_ / name; }

private:
    fs::path path_;
};

// Pins the process time zone to a POSIX TZ rule for the lifetime of the object.
class ScopedTimeZone {
public:
    explicit ScopedTimeZone(const char* rule) {
        if (const char* current = std::getenv("TZ")) {
            previous_ = current;
        }
        setenv("TZ", rule, 1);
        tzset();
    }

    ~ScopedTimeZone() {
        if (previous_) {
            setenv("TZ", previous_->c_str(), 1);
        } else {
            unsetenv("TZ");
        }
        tzset();
    }

    ScopedTimeZone(const ScopedTimeZone&) = delete;
    ScopedTimeZone& operator=(const ScopedTimeZone&) = delete;

private:
    std::optional<std::string> previous_;
};

// US Pacific rules, spelled out so no tzdata lookup is needed.
inline constexpr const char* kPacificTimeZone = "PST8PDT,M3.2.0,M11.1.0";

// Wall-clock time in the local zone.
inline core::Instant localTime(int year, int month, int day, int hour, int minute, int second = 0) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;
    return core::Clock::from_time_t(std::mktime(&tm));
}

inline void writeFile(const fs::path& path, const std::string& contents) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
}

inline std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Allocates no blocks on filesystems with sparse file support.
inline void makeSparseFile(const fs::path& path, std::uintmax_t size) {
    writeFile(path, "");
    fs::resize_file(path, size);
}

class FakeRecorder : public core::Recorder {
public:
    bool record(const std::string& streamUrl, const fs::path& outputPath, std::chrono::seconds duration) override {
        ++calls;
        if (journal) {
            journal->push_back("record");
        }
        lastStreamUrl = streamUrl;
        lastOutput = outputPath;
        lastDuration = duration;
        if (!succeed) {
            return false;
        }
        makeSparseFile(outputPath, bytes);
        return true;
    }

    bool succeed = true;
    std::uintmax_t bytes = 4096;
    int calls = 0;
    std::string lastStreamUrl;
    fs::path lastOutput;
    std::chrono::seconds lastDuration{0};
    std::vector<std::string>* journal = nullptr;
};

class FakeProbe : public core::DurationProbe {
public:
    std::optional<double> probe(const fs::path&) const override { return seconds; }

    std::optional<double> seconds = 3600.0;
};

// Writes 1000 bytes per part; part `failOn` (1-based) fails after leaving a stub file behind.
class FakeExtractor : public core::RangeExtractor {
public:
    struct Call {
        fs::path source;
        fs::path dest;
        long start;
        long length;
    };

    bool extract(const fs::path& source, const fs::path& dest, long startSeconds, long lengthSeconds) override {
        calls.push_back({source, dest, startSeconds, lengthSeconds});
        if (static_cast<int>(calls.size()) == failOn) {
            writeFile(dest, "partial");
            return false;
        }
        writeFile(dest, std::string(1000, 'a'));
        return true;
    }

    std::vector<Call> calls;
    int failOn = 0;
};

class FakeMetadataProvider : public core::MetadataProvider {
public:
    core::ShowMetadata fetch(const std::string& showName, const std::string& archiveUrl) noexcept override {
        ++calls;
        if (journal) {
            journal->push_back("fetch");
        }
        lastShowName = showName;
        lastArchiveUrl = archiveUrl;
        return result;
    }

    core::ShowMetadata result;
    int calls = 0;
    std::string lastShowName;
    std::string lastArchiveUrl;
    std::vector<std::string>* journal = nullptr;
};

class RecordingNotifier : public core::Notifier {
public:
    void notify(const std::string& message) noexcept override { messages.push_back(message); }

    std::vector<std::string> messages;
};

class CountingPublisher : public core::Publisher {
public:
    void publish() noexcept override { ++calls; }

    int calls = 0;
};

} // namespace test
} // namespace podcapture
