#pragma once

#include <stdexcept>
#include <string>

namespace podcapture {
namespace core {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

class DuplicateKeyError : public std::runtime_error {
public:
    explicit DuplicateKeyError(const std::string& key)
        : std::runtime_error("Episode already cataloged: " + key), key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

class SegmentError : public std::runtime_error {
public:
    enum class Kind {
        SourceMissing,
        ProbeFailed,
        SegmentIncomplete
    };

    SegmentError(Kind kind, const std::string& what) : std::runtime_error(what), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

} // namespace core
} // namespace podcapture
