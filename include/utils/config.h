#pragma once

#include <string>
#include <memory>
#include <cstdint>

namespace phichain {
namespace utils {

constexpr double DEFAULT_SYMMETRY_TOLERANCE = 0.001;

struct LedgerConfig {
    // Relative deviation from phi accepted by the symmetry predicate.
    double symmetryTolerance = DEFAULT_SYMMETRY_TOLERANCE;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
    bool console = true;
    uint64_t maxFileSize = 10 * 1024 * 1024;
    uint32_t maxFiles = 5;
};

class Config {
public:
    static Config& instance();

    // key=value lines, '#' comments. False when the file cannot be opened.
    bool load(const std::string& path);
    bool loadDefaults();
    void reset();

    std::string getString(const std::string& key, const std::string& def = "") const;
    int getInt(const std::string& key, int def = 0) const;
    int64_t getInt64(const std::string& key, int64_t def = 0) const;
    double getDouble(const std::string& key, double def = 0.0) const;
    bool getBool(const std::string& key, bool def = false) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, int value);
    void set(const std::string& key, int64_t value);
    void set(const std::string& key, double value);
    void set(const std::string& key, bool value);

    // Invalid tolerances (non-finite, zero, negative) yield the default.
    LedgerConfig getLedgerConfig() const;
    LoggingConfig getLoggingConfig() const;

private:
    Config();

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
