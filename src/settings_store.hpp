#pragma once
#include "database.hpp"
#include <string>
#include <vector>
#include <optional>

namespace queuectl {

// Key/value settings kept in the database's config table.
class SettingsStore {
public:
    static constexpr const char* kMaxRetries = "max_retries";
    static constexpr const char* kBackoffBase = "backoff_base_seconds";
    static constexpr int kDefaultMaxRetries = 3;
    static constexpr double kDefaultBackoffBase = 2.0;

    explicit SettingsStore(Database& db) : db_(db) {}

    std::optional<std::string> get(const std::string& key);
    void set(const std::string& key, const std::string& value);

    // Missing or non-numeric values yield the default
    int get_int(const std::string& key, int def);
    double get_double(const std::string& key, double def);

    int max_retries() { return get_int(kMaxRetries, kDefaultMaxRetries); }
    double backoff_base() { return get_double(kBackoffBase, kDefaultBackoffBase); }

    static bool is_known_key(const std::string& key);

private:
    Database& db_;
};

} // namespace queuectl
