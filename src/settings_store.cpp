#include "settings_store.hpp"
#include <cstdlib>
#include <cerrno>

namespace queuectl {

std::optional<std::string> SettingsStore::get(const std::string& key) {
    Statement stmt(db_, "SELECT value FROM config WHERE key = ?");
    stmt.bind_text(1, key);
    if (!stmt.step()) return std::nullopt;
    return stmt.column_text(0);
}

void SettingsStore::set(const std::string& key, const std::string& value) {
    Statement stmt(db_, "INSERT OR REPLACE INTO config (key, value) VALUES (?, ?)");
    stmt.bind_text(1, key);
    stmt.bind_text(2, value);
    stmt.step();
}

int SettingsStore::get_int(const std::string& key, int def) {
    auto value = get(key);
    if (!value || value->empty()) return def;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(value->c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return def;
    return static_cast<int>(v);
}

double SettingsStore::get_double(const std::string& key, double def) {
    auto value = get(key);
    if (!value || value->empty()) return def;
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(value->c_str(), &end);
    if (errno != 0 || *end != '\0') return def;
    return v;
}

bool SettingsStore::is_known_key(const std::string& key) {
    return key == kMaxRetries || key == kBackoffBase;
}

} // namespace queuectl
