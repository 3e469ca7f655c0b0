#include "config_cmd.hpp"
#include "config.hpp"
#include "settings_store.hpp"
#include <iostream>

namespace queuectl {

int cmd_config(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: queuectl config <set KEY VALUE|get KEY>\n"
                  << "Known keys: max_retries, backoff_base_seconds\n";
        return 1;
    }

    const std::string& subcmd = args[0];
    try {
        Config cfg = Config::load(default_config_path());
        Database db(cfg.database_path(), cfg.busy_timeout_ms);
        SettingsStore settings(db);

        if (subcmd == "set") {
            if (args.size() < 3) {
                std::cerr << "Usage: queuectl config set KEY VALUE\n";
                return 1;
            }
            const std::string& key = args[1];
            const std::string& value = args[2];
            if (!SettingsStore::is_known_key(key)) {
                std::cout << "Warning: '" << key << "' is not a recognized setting.\n";
            }
            settings.set(key, value);
            std::cout << "Config updated: " << key << " = " << value << "\n";
            return 0;
        }
        else if (subcmd == "get") {
            if (args.size() < 2) {
                std::cerr << "Usage: queuectl config get KEY\n";
                return 1;
            }
            const std::string& key = args[1];
            auto value = settings.get(key);
            if (!value) {
                std::cerr << "Error: Config key '" << key << "' not found.\n";
                return 1;
            }
            std::cout << key << " = " << *value << "\n";
            return 0;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown config subcommand: " << subcmd << "\n";
    return 1;
}

} // namespace queuectl
