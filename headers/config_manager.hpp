#ifndef CONFIG_MANAGER_HPP
#define CONFIG_MANAGER_HPP

#include <optional>
#include <string>

/**
 * @class ConfigManager
 * @brief Reads the INI configuration file and resolves where the task database lives
 *
 * Recognised keys:
 *   [Database]
 *   Path=/path/to/tasks.db
 */
class ConfigManager {
public:
    /**
     * @param config_path INI file; std::nullopt means the default $HOME/.todo.ini
     * @throws ConfigError if an explicitly named file does not exist
     */
    explicit ConfigManager(const std::optional<std::string>& config_path = std::nullopt);

    /**
     * @brief Database path from [Database] Path, else $HOME/.todo.db
     */
    std::string get_db_path() const;

    std::string get_config_path() const;

    static std::string default_config_path();
    static std::string default_db_path();

private:
    std::string config_path_;
    bool file_present_;

    std::optional<std::string> read_key(const std::string& section, const std::string& key) const;
};

#endif
