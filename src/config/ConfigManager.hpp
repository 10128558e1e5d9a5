#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <toml++/toml.h>

// One section of the run configuration ("matching", "enrichment.city_center") and the keys its handler reads.
struct TableBinding
{
    std::string path;
    std::vector<std::string> keys;
    std::function<void(const toml::table& section)> load;
};

/**
 * @brief Parses the run configuration and hands each bound section to its handler.
 *
 * A missing file is not an error: every handler then sees an empty table, so defaults apply.
 * Keys inside a bound section that its handler does not list, and top-level sections nobody bound or
 * acknowledged, are reported as Configuration warnings and collected in unknownKeys().
 */
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "config.toml");
    ~ConfigManager();

    // False when another binding of the same path already lists one of the keys
    [[nodiscard]] bool bind(TableBinding binding);

    // Top-level section read by someone else (LogManager owns [logging])
    void acknowledge(const std::string& section);

    // False on a TOML syntax error, with lastError() set. Exceptions thrown by handlers propagate.
    [[nodiscard]] bool load();

    const std::string& path() const { return config_path_; }
    bool fileFound() const { return file_found_; }
    const std::string& lastError() const { return last_error_; }

    // "[matching] fuzziness", "[colour]"
    const std::vector<std::string>& unknownKeys() const { return unknown_keys_; }

private:
    const toml::table* findSection(const toml::table& root, const std::string& path) const;
    void checkSectionKeys(const toml::table& section, const TableBinding& binding);
    void checkTopLevel(const toml::table& root);
    void reportUnknown(std::string where);

    std::string config_path_;
    std::string last_error_;
    bool file_found_ = false;

    std::vector<TableBinding> bindings_;
    std::vector<std::string> acknowledged_;
    std::vector<std::string> unknown_keys_;
    std::unique_ptr<toml::table> root_;
};
