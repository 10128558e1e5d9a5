#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <plog/Log.h>

namespace
{

bool contains(const std::vector<std::string>& names, const std::string& name)
{
    return std::find(names.begin(), names.end(), name) != names.end();
}

std::string firstSegment(const std::string& path) { return path.substr(0, path.find('.')); }

} // namespace

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::bind(TableBinding binding)
{
    for (const auto& existing : bindings_)
    {
        if (existing.path != binding.path)
            continue;
        for (const auto& key : binding.keys)
        {
            if (contains(existing.keys, key))
            {
                last_error_ = "key '" + key + "' of [" + binding.path + "] is already bound";
                PLOG_ERROR << last_error_;
                return false;
            }
        }
    }

    bindings_.push_back(std::move(binding));
    return true;
}

void ConfigManager::acknowledge(const std::string& section)
{
    if (!contains(acknowledged_, section))
        acknowledged_.push_back(section);
}

bool ConfigManager::load()
{
    last_error_.clear();
    unknown_keys_.clear();

    std::ifstream ifs(config_path_, std::ios::binary);
    file_found_ = static_cast<bool>(ifs);
    if (!file_found_)
    {
        PLOG_INFO << "No config at " << config_path_ << ", using defaults";
        root_ = std::make_unique<toml::table>();
    }
    else
    {
        try
        {
            root_ = std::make_unique<toml::table>(toml::parse(ifs, config_path_));
        }
        catch (const toml::parse_error& pe)
        {
            std::ostringstream where;
            where << config_path_;
            if (pe.source().begin.line > 0)
                where << ":" << pe.source().begin.line << ":" << pe.source().begin.column;
            last_error_ = where.str() + ": " + std::string(pe.description());

            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration,
                                              "Configuration file could not be parsed", last_error_);
            return false;
        }
        checkTopLevel(*root_);
    }

    const toml::table empty;
    for (const auto& binding : bindings_)
    {
        const toml::table* section = findSection(*root_, binding.path);
        if (section)
            checkSectionKeys(*section, binding);
        binding.load(section ? *section : empty);
    }

    if (file_found_)
        PLOG_INFO << "Loaded config from " << config_path_;
    return true;
}

void ConfigManager::checkTopLevel(const toml::table& root)
{
    for (const auto& [key, value] : root)
    {
        const std::string name(key.str());
        if (contains(acknowledged_, name))
            continue;
        const bool bound = std::any_of(bindings_.begin(), bindings_.end(),
                                       [&name](const TableBinding& b) { return firstSegment(b.path) == name; });
        if (!bound)
            reportUnknown("[" + name + "]");
    }
}

void ConfigManager::checkSectionKeys(const toml::table& section, const TableBinding& binding)
{
    for (const auto& [key, value] : section)
    {
        const std::string name(key.str());
        if (contains(binding.keys, name))
            continue;
        // Sub-tables bound on their own ("enrichment.city_center") belong to that binding
        const std::string nested = binding.path + "." + name;
        if (value.is_table() && std::any_of(bindings_.begin(), bindings_.end(),
                                            [&nested](const TableBinding& b) { return b.path == nested; }))
            continue;
        reportUnknown("[" + binding.path + "] " + name);
    }
}

void ConfigManager::reportUnknown(std::string where)
{
    PLOG_WARNING << "Unknown configuration entry " << where << " ignored";
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Unknown configuration entry ignored",
                                        where + " in " + config_path_);
    unknown_keys_.push_back(std::move(where));
}

const toml::table* ConfigManager::findSection(const toml::table& root, const std::string& path) const
{
    const toml::table* current = &root;
    std::istringstream segments(path);
    std::string segment;
    while (std::getline(segments, segment, '.'))
    {
        if (segment.empty())
            return nullptr;
        current = (*current)[segment].as_table();
        if (!current)
            return nullptr;
    }
    return current;
}
