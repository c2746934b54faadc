#include "core/poco_config_manager.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <functional>
#include <limits>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

namespace
{
    nlohmann::json yamlToJson(const YAML::Node &node)
    {
        switch (node.Type())
        {
        case YAML::NodeType::Map:
        {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto &entry : node)
                obj[entry.first.as<std::string>()] = yamlToJson(entry.second);
            return obj;
        }
        case YAML::NodeType::Sequence:
        {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto &item : node)
                arr.push_back(yamlToJson(item));
            return arr;
        }
        case YAML::NodeType::Scalar:
        {
            bool b;
            if (YAML::convert<bool>::decode(node, b))
                return b;
            int64_t i;
            if (YAML::convert<int64_t>::decode(node, i))
                return i;
            double d;
            if (YAML::convert<double>::decode(node, d))
                return d;
            return node.as<std::string>();
        }
        default:
            return nullptr;
        }
    }
}

PocoConfigManager::PocoConfigManager()
{
    resetToDefaults();
}

nlohmann::json PocoConfigManager::defaultConfig()
{
    DedupConfig defaults;
    nlohmann::json j;
    j["log_level"] = defaults.log_level;
    j["paths"]["target_base_dir"] = defaults.target_base_dir;
    j["paths"]["duplicates_folder_name"] = defaults.duplicates_folder_name;
    j["paths"]["log_folder"] = defaults.log_folder;
    j["paths"]["log_filename"] = defaults.log_filename;
    j["paths"]["performance_log_filename"] = defaults.performance_log_filename;
    j["logging"]["max_file_size_bytes"] = defaults.log_max_file_size_bytes;
    j["filtering"]["min_size_bytes"] = defaults.min_size_bytes;
    for (const auto &ext : defaults.allowed_extensions)
    {
        if (defaults.isRawExtension(ext))
            j["categories"]["images_raw"][ext] = true;
        else
            j["categories"]["images"][ext] = true;
    }
    for (const auto &[ext, priority] : defaults.format_priority)
        j["format_priority"][ext] = priority;
    j["detection"]["threshold"] = defaults.threshold;
    j["detection"]["exhaustive_anchor_search"] = defaults.exhaustive_anchor_search;
    j["selection"]["strategy"] = SelectionStrategies::getStrategyName(defaults.strategy);
    j["threading"]["max_hashing_threads"] = defaults.max_hashing_threads;
    return j;
}

void PocoConfigManager::resetToDefaults()
{
    cfg_ = new JSONConfiguration();
    applyPatch(defaultConfig());
}

bool PocoConfigManager::load(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(path);
    if (!in.good())
    {
        Logger::error("Configuration file not found: " + path);
        return false;
    }

    try
    {
        nlohmann::json patch;
        std::string ext = FileUtils::getFileExtension(path);
        if (ext == "yaml" || ext == "yml")
        {
            patch = yamlToJson(YAML::Load(in));
        }
        else
        {
            AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
            tmp->load(in);
            std::stringstream ss;
            tmp->save(ss);
            patch = nlohmann::json::parse(ss.str());
        }

        if (!patch.is_object())
        {
            Logger::error("Configuration root must be an object: " + path);
            return false;
        }

        resetToDefaults();
        applyPatch(patch);
        Logger::info("Configuration loaded from: " + path);
        return true;
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Error loading config " + path + ": " + e.displayText());
    }
    catch (const std::exception &e)
    {
        Logger::error("Error loading config " + path + ": " + std::string(e.what()));
    }
    return false;
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
    {
        Logger::error("Cannot write configuration file: " + path);
        return false;
    }
    out << toJson().dump(4) << std::endl;
    return out.good();
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return toJson();
}

nlohmann::json PocoConfigManager::toJson() const
{
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    applyPatch(patch);
}

void PocoConfigManager::applyPatch(const nlohmann::json &patch)
{
    // Flatten and set values
    std::function<void(const std::string &, const nlohmann::json &)> apply;
    apply = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                apply(key, it.value());
            }
        }
        else if (!node.is_null())
        {
            if (node.is_boolean())
                cfg_->setBool(prefix, node.get<bool>());
            else if (node.is_number_integer())
            {
                int64_t value = node.get<int64_t>();
                if (value >= std::numeric_limits<int>::min() && value <= std::numeric_limits<int>::max())
                    cfg_->setInt(prefix, static_cast<int>(value));
                else
                    cfg_->setInt64(prefix, value);
            }
            else if (node.is_number_float())
                cfg_->setDouble(prefix, node.get<double>());
            else if (node.is_string())
                cfg_->setString(prefix, node.get<std::string>());
            else
                cfg_->setString(prefix, node.dump());
        }
    };
    apply("", patch);
}

std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}

int64_t PocoConfigManager::getInt64(const std::string &key, int64_t def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt64(key, def);
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getBool(key, def);
}

std::vector<std::string> PocoConfigManager::validateConfig() const
{
    std::vector<std::string> problems;
    try
    {
        int threshold = getInt("detection.threshold", 5);
        if (threshold < 0 || threshold > DedupConfig::kHashBits)
            problems.push_back("Invalid detection.threshold: " + std::to_string(threshold) + " (expected 0-64)");

        int64_t min_size = getInt64("filtering.min_size_bytes", 0);
        if (min_size < 0)
            problems.push_back("Invalid filtering.min_size_bytes: " + std::to_string(min_size));

        std::string strategy = getString("selection.strategy", "");
        if (!SelectionStrategies::fromString(strategy))
            problems.push_back("Invalid selection.strategy: " + strategy);

        int threads = getInt("threading.max_hashing_threads", 0);
        if (threads < 0)
            problems.push_back("Invalid threading.max_hashing_threads: " + std::to_string(threads));
    }
    catch (const Poco::Exception &e)
    {
        problems.push_back("Malformed configuration value: " + e.displayText());
    }

    for (const auto &problem : problems)
        Logger::error(problem);
    return problems;
}

DedupConfig PocoConfigManager::getDedupConfig() const
{
    DedupConfig config;
    nlohmann::json all = getAll();

    try
    {
        config.log_level = getString("log_level", config.log_level);
        config.target_base_dir = getString("paths.target_base_dir", config.target_base_dir);
        config.duplicates_folder_name = getString("paths.duplicates_folder_name", config.duplicates_folder_name);
        config.log_folder = getString("paths.log_folder", config.log_folder);
        config.log_filename = getString("paths.log_filename", config.log_filename);
        config.performance_log_filename = getString("paths.performance_log_filename", config.performance_log_filename);

        int64_t max_log = getInt64("logging.max_file_size_bytes", static_cast<int64_t>(config.log_max_file_size_bytes));
        if (max_log > 0)
            config.log_max_file_size_bytes = static_cast<uint64_t>(max_log);

        int64_t min_size = getInt64("filtering.min_size_bytes", static_cast<int64_t>(config.min_size_bytes));
        if (min_size >= 0)
            config.min_size_bytes = static_cast<uint64_t>(min_size);

        int threshold = getInt("detection.threshold", config.threshold);
        if (threshold >= 0 && threshold <= DedupConfig::kHashBits)
            config.threshold = threshold;
        config.exhaustive_anchor_search = getBool("detection.exhaustive_anchor_search", config.exhaustive_anchor_search);

        auto strategy = SelectionStrategies::fromString(getString("selection.strategy", ""));
        if (strategy)
            config.strategy = *strategy;

        int threads = getInt("threading.max_hashing_threads", config.max_hashing_threads);
        if (threads >= 0)
            config.max_hashing_threads = threads;
    }
    catch (const Poco::Exception &e)
    {
        Logger::warn("Malformed configuration value, keeping defaults: " + e.displayText());
    }

    // Extension tables come from the JSON tree
    auto readExtensions = [&all](const char *category, std::set<std::string> &out)
    {
        if (!all.contains("categories") || !all["categories"].contains(category))
            return;
        for (auto it = all["categories"][category].begin(); it != all["categories"][category].end(); ++it)
        {
            const auto &enabled = it.value();
            bool on = enabled.is_boolean() ? enabled.get<bool>() : (enabled.is_string() && enabled.get<std::string>() == "true");
            if (on)
                out.insert(FileUtils::getFileExtension("x." + it.key()));
        }
    };

    config.allowed_extensions.clear();
    config.raw_extensions.clear();
    readExtensions("images", config.allowed_extensions);
    readExtensions("images_raw", config.raw_extensions);
    config.allowed_extensions.insert(config.raw_extensions.begin(), config.raw_extensions.end());

    if (all.contains("format_priority") && all["format_priority"].is_object())
    {
        config.format_priority.clear();
        for (auto it = all["format_priority"].begin(); it != all["format_priority"].end(); ++it)
        {
            std::string ext = FileUtils::getFileExtension("x." + it.key());
            if (it.value().is_number_integer())
                config.format_priority[ext] = it.value().get<int>();
            else if (it.value().is_string())
            {
                try
                {
                    config.format_priority[ext] = std::stoi(it.value().get<std::string>());
                }
                catch (const std::exception &)
                {
                    Logger::warn("Ignoring non-numeric format priority for " + ext);
                }
            }
        }
    }

    return config;
}
