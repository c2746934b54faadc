#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include "core/selection_strategy.hpp"

/**
 * @brief Settings of a duplicate check run
 *
 * Built by PocoConfigManager::getDedupConfig() or left at its defaults, and
 * passed by value into the components that need it.
 */
struct DedupConfig
{
    // Logging
    std::string log_level = "INFO";
    uint64_t log_max_file_size_bytes = 5 * 1024 * 1024;

    // Paths
    std::string target_base_dir = "DuplicateCheckResults";
    std::string duplicates_folder_name = "Duplicates";
    std::string log_folder = "DuplicateCheckResults/Logs";
    std::string log_filename = "duplicate_check.log";
    std::string performance_log_filename = "performance_log.txt";

    // Files smaller than this are never considered
    uint64_t min_size_bytes = 1 * 1024 * 1024;

    // Lower-case extensions without the leading dot
    std::set<std::string> allowed_extensions = {"jpg", "jpeg", "png", "webp", "gif",
                                                "heic", "tiff", "bmp", "jfif", "dng"};
    std::set<std::string> raw_extensions = {"dng"};

    // Lower value = preferred format
    std::map<std::string, int> format_priority = {{"dng", 0}, {"tiff", 1}, {"png", 2}, {"jpeg", 3},
                                                  {"jpg", 3}, {"heic", 4}, {"webp", 5}};

    // Detection
    int threshold = 5;
    bool exhaustive_anchor_search = false;

    // Automatic selection
    SelectionStrategy strategy = SelectionStrategy::KEEP_BEST_QUALITY;

    // 0 = one worker per hardware thread
    int max_hashing_threads = 0;

    static constexpr int kHashBits = 64;
    static constexpr int kUnknownFormatPriority = 99;

    bool isAllowedExtension(const std::string &ext) const
    {
        return allowed_extensions.count(ext) > 0;
    }

    bool isRawExtension(const std::string &ext) const
    {
        return raw_extensions.count(ext) > 0;
    }
};
