#include "core/duplicate_checker.hpp"
#include "core/bk_tree.hpp"
#include "core/group_match_engine.hpp"
#include "core/hash_utils.hpp"
#include "core/hashing_thread_pool.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>
#include <unordered_set>

namespace
{
    std::string formatSeconds(double seconds)
    {
        std::stringstream ss;
        ss << std::fixed << std::setprecision(2) << seconds;
        return ss.str();
    }

    double secondsSince(std::chrono::steady_clock::time_point start)
    {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    }
}

json CheckStatistics::toJson() const
{
    return json{
        {"files_processed", files_processed},
        {"failed_files", failed_files},
        {"images_hashed", images_hashed},
        {"distinct_hashes", distinct_hashes},
        {"groups_found", groups_found},
        {"hashing_time", hashing_time},
        {"comparison_time", comparison_time}};
}

DuplicateChecker::DuplicateChecker(const DedupConfig &config)
    : config_(config), extractor_(MetadataExtractor(config).asFunction())
{
}

DuplicateChecker::DuplicateChecker(const DedupConfig &config, MetadataExtractor::ExtractFunction extractor)
    : config_(config), extractor_(std::move(extractor))
{
}

void DuplicateChecker::reportProgress(int percent, const std::string &message) const
{
    if (progress_callback_)
        progress_callback_(percent, message);
}

CheckResult DuplicateChecker::run(const std::vector<std::string> &image_paths) const
{
    return run(image_paths, config_.threshold);
}

CheckResult DuplicateChecker::run(const std::vector<std::string> &image_paths, int threshold) const
{
    if (threshold < 0 || threshold > DedupConfig::kHashBits)
        throw std::invalid_argument("Threshold must be between 0 and 64, got " + std::to_string(threshold));

    // Candidates are de-duplicated and sorted
    std::set<std::string> unique_paths(image_paths.begin(), image_paths.end());
    std::vector<std::string> paths(unique_paths.begin(), unique_paths.end());

    CheckResult result;
    result.statistics.files_processed = paths.size();

    if (paths.empty())
    {
        reportProgress(100, "No image files to check.");
        return result;
    }

    try
    {
        Logger::info("Starting duplicate check of " + std::to_string(paths.size()) + " images (threshold " +
                     std::to_string(threshold) + ")");

        // Step 1: validation and hashing (parallel)
        auto start_time = std::chrono::steady_clock::now();
        result.all_file_data = hashFiles(paths);
        result.statistics.hashing_time = secondsSince(start_time);
        result.statistics.images_hashed = result.all_file_data.size();
        result.statistics.failed_files = paths.size() - result.all_file_data.size();
        Logger::info("Validation and hashing completed in " + formatSeconds(result.statistics.hashing_time) + " seconds.");

        // Step 2: comparison and grouping
        start_time = std::chrono::steady_clock::now();
        reportProgress(75, "Building BK-tree for fast search...");

        if (result.all_file_data.empty())
        {
            reportProgress(100, "No images could be hashed.");
            return result;
        }

        std::set<uint64_t> distinct;
        for (const auto &[path, metadata] : result.all_file_data)
            distinct.insert(metadata.hash);
        result.statistics.distinct_hashes = distinct.size();

        result.groups = findGroups(result.all_file_data, threshold, config_.exhaustive_anchor_search, progress_callback_);
        result.statistics.groups_found = result.groups.size();
        result.statistics.comparison_time = secondsSince(start_time);
        Logger::info("Comparison completed in " + formatSeconds(result.statistics.comparison_time) +
                     " seconds. Found " + std::to_string(result.groups.size()) + " duplicate groups.");

        reportProgress(100, "Check complete.");
        return result;
    }
    catch (const std::exception &e)
    {
        Logger::critical("An unexpected error occurred during the duplicate check: " + std::string(e.what()));
        throw DuplicateCheckError(e.what());
    }
}

FileMetadataMap DuplicateChecker::hashFiles(const std::vector<std::string> &paths) const
{
    FileMetadataMap file_data;
    HashingThreadPool pool(config_.max_hashing_threads);
    Logger::debug("Hashing with " + std::to_string(pool.getThreadCount()) + " threads");

    std::vector<std::future<std::optional<FileMetadata>>> futures;
    futures.reserve(paths.size());
    for (const auto &path : paths)
    {
        futures.push_back(pool.submit([extractor = extractor_, path]()
                                      { return extractor(path); }));
    }

    // Results are collected in submission order; progress follows retrieval
    const size_t total = paths.size();
    for (size_t i = 0; i < futures.size(); ++i)
    {
        std::optional<FileMetadata> metadata = futures[i].get();
        if (metadata)
            file_data[metadata->path] = *metadata;

        size_t processed = i + 1;
        int percent = static_cast<int>(10 + 65 * processed / total);
        reportProgress(percent, "🔄 Processing image " + std::to_string(processed) + " of " + std::to_string(total) + "...");
        if (file_progress_callback_)
            file_progress_callback_(processed, total);
    }
    return file_data;
}

DuplicateGroups DuplicateChecker::findGroups(const FileMetadataMap &file_data, int threshold, bool exhaustive,
                                             const ProgressCallback &progress)
{
    // Exact duplicates collapse to one entry per distinct hash
    std::map<uint64_t, std::vector<std::string>> hash_to_paths;
    for (const auto &[path, metadata] : file_data)
        hash_to_paths[metadata.hash].push_back(path);

    BKTree<uint64_t> tree(&HashUtils::hammingDistance);
    for (const auto &entry : hash_to_paths)
        tree.add(entry.first);

    if (progress)
        progress(80, "Comparing images and building groups...");

    GroupMatchEngine engine;
    std::unordered_set<uint64_t> processed_hashes;
    const size_t total = hash_to_paths.size();
    size_t index = 0;
    for (const auto &[hash, paths] : hash_to_paths)
    {
        ++index;
        if (!exhaustive && processed_hashes.count(hash))
            continue;

        // paths is sorted, so the representative is the smallest path
        const std::string &representative = paths.front();
        for (size_t k = 1; k < paths.size(); ++k)
            engine.addMatch(representative, paths[k], 0);

        for (const auto &[distance, match_hash] : tree.find(hash, threshold))
        {
            const std::string &other = hash_to_paths.at(match_hash).front();
            if (other != representative)
                engine.addMatch(representative, other, distance);
            processed_hashes.insert(match_hash);
        }

        if (progress && index % 50 == 0)
        {
            progress(std::min(99, static_cast<int>(80 + 20 * index / total)),
                     "Comparing group " + std::to_string(index) + "/" + std::to_string(total) + "...");
        }
    }

    // Re-add every path that shares a collapsed hash
    DuplicateGroups final_groups;
    for (const auto &group : engine.getGroups())
    {
        std::set<std::string> expanded;
        for (const auto &path : group)
        {
            auto metadata = file_data.find(path);
            if (metadata == file_data.end())
                continue;
            const auto &same_hash = hash_to_paths.at(metadata->second.hash);
            expanded.insert(same_hash.begin(), same_hash.end());
        }
        if (expanded.size() > 1)
            final_groups.emplace_back(expanded.begin(), expanded.end());
    }
    std::sort(final_groups.begin(), final_groups.end());
    return final_groups;
}
