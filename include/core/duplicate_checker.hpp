#pragma once

#include "core/dedup_config.hpp"
#include "core/file_metadata.hpp"
#include "core/metadata_extractor.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

/**
 * @brief Fatal failure of a duplicate check run; no partial results are returned
 */
class DuplicateCheckError : public std::runtime_error
{
public:
    explicit DuplicateCheckError(const std::string &message)
        : std::runtime_error(message) {}
};

struct CheckStatistics
{
    size_t files_processed = 0; // distinct candidates handed to the run
    size_t failed_files = 0;
    size_t images_hashed = 0;
    size_t distinct_hashes = 0;
    size_t groups_found = 0;
    double hashing_time = 0.0;    // seconds
    double comparison_time = 0.0; // seconds

    json toJson() const;
};

struct CheckResult
{
    CheckStatistics statistics;
    FileMetadataMap all_file_data;
    DuplicateGroups groups;
};

/**
 * @brief Batch duplicate detection over a list of candidate files
 *
 * Hashes every candidate in parallel, indexes the distinct hashes in a
 * BK-tree and clusters radius matches into disjoint groups.
 */
class DuplicateChecker
{
public:
    using ProgressCallback = std::function<void(int percent, const std::string &message)>;
    using FileProgressCallback = std::function<void(size_t processed, size_t total)>;

    explicit DuplicateChecker(const DedupConfig &config);

    /**
     * @brief Use a custom per-file extractor instead of MetadataExtractor
     */
    DuplicateChecker(const DedupConfig &config, MetadataExtractor::ExtractFunction extractor);

    void setProgressCallback(ProgressCallback callback) { progress_callback_ = std::move(callback); }
    void setFileProgressCallback(FileProgressCallback callback) { file_progress_callback_ = std::move(callback); }

    /**
     * @brief Run a check with the configured threshold
     */
    CheckResult run(const std::vector<std::string> &image_paths) const;

    /**
     * @brief Run a check
     * @param image_paths Candidate files, already local
     * @param threshold Inclusive Hamming distance limit
     * @return Statistics, metadata of every hashed file and the duplicate groups
     * @throws std::invalid_argument if threshold is outside [0, 64]
     * @throws DuplicateCheckError on any unexpected failure
     */
    CheckResult run(const std::vector<std::string> &image_paths, int threshold) const;

    /**
     * @brief Cluster already hashed files into duplicate groups
     * @param file_data Metadata keyed by path
     * @param threshold Inclusive Hamming distance limit
     * @param exhaustive Query every distinct hash instead of skipping matched ones
     * @param progress Optional progress sink for the comparison phase
     * @return Sorted groups of at least two paths, ordered by first path
     */
    static DuplicateGroups findGroups(const FileMetadataMap &file_data, int threshold, bool exhaustive,
                                      const ProgressCallback &progress = nullptr);

private:
    DedupConfig config_;
    MetadataExtractor::ExtractFunction extractor_;
    ProgressCallback progress_callback_;
    FileProgressCallback file_progress_callback_;

    void reportProgress(int percent, const std::string &message) const;
    FileMetadataMap hashFiles(const std::vector<std::string> &paths) const;
};
