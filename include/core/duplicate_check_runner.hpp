#pragma once

#include "core/automatic_selector.hpp"
#include "core/dedup_config.hpp"
#include "core/duplicate_checker.hpp"
#include "core/file_scanner.hpp"
#include <optional>
#include <string>

enum class RunMode
{
    MANUAL_REVIEW,
    AUTOMATIC_SELECTION
};

struct RunRequest
{
    std::string folder;
    int threshold = 5;
    RunMode mode = RunMode::MANUAL_REVIEW;
    SelectionStrategy strategy = SelectionStrategy::KEEP_BEST_QUALITY;
};

struct RunOutcome
{
    json statistics; // scan, check and selection statistics merged
    ScanSummary scan;
    FileMetadataMap all_file_data;
    DuplicateGroups groups;
    SelectionResult selection; // empty in manual review mode
};

/**
 * @brief Runs scan, duplicate check and (in automatic mode) selection for a folder
 */
class DuplicateCheckRunner
{
public:
    explicit DuplicateCheckRunner(const DedupConfig &config);

    /**
     * @brief Use a custom per-file extractor for the duplicate check
     */
    DuplicateCheckRunner(const DedupConfig &config, MetadataExtractor::ExtractFunction extractor);

    void setProgressCallback(DuplicateChecker::ProgressCallback callback) { progress_callback_ = std::move(callback); }

    /**
     * @brief Receive (processed, total) file counts during hashing
     */
    void setFileProgressCallback(DuplicateChecker::FileProgressCallback callback) { file_progress_callback_ = std::move(callback); }

    /**
     * @brief Execute one run
     * @throws std::invalid_argument for an out-of-range threshold
     * @throws DuplicateCheckError if the duplicate check fails
     */
    RunOutcome run(const RunRequest &request) const;

    static std::string getModeName(RunMode mode);
    static std::optional<RunMode> parseMode(const std::string &name);

private:
    DedupConfig config_;
    std::optional<MetadataExtractor::ExtractFunction> extractor_;
    DuplicateChecker::ProgressCallback progress_callback_;
    DuplicateChecker::FileProgressCallback file_progress_callback_;

    void reportProgress(int percent, const std::string &message) const;
};
