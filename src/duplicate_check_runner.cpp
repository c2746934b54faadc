#include "core/duplicate_check_runner.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>

DuplicateCheckRunner::DuplicateCheckRunner(const DedupConfig &config)
    : config_(config)
{
}

DuplicateCheckRunner::DuplicateCheckRunner(const DedupConfig &config, MetadataExtractor::ExtractFunction extractor)
    : config_(config), extractor_(std::move(extractor))
{
}

std::string DuplicateCheckRunner::getModeName(RunMode mode)
{
    switch (mode)
    {
    case RunMode::MANUAL_REVIEW:
        return "Manual review";
    case RunMode::AUTOMATIC_SELECTION:
        return "Automatic selection";
    default:
        return "Unknown";
    }
}

std::optional<RunMode> DuplicateCheckRunner::parseMode(const std::string &name)
{
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    if (lower == "manual" || lower == "manual review")
        return RunMode::MANUAL_REVIEW;
    if (lower == "auto" || lower == "automatic" || lower == "automatic selection")
        return RunMode::AUTOMATIC_SELECTION;
    return std::nullopt;
}

void DuplicateCheckRunner::reportProgress(int percent, const std::string &message) const
{
    if (progress_callback_)
        progress_callback_(percent, message);
}

RunOutcome DuplicateCheckRunner::run(const RunRequest &request) const
{
    RunOutcome outcome;
    outcome.statistics = json::object();

    reportProgress(0, "Scanning folder...");
    FileScanner scanner(config_);
    outcome.scan = scanner.scanDirectory(request.folder);
    outcome.statistics["scan_time"] = outcome.scan.scan_time;

    if (outcome.scan.candidate_paths.empty())
    {
        reportProgress(100, "No image files found.");
        outcome.statistics["groups_found"] = 0;
        return outcome;
    }

    DuplicateChecker checker = extractor_ ? DuplicateChecker(config_, *extractor_) : DuplicateChecker(config_);
    checker.setProgressCallback(progress_callback_);
    checker.setFileProgressCallback(file_progress_callback_);

    CheckResult check = checker.run(outcome.scan.candidate_paths, request.threshold);
    outcome.statistics.update(check.statistics.toJson());
    outcome.all_file_data = std::move(check.all_file_data);
    outcome.groups = std::move(check.groups);

    if (outcome.groups.empty() || request.mode == RunMode::MANUAL_REVIEW)
        return outcome;

    auto start_time = std::chrono::steady_clock::now();
    AutomaticSelector selector(config_);
    outcome.selection = selector.runAutomaticSelection(outcome.groups, request.strategy, outcome.all_file_data);
    outcome.statistics["automatic_selection_time"] =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
    outcome.statistics["files_marked_for_removal"] = outcome.selection.files_for_removal.size();
    return outcome;
}
