#include "core/file_scanner.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <chrono>

FileScanner::FileScanner(const DedupConfig &config)
    : config_(config)
{
}

ScanSummary FileScanner::scanDirectory(const std::string &dir_path)
{
    Logger::info("Starting directory scan: " + dir_path);
    auto start_time = std::chrono::steady_clock::now();

    ScanSummary summary;
    bool failed = false;

    auto file_stream = FileUtils::listFilesAsObservable(FileUtils::toAbsolutePath(dir_path), true);
    file_stream.subscribe(
        [this, &summary](const std::string &file_path)
        {
            handleFile(file_path, summary);
        },
        [&failed](const std::exception &error)
        {
            failed = true;
            Logger::error("Scan error: " + std::string(error.what()));
        },
        [&summary]()
        {
            Logger::info("Directory scan completed. Files: " + std::to_string(summary.total_files) +
                         ", Candidates: " + std::to_string(summary.candidate_paths.size()));
        });

    if (failed)
        return ScanSummary();

    std::sort(summary.candidate_paths.begin(), summary.candidate_paths.end());
    summary.scan_time = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
    return summary;
}

void FileScanner::handleFile(const std::string &file_path, ScanSummary &summary) const
{
    summary.total_files++;

    std::string ext = FileUtils::getFileExtension(file_path);
    if (config_.isAllowedExtension(ext))
    {
        summary.image_extension_counts[ext]++;
        summary.candidate_paths.push_back(file_path);
        return;
    }

    Logger::trace("Skipping unsupported file during scan: " + file_path);
    summary.other_extension_counts[ext.empty() ? kNoExtension : ext]++;
}
