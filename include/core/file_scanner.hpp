#pragma once

#include "core/dedup_config.hpp"
#include "core/file_utils.hpp"
#include <map>
#include <string>
#include <vector>

/**
 * @brief Result of walking a folder tree
 */
struct ScanSummary
{
    size_t total_files = 0;
    std::map<std::string, size_t> image_extension_counts; // allowed image extensions
    std::map<std::string, size_t> other_extension_counts; // everything else, NO_EXT for none
    std::vector<std::string> candidate_paths;             // sorted absolute paths
    double scan_time = 0.0;                               // seconds
};

class FileScanner
{
public:
    explicit FileScanner(const DedupConfig &config);
    ~FileScanner() = default;

    /**
     * @brief Recursively collect the candidate image files below a folder
     * @param dir_path Folder to scan
     * @return Scan summary, empty if the folder is not accessible
     */
    ScanSummary scanDirectory(const std::string &dir_path);

    static constexpr const char *kNoExtension = "NO_EXT";

private:
    DedupConfig config_;

    // Handle individual file during scanning
    void handleFile(const std::string &file_path, ScanSummary &summary) const;
};
