#pragma once

#include <nlohmann/json.hpp>
#include <string>

/**
 * @brief Appends a human-readable summary of every run to a text file
 */
class PerformanceLogger
{
public:
    /**
     * @brief Create the folder, and the file with its header if it is new
     */
    PerformanceLogger(const std::string &log_folder, const std::string &log_filename);

    /**
     * @brief Append one run summary
     * @param stats Run statistics (timestamp, folder, mode, times, counts, discarded_files)
     * @return false if the file could not be written
     */
    bool logRun(const nlohmann::json &stats) const;

    const std::string &getLogPath() const { return log_path_; }

    static constexpr size_t kDiscardedSampleSize = 20;

private:
    std::string log_path_;
};
