#include "core/performance_logger.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace
{
    std::string valueOr(const nlohmann::json &stats, const char *key, const std::string &def = "N/A")
    {
        if (!stats.contains(key) || stats[key].is_null())
            return def;
        if (stats[key].is_string())
            return stats[key].get<std::string>();
        return stats[key].dump();
    }

    std::string seconds(const nlohmann::json &stats, const char *key)
    {
        double value = 0.0;
        if (stats.contains(key) && stats[key].is_number())
            value = stats[key].get<double>();
        std::stringstream ss;
        ss << std::fixed << std::setprecision(2) << value;
        return ss.str();
    }
}

PerformanceLogger::PerformanceLogger(const std::string &log_folder, const std::string &log_filename)
    : log_path_((fs::path(log_folder) / log_filename).string())
{
    std::error_code ec;
    fs::create_directories(log_folder, ec);
    if (ec)
    {
        Logger::error("Could not create performance log folder " + log_folder + ": " + ec.message());
        return;
    }

    if (!fs::exists(log_path_))
    {
        std::ofstream out(log_path_);
        if (!out)
        {
            Logger::error("Could not create performance log file: " + log_path_);
            return;
        }
        out << "--- Performance Log for Duplicate Check ---\n\n";
    }
}

bool PerformanceLogger::logRun(const nlohmann::json &stats) const
{
    std::ofstream f(log_path_, std::ios::app);
    if (!f)
    {
        Logger::error("Could not write to performance log: " + log_path_);
        return false;
    }

    f << "--- Run: " << valueOr(stats, "timestamp") << " ---\n";
    f << "Folder: " << valueOr(stats, "folder") << "\n";
    f << "Total time: " << seconds(stats, "total_time") << " seconds\n";

    f << "\n[Settings]\n";
    f << "  Mode: " << valueOr(stats, "mode") << "\n";
    if (valueOr(stats, "mode") == "Automatic selection")
        f << "  Strategy: " << valueOr(stats, "strategy") << "\n";
    f << "  Sensitivity (threshold): " << valueOr(stats, "threshold") << "\n";

    f << "\n[Statistics]\n";
    f << "  Images found for check: " << valueOr(stats, "files_processed") << "\n";
    f << "  Images that failed hashing: " << valueOr(stats, "failed_files") << "\n";
    f << "  Images hashed: " << valueOr(stats, "images_hashed") << "\n";

    f << "\n[Time Usage Details (seconds)]\n";
    f << "  Scanning folder:         " << seconds(stats, "scan_time") << "\n";
    f << "  Hashing images:          " << seconds(stats, "hashing_time") << "\n";
    f << "  Comparison/grouping:     " << seconds(stats, "comparison_time") << "\n";
    if (stats.contains("automatic_selection_time"))
        f << "  Automatic selection:     " << seconds(stats, "automatic_selection_time") << "\n";
    if (stats.contains("move_time"))
        f << "  Moving files:            " << seconds(stats, "move_time") << "\n";

    f << "\n[Result]\n";
    f << "  Duplicate groups found: " << valueOr(stats, "groups_found") << "\n";
    f << "  Files marked for removal: " << valueOr(stats, "files_marked_for_removal") << "\n";
    f << "  Files moved: " << valueOr(stats, "files_moved") << "\n";

    if (stats.contains("discarded_files") && stats["discarded_files"].is_array() && !stats["discarded_files"].empty())
    {
        const auto &discarded = stats["discarded_files"];
        f << "\n[Discarded Files (sample)]\n";
        for (size_t i = 0; i < discarded.size() && i < kDiscardedSampleSize; ++i)
        {
            std::string path = discarded[i].is_string() ? discarded[i].get<std::string>() : discarded[i].dump();
            f << "  - " << fs::path(path).filename().string() << "\n";
        }
        if (discarded.size() > kDiscardedSampleSize)
            f << "  ... and " << (discarded.size() - kDiscardedSampleSize) << " more.\n";
    }

    f << std::string(50, '-') << "\n\n";
    if (!f.good())
    {
        Logger::error("Could not write to performance log: " + log_path_);
        return false;
    }
    return true;
}
