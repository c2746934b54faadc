#include "core/file_action_executor.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

std::string FileActionExecutor::uniqueDestination(const std::string &destination_folder, const std::string &file_name)
{
    fs::path destination = fs::path(destination_folder) / file_name;
    if (!fs::exists(destination))
        return destination.string();

    fs::path name(file_name);
    std::string stem = name.stem().string();
    std::string ext = name.extension().string();
    for (size_t i = 1;; ++i)
    {
        destination = fs::path(destination_folder) / (stem + "_" + std::to_string(i) + ext);
        if (!fs::exists(destination))
            return destination.string();
    }
}

void FileActionExecutor::emit(const std::string &message, ActionReport &report) const
{
    Logger::info(message);
    report.log.push_back(message);
    if (log_callback_)
        log_callback_(message);
}

FileActionExecutor::MoveOutcome FileActionExecutor::moveFile(const std::string &file_path, const std::string &destination_folder,
                                                             const std::string &action_verb, ActionReport &report) const
{
    std::string file_name = fs::path(file_path).filename().string();
    try
    {
        if (!fs::exists(file_path))
        {
            emit("SKIP: File no longer exists at " + file_path, report);
            report.skipped++;
            return MoveOutcome::SKIPPED;
        }

        fs::create_directories(destination_folder);
        std::string destination = uniqueDestination(destination_folder, file_name);

        std::error_code ec;
        fs::rename(file_path, destination, ec);
        if (ec)
        {
            // Different device: copy, then remove the source
            fs::copy_file(file_path, destination);
            fs::remove(file_path);
        }

        emit(action_verb + ": " + file_name + " to " + fs::path(destination_folder).filename().string(), report);
        return MoveOutcome::MOVED;
    }
    catch (const std::exception &e)
    {
        Logger::error("Failed to move " + file_path + ": " + e.what());
        emit("ERROR moving " + file_name + ": " + e.what(), report);
        report.failed++;
        return MoveOutcome::FAILED;
    }
}

ActionReport FileActionExecutor::execute(const ActionPlan &plan) const
{
    ActionReport report;

    // 1. Sorting
    if (!plan.files_to_sort.empty())
    {
        fs::path originals = fs::path(plan.base_sort_folder) / kOriginalsFolder;
        fs::path edits = fs::path(plan.base_sort_folder) / kLastEditedFolder;
        for (const auto &record : plan.files_to_sort)
        {
            if (!record.original.empty() &&
                moveFile(record.original, originals.string(), "SORTED", report) == MoveOutcome::MOVED)
                report.sorted++;
            if (!record.edited.empty() && record.edited != record.original &&
                moveFile(record.edited, edits.string(), "SORTED", report) == MoveOutcome::MOVED)
                report.sorted++;
        }
    }

    // 2. Remaining files
    if (plan.remains_action == RemainsAction::MOVE)
    {
        if (plan.remains_dest_folder.empty())
        {
            emit("ERROR: No destination folder for the remaining files", report);
            report.failed += plan.remains_to_process.size();
        }
        else
        {
            for (const auto &path : plan.remains_to_process)
            {
                if (moveFile(path, plan.remains_dest_folder, "MOVED", report) == MoveOutcome::MOVED)
                    report.moved++;
            }
        }
    }

    Logger::info("All file actions completed. Sorted: " + std::to_string(report.sorted) +
                 ", Moved: " + std::to_string(report.moved) +
                 ", Skipped: " + std::to_string(report.skipped) +
                 ", Failed: " + std::to_string(report.failed));
    return report;
}
