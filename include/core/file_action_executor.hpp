#pragma once

#include "core/automatic_selector.hpp"
#include <functional>
#include <string>
#include <vector>

enum class RemainsAction
{
    NONE, // leave the remaining files where they are
    MOVE  // move them into remains_dest_folder
};

/**
 * @brief File operations to perform after a selection
 */
struct ActionPlan
{
    std::vector<SortRecord> files_to_sort;
    std::vector<std::string> remains_to_process;
    RemainsAction remains_action = RemainsAction::NONE;
    std::string remains_dest_folder;
    std::string base_sort_folder;
};

struct ActionReport
{
    size_t sorted = 0;
    size_t moved = 0;
    size_t skipped = 0;
    size_t failed = 0;
    std::vector<std::string> log; // one line per action
};

/**
 * @brief Moves sorted and remaining files; a failure on one file never stops the run
 */
class FileActionExecutor
{
public:
    using LogCallback = std::function<void(const std::string &)>;

    FileActionExecutor() = default;

    void setLogCallback(LogCallback callback) { log_callback_ = std::move(callback); }

    /**
     * @brief Sort role records into Originals / Last Edited, then handle the remains
     * @param plan What to move where
     * @return Counts and log lines of every action
     */
    ActionReport execute(const ActionPlan &plan) const;

    /**
     * @brief First free path for a file name in a folder: name, then stem_1.ext, stem_2.ext, ...
     */
    static std::string uniqueDestination(const std::string &destination_folder, const std::string &file_name);

    static constexpr const char *kOriginalsFolder = "Originals";
    static constexpr const char *kLastEditedFolder = "Last Edited";

private:
    LogCallback log_callback_;

    enum class MoveOutcome
    {
        MOVED,
        SKIPPED,
        FAILED
    };

    MoveOutcome moveFile(const std::string &file_path, const std::string &destination_folder,
                         const std::string &action_verb, ActionReport &report) const;
    void emit(const std::string &message, ActionReport &report) const;
};
