#include "core/automatic_selector.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <regex>
#include <set>
#include <stdexcept>

AutomaticSelector::AutomaticSelector(const DedupConfig &config)
    : config_(config)
{
}

int AutomaticSelector::getFormatPriority(const std::string &path) const
{
    auto it = config_.format_priority.find(FileUtils::getFileExtension(path));
    if (it == config_.format_priority.end())
        return DedupConfig::kUnknownFormatPriority;
    return it->second;
}

bool AutomaticSelector::isLikelyOriginalByName(const std::string &path)
{
    static const std::regex edit_suffix(R"([-_]\d+$|[-_]edit(ed)?$|[-_]copy$|\(\d+\)$)",
                                        std::regex::ECMAScript | std::regex::icase);
    return !std::regex_search(FileUtils::getFileStem(path), edit_suffix);
}

int AutomaticSelector::compareFiles(const FileMetadata &a, const FileMetadata &b) const
{
    // 1. Highest resolution
    if (a.resolution != b.resolution)
        return a.resolution > b.resolution ? -1 : 1;

    // 2. Largest file
    if (a.size != b.size)
        return a.size > b.size ? -1 : 1;

    // 3. Preferred format
    int priority_a = getFormatPriority(a.path);
    int priority_b = getFormatPriority(b.path);
    if (priority_a != priority_b)
        return priority_a < priority_b ? -1 : 1;

    // 4. Original-looking name
    bool original_a = isLikelyOriginalByName(a.path);
    bool original_b = isLikelyOriginalByName(b.path);
    if (original_a != original_b)
        return original_a ? -1 : 1;

    // 5. Oldest modification time
    if (a.mod_time != b.mod_time)
        return a.mod_time < b.mod_time ? -1 : 1;

    if (a.path != b.path)
        return a.path < b.path ? -1 : 1;
    return 0;
}

const FileMetadata &AutomaticSelector::getBestInGroup(const std::vector<FileMetadata> &group) const
{
    if (group.empty())
        throw std::invalid_argument("Cannot pick the best file of an empty group");
    return *std::min_element(group.begin(), group.end(),
                             [this](const FileMetadata &a, const FileMetadata &b)
                             { return isBetter(a, b); });
}

const FileMetadata &AutomaticSelector::getLastEdited(const std::vector<FileMetadata> &group)
{
    if (group.empty())
        throw std::invalid_argument("Cannot pick the last edited file of an empty group");
    // Latest time wins; equal times go to the smallest path
    return *std::min_element(group.begin(), group.end(),
                             [](const FileMetadata &a, const FileMetadata &b)
                             {
                                 if (a.mod_time != b.mod_time)
                                     return a.mod_time > b.mod_time;
                                 return a.path < b.path;
                             });
}

GroupSelection AutomaticSelector::select(SelectionStrategy strategy, const std::vector<FileMetadata> &group) const
{
    GroupSelection selection;
    if (group.empty())
        return selection;

    switch (strategy)
    {
    case SelectionStrategy::KEEP_BEST_QUALITY:
        selection.keep.push_back(getBestInGroup(group).path);
        break;
    case SelectionStrategy::KEEP_LAST_EDITED:
        selection.keep.push_back(getLastEdited(group).path);
        break;
    case SelectionStrategy::KEEP_ALL_UNIQUE_VERSIONS:
    {
        const FileMetadata &best = getBestInGroup(group);
        const FileMetadata &last = getLastEdited(group);
        selection.keep.push_back(best.path);
        if (last.path != best.path)
            selection.keep.push_back(last.path);
        selection.roles = SortRecord{best.path, last.path};
        break;
    }
    }

    for (const auto &metadata : group)
    {
        if (std::find(selection.keep.begin(), selection.keep.end(), metadata.path) == selection.keep.end())
            selection.remove.push_back(metadata.path);
    }
    return selection;
}

SelectionResult AutomaticSelector::runAutomaticSelection(const DuplicateGroups &groups, const std::string &strategy_name,
                                                         const FileMetadataMap &all_file_data) const
{
    auto strategy = SelectionStrategies::fromString(strategy_name);
    if (!strategy)
    {
        Logger::error("Unknown strategy: " + strategy_name + ". Cannot perform automatic selection.");
        return SelectionResult();
    }
    return runAutomaticSelection(groups, *strategy, all_file_data);
}

SelectionResult AutomaticSelector::runAutomaticSelection(const DuplicateGroups &groups, SelectionStrategy strategy,
                                                         const FileMetadataMap &all_file_data) const
{
    Logger::info("Automatic selection with strategy: " + SelectionStrategies::getDisplayName(strategy));

    std::set<std::string> removal;
    SelectionResult result;

    for (const auto &group : groups)
    {
        if (group.size() < 2)
            continue;

        std::vector<FileMetadata> metadata_list;
        for (const auto &path : group)
        {
            auto it = all_file_data.find(path);
            if (it != all_file_data.end())
                metadata_list.push_back(it->second);
        }

        if (metadata_list.size() < 2)
        {
            Logger::warn("Did not find enough valid metadata for group of " + std::to_string(group.size()) +
                         " files starting with " + group.front() + ", skipping");
            continue;
        }

        GroupSelection selection = select(strategy, metadata_list);
        if (selection.roles)
            result.files_to_sort.push_back(*selection.roles);
        removal.insert(selection.remove.begin(), selection.remove.end());
    }

    result.files_for_removal.assign(removal.begin(), removal.end());
    Logger::info("Automatic selection marked " + std::to_string(result.files_for_removal.size()) + " files for removal");
    return result;
}
