#pragma once

#include "core/dedup_config.hpp"
#include "core/file_metadata.hpp"
#include "core/selection_strategy.hpp"
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Role-tagged pair routed into the Originals / Last Edited folders
 */
struct SortRecord
{
    std::string original;
    std::string edited;

    bool operator==(const SortRecord &other) const
    {
        return original == other.original && edited == other.edited;
    }
};

/**
 * @brief Decision of one strategy for one group
 */
struct GroupSelection
{
    std::vector<std::string> keep;
    std::vector<std::string> remove;
    std::optional<SortRecord> roles; // only set by KEEP_ALL_UNIQUE_VERSIONS
};

/**
 * @brief Aggregated decision over all groups
 */
struct SelectionResult
{
    std::vector<std::string> files_for_removal; // sorted, no duplicates
    std::vector<SortRecord> files_to_sort;      // one record per group, in group order
};

/**
 * @brief Picks the files to keep in each duplicate group
 *
 * Quality is ranked by a fixed cascade: resolution, file size, format
 * priority, original-looking file name, older modification time and
 * finally the path itself, so the order is total.
 */
class AutomaticSelector
{
public:
    explicit AutomaticSelector(const DedupConfig &config = DedupConfig());

    /**
     * @brief Apply a strategy to every group
     * @param groups Duplicate groups
     * @param strategy Strategy to apply
     * @param all_file_data Metadata keyed by path
     * @return Union of the removal sets and the role records
     */
    SelectionResult runAutomaticSelection(const DuplicateGroups &groups, SelectionStrategy strategy,
                                          const FileMetadataMap &all_file_data) const;

    /**
     * @brief Apply a strategy given by identifier or display name
     * An unknown name is logged and yields an empty result.
     */
    SelectionResult runAutomaticSelection(const DuplicateGroups &groups, const std::string &strategy_name,
                                          const FileMetadataMap &all_file_data) const;

    /**
     * @brief Decide a single group
     * @param strategy Strategy to apply
     * @param group Metadata of the group members, at least one entry
     */
    GroupSelection select(SelectionStrategy strategy, const std::vector<FileMetadata> &group) const;

    /**
     * @brief Hierarchical quality comparison
     * @return -1 if a is better, 1 if b is better, 0 only for the same path
     */
    int compareFiles(const FileMetadata &a, const FileMetadata &b) const;

    // Sort predicate, best file first
    bool isBetter(const FileMetadata &a, const FileMetadata &b) const { return compareFiles(a, b) < 0; }

    /**
     * @brief Format rank of a path, lower is better; unknown extensions get 99
     */
    int getFormatPriority(const std::string &path) const;

    /**
     * @brief False if the file name stem ends in a copy or edit suffix
     * such as "-2", "_edited", "-copy" or "(1)"
     */
    static bool isLikelyOriginalByName(const std::string &path);

    const FileMetadata &getBestInGroup(const std::vector<FileMetadata> &group) const;
    static const FileMetadata &getLastEdited(const std::vector<FileMetadata> &group);

private:
    DedupConfig config_;
};
