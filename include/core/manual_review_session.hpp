#pragma once

#include "core/file_metadata.hpp"
#include <cstddef>
#include <set>
#include <string>
#include <variant>
#include <vector>

/**
 * @brief Group-by-group review of duplicate groups driven by explicit events
 *
 * States: AwaitingDecision(i) -> Approved(i, kept) | Skipped(i) -> next()
 * -> AwaitingDecision(i + 1) or Done. Invalid events return false and leave
 * the state unchanged.
 */
class ManualReviewSession
{
public:
    struct AwaitingDecision
    {
        size_t group_index;
    };
    struct Approved
    {
        size_t group_index;
        std::string kept_path;
    };
    struct Skipped
    {
        size_t group_index;
    };
    struct Done
    {
    };

    using State = std::variant<AwaitingDecision, Approved, Skipped, Done>;

    ManualReviewSession(const DuplicateGroups &groups, const FileMetadataMap &all_file_data);

    /**
     * @brief Keep one file of the current group and remove the others
     * @param kept_path Member of the current group
     * @return false if not awaiting a decision or the path is not in the group
     */
    bool approve(const std::string &kept_path);

    /**
     * @brief Leave the current group untouched
     */
    bool skip();

    /**
     * @brief Advance after a decision
     */
    bool next();

    const State &getState() const { return state_; }
    bool isDone() const { return std::holds_alternative<Done>(state_); }

    /**
     * @brief Index of the group being reviewed, groupCount() when done
     */
    size_t currentGroupIndex() const;
    const DuplicateGroup &currentGroup() const;

    /**
     * @brief Metadata of the current group members that have any
     */
    std::vector<FileMetadata> currentGroupMetadata() const;

    size_t groupCount() const { return groups_.size(); }
    size_t approvedCount() const { return approved_count_; }
    size_t skippedCount() const { return skipped_count_; }

    /**
     * @brief Every file marked for removal so far, sorted
     */
    std::vector<std::string> getFilesForRemoval() const;

private:
    DuplicateGroups groups_;
    FileMetadataMap all_file_data_;
    State state_;
    std::set<std::string> removal_;
    size_t approved_count_ = 0;
    size_t skipped_count_ = 0;
};
