#pragma once

#include "core/file_metadata.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Incremental clustering of pairwise matches into disjoint groups
 *
 * Groups are kept in an arena indexed by id. Merging two groups relabels
 * every member of the smaller one to the id of the larger one, so each path
 * always maps to exactly one live group. Not thread-safe.
 */
class GroupMatchEngine
{
public:
    GroupMatchEngine() = default;

    /**
     * @brief Record that two paths match
     * @param path1 First path
     * @param path2 Second path
     * @param distance Hamming distance of the match, kept for statistics
     */
    void addMatch(const std::string &path1, const std::string &path2, int distance = 0);

    /**
     * @brief Current groups, each sorted, ordered by first member
     */
    const DuplicateGroups &getGroups() const;

    /**
     * @brief Group id of a path, if it has one
     */
    std::optional<size_t> groupOf(const std::string &path) const;

    size_t groupCount() const { return live_groups_; }
    size_t matchCount() const { return match_count_; }

    void clear();

private:
    struct Group
    {
        std::vector<std::string> members;
        bool alive = true;
    };

    std::vector<Group> groups_;
    std::unordered_map<std::string, size_t> path_to_group_;
    size_t live_groups_ = 0;
    size_t match_count_ = 0;

    mutable DuplicateGroups cached_groups_;
    mutable bool cache_valid_ = true;

    size_t createGroup(const std::string &path1, const std::string &path2);
    void mergeGroups(size_t a, size_t b);
};
