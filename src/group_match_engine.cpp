#include "core/group_match_engine.hpp"
#include "logging/logger.hpp"
#include <algorithm>

void GroupMatchEngine::addMatch(const std::string &path1, const std::string &path2, int distance)
{
    if (path1 == path2)
        return;

    match_count_++;
    if (Logger::isEnabled(Logger::Level::TRACE))
        Logger::trace("Match (" + std::to_string(distance) + "): " + path1 + " <-> " + path2);

    auto it1 = path_to_group_.find(path1);
    auto it2 = path_to_group_.find(path2);
    bool has1 = it1 != path_to_group_.end();
    bool has2 = it2 != path_to_group_.end();

    if (has1 && has2)
    {
        if (it1->second == it2->second)
            return;
        mergeGroups(it1->second, it2->second);
    }
    else if (has1)
    {
        groups_[it1->second].members.push_back(path2);
        path_to_group_[path2] = it1->second;
    }
    else if (has2)
    {
        groups_[it2->second].members.push_back(path1);
        path_to_group_[path1] = it2->second;
    }
    else
    {
        createGroup(path1, path2);
    }
    cache_valid_ = false;
}

size_t GroupMatchEngine::createGroup(const std::string &path1, const std::string &path2)
{
    size_t id = groups_.size();
    groups_.push_back(Group{{path1, path2}, true});
    path_to_group_[path1] = id;
    path_to_group_[path2] = id;
    live_groups_++;
    return id;
}

void GroupMatchEngine::mergeGroups(size_t a, size_t b)
{
    // Absorb the smaller group into the larger
    size_t keep = a;
    size_t absorb = b;
    if (groups_[a].members.size() < groups_[b].members.size())
        std::swap(keep, absorb);

    Group &target = groups_[keep];
    Group &source = groups_[absorb];
    for (const auto &member : source.members)
    {
        path_to_group_[member] = keep;
        target.members.push_back(member);
    }
    source.members.clear();
    source.members.shrink_to_fit();
    source.alive = false;
    live_groups_--;
}

const DuplicateGroups &GroupMatchEngine::getGroups() const
{
    if (cache_valid_)
        return cached_groups_;

    cached_groups_.clear();
    cached_groups_.reserve(live_groups_);
    for (const auto &group : groups_)
    {
        if (!group.alive)
            continue;
        DuplicateGroup members = group.members;
        std::sort(members.begin(), members.end());
        cached_groups_.push_back(std::move(members));
    }
    std::sort(cached_groups_.begin(), cached_groups_.end());
    cache_valid_ = true;
    return cached_groups_;
}

std::optional<size_t> GroupMatchEngine::groupOf(const std::string &path) const
{
    auto it = path_to_group_.find(path);
    if (it == path_to_group_.end())
        return std::nullopt;
    return it->second;
}

void GroupMatchEngine::clear()
{
    groups_.clear();
    path_to_group_.clear();
    live_groups_ = 0;
    match_count_ = 0;
    cached_groups_.clear();
    cache_valid_ = true;
}
