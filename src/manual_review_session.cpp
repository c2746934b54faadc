#include "core/manual_review_session.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <stdexcept>
#include <type_traits>

ManualReviewSession::ManualReviewSession(const DuplicateGroups &groups, const FileMetadataMap &all_file_data)
    : all_file_data_(all_file_data), state_(Done{})
{
    // Groups that cannot be decided are never shown
    for (const auto &group : groups)
    {
        if (group.size() >= 2)
            groups_.push_back(group);
    }
    if (!groups_.empty())
        state_ = AwaitingDecision{0};
}

bool ManualReviewSession::approve(const std::string &kept_path)
{
    const auto *awaiting = std::get_if<AwaitingDecision>(&state_);
    if (!awaiting)
    {
        Logger::warn("Cannot approve: no group is awaiting a decision");
        return false;
    }

    const DuplicateGroup &group = groups_[awaiting->group_index];
    if (std::find(group.begin(), group.end(), kept_path) == group.end())
    {
        Logger::warn("Cannot approve " + kept_path + ": not a member of group " + std::to_string(awaiting->group_index + 1));
        return false;
    }

    for (const auto &path : group)
    {
        if (path != kept_path)
            removal_.insert(path);
    }
    approved_count_++;
    state_ = Approved{awaiting->group_index, kept_path};
    return true;
}

bool ManualReviewSession::skip()
{
    const auto *awaiting = std::get_if<AwaitingDecision>(&state_);
    if (!awaiting)
    {
        Logger::warn("Cannot skip: no group is awaiting a decision");
        return false;
    }
    skipped_count_++;
    state_ = Skipped{awaiting->group_index};
    return true;
}

bool ManualReviewSession::next()
{
    size_t index;
    if (const auto *approved = std::get_if<Approved>(&state_))
        index = approved->group_index;
    else if (const auto *skipped = std::get_if<Skipped>(&state_))
        index = skipped->group_index;
    else
    {
        Logger::warn("Cannot advance: the current group has no decision yet");
        return false;
    }

    if (index + 1 < groups_.size())
        state_ = AwaitingDecision{index + 1};
    else
        state_ = Done{};
    return true;
}

size_t ManualReviewSession::currentGroupIndex() const
{
    return std::visit([this](const auto &state) -> size_t
                      {
                          using S = std::decay_t<decltype(state)>;
                          if constexpr (std::is_same_v<S, Done>)
                              return groups_.size();
                          else
                              return state.group_index; },
                      state_);
}

const DuplicateGroup &ManualReviewSession::currentGroup() const
{
    size_t index = currentGroupIndex();
    if (index >= groups_.size())
        throw std::out_of_range("Review session is done");
    return groups_[index];
}

std::vector<FileMetadata> ManualReviewSession::currentGroupMetadata() const
{
    std::vector<FileMetadata> metadata;
    if (isDone())
        return metadata;
    for (const auto &path : currentGroup())
    {
        auto it = all_file_data_.find(path);
        if (it != all_file_data_.end())
            metadata.push_back(it->second);
    }
    return metadata;
}

std::vector<std::string> ManualReviewSession::getFilesForRemoval() const
{
    return std::vector<std::string>(removal_.begin(), removal_.end());
}
