#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

/**
 * @brief Automatic selection strategies for duplicate groups
 */
enum class SelectionStrategy
{
    KEEP_BEST_QUALITY,       // Keep the single best file by the quality cascade
    KEEP_LAST_EDITED,        // Keep the most recently modified file
    KEEP_ALL_UNIQUE_VERSIONS // Keep the best original plus the last edited file
};

class SelectionStrategies
{
public:
    /**
     * @brief Get the identifier of a strategy, as used in configuration files
     * @param strategy The selection strategy
     * @return Upper-case identifier
     */
    static std::string getStrategyName(SelectionStrategy strategy)
    {
        switch (strategy)
        {
        case SelectionStrategy::KEEP_BEST_QUALITY:
            return "KEEP_BEST_QUALITY";
        case SelectionStrategy::KEEP_LAST_EDITED:
            return "KEEP_LAST_EDITED";
        case SelectionStrategy::KEEP_ALL_UNIQUE_VERSIONS:
            return "KEEP_ALL_UNIQUE_VERSIONS";
        default:
            return "UNKNOWN";
        }
    }

    /**
     * @brief Get the human readable name shown in run summaries
     * @param strategy The selection strategy
     * @return Display name
     */
    static std::string getDisplayName(SelectionStrategy strategy)
    {
        switch (strategy)
        {
        case SelectionStrategy::KEEP_BEST_QUALITY:
            return "Keep best quality";
        case SelectionStrategy::KEEP_LAST_EDITED:
            return "Keep last edited";
        case SelectionStrategy::KEEP_ALL_UNIQUE_VERSIONS:
            return "Keep unique versions (original + edited)";
        default:
            return "Unknown strategy";
        }
    }

    /**
     * @brief Parse a strategy identifier or display name
     * @param name Identifier (any case) or display name
     * @return The strategy, or std::nullopt if the name is not recognised
     */
    static std::optional<SelectionStrategy> fromString(const std::string &name)
    {
        std::string upper = name;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });

        for (SelectionStrategy strategy : {SelectionStrategy::KEEP_BEST_QUALITY,
                                           SelectionStrategy::KEEP_LAST_EDITED,
                                           SelectionStrategy::KEEP_ALL_UNIQUE_VERSIONS})
        {
            if (upper == getStrategyName(strategy) || name == getDisplayName(strategy))
                return strategy;
        }
        return std::nullopt;
    }
};
