#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <map>
#include <utility>
#include <vector>

/**
 * @brief Burkhard-Keller tree for radius queries under an integer metric
 *
 * The metric must satisfy the triangle inequality. Nodes are stored in a
 * flat arena; each node maps an edge distance to the index of its child.
 *
 * @tparam T Key type
 */
template <typename T>
class BKTree
{
public:
    using Metric = std::function<int(const T &, const T &)>;
    using Match = std::pair<int, T>; // (distance, item)

    explicit BKTree(Metric metric)
        : metric_(std::move(metric)) {}

    /**
     * @brief Insert an item
     * @return false if an item at distance 0 is already present
     */
    bool add(const T &item)
    {
        if (nodes_.empty())
        {
            nodes_.push_back(Node{item, {}});
            return true;
        }

        size_t current = 0;
        while (true)
        {
            int distance = metric_(item, nodes_[current].item);
            if (distance == 0)
                return false;

            auto child = nodes_[current].children.find(distance);
            if (child == nodes_[current].children.end())
            {
                nodes_.push_back(Node{item, {}});
                nodes_[current].children.emplace(distance, nodes_.size() - 1);
                return true;
            }
            current = child->second;
        }
    }

    /**
     * @brief Find every item within a radius (inclusive)
     * @param item Query key
     * @param radius Maximum distance
     * @return Matches sorted by distance, then by item
     */
    std::vector<Match> find(const T &item, int radius) const
    {
        std::vector<Match> matches;
        if (nodes_.empty() || radius < 0)
            return matches;

        std::vector<size_t> pending{0};
        while (!pending.empty())
        {
            size_t index = pending.back();
            pending.pop_back();
            const Node &node = nodes_[index];

            int distance = metric_(item, node.item);
            if (distance <= radius)
                matches.emplace_back(distance, node.item);

            // Only subtrees with edge in [d - r, d + r] can hold matches
            auto first = node.children.lower_bound(distance - radius);
            auto last = node.children.upper_bound(distance + radius);
            for (auto it = first; it != last; ++it)
                pending.push_back(it->second);
        }

        std::sort(matches.begin(), matches.end());
        return matches;
    }

    size_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }

private:
    struct Node
    {
        T item;
        std::map<int, size_t> children;
    };

    Metric metric_;
    std::vector<Node> nodes_;
};
