#pragma once

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <memory>
#include <utility>
#include <vector>

#include "core/types.hpp"

namespace geoatlas {

using core::Bounds;

// Bounding-box R-tree, built in one pass by sort-tile bulk loading.
template <typename T>
class RTree {
public:
    RTree();

    void bulk_load(std::vector<std::pair<T, Bounds>> entries);
    [[nodiscard]] std::vector<T> query(const Bounds& bounds) const;
    [[nodiscard]] std::vector<T> query_point(double lon, double lat) const;
    void clear();
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t depth() const;

    bool validate_structure() const;

private:
    struct Item {
        T data;
        Bounds bounds;

        Item(const T& value, const Bounds& box)
            : data(value)
            , bounds(box) {}
    };

    struct Node;
    using NodePtr = std::unique_ptr<Node>;

    struct Node {
        Bounds bounds = Bounds::empty();
        std::vector<Item> items;
        std::vector<NodePtr> children;
        bool is_leaf;

        explicit Node(bool leaf = true)
            : is_leaf(leaf) {}

        void update_bounds() {
            bounds = Bounds::empty();
            if (is_leaf) {
                for (const auto& item : items) {
                    bounds.expand(item.bounds);
                }
            } else {
                for (const auto& child : children) {
                    bounds.expand(child->bounds);
                }
            }
        }
    };

    static constexpr std::size_t kMaxItems = 32;
    static constexpr std::size_t kMaxDepth = 64;

    template <typename Container, typename Projection>
    static void sort_by_best_axis(Container& container, Projection projection);

    [[nodiscard]] static std::vector<std::size_t> calculate_group_sizes(std::size_t total);
    [[nodiscard]] static std::vector<NodePtr> build_leaf_level(std::vector<Item>&& items);
    [[nodiscard]] static std::vector<NodePtr> build_parent_level(std::vector<NodePtr>&& children);
    void query_recursive(const Node* node, const Bounds& bounds, std::vector<T>& results, std::size_t depth) const;

    NodePtr root_;
};

template <typename T>
RTree<T>::RTree()
    : root_(std::make_unique<Node>(true)) {}

template <typename T>
void RTree<T>::bulk_load(std::vector<std::pair<T, Bounds>> entries) {
    root_ = std::make_unique<Node>(true);
    if (entries.empty()) {
        return;
    }

    std::vector<Item> items;
    items.reserve(entries.size());
    for (auto& entry : entries) {
        items.emplace_back(entry.first, entry.second);
    }

    auto level = build_leaf_level(std::move(items));
    // Keep grouping until a single root remains.
    while (level.size() > 1) {
        level = build_parent_level(std::move(level));
    }
    root_ = std::move(level.front());
}

template <typename T>
std::vector<T> RTree<T>::query(const Bounds& bounds) const {
    std::vector<T> results;
    if (!bounds.is_valid()) {
        return results;
    }
    query_recursive(root_.get(), bounds, results, 0);
    return results;
}

template <typename T>
std::vector<T> RTree<T>::query_point(double lon, double lat) const {
    return query(Bounds{lon, lon, lat, lat});
}

template <typename T>
void RTree<T>::clear() {
    root_ = std::make_unique<Node>(true);
}

template <typename T>
std::size_t RTree<T>::size() const {
    std::size_t count = 0;
    std::vector<const Node*> stack{root_.get()};

    while (!stack.empty()) {
        const Node* node = stack.back();
        stack.pop_back();
        if (node->is_leaf) {
            count += node->items.size();
        } else {
            for (const auto& child : node->children) {
                stack.push_back(child.get());
            }
        }
    }
    return count;
}

template <typename T>
std::size_t RTree<T>::depth() const {
    std::size_t max_depth = 0;
    std::vector<std::pair<const Node*, std::size_t>> stack;
    stack.emplace_back(root_.get(), 1);

    while (!stack.empty()) {
        auto [node, current_depth] = stack.back();
        stack.pop_back();
        max_depth = std::max(max_depth, current_depth);
        if (!node->is_leaf) {
            for (const auto& child : node->children) {
                stack.emplace_back(child.get(), current_depth + 1);
            }
        }
    }
    return max_depth;
}

template <typename T>
bool RTree<T>::validate_structure() const {
    bool valid = true;
    std::vector<std::pair<const Node*, std::size_t>> stack;
    stack.emplace_back(root_.get(), 0);

    while (!stack.empty()) {
        auto [node, depth] = stack.back();
        stack.pop_back();

        const std::size_t fanout = node->is_leaf ? node->items.size() : node->children.size();
        if (fanout > kMaxItems) {
            std::cerr << "ERROR: R-tree node at depth " << depth << " has " << fanout
                      << " entries (max: " << kMaxItems << ")" << std::endl;
            valid = false;
        }

        if (node->is_leaf) {
            for (const auto& item : node->items) {
                if (!node->bounds.contains(item.bounds)) {
                    std::cerr << "ERROR: R-tree leaf at depth " << depth << " does not cover its items" << std::endl;
                    valid = false;
                    break;
                }
            }
        } else {
            for (const auto& child : node->children) {
                if (!node->bounds.contains(child->bounds)) {
                    std::cerr << "ERROR: R-tree node at depth " << depth << " does not cover its children" << std::endl;
                    valid = false;
                }
                stack.emplace_back(child.get(), depth + 1);
            }
        }
    }
    return valid;
}

template <typename T>
template <typename Container, typename Projection>
void RTree<T>::sort_by_best_axis(Container& container, Projection projection) {
    if (container.size() < 2) {
        return;
    }

    Bounds centers = Bounds::empty();
    for (const auto& element : container) {
        centers.expand(projection(element).center());
    }

    // Stable so equal keys keep insertion order
    if (centers.width() >= centers.height()) {
        std::stable_sort(container.begin(), container.end(), [&projection](const auto& lhs, const auto& rhs) {
            return projection(lhs).center().lon < projection(rhs).center().lon;
        });
    } else {
        std::stable_sort(container.begin(), container.end(), [&projection](const auto& lhs, const auto& rhs) {
            return projection(lhs).center().lat < projection(rhs).center().lat;
        });
    }
}

template <typename T>
std::vector<std::size_t> RTree<T>::calculate_group_sizes(std::size_t total) {
    if (total == 0) {
        return {};
    }
    if (total <= kMaxItems) {
        return {total};
    }

    const std::size_t group_count = (total + kMaxItems - 1) / kMaxItems;
    std::vector<std::size_t> sizes(group_count, total / group_count);
    for (std::size_t i = 0; i < total % group_count; ++i) {
        ++sizes[i];
    }
    return sizes;
}

template <typename T>
std::vector<typename RTree<T>::NodePtr> RTree<T>::build_leaf_level(std::vector<Item>&& items) {
    sort_by_best_axis(items, [](const Item& item) -> const Bounds& { return item.bounds; });

    std::vector<NodePtr> leaves;
    std::size_t offset = 0;
    for (const std::size_t group_size : calculate_group_sizes(items.size())) {
        NodePtr node = std::make_unique<Node>(true);
        node->items.reserve(group_size);
        for (std::size_t i = 0; i < group_size; ++i) {
            node->items.push_back(std::move(items[offset++]));
        }
        node->update_bounds();
        leaves.push_back(std::move(node));
    }
    return leaves;
}

template <typename T>
std::vector<typename RTree<T>::NodePtr> RTree<T>::build_parent_level(std::vector<NodePtr>&& children) {
    sort_by_best_axis(children, [](const NodePtr& node) -> const Bounds& { return node->bounds; });

    std::vector<NodePtr> parents;
    std::size_t offset = 0;
    for (const std::size_t group_size : calculate_group_sizes(children.size())) {
        NodePtr parent = std::make_unique<Node>(false);
        parent->children.reserve(group_size);
        for (std::size_t i = 0; i < group_size; ++i) {
            parent->children.push_back(std::move(children[offset++]));
        }
        parent->update_bounds();
        parents.push_back(std::move(parent));
    }
    return parents;
}

template <typename T>
void RTree<T>::query_recursive(const Node* node, const Bounds& bounds, std::vector<T>& results, std::size_t depth) const {
    if (depth > kMaxDepth) {
        std::cerr << "Warning: R-tree query exceeded maximum depth (" << kMaxDepth << ")" << std::endl;
        return;
    }
    if (!node || !node->bounds.intersects(bounds)) {
        return;
    }

    if (node->is_leaf) {
        for (const auto& item : node->items) {
            if (item.bounds.intersects(bounds)) {
                results.push_back(item.data);
            }
        }
    } else {
        for (const auto& child : node->children) {
            query_recursive(child.get(), bounds, results, depth + 1);
        }
    }
}

} // namespace geoatlas
