#include "rtree.hpp"
#include "simple_spatial_index.hpp"

#include <algorithm>
#include <iostream>
#include <random>
#include <unordered_set>
#include <utility>
#include <vector>

namespace geoatlas {

namespace rtree_tests {

using Tree = RTree<int>;

// Corner order (x0, y0, x1, y1) to keep the fixtures readable.
Bounds box(double min_x, double min_y, double max_x, double max_y) {
    return Bounds{min_x, max_x, min_y, max_y};
}

bool test_empty_tree() {
    Tree tree;
    auto results = tree.query(box(-10, -10, 10, 10));
    return results.empty() && tree.size() == 0 && tree.query_point(0, 0).empty();
}

bool test_single_entry() {
    Tree tree;
    tree.bulk_load({{42, box(0, 0, 1, 1)}});

    auto results = tree.query(box(-1, -1, 2, 2));
    return results.size() == 1 && results.front() == 42 && tree.size() == 1;
}

bool test_clear() {
    Tree tree;
    tree.bulk_load({{1, box(-1, -1, 1, 1)}});
    tree.clear();

    return tree.size() == 0 && tree.query(box(-2, -2, 2, 2)).empty();
}

bool test_invalid_query_box() {
    Tree tree;
    tree.bulk_load({{1, box(0, 0, 1, 1)}});
    return tree.query(box(2, 2, -2, -2)).empty() && tree.query(Bounds::empty()).empty();
}

bool test_full_query() {
    constexpr int count = 1000;

    std::vector<std::pair<int, Bounds>> entries;
    for (int i = 0; i < count; ++i) {
        double x = static_cast<double>(i);
        double y = static_cast<double>(count - i);
        entries.emplace_back(i, box(x, y, x + 0.5, y + 0.5));
    }
    Tree tree;
    tree.bulk_load(std::move(entries));

    if (tree.size() != static_cast<std::size_t>(count)) {
        return false;
    }
    if (!tree.validate_structure()) {
        std::cerr << "Diagonal tree failed structure validation" << std::endl;
        return false;
    }

    auto results = tree.query(box(-1, -1, count + 2, count + 2));
    if (results.size() != static_cast<std::size_t>(count)) {
        return false;
    }

    std::sort(results.begin(), results.end());
    for (int i = 0; i < count; ++i) {
        if (results[i] != i) {
            return false;
        }
    }
    return true;
}

bool test_spatial_filtering() {
    constexpr int grid = 20;
    int id = 0;

    std::vector<std::pair<int, Bounds>> entries;
    for (int x = 0; x < grid; ++x) {
        for (int y = 0; y < grid; ++y) {
            entries.emplace_back(id++, box(x, y, x + 0.9, y + 0.9));
        }
    }
    Tree tree;
    tree.bulk_load(std::move(entries));

    auto subset = tree.query(box(5.0, 5.0, 10.0, 10.0));

    std::unordered_set<int> expected;
    for (int x = 5; x <= 10; ++x) {
        for (int y = 5; y <= 10; ++y) {
            expected.insert(x * grid + y);
        }
    }
    // Cells at 4 reach 4.9 and stay outside
    for (int v : subset) {
        if (!expected.erase(v)) {
            std::cerr << "Unexpected item " << v << " in spatial query" << std::endl;
            return false;
        }
    }

    if (!expected.empty()) {
        std::cerr << "Missing " << expected.size() << " expected items in spatial query" << std::endl;
        return false;
    }

    auto outside = tree.query(box(100.0, 100.0, 101.0, 101.0));
    if (!outside.empty()) {
        std::cerr << "Query outside populated area should be empty" << std::endl;
        return false;
    }

    return true;
}

bool test_overlapping_bounds() {
    Tree tree;
    tree.bulk_load({{1, box(0, 0, 5, 5)}, {2, box(2, 2, 7, 7)}, {3, box(6, 6, 9, 9)}});

    auto center = tree.query(box(3, 3, 4, 4));
    std::sort(center.begin(), center.end());
    if (center != std::vector<int>{1, 2}) {
        std::cerr << "Expected overlapping query to return items 1 and 2" << std::endl;
        return false;
    }

    // Touching edges count as intersecting
    auto edge = tree.query(box(5, 5, 6, 6));
    std::sort(edge.begin(), edge.end());
    if (edge != std::vector<int>{1, 2, 3}) {
        std::cerr << "Expected edge query to return items 1, 2, and 3" << std::endl;
        return false;
    }

    return true;
}

bool test_point_items() {
    Tree tree;
    tree.bulk_load({{7, box(3, 4, 3, 4)}, {8, box(-3, -4, -3, -4)}});

    auto hit = tree.query_point(3, 4);
    auto around = tree.query(box(2, 3, 4, 5));
    return hit == std::vector<int>{7} && around == std::vector<int>{7};
}

bool test_bulk_load_matches_linear_scan() {
    std::mt19937 rng(1234u);
    std::uniform_real_distribution<double> lon(-180.0, 170.0);
    std::uniform_real_distribution<double> lat(-90.0, 80.0);
    std::uniform_real_distribution<double> extent(0.0, 10.0);

    std::vector<std::pair<int, Bounds>> entries;
    SimpleSpatialIndex<int> linear;
    for (int i = 0; i < 2500; ++i) {
        const double x = lon(rng);
        const double y = lat(rng);
        const Bounds b = box(x, y, x + extent(rng), y + extent(rng));
        entries.emplace_back(i, b);
        linear.insert(i, b);
    }

    Tree tree;
    tree.bulk_load(entries);
    if (tree.size() != entries.size() || !tree.validate_structure()) {
        std::cerr << "Bulk loaded tree has wrong size or structure" << std::endl;
        return false;
    }
    if (tree.depth() < 2) {
        std::cerr << "2500 items should need more than one level" << std::endl;
        return false;
    }

    for (int q = 0; q < 200; ++q) {
        const double x = lon(rng);
        const double y = lat(rng);
        const Bounds query = box(x, y, x + extent(rng) * 3.0, y + extent(rng) * 3.0);

        auto expected = linear.query(query);
        auto actual = tree.query(query);
        std::sort(expected.begin(), expected.end());
        std::sort(actual.begin(), actual.end());
        if (expected != actual) {
            std::cerr << "R-tree and linear scan disagree on query " << q << std::endl;
            return false;
        }
    }
    return true;
}

bool test_bulk_load_replaces_contents() {
    Tree tree;
    tree.bulk_load({{1, box(0, 0, 1, 1)}});
    tree.bulk_load({{2, box(10, 10, 11, 11)}});

    if (tree.size() != 1 || !tree.query(box(0, 0, 1, 1)).empty()) {
        return false;
    }
    tree.bulk_load({});
    return tree.size() == 0;
}

bool test_linear_index_insertion_order() {
    SimpleSpatialIndex<int> index;
    index.insert(3, box(0, 0, 2, 2));
    index.insert(1, box(1, 1, 3, 3));
    index.insert(2, box(10, 10, 11, 11));

    const auto stats = index.get_statistics();
    if (stats.total_items != 3 || stats.bounds.max_lon != 11 || stats.total_area != 9.0) {
        std::cerr << "Unexpected linear index statistics" << std::endl;
        return false;
    }
    return index.query(box(1.5, 1.5, 1.5, 1.5)) == std::vector<int>{3, 1} &&
           index.query(box(5, 5, 4, 4)).empty();
}

bool run_all_tests() {
    const std::pair<const char*, bool (*)()> tests[] = {
        {"empty_tree", &test_empty_tree},
        {"single_entry", &test_single_entry},
        {"clear", &test_clear},
        {"invalid_query_box", &test_invalid_query_box},
        {"full_query", &test_full_query},
        {"spatial_filtering", &test_spatial_filtering},
        {"overlapping_bounds", &test_overlapping_bounds},
        {"point_items", &test_point_items},
        {"bulk_load_matches_linear_scan", &test_bulk_load_matches_linear_scan},
        {"bulk_load_replaces_contents", &test_bulk_load_replaces_contents},
        {"linear_index_insertion_order", &test_linear_index_insertion_order},
    };

    bool all_passed = true;

    for (const auto& [name, fn] : tests) {
        if (!fn()) {
            std::cerr << "Test failed: " << name << std::endl;
            all_passed = false;
        }
    }

    return all_passed;
}

} // namespace rtree_tests

} // namespace geoatlas

int main() {
    if (geoatlas::rtree_tests::run_all_tests()) {
        std::cout << "All RTree tests passed" << std::endl;
        return 0;
    }

    std::cerr << "RTree tests failed" << std::endl;
    return 1;
}
