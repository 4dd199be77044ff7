#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "region.hpp"

namespace geoatlas::core {

// At most one selected region. The selected flag on BoundedRegion mirrors this state.
class RegionSelection {
public:
    // Clears the previous region's flag before raising the new one; nullopt clears.
    // Out-of-range indices are treated as nullopt.
    void select(std::vector<BoundedRegion>& regions, std::optional<std::size_t> index);
    void clear(std::vector<BoundedRegion>& regions) { select(regions, std::nullopt); }

    [[nodiscard]] std::optional<std::size_t> selected() const { return selected_; }
    [[nodiscard]] bool has_selection() const { return selected_.has_value(); }
    [[nodiscard]] std::optional<std::string> selected_name(const std::vector<BoundedRegion>& regions) const;

    // Drops the index without touching any region, for when the collection is replaced.
    void reset() { selected_.reset(); }

private:
    std::optional<std::size_t> selected_;
};

} // namespace geoatlas::core
