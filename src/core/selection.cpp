#include "selection.hpp"

namespace geoatlas::core {

void RegionSelection::select(std::vector<BoundedRegion>& regions, std::optional<std::size_t> index) {
    if (selected_ && *selected_ < regions.size()) {
        regions[*selected_].set_selected(false);
    }
    selected_.reset();

    if (index && *index < regions.size()) {
        regions[*index].set_selected(true);
        selected_ = index;
    }
}

std::optional<std::string> RegionSelection::selected_name(const std::vector<BoundedRegion>& regions) const {
    if (!selected_ || *selected_ >= regions.size()) {
        return std::nullopt;
    }
    return regions[*selected_].name();
}

} // namespace geoatlas::core
