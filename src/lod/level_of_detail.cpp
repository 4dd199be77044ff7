#include "level_of_detail.hpp"

#include <array>

#include "simplify.hpp"

namespace geoatlas::lod {

namespace {

struct Band {
    double min_zoom;
    std::size_t stride;
    double tolerance;
};

// Ordered from closest to farthest; the first band whose min_zoom <= zoom wins.
constexpr std::array<Band, 6> kBands{{
    {LevelOfDetailSelector::kFullDetailZoom, 1, 0.0},
    {2.0, 2, 0.1},
    {1.0, 4, 0.5},
    {0.5, 8, 1.0},
    {0.3, 16, 2.0},
    {0.0, 16, 5.0},
}};

} // namespace

const char* to_string(Strategy strategy) {
    switch (strategy) {
        case Strategy::Stride:
            return "stride";
        case Strategy::Tolerance:
            return "tolerance";
    }
    return "unknown";
}

bool parse_strategy(std::string_view text, Strategy& out) {
    if (text == "stride") {
        out = Strategy::Stride;
        return true;
    }
    if (text == "tolerance") {
        out = Strategy::Tolerance;
        return true;
    }
    return false;
}

LevelOfDetailSelector::LevelOfDetailSelector(Strategy strategy, std::size_t cache_capacity)
    : strategy_(strategy)
    , cache_(cache_capacity) {}

DetailLevel LevelOfDetailSelector::select(double zoom) const {
    int band = static_cast<int>(kBands.size()) - 1;
    for (std::size_t i = 0; i < kBands.size(); ++i) {
        if (zoom >= kBands[i].min_zoom) {
            band = static_cast<int>(i);
            break;
        }
    }

    DetailLevel level;
    level.strategy = strategy_;
    level.band = band;
    if (strategy_ == Strategy::Stride) {
        level.stride = kBands[band].stride;
    } else {
        level.tolerance = kBands[band].tolerance;
    }
    return level;
}

SharedRingSet LevelOfDetailSelector::rings_for(const core::BoundedRegion& region, std::size_t region_id, double zoom) {
    const DetailLevel level = select(zoom);
    if (level.full_detail()) {
        return region.shared_rings();
    }

    return cache_.get_or_compute(region_id, level.band, [&]() {
        return reduce(region.rings(), level);
    });
}

RingSet LevelOfDetailSelector::reduce(const RingSet& rings, const DetailLevel& level) {
    RingSet reduced;
    reduced.reserve(rings.size());
    for (const auto& ring : rings) {
        if (level.full_detail()) {
            reduced.push_back(ring);
        } else if (level.strategy == Strategy::Stride) {
            reduced.push_back(decimate_ring(ring, level.stride));
        } else {
            reduced.push_back(simplify_ring(ring, level.tolerance));
        }
    }
    return reduced;
}

void LevelOfDetailSelector::set_strategy(Strategy strategy) {
    if (strategy != strategy_) {
        strategy_ = strategy;
        cache_.clear();
    }
}

} // namespace geoatlas::lod
