#pragma once
#include "surface.hpp"
#include <cstdint>
#include <optional>

struct SEdgeScroll {
    eScrollDirection direction       = SCROLL_FORWARD;
    double           speedMultiplier = 1.0;
};

// Where a pointer at y sits relative to the edge bands of [top, bottom).
// nullopt outside both bands, otherwise the direction and a multiplier in (0, 1] that grows
// with the depth into the band, rounded up to 1/steps so nearby positions share a value.
std::optional<SEdgeScroll> edgeScrollFor(double y, double top, double bottom, double edgeSize, uint32_t steps);
