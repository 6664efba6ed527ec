#include "edge.hpp"
#include <algorithm>
#include <cmath>

std::optional<SEdgeScroll> edgeScrollFor(double y, double top, double bottom, double edgeSize, uint32_t steps) {
    if (!(edgeSize > 0.0) || !(bottom > top))
        return std::nullopt;

    steps = std::max<uint32_t>(steps, 1);

    const double     toTop    = y - top;
    const double     toBottom = bottom - y;

    // short windows have overlapping bands, the closer edge wins
    const eScrollDirection DIR   = toTop < toBottom ? SCROLL_BACKWARD : SCROLL_FORWARD;
    const double     depth = edgeSize - std::min(toTop, toBottom);

    if (depth <= 0.0)
        return std::nullopt;

    // past the edge itself counts as full depth
    const double fraction  = std::clamp(depth / edgeSize, 0.0, 1.0);
    const double quantized = std::ceil(fraction * steps) / steps;

    return SEdgeScroll{DIR, std::clamp(quantized, 1.0 / steps, 1.0)};
}
