#pragma once
#include "surface.hpp"
#include <cstdint>

struct SScrollTargetKeys {
    uintptr_t windowKey  = 0;
    uintptr_t surfaceKey = 0;
};

SScrollTargetKeys currentScrollTargetKeys();

// Scrolls whatever holds pointer focus by sending synthetic vertical axis events.
// Only usable while the window and surface captured by bind() keep pointer focus.
class CAxisScrollSurface : public IScrollSurface {
  public:
    void                              bind(const SScrollTargetKeys& keys);
    void                              unbind();
    bool                              targetFocused() const;

    bool                              canScroll(eScrollDirection dir) override;
    std::unique_ptr<IScrollAnimation> animateScrollBy(double distance, uint32_t durationMs, ScrollEasingFn easing, std::function<void(bool)> onDone) override;

  private:
    SScrollTargetKeys m_target;
};
