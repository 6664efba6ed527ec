#pragma once
#include <cstdint>
#include <functional>
#include <memory>

enum eScrollDirection : uint8_t {
    SCROLL_BACKWARD = 0,
    SCROLL_FORWARD,
};

// maps progress in [0, 1] to eased progress in [0, 1]
using ScrollEasingFn = double (*)(double);

inline double linearEasing(double t) {
    return t;
}

class IScrollAnimation {
  public:
    virtual ~IScrollAnimation() = default;

    // onDone is never called after cancel()
    virtual void cancel() = 0;
};

class IScrollSurface {
  public:
    virtual ~IScrollSurface() = default;

    virtual bool canScroll(eScrollDirection dir) = 0;

    // Applies a signed offset over durationMs. onDone(true) when the whole distance was applied,
    // onDone(false) when the surface gave up midway. onDone runs from the event loop, never from
    // inside animateScrollBy.
    virtual std::unique_ptr<IScrollAnimation> animateScrollBy(double distance, uint32_t durationMs, ScrollEasingFn easing,
                                                              std::function<void(bool)> onDone) = 0;
};
