#pragma once
#include "surface.hpp"
#include <wayland-server-core.h>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <vector>

// Records animations and completes them only when the test says so.
class CFakeSurface : public IScrollSurface {
  public:
    struct SAnimation {
        double                    distance   = 0.0;
        uint32_t                  durationMs = 0;
        ScrollEasingFn            easing     = nullptr;
        std::function<void(bool)> onDone;
        bool                      cancelled = false;
        bool                      completed = false;
    };

    bool canScroll(eScrollDirection dir) override {
        return dir == SCROLL_FORWARD ? canForward : canBackward;
    }

    std::unique_ptr<IScrollAnimation> animateScrollBy(double distance, uint32_t durationMs, ScrollEasingFn easing, std::function<void(bool)> onDone) override {
        if (throwOnAnimate)
            throw std::runtime_error("animation backend gone");
        if (refuseAnimations)
            return nullptr;

        auto anim = std::make_shared<SAnimation>(SAnimation{distance, durationMs, easing, std::move(onDone)});
        animations.push_back(anim);
        return std::make_unique<CHandle>(anim);
    }

    // completes the most recent animation, false reports it as aborted
    void completeLast(bool finished = true) {
        if (animations.empty())
            return;

        const auto anim = animations.back();
        if (anim->cancelled || anim->completed)
            return;

        anim->completed = true;
        auto onDone     = anim->onDone;
        onDone(finished);
    }

    bool                                     canForward       = true;
    bool                                     canBackward      = true;
    bool                                     throwOnAnimate   = false;
    bool                                     refuseAnimations = false;
    std::vector<std::shared_ptr<SAnimation>> animations;

  private:
    class CHandle : public IScrollAnimation {
      public:
        explicit CHandle(std::shared_ptr<SAnimation> anim) : m_anim(std::move(anim)) {}

        void cancel() override {
            m_anim->cancelled = true;
        }

      private:
        std::shared_ptr<SAnimation> m_anim;
    };
};

// Dispatches the loop until pred holds or timeoutMs passes.
inline bool dispatchUntil(wl_event_loop* loop, const std::function<bool()>& pred, int timeoutMs = 1000) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline)
            return false;
        wl_event_loop_dispatch(loop, 10);
    }
    return true;
}
