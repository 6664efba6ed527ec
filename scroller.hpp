#pragma once
#include "surface.hpp"
#include <wayland-server-core.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

struct SScrollIntent {
    eScrollDirection direction       = SCROLL_FORWARD;
    double           speedMultiplier = 1.0;

    bool             operator==(const SScrollIntent&) const = default;
};

// One animated step. durationMs == 0 means no progress is possible right now.
struct SScrollTick {
    uint32_t durationMs = 0;
    double   distance   = 0.0;
};

struct SScrollerConfig {
    uint32_t maxTickDurationMs = 100;
    uint32_t zeroScrollWaitMs  = 100;
};

// -1 for SCROLL_BACKWARD, 1 for SCROLL_FORWARD
int         scrollDirectionSign(eScrollDirection dir);

// Duration covering maxDistance at pixelsPerMs, clamped to [1, maxDurationMs], and the
// distance that keeps the speed constant over that clamped duration (unsigned).
SScrollTick computeScrollTick(double maxDistance, double pixelsPerMs, uint32_t maxDurationMs);

/*
    Drives a continuous scroll of an IScrollSurface in one direction.
    At most one loop runs at a time, all of it on the given wl_event_loop.
    A tick: onTick, canScroll check, max distance query, one animated step.
*/
class CScroller {
  public:
    using SpeedProvider    = std::function<double()>;
    using DistanceProvider = std::function<double()>;
    using TickCallback     = std::function<void()>;

    CScroller(wl_event_loop* loop, IScrollSurface& surface, SpeedProvider pixelsPerSecond, SScrollerConfig config = {});
    ~CScroller();

    CScroller(const CScroller&)            = delete;
    CScroller& operator=(const CScroller&) = delete;

    // Speed given as "pixelAmount per durationMs" instead of pixels per second.
    static SpeedProvider speedFromAmount(std::function<double()> pixelAmount, uint32_t durationMs);

    // Repeating the running direction and multiplier is a no-op. An empty maxDistance means unbounded.
    void     start(eScrollDirection dir, double speedMultiplier = 1.0, DistanceProvider maxDistance = {}, TickCallback onTick = {});
    void     stop();

    bool     isScrolling() const;

    // Id of the running loop, 0 when idle. Every launched loop gets a new id.
    uint64_t loopId() const;

  private:
    class CScrollLoop;

    void                         onLoopFinished(CScrollLoop* loop, const char* reason);
    void                         cancelLoop(const char* reason);

    wl_event_loop*               m_eventLoop = nullptr;
    IScrollSurface&              m_surface;
    SpeedProvider                m_pixelsPerSecond;
    SScrollerConfig              m_config;

    std::optional<SScrollIntent> m_intent;
    std::shared_ptr<CScrollLoop> m_loop;
    uint64_t                     m_lastLoopId = 0;
};
