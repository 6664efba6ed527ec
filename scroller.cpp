#include "scroller.hpp"
#include "log.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <format>
#include <limits>

int scrollDirectionSign(eScrollDirection dir) {
    switch (dir) {
        case SCROLL_BACKWARD: return -1;
        case SCROLL_FORWARD: return 1;
    }
    return 1;
}

SScrollTick computeScrollTick(double maxDistance, double pixelsPerMs, uint32_t maxDurationMs) {
    // NaN fails both comparisons
    if (!(maxDistance > 0.0) || !(pixelsPerMs > 0.0) || !std::isfinite(pixelsPerMs))
        return {};

    const uint32_t MAXMS   = std::max<uint32_t>(maxDurationMs, 1);
    const double   idealMs = maxDistance / pixelsPerMs;

    // unbounded distance: always a full-length step at the requested speed
    if (!std::isfinite(idealMs))
        return {MAXMS, MAXMS * pixelsPerMs};

    const double   rounded  = std::round(idealMs);
    const uint32_t duration = rounded >= MAXMS ? MAXMS : std::max<uint32_t>(1, static_cast<uint32_t>(rounded));

    // scaled to the clamped duration so the speed stays exact
    return {duration, maxDistance * duration / idealMs};
}

class CScroller::CScrollLoop : public std::enable_shared_from_this<CScrollLoop> {
  public:
    CScrollLoop(CScroller* owner, uint64_t id, SScrollIntent intent, DistanceProvider maxDistance, TickCallback onTick);
    ~CScrollLoop();

    void     launch();
    void     cancel();

    uint64_t id() const {
        return m_id;
    }

  private:
    static void                       onIdle(void* data);
    static int                        onZeroWaitTimer(void* data);

    void                              scheduleTick();
    void                              tick();
    void                              onAnimationDone(bool finished);
    void                              finish(const char* reason);

    CScroller*                         m_owner = nullptr;
    uint64_t                          m_id    = 0;
    SScrollIntent                     m_intent;
    DistanceProvider                  m_maxDistance;
    TickCallback                      m_onTick;

    wl_event_source*                  m_idle      = nullptr;
    wl_event_source*                  m_waitTimer = nullptr;
    std::unique_ptr<IScrollAnimation> m_animation;
    bool                              m_cancelled = false;
};

CScroller::CScrollLoop::CScrollLoop(CScroller* owner, uint64_t id, SScrollIntent intent, DistanceProvider maxDistance, TickCallback onTick) :
    m_owner(owner), m_id(id), m_intent(intent), m_maxDistance(std::move(maxDistance)), m_onTick(std::move(onTick)) {
    m_waitTimer = wl_event_loop_add_timer(m_owner->m_eventLoop, onZeroWaitTimer, this);
}

CScroller::CScrollLoop::~CScrollLoop() {
    cancel();
    if (m_waitTimer)
        wl_event_source_remove(m_waitTimer);
}

void CScroller::CScrollLoop::launch() {
    if (!m_waitTimer) {
        finish("timer source unavailable");
        return;
    }

    scheduleTick();
}

void CScroller::CScrollLoop::cancel() {
    m_cancelled = true;

    if (m_idle) {
        wl_event_source_remove(m_idle);
        m_idle = nullptr;
    }

    if (m_waitTimer)
        wl_event_source_timer_update(m_waitTimer, 0);

    if (m_animation) {
        m_animation->cancel();
        m_animation.reset();
    }
}

void CScroller::CScrollLoop::scheduleTick() {
    if (m_cancelled || m_idle)
        return;

    m_idle = wl_event_loop_add_idle(m_owner->m_eventLoop, onIdle, this);
    if (!m_idle)
        finish("idle source unavailable");
}

void CScroller::CScrollLoop::onIdle(void* data) {
    auto* self = static_cast<CScrollLoop*>(data);
    // the event loop removes idle sources itself after dispatch
    self->m_idle = nullptr;
    self->tick();
}

int CScroller::CScrollLoop::onZeroWaitTimer(void* data) {
    static_cast<CScrollLoop*>(data)->tick();
    return 0;
}

void CScroller::CScrollLoop::tick() {
    if (m_cancelled)
        return;

    // the tick callback may stop or restart the scroller, which drops the owner's reference
    const auto self = shared_from_this();

    // finished animation handles are released here, outside the surface's own callback
    m_animation.reset();

    try {
        if (m_onTick) {
            m_onTick();
            if (m_cancelled)
                return;
        }

        if (!m_owner->m_surface.canScroll(m_intent.direction)) {
            finish("cannot scroll further");
            return;
        }

        const double maxDistance = m_maxDistance ? m_maxDistance() : std::numeric_limits<double>::infinity();
        const double pixelsPerMs = m_owner->m_pixelsPerSecond() * m_intent.speedMultiplier / 1000.0;
        const auto   STEP        = computeScrollTick(maxDistance, pixelsPerMs, m_owner->m_config.maxTickDurationMs);

        if (STEP.durationMs == 0) {
            if (debugLoggingEnabled())
                edgeLog(std::format("loop {} waiting: maxDistance={} pixelsPerMs={}", m_id, maxDistance, pixelsPerMs));
            wl_event_source_timer_update(m_waitTimer, std::max<uint32_t>(m_owner->m_config.zeroScrollWaitMs, 1));
            return;
        }

        const double diff = STEP.distance * scrollDirectionSign(m_intent.direction);

        if (debugLoggingEnabled())
            edgeLog(std::format("loop {} step: diff={} duration={}ms maxDistance={}", m_id, diff, STEP.durationMs, maxDistance));

        m_animation = m_owner->m_surface.animateScrollBy(diff, STEP.durationMs, linearEasing, [weak = weak_from_this()](bool finished) {
            if (const auto loop = weak.lock())
                loop->onAnimationDone(finished);
        });

        if (!m_animation)
            finish("surface refused the animation");
    } catch (const std::exception& e) { finish(e.what()); }
}

void CScroller::CScrollLoop::onAnimationDone(bool finished) {
    if (m_cancelled)
        return;

    if (!finished) {
        finish("animation aborted");
        return;
    }

    scheduleTick();
}

void CScroller::CScrollLoop::finish(const char* reason) {
    cancel();
    m_owner->onLoopFinished(this, reason);
}

CScroller::CScroller(wl_event_loop* loop, IScrollSurface& surface, SpeedProvider pixelsPerSecond, SScrollerConfig config) :
    m_eventLoop(loop), m_surface(surface), m_pixelsPerSecond(std::move(pixelsPerSecond)), m_config(config) {
    if (!m_pixelsPerSecond)
        m_pixelsPerSecond = [] { return 0.0; };
}

CScroller::~CScroller() {
    cancelLoop("scroller destroyed");
}

CScroller::SpeedProvider CScroller::speedFromAmount(std::function<double()> pixelAmount, uint32_t durationMs) {
    return [pixelAmount = std::move(pixelAmount), durationMs]() -> double {
        if (durationMs == 0)
            return 0.0;
        return pixelAmount() / (durationMs / 1000.0);
    };
}

void CScroller::start(eScrollDirection dir, double speedMultiplier, DistanceProvider maxDistance, TickCallback onTick) {
    const SScrollIntent INTENT{dir, speedMultiplier};

    if (m_intent == INTENT)
        return;

    cancelLoop("superseded");

    if (!m_surface.canScroll(dir)) {
        if (debugLoggingEnabled())
            edgeLog(std::format("start dir={} ignored: cannot scroll", scrollDirectionSign(dir)));
        return;
    }

    m_intent = INTENT;
    m_loop   = std::make_shared<CScrollLoop>(this, ++m_lastLoopId, INTENT, std::move(maxDistance), std::move(onTick));

    if (debugLoggingEnabled())
        edgeLog(std::format("loop {} started: dir={} multiplier={}", m_lastLoopId, scrollDirectionSign(dir), speedMultiplier));

    // launch may fail and finish the loop straight away
    const auto loop = m_loop;
    loop->launch();
}

void CScroller::stop() {
    cancelLoop("stopped");
}

bool CScroller::isScrolling() const {
    return m_intent.has_value();
}

uint64_t CScroller::loopId() const {
    return m_loop ? m_loop->id() : 0;
}

void CScroller::cancelLoop(const char* reason) {
    m_intent.reset();

    if (!m_loop)
        return;

    if (debugLoggingEnabled())
        edgeLog(std::format("loop {} cancelled: {}", m_loop->id(), reason));

    // a loop cancelled from inside its own tick stays alive until that tick returns
    const auto loop = std::move(m_loop);
    loop->cancel();
}

void CScroller::onLoopFinished(CScrollLoop* loop, const char* reason) {
    if (m_loop.get() != loop)
        return;

    if (debugLoggingEnabled())
        edgeLog(std::format("loop {} finished: {}", loop->id(), reason));

    m_intent.reset();
    m_loop.reset();
}
