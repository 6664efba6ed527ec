#include "axissurface.hpp"
#include "globals.hpp"
#include "log.hpp"
#include <hyprland/src/Compositor.hpp>
#include <hyprland/src/managers/SeatManager.hpp>
#include <hyprland/src/managers/input/InputManager.hpp>
#include <algorithm>
#include <chrono>
#include <format>

SScrollTargetKeys currentScrollTargetKeys() {
    SScrollTargetKeys out;

    if (g_pInputManager) {
        const auto PWIN = g_pInputManager->m_lastMouseFocus.lock();
        out.windowKey   = PWIN ? reinterpret_cast<uintptr_t>(PWIN.get()) : 0;
    }

    if (g_pSeatManager) {
        const auto PSURF = g_pSeatManager->m_state.pointerFocus.lock();
        out.surfaceKey   = PSURF ? reinterpret_cast<uintptr_t>(PSURF.get()) : 0;
    }

    return out;
}

static uint32_t nowMs() {
    const auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

class CAxisScrollAnimation : public IScrollAnimation {
  public:
    CAxisScrollAnimation(const CAxisScrollSurface* surface, double distance, uint32_t durationMs, ScrollEasingFn easing, std::function<void(bool)> onDone);
    ~CAxisScrollAnimation() override;

    void cancel() override;

    bool valid() const {
        return m_timer != nullptr;
    }

  private:
    static int                            onFrameTimer(void* data);
    void                                  frame();
    void                                  complete(bool finished);
    uint32_t                              frameIntervalMs() const;

    const CAxisScrollSurface*             m_surface = nullptr;
    double                                m_distance   = 0.0;
    uint32_t                              m_durationMs = 0;
    ScrollEasingFn                        m_easing     = linearEasing;
    std::function<void(bool)>             m_onDone;

    std::chrono::steady_clock::time_point m_begin;
    double                                m_emitted = 0.0;
    bool                                  m_done    = false;
    wl_event_source*                      m_timer   = nullptr;
};

CAxisScrollAnimation::CAxisScrollAnimation(const CAxisScrollSurface* surface, double distance, uint32_t durationMs, ScrollEasingFn easing,
                                           std::function<void(bool)> onDone) :
    m_surface(surface), m_distance(distance), m_durationMs(std::max<uint32_t>(durationMs, 1)), m_easing(easing ? easing : linearEasing),
    m_onDone(std::move(onDone)), m_begin(std::chrono::steady_clock::now()) {
    m_timer = wl_event_loop_add_timer(g_pCompositor->m_wlEventLoop, onFrameTimer, this);
    if (m_timer)
        wl_event_source_timer_update(m_timer, std::min(frameIntervalMs(), m_durationMs));
}

CAxisScrollAnimation::~CAxisScrollAnimation() {
    if (m_timer)
        wl_event_source_remove(m_timer);
}

void CAxisScrollAnimation::cancel() {
    m_done = true;
    m_onDone = nullptr;
    if (m_timer)
        wl_event_source_timer_update(m_timer, 0);
}

uint32_t CAxisScrollAnimation::frameIntervalMs() const {
    static auto const* PINTERVAL =
        (Hyprlang::INT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:edge-scroll:interval_ms")->getDataStaticPtr();
    return static_cast<uint32_t>(std::max<Hyprlang::INT>(**PINTERVAL, 1));
}

int CAxisScrollAnimation::onFrameTimer(void* data) {
    static_cast<CAxisScrollAnimation*>(data)->frame();
    return 0;
}

void CAxisScrollAnimation::frame() {
    if (m_done)
        return;

    if (!m_surface->targetFocused()) {
        complete(false);
        return;
    }

    const auto   elapsed  = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - m_begin).count();
    const double progress = std::clamp(static_cast<double>(elapsed) / m_durationMs, 0.0, 1.0);
    const double target   = m_easing(progress) * m_distance;
    const double delta    = target - m_emitted;

    if (delta != 0.0) {
        g_pSeatManager->sendPointerAxis(nowMs(), WL_POINTER_AXIS_VERTICAL_SCROLL, delta,
                                        0, // discrete
                                        0, // v120
                                        WL_POINTER_AXIS_SOURCE_CONTINUOUS, WL_POINTER_AXIS_RELATIVE_DIRECTION_IDENTICAL);
        g_pSeatManager->sendPointerFrame();
        m_emitted = target;
    }

    if (progress >= 1.0) {
        complete(true);
        return;
    }

    const auto remaining = static_cast<uint32_t>(m_durationMs - elapsed);
    wl_event_source_timer_update(m_timer, std::clamp<uint32_t>(remaining, 1, frameIntervalMs()));
}

void CAxisScrollAnimation::complete(bool finished) {
    m_done = true;

    if (!finished && debugLoggingEnabled())
        edgeLog(std::format("animation aborted after {:.1f} of {:.1f}px", m_emitted, m_distance));

    // the owner may destroy us from inside onDone
    auto onDone = std::move(m_onDone);
    m_onDone    = nullptr;
    if (onDone)
        onDone(finished);
}

void CAxisScrollSurface::bind(const SScrollTargetKeys& keys) {
    m_target = keys;
}

void CAxisScrollSurface::unbind() {
    m_target = {};
}

bool CAxisScrollSurface::targetFocused() const {
    if (m_target.windowKey == 0 || m_target.surfaceKey == 0)
        return false;

    // a pointer dragged past the window edge may report no window, only a different one counts
    const auto CURRENT        = currentScrollTargetKeys();
    const bool windowChanged  = CURRENT.windowKey != 0 && CURRENT.windowKey != m_target.windowKey;
    const bool surfaceChanged = CURRENT.surfaceKey != m_target.surfaceKey;
    return !windowChanged && !surfaceChanged;
}

bool CAxisScrollSurface::canScroll(eScrollDirection /*dir*/) {
    // clients don't report their scroll extents, focus is all we can check
    return targetFocused();
}

std::unique_ptr<IScrollAnimation> CAxisScrollSurface::animateScrollBy(double distance, uint32_t durationMs, ScrollEasingFn easing, std::function<void(bool)> onDone) {
    auto anim = std::make_unique<CAxisScrollAnimation>(this, distance, durationMs, easing, std::move(onDone));
    if (!anim->valid())
        return nullptr;

    return anim;
}
