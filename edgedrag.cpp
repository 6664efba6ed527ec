#include "edgedrag.hpp"
#include "edge.hpp"
#include "globals.hpp"
#include "log.hpp"
#include <hyprland/src/Compositor.hpp>
#include <hyprland/src/managers/input/InputManager.hpp>
#include <linux/input-event-codes.h>
#include <algorithm>
#include <format>

CEdgeDrag::CEdgeDrag() {
    reloadConfig();
}

CEdgeDrag::~CEdgeDrag() {
    m_scroller.reset();
}

void CEdgeDrag::reloadConfig() {
    static auto const* PDEBUG =
        (Hyprlang::INT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:edge-scroll:debug")->getDataStaticPtr();
    static auto const* PMAXTICK =
        (Hyprlang::INT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:edge-scroll:max_tick_ms")->getDataStaticPtr();
    static auto const* PZEROWAIT =
        (Hyprlang::INT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:edge-scroll:zero_wait_ms")->getDataStaticPtr();
    static auto const* PSPEED =
        (Hyprlang::FLOAT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:edge-scroll:speed")->getDataStaticPtr();

    setDebugLogging(**PDEBUG);

    SScrollerConfig config;
    config.maxTickDurationMs = static_cast<uint32_t>(std::max<Hyprlang::INT>(**PMAXTICK, 1));
    config.zeroScrollWaitMs  = static_cast<uint32_t>(std::max<Hyprlang::INT>(**PZEROWAIT, 1));

    // replacing the scroller cancels whatever the old one was doing
    m_scroller = std::make_unique<CScroller>(g_pCompositor->m_wlEventLoop, m_surface, [] { return static_cast<double>(**PSPEED); }, config);

    if (debugLoggingEnabled())
        edgeLog(std::format("config: maxTick={}ms zeroWait={}ms speed={}px/s", config.maxTickDurationMs, config.zeroScrollWaitMs, **PSPEED));

    if (m_dragging)
        evaluate();
}

void CEdgeDrag::onButton(const IPointer::SButtonEvent& e) {
    static auto const* PENABLED =
        (Hyprlang::INT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:edge-scroll:enabled")->getDataStaticPtr();

    if (e.button != BTN_LEFT)
        return;

    if (e.state != WL_POINTER_BUTTON_STATE_PRESSED) {
        endDrag("buttonReleased");
        return;
    }

    if (!**PENABLED)
        return;

    const auto KEYS = currentScrollTargetKeys();
    if (KEYS.windowKey == 0 || KEYS.surfaceKey == 0)
        return;

    m_surface.bind(KEYS);
    m_window   = g_pInputManager->m_lastMouseFocus;
    m_dragging = true;

    if (debugLoggingEnabled())
        edgeLog(std::format("drag began window={:#x} surface={:#x}", KEYS.windowKey, KEYS.surfaceKey));
}

void CEdgeDrag::onMove() {
    if (m_dragging)
        evaluate();
}

void CEdgeDrag::onFocusChange(PHLWINDOW window) {
    static auto const* PSTOPFOCUS =
        (Hyprlang::INT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:edge-scroll:stop_on_focus")->getDataStaticPtr();

    if (!**PSTOPFOCUS)
        return;

    // clicking into an unfocused window focuses the very window we're dragging in
    if (window && window == m_window.lock())
        return;

    endDrag("activeWindow");
}

void CEdgeDrag::endDrag(const char* reason) {
    if (!m_dragging && !m_scroller->isScrolling())
        return;

    if (debugLoggingEnabled())
        edgeLog(std::format("drag ended reason={}", reason));

    m_dragging = false;
    m_scroller->stop();
    m_surface.unbind();
    m_window.reset();
}

void CEdgeDrag::evaluate() {
    static auto const* PENABLED =
        (Hyprlang::INT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:edge-scroll:enabled")->getDataStaticPtr();
    static auto const* PEDGE =
        (Hyprlang::INT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:edge-scroll:edge_size")->getDataStaticPtr();
    static auto const* PSTEPS =
        (Hyprlang::INT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:edge-scroll:speed_steps")->getDataStaticPtr();
    static auto const* PMAXDIST =
        (Hyprlang::FLOAT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:edge-scroll:max_distance")->getDataStaticPtr();
    static auto const* PDEBUG =
        (Hyprlang::INT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:edge-scroll:debug")->getDataStaticPtr();

    if (!**PENABLED) {
        endDrag("disabled");
        return;
    }

    // geometry of the window the drag began in, the pointer may well be outside it by now
    const auto PWIN = m_window.lock();
    if (!PWIN || !m_surface.targetFocused()) {
        m_scroller->stop();
        return;
    }

    const auto POS    = PWIN->m_realPosition->value();
    const auto SIZE   = PWIN->m_realSize->value();
    const auto MOUSE  = g_pInputManager->getMouseCoordsInternal();
    const auto STEPS  = static_cast<uint32_t>(std::max<Hyprlang::INT>(**PSTEPS, 1));
    const auto SCROLL = edgeScrollFor(MOUSE.y, POS.y, POS.y + SIZE.y, static_cast<double>(**PEDGE), STEPS);

    if (!SCROLL) {
        m_scroller->stop();
        return;
    }

    const bool wasScrolling = m_scroller->isScrolling();

    CScroller::DistanceProvider maxDistance;
    if (**PMAXDIST > 0.F)
        maxDistance = [] { return static_cast<double>(**PMAXDIST); };

    // the tick re-reads the pointer so a resting pointer still steers the scroll
    m_scroller->start(SCROLL->direction, SCROLL->speedMultiplier, std::move(maxDistance), [this] { evaluate(); });

    if (**PDEBUG && !wasScrolling && m_scroller->isScrolling()) {
        const std::string msg = std::format("[hypr-edge-scroll] scrolling {} x{:.2f}", SCROLL->direction == SCROLL_FORWARD ? "down" : "up", SCROLL->speedMultiplier);
        HyprlandAPI::addNotification(PHANDLE, msg, CHyprColor{0.2, 0.6, 1.0, 1.0}, 1000);
    }
}
