#include "globals.hpp"
#include "edgedrag.hpp"
#include "log.hpp"
#include <hyprland/src/plugins/PluginAPI.hpp>
#include <hyprland/src/devices/IPointer.hpp>
#include <unordered_map>
#include <any>
#include <stdexcept>
#include <string>

static SP<HOOK_CALLBACK_FN> g_pButtonCallback;
static SP<HOOK_CALLBACK_FN> g_pMoveCallback;
static SP<HOOK_CALLBACK_FN> g_pWindowCallback;
static SP<HOOK_CALLBACK_FN> g_pConfigCallback;

static void onMouseButton(void* /*self*/, SCallbackInfo& /*info*/, std::any data) {
    if (!g_pEdgeDrag)
        return;

    auto eventData = std::any_cast<std::unordered_map<std::string, std::any>>(data);
    auto e         = std::any_cast<IPointer::SButtonEvent>(eventData["event"]);

    g_pEdgeDrag->onButton(e);
    // Don't cancel - the click still belongs to the client
}

static void onMouseMove(void* /*self*/, SCallbackInfo& /*info*/, std::any /*data*/) {
    if (!g_pEdgeDrag)
        return;

    g_pEdgeDrag->onMove();
}

static void onActiveWindow(void* /*self*/, SCallbackInfo& /*info*/, std::any data) {
    if (!g_pEdgeDrag)
        return;

    g_pEdgeDrag->onFocusChange(std::any_cast<PHLWINDOW>(data));
}

static void onConfigReloaded(void* /*self*/, SCallbackInfo& /*info*/, std::any /*data*/) {
    if (!g_pEdgeDrag)
        return;

    g_pEdgeDrag->reloadConfig();
}

APICALL EXPORT std::string PLUGIN_API_VERSION() {
    return HYPRLAND_API_VERSION;
}

APICALL EXPORT PLUGIN_DESCRIPTION_INFO PLUGIN_INIT(HANDLE handle) {
    PHANDLE = handle;

    const std::string HASH = __hyprland_api_get_hash();
    if (HASH != __hyprland_api_get_client_hash()) {
        HyprlandAPI::addNotification(PHANDLE, "[hypr-edge-scroll] Version mismatch (headers ver is not equal to running hyprland ver)", CHyprColor{1.0, 0.2, 0.2, 1.0},
                                     5000);
        throw std::runtime_error("[hypr-edge-scroll] Version mismatch");
    }

    HyprlandAPI::addConfigValue(PHANDLE, "plugin:edge-scroll:enabled", Hyprlang::INT{1});
    HyprlandAPI::addConfigValue(PHANDLE, "plugin:edge-scroll:speed", Hyprlang::FLOAT{1200.0});
    HyprlandAPI::addConfigValue(PHANDLE, "plugin:edge-scroll:edge_size", Hyprlang::INT{48});
    HyprlandAPI::addConfigValue(PHANDLE, "plugin:edge-scroll:speed_steps", Hyprlang::INT{4});
    HyprlandAPI::addConfigValue(PHANDLE, "plugin:edge-scroll:max_distance", Hyprlang::FLOAT{0.0});
    HyprlandAPI::addConfigValue(PHANDLE, "plugin:edge-scroll:interval_ms", Hyprlang::INT{16});
    HyprlandAPI::addConfigValue(PHANDLE, "plugin:edge-scroll:max_tick_ms", Hyprlang::INT{100});
    HyprlandAPI::addConfigValue(PHANDLE, "plugin:edge-scroll:zero_wait_ms", Hyprlang::INT{100});
    HyprlandAPI::addConfigValue(PHANDLE, "plugin:edge-scroll:stop_on_focus", Hyprlang::INT{1});
    HyprlandAPI::addConfigValue(PHANDLE, "plugin:edge-scroll:debug", Hyprlang::INT{0});

    // Compositor event loop is up during PLUGIN_INIT
    g_pEdgeDrag = new CEdgeDrag();

    g_pButtonCallback = HyprlandAPI::registerCallbackDynamic(PHANDLE, "mouseButton", onMouseButton);
    g_pMoveCallback   = HyprlandAPI::registerCallbackDynamic(PHANDLE, "mouseMove", onMouseMove);
    g_pWindowCallback = HyprlandAPI::registerCallbackDynamic(PHANDLE, "activeWindow", onActiveWindow);
    g_pConfigCallback = HyprlandAPI::registerCallbackDynamic(PHANDLE, "configReloaded", onConfigReloaded);

    edgeLog("loaded");
    HyprlandAPI::addNotification(PHANDLE, "[hypr-edge-scroll] Loaded!", CHyprColor{0.2, 0.8, 0.2, 1.0}, 3000);

    return {"hypr-edge-scroll", "Auto-scroll windows while dragging at their edges", "savonovv", "0.1"};
}

APICALL EXPORT void PLUGIN_EXIT() {
    g_pButtonCallback.reset();
    g_pMoveCallback.reset();
    g_pWindowCallback.reset();
    g_pConfigCallback.reset();

    // stops any running scroll and removes its event sources
    delete g_pEdgeDrag;
    g_pEdgeDrag = nullptr;
}
