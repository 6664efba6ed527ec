#pragma once
#include <hyprland/src/plugins/PluginAPI.hpp>

class CEdgeDrag;

inline HANDLE     PHANDLE     = nullptr;
inline CEdgeDrag* g_pEdgeDrag = nullptr;
