#pragma once
#include "axissurface.hpp"
#include "scroller.hpp"
#include <hyprland/src/Compositor.hpp>
#include <hyprland/src/devices/IPointer.hpp>
#include <memory>

// Scrolls the window under a left-button drag while the pointer sits in its top or bottom edge band.
class CEdgeDrag {
  public:
    CEdgeDrag();
    ~CEdgeDrag();

    void onButton(const IPointer::SButtonEvent& e);
    void onMove();
    void onFocusChange(PHLWINDOW window);
    void reloadConfig();

    void endDrag(const char* reason);

  private:
    void                       evaluate();

    CAxisScrollSurface         m_surface;
    std::unique_ptr<CScroller> m_scroller;
    PHLWINDOWREF               m_window;
    bool                       m_dragging = false;
};
