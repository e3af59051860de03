#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace winplace {

// ─────────────────────────────────────────────────────────────────────────────
// Basic geometry types
// ─────────────────────────────────────────────────────────────────────────────

/// Opaque window handle issued by the windowing system (an X11 window id).
using WindowHandle = uint32_t;

constexpr WindowHandle NO_WINDOW = 0;

/// Rectangle in absolute desktop coordinates.
struct Geometry
{
    int32_t x = 0;
    int32_t y = 0;
    int32_t width = 0;
    int32_t height = 0;

    bool operator==(Geometry const&) const = default;

    int32_t right() const { return x + width; }
    int32_t bottom() const { return y + height; }

    bool contains(int32_t px, int32_t py) const { return px >= x && px < right() && py >= y && py < bottom(); }
};

// ─────────────────────────────────────────────────────────────────────────────
// Window and monitor snapshots
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Immutable view of one window at a point in time.
 *
 * Produced by the WindowSystem on demand. Never mutated by the engine;
 * re-fetched whenever freshness matters (e.g., when a delayed placement fires).
 */
struct WindowSnapshot
{
    WindowHandle handle = NO_WINDOW;
    std::string title;    // _NET_WM_NAME or WM_NAME
    std::string process;  // /proc/<_NET_WM_PID>/comm
    std::string wm_class; // WM_CLASS class name
    Geometry geometry;
    size_t monitor = 0;   // 0-based index of the monitor containing the window centre
    bool maximized = false;
    bool minimized = false;
};

/**
 * @brief One physical output.
 *
 * `area` is the full output rectangle, `work_area` the part not reserved by
 * panels (struts). Indices are 0-based; configuration addresses monitors 1-based.
 */
struct MonitorInfo
{
    std::string name;
    Geometry area;
    Geometry work_area;
};

} // namespace winplace
