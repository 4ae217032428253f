#pragma once

#include "di/types/prelude.h"
#include "di/vocab/optional/prelude.h"
#include "dius/steady_clock.h"
#include "termgrid/terminal/cursor.h"

namespace termgrid::terminal {
/// @brief Screen dimensions the viewport maps onto
///
/// The logical screen can be taller than the visible area (when a logical size is
/// set), in which case the extra rows are hidden above the visible area when the
/// viewport is at the bottom.
struct ViewportGeometry {
    u32 visible_rows { 0 };      ///< Physical rows
    u32 effective_rows { 0 };    ///< Logical screen rows
    usize scroll_back_rows { 0 };
    bool scroll_back_disabled { false };

    auto hidden_above() const -> usize { return effective_rows > visible_rows ? effective_rows - visible_rows : 0; }
};

/// @brief A crop applied by the renderer to the visible area
struct ScreenCrop {
    di::Optional<u32> width;
    di::Optional<u32> height;

    auto operator==(ScreenCrop const&) const -> bool = default;
};

/// @brief Tracks which part of the scroll back and screen is visible
///
/// The scroll offset counts rows up from the bottom of the logical screen, so 0 shows
/// the newest content. Offsets up to hidden_above() reveal logical rows above the visible
/// area, larger offsets reveal scroll back.
///
/// When entering the scroll back from below, there is a "magnetic" zone of a few rows where
/// the view sticks to the scroll back boundary. This prevents small scroll wheel movements
/// from accidentally showing scroll back.
///
/// The viewport also implements auto-scroll: for a short time after keyboard activity,
/// the view follows the cursor if it moves off screen.
class Viewport {
public:
    using Duration = dius::SteadyClock::Duration;
    using TimePoint = dius::SteadyClock::TimePoint;

    explicit Viewport(Duration keyboard_window = di::chrono::Milliseconds(500)) : m_keyboard_window(keyboard_window) {}

    auto scroll_offset() const -> usize { return m_scroll_offset; }

    /// @brief Set the scroll offset, clamped to [0, max_scroll_offset()]
    void set_scroll_offset(usize offset, ViewportGeometry const& geometry);

    /// @brief Reset the offset without clamping (used when the screen is rebuilt)
    void reset_scroll_offset(usize offset = 0) { m_scroll_offset = offset; }

    /// @brief Adjust for the oldest scroll back row being evicted
    ///
    /// When viewing scroll back, this keeps the same content visible.
    void on_scroll_back_evicted() {
        if (m_scroll_offset > 0) {
            m_scroll_offset--;
        }
    }

    auto magnetic_threshold(ViewportGeometry const& geometry) const -> usize;
    auto effective_scroll_offset(ViewportGeometry const& geometry) const -> usize;
    auto max_scroll_offset(ViewportGeometry const& geometry) const -> usize;

    /// @brief Snap back to the scroll back boundary if within the magnetic zone
    ///
    /// @return Whether the offset changed
    auto normalize_scroll_offset(ViewportGeometry const& geometry) -> bool;

    /// @brief The visible row just below the scroll back boundary, if one should be drawn
    auto scroll_back_boundary_visible_row(ViewportGeometry const& geometry) const -> di::Optional<u32>;

    /// @brief Map a visible row to an absolute row, where scroll back rows come first
    auto absolute_row(u32 visible_row, ViewportGeometry const& geometry) const -> usize;

    /// @brief Map a logical screen row to a visible row, if it is visible
    auto visible_row_for(u32 screen_row, ViewportGeometry const& geometry) const -> di::Optional<u32>;

    void notify_keyboard_activity(TimePoint now = dius::SteadyClock::now()) { m_last_keyboard_activity = now; }
    void notify_manual_vertical_scroll(TimePoint now = dius::SteadyClock::now()) { m_last_manual_scroll = now; }
    void record_scroll_event(TimePoint now = dius::SteadyClock::now()) { m_last_scroll_event = now; }
    auto last_scroll_event() const -> di::Optional<TimePoint> { return m_last_scroll_event; }

    /// @brief Whether keyboard activity was recent and not overridden by a manual scroll
    auto auto_scroll_active(TimePoint now = dius::SteadyClock::now()) const -> bool;

    /// @brief Scroll to bring the cursor into view if auto-scroll is active
    ///
    /// @param cursor_row The cursor row on the logical screen
    /// @param direction The direction of the cursor's most recent vertical movement
    /// @param geometry The current screen dimensions
    /// @param now The current time
    ///
    /// @return Whether the scroll offset changed
    ///
    /// If scroll back is visible, the view first snaps to the logical screen. Otherwise,
    /// when the cursor was not drawn last frame, the view catches up to the cursor in the
    /// direction it last moved. Each successful scroll extends the keyboard activity window.
    auto check_cursor_auto_scroll(u32 cursor_row, MoveDirection direction, ViewportGeometry const& geometry,
                                  TimePoint now = dius::SteadyClock::now()) -> bool;

    auto cursor_drawn() const -> bool { return m_cursor_drawn; }
    void set_cursor_drawn(bool drawn) { m_cursor_drawn = drawn; }

    auto auto_scroll_disabled() const -> bool { return m_auto_scroll_disabled; }
    void set_auto_scroll_disabled(bool disabled) { m_auto_scroll_disabled = disabled; }

    auto crop() const -> ScreenCrop const& { return m_crop; }
    void set_crop(ScreenCrop const& crop) { m_crop = crop; }
    void clear_crop() { m_crop = {}; }

private:
    usize m_scroll_offset { 0 };
    ScreenCrop m_crop;
    di::Optional<TimePoint> m_last_keyboard_activity;
    di::Optional<TimePoint> m_last_manual_scroll;
    di::Optional<TimePoint> m_last_scroll_event;
    Duration m_keyboard_window {};
    bool m_cursor_drawn { false };
    bool m_auto_scroll_disabled { false };
};
}
