#include "termgrid/terminal/viewport.h"

#include "di/util/clamp.h"

namespace termgrid::terminal {
void Viewport::set_scroll_offset(usize offset, ViewportGeometry const& geometry) {
    m_scroll_offset = di::min(offset, max_scroll_offset(geometry));
}

auto Viewport::magnetic_threshold(ViewportGeometry const& geometry) const -> usize {
    auto total = geometry.scroll_back_rows + geometry.hidden_above();
    return di::clamp(total * 5 / 100, 2_usize, 50_usize);
}

auto Viewport::effective_scroll_offset(ViewportGeometry const& geometry) const -> usize {
    auto hidden = geometry.hidden_above();
    if (m_scroll_offset <= hidden) {
        return m_scroll_offset;
    }

    // Inside the magnetic zone the view sticks to the boundary. Past it, the view
    // lags behind the raw offset by the zone's size.
    auto threshold = magnetic_threshold(geometry);
    auto into_scroll_back = m_scroll_offset - hidden;
    if (into_scroll_back <= threshold) {
        return hidden;
    }
    return m_scroll_offset - threshold;
}

auto Viewport::max_scroll_offset(ViewportGeometry const& geometry) const -> usize {
    auto hidden = geometry.hidden_above();
    if (geometry.scroll_back_disabled) {
        return hidden;
    }
    auto result = geometry.scroll_back_rows + hidden;
    if (geometry.scroll_back_rows > 0) {
        result += magnetic_threshold(geometry);
    }
    return result;
}

auto Viewport::normalize_scroll_offset(ViewportGeometry const& geometry) -> bool {
    auto hidden = geometry.hidden_above();
    if (m_scroll_offset <= hidden) {
        return false;
    }
    if (m_scroll_offset - hidden <= magnetic_threshold(geometry)) {
        m_scroll_offset = hidden;
        return true;
    }
    return false;
}

auto Viewport::scroll_back_boundary_visible_row(ViewportGeometry const& geometry) const -> di::Optional<u32> {
    if (geometry.scroll_back_rows == 0) {
        return {};
    }

    auto hidden = geometry.hidden_above();
    auto threshold = magnetic_threshold(geometry);
    if (m_scroll_offset <= hidden + threshold) {
        return {};
    }

    auto row = m_scroll_offset - hidden - threshold;
    if (row >= geometry.visible_rows) {
        return {};
    }
    return u32(row);
}

auto Viewport::absolute_row(u32 visible_row, ViewportGeometry const& geometry) const -> usize {
    auto top = geometry.scroll_back_rows + geometry.hidden_above();
    auto offset = di::min(effective_scroll_offset(geometry), top);
    return top - offset + visible_row;
}

auto Viewport::visible_row_for(u32 screen_row, ViewportGeometry const& geometry) const -> di::Optional<u32> {
    // visible = screen_row - hidden + offset, computed without going negative.
    auto shifted = usize(screen_row) + effective_scroll_offset(geometry);
    auto hidden = geometry.hidden_above();
    if (shifted < hidden || shifted - hidden >= geometry.visible_rows) {
        return {};
    }
    return u32(shifted - hidden);
}

auto Viewport::auto_scroll_active(TimePoint now) const -> bool {
    if (!m_last_keyboard_activity) {
        return false;
    }
    auto keyboard = m_last_keyboard_activity.value();
    if (now >= keyboard + m_keyboard_window) {
        return false;
    }

    // A manual scroll at or after the last keystroke takes precedence.
    if (m_last_manual_scroll && m_last_manual_scroll.value() >= keyboard) {
        return false;
    }
    return true;
}

auto Viewport::check_cursor_auto_scroll(u32 cursor_row, MoveDirection direction, ViewportGeometry const& geometry,
                                        TimePoint now) -> bool {
    if (m_auto_scroll_disabled || !auto_scroll_active(now)) {
        return false;
    }

    // 1. Scroll back is always forced out of view before following the cursor.
    auto hidden = geometry.hidden_above();
    if (m_scroll_offset > hidden) {
        m_scroll_offset = hidden;
        m_last_keyboard_activity = now;
        return true;
    }

    // 2. Nothing to do if the cursor is already visible.
    if (m_cursor_drawn) {
        return false;
    }

    // 3. Catch up to the cursor. Within the logical screen the effective offset is the raw offset.
    auto visible_row = i64(cursor_row) - i64(hidden) + i64(m_scroll_offset);
    auto rows = i64(geometry.visible_rows);
    switch (direction) {
        case MoveDirection::Forward: {
            auto amount = 0_i64;
            if (visible_row >= rows) {
                amount = visible_row - rows + 1;
            } else if (m_scroll_offset > 0) {
                amount = 1;
            }
            if (amount <= 0 || m_scroll_offset == 0) {
                return false;
            }
            m_scroll_offset -= di::min(usize(amount), m_scroll_offset);
            break;
        }
        case MoveDirection::Backward: {
            auto amount = 0_i64;
            if (visible_row < 0) {
                amount = -visible_row;
            } else if (m_scroll_offset < hidden) {
                amount = 1;
            }
            if (amount <= 0 || m_scroll_offset >= hidden) {
                return false;
            }
            m_scroll_offset += di::min(usize(amount), hidden - m_scroll_offset);
            break;
        }
        case MoveDirection::None:
            return false;
    }

    m_last_keyboard_activity = now;
    return true;
}
}
