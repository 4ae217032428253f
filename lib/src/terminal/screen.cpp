#include "termgrid/terminal/screen.h"

#include "di/container/algorithm/rotate.h"
#include "di/util/clamp.h"
#include "di/util/unreachable.h"

namespace termgrid::terminal {
static auto is_word_boundary(c32 code_point) -> bool {
    return code_point == U' ' || code_point == U'-' || code_point == U',' || code_point == U';' ||
           code_point == U'\u2014';
}

static auto sanitize(Size const& size) -> Size {
    return { di::max(size.rows, 1_u32), di::max(size.cols, 1_u32) };
}

Screen::Screen(Size const& size, usize max_scroll_back_rows)
    : m_size(sanitize(size)), m_scroll_back(max_scroll_back_rows) {
    init_rows();
}

auto Screen::geometry() const -> ViewportGeometry {
    return { m_size.rows, max_height(), m_scroll_back.total_rows(), m_modes.scroll_back_disabled };
}

void Screen::init_rows() {
    m_rows.clear();
    for (auto _ : di::range(max_height())) {
        m_rows.push_back(empty_row());
    }
}

void Screen::resize(Size const& requested) {
    auto size = sanitize(requested);
    if (size == m_size) {
        return;
    }

    // Whether the user was looking at the scroll back must be decided with the old geometry.
    auto was_viewing_scroll_back = m_viewport.scroll_offset() > geometry().hidden_above();

    m_size = size;
    if (m_logical_size.rows == 0) {
        adjust_rows_for_resize(size.rows);
    }
    clamp_cursor();

    auto new_geometry = geometry();
    if (!was_viewing_scroll_back && m_viewport.scroll_offset() > new_geometry.hidden_above()) {
        m_viewport.reset_scroll_offset(new_geometry.hidden_above());
    }
    m_viewport.set_scroll_offset(m_viewport.scroll_offset(), new_geometry);

    // Rows may have moved into the scroll back and the offset may have been clamped, so
    // every visible row has to be redrawn, even when the user stays in the scroll back.
    invalidate_all();
}

void Screen::adjust_rows_for_resize(u32 target_rows) {
    if (m_rows.size() < target_rows) {
        for (auto _ : di::range(target_rows - m_rows.size())) {
            m_rows.push_back(empty_row());
        }
        return;
    }

    // Keep the last row with content on screen by moving rows above it into the scroll back.
    auto last = last_content_row();
    auto to_push = (last && last.value() >= target_rows) ? last.value() - target_rows + 1 : 0_u32;
    for (auto _ : di::range(to_push)) {
        auto row = di::move(m_rows[0]);
        m_rows.pop_front();
        push_to_scroll_back(di::move(row));
    }
    if (to_push > 0) {
        auto new_row = m_cursor.row > to_push ? m_cursor.row - to_push : 0_u32;
        track_vertical_move(new_row);
        m_cursor.row = new_row;
    }

    if (m_rows.size() > target_rows) {
        m_rows.erase(m_rows.iterator(target_rows), m_rows.end());
    }
    while (m_rows.size() < target_rows) {
        m_rows.push_back(empty_row());
    }
}

void Screen::set_logical_size(Size const& size) {
    m_logical_size = size;
    m_modes.smart_word_wrap = size.cols == 0;

    auto target = max_height();
    if (m_rows.size() < target) {
        for (auto _ : di::range(target - m_rows.size())) {
            m_rows.push_back(screen_row());
        }
    } else if (m_rows.size() > target) {
        shrink_logical_rows(target);
    }
    ASSERT_EQ(m_rows.size(), target);

    clamp_cursor();
    m_viewport.set_scroll_offset(m_viewport.scroll_offset(), geometry());
    invalidate_all();
}

void Screen::shrink_logical_rows(u32 target_rows) {
    auto last = last_content_row();
    if (!last) {
        m_rows.erase(m_rows.iterator(target_rows), m_rows.end());
        return;
    }

    // Rows above the new top go to the scroll back, so the content keeps its place relative
    // to the bottom of the screen. The cursor moves with the content.
    auto new_top = last.value() >= target_rows ? last.value() - target_rows + 1 : 0_u32;
    for (auto _ : di::range(new_top)) {
        auto row = di::move(m_rows[0]);
        m_rows.pop_front();
        push_to_scroll_back(di::move(row));
    }
    if (new_top > 0) {
        auto new_row = m_cursor.row > new_top ? m_cursor.row - new_top : 0_u32;
        track_vertical_move(new_row);
        m_cursor.row = new_row;
    }

    if (m_rows.size() > target_rows) {
        m_rows.erase(m_rows.iterator(target_rows), m_rows.end());
    }
    while (m_rows.size() < target_rows) {
        m_rows.push_back(screen_row());
    }
}

auto Screen::last_content_row() const -> di::Optional<u32> {
    for (auto row = u32(m_rows.size()); row > 0; row--) {
        if (!m_rows[row - 1].cells.empty()) {
            return row - 1;
        }
    }
    return {};
}

void Screen::clamp_cursor() {
    if (m_cursor.col >= max_width()) {
        m_cursor.col = max_width() - 1;
    }
    if (m_cursor.row >= max_height()) {
        track_vertical_move(max_height() - 1);
        m_cursor.row = max_height() - 1;
    }
}

void Screen::set_current_graphics_rendition(GraphicsRendition const& rendition) {
    m_graphics_rendition = rendition;
    invalidate_all();
}

void Screen::set_auto_wrap_mode(AutoWrapMode mode) {
    m_modes.auto_wrap = mode;
    invalidate_all();
}

void Screen::set_smart_word_wrap(bool enabled) {
    m_modes.smart_word_wrap = enabled;
    invalidate_all();
}

void Screen::set_flex_width(bool enabled) {
    m_modes.flex_width = enabled;
    invalidate_all();
}

void Screen::set_visual_width_wrap(bool enabled) {
    m_modes.visual_width_wrap = enabled;
    invalidate_all();
}

void Screen::set_ambiguous_width_mode(AmbiguousWidthMode mode) {
    m_modes.ambiguous_width = mode;
    invalidate_all();
}

void Screen::set_scroll_back_disabled(bool disabled) {
    m_modes.scroll_back_disabled = disabled;
    if (disabled) {
        m_viewport.reset_scroll_offset();
    }
    invalidate_all();
}

void Screen::track_vertical_move(u32 new_row) {
    if (new_row > m_cursor.row) {
        m_cursor.vertical_direction = MoveDirection::Forward;
    } else if (new_row < m_cursor.row) {
        m_cursor.vertical_direction = MoveDirection::Backward;
    }
}

void Screen::set_horizontal_direction(MoveDirection direction, bool absolute) {
    m_cursor.horizontal_direction = direction;
    m_cursor.absolute_position = absolute;
}

void Screen::set_cursor(u32 row, u32 col) {
    auto new_row = di::min(row, max_height() - 1);
    track_vertical_move(new_row);
    m_cursor.row = new_row;
    m_cursor.col = di::min(col, max_width() - 1);
    set_horizontal_direction(MoveDirection::None, true);
    invalidate_all();
}

void Screen::move_cursor_up(u32 count) {
    auto new_row = m_cursor.row > count ? m_cursor.row - count : 0_u32;
    track_vertical_move(new_row);
    m_cursor.row = new_row;
    invalidate_all();
}

void Screen::move_cursor_down(u32 count) {
    auto new_row = u32(di::min(u64(m_cursor.row) + count, u64(max_height() - 1)));
    track_vertical_move(new_row);
    m_cursor.row = new_row;
    invalidate_all();
}

void Screen::move_cursor_forward(u32 count) {
    set_horizontal_direction(MoveDirection::Forward, false);
    m_cursor.col = u32(di::min(u64(m_cursor.col) + count, u64(max_width() - 1)));
    invalidate_all();
}

void Screen::move_cursor_backward(u32 count) {
    set_horizontal_direction(MoveDirection::Backward, false);
    m_cursor.col = m_cursor.col > count ? m_cursor.col - count : 0_u32;
    invalidate_all();
}

void Screen::set_cursor_visible(bool visible) {
    m_cursor.visible = visible;
    invalidate_all();
}

void Screen::set_cursor_style(CursorStyle const& style) {
    m_cursor.style = style;
    invalidate_all();
}

void Screen::save_cursor() {
    m_saved_cursor = { m_cursor.row, m_cursor.col };
}

void Screen::restore_cursor() {
    m_cursor.col = m_saved_cursor.col;
    track_vertical_move(m_saved_cursor.row);
    m_cursor.row = m_saved_cursor.row;

    // The saved position may predate a resize.
    clamp_cursor();
    invalidate_all();
}

void Screen::advance_row() {
    track_vertical_move(m_cursor.row + 1);
    if (m_cursor.row + 1 >= max_height()) {
        scroll_up_one();
        m_cursor.row = max_height() - 1;
    } else {
        m_cursor.row++;
    }
}

void Screen::newline() {
    m_cursor.col = 0;
    advance_row();
    invalidate_all();
}

void Screen::carriage_return() {
    set_horizontal_direction(MoveDirection::Backward, false);
    m_cursor.col = 0;
    invalidate_all();
}

void Screen::line_feed() {
    advance_row();
    invalidate_all();
}

void Screen::tab() {
    set_horizontal_direction(MoveDirection::Forward, false);
    m_cursor.col = di::min((m_cursor.col / 8 + 1) * 8, max_width() - 1);
    invalidate_all();
}

void Screen::backspace() {
    set_horizontal_direction(MoveDirection::Backward, false);
    if (m_cursor.col > 0) {
        m_cursor.col--;
    }
    invalidate_all();
}

void Screen::ensure_line_length(u32 row, u32 length) {
    auto& row_object = m_rows[row];
    auto fill = row_object.info.default_cell.blanked();
    while (row_object.cells.size() < length) {
        row_object.cells.push_back(fill);
    }
}

auto Screen::previous_cell() -> di::Optional<Cell&> {
    if (m_cursor.col == 0) {
        if (m_cursor.row == 0) {
            return {};
        }
        return m_rows[m_cursor.row - 1].cells.back();
    }

    auto& cells = m_rows[m_cursor.row].cells;
    if (m_cursor.col - 1 >= cells.size()) {
        return {};
    }
    return cells[m_cursor.col - 1];
}

auto Screen::previous_cell_width() -> f64 {
    auto cell = previous_cell();
    if (cell && cell->flex_width && cell->width > 0) {
        return cell->width;
    }
    return 1.0;
}

auto Screen::code_point_width(c32 code_point, bool has_custom_glyph) -> f64 {
    if (!m_modes.flex_width) {
        return 1.0;
    }

    // A custom glyph's width is forced by an explicit ambiguous width mode, even if the
    // underlying character has a definite width.
    if (has_custom_glyph) {
        switch (m_modes.ambiguous_width) {
            case AmbiguousWidthMode::Narrow:
                return 1.0;
            case AmbiguousWidthMode::Wide:
                return 2.0;
            case AmbiguousWidthMode::Auto:
                break;
        }
    }

    auto width = east_asian_display_width(code_point);
    if (width > 0) {
        return width;
    }
    switch (m_modes.ambiguous_width) {
        case AmbiguousWidthMode::Narrow:
            return 1.0;
        case AmbiguousWidthMode::Wide:
            return 2.0;
        case AmbiguousWidthMode::Auto:
            return previous_cell_width();
    }
    di::unreachable();
}

auto Screen::line_visual_width(u32 row, u32 col) const -> f64 {
    if (row >= m_rows.size()) {
        return 0.0;
    }
    auto const& cells = m_rows[row].cells;
    auto width = 0.0;
    for (auto const& cell : cells | di::take(col)) {
        width += cell.width > 0 ? cell.width : 1.0;
    }
    return width;
}

auto Screen::total_line_visual_width(u32 row) const -> f64 {
    if (row >= m_rows.size()) {
        return 0.0;
    }
    return line_visual_width(row, u32(m_rows[row].cells.size()));
}

void Screen::wrap_at_word_boundary() {
    auto& cells = m_rows[m_cursor.row].cells;

    auto indent = 0_usize;
    while (indent < cells.size() && cells[indent].code_point == U' ') {
        indent++;
    }

    // Search backwards for a break point which is past the indent.
    auto boundary = di::Optional<usize> {};
    for (auto i = cells.size(); i > indent + 1;) {
        i--;
        if (is_word_boundary(cells[i].code_point)) {
            boundary = i;
            break;
        }
    }

    // Move the partial word after the break point. A break point in the last cell means
    // the line ended on a word boundary, so there's nothing to carry.
    auto carried = di::Vector<Cell> {};
    if (boundary && boundary.value() + 1 < cells.size()) {
        for (auto const& cell : cells | di::drop(boundary.value() + 1)) {
            carried.push_back(cell);
        }
        cells.erase(cells.begin() + boundary.value() + 1, cells.end());
    }

    set_horizontal_direction(MoveDirection::Backward, false);
    advance_row();

    // The indent is made of plain spaces, not the current attributes.
    auto& next = m_rows[m_cursor.row].cells;
    next.insert_container(next.begin(), di::repeat(Cell {}, indent));
    next.insert_container(next.begin() + indent, carried);
    m_cursor.col = u32(indent + carried.size());
}

void Screen::put_code_point(c32 code_point, GlyphStore const& glyphs) {
    // 1. Combining marks attach to the previous cell instead of taking a new one.
    if (is_combining_mark(code_point)) {
        if (auto cell = previous_cell()) {
            cell->add_combining_mark(code_point);
            invalidate_all();
        }
        return;
    }

    // 2. Determine the width of the new cell.
    auto width = code_point_width(code_point, glyphs.has_custom_glyph(code_point));

    // 3. Wrap if the character doesn't fit.
    auto const cols = max_width();
    auto should_wrap = (m_modes.visual_width_wrap && m_modes.flex_width)
                           ? line_visual_width(m_cursor.row, m_cursor.col) + width > f64(cols)
                           : m_cursor.col >= cols;
    if (should_wrap) {
        if (m_modes.auto_wrap == AutoWrapMode::Disabled) {
            m_cursor.col = cols - 1;
        } else if (m_modes.smart_word_wrap) {
            wrap_at_word_boundary();
        } else {
            set_horizontal_direction(MoveDirection::Backward, false);
            m_cursor.col = 0;
            advance_row();
        }
    }

    // 4. Store the cell, growing the row as needed.
    ensure_line_length(m_cursor.row, m_cursor.col + 1);
    m_rows[m_cursor.row].cells[m_cursor.col] =
        m_graphics_rendition.make_cell(code_point, width, m_modes.flex_width);
    if (!should_wrap) {
        set_horizontal_direction(MoveDirection::Forward, false);
    }
    m_cursor.col++;
    invalidate_all();
}

void Screen::push_to_scroll_back(Row row) {
    if (m_modes.scroll_back_disabled) {
        return;
    }
    if (m_scroll_back.add_row(di::move(row))) {
        m_viewport.on_scroll_back_evicted();
    }
}

void Screen::scroll_up_one() {
    auto row = di::move(m_rows[0]);
    m_rows.pop_front();
    push_to_scroll_back(di::move(row));
    m_viewport.record_scroll_event();

    m_rows.push_back(empty_row());
    m_cursor.vertical_direction = MoveDirection::Forward;
    invalidate_all();
}

void Screen::scroll_up(u32 count) {
    // Past a full screen every scroll only adds blank rows to the scroll back.
    for (auto _ : di::range(di::min(count, max_height()))) {
        scroll_up_one();
    }
}

void Screen::scroll_down(u32 count) {
    count = di::min(count, max_height());
    m_rows.erase(m_rows.iterator(max_height() - count), m_rows.end());
    m_rows.insert_container(m_rows.begin(), di::range(count) | di::transform([&](auto) {
                                                return empty_row();
                                            }));
    invalidate_all();
}

void Screen::insert_lines(u32 count) {
    auto const row = m_cursor.row;
    count = di::min(count, max_height() - row);

    // Drop rows off the bottom, then open up space at the cursor.
    m_rows.erase(m_rows.iterator(max_height() - count), m_rows.end());
    m_rows.insert_container(m_rows.iterator(row), di::range(count) | di::transform([&](auto) {
                                                      return empty_row();
                                                  }));
    invalidate_all();
}

void Screen::delete_lines(u32 count) {
    auto const row = m_cursor.row;
    count = di::min(count, max_height() - row);

    for (auto i : di::range(row, row + count)) {
        m_rows[i] = empty_row();
    }
    di::rotate(m_rows.iterator(row), m_rows.iterator(row + count), m_rows.end());
    invalidate_all();
}

void Screen::insert_chars(u32 count) {
    ensure_line_length(m_cursor.row, m_cursor.col);

    auto& cells = m_rows[m_cursor.row].cells;
    cells.insert_container(cells.begin() + m_cursor.col, di::repeat(m_graphics_rendition.blank_cell(), count));
    invalidate_all();
}

void Screen::delete_chars(u32 count) {
    auto& cells = m_rows[m_cursor.row].cells;
    if (m_cursor.col >= cells.size()) {
        return;
    }

    auto end = di::min(usize(m_cursor.col) + count, cells.size());
    cells.erase(cells.begin() + m_cursor.col, cells.begin() + end);
    invalidate_all();
}

void Screen::erase_chars(u32 count) {
    auto& cells = m_rows[m_cursor.row].cells;
    if (m_cursor.col >= cells.size()) {
        return;
    }

    auto blank = m_graphics_rendition.blank_cell();
    auto end = di::min(usize(m_cursor.col) + count, cells.size());
    for (auto& cell : cells | di::drop(m_cursor.col) | di::take(end - m_cursor.col)) {
        cell = blank;
    }
    invalidate_all();
}

void Screen::clear_row_after_cursor() {
    auto& row = m_rows[m_cursor.row];
    row.info.default_cell = m_graphics_rendition.blank_cell();
    if (m_cursor.col < row.cells.size()) {
        row.cells.erase(row.cells.begin() + m_cursor.col, row.cells.end());
    }
    invalidate_all();
}

void Screen::clear_row_before_cursor() {
    auto& cells = m_rows[m_cursor.row].cells;
    if (!cells.empty()) {
        auto blank = m_graphics_rendition.blank_cell();
        auto end = di::min(usize(m_cursor.col), cells.size() - 1);
        for (auto& cell : cells | di::take(end + 1)) {
            cell = blank;
        }
    }
    invalidate_all();
}

void Screen::clear_row() {
    auto& row = m_rows[m_cursor.row];
    row.info.default_cell = m_graphics_rendition.blank_cell();
    row.cells.clear();
    invalidate_all();
}

void Screen::clear_after_cursor() {
    m_screen_default_cell = m_graphics_rendition.blank_cell();
    clear_row_after_cursor();
    for (auto row : di::range(m_cursor.row + 1, max_height())) {
        m_rows[row] = empty_row();
    }
    invalidate_all();
}

void Screen::clear_before_cursor() {
    for (auto row : di::range(m_cursor.row)) {
        m_rows[row] = empty_row();
    }
    clear_row_before_cursor();
}

void Screen::clear() {
    m_screen_default_cell = m_graphics_rendition.blank_cell();
    init_rows();

    track_vertical_move(0);
    m_cursor.row = 0;
    m_cursor.col = 0;

    // Show the top of the logical screen.
    m_viewport.reset_scroll_offset(geometry().hidden_above());
    invalidate_all();
}

void Screen::set_line_attribute(LineAttribute attribute) {
    m_rows[m_cursor.row].info.attribute = attribute;
    invalidate_all();
}

auto Screen::cell(u32 row, u32 col) const -> Cell {
    if (row >= m_rows.size()) {
        return m_screen_default_cell;
    }
    return m_rows[row].cell_or_default(col);
}

auto Screen::line_info(u32 row) const -> LineInfo {
    if (row >= m_rows.size()) {
        return {};
    }
    return m_rows[row].info;
}

auto Screen::line_attribute(u32 row) const -> LineAttribute {
    if (row >= m_rows.size()) {
        return LineAttribute::Normal;
    }
    return m_rows[row].info.attribute;
}

auto Screen::visible_cell(u32 row, u32 col) const -> Cell {
    if (row >= m_size.rows) {
        return m_screen_default_cell;
    }

    auto absolute = m_viewport.absolute_row(row, geometry());
    if (absolute < m_scroll_back.total_rows()) {
        return m_scroll_back.row(absolute).cell_or_default(col);
    }
    return cell(u32(absolute - m_scroll_back.total_rows()), col);
}

auto Screen::visible_line_info(u32 row) const -> LineInfo {
    auto fallback = LineInfo { LineAttribute::Normal, m_screen_default_cell };
    if (row >= m_size.rows) {
        return fallback;
    }

    auto absolute = m_viewport.absolute_row(row, geometry());
    if (absolute < m_scroll_back.total_rows()) {
        return m_scroll_back.row(absolute).info;
    }
    auto screen_row = absolute - m_scroll_back.total_rows();
    if (screen_row >= m_rows.size()) {
        return fallback;
    }
    return m_rows[screen_row].info;
}

auto Screen::cursor_visible_position() const -> di::Optional<VisiblePosition> {
    if (m_cursor.col >= m_size.cols) {
        return {};
    }
    auto row = m_viewport.visible_row_for(m_cursor.row, geometry());
    if (!row) {
        return {};
    }
    return VisiblePosition { row.value(), m_cursor.col };
}

void Screen::clear_scroll_back() {
    m_scroll_back.clear();
    m_viewport.reset_scroll_offset();
    invalidate_all();
}

void Screen::set_max_scroll_back_rows(usize max_rows) {
    auto evicted = m_scroll_back.set_max_rows(max_rows);
    for (auto _ : di::range(evicted)) {
        m_viewport.on_scroll_back_evicted();
    }
    m_viewport.set_scroll_offset(m_viewport.scroll_offset(), geometry());
    invalidate_all();
}

void Screen::set_scroll_offset(usize offset) {
    m_viewport.set_scroll_offset(offset, geometry());
    invalidate_all();
}

auto Screen::normalize_scroll_offset() -> bool {
    if (!m_viewport.normalize_scroll_offset(geometry())) {
        return false;
    }
    invalidate_all();
    return true;
}

void Screen::notify_keyboard_activity(TimePoint now) {
    m_viewport.notify_keyboard_activity(now);
}

void Screen::notify_manual_vertical_scroll(TimePoint now) {
    m_viewport.notify_manual_vertical_scroll(now);
}

void Screen::set_cursor_drawn(bool drawn) {
    m_viewport.set_cursor_drawn(drawn);
}

void Screen::set_auto_scroll_disabled(bool disabled) {
    m_viewport.set_auto_scroll_disabled(disabled);
}

auto Screen::check_cursor_auto_scroll(TimePoint now) -> bool {
    if (!m_viewport.check_cursor_auto_scroll(m_cursor.row, m_cursor.vertical_direction, geometry(), now)) {
        return false;
    }
    invalidate_all();
    return true;
}

void Screen::set_crop(ScreenCrop const& crop) {
    m_viewport.set_crop(crop);
    invalidate_all();
}

void Screen::clear_crop() {
    m_viewport.clear_crop();
    invalidate_all();
}

void Screen::reset() {
    for (auto& row : m_rows) {
        if (!row.cells.empty()) {
            push_to_scroll_back(di::move(row));
        }
    }

    m_graphics_rendition = {};
    m_screen_default_cell = {};
    m_modes = {};
    init_rows();

    m_cursor = {};
    m_saved_cursor = {};

    m_viewport.reset_scroll_offset();
    m_viewport.set_auto_scroll_disabled(false);
    invalidate_all();
}

auto Screen::scroll_back_text() const -> di::String {
    auto result = di::String {};
    auto append_row = [&](Row const& row) {
        for (auto const& cell : row.cells) {
            if (cell.code_point != 0) {
                result.push_back(cell.code_point);
            }
            for (auto mark : cell.combining()) {
                result.push_back(mark);
            }
        }
        result.push_back(U'\n');
    };

    for (auto const& row : m_scroll_back.rows()) {
        append_row(row);
    }
    for (auto const& row : m_rows) {
        append_row(row);
    }
    return result;
}
}
