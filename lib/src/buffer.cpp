#include "termgrid/buffer.h"

namespace termgrid {
BufferState::BufferState(BufferConfig const& config) : screen(config.size, config.max_scroll_back_rows) {
    screen.set_auto_wrap_mode(config.auto_wrap ? terminal::AutoWrapMode::Enabled : terminal::AutoWrapMode::Disabled);
    screen.set_smart_word_wrap(config.smart_word_wrap);
    screen.set_flex_width(config.flex_width);
    screen.set_visual_width_wrap(config.visual_width_wrap);
    screen.set_ambiguous_width_mode(config.ambiguous_width);
}

Buffer::Buffer(BufferConfig const& config) : m_state(di::in_place, config) {}

void Buffer::write_code_point(c32 code_point) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.put_code_point(code_point, state.glyphs);
    });
}

void Buffer::write_string(di::StringView text) {
    m_state.with_lock([&](BufferState& state) {
        for (auto code_point : text) {
            state.screen.put_code_point(code_point, state.glyphs);
        }
    });
}

void Buffer::set_cursor(u32 row, u32 col) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.set_cursor(row, col);
    });
}

void Buffer::move_cursor_up(u32 count) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.move_cursor_up(count);
    });
}

void Buffer::move_cursor_down(u32 count) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.move_cursor_down(count);
    });
}

void Buffer::move_cursor_forward(u32 count) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.move_cursor_forward(count);
    });
}

void Buffer::move_cursor_backward(u32 count) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.move_cursor_backward(count);
    });
}

void Buffer::newline() {
    m_state.with_lock([&](BufferState& state) {
        state.screen.newline();
    });
}

void Buffer::carriage_return() {
    m_state.with_lock([&](BufferState& state) {
        state.screen.carriage_return();
    });
}

void Buffer::line_feed() {
    m_state.with_lock([&](BufferState& state) {
        state.screen.line_feed();
    });
}

void Buffer::tab() {
    m_state.with_lock([&](BufferState& state) {
        state.screen.tab();
    });
}

void Buffer::backspace() {
    m_state.with_lock([&](BufferState& state) {
        state.screen.backspace();
    });
}

void Buffer::save_cursor() {
    m_state.with_lock([&](BufferState& state) {
        state.screen.save_cursor();
    });
}

void Buffer::restore_cursor() {
    m_state.with_lock([&](BufferState& state) {
        state.screen.restore_cursor();
    });
}

void Buffer::set_cursor_visible(bool visible) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.set_cursor_visible(visible);
    });
}

void Buffer::set_cursor_style(CursorShape shape, CursorBlink blink) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.set_cursor_style({ shape, blink });
    });
}

auto Buffer::cursor() const -> terminal::Cursor {
    return m_state.with_read_lock([&](BufferState const& state) {
        return state.screen.cursor();
    });
}

auto Buffer::cursor_style() const -> CursorStyle {
    return cursor().style;
}

auto Buffer::cursor_visible() const -> bool {
    return cursor().visible;
}

auto Buffer::cursor_visible_position() const -> di::Optional<terminal::VisiblePosition> {
    return m_state.with_read_lock([&](BufferState const& state) {
        return state.screen.cursor_visible_position();
    });
}

void Buffer::insert_lines(u32 count) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.insert_lines(count);
    });
}

void Buffer::delete_lines(u32 count) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.delete_lines(count);
    });
}

void Buffer::insert_chars(u32 count) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.insert_chars(count);
    });
}

void Buffer::delete_chars(u32 count) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.delete_chars(count);
    });
}

void Buffer::erase_chars(u32 count) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.erase_chars(count);
    });
}

void Buffer::clear_to_end_of_line() {
    m_state.with_lock([&](BufferState& state) {
        state.screen.clear_row_after_cursor();
    });
}

void Buffer::clear_to_start_of_line() {
    m_state.with_lock([&](BufferState& state) {
        state.screen.clear_row_before_cursor();
    });
}

void Buffer::clear_line() {
    m_state.with_lock([&](BufferState& state) {
        state.screen.clear_row();
    });
}

void Buffer::clear_to_end_of_screen() {
    m_state.with_lock([&](BufferState& state) {
        state.screen.clear_after_cursor();
    });
}

void Buffer::clear_to_start_of_screen() {
    m_state.with_lock([&](BufferState& state) {
        state.screen.clear_before_cursor();
    });
}

void Buffer::clear_screen() {
    m_state.with_lock([&](BufferState& state) {
        state.screen.clear();
    });
}

void Buffer::scroll_up(u32 count) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.scroll_up(count);
    });
}

void Buffer::scroll_down(u32 count) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.scroll_down(count);
    });
}

void Buffer::set_foreground(Color color) {
    update_graphics_rendition([&](GraphicsRendition& rendition) {
        rendition.fg = color;
    });
}

void Buffer::set_background(Color color) {
    update_graphics_rendition([&](GraphicsRendition& rendition) {
        rendition.bg = color;
    });
}

void Buffer::set_bold(bool bold) {
    update_graphics_rendition([&](GraphicsRendition& rendition) {
        rendition.bold = bold;
    });
}

void Buffer::set_italic(bool italic) {
    update_graphics_rendition([&](GraphicsRendition& rendition) {
        rendition.italic = italic;
    });
}

void Buffer::set_underline(bool underline) {
    update_graphics_rendition([&](GraphicsRendition& rendition) {
        rendition.set_underline(underline);
    });
}

void Buffer::set_underline_style(terminal::UnderlineStyle style) {
    update_graphics_rendition([&](GraphicsRendition& rendition) {
        rendition.underline_style = style;
    });
}

void Buffer::set_underline_color(di::Optional<Color> color) {
    update_graphics_rendition([&](GraphicsRendition& rendition) {
        rendition.underline_color = color;
    });
}

void Buffer::set_reverse(bool reverse) {
    update_graphics_rendition([&](GraphicsRendition& rendition) {
        rendition.reverse = reverse;
    });
}

void Buffer::set_blink(bool blink) {
    update_graphics_rendition([&](GraphicsRendition& rendition) {
        rendition.blink = blink;
    });
}

void Buffer::set_strikethrough(bool strikethrough) {
    update_graphics_rendition([&](GraphicsRendition& rendition) {
        rendition.strikethrough = strikethrough;
    });
}

void Buffer::set_base_glyph_palette(di::Optional<u32> palette) {
    update_graphics_rendition([&](GraphicsRendition& rendition) {
        rendition.base_glyph_palette = palette;
    });
}

void Buffer::set_x_flip(bool flip) {
    update_graphics_rendition([&](GraphicsRendition& rendition) {
        rendition.x_flip = flip;
    });
}

void Buffer::set_y_flip(bool flip) {
    update_graphics_rendition([&](GraphicsRendition& rendition) {
        rendition.y_flip = flip;
    });
}

void Buffer::reset_attributes() {
    update_graphics_rendition([&](GraphicsRendition& rendition) {
        rendition.reset_attributes();
    });
}

auto Buffer::graphics_rendition() const -> GraphicsRendition {
    return m_state.with_read_lock([&](BufferState const& state) {
        return state.screen.current_graphics_rendition();
    });
}

void Buffer::set_auto_wrap(bool enabled) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.set_auto_wrap_mode(enabled ? terminal::AutoWrapMode::Enabled : terminal::AutoWrapMode::Disabled);
    });
}

void Buffer::set_smart_word_wrap(bool enabled) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.set_smart_word_wrap(enabled);
    });
}

void Buffer::set_flex_width(bool enabled) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.set_flex_width(enabled);
    });
}

void Buffer::set_visual_width_wrap(bool enabled) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.set_visual_width_wrap(enabled);
    });
}

void Buffer::set_ambiguous_width_mode(AmbiguousWidthMode mode) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.set_ambiguous_width_mode(mode);
    });
}

void Buffer::set_auto_scroll_disabled(bool disabled) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.set_auto_scroll_disabled(disabled);
    });
}

void Buffer::set_scroll_back_disabled(bool disabled) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.set_scroll_back_disabled(disabled);
    });
}

auto Buffer::modes() const -> terminal::ScreenModes {
    return m_state.with_read_lock([&](BufferState const& state) {
        return state.screen.modes();
    });
}

auto Buffer::auto_scroll_disabled() const -> bool {
    return m_state.with_read_lock([&](BufferState const& state) {
        return state.screen.viewport().auto_scroll_disabled();
    });
}

void Buffer::set_line_attribute(terminal::LineAttribute attribute) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.set_line_attribute(attribute);
    });
}

auto Buffer::line_attribute(u32 row) const -> terminal::LineAttribute {
    return m_state.with_read_lock([&](BufferState const& state) {
        return state.screen.line_attribute(row);
    });
}

auto Buffer::line_info(u32 row) const -> terminal::LineInfo {
    return m_state.with_read_lock([&](BufferState const& state) {
        return state.screen.line_info(row);
    });
}

auto Buffer::visible_line_info(u32 row) const -> terminal::LineInfo {
    return m_state.with_read_lock([&](BufferState const& state) {
        return state.screen.visible_line_info(row);
    });
}

auto Buffer::line_visual_width(u32 row, u32 col) const -> f64 {
    return m_state.with_read_lock([&](BufferState const& state) {
        return state.screen.line_visual_width(row, col);
    });
}

auto Buffer::total_line_visual_width(u32 row) const -> f64 {
    return m_state.with_read_lock([&](BufferState const& state) {
        return state.screen.total_line_visual_width(row);
    });
}

auto Buffer::cell(u32 row, u32 col) const -> terminal::Cell {
    return m_state.with_read_lock([&](BufferState const& state) {
        return state.screen.cell(row, col);
    });
}

auto Buffer::visible_cell(u32 row, u32 col) const -> terminal::Cell {
    return m_state.with_read_lock([&](BufferState const& state) {
        return state.screen.visible_cell(row, col);
    });
}

void Buffer::resize(Size const& size) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.resize(size);
    });
}

void Buffer::set_logical_size(Size const& size) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.set_logical_size(size);
    });
}

auto Buffer::size() const -> Size {
    return m_state.with_read_lock([&](BufferState const& state) {
        return state.screen.size();
    });
}

auto Buffer::logical_size() const -> Size {
    return m_state.with_read_lock([&](BufferState const& state) {
        return state.screen.logical_size();
    });
}

auto Buffer::effective_size() const -> Size {
    return m_state.with_read_lock([&](BufferState const& state) {
        return Size { state.screen.max_height(), state.screen.max_width() };
    });
}

void Buffer::set_scroll_offset(usize offset) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.set_scroll_offset(offset);
    });
}

auto Buffer::scroll_offset() const -> usize {
    return m_state.with_read_lock([&](BufferState const& state) {
        return state.screen.scroll_offset();
    });
}

auto Buffer::effective_scroll_offset() const -> usize {
    return m_state.with_read_lock([&](BufferState const& state) {
        return state.screen.effective_scroll_offset();
    });
}

auto Buffer::max_scroll_offset() const -> usize {
    return m_state.with_read_lock([&](BufferState const& state) {
        return state.screen.max_scroll_offset();
    });
}

auto Buffer::normalize_scroll_offset() -> bool {
    return m_state.with_lock([&](BufferState& state) {
        return state.screen.normalize_scroll_offset();
    });
}

auto Buffer::scroll_back_size() const -> usize {
    return m_state.with_read_lock([&](BufferState const& state) {
        return state.screen.scroll_back().total_rows();
    });
}

auto Buffer::scroll_back_boundary_visible_row() const -> di::Optional<u32> {
    return m_state.with_read_lock([&](BufferState const& state) {
        return state.screen.scroll_back_boundary_visible_row();
    });
}

void Buffer::set_max_scroll_back_rows(usize max_rows) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.set_max_scroll_back_rows(max_rows);
    });
}

void Buffer::clear_scroll_back() {
    m_state.with_lock([&](BufferState& state) {
        state.screen.clear_scroll_back();
    });
}

auto Buffer::scroll_back_text() const -> di::String {
    return m_state.with_read_lock([&](BufferState const& state) {
        return state.screen.scroll_back_text();
    });
}

void Buffer::notify_keyboard_activity(TimePoint now) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.notify_keyboard_activity(now);
    });
}

void Buffer::notify_manual_vertical_scroll(TimePoint now) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.notify_manual_vertical_scroll(now);
    });
}

void Buffer::set_cursor_drawn(bool drawn) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.set_cursor_drawn(drawn);
    });
}

auto Buffer::check_cursor_auto_scroll(TimePoint now) -> bool {
    return m_state.with_lock([&](BufferState& state) {
        return state.screen.check_cursor_auto_scroll(now);
    });
}

void Buffer::set_crop(terminal::ScreenCrop const& crop) {
    m_state.with_lock([&](BufferState& state) {
        state.screen.set_crop(crop);
    });
}

void Buffer::clear_crop() {
    m_state.with_lock([&](BufferState& state) {
        state.screen.clear_crop();
    });
}

auto Buffer::crop() const -> terminal::ScreenCrop {
    return m_state.with_read_lock([&](BufferState const& state) {
        return state.screen.viewport().crop();
    });
}

// Palette and glyph changes mark the buffer dirty, since cells which reference them
// render differently afterwards.

void Buffer::init_palette(u32 number, usize length) {
    m_state.with_lock([&](BufferState& state) {
        state.palettes.init_palette(number, length);
        state.screen.invalidate_all();
    });
}

void Buffer::delete_palette(u32 number) {
    m_state.with_lock([&](BufferState& state) {
        state.palettes.delete_palette(number);
        state.screen.invalidate_all();
    });
}

void Buffer::delete_all_palettes() {
    m_state.with_lock([&](BufferState& state) {
        state.palettes.delete_all_palettes();
        state.screen.invalidate_all();
    });
}

void Buffer::set_palette_entry(u32 number, usize index, u32 code, bool dim) {
    m_state.with_lock([&](BufferState& state) {
        state.palettes.set_entry(number, index, code, dim);
        state.screen.invalidate_all();
    });
}

void Buffer::set_palette_entry_color(u32 number, usize index, Color color, bool dim) {
    m_state.with_lock([&](BufferState& state) {
        state.palettes.set_entry_color(number, index, color, dim);
        state.screen.invalidate_all();
    });
}

auto Buffer::palette(u32 number) const -> di::Optional<Palette> {
    return m_state.with_read_lock([&](BufferState const& state) -> di::Optional<Palette> {
        auto palette = state.palettes.palette(number);
        if (!palette) {
            return {};
        }
        return palette.value().clone();
    });
}

auto Buffer::resolve_glyph_color(terminal::Cell const& cell, i32 index) const -> Color {
    return m_state.with_read_lock([&](BufferState const& state) {
        return state.palettes.resolve_glyph_color(cell, index);
    });
}

void Buffer::set_glyph(c32 code_point, u32 width, di::Vector<i32> pixels) {
    m_state.with_lock([&](BufferState& state) {
        state.glyphs.set_glyph(code_point, width, di::move(pixels));
        state.screen.invalidate_all();
    });
}

void Buffer::delete_glyph(c32 code_point) {
    m_state.with_lock([&](BufferState& state) {
        state.glyphs.delete_glyph(code_point);
        state.screen.invalidate_all();
    });
}

void Buffer::delete_all_glyphs() {
    m_state.with_lock([&](BufferState& state) {
        state.glyphs.delete_all_glyphs();
        state.screen.invalidate_all();
    });
}

auto Buffer::glyph(c32 code_point) const -> di::Optional<CustomGlyph> {
    return m_state.with_read_lock([&](BufferState const& state) -> di::Optional<CustomGlyph> {
        auto glyph = state.glyphs.glyph(code_point);
        if (!glyph) {
            return {};
        }
        return glyph.value().clone();
    });
}

auto Buffer::has_custom_glyph(c32 code_point) const -> bool {
    return m_state.with_read_lock([&](BufferState const& state) {
        return state.glyphs.has_custom_glyph(code_point);
    });
}

void Buffer::reset() {
    m_state.with_lock([&](BufferState& state) {
        state.screen.reset();
    });
}

auto Buffer::is_dirty() const -> bool {
    return m_state.with_read_lock([&](BufferState const& state) {
        return state.screen.whole_screen_dirty();
    });
}

void Buffer::mark_dirty() {
    m_state.with_lock([&](BufferState& state) {
        state.screen.invalidate_all();
    });
}

void Buffer::clear_dirty() {
    m_state.with_lock([&](BufferState& state) {
        state.screen.clear_whole_screen_dirty_flag();
    });
}
}
