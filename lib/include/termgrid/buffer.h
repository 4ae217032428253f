#pragma once

#include "di/container/string/prelude.h"
#include "di/container/vector/vector.h"
#include "di/reflect/prelude.h"
#include "di/vocab/optional/prelude.h"
#include "termgrid/color.h"
#include "termgrid/custom_glyph.h"
#include "termgrid/palette.h"
#include "termgrid/shared_synchronized.h"
#include "termgrid/size.h"
#include "termgrid/terminal/screen.h"

namespace termgrid {
/// @brief Initial settings for a Buffer
struct BufferConfig {
    Size size { 24, 80 };
    usize max_scroll_back_rows { terminal::ScrollBack::default_max_rows };
    bool auto_wrap { true };
    bool smart_word_wrap { true };
    bool flex_width { false };
    bool visual_width_wrap { false };
    AmbiguousWidthMode ambiguous_width { AmbiguousWidthMode::Auto };

    auto operator==(BufferConfig const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<BufferConfig>) {
        return di::make_fields<"BufferConfig">(
            di::field<"size", &BufferConfig::size>,
            di::field<"max_scroll_back_rows", &BufferConfig::max_scroll_back_rows>,
            di::field<"auto_wrap", &BufferConfig::auto_wrap>,
            di::field<"smart_word_wrap", &BufferConfig::smart_word_wrap>,
            di::field<"flex_width", &BufferConfig::flex_width>,
            di::field<"visual_width_wrap", &BufferConfig::visual_width_wrap>,
            di::field<"ambiguous_width", &BufferConfig::ambiguous_width>);
    }
};

/// @brief Everything guarded by the buffer's lock
struct BufferState {
    explicit BufferState(BufferConfig const& config);

    terminal::Screen screen;
    PaletteStore palettes;
    GlyphStore glyphs;
};

/// @brief Thread-safe terminal buffer
///
/// The buffer is driven by an escape sequence interpreter on one thread and read by a
/// renderer on another. All state lives behind a single reader/writer lock, which every
/// operation holds for its full duration. Mutations take it exclusively, while queries only
/// take a shared hold, so readers never block each other. Queries return copies, so callers
/// never observe state without holding the lock.
class Buffer {
public:
    using TimePoint = terminal::Screen::TimePoint;

    explicit Buffer(BufferConfig const& config = {});

    // Writing
    void write_code_point(c32 code_point);
    void write_string(di::StringView text);

    // Cursor
    void set_cursor(u32 row, u32 col);
    void move_cursor_up(u32 count = 1);
    void move_cursor_down(u32 count = 1);
    void move_cursor_forward(u32 count = 1);
    void move_cursor_backward(u32 count = 1);
    void newline();
    void carriage_return();
    void line_feed();
    void tab();
    void backspace();
    void save_cursor();
    void restore_cursor();
    void set_cursor_visible(bool visible);
    void set_cursor_style(CursorShape shape, CursorBlink blink);

    auto cursor() const -> terminal::Cursor;
    auto cursor_style() const -> CursorStyle;
    auto cursor_visible() const -> bool;
    auto cursor_visible_position() const -> di::Optional<terminal::VisiblePosition>;

    // Editing
    void insert_lines(u32 count);
    void delete_lines(u32 count);
    void insert_chars(u32 count);
    void delete_chars(u32 count);
    void erase_chars(u32 count);
    void clear_to_end_of_line();
    void clear_to_start_of_line();
    void clear_line();
    void clear_to_end_of_screen();
    void clear_to_start_of_screen();
    void clear_screen();
    void scroll_up(u32 count = 1);
    void scroll_down(u32 count = 1);

    // Attributes
    void set_foreground(Color color);
    void set_background(Color color);
    void set_bold(bool bold);
    void set_italic(bool italic);
    void set_underline(bool underline);
    void set_underline_style(terminal::UnderlineStyle style);
    void set_underline_color(di::Optional<Color> color);
    void set_reverse(bool reverse);
    void set_blink(bool blink);
    void set_strikethrough(bool strikethrough);
    void set_base_glyph_palette(di::Optional<u32> palette);
    void set_x_flip(bool flip);
    void set_y_flip(bool flip);
    void reset_attributes();
    auto graphics_rendition() const -> GraphicsRendition;

    // Modes
    void set_auto_wrap(bool enabled);
    void set_smart_word_wrap(bool enabled);
    void set_flex_width(bool enabled);
    void set_visual_width_wrap(bool enabled);
    void set_ambiguous_width_mode(AmbiguousWidthMode mode);
    void set_auto_scroll_disabled(bool disabled);
    void set_scroll_back_disabled(bool disabled);
    auto modes() const -> terminal::ScreenModes;
    auto auto_scroll_disabled() const -> bool;

    // Lines
    void set_line_attribute(terminal::LineAttribute attribute);
    auto line_attribute(u32 row) const -> terminal::LineAttribute;
    auto line_info(u32 row) const -> terminal::LineInfo;
    auto visible_line_info(u32 row) const -> terminal::LineInfo;
    auto line_visual_width(u32 row, u32 col) const -> f64;
    auto total_line_visual_width(u32 row) const -> f64;

    // Cells
    auto cell(u32 row, u32 col) const -> terminal::Cell;
    auto visible_cell(u32 row, u32 col) const -> terminal::Cell;

    // Geometry
    void resize(Size const& size);
    void set_logical_size(Size const& size);
    auto size() const -> Size;
    auto logical_size() const -> Size;
    auto effective_size() const -> Size;

    // Scroll back and viewport
    void set_scroll_offset(usize offset);
    auto scroll_offset() const -> usize;
    auto effective_scroll_offset() const -> usize;
    auto max_scroll_offset() const -> usize;
    auto normalize_scroll_offset() -> bool;
    auto scroll_back_size() const -> usize;
    auto scroll_back_boundary_visible_row() const -> di::Optional<u32>;
    void set_max_scroll_back_rows(usize max_rows);
    void clear_scroll_back();
    auto scroll_back_text() const -> di::String;

    // Auto-scroll signals
    void notify_keyboard_activity(TimePoint now = dius::SteadyClock::now());
    void notify_manual_vertical_scroll(TimePoint now = dius::SteadyClock::now());
    void set_cursor_drawn(bool drawn);
    auto check_cursor_auto_scroll(TimePoint now = dius::SteadyClock::now()) -> bool;

    // Crop
    void set_crop(terminal::ScreenCrop const& crop);
    void clear_crop();
    auto crop() const -> terminal::ScreenCrop;

    // Palettes
    void init_palette(u32 number, usize length);
    void delete_palette(u32 number);
    void delete_all_palettes();
    void set_palette_entry(u32 number, usize index, u32 code, bool dim);
    void set_palette_entry_color(u32 number, usize index, Color color, bool dim);
    auto palette(u32 number) const -> di::Optional<Palette>;
    auto resolve_glyph_color(terminal::Cell const& cell, i32 index) const -> Color;

    // Custom glyphs
    void set_glyph(c32 code_point, u32 width, di::Vector<i32> pixels);
    void delete_glyph(c32 code_point);
    void delete_all_glyphs();
    auto glyph(c32 code_point) const -> di::Optional<CustomGlyph>;
    auto has_custom_glyph(c32 code_point) const -> bool;

    // Lifecycle
    void reset();
    auto is_dirty() const -> bool;
    void mark_dirty();
    void clear_dirty();

private:
    template<typename F>
    void update_graphics_rendition(F&& update) {
        m_state.with_lock([&](BufferState& state) {
            auto rendition = state.screen.current_graphics_rendition();
            update(rendition);
            state.screen.set_current_graphics_rendition(rendition);
        });
    }

    SharedSynchronized<BufferState> m_state;
};
}
