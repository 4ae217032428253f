#pragma once

#include "di/container/ring/prelude.h"
#include "di/container/string/prelude.h"
#include "di/reflect/prelude.h"
#include "di/vocab/optional/prelude.h"
#include "termgrid/custom_glyph.h"
#include "termgrid/graphics_rendition.h"
#include "termgrid/size.h"
#include "termgrid/terminal/cursor.h"
#include "termgrid/terminal/row.h"
#include "termgrid/terminal/scroll_back.h"
#include "termgrid/terminal/viewport.h"
#include "termgrid/unicode_width.h"

namespace termgrid::terminal {
/// @brief Whether or not auto-wrap is enabled.
enum class AutoWrapMode {
    Disabled,
    Enabled,
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<AutoWrapMode>) {
    using enum AutoWrapMode;
    return di::make_enumerators<"AutoWrapMode">(di::enumerator<"Disabled", Disabled>,
                                                di::enumerator<"Enabled", Enabled>);
}

/// @brief Modes which affect how characters are placed
struct ScreenModes {
    AutoWrapMode auto_wrap { AutoWrapMode::Enabled };
    bool smart_word_wrap { true };    ///< Wrap at the last word boundary instead of mid-word
    bool flex_width { false };        ///< Compute cell widths from the character
    bool visual_width_wrap { false }; ///< Wrap on accumulated visual width (only with flex_width)
    AmbiguousWidthMode ambiguous_width { AmbiguousWidthMode::Auto };
    bool scroll_back_disabled { false };

    auto operator==(ScreenModes const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<ScreenModes>) {
        return di::make_fields<"ScreenModes">(
            di::field<"auto_wrap", &ScreenModes::auto_wrap>,
            di::field<"smart_word_wrap", &ScreenModes::smart_word_wrap>,
            di::field<"flex_width", &ScreenModes::flex_width>,
            di::field<"visual_width_wrap", &ScreenModes::visual_width_wrap>,
            di::field<"ambiguous_width", &ScreenModes::ambiguous_width>,
            di::field<"scroll_back_disabled", &ScreenModes::scroll_back_disabled>);
    }
};

/// @brief A cursor position relative to the visible area
struct VisiblePosition {
    u32 row { 0 };
    u32 col { 0 };

    auto operator==(VisiblePosition const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<VisiblePosition>) {
        return di::make_fields<"VisiblePosition">(di::field<"row", &VisiblePosition::row>,
                                                  di::field<"col", &VisiblePosition::col>);
    }
};

/// @brief Represents the contents of the terminal, including its scroll back
///
/// The screen holds one Row per effective row. Rows are variable length: cells are only
/// stored up to the last written column, and columns past the end are filled with the row's
/// default cell. When a logical size is set, the effective size replaces the physical size
/// for cursor clamping and wrapping, and any rows beyond the physical height are hidden
/// above the visible area.
///
/// Rows scrolled off the top are moved into the scroll back, which the viewport maps onto
/// the visible area.
class Screen {
public:
    using TimePoint = Viewport::TimePoint;

    explicit Screen(Size const& size, usize max_scroll_back_rows = ScrollBack::default_max_rows);

    /// @brief Change the physical size
    ///
    /// Without a logical row count, shrinking pushes content rows which no longer fit into
    /// the scroll back and moves the cursor up with them.
    void resize(Size const& size);

    /// @brief Set the logical size, where 0 means "use the physical dimension"
    ///
    /// A fixed column count disables smart word wrap. Returning to the physical column
    /// count enables it again.
    void set_logical_size(Size const& size);

    auto size() const -> Size const& { return m_size; }
    auto logical_size() const -> Size const& { return m_logical_size; }
    auto max_height() const -> u32 { return m_logical_size.rows ? m_logical_size.rows : m_size.rows; }
    auto max_width() const -> u32 { return m_logical_size.cols ? m_logical_size.cols : m_size.cols; }
    auto geometry() const -> ViewportGeometry;

    auto current_graphics_rendition() const -> GraphicsRendition const& { return m_graphics_rendition; }
    void set_current_graphics_rendition(GraphicsRendition const& rendition);

    auto modes() const -> ScreenModes const& { return m_modes; }
    void set_auto_wrap_mode(AutoWrapMode mode);
    void set_smart_word_wrap(bool enabled);
    void set_flex_width(bool enabled);
    void set_visual_width_wrap(bool enabled);
    void set_ambiguous_width_mode(AmbiguousWidthMode mode);
    void set_scroll_back_disabled(bool disabled);

    auto cursor() const -> Cursor { return m_cursor; }
    auto saved_cursor() const -> SavedCursor { return m_saved_cursor; }

    void set_cursor(u32 row, u32 col);
    void move_cursor_up(u32 count);
    void move_cursor_down(u32 count);
    void move_cursor_forward(u32 count);
    void move_cursor_backward(u32 count);
    void set_cursor_visible(bool visible);
    void set_cursor_style(CursorStyle const& style);

    void save_cursor();
    void restore_cursor();

    void newline();
    void carriage_return();
    void line_feed();
    void tab();
    void backspace();

    /// @brief Write a printable character at the cursor
    ///
    /// @param code_point The character to write
    /// @param glyphs Custom glyphs, which can override the character's width
    void put_code_point(c32 code_point, GlyphStore const& glyphs);

    void insert_lines(u32 count);
    void delete_lines(u32 count);

    void insert_chars(u32 count);
    void delete_chars(u32 count);
    void erase_chars(u32 count);

    void clear();
    void clear_after_cursor();
    void clear_before_cursor();

    void clear_row();
    void clear_row_after_cursor();
    void clear_row_before_cursor();

    void scroll_up(u32 count);
    void scroll_down(u32 count);

    void set_line_attribute(LineAttribute attribute);

    /// @brief The cell at a logical screen position
    ///
    /// Positions past the stored row return the row's default cell, and rows outside the
    /// screen return the screen default cell.
    auto cell(u32 row, u32 col) const -> Cell;
    auto line_info(u32 row) const -> LineInfo;
    auto line_attribute(u32 row) const -> LineAttribute;

    /// @brief The cell at a visible position, taking the scroll offset into account
    auto visible_cell(u32 row, u32 col) const -> Cell;
    auto visible_line_info(u32 row) const -> LineInfo;

    /// @brief The cursor position on the visible area, if the cursor is visible
    auto cursor_visible_position() const -> di::Optional<VisiblePosition>;

    /// @brief The visual width of the first @p col cells of a row
    ///
    /// Cells with a non-positive width count as 1.
    auto line_visual_width(u32 row, u32 col) const -> f64;
    auto total_line_visual_width(u32 row) const -> f64;

    auto screen_default_cell() const -> Cell const& { return m_screen_default_cell; }

    auto scroll_back() const -> ScrollBack const& { return m_scroll_back; }
    void clear_scroll_back();
    void set_max_scroll_back_rows(usize max_rows);

    auto viewport() const -> Viewport const& { return m_viewport; }
    auto scroll_offset() const -> usize { return m_viewport.scroll_offset(); }
    auto effective_scroll_offset() const -> usize { return m_viewport.effective_scroll_offset(geometry()); }
    auto max_scroll_offset() const -> usize { return m_viewport.max_scroll_offset(geometry()); }
    auto scroll_back_boundary_visible_row() const -> di::Optional<u32> {
        return m_viewport.scroll_back_boundary_visible_row(geometry());
    }
    void set_scroll_offset(usize offset);
    auto normalize_scroll_offset() -> bool;

    void notify_keyboard_activity(TimePoint now = dius::SteadyClock::now());
    void notify_manual_vertical_scroll(TimePoint now = dius::SteadyClock::now());
    void set_cursor_drawn(bool drawn);
    void set_auto_scroll_disabled(bool disabled);

    /// @brief Bring the cursor into view if the user was recently typing
    ///
    /// @return Whether the scroll offset changed
    auto check_cursor_auto_scroll(TimePoint now = dius::SteadyClock::now()) -> bool;

    void set_crop(ScreenCrop const& crop);
    void clear_crop();

    /// @brief Reset all state except palettes and glyphs, preserving content in the scroll back
    void reset();

    /// @brief Plain text of the scroll back followed by the screen, one line per row
    auto scroll_back_text() const -> di::String;

    void invalidate_all() { m_whole_screen_dirty = true; }
    auto whole_screen_dirty() const -> bool { return m_whole_screen_dirty; }
    void clear_whole_screen_dirty_flag() { m_whole_screen_dirty = false; }

    auto rows() const -> di::Ring<Row> const& { return m_rows; }

private:
    auto default_line_info() const -> LineInfo { return { LineAttribute::Normal, m_graphics_rendition.blank_cell() }; }
    auto empty_row() const -> Row { return { {}, default_line_info() }; }
    auto screen_row() const -> Row { return { {}, { LineAttribute::Normal, m_screen_default_cell } }; }

    void init_rows();
    void ensure_line_length(u32 row, u32 length);
    void push_to_scroll_back(Row row);
    void scroll_up_one();
    void advance_row();
    void wrap_at_word_boundary();

    void track_vertical_move(u32 new_row);
    void set_horizontal_direction(MoveDirection direction, bool absolute);
    void clamp_cursor();

    auto previous_cell() -> di::Optional<Cell&>;
    auto previous_cell_width() -> f64;
    auto code_point_width(c32 code_point, bool has_custom_glyph) -> f64;

    void adjust_rows_for_resize(u32 target_rows);
    void shrink_logical_rows(u32 target_rows);
    auto last_content_row() const -> di::Optional<u32>;

    Size m_size;
    Size m_logical_size;
    di::Ring<Row> m_rows;
    Cell m_screen_default_cell;
    ScrollBack m_scroll_back;
    Viewport m_viewport;
    Cursor m_cursor;
    SavedCursor m_saved_cursor;
    GraphicsRendition m_graphics_rendition;
    ScreenModes m_modes;
    bool m_whole_screen_dirty { true };
};
}
