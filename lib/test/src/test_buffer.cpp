#include "di/test/prelude.h"
#include "dius/thread.h"
#include "termgrid/buffer.h"

namespace buffer {
using namespace termgrid;
using namespace termgrid::terminal;

static void config() {
    auto buffer = Buffer({
        .size = { 3, 10 },
        .max_scroll_back_rows = 5,
        .auto_wrap = false,
        .smart_word_wrap = false,
        .flex_width = true,
        .ambiguous_width = AmbiguousWidthMode::Wide,
    });

    ASSERT_EQ(buffer.size(), (Size { 3, 10 }));
    ASSERT_EQ(buffer.effective_size(), (Size { 3, 10 }));
    ASSERT_EQ(buffer.logical_size(), Size {});

    auto modes = buffer.modes();
    ASSERT_EQ(modes.auto_wrap, AutoWrapMode::Disabled);
    ASSERT(!modes.smart_word_wrap);
    ASSERT(modes.flex_width);
    ASSERT_EQ(modes.ambiguous_width, AmbiguousWidthMode::Wide);

    // Zero sized screens are clamped.
    auto tiny = Buffer({ .size = { 0, 0 } });
    ASSERT_EQ(tiny.size(), (Size { 1, 1 }));
}

static void write() {
    auto buffer = Buffer({ .size = { 3, 10 } });
    buffer.write_string("hi"_sv);
    buffer.write_code_point(U'!');

    ASSERT_EQ(buffer.cell(0, 0).code_point, U'h');
    ASSERT_EQ(buffer.cell(0, 2).code_point, U'!');
    ASSERT_EQ(buffer.cursor().col, 3u);
    ASSERT_EQ(buffer.visible_cell(0, 1).code_point, U'i');
    ASSERT_EQ(buffer.cursor_visible_position().value(), (VisiblePosition { 0, 3 }));

    buffer.carriage_return();
    buffer.clear_to_end_of_line();
    ASSERT_EQ(buffer.cell(0, 0).code_point, U' ');
    ASSERT_EQ(buffer.total_line_visual_width(0), 0.0);
}

static void attributes() {
    auto buffer = Buffer({ .size = { 3, 10 } });
    buffer.set_foreground(Color::standard(1));
    buffer.set_background(Color::palette(100));
    buffer.set_bold(true);
    buffer.set_underline(true);
    buffer.set_base_glyph_palette(4);
    buffer.set_x_flip(true);
    buffer.write_code_point(U'x');

    auto cell = buffer.cell(0, 0);
    ASSERT_EQ(cell.fg, Color::standard(1));
    ASSERT_EQ(cell.bg, Color::palette(100));
    ASSERT(cell.bold);
    ASSERT_EQ(cell.underline_style, UnderlineStyle::Single);
    ASSERT_EQ(cell.base_glyph_palette.value(), 4u);
    ASSERT(cell.x_flip);

    buffer.set_underline_style(UnderlineStyle::Dashed);
    ASSERT_EQ(buffer.graphics_rendition().underline_style, UnderlineStyle::Dashed);

    buffer.reset_attributes();
    auto rendition = buffer.graphics_rendition();
    ASSERT_EQ(rendition.fg, Color::default_foreground());
    ASSERT(!rendition.bold);
    ASSERT_EQ(rendition.underline_style, UnderlineStyle::None);
    ASSERT_EQ(rendition.base_glyph_palette.value(), 4u);
    ASSERT(rendition.x_flip);
}

static void cursor_state() {
    auto buffer = Buffer({ .size = { 5, 10 } });
    ASSERT(buffer.cursor_visible());
    ASSERT_EQ(buffer.cursor_style(), CursorStyle {});

    buffer.set_cursor_style(CursorShape::Bar, CursorBlink::Slow);
    buffer.set_cursor_visible(false);
    ASSERT_EQ(buffer.cursor_style(), (CursorStyle { CursorShape::Bar, CursorBlink::Slow }));
    ASSERT(!buffer.cursor_visible());

    buffer.set_cursor(2, 4);
    buffer.save_cursor();
    buffer.move_cursor_down(10);
    buffer.move_cursor_forward();
    ASSERT_EQ(buffer.cursor().row, 4u);
    ASSERT_EQ(buffer.cursor().col, 5u);

    buffer.restore_cursor();
    ASSERT_EQ(buffer.cursor().row, 2u);
    ASSERT_EQ(buffer.cursor().col, 4u);
}

static void scroll_back() {
    auto buffer = Buffer({ .size = { 2, 10 }, .max_scroll_back_rows = 2 });
    for (auto c : "abcd"_sv) {
        buffer.write_code_point(c);
        buffer.newline();
    }

    // "a", "b" and "c" were scrolled off, but only 2 rows are kept.
    ASSERT_EQ(buffer.scroll_back_size(), 2u);
    ASSERT_EQ(buffer.scroll_back_text(), "b\nc\nd\n\n"_sv);

    buffer.set_scroll_offset(100);
    ASSERT_EQ(buffer.scroll_offset(), buffer.max_scroll_offset());
    ASSERT_EQ(buffer.visible_cell(0, 0).code_point, U'b');

    buffer.set_max_scroll_back_rows(1);
    ASSERT_EQ(buffer.scroll_back_size(), 1u);

    buffer.clear_scroll_back();
    ASSERT_EQ(buffer.scroll_back_size(), 0u);
    ASSERT_EQ(buffer.scroll_offset(), 0u);
}

static void palettes() {
    auto buffer = Buffer({ .size = { 3, 10 } });
    buffer.set_foreground(Color::standard(1));
    buffer.write_code_point(U'x');
    buffer.clear_dirty();
    ASSERT(!buffer.is_dirty());

    buffer.init_palette(31, 2);
    ASSERT(buffer.is_dirty());

    buffer.clear_dirty();
    buffer.set_palette_entry(31, 1, 9, false);
    buffer.set_palette_entry_color(31, 0, Color::true_color(1, 1, 1), false);
    ASSERT(buffer.is_dirty());

    auto palette = buffer.palette(31);
    ASSERT(palette);
    ASSERT(di::holds_alternative<PaletteEntry::DefaultForeground>(palette.value().entries[1].value));

    auto cell = buffer.cell(0, 0);
    ASSERT_EQ(buffer.resolve_glyph_color(cell, 0), Color::true_color(1, 1, 1));
    ASSERT_EQ(buffer.resolve_glyph_color(cell, 1), Color::standard(1));

    buffer.delete_palette(31);
    ASSERT(!buffer.palette(31));
    ASSERT_EQ(buffer.resolve_glyph_color(cell, 0), cell.bg);

    buffer.init_palette(1, 1);
    buffer.delete_all_palettes();
    ASSERT(!buffer.palette(1));
}

static void glyphs() {
    auto buffer = Buffer({ .size = { 3, 10 } });
    buffer.set_flex_width(true);
    buffer.set_ambiguous_width_mode(AmbiguousWidthMode::Wide);

    auto pixels = di::Vector<i32> {};
    pixels.push_back(1);
    pixels.push_back(0);
    buffer.clear_dirty();
    buffer.set_glyph(U'g', 2, di::move(pixels));
    ASSERT(buffer.is_dirty());
    ASSERT(buffer.has_custom_glyph(U'g'));
    ASSERT_EQ(buffer.glyph(U'g').value().width(), 2u);

    // Custom glyphs take the explicit ambiguous width.
    buffer.write_code_point(U'g');
    ASSERT_EQ(buffer.cell(0, 0).width, 2.0);
    ASSERT_EQ(buffer.total_line_visual_width(0), 2.0);

    buffer.delete_glyph(U'g');
    ASSERT(!buffer.glyph(U'g'));

    buffer.set_glyph(U'h', 1, {});
    buffer.delete_all_glyphs();
    ASSERT(!buffer.has_custom_glyph(U'h'));
}

static void reset() {
    auto buffer = Buffer({ .size = { 3, 10 } });
    buffer.set_bold(true);
    buffer.set_smart_word_wrap(false);
    buffer.set_auto_scroll_disabled(true);
    buffer.init_palette(31, 1);
    buffer.write_string("abc"_sv);

    buffer.reset();
    ASSERT(!buffer.graphics_rendition().bold);
    ASSERT(buffer.modes().smart_word_wrap);
    ASSERT(!buffer.auto_scroll_disabled());
    ASSERT_EQ(buffer.cursor().col, 0u);
    ASSERT_EQ(buffer.scroll_back_size(), 1u);

    // Palettes are not part of the screen state.
    ASSERT(buffer.palette(31));
}

static void crop() {
    auto buffer = Buffer({ .size = { 3, 10 } });
    buffer.set_crop({ {}, 2u });
    ASSERT_EQ(buffer.crop().height.value(), 2u);
    buffer.clear_crop();
    ASSERT(!buffer.crop().height);
}

static void concurrent_access() {
    auto buffer = Buffer({ .size = { 3, 200 } });

    auto writer = dius::Thread::create([&] {
        for (auto _ : di::range(100)) {
            buffer.write_code_point(U'x');
        }
    });
    ASSERT(writer);

    // Several readers run at once, and each only ever observes a consistent state.
    auto read = [&] {
        for (auto _ : di::range(100)) {
            auto cursor = buffer.cursor();
            ASSERT_LT_EQ(cursor.col, 100u);
            ASSERT_EQ(cursor.row, 0u);

            auto cell = buffer.cell(0, 0);
            ASSERT(cell.code_point == U'x' || cell.code_point == U' ');

            auto text = buffer.scroll_back_text();
            ASSERT_LT_EQ(text.size_bytes(), 103u);
        }
    };

    auto first_reader = dius::Thread::create(read);
    auto second_reader = dius::Thread::create(read);
    ASSERT(first_reader);
    ASSERT(second_reader);

    read();

    ASSERT(first_reader.value().join());
    ASSERT(second_reader.value().join());
    ASSERT(writer.value().join());
    ASSERT_EQ(buffer.cursor().col, 100u);
    ASSERT_EQ(buffer.cell(0, 99).code_point, U'x');
}

TEST(buffer, config)
TEST(buffer, write)
TEST(buffer, attributes)
TEST(buffer, cursor_state)
TEST(buffer, scroll_back)
TEST(buffer, palettes)
TEST(buffer, glyphs)
TEST(buffer, reset)
TEST(buffer, crop)
TEST(buffer, concurrent_access)
}
