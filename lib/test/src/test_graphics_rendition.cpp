#include "di/test/prelude.h"
#include "termgrid/graphics_rendition.h"

namespace graphics_rendition {
using namespace termgrid;
using namespace termgrid::terminal;

static void reset_attributes() {
    auto rendition = GraphicsRendition {};
    rendition.fg = Color::standard(1);
    rendition.bg = Color::palette(200);
    rendition.underline_color = Color::true_color(1, 2, 3);
    rendition.set_underline(true);
    rendition.bold = true;
    rendition.italic = true;
    rendition.reverse = true;
    rendition.blink = true;
    rendition.strikethrough = true;
    rendition.base_glyph_palette = 5;
    rendition.x_flip = true;
    rendition.y_flip = true;

    rendition.reset_attributes();

    // Custom glyph state survives.
    auto expected = GraphicsRendition {};
    expected.base_glyph_palette = 5;
    expected.x_flip = true;
    expected.y_flip = true;
    ASSERT_EQ(rendition, expected);
}

static void underline() {
    auto rendition = GraphicsRendition {};
    rendition.set_underline(true);
    ASSERT_EQ(rendition.underline_style, UnderlineStyle::Single);

    rendition.underline_style = UnderlineStyle::Curly;
    auto cell = rendition.make_cell(U'a', 1.0, false);
    ASSERT(cell.underline());
    ASSERT_EQ(cell.underline_style, UnderlineStyle::Curly);

    rendition.set_underline(false);
    ASSERT(!rendition.make_cell(U'a', 1.0, false).underline());
}

static void erase_cell() {
    auto rendition = GraphicsRendition {};
    rendition.fg = Color::standard(1);
    rendition.bg = Color::standard(4);
    rendition.bold = true;
    rendition.strikethrough = true;
    rendition.set_underline(true);

    auto cell = rendition.blank_cell();
    ASSERT_EQ(cell.code_point, U' ');
    ASSERT_EQ(cell.fg, Color::standard(1));
    ASSERT_EQ(cell.bg, Color::standard(4));
    ASSERT(cell.bold);
    ASSERT(cell.underline());
    ASSERT(!cell.strikethrough);

    rendition.reverse = true;
    cell = rendition.blank_cell();
    ASSERT_EQ(cell.fg, Color::standard(4));
    ASSERT_EQ(cell.bg, Color::standard(1));
    ASSERT(cell.reverse);
}

static void written_cell() {
    auto rendition = GraphicsRendition {};
    rendition.fg = Color::standard(2);
    rendition.bg = Color::standard(0);
    rendition.reverse = true;
    rendition.italic = true;
    rendition.base_glyph_palette = 9;
    rendition.y_flip = true;

    auto cell = rendition.make_cell(0x732B, 2.0, true);
    ASSERT_EQ(cell.code_point, c32(0x732B));
    ASSERT_EQ(cell.width, 2.0);
    ASSERT(cell.flex_width);
    ASSERT_EQ(cell.fg, Color::standard(0));
    ASSERT_EQ(cell.bg, Color::standard(2));
    ASSERT(cell.italic);
    ASSERT(cell.reverse);
    ASSERT_EQ(cell.base_glyph_palette.value(), 9u);
    ASSERT(!cell.x_flip);
    ASSERT(cell.y_flip);
    ASSERT(cell.combining().empty());
}

TEST(graphics_rendition, reset_attributes)
TEST(graphics_rendition, underline)
TEST(graphics_rendition, erase_cell)
TEST(graphics_rendition, written_cell)
}
