#include "di/test/prelude.h"
#include "termgrid/fnv.h"
#include "termgrid/palette.h"

namespace palette {
using namespace termgrid;

static auto make_cell(Color fg, Color bg) -> terminal::Cell {
    auto cell = terminal::Cell {};
    cell.fg = fg;
    cell.bg = bg;
    return cell;
}

static void set_entry() {
    auto store = PaletteStore {};
    store.init_palette(31, 4);
    ASSERT_EQ(store.palette_count(), 1u);

    store.set_entry(31, 0, 8, false);
    store.set_entry(31, 1, 9, true);
    store.set_entry(31, 2, 94, false);
    store.set_entry(31, 3, 42, true);

    auto const& palette = store.palette(31).value();
    ASSERT(di::holds_alternative<PaletteEntry::Transparent>(palette.entries[0].value));
    ASSERT(palette.uses_bg);
    ASSERT(di::holds_alternative<PaletteEntry::DefaultForeground>(palette.entries[1].value));
    ASSERT(palette.entries[1].dim);
    ASSERT(palette.uses_default_fg);
    ASSERT_EQ(di::get_if<Color>(palette.entries[2].value).value(), Color::standard(12));
    ASSERT_EQ(di::get_if<Color>(palette.entries[3].value).value(), Color::standard(2));
    ASSERT(palette.entries[3].dim);

    // Unknown codes select white.
    store.set_entry(31, 2, 5, false);
    ASSERT_EQ(di::get_if<Color>(store.palette(31).value().entries[2].value).value(), Color::standard(7));

    // A color code replaces a transparent entry.
    store.set_entry(31, 0, 31, false);
    ASSERT(!di::holds_alternative<PaletteEntry::Transparent>(store.palette(31).value().entries[0].value));
    ASSERT_EQ(di::get_if<Color>(store.palette(31).value().entries[0].value).value(), Color::standard(1));
}

static void set_entry_out_of_range() {
    auto store = PaletteStore {};
    store.init_palette(31, 1);

    store.set_entry(31, 1, 31, false);
    store.set_entry(32, 0, 31, false);
    store.set_entry_color(31, 5, Color::true_color(1, 2, 3), false);

    ASSERT_EQ(store.palette_count(), 1u);
    ASSERT_EQ(store.palette(31).value().entries.size(), 1u);
    ASSERT(store.palette(31).value().entries[0] == PaletteEntry {});
    ASSERT(!store.palette(32));
}

static void delete_palettes() {
    auto store = PaletteStore {};
    store.init_palette(31, 2);
    store.init_palette(32, 2);
    store.init_palette(100, 2);

    store.delete_palette(32);
    ASSERT(!store.palette(32));
    ASSERT(store.palette(31));
    ASSERT_EQ(store.palette_count(), 2u);

    // Re-initializing replaces the palette.
    store.set_entry(31, 0, 31, false);
    store.init_palette(31, 3);
    ASSERT_EQ(store.palette(31).value().entries.size(), 3u);
    ASSERT(store.palette(31).value().entries[0] == PaletteEntry {});

    store.delete_all_palettes();
    ASSERT_EQ(store.palette_count(), 0u);
}

static void palette_number() {
    auto cell = make_cell(Color::standard(1), Color::default_background());
    ASSERT_EQ(palette_number_for(cell), 31u);

    cell.fg = Color::standard(9);
    ASSERT_EQ(palette_number_for(cell), 91u);

    cell.fg = Color::true_color(1, 2, 3);
    ASSERT_EQ(palette_number_for(cell), 39u);

    cell.fg = Color::palette(1);
    ASSERT_EQ(palette_number_for(cell), 39u);

    cell.base_glyph_palette = 1000;
    ASSERT_EQ(palette_number_for(cell), 1000u);
}

static void resolve_without_palette() {
    auto store = PaletteStore {};
    auto fg = Color::true_color(100, 100, 100);
    auto bg = Color::true_color(0, 0, 50);
    auto cell = make_cell(fg, bg);

    ASSERT_EQ(store.resolve_glyph_color(cell, 0), bg);
    ASSERT_EQ(store.resolve_glyph_color(cell, 1), fg);
    ASSERT_EQ(store.resolve_glyph_color(cell, 2), fg.dimmed());
    ASSERT_EQ(store.resolve_glyph_color(cell, 3), fg.brightened());
    ASSERT_EQ(store.resolve_glyph_color(cell, 50), fg.brightened());
    ASSERT_EQ(store.resolve_glyph_color(cell, -1), fg.brightened());

    // An empty palette behaves as if there was none.
    store.init_palette(39, 0);
    ASSERT_EQ(store.resolve_glyph_color(cell, 1), fg);
    ASSERT_EQ(store.resolve_glyph_color(cell, 2), fg.dimmed());
}

static void resolve_with_palette() {
    auto store = PaletteStore {};
    store.init_palette(31, 3);
    store.set_entry(31, 0, 8, false);
    store.set_entry(31, 1, 9, true);
    store.set_entry_color(31, 2, Color::true_color(10, 20, 30), false);

    auto bg = Color::true_color(0, 0, 50);
    auto cell = make_cell(Color::standard(1), bg);

    ASSERT_EQ(store.resolve_glyph_color(cell, 0), bg);
    ASSERT_EQ(store.resolve_glyph_color(cell, 1), Color::standard(1).dimmed());
    ASSERT_EQ(store.resolve_glyph_color(cell, 2), Color::true_color(10, 20, 30));

    // Indices are clamped into the palette.
    ASSERT_EQ(store.resolve_glyph_color(cell, 9), Color::true_color(10, 20, 30));
    ASSERT_EQ(store.resolve_glyph_color(cell, -4), bg);

    // Cells with another foreground select another palette.
    cell.fg = Color::standard(2);
    ASSERT_EQ(store.resolve_glyph_color(cell, 2), Color::standard(2).dimmed());
}

static void resolve_single_entry() {
    auto store = PaletteStore {};
    store.init_palette(7, 1);
    store.set_entry_color(7, 0, Color::true_color(1, 2, 3), false);

    auto bg = Color::true_color(0, 0, 50);
    auto cell = make_cell(Color::standard(1), bg);
    cell.base_glyph_palette = 7;

    // Index 0 is always the background, everything else is the one entry.
    ASSERT_EQ(store.resolve_glyph_color(cell, 0), bg);
    ASSERT_EQ(store.resolve_glyph_color(cell, 1), Color::true_color(1, 2, 3));
    ASSERT_EQ(store.resolve_glyph_color(cell, 12), Color::true_color(1, 2, 3));

    store.set_entry_color(7, 0, Color::true_color(100, 50, 10), true);
    ASSERT_EQ(store.resolve_glyph_color(cell, 1), Color::true_color(60, 30, 6));
}

static void ansi_round_trip() {
    auto store = PaletteStore {};
    store.init_palette(100, 2);
    store.set_entry(100, 0, 31, false);

    auto cell = make_cell(Color::standard(4), Color::default_background());
    cell.base_glyph_palette = 100;

    auto color = store.resolve_glyph_color(cell, 0);
    ASSERT_EQ(color, Color::standard(1));
    ASSERT_EQ(color_to_ansi_code(color), 31u);
}

static void hash() {
    ASSERT_EQ(Palette {}.hash(), 0u);

    auto store = PaletteStore {};
    store.init_palette(31, 2);
    store.init_palette(32, 2);

    auto const& a = store.palette(31).value();
    auto const& b = store.palette(32).value();
    ASSERT_NOT_EQ(a.hash(), 0u);
    ASSERT_EQ(a.hash(), b.hash());

    store.set_entry(32, 1, 31, false);
    ASSERT_NOT_EQ(store.palette(31).value().hash(), store.palette(32).value().hash());

    store.set_entry(31, 1, 31, true);
    ASSERT_NOT_EQ(store.palette(31).value().hash(), store.palette(32).value().hash());

    store.set_entry(31, 1, 31, false);
    ASSERT_EQ(store.palette(31).value().hash(), store.palette(32).value().hash());

    auto copy = store.palette(31).value().clone();
    ASSERT_EQ(copy.hash(), store.palette(31).value().hash());
}

static void hash_value() {
    auto store = PaletteStore {};
    store.init_palette(1, 3);
    store.set_entry(1, 0, 8, false);
    store.set_entry(1, 1, 9, true);
    store.set_entry_color(1, 2, Color::true_color(1, 2, 3), false);

    // FNV-1a over a tag per entry kind, the RGB of color entries and a marker for dim entries.
    auto expected = fnv::mix(fnv::offset_basis, 1);
    expected = fnv::mix(expected, 2);
    expected = fnv::mix(expected, 1);
    expected = fnv::mix(expected, 0);
    expected = fnv::mix(expected, 1);
    expected = fnv::mix(expected, 2);
    expected = fnv::mix(expected, 3);
    ASSERT_EQ(store.palette(1).value().hash(), expected);
}

TEST(palette, set_entry)
TEST(palette, set_entry_out_of_range)
TEST(palette, delete_palettes)
TEST(palette, palette_number)
TEST(palette, resolve_without_palette)
TEST(palette, resolve_with_palette)
TEST(palette, resolve_single_entry)
TEST(palette, ansi_round_trip)
TEST(palette, hash)
TEST(palette, hash_value)
}
