#include "di/test/prelude.h"
#include "termgrid/custom_glyph.h"
#include "termgrid/fnv.h"

namespace custom_glyph {
using namespace termgrid;

template<typename... Ts>
static auto make_pixels(Ts... values) -> di::Vector<i32> {
    auto result = di::Vector<i32> {};
    (result.push_back(i32(values)), ...);
    return result;
}

static void dimensions() {
    auto glyph = CustomGlyph(2, make_pixels(1, 2, 3, 4, 5, 6));
    ASSERT_EQ(glyph.width(), 2u);
    ASSERT_EQ(glyph.height(), 3u);

    // A partial last row still counts towards the height.
    auto partial = CustomGlyph(3, make_pixels(1, 2, 3, 4));
    ASSERT_EQ(partial.height(), 2u);

    ASSERT_EQ(CustomGlyph(0, make_pixels(1, 2)).height(), 0u);
    ASSERT_EQ(CustomGlyph(4, {}).height(), 0u);
    ASSERT_EQ(CustomGlyph().height(), 0u);
}

static void pixels() {
    auto glyph = CustomGlyph(3, make_pixels(1, 2, 3, 4));
    ASSERT_EQ(glyph.pixel(0, 0), 1);
    ASSERT_EQ(glyph.pixel(2, 0), 3);
    ASSERT_EQ(glyph.pixel(0, 1), 4);

    // Missing pixels in the last row read as 0.
    ASSERT_EQ(glyph.pixel(1, 1), 0);

    // Out of bounds.
    ASSERT_EQ(glyph.pixel(3, 0), 0);
    ASSERT_EQ(glyph.pixel(0, 2), 0);
}

static void hash() {
    ASSERT_EQ(CustomGlyph().hash(), 0u);
    ASSERT_EQ(CustomGlyph(2, {}).hash(), 0u);

    auto a = CustomGlyph(2, make_pixels(1, 0, 0, 1));
    auto b = CustomGlyph(2, make_pixels(1, 0, 0, 1));
    ASSERT_NOT_EQ(a.hash(), 0u);
    ASSERT_EQ(a.hash(), b.hash());
    ASSERT_EQ(a.hash(), a.clone().hash());

    // Same pixels with a different shape.
    auto c = CustomGlyph(4, make_pixels(1, 0, 0, 1));
    ASSERT_NOT_EQ(a.hash(), c.hash());

    auto d = CustomGlyph(2, make_pixels(1, 0, 0, -1));
    ASSERT_NOT_EQ(a.hash(), d.hash());
}

static void hash_value() {
    // FNV-1a over the width, the height and then each sign extended pixel.
    auto expected = fnv::mix(fnv::offset_basis, 1);
    expected = fnv::mix(expected, 2);
    expected = fnv::mix(expected, 5);
    expected = fnv::mix(expected, u64(i64(-1)));
    ASSERT_EQ(CustomGlyph(1, make_pixels(5, -1)).hash(), expected);
}

static void store() {
    auto glyphs = GlyphStore {};
    ASSERT(!glyphs.has_custom_glyph(U'x'));

    glyphs.set_glyph(U'x', 2, make_pixels(1, 1));
    glyphs.set_glyph(U'y', 1, make_pixels(2));
    ASSERT(glyphs.has_custom_glyph(U'x'));
    ASSERT_EQ(glyphs.glyph_count(), 2u);
    ASSERT_EQ(glyphs.glyph(U'x').value().width(), 2u);

    // Setting a glyph again replaces it.
    glyphs.set_glyph(U'x', 1, make_pixels(3, 3, 3));
    ASSERT_EQ(glyphs.glyph_count(), 2u);
    ASSERT_EQ(glyphs.glyph(U'x').value().height(), 3u);
    ASSERT_EQ(glyphs.glyph(U'x').value().pixel(0, 2), 3);

    glyphs.delete_glyph(U'x');
    ASSERT(!glyphs.glyph(U'x'));
    ASSERT(glyphs.has_custom_glyph(U'y'));

    // Deleting a missing glyph is a no-op.
    glyphs.delete_glyph(U'z');
    ASSERT_EQ(glyphs.glyph_count(), 1u);

    glyphs.delete_all_glyphs();
    ASSERT_EQ(glyphs.glyph_count(), 0u);
}

TEST(custom_glyph, dimensions)
TEST(custom_glyph, pixels)
TEST(custom_glyph, hash)
TEST(custom_glyph, hash_value)
TEST(custom_glyph, store)
}
