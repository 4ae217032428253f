#pragma once

#include "di/container/tree/tree_map.h"
#include "di/container/vector/prelude.h"
#include "di/types/integers.h"
#include "di/vocab/optional/prelude.h"

namespace termgrid {
/// @brief A user defined bitmap which replaces a character when rendering
///
/// Pixels are palette indices, stored row-major. The pixel count is not required to be a
/// multiple of the width: a partial last row counts towards the height and missing pixels
/// read as 0.
class CustomGlyph {
public:
    CustomGlyph() = default;
    explicit CustomGlyph(u32 width, di::Vector<i32> pixels);

    auto width() const -> u32 { return m_width; }
    auto height() const -> u32 { return m_height; }
    auto pixels() const -> di::Vector<i32> const& { return m_pixels; }

    /// @brief The palette index at (x, y), or 0 if out of bounds
    auto pixel(u32 x, u32 y) const -> i32;

    /// @brief FNV-1a hash of the dimensions and pixels (0 when there are no pixels)
    auto hash() const -> u64;

    auto clone() const -> CustomGlyph { return CustomGlyph(m_width, m_pixels.clone()); }

private:
    u32 m_width { 0 };
    u32 m_height { 0 };
    di::Vector<i32> m_pixels;
};

/// @brief Custom glyphs keyed by the code point they replace
class GlyphStore {
public:
    /// @brief Store a glyph, replacing any existing one for @p code_point
    void set_glyph(c32 code_point, u32 width, di::Vector<i32> pixels);

    auto glyph(c32 code_point) const -> di::Optional<CustomGlyph const&>;
    auto has_custom_glyph(c32 code_point) const -> bool { return m_glyphs.contains(code_point); }

    void delete_glyph(c32 code_point);
    void delete_all_glyphs();

    auto glyph_count() const -> usize { return m_glyphs.size(); }

private:
    di::TreeMap<c32, CustomGlyph> m_glyphs;
};
}
