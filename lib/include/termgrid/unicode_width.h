#pragma once

#include "di/reflect/prelude.h"
#include "di/types/integers.h"

namespace termgrid {
/// @brief Unicode East Asian Width property
enum class EastAsianWidth : u8 {
    Neutral,
    Ambiguous,
    Halfwidth,
    Fullwidth,
    Narrow,
    Wide,
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<EastAsianWidth>) {
    using enum EastAsianWidth;
    return di::make_enumerators<"EastAsianWidth">(
        di::enumerator<"Neutral", Neutral>, di::enumerator<"Ambiguous", Ambiguous>,
        di::enumerator<"Halfwidth", Halfwidth>, di::enumerator<"Fullwidth", Fullwidth>,
        di::enumerator<"Narrow", Narrow>, di::enumerator<"Wide", Wide>);
}

/// @brief How ambiguous width characters are sized when flex width is enabled
enum class AmbiguousWidthMode : u8 {
    Auto,   ///< Match the width of the previous cell
    Narrow, ///< Always 1 column
    Wide,   ///< Always 2 columns
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<AmbiguousWidthMode>) {
    using enum AmbiguousWidthMode;
    return di::make_enumerators<"AmbiguousWidthMode">(di::enumerator<"Auto", Auto>, di::enumerator<"Narrow", Narrow>,
                                                      di::enumerator<"Wide", Wide>);
}

auto east_asian_width(c32 code_point) -> EastAsianWidth;

/// @brief Display width in columns: 2.0 for wide and fullwidth, -1.0 for ambiguous, else 1.0
auto east_asian_display_width(c32 code_point) -> f64;

/// @brief Whether @p code_point attaches to the preceding character instead of taking a cell
///
/// This covers combining diacritics, Hebrew, Arabic, Thai and Devanagari marks,
/// Hangul medial jamo, variation selectors and the zero width (non-)joiners.
auto is_combining_mark(c32 code_point) -> bool;

/// @brief Box drawing and block elements, which must span the full cell when drawn wide
auto is_block_or_line_drawing(c32 code_point) -> bool;
}
