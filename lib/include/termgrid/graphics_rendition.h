#pragma once

#include "di/reflect/prelude.h"
#include "di/types/integers.h"
#include "di/vocab/optional/prelude.h"
#include "termgrid/color.h"
#include "termgrid/terminal/cell.h"

namespace termgrid {
/// @brief The attribute state applied to newly written cells
///
/// This is the state SGR-like operations update. Cells are stamped with it when written,
/// and erase operations fill with the blank cell it describes.
struct GraphicsRendition {
    Color fg { Color::default_foreground() };
    Color bg { Color::default_background() };
    di::Optional<Color> underline_color;
    terminal::UnderlineStyle underline_style { terminal::UnderlineStyle::None };
    bool bold { false };
    bool italic { false };
    bool reverse { false };
    bool blink { false };
    bool strikethrough { false };

    // Custom glyph state. This survives reset_attributes().
    di::Optional<u32> base_glyph_palette;
    bool x_flip { false };
    bool y_flip { false };

    /// @brief Reset the SGR attributes, keeping the glyph palette and flips
    void reset_attributes();

    void set_underline(bool underline) {
        underline_style = underline ? terminal::UnderlineStyle::Single : terminal::UnderlineStyle::None;
    }

    /// @brief The fill cell for erase operations (fg and bg swapped when reverse is set)
    auto blank_cell() const -> terminal::Cell;

    /// @brief Build a written cell
    ///
    /// @param code_point The character to store
    /// @param width The display width
    /// @param flex_width Whether the width was computed from the character
    auto make_cell(c32 code_point, f64 width, bool flex_width) const -> terminal::Cell;

    auto operator==(GraphicsRendition const& other) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<GraphicsRendition>) {
        return di::make_fields<"GraphicsRendition">(
            di::field<"fg", &GraphicsRendition::fg>, di::field<"bg", &GraphicsRendition::bg>,
            di::field<"underline_color", &GraphicsRendition::underline_color>,
            di::field<"underline_style", &GraphicsRendition::underline_style>,
            di::field<"bold", &GraphicsRendition::bold>, di::field<"italic", &GraphicsRendition::italic>,
            di::field<"reverse", &GraphicsRendition::reverse>, di::field<"blink", &GraphicsRendition::blink>,
            di::field<"strikethrough", &GraphicsRendition::strikethrough>,
            di::field<"base_glyph_palette", &GraphicsRendition::base_glyph_palette>,
            di::field<"x_flip", &GraphicsRendition::x_flip>, di::field<"y_flip", &GraphicsRendition::y_flip>);
    }
};
}
