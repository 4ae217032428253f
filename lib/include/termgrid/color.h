#pragma once

#include "di/container/string/prelude.h"
#include "di/reflect/prelude.h"
#include "di/types/integers.h"
#include "di/vocab/array/array.h"

namespace termgrid {
/// @brief Which SGR layer a color code is being generated for
enum class ColorLayer : u8 {
    Foreground,
    Background,
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<ColorLayer>) {
    using enum ColorLayer;
    return di::make_enumerators<"ColorLayer">(di::enumerator<"Foreground", Foreground>,
                                              di::enumerator<"Background", Background>);
}

/// @brief Represents a terminal color value
///
/// Every color carries its resolved RGB value in addition to the way it was specified,
/// so that renderers never need to consult the color tables themselves.
struct Color {
    enum class Type : u8 {
        Default,   ///< Color is the default (unset SGR)
        Standard,  ///< Color is one of the 16 ANSI colors
        Palette,   ///< Color is an entry of the 256 color table
        TrueColor, ///< Color is true color (r, b, g fully specified)
    };

    constexpr static auto default_foreground() -> Color { return { Type::Default, 0, 212, 212, 212 }; }
    constexpr static auto default_background() -> Color { return { Type::Default, 0, 30, 30, 30 }; }

    /// @brief Create one of the 16 ANSI colors (indices past 15 become white)
    static auto standard(u8 index) -> Color;

    /// @brief Create an entry of the 256 color table
    static auto palette(u8 index) -> Color;

    constexpr static auto true_color(u8 r, u8 g, u8 b) -> Color { return { Type::TrueColor, 0, r, g, b }; }

    Type type { Type::Default };
    u8 index { 0 };
    u8 r { 0 };
    u8 g { 0 };
    u8 b { 0 };

    /// @brief Scale each channel to 60%, yielding a true color
    auto dimmed() const -> Color;

    /// @brief Add @p amount to each channel (saturating), yielding a true color
    auto brightened(u8 amount = 64) const -> Color;

    /// @brief SGR parameter text which selects this color (e.g. "31", "48;5;200")
    auto sgr_code(ColorLayer layer) const -> di::String;

    auto operator==(Color const& other) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Color>) {
        return di::make_fields<"Color">(di::field<"type", &Color::type>, di::field<"index", &Color::index>,
                                        di::field<"r", &Color::r>, di::field<"g", &Color::g>,
                                        di::field<"b", &Color::b>);
    }
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Color::Type>) {
    using enum Color::Type;
    return di::make_enumerators<"Color::Type">(di::enumerator<"Default", Default>,
                                               di::enumerator<"Standard", Standard>,
                                               di::enumerator<"Palette", Palette>,
                                               di::enumerator<"TrueColor", TrueColor>);
}

struct Rgb {
    u8 r { 0 };
    u8 g { 0 };
    u8 b { 0 };

    auto operator==(Rgb const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Rgb>) {
        return di::make_fields<"Rgb">(di::field<"r", &Rgb::r>, di::field<"g", &Rgb::g>, di::field<"b", &Rgb::b>);
    }
};

/// @brief RGB values of the 16 ANSI colors
constexpr inline auto ansi_colors = di::Array<Rgb, 16> {
    Rgb { 0, 0, 0 },       Rgb { 170, 0, 0 },    Rgb { 0, 170, 0 },    Rgb { 170, 85, 0 },
    Rgb { 0, 0, 170 },     Rgb { 170, 0, 170 },  Rgb { 0, 170, 170 },  Rgb { 170, 170, 170 },
    Rgb { 85, 85, 85 },    Rgb { 255, 85, 85 },  Rgb { 85, 255, 85 },  Rgb { 255, 255, 85 },
    Rgb { 85, 85, 255 },   Rgb { 255, 85, 255 }, Rgb { 85, 255, 255 }, Rgb { 255, 255, 255 },
};

/// @brief Lookup the RGB value of an entry in the 256 color table
///
/// Entries 0-15 are the ANSI colors, 16-231 form a 6x6x6 color cube,
/// and 232-255 are a grayscale ramp.
auto palette_rgb(u8 index) -> Rgb;

/// @brief Map a color back to a legacy SGR foreground code
///
/// Standard colors and palette entries below 16 map to 30-37 or 90-97, other palette
/// entries return their raw index, and true colors map to an exactly matching ANSI color
/// or 37 if there is none. The default color maps to 39.
auto color_to_ansi_code(Color const& color) -> u32;
}
