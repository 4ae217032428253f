#pragma once

#include "di/container/tree/tree_map.h"
#include "di/container/vector/prelude.h"
#include "di/reflect/prelude.h"
#include "di/vocab/optional/prelude.h"
#include "di/vocab/variant/get_if.h"
#include "di/vocab/variant/holds_alternative.h"
#include "di/vocab/variant/prelude.h"
#include "termgrid/color.h"
#include "termgrid/terminal/cell.h"

namespace termgrid {
/// @brief A single entry of a glyph palette
struct PaletteEntry {
    /// @brief Use the cell's background color
    struct Transparent {
        auto operator==(Transparent const&) const -> bool = default;

        constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Transparent>) {
            return di::make_fields<"PaletteEntry::Transparent">();
        }
    };

    /// @brief Use the cell's foreground color
    struct DefaultForeground {
        auto operator==(DefaultForeground const&) const -> bool = default;

        constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<DefaultForeground>) {
            return di::make_fields<"PaletteEntry::DefaultForeground">();
        }
    };

    di::Variant<Color, Transparent, DefaultForeground> value { Color {} };
    bool dim { false };

    auto operator==(PaletteEntry const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<PaletteEntry>) {
        return di::make_fields<"PaletteEntry">(di::field<"value", &PaletteEntry::value>,
                                               di::field<"dim", &PaletteEntry::dim>);
    }
};

/// @brief Indexed colors used to paint custom glyph pixels
struct Palette {
    di::Vector<PaletteEntry> entries;
    bool uses_default_fg { false }; ///< Set once any entry is DefaultForeground
    bool uses_bg { false };         ///< Set once any entry is Transparent

    /// @brief FNV-1a hash of the entries, suitable for render cache keys (0 when empty)
    auto hash() const -> u64;

    auto clone() const -> Palette { return { entries.clone(), uses_default_fg, uses_bg }; }
};

/// @brief Collection of palettes, keyed by palette number
///
/// Palette numbers are either legacy SGR foreground codes (30-37, 90-97, 39),
/// which cells select implicitly through their foreground color, or arbitrary
/// ids which cells select explicitly through their base glyph palette.
class PaletteStore {
public:
    /// @brief Create (or replace) palette @p number with @p length zeroed entries
    void init_palette(u32 number, usize length);

    void delete_palette(u32 number);
    void delete_all_palettes();

    /// @brief Set an entry from a legacy SGR color code
    ///
    /// Code 8 means transparent, code 9 means the default foreground. Codes 30-37/40-47
    /// and 90-97/100-107 select an ANSI color. Anything else selects white. This is a
    /// no-op if the palette does not exist or @p index is out of range.
    void set_entry(u32 number, usize index, u32 code, bool dim);

    /// @brief Set an entry to an arbitrary color
    void set_entry_color(u32 number, usize index, Color color, bool dim);

    auto palette(u32 number) const -> di::Optional<Palette const&>;
    auto palette_count() const -> usize { return m_palettes.size(); }

    /// @brief Resolve the color of a custom glyph pixel
    ///
    /// @param cell The cell the glyph is drawn in
    /// @param index The pixel's palette index
    ///
    /// The palette is the cell's base glyph palette if set, otherwise the SGR code of
    /// its foreground color. Without a matching palette, a fixed 4 level scheme is used:
    /// 0 is the background, 1 the foreground, 2 the dimmed foreground and anything higher
    /// the brightened foreground.
    auto resolve_glyph_color(terminal::Cell const& cell, i32 index) const -> Color;

private:
    auto entry(u32 number, usize index) -> di::Optional<PaletteEntry&>;

    di::TreeMap<u32, Palette> m_palettes;
};

/// @brief The palette number a cell implicitly selects
auto palette_number_for(terminal::Cell const& cell) -> u32;
}
