#include "termgrid/palette.h"

#include "di/function/overload.h"
#include "di/util/clamp.h"
#include "termgrid/fnv.h"

namespace termgrid {

auto Palette::hash() const -> u64 {
    if (entries.empty()) {
        return 0;
    }

    auto result = fnv::offset_basis;
    for (auto const& entry : entries) {
        result = di::visit(di::overload(
                               [&](Color const& color) {
                                   auto hash = fnv::mix(result, 0);
                                   hash = fnv::mix(hash, color.r);
                                   hash = fnv::mix(hash, color.g);
                                   return fnv::mix(hash, color.b);
                               },
                               [&](PaletteEntry::Transparent) {
                                   return fnv::mix(result, 1);
                               },
                               [&](PaletteEntry::DefaultForeground) {
                                   return fnv::mix(result, 2);
                               }),
                           entry.value);
        if (entry.dim) {
            result = fnv::mix(result, 1);
        }
    }
    return result;
}

void PaletteStore::init_palette(u32 number, usize length) {
    auto palette = Palette {};
    palette.entries.resize(length);
    m_palettes.insert_or_assign(number, di::move(palette));
}

void PaletteStore::delete_palette(u32 number) {
    m_palettes.erase(number);
}

void PaletteStore::delete_all_palettes() {
    m_palettes.clear();
}

auto PaletteStore::entry(u32 number, usize index) -> di::Optional<PaletteEntry&> {
    auto palette = m_palettes.at(number);
    if (!palette || index >= palette->entries.size()) {
        return {};
    }
    return palette->entries[index];
}

void PaletteStore::set_entry(u32 number, usize index, u32 code, bool dim) {
    auto entry = this->entry(number, index);
    if (!entry) {
        return;
    }

    auto& palette = m_palettes.at(number).value();
    entry->dim = dim;
    if (code == 8) {
        entry->value = PaletteEntry::Transparent {};
        palette.uses_bg = true;
        return;
    }
    if (code == 9) {
        entry->value = PaletteEntry::DefaultForeground {};
        palette.uses_default_fg = true;
        return;
    }

    auto ansi_index = [&] -> u8 {
        if ((code >= 30 && code <= 37) || (code >= 40 && code <= 47)) {
            return u8(code % 10);
        }
        if ((code >= 90 && code <= 97) || (code >= 100 && code <= 107)) {
            return u8(code % 10 + 8);
        }
        return 7;
    }();
    entry->value = Color::standard(ansi_index);
}

void PaletteStore::set_entry_color(u32 number, usize index, Color color, bool dim) {
    auto entry = this->entry(number, index);
    if (!entry) {
        return;
    }
    entry->value = color;
    entry->dim = dim;
}

auto PaletteStore::palette(u32 number) const -> di::Optional<Palette const&> {
    return m_palettes.at(number);
}

auto palette_number_for(terminal::Cell const& cell) -> u32 {
    if (cell.base_glyph_palette) {
        return *cell.base_glyph_palette;
    }
    if (cell.fg.type == Color::Type::Standard) {
        return cell.fg.index < 8 ? 30 + cell.fg.index : 90 + cell.fg.index - 8;
    }
    return 39;
}

static auto resolve_entry(PaletteEntry const& entry, terminal::Cell const& cell) -> Color {
    return di::visit(di::overload(
                         [&](Color const& color) {
                             return entry.dim ? color.dimmed() : color;
                         },
                         [&](PaletteEntry::Transparent) {
                             return cell.bg;
                         },
                         [&](PaletteEntry::DefaultForeground) {
                             return entry.dim ? cell.fg.dimmed() : cell.fg;
                         }),
                     entry.value);
}

auto PaletteStore::resolve_glyph_color(terminal::Cell const& cell, i32 index) const -> Color {
    // NOTE: an empty palette has nothing to clamp into, so it is treated as missing.
    auto palette = this->palette(palette_number_for(cell));
    if (!palette || palette->entries.empty()) {
        switch (index) {
            case 0:
                return cell.bg;
            case 1:
                return cell.fg;
            case 2:
                return cell.fg.dimmed();
            default:
                return cell.fg.brightened();
        }
    }

    auto const& entries = palette->entries;
    if (entries.size() == 1) {
        if (index == 0) {
            return cell.bg;
        }
        return resolve_entry(entries[0], cell);
    }

    auto clamped = usize(di::clamp(index, 0, i32(entries.size() - 1)));
    return resolve_entry(entries[clamped], cell);
}
}
