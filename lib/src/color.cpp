#include "termgrid/color.h"

#include "di/container/algorithm/find.h"
#include "di/format/prelude.h"
#include "di/util/unreachable.h"

namespace termgrid {
auto Color::standard(u8 index) -> Color {
    if (index >= ansi_colors.size()) {
        index = 7;
    }
    auto [r, g, b] = ansi_colors[index];
    return { Type::Standard, index, r, g, b };
}

auto Color::palette(u8 index) -> Color {
    auto [r, g, b] = palette_rgb(index);
    return { Type::Palette, index, r, g, b };
}

auto Color::dimmed() const -> Color {
    // NOTE: truncation is intended.
    return true_color(u8(f64(r) * 0.6), u8(f64(g) * 0.6), u8(f64(b) * 0.6));
}

auto Color::brightened(u8 amount) const -> Color {
    auto add = [&](u8 channel) -> u8 {
        auto value = u32(channel) + amount;
        return u8(value > 255 ? 255 : value);
    };
    return true_color(add(r), add(g), add(b));
}

auto Color::sgr_code(ColorLayer layer) const -> di::String {
    auto fg = layer == ColorLayer::Foreground;
    switch (type) {
        case Type::Default:
            return fg ? "39"_s : "49"_s;
        case Type::Standard:
            if (index < 8) {
                return *di::present("{}"_sv, (fg ? 30 : 40) + index);
            }
            return *di::present("{}"_sv, (fg ? 90 : 100) + index - 8);
        case Type::Palette:
            return *di::present("{};5;{}"_sv, fg ? 38 : 48, u32(index));
        case Type::TrueColor:
            return *di::present("{};2;{};{};{}"_sv, fg ? 38 : 48, u32(r), u32(g), u32(b));
    }
    di::unreachable();
}

auto palette_rgb(u8 index) -> Rgb {
    if (index < 16) {
        return ansi_colors[index];
    }
    if (index < 232) {
        auto cube = index - 16;
        return { u8((cube / 36) * 51), u8(((cube / 6) % 6) * 51), u8((cube % 6) * 51) };
    }
    auto gray = u8((index - 232) * 10 + 8);
    return { gray, gray, gray };
}

auto color_to_ansi_code(Color const& color) -> u32 {
    switch (color.type) {
        case Color::Type::Default:
            return 39;
        case Color::Type::Standard:
            return color.index < 8 ? 30 + color.index : 90 + color.index - 8;
        case Color::Type::Palette:
            if (color.index < 8) {
                return 30 + color.index;
            }
            if (color.index < 16) {
                return 90 + color.index - 8;
            }
            return color.index;
        case Color::Type::TrueColor: {
            auto it = di::find(ansi_colors, Rgb { color.r, color.g, color.b });
            if (it == ansi_colors.end()) {
                return 37;
            }
            auto index = u32(di::distance(ansi_colors.begin(), it));
            return index < 8 ? 30 + index : 90 + index - 8;
        }
    }
    di::unreachable();
}
}
