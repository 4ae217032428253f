#include "termgrid/graphics_rendition.h"

namespace termgrid {
void GraphicsRendition::reset_attributes() {
    fg = Color::default_foreground();
    bg = Color::default_background();
    underline_color = {};
    underline_style = terminal::UnderlineStyle::None;
    bold = false;
    italic = false;
    reverse = false;
    blink = false;
    strikethrough = false;
}

auto GraphicsRendition::blank_cell() const -> terminal::Cell {
    if (reverse) {
        return terminal::blank_cell(bg, fg, bold, italic, underline_style, reverse, blink);
    }
    return terminal::blank_cell(fg, bg, bold, italic, underline_style, reverse, blink);
}

auto GraphicsRendition::make_cell(c32 code_point, f64 width, bool flex_width) const -> terminal::Cell {
    auto cell = terminal::Cell {};
    cell.code_point = code_point;
    cell.fg = reverse ? bg : fg;
    cell.bg = reverse ? fg : bg;
    cell.bold = bold;
    cell.italic = italic;
    cell.underline_style = underline_style;
    cell.underline_color = underline_color;
    cell.reverse = reverse;
    cell.blink = blink;
    cell.strikethrough = strikethrough;
    cell.base_glyph_palette = base_glyph_palette;
    cell.x_flip = x_flip;
    cell.y_flip = y_flip;
    cell.flex_width = flex_width;
    cell.width = width;
    return cell;
}
}
