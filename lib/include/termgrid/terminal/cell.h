#pragma once

#include "di/container/string/prelude.h"
#include "di/reflect/prelude.h"
#include "di/types/integers.h"
#include "di/container/vector/vector.h"
#include "di/vocab/optional/prelude.h"
#include "di/vocab/span/prelude.h"
#include "termgrid/color.h"

namespace termgrid::terminal {
enum class UnderlineStyle : u8 {
    None = 0,
    Single = 1,
    Double = 2,
    Curly = 3,
    Dotted = 4,
    Dashed = 5,
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<UnderlineStyle>) {
    using enum UnderlineStyle;
    return di::make_enumerators<"UnderlineStyle">(di::enumerator<"None", None>, di::enumerator<"Single", Single>,
                                                  di::enumerator<"Double", Double>, di::enumerator<"Curly", Curly>,
                                                  di::enumerator<"Dotted", Dotted>, di::enumerator<"Dashed", Dashed>);
}

/// @brief Combining marks attached to a cell's base code point
///
/// The marks are heap allocated only once a mark is attached, so plain cells stay cheap to copy.
class CombiningMarks {
public:
    CombiningMarks() = default;

    CombiningMarks(CombiningMarks const& other) : m_marks(other.m_marks.clone()) {}
    CombiningMarks(CombiningMarks&&) = default;

    auto operator=(CombiningMarks const& other) -> CombiningMarks& {
        if (this != &other) {
            m_marks = other.m_marks.clone();
        }
        return *this;
    }
    auto operator=(CombiningMarks&&) -> CombiningMarks& = default;

    void add(c32 code_point) { m_marks.push_back(code_point); }
    void clear() { m_marks.clear(); }

    auto size() const -> usize { return m_marks.size(); }
    auto empty() const -> bool { return m_marks.empty(); }
    auto span() const -> di::Span<c32 const> { return { m_marks.data(), m_marks.size() }; }

    auto operator==(CombiningMarks const& other) const -> bool { return m_marks == other.m_marks; }

private:
    di::Vector<c32> m_marks;
};

/// @brief Represents a on-screen terminal cell
struct Cell {
    c32 code_point { U' ' };
    CombiningMarks combining_marks;

    Color fg { Color::default_foreground() };
    Color bg { Color::default_background() };
    di::Optional<Color> underline_color;   ///< Empty means use the foreground color
    di::Optional<u32> base_glyph_palette;  ///< Empty means derive the palette from fg
    f64 width { 1.0 };                     ///< Display width in columns, always positive
    UnderlineStyle underline_style { UnderlineStyle::None };

    bool bold { false };
    bool italic { false };
    bool reverse { false };
    bool blink { false };
    bool strikethrough { false };
    bool flex_width { false }; ///< Set if width was computed from the character instead of fixed at 1
    bool x_flip { false };
    bool y_flip { false };

    auto underline() const -> bool { return underline_style != UnderlineStyle::None; }

    auto combining() const -> di::Span<c32 const> { return combining_marks.span(); }

    void add_combining_mark(c32 code_point) { combining_marks.add(code_point); }

    /// @brief The base code point followed by any combining marks
    auto text() const -> di::String {
        auto result = di::String {};
        result.push_back(code_point);
        for (auto mark : combining()) {
            result.push_back(mark);
        }
        return result;
    }

    /// @brief A copy of this cell with its content replaced by a blank
    auto blanked() const -> Cell {
        auto result = *this;
        result.code_point = U' ';
        result.combining_marks.clear();
        return result;
    }

    auto operator==(Cell const&) const -> bool = default;
};

/// @brief A blank cell with the given attributes
///
/// This is what erase operations fill with. The underline style is carried so that
/// erased regions keep rendering the active underline.
inline auto blank_cell(Color fg, Color bg, bool bold, bool italic, UnderlineStyle underline_style, bool reverse,
                       bool blink) -> Cell {
    auto result = Cell {};
    result.fg = fg;
    result.bg = bg;
    result.bold = bold;
    result.italic = italic;
    result.underline_style = underline_style;
    result.reverse = reverse;
    result.blink = blink;
    return result;
}
}
