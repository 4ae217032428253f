#pragma once

#include "di/container/vector/prelude.h"
#include "di/reflect/prelude.h"
#include "termgrid/terminal/cell.h"

namespace termgrid::terminal {
enum class LineAttribute : u8 {
    Normal,
    DoubleWidth,
    DoubleTop,    ///< Top half of a double height line
    DoubleBottom, ///< Bottom half of a double height line
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<LineAttribute>) {
    using enum LineAttribute;
    return di::make_enumerators<"LineAttribute">(di::enumerator<"Normal", Normal>,
                                                 di::enumerator<"DoubleWidth", DoubleWidth>,
                                                 di::enumerator<"DoubleTop", DoubleTop>,
                                                 di::enumerator<"DoubleBottom", DoubleBottom>);
}

/// @brief Per-row rendering information
struct LineInfo {
    LineAttribute attribute { LineAttribute::Normal };
    Cell default_cell {}; ///< Fills the row past its stored cells

    auto operator==(LineInfo const&) const -> bool = default;
};

/// @brief Represents a terminal row of cells
///
/// Rows are variable length. Columns past the end of the cell vector are
/// conceptually filled with the line info's default cell.
struct Row {
    di::Vector<Cell> cells; ///< Stored cells, may be shorter or (visually) wider than the screen.
    LineInfo info;

    /// @brief The cell at @p col, or the fill cell if @p col is past the stored cells
    auto cell_or_default(u32 col) const -> Cell {
        if (col < cells.size()) {
            return cells[col];
        }
        return info.default_cell.blanked();
    }

    auto clone() const -> Row { return { cells.clone(), info }; }
};
}
