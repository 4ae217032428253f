#pragma once

#include "di/reflect/prelude.h"
#include "di/types/prelude.h"
#include "termgrid/cursor_style.h"

namespace termgrid::terminal {
/// @brief Direction of the most recent cursor movement along one axis
enum class MoveDirection : i8 {
    Backward = -1, ///< Left or up
    None = 0,      ///< Unknown (absolute positioning)
    Forward = 1,   ///< Right or down
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<MoveDirection>) {
    using enum MoveDirection;
    return di::make_enumerators<"MoveDirection">(di::enumerator<"Backward", Backward>, di::enumerator<"None", None>,
                                                 di::enumerator<"Forward", Forward>);
}

/// @brief Represents the current cursor position of the terminal.
///
/// The column may equal the column count after a write fills the last column. The
/// next printable character then wraps (or overwrites the last column if auto wrap
/// is disabled).
struct Cursor {
    u32 row { 0 };                                           ///< Row (y coordinate)
    u32 col { 0 };                                           ///< Column (x coordinate)
    MoveDirection horizontal_direction { MoveDirection::None }; ///< Last horizontal movement
    MoveDirection vertical_direction { MoveDirection::None };   ///< Last vertical movement
    bool absolute_position { false }; ///< Set if the last horizontal change was an absolute move
    bool visible { true };
    CursorStyle style {};

    auto operator==(Cursor const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Cursor>) {
        return di::make_fields<"Cursor">(
            di::field<"row", &Cursor::row>, di::field<"col", &Cursor::col>,
            di::field<"horizontal_direction", &Cursor::horizontal_direction>,
            di::field<"vertical_direction", &Cursor::vertical_direction>,
            di::field<"absolute_position", &Cursor::absolute_position>, di::field<"visible", &Cursor::visible>,
            di::field<"style", &Cursor::style>);
    }
};

/// @brief Represents the saved cursor state, which is used for save/restore cursor operations.
struct SavedCursor {
    u32 row { 0 }; ///< Row (y coordinate)
    u32 col { 0 }; ///< Column (x coordinate)

    auto operator==(SavedCursor const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<SavedCursor>) {
        return di::make_fields<"SavedCursor">(di::field<"row", &SavedCursor::row>,
                                              di::field<"col", &SavedCursor::col>);
    }
};
}
