#pragma once

#include "di/reflect/prelude.h"
#include "di/types/integers.h"

namespace termgrid {
enum class CursorShape : u8 {
    Block = 0,
    Underline = 1,
    Bar = 2,
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<CursorShape>) {
    using enum CursorShape;
    return di::make_enumerators<"CursorShape">(di::enumerator<"Block", Block>, di::enumerator<"Underline", Underline>,
                                               di::enumerator<"Bar", Bar>);
}

enum class CursorBlink : u8 {
    None = 0,
    Slow = 1,
    Fast = 2,
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<CursorBlink>) {
    using enum CursorBlink;
    return di::make_enumerators<"CursorBlink">(di::enumerator<"None", None>, di::enumerator<"Slow", Slow>,
                                               di::enumerator<"Fast", Fast>);
}

struct CursorStyle {
    CursorShape shape { CursorShape::Block };
    CursorBlink blink { CursorBlink::None };

    auto operator==(CursorStyle const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<CursorStyle>) {
        return di::make_fields<"CursorStyle">(di::field<"shape", &CursorStyle::shape>,
                                              di::field<"blink", &CursorStyle::blink>);
    }
};
}
