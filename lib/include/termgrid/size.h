#pragma once

#include "di/reflect/prelude.h"
#include "di/types/prelude.h"

namespace termgrid {
struct Size {
    u32 rows { 0 };
    u32 cols { 0 };

    auto operator==(Size const&) const -> bool = default;
    auto operator<=>(Size const&) const = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Size>) {
        return di::make_fields<"Size">(di::field<"rows", &Size::rows>, di::field<"cols", &Size::cols>);
    }
};
}
