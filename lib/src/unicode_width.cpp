#include "termgrid/unicode_width.h"

#include "di/container/algorithm/lower_bound.h"
#include "di/vocab/array/array.h"

namespace termgrid {
using enum EastAsianWidth;

namespace {
struct WidthRange {
    c32 first;
    c32 last;
    EastAsianWidth width;
};

struct MarkRange {
    c32 first;
    c32 last;
};

// Sorted and non-overlapping, so lookups can binary search on the end of each range.
constexpr auto width_table = di::Array {
    WidthRange { 0x0020, 0x007E, Narrow },     // Basic Latin
    WidthRange { 0x00A0, 0x00FF, Narrow },     // Latin-1 Supplement
    WidthRange { 0x0370, 0x03FF, Ambiguous },  // Greek
    WidthRange { 0x0400, 0x04FF, Ambiguous },  // Cyrillic
    WidthRange { 0x1E00, 0x1EFF, Ambiguous },  // Latin Extended Additional
    WidthRange { 0x2010, 0x2027, Ambiguous },  // General Punctuation (dashes, quotes, ellipsis)
    WidthRange { 0x20A0, 0x20CF, Ambiguous },  // Currency Symbols
    WidthRange { 0x2100, 0x214F, Ambiguous },  // Letterlike Symbols
    WidthRange { 0x2150, 0x218F, Ambiguous },  // Number Forms
    WidthRange { 0x2190, 0x21FF, Ambiguous },  // Arrows
    WidthRange { 0x2200, 0x22FF, Ambiguous },  // Mathematical Operators
    WidthRange { 0x2300, 0x23FF, Ambiguous },  // Miscellaneous Technical
    WidthRange { 0x2500, 0x257F, Ambiguous },  // Box Drawing
    WidthRange { 0x2580, 0x259F, Ambiguous },  // Block Elements
    WidthRange { 0x25A0, 0x25FF, Ambiguous },  // Geometric Shapes
    WidthRange { 0x2600, 0x26FF, Ambiguous },  // Miscellaneous Symbols
    WidthRange { 0x2700, 0x27BF, Ambiguous },  // Dingbats
    WidthRange { 0x2E80, 0x2EFF, Wide },       // CJK Radicals Supplement
    WidthRange { 0x2F00, 0x2FDF, Wide },       // Kangxi Radicals
    WidthRange { 0x3000, 0x303F, Wide },       // CJK Symbols and Punctuation
    WidthRange { 0x3040, 0x309F, Wide },       // Hiragana
    WidthRange { 0x30A0, 0x30FF, Wide },       // Katakana
    WidthRange { 0x3100, 0x312F, Wide },       // Bopomofo
    WidthRange { 0x3130, 0x318F, Wide },       // Hangul Compatibility Jamo
    WidthRange { 0x3190, 0x319F, Wide },       // Kanbun
    WidthRange { 0x31A0, 0x31BF, Wide },       // Bopomofo Extended
    WidthRange { 0x31C0, 0x31EF, Wide },       // CJK Strokes
    WidthRange { 0x31F0, 0x31FF, Wide },       // Katakana Phonetic Extensions
    WidthRange { 0x3200, 0x32FF, Wide },       // Enclosed CJK Letters and Months
    WidthRange { 0x3300, 0x33FF, Wide },       // CJK Compatibility
    WidthRange { 0x3400, 0x4DBF, Wide },       // CJK Unified Ideographs Extension A
    WidthRange { 0x4E00, 0x9FFF, Wide },       // CJK Unified Ideographs
    WidthRange { 0xA000, 0xA48F, Wide },       // Yi Syllables
    WidthRange { 0xA490, 0xA4CF, Wide },       // Yi Radicals
    WidthRange { 0xAC00, 0xD7AF, Wide },       // Hangul Syllables
    WidthRange { 0xF900, 0xFAFF, Wide },       // CJK Compatibility Ideographs
    WidthRange { 0xFE10, 0xFE1F, Wide },       // Vertical Forms
    WidthRange { 0xFE30, 0xFE4F, Wide },       // CJK Compatibility Forms
    WidthRange { 0xFE50, 0xFE6F, Wide },       // Small Form Variants
    WidthRange { 0xFF01, 0xFF60, Fullwidth },  // Fullwidth ASCII variants
    WidthRange { 0xFF61, 0xFF64, Halfwidth },  // Halfwidth CJK punctuation
    WidthRange { 0xFF65, 0xFF9F, Halfwidth },  // Halfwidth Katakana
    WidthRange { 0xFFA0, 0xFFDC, Halfwidth },  // Halfwidth Hangul
    WidthRange { 0xFFE0, 0xFFE6, Fullwidth },  // Fullwidth currency symbols
    WidthRange { 0xFFE8, 0xFFEE, Halfwidth },  // Halfwidth symbols
    WidthRange { 0x1F300, 0x1F9FF, Wide },     // Emoji
    WidthRange { 0x1FA00, 0x1FAFF, Wide },     // Symbols and Pictographs Extended-A
    WidthRange { 0x20000, 0x2A6DF, Wide },     // CJK Unified Ideographs Extension B
    WidthRange { 0x2A700, 0x2B73F, Wide },     // CJK Unified Ideographs Extension C
    WidthRange { 0x2B740, 0x2B81F, Wide },     // CJK Unified Ideographs Extension D
    WidthRange { 0x2B820, 0x2CEAF, Wide },     // CJK Unified Ideographs Extension E
    WidthRange { 0x2CEB0, 0x2EBEF, Wide },     // CJK Unified Ideographs Extension F
    WidthRange { 0x2F800, 0x2FA1F, Wide },     // CJK Compatibility Ideographs Supplement
    WidthRange { 0x30000, 0x3134F, Wide },     // CJK Unified Ideographs Extension G
};

constexpr auto combining_table = di::Array {
    MarkRange { 0x0300, 0x036F }, // Combining Diacritical Marks
    MarkRange { 0x0591, 0x05BD }, // Hebrew points
    MarkRange { 0x05BF, 0x05BF }, MarkRange { 0x05C1, 0x05C2 }, MarkRange { 0x05C4, 0x05C5 },
    MarkRange { 0x05C7, 0x05C7 },
    MarkRange { 0x0610, 0x061A }, // Arabic
    MarkRange { 0x064B, 0x065F }, MarkRange { 0x0670, 0x0670 }, MarkRange { 0x06D6, 0x06DC },
    MarkRange { 0x06DF, 0x06E4 }, MarkRange { 0x06E7, 0x06E8 }, MarkRange { 0x06EA, 0x06ED },
    MarkRange { 0x0901, 0x0903 }, // Devanagari
    MarkRange { 0x093A, 0x094F }, MarkRange { 0x0951, 0x0957 }, MarkRange { 0x0962, 0x0963 },
    MarkRange { 0x0E31, 0x0E3A }, // Thai
    MarkRange { 0x0E47, 0x0E4E },
    MarkRange { 0x1160, 0x11FF }, // Hangul medial and final jamo
    MarkRange { 0x1AB0, 0x1AFF }, // Combining Diacritical Marks Extended
    MarkRange { 0x1DC0, 0x1DFF }, // Combining Diacritical Marks Supplement
    MarkRange { 0x200C, 0x200D }, // ZWNJ, ZWJ
    MarkRange { 0x20D0, 0x20FF }, // Combining Diacritical Marks for Symbols
    MarkRange { 0xFE00, 0xFE0F }, // Variation Selectors
    MarkRange { 0xFE20, 0xFE2F }, // Combining Half Marks
};
}

auto east_asian_width(c32 code_point) -> EastAsianWidth {
    auto const* it = di::lower_bound(width_table, code_point, di::compare, &WidthRange::last);
    if (it == width_table.end() || it->first > code_point) {
        return Neutral;
    }
    return it->width;
}

auto east_asian_display_width(c32 code_point) -> f64 {
    switch (east_asian_width(code_point)) {
        case Ambiguous:
            return -1.0;
        case Fullwidth:
        case Wide:
            return 2.0;
        case Neutral:
        case Halfwidth:
        case Narrow:
            return 1.0;
    }
    return 1.0;
}

auto is_combining_mark(c32 code_point) -> bool {
    auto const* it = di::lower_bound(combining_table, code_point, di::compare, &MarkRange::last);
    return it != combining_table.end() && it->first <= code_point;
}

auto is_block_or_line_drawing(c32 code_point) -> bool {
    return code_point >= 0x2500 && code_point <= 0x259F;
}
}
