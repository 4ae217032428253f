#include "termgrid/custom_glyph.h"

#include "termgrid/fnv.h"

namespace termgrid {
CustomGlyph::CustomGlyph(u32 width, di::Vector<i32> pixels) : m_width(width), m_pixels(di::move(pixels)) {
    if (m_width > 0 && !m_pixels.empty()) {
        m_height = u32((m_pixels.size() + m_width - 1) / m_width);
    }
}

auto CustomGlyph::pixel(u32 x, u32 y) const -> i32 {
    if (x >= m_width || y >= m_height) {
        return 0;
    }
    auto index = usize(y) * m_width + x;
    if (index >= m_pixels.size()) {
        return 0;
    }
    return m_pixels[index];
}

auto CustomGlyph::hash() const -> u64 {
    if (m_pixels.empty()) {
        return 0;
    }

    auto result = fnv::mix(fnv::offset_basis, m_width);
    result = fnv::mix(result, m_height);
    for (auto pixel : m_pixels) {
        // Sign extend, so negative indices hash like their 64 bit two's complement.
        result = fnv::mix(result, u64(i64(pixel)));
    }
    return result;
}

void GlyphStore::set_glyph(c32 code_point, u32 width, di::Vector<i32> pixels) {
    m_glyphs.insert_or_assign(code_point, CustomGlyph(width, di::move(pixels)));
}

auto GlyphStore::glyph(c32 code_point) const -> di::Optional<CustomGlyph const&> {
    return m_glyphs.at(code_point);
}

void GlyphStore::delete_glyph(c32 code_point) {
    m_glyphs.erase(code_point);
}

void GlyphStore::delete_all_glyphs() {
    m_glyphs.clear();
}
}
