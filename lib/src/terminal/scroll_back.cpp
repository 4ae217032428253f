#include "termgrid/terminal/scroll_back.h"

namespace termgrid::terminal {
auto ScrollBack::set_max_rows(usize max_rows) -> usize {
    m_max_rows = max_rows;

    auto evicted = 0_usize;
    while (m_rows.size() > m_max_rows) {
        m_rows.pop_front();
        evicted++;
    }
    return evicted;
}

void ScrollBack::clear() {
    m_rows.clear();
}

auto ScrollBack::add_row(Row row) -> bool {
    if (m_max_rows == 0) {
        return false;
    }

    auto evicted = false;
    if (m_rows.size() >= m_max_rows) {
        m_rows.pop_front();
        evicted = true;
    }
    m_rows.push_back(di::move(row));

    ASSERT_LT_EQ(m_rows.size(), m_max_rows);
    return evicted;
}
}
