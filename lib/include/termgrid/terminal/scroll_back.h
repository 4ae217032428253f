#pragma once

#include "di/assert/prelude.h"
#include "di/container/ring/prelude.h"
#include "di/container/string/prelude.h"
#include "termgrid/terminal/row.h"

namespace termgrid::terminal {
/// @brief Represents the terminal scroll back
///
/// Rows scrolled off the top of the screen are stored here along with their line info,
/// oldest first. Once the row limit is reached, adding a row evicts the oldest one.
///
/// The scroll back is unaffected by resize operations, so rows can be over or under
/// sized relative to the screen when they are displayed.
class ScrollBack {
public:
    constexpr static auto default_max_rows = 10000zu;

    ScrollBack() = default;
    explicit ScrollBack(usize max_rows) : m_max_rows(max_rows) {}

    auto max_rows() const -> usize { return m_max_rows; }
    auto total_rows() const -> usize { return m_rows.size(); }
    auto empty() const -> bool { return m_rows.empty(); }

    /// @brief Change the row limit, evicting the oldest rows if now over the limit
    ///
    /// @return The number of rows evicted
    auto set_max_rows(usize max_rows) -> usize;

    /// @brief Clear the scroll back history
    void clear();

    /// @brief Add a row to the end of the scroll back buffer
    ///
    /// @return Whether the oldest row was evicted to make room
    ///
    /// With a limit of 0 the row is discarded immediately.
    auto add_row(Row row) -> bool;

    auto row(usize index) const -> Row const& {
        ASSERT_LT(index, total_rows());
        return m_rows[index];
    }
    auto rows() const -> di::Ring<Row> const& { return m_rows; }

private:
    di::Ring<Row> m_rows;
    usize m_max_rows { default_max_rows };
};
}
