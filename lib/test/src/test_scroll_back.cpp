#include "di/test/prelude.h"
#include "di/vocab/array/array.h"
#include "termgrid/terminal/scroll_back.h"

namespace scroll_back {
using namespace termgrid;
using namespace termgrid::terminal;

static auto make_row(c32 code_point) -> Row {
    auto row = Row {};
    auto cell = Cell {};
    cell.code_point = code_point;
    row.cells.push_back(cell);
    return row;
}

static void add_rows() {
    auto scroll_back = ScrollBack(3);
    ASSERT(scroll_back.empty());

    ASSERT(!scroll_back.add_row(make_row(U'a')));
    ASSERT(!scroll_back.add_row(make_row(U'b')));
    ASSERT(!scroll_back.add_row(make_row(U'c')));
    ASSERT_EQ(scroll_back.total_rows(), 3u);

    // The oldest row is evicted once full.
    ASSERT(scroll_back.add_row(make_row(U'd')));
    ASSERT_EQ(scroll_back.total_rows(), 3u);
    ASSERT_EQ(scroll_back.row(0).cells[0].code_point, U'b');
    ASSERT_EQ(scroll_back.row(2).cells[0].code_point, U'd');
}

static void zero_limit() {
    auto scroll_back = ScrollBack(0);
    ASSERT(!scroll_back.add_row(make_row(U'a')));
    ASSERT(scroll_back.empty());
}

static void set_max_rows() {
    auto scroll_back = ScrollBack();
    ASSERT_EQ(scroll_back.max_rows(), ScrollBack::default_max_rows);

    for (auto c : di::Array { U'a', U'b', U'c', U'd', U'e' }) {
        scroll_back.add_row(make_row(c));
    }
    ASSERT_EQ(scroll_back.total_rows(), 5u);

    ASSERT_EQ(scroll_back.set_max_rows(2), 3u);
    ASSERT_EQ(scroll_back.total_rows(), 2u);
    ASSERT_EQ(scroll_back.row(0).cells[0].code_point, U'd');

    ASSERT_EQ(scroll_back.set_max_rows(10), 0u);
    ASSERT_EQ(scroll_back.total_rows(), 2u);

    scroll_back.clear();
    ASSERT(scroll_back.empty());
    ASSERT_EQ(scroll_back.max_rows(), 10u);
}

TEST(scroll_back, add_rows)
TEST(scroll_back, zero_limit)
TEST(scroll_back, set_max_rows)
}
