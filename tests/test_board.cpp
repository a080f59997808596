#include "board.hpp"
#include "seed.hpp"
#include <cassert>
#include <string>
#include <vector>

static Board make_board(int n) {
  std::vector<Item> items;
  for (int i = 0; i < n; ++i) items.push_back(Item{"I" + std::to_string(i), 1, Status::ToDo});
  return Board(items);
}

static void test_status_cycle() {
  for (Status s : {Status::ToDo, Status::UpNext, Status::InProgress}) {
    assert(next_status(next_status(next_status(s))) == s);
    assert(prev_status(next_status(s)) == s);
    assert(next_status(prev_status(s)) == s);
  }
  assert(next_status(Status::ToDo) == Status::UpNext);
  assert(next_status(Status::UpNext) == Status::InProgress);
  assert(prev_status(Status::ToDo) == Status::InProgress);
}

static void test_active_column() {
  Board b = make_board(3);
  assert(b.active_column() == Status::ToDo);
  b.cycle_active_column_forward();
  assert(b.active_column() == Status::UpNext);
  b.cycle_active_column_forward();
  b.cycle_active_column_forward();
  assert(b.active_column() == Status::ToDo);
  b.cycle_active_column_backward();
  assert(b.active_column() == Status::InProgress);
  b.cycle_active_column_forward();
  assert(b.active_column() == Status::ToDo);
  // column changes never touch the cursor
  assert(!b.selected());
}

static void test_navigation_wraps() {
  Board b = make_board(5);
  assert(!b.selected());
  b.select_next();
  assert(b.selected() == 0u);
  for (int i = 0; i < 5; ++i) b.select_next();
  assert(b.selected() == 0u);
  b.select_previous();
  assert(b.selected() == 4u);
  b.select_next();
  assert(b.selected() == 0u);

  Board c = make_board(5);
  c.select_previous();
  assert(c.selected() == 0u);

  for (size_t start = 0; start < 5; ++start) {
    Board d = make_board(5);
    d.select_next();
    for (size_t k = 0; k < start; ++k) d.select_next();
    assert(d.selected() == start);
    d.select_next(); d.select_previous();
    assert(d.selected() == start);
    d.select_previous(); d.select_next();
    assert(d.selected() == start);
  }
}

static void test_empty_board_is_inert() {
  Board b;
  b.select_next();
  b.select_previous();
  assert(!b.selected());
  b.delete_selected();
  assert(b.empty());
  b.unselect();
  assert(!b.selected());
  assert(b.selected_item() == nullptr);
}

static void test_unselect() {
  Board b = make_board(2);
  b.select_next();
  b.unselect();
  assert(!b.selected());
  b.unselect();
  assert(!b.selected());
}

static void test_delete() {
  Board one = make_board(1);
  one.select_next();
  one.delete_selected();
  assert(one.empty());
  assert(!one.selected());

  Board b = make_board(5);
  b.delete_selected();
  assert(b.size() == 5);

  b.select_next(); b.select_next(); b.select_next(); // index 2
  b.delete_selected();
  assert(b.size() == 4);
  assert(b.selected() == 1u);
  assert(b.items()[1].label == "I1");
  assert(b.items()[2].label == "I3");

  b.select_previous(); // index 0
  b.delete_selected();
  assert(b.size() == 3);
  assert(b.selected() == 0u);
  assert(b.selected_item()->label == "I1");

  b.select_previous(); // wraps to last
  assert(b.selected() == 2u);
  b.delete_selected();
  assert(b.selected() == 1u);
  assert(b.size() == 2);
}

// The cursor addresses the backing sequence, not the active column's view.
static void test_cursor_ignores_column_filter() {
  Board b({{"A", 1, Status::ToDo}, {"B", 2, Status::UpNext}, {"C", 1, Status::ToDo}});
  b.select_next(); b.select_next();
  assert(b.selected() == 1u);
  assert(b.selected_item()->label == "B");
  auto todo = b.column(Status::ToDo);
  assert(todo.size() == 2);
  assert(todo[1]->label == "C");
  b.delete_selected();
  assert(b.size() == 2);
  assert(b.count(Status::UpNext) == 0);
  assert(b.count(Status::ToDo) == 2);
  assert(b.selected() == 0u);
}

static void test_seed() {
  Board b(seed_items());
  assert(b.size() == 24);
  assert(b.count(Status::ToDo) == 10);
  assert(b.count(Status::InProgress) == 11);
  assert(b.count(Status::UpNext) == 3);
  assert(b.items()[9].weight == 6);
  assert(b.items()[23].label == "Item23");
  auto up = b.column(Status::UpNext);
  assert(up.size() == 3 && up[0]->label == "Item21");
  b.cycle_active_column_forward(); b.cycle_active_column_forward(); b.cycle_active_column_forward();
  assert(b.active_column() == Status::ToDo);
  b.delete_selected();
  assert(b.size() == 24);
}

static void test_weights_are_positive() {
  Board b({{"zero", 0, Status::ToDo}, {"neg", -3, Status::UpNext}, {"big", 4, Status::InProgress}});
  assert(b.items()[0].weight == 1);
  assert(b.items()[1].weight == 1);
  assert(b.items()[2].weight == 4);
}

int main() {
  test_status_cycle();
  test_active_column();
  test_navigation_wraps();
  test_empty_board_is_inert();
  test_unselect();
  test_delete();
  test_cursor_ignores_column_filter();
  test_seed();
  test_weights_are_positive();
  return 0;
}
