#pragma once
/*
 * Board
 *
 * Purpose: own the work items, the selection cursor and the active column.
 * Note: columns are filtered views over one backing sequence; the cursor
 *       indexes the backing sequence, never a column.
 * Constraint: every operation is total (empty board / no selection = no-op).
 *             Item weights below 1 are raised to 1 on construction.
 */
#include <cstddef>
#include <optional>
#include <vector>
#include "types.hpp"

class Board {
public:
  Board() = default;
  explicit Board(std::vector<Item> items, Status active = Status::ToDo);

  void select_next();
  void select_previous();
  void unselect();
  void delete_selected();
  void cycle_active_column_forward();
  void cycle_active_column_backward();

  const std::vector<Item>& items() const { return items_; }
  size_t size() const { return items_.size(); }
  bool empty() const { return items_.empty(); }
  std::optional<size_t> selected() const { return selected_; }
  const Item* selected_item() const;
  Status active_column() const { return active_column_; }

  std::vector<const Item*> column(Status s) const;
  size_t count(Status s) const;

private:
  std::vector<Item> items_;
  std::optional<size_t> selected_;
  Status active_column_ = Status::ToDo;
};
