#include "board.hpp"
#include <algorithm>
#include <utility>

Board::Board(std::vector<Item> items, Status active)
  : items_(std::move(items)), active_column_(active) {
  for (auto& it : items_) it.weight = std::max(1, it.weight);
}

void Board::select_next() {
  if (items_.empty()) return;
  size_t i = 0;
  if (selected_) i = (*selected_ + 1 >= items_.size()) ? 0 : *selected_ + 1;
  selected_ = i;
}

void Board::select_previous() {
  if (items_.empty()) return;
  size_t i = 0;
  if (selected_) i = (*selected_ == 0) ? items_.size() - 1 : *selected_ - 1;
  selected_ = i;
}

void Board::unselect() { selected_.reset(); }

void Board::delete_selected() {
  if (!selected_) return;
  size_t i = *selected_;
  if (i >= items_.size()) { selected_.reset(); return; }
  items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(i));
  if (items_.empty()) { selected_.reset(); return; }
  selected_ = (i == 0) ? 0 : i - 1;
}

void Board::cycle_active_column_forward() { active_column_ = next_status(active_column_); }

void Board::cycle_active_column_backward() { active_column_ = prev_status(active_column_); }

const Item* Board::selected_item() const {
  if (!selected_ || *selected_ >= items_.size()) return nullptr;
  return &items_[*selected_];
}

std::vector<const Item*> Board::column(Status s) const {
  std::vector<const Item*> out;
  for (const auto& it : items_) if (it.status == s) out.push_back(&it);
  return out;
}

size_t Board::count(Status s) const {
  return static_cast<size_t>(std::count_if(items_.begin(), items_.end(),
                                           [s](const Item& it){ return it.status == s; }));
}
