#include "app.hpp"
#include <algorithm>
#include <ncurses.h>
#include <utility>

App::App(ITerminal& term, IKeySource& keys, Board board, LogQueue logs,
         std::chrono::milliseconds tick_interval)
  : term_(term), keys_(keys), board_(std::move(board)), logs_(std::move(logs)),
    tick_interval_(tick_interval) {
  register_bindings();
}

void App::register_bindings() {
  bindings_.bind('q', "q", "quit", [this]{ state_ = State::Terminated; });
  bindings_.bind(KEY_LEFT, "Left", "unselect", [this]{ unselect(); });
  bindings_.bind(KEY_DOWN, "Down", "next", [this]{ select_next(); });
  bindings_.bind('j', "j", "next", [this]{ select_next(); });
  bindings_.bind(KEY_UP, "Up", "prev", [this]{ select_previous(); });
  bindings_.bind('k', "k", "prev", [this]{ select_previous(); });
  bindings_.bind('l', "l", "column>", [this]{ cycle_column(true); });
  bindings_.bind('h', "h", "column<", [this]{ cycle_column(false); });
  bindings_.bind('x', "x", "delete", [this]{ delete_selected(); });
}

std::chrono::milliseconds App::poll_timeout(std::chrono::milliseconds tick_interval,
                                            Clock::duration elapsed) {
  auto remaining = std::chrono::ceil<std::chrono::milliseconds>(tick_interval - elapsed);
  return std::max(remaining, std::chrono::milliseconds(0));
}

void App::run() {
  auto last_tick = Clock::now();
  while (state_ == State::Running) {
    render();
    auto timeout = poll_timeout(tick_interval_, Clock::now() - last_tick);
    if (auto ch = keys_.poll_key(timeout)) handle_key(*ch);
    if (state_ == State::Terminated) break;
    if (Clock::now() - last_tick >= tick_interval_) {
      on_tick();
      last_tick = Clock::now();
    }
  }
}

void App::handle_key(int ch) {
  if (state_ != State::Running) return;
  bindings_.dispatch(ch);
}

void App::on_tick() {
  logs_.advance();
  ticks_++;
}

void App::render() {
  renderer_.render(term_, board_, logs_, viewports_, message_, bindings_.hints());
}

void App::select_next() {
  if (board_.empty()) { message_ = "board is empty"; return; }
  board_.select_next();
  if (const Item* it = board_.selected_item()) message_ = "selected " + it->label;
}

void App::select_previous() {
  if (board_.empty()) { message_ = "board is empty"; return; }
  board_.select_previous();
  if (const Item* it = board_.selected_item()) message_ = "selected " + it->label;
}

void App::unselect() {
  board_.unselect();
  message_ = "selection cleared";
}

void App::delete_selected() {
  const Item* it = board_.selected_item();
  if (!it) { message_ = "nothing selected"; return; }
  std::string label = it->label;
  board_.delete_selected();
  message_ = "deleted " + label;
}

void App::cycle_column(bool forward) {
  if (forward) board_.cycle_active_column_forward();
  else board_.cycle_active_column_backward();
  message_ = std::string("column: ") + status_name(board_.active_column());
}
