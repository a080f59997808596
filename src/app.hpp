#pragma once
/*
 * App
 *
 * Purpose: the control loop; owns Board + LogQueue, routes key presses and
 *          rotates the log on a fixed tick.
 * Loop: render → poll (bounded by time left until next tick) → at most one
 *       board command → at most one log rotation. Input never resets the tick.
 */
#include <chrono>
#include <string>
#include "board.hpp"
#include "config.hpp"
#include "iterminal.hpp"
#include "key_bindings.hpp"
#include "key_source.hpp"
#include "log_queue.hpp"
#include "renderer.hpp"

class App {
public:
  enum class State { Running, Terminated };
  using Clock = std::chrono::steady_clock;

  App(ITerminal& term, IKeySource& keys, Board board, LogQueue logs,
      std::chrono::milliseconds tick_interval = std::chrono::milliseconds(KB_TICK_MS));
  void run();
  void handle_key(int ch);
  void on_tick();

  static std::chrono::milliseconds poll_timeout(std::chrono::milliseconds tick_interval,
                                                Clock::duration elapsed);

  State state() const { return state_; }
  const Board& board() const { return board_; }
  const LogQueue& logs() const { return logs_; }
  const std::string& message() const { return message_; }
  const KeyBindings& bindings() const { return bindings_; }
  const ColumnViewport& viewport(Status s) const { return viewports_[static_cast<int>(s)]; }
  int ticks() const { return ticks_; }

private:
  void render();
  void register_bindings();
  void select_next();
  void select_previous();
  void unselect();
  void delete_selected();
  void cycle_column(bool forward);

  ITerminal& term_;
  IKeySource& keys_;
  Board board_;
  LogQueue logs_;
  std::chrono::milliseconds tick_interval_;
  State state_ = State::Running;
  std::string message_;
  KeyBindings bindings_;
  Renderer renderer_;
  ColumnViewports viewports_{};
  int ticks_ = 0;
};
