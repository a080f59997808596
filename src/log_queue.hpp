#pragma once
/*
 * LogQueue
 *
 * Purpose: fixed set of log entries rotated once per tick.
 * Constraint: rotation only reorders; entries are never created or dropped.
 */
#include <cstddef>
#include <deque>
#include <vector>
#include "types.hpp"

class LogQueue {
public:
  LogQueue() = default;
  explicit LogQueue(std::vector<LogEntry> entries);

  void advance();

  const std::deque<LogEntry>& entries() const { return entries_; }
  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  const LogEntry* front() const { return entries_.empty() ? nullptr : &entries_.front(); }

private:
  std::deque<LogEntry> entries_;
};
