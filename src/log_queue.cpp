#include "log_queue.hpp"
#include <iterator>
#include <utility>

LogQueue::LogQueue(std::vector<LogEntry> entries)
  : entries_(std::make_move_iterator(entries.begin()), std::make_move_iterator(entries.end())) {}

void LogQueue::advance() {
  if (entries_.empty()) return;
  LogEntry e = std::move(entries_.front());
  entries_.pop_front();
  entries_.push_back(std::move(e));
}
