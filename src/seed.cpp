#include "seed.hpp"
#include <string>

std::vector<Item> seed_items() {
  static const int weights[] = {1, 2, 1, 3, 1, 4, 1, 3, 1, 6,
                                1, 3, 1, 2, 1, 1, 4, 1, 5, 4, 1,
                                2, 1, 3};
  std::vector<Item> items;
  items.reserve(24);
  for (int i = 0; i < 24; ++i) {
    Status s = i < 10 ? Status::ToDo : i < 21 ? Status::InProgress : Status::UpNext;
    items.push_back(Item{"Item" + std::to_string(i), weights[i], s});
  }
  return items;
}

std::vector<LogEntry> seed_log_entries() {
  using S = Severity;
  static const S severities[] = {
    S::Info, S::Info, S::Critical, S::Error, S::Info, S::Info, S::Warning, S::Info, S::Info,
    S::Info, S::Critical, S::Info, S::Info, S::Info, S::Info, S::Info, S::Error, S::Error,
    S::Info, S::Info, S::Warning, S::Info, S::Info, S::Warning, S::Info, S::Info
  };
  std::vector<LogEntry> entries;
  entries.reserve(26);
  for (int i = 0; i < 26; ++i) entries.push_back(LogEntry{"Event" + std::to_string(i + 1), severities[i]});
  return entries;
}
