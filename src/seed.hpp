#pragma once
/*
 * Seed
 *
 * Purpose: the fixed data every run starts from (24 items, 26 log entries).
 */
#include <vector>
#include "types.hpp"

std::vector<Item> seed_items();
std::vector<LogEntry> seed_log_entries();
