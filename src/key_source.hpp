#pragma once
/*
 * IKeySource
 *
 * Purpose: input transport; one bounded poll yields at most one key press.
 * Contract: returns early once a key is available, nullopt on timeout.
 */
#include <chrono>
#include <optional>

class IKeySource {
public:
  virtual ~IKeySource() = default;
  virtual std::optional<int> poll_key(std::chrono::milliseconds timeout) = 0;
};
