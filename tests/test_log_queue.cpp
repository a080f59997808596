#include "log_queue.hpp"
#include "seed.hpp"
#include <cassert>
#include <string>
#include <vector>

static std::vector<std::string> labels(const LogQueue& q) {
  std::vector<std::string> out;
  for (const auto& e : q.entries()) out.push_back(e.label);
  return out;
}

int main() {
  LogQueue q(seed_log_entries());
  assert(q.size() == 26);
  assert(q.front()->label == "Event1");
  assert(q.entries()[2].severity == Severity::Critical);
  auto original = labels(q);

  q.advance();
  assert(q.size() == 26);
  assert(q.front()->label == "Event2");
  assert(q.entries().back().label == "Event1");
  assert(q.entries().back().severity == Severity::Info);
  for (size_t i = 0; i + 1 < q.size(); ++i) assert(q.entries()[i].label == original[i + 1]);

  for (int i = 1; i < 26; ++i) q.advance();
  assert(labels(q) == original);

  LogQueue small({{"a", Severity::Error}, {"b", Severity::Warning}, {"c", Severity::Info}});
  small.advance(); small.advance();
  assert(small.front()->label == "c");
  assert(small.front()->severity == Severity::Info);
  small.advance();
  assert(small.front()->label == "a");

  LogQueue empty;
  empty.advance();
  assert(empty.empty());
  assert(empty.front() == nullptr);
  return 0;
}
