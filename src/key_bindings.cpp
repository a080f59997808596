#include "key_bindings.hpp"
#include <algorithm>
#include <utility>

void KeyBindings::bind(int key, const std::string& label, const std::string& name, Handler h) {
  if (map_.find(key) == map_.end()) order_.push_back(key);
  map_[key] = Binding{label, name, std::move(h)};
}

bool KeyBindings::dispatch(int key) const {
  auto it = map_.find(key);
  if (it == map_.end()) return false;
  if (it->second.handler) it->second.handler();
  return true;
}

const std::string* KeyBindings::name_of(int key) const {
  auto it = map_.find(key);
  if (it == map_.end()) return nullptr;
  return &it->second.name;
}

std::string KeyBindings::hints() const {
  std::vector<std::pair<std::string, std::string>> groups; // name → labels
  for (int key : order_) {
    const Binding& b = map_.at(key);
    auto g = std::find_if(groups.begin(), groups.end(), [&](const auto& p){ return p.first == b.name; });
    if (g == groups.end()) groups.emplace_back(b.name, b.label);
    else g->second += "/" + b.label;
  }
  std::string out;
  for (const auto& [name, labels] : groups) {
    if (!out.empty()) out += " ";
    out += labels + ":" + name;
  }
  return out;
}
