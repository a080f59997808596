#pragma once
/*
 * KeyBindings
 *
 * Purpose: register and dispatch key handlers.
 * Design: map key code → (name, handler); App binds and routes key presses.
 * hints() lists bindings in registration order, keys sharing a name grouped.
 */
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

class KeyBindings {
public:
  using Handler = std::function<void()>;
  void bind(int key, const std::string& label, const std::string& name, Handler h);
  bool dispatch(int key) const;
  bool bound(int key) const { return map_.count(key) != 0; }
  const std::string* name_of(int key) const;
  std::string hints() const;

private:
  struct Binding {
    std::string label;
    std::string name;
    Handler handler;
  };
  std::unordered_map<int, Binding> map_;
  std::vector<int> order_;
};
