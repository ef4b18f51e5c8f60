#pragma once

#include "rule.hpp"

#include <cstddef>
#include <vector>

namespace fuselex {

// Stack of active lexer states. Always holds at least one frame.
class StateStack {
public:
  explicit StateStack(StateId initial = StateId::Root);

  StateId top() const { return frames_.back(); }
  std::size_t depth() const { return frames_.size(); }

  void push(StateId state);

  // Returns false (and leaves the stack untouched) when only one frame is
  // left.
  bool pop();

  // Replace the top frame.
  void go(StateId state);

  void reset(StateId initial);

  const std::vector<StateId> &frames() const { return frames_; }

private:
  std::vector<StateId> frames_;
};

} // namespace fuselex
