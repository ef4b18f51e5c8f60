#include "state_stack.hpp"

namespace fuselex {

StateStack::StateStack(StateId initial) { reset(initial); }

void StateStack::push(StateId state) { frames_.push_back(state); }

bool StateStack::pop() {
  if (frames_.size() <= 1) {
    return false;
  }
  frames_.pop_back();
  return true;
}

void StateStack::go(StateId state) { frames_.back() = state; }

void StateStack::reset(StateId initial) {
  frames_.clear();
  frames_.push_back(initial);
}

} // namespace fuselex
