#include <tdw/sequence.hpp>
#include <algorithm>

namespace tdw {

const std::vector<Keystroke>& boost_sequence() {
  static const std::vector<Keystroke> seq = {
    Keystroke::Up, Keystroke::Up, Keystroke::Down, Keystroke::Down,
    Keystroke::Left, Keystroke::Right, Keystroke::Left, Keystroke::Right,
    Keystroke::B, Keystroke::A,
  };
  return seq;
}

bool SequenceMatcher::push(Keystroke k) {
  if (pattern_.empty()) return false;
  recent_.push_back(k);
  while (recent_.size() > pattern_.size()) recent_.pop_front();
  if (recent_.size() != pattern_.size()) return false;
  return std::equal(recent_.begin(), recent_.end(), pattern_.begin());
}

} // namespace tdw
