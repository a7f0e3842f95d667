#pragma once
#include <cstddef>
#include <deque>
#include <utility>
#include <vector>

namespace tdw {

// Keystrokes the sequence matcher understands; everything else maps to Other.
enum class Keystroke : int { Up = 0, Down, Left, Right, A, B, Other };

// Up Up Down Down Left Right Left Right B A
const std::vector<Keystroke>& boost_sequence();

// Matches the tail of an ordered keystroke log against a fixed pattern.
class SequenceMatcher {
public:
  SequenceMatcher() : SequenceMatcher(boost_sequence()) {}
  explicit SequenceMatcher(std::vector<Keystroke> pattern) : pattern_(std::move(pattern)) {}

  // Appends k; returns true if the most recent keystrokes spell the pattern.
  bool push(Keystroke k);
  void clear() { recent_.clear(); }

  const std::vector<Keystroke>& pattern() const { return pattern_; }
  std::size_t buffered() const { return recent_.size(); }

private:
  std::vector<Keystroke> pattern_;
  std::deque<Keystroke>  recent_;   // never longer than pattern_
};

} // namespace tdw
