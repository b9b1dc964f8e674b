#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace linecheck::input {

struct Keystroke {
  char                                  ch = '\0';
  std::chrono::steady_clock::time_point at;
};

struct ScannerInputOptions {
  std::size_t               min_length = 4;
  std::chrono::milliseconds max_gap{50};
  char                      terminator = '\n';
};

/*
  Tells a hardware scanner burst apart from a human typing.

  Returns the token preceding the first terminator when it is at least
  min_length characters and no gap between consecutive keystrokes
  (terminator included) exceeds max_gap. nullopt otherwise, or when no
  terminator was seen.
*/
std::optional<std::string> ClassifyInputStream(const std::vector<Keystroke>& keys, const ScannerInputOptions& options = {});

} // namespace linecheck::input
