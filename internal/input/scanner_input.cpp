#include "internal/input/scanner_input.hpp"

namespace linecheck::input {

std::optional<std::string> ClassifyInputStream(const std::vector<Keystroke>& keys, const ScannerInputOptions& options) {
  std::string token;
  for (std::size_t i = 0; i < keys.size(); ++i) {
    if (i > 0 && keys[i].at - keys[i - 1].at > options.max_gap) {
      return std::nullopt;
    }
    if (keys[i].ch == options.terminator) {
      if (token.size() < options.min_length) {
        return std::nullopt;
      }
      return token;
    }
    token.push_back(keys[i].ch);
  }
  return std::nullopt;
}

} // namespace linecheck::input
