#include "internal/input/scanner_input.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

namespace {

using linecheck::input::ClassifyInputStream;
using linecheck::input::Keystroke;
using linecheck::input::ScannerInputOptions;

std::vector<Keystroke> Typed(const std::string& text, std::chrono::milliseconds gap) {
  std::vector<Keystroke> keys;
  auto                   at = std::chrono::steady_clock::time_point{} + std::chrono::seconds(1);
  for (char c : text) {
    keys.push_back(Keystroke{.ch = c, .at = at});
    at += gap;
  }
  return keys;
}

void TestScannerBurstIsAccepted() {
  const auto token = ClassifyInputStream(Typed("012345678905\n", std::chrono::milliseconds(5)));
  assert(token);
  assert(*token == "012345678905");
}

void TestHumanTypingIsRejected() {
  assert(!ClassifyInputStream(Typed("012345678905\n", std::chrono::milliseconds(120))));

  // one slow key anywhere, the terminator included, rejects the burst
  auto keys = Typed("0123\n", std::chrono::milliseconds(5));
  keys.back().at += std::chrono::milliseconds(200);
  assert(!ClassifyInputStream(keys));
}

void TestShortOrUnterminatedInput() {
  assert(!ClassifyInputStream(Typed("012\n", std::chrono::milliseconds(5))));
  assert(!ClassifyInputStream(Typed("01234", std::chrono::milliseconds(5))));
  assert(!ClassifyInputStream({}));
}

void TestCustomOptions() {
  ScannerInputOptions options;
  options.min_length = 2;
  options.terminator = '\r';
  options.max_gap    = std::chrono::milliseconds(200);

  const auto token = ClassifyInputStream(Typed("AB\r", std::chrono::milliseconds(150)), options);
  assert(token && *token == "AB");
}

} // namespace

int main() {
  TestScannerBurstIsAccepted();
  TestHumanTypingIsRejected();
  TestShortOrUnterminatedInput();
  TestCustomOptions();

  std::cout << "linecheck_unit_scanner_input: pass\n";
  return 0;
}
