#include "internal/core/validation.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using namespace linecheck::core;
using linecheck::util::InvalidInputError;
using linecheck::util::ValidationError;

template <typename Fn>
bool ThrowsValidation(Fn&& fn) {
  try {
    fn();
  } catch (const ValidationError&) {
    return true;
  }
  return false;
}

void TestTrimStripsAsciiWhitespace() {
  assert(Trim("  ABC \t\r\n") == "ABC");
  assert(Trim("") == "");
  assert(Trim(" \t ") == "");
  assert(Trim("A B") == "A B");
}

void TestJobIdRules() {
  assert(ValidateJobId("  JOB-1 ") == "JOB-1");
  assert(ThrowsValidation([] { ValidateJobId("   "); }));
  assert(ThrowsValidation([] { ValidateJobId(std::string(101, 'x')); }));
  assert(ValidateJobId(std::string(100, 'x')).size() == 100);

  for (const char* bad : {"a<b", "a>b", "a\"b", "a'b", "a&b", "a;b", "a\\b", "a/b"}) {
    assert(ThrowsValidation([bad] { ValidateJobId(bad); }));
  }
  assert(ThrowsValidation([] { ValidateJobId("a\tb"); }));
}

void TestExpectedBarcodeRules() {
  assert(ValidateExpectedBarcode(" 012345678905 ") == "012345678905");
  assert(ThrowsValidation([] { ValidateExpectedBarcode(""); }));
  assert(ThrowsValidation([] { ValidateExpectedBarcode(std::string(201, '9')); }));
  assert(ThrowsValidation([] { ValidateExpectedBarcode("12;34"); }));
  // '/' is fine in a barcode, a tab inside the value too.
  assert(ValidateExpectedBarcode("AB/12") == "AB/12");
  assert(ValidateExpectedBarcode("AB\t12") == "AB\t12");
  assert(ThrowsValidation([] { ValidateExpectedBarcode(std::string("AB\x01" "12")); }));
}

void TestNumericRanges() {
  ValidatePiecesPerShipper(1);
  ValidatePiecesPerShipper(10000);
  assert(ThrowsValidation([] { ValidatePiecesPerShipper(0); }));
  assert(ThrowsValidation([] { ValidatePiecesPerShipper(10001); }));

  ValidateTargetQuantity(0);
  ValidateTargetQuantity(1000000);
  assert(ThrowsValidation([] { ValidateTargetQuantity(-1); }));
  assert(ThrowsValidation([] { ValidateTargetQuantity(1000001); }));
}

void TestScanInputNormalization() {
  assert(NormalizeScanInput("\t0001 \n") == "0001");

  bool invalid = false;
  try {
    NormalizeScanInput("   ");
  } catch (const InvalidInputError&) {
    invalid = true;
  }
  assert(invalid);

  invalid = false;
  try {
    NormalizeScanInput(std::string(201, '1'));
  } catch (const InvalidInputError&) {
    invalid = true;
  }
  assert(invalid);
}

void TestPinFormat() {
  ValidatePinFormat("1234");
  ValidatePinFormat("abcDEF0123456789wxyz");
  assert(ThrowsValidation([] { ValidatePinFormat("123"); }));
  assert(ThrowsValidation([] { ValidatePinFormat("123456789012345678901"); }));
  assert(ThrowsValidation([] { ValidatePinFormat("12 34"); }));
  assert(ThrowsValidation([] { ValidatePinFormat("12-34"); }));
}

} // namespace

int main() {
  TestTrimStripsAsciiWhitespace();
  TestJobIdRules();
  TestExpectedBarcodeRules();
  TestNumericRanges();
  TestScanInputNormalization();
  TestPinFormat();

  std::cout << "linecheck_unit_validation: pass\n";
  return 0;
}
