#include "internal/core/validation.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace linecheck::core {

namespace {

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool IsControl(char c) {
  const auto u = static_cast<unsigned char>(c);
  return u < 0x20 || u == 0x7f;
}

bool IsAsciiAlnum(char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

void RejectForbidden(std::string_view field, std::string_view value, std::string_view forbidden, bool allow_tab) {
  for (char c : value) {
    if (forbidden.find(c) != std::string_view::npos) {
      throw util::ValidationError(std::string(field) + " must not contain '" + std::string(1, c) + "'");
    }
    if (IsControl(c) && !(allow_tab && c == '\t')) {
      throw util::ValidationError(std::string(field) + " must not contain control characters");
    }
  }
}

} // namespace

std::string Trim(std::string_view value) {
  std::size_t begin = 0;
  std::size_t end   = value.size();
  while (begin < end && IsSpace(value[begin])) ++begin;
  while (end > begin && IsSpace(value[end - 1])) --end;
  return std::string(value.substr(begin, end - begin));
}

std::string ValidateJobId(std::string_view raw) {
  auto id = Trim(raw);
  if (id.empty()) {
    throw util::ValidationError("job_id must not be empty");
  }
  if (id.size() > kMaxJobIdLength) {
    throw util::ValidationError("job_id must be at most " + std::to_string(kMaxJobIdLength) + " characters");
  }
  RejectForbidden("job_id", id, "<>\"'&;\\/", false);
  return id;
}

std::string ValidateExpectedBarcode(std::string_view raw) {
  auto barcode = Trim(raw);
  if (barcode.empty()) {
    throw util::ValidationError("expected_barcode must not be empty");
  }
  if (barcode.size() > kMaxBarcodeLength) {
    throw util::ValidationError("expected_barcode must be at most " + std::to_string(kMaxBarcodeLength) + " characters");
  }
  RejectForbidden("expected_barcode", barcode, "<>\"'&;\\", true);
  return barcode;
}

void ValidatePiecesPerShipper(int64_t value) {
  if (value < kMinPiecesPerShipper || value > kMaxPiecesPerShipper) {
    throw util::ValidationError("pieces_per_shipper must be between " + std::to_string(kMinPiecesPerShipper) + " and " +
                                std::to_string(kMaxPiecesPerShipper));
  }
}

void ValidateTargetQuantity(int64_t value) {
  if (value < 0 || value > kMaxTargetQuantity) {
    throw util::ValidationError("target_quantity must be between 0 and " + std::to_string(kMaxTargetQuantity));
  }
}

std::string NormalizeScanInput(std::string_view raw) {
  auto barcode = Trim(raw);
  if (barcode.empty()) {
    throw util::InvalidInputError("barcode must not be empty");
  }
  if (barcode.size() > kMaxBarcodeLength) {
    throw util::InvalidInputError("barcode must be at most " + std::to_string(kMaxBarcodeLength) + " characters");
  }
  return barcode;
}

void ValidatePinFormat(std::string_view pin) {
  if (pin.size() < kMinPinLength || pin.size() > kMaxPinLength) {
    throw util::ValidationError("PIN must be " + std::to_string(kMinPinLength) + "-" + std::to_string(kMaxPinLength) + " characters");
  }
  for (char c : pin) {
    if (!IsAsciiAlnum(c)) {
      throw util::ValidationError("PIN must contain only letters and digits");
    }
  }
}

} // namespace linecheck::core
