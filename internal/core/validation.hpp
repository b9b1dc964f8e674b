#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace linecheck::core {

inline constexpr std::size_t kMaxJobIdLength       = 100;
inline constexpr std::size_t kMaxBarcodeLength     = 200;
inline constexpr int64_t     kMinPiecesPerShipper  = 1;
inline constexpr int64_t     kMaxPiecesPerShipper  = 10000;
inline constexpr int64_t     kMaxTargetQuantity    = 1000000;
inline constexpr std::size_t kMinPinLength         = 4;
inline constexpr std::size_t kMaxPinLength         = 20;

// Strips leading/trailing ASCII whitespace.
std::string Trim(std::string_view value);

/*
  Field validators. Each returns the trimmed value where trimming applies
  and throws util::ValidationError naming the field otherwise.
*/
std::string ValidateJobId(std::string_view raw);
std::string ValidateExpectedBarcode(std::string_view raw);
void        ValidatePiecesPerShipper(int64_t value);
void        ValidateTargetQuantity(int64_t value);

// Trimmed scan input; util::InvalidInputError when empty or longer than 200.
std::string NormalizeScanInput(std::string_view raw);

// 4-20 ASCII letters or digits.
void ValidatePinFormat(std::string_view pin);

} // namespace linecheck::core
