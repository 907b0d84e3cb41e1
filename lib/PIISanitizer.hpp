#ifndef PII_DEFENDER_PII_SANITIZER_H_
#define PII_DEFENDER_PII_SANITIZER_H_

#include <set>
#include <stdexcept>
#include <string>
#include <utility>

#include "PIICategory.hpp"
#include "PIIValidator.hpp"

// Masks validated values of sensitive categories. Other categories go
// through untouched.
class PIISanitizer {
 public:
  PIISanitizer(char mask_char, std::set<PIICategory> sensitive_categories)
      : mask_char_(mask_char),
        sensitive_categories_(std::move(sensitive_categories)) {}

  bool IsSensitive(PIICategory category) const {
    return sensitive_categories_.count(category) > 0;
  }

  std::string Mask(PIICategory category, const std::string& value) const {
    if (!IsSensitive(category)) {
      return value;
    }
    switch (category) {
      case PIICategory::kCreditCard:
        return MaskCreditCard(value);
      case PIICategory::kEmail:
        return MaskEmail(value);
      default:
        return value;
    }
  }

  // 12 mask characters followed by the last four digits.
  std::string MaskCreditCard(const std::string& card) const {
    std::string digits;
    if (!PIIValidator::NormalizeCardNumber(card, &digits) ||
        digits.size() < 4) {
      throw std::logic_error(
          "PIISanitizer: card number reached masking without validation");
    }
    return std::string(12, mask_char_) + digits.substr(digits.size() - 4);
  }

  // Keeps the first two characters of the local part and the whole domain.
  // "abcdef@example.com" becomes "ab****@example.com".
  std::string MaskEmail(const std::string& email) const {
    size_t at = email.find('@');
    if (at == std::string::npos) {
      throw std::logic_error(
          "PIISanitizer: email reached masking without an '@'");
    }
    const size_t visible = 2;
    std::string local = email.substr(0, at);
    if (local.size() <= visible) {
      return email;
    }
    return local.substr(0, visible) +
           std::string(local.size() - visible, mask_char_) + email.substr(at);
  }

 private:
  char mask_char_;
  std::set<PIICategory> sensitive_categories_;
};

#endif  // PII_DEFENDER_PII_SANITIZER_H_
