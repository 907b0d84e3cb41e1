#ifndef PII_DEFENDER_PII_VALIDATOR_H_
#define PII_DEFENDER_PII_VALIDATOR_H_

#include <cctype>
#include <string>

#include "PIICategory.hpp"

// Per category checks applied to every pattern match before it is kept.
// A rejected match is simply dropped, nothing here reports errors.
class PIIValidator {
 public:
  static bool Accept(PIICategory category, const std::string& match) {
    switch (category) {
      case PIICategory::kEmail:
        return IsValidEmail(match);
      case PIICategory::kUrl:
        return IsValidUrl(match);
      case PIICategory::kCreditCard:
        return IsValidCreditCard(match);
      case PIICategory::kPhone:
      case PIICategory::kTime:
        // The pattern is all we check for these.
        return true;
    }
    return false;
  }

  // RFC 5321 length limits on the whole address and both of its parts.
  static bool IsValidEmail(const std::string& email) {
    if (email.size() > 254) {
      return false;
    }
    size_t at = email.rfind('@');
    if (at == std::string::npos) {
      return false;
    }
    size_t local_size = at;
    size_t domain_size = email.size() - at - 1;
    return local_size <= 64 && domain_size <= 253;
  }

  // Anything carrying markup characters or spaces means the pattern ran past
  // the end of the real URL. The length limit counts characters, not bytes.
  static bool IsValidUrl(const std::string& url) {
    if (CountCodePoints(url) >= 2048) {
      return false;
    }
    return url.find_first_of("<>\" ") == std::string::npos;
  }

  static bool IsValidCreditCard(const std::string& card) {
    std::string digits;
    if (!NormalizeCardNumber(card, &digits)) {
      return false;
    }
    if (digits.size() < 13 || digits.size() > 19) {
      return false;
    }
    return LuhnChecksumValid(digits);
  }

  // Drops whitespace and dashes. Returns false if anything other than a digit
  // is left over.
  static bool NormalizeCardNumber(const std::string& card,
                                  std::string* digits_out) {
    *digits_out = "";
    for (char c : card) {
      if (isspace(static_cast<unsigned char>(c)) || c == '-') {
        continue;
      }
      if (!isdigit(static_cast<unsigned char>(c))) {
        *digits_out = "";
        return false;
      }
      *digits_out += c;
    }
    return true;
  }

  // Expects digits only.
  // Number of UTF-8 code points: every byte that is not a continuation byte.
  static size_t CountCodePoints(const std::string& text) {
    size_t count = 0;
    for (char c : text) {
      if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++count;
    }
    return count;
  }

  static bool LuhnChecksumValid(const std::string& digits) {
    int checksum = 0;
    bool double_it = false;
    // Walk from the least significant digit, doubling every second one.
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
      int n = (int) (*it - '0');
      if (double_it) {
        n *= 2;
        if (n > 9) {
          n -= 9;
        }
      }
      checksum += n;
      double_it = !double_it;
    }
    return checksum % 10 == 0;
  }
};

#endif  // PII_DEFENDER_PII_VALIDATOR_H_
