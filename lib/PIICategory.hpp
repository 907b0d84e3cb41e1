#ifndef PII_DEFENDER_PII_CATEGORY_H_
#define PII_DEFENDER_PII_CATEGORY_H_

#include <array>
#include <cstddef>

// Kinds of data we know how to pull out of free text.
enum class PIICategory {
  kEmail,
  kUrl,
  kPhone,
  kCreditCard,
  kTime,
};

// Attack signatures that make us reject an input as a whole.
enum class PIISignature {
  kSqlInjection,
  kXss,
  kPathTraversal,
  kCommandInjection,
};

constexpr size_t kCategoryCount = 5;
constexpr size_t kSignatureCount = 4;

inline const std::array<PIICategory, kCategoryCount>& AllCategories() {
  static const std::array<PIICategory, kCategoryCount> categories = {{
      PIICategory::kEmail,
      PIICategory::kUrl,
      PIICategory::kPhone,
      PIICategory::kCreditCard,
      PIICategory::kTime,
  }};
  return categories;
}

// The order here is the order in which the security gate scans.
inline const std::array<PIISignature, kSignatureCount>& AllSignatures() {
  static const std::array<PIISignature, kSignatureCount> signatures = {{
      PIISignature::kSqlInjection,
      PIISignature::kXss,
      PIISignature::kPathTraversal,
      PIISignature::kCommandInjection,
  }};
  return signatures;
}

inline const char* PIICategoryName(PIICategory category) {
  switch (category) {
    case PIICategory::kEmail:
      return "email";
    case PIICategory::kUrl:
      return "url";
    case PIICategory::kPhone:
      return "phone";
    case PIICategory::kCreditCard:
      return "credit_card";
    case PIICategory::kTime:
      return "time";
  }
  return "unknown";
}

inline const char* PIISignatureName(PIISignature signature) {
  switch (signature) {
    case PIISignature::kSqlInjection:
      return "sql_injection";
    case PIISignature::kXss:
      return "xss";
    case PIISignature::kPathTraversal:
      return "path_traversal";
    case PIISignature::kCommandInjection:
      return "command_injection";
  }
  return "unknown";
}

#endif  // PII_DEFENDER_PII_CATEGORY_H_
