#ifndef PII_DEFENDER_PII_EXTRACTION_RESULT_H_
#define PII_DEFENDER_PII_EXTRACTION_RESULT_H_

#include <map>
#include <string>
#include <vector>

#include "PIICategory.hpp"

// What one Extract() call produced. Only categories with at least one
// accepted value are stored, so "absent" and "empty" read the same.
//
// A rejected input yields no values for any category. rejected() tells the
// two empty cases apart; callers that only look at the values see the same
// empty result either way.
class PIIExtractionResult {
 public:
  PIIExtractionResult()
      : rejected_(false), rejected_by_(PIISignature::kSqlInjection) {}

  static PIIExtractionResult Rejected(PIISignature signature) {
    PIIExtractionResult result;
    result.rejected_ = true;
    result.rejected_by_ = signature;
    return result;
  }

  bool rejected() const { return rejected_; }

  // Only meaningful when rejected() is true.
  PIISignature rejected_by() const { return rejected_by_; }

  const std::vector<std::string>& Matches(PIICategory category) const {
    static const std::vector<std::string> empty;
    auto it = values_.find(category);
    return it == values_.end() ? empty : it->second;
  }

  const std::map<PIICategory, std::vector<std::string>>& values() const {
    return values_;
  }

  bool Empty() const { return values_.empty(); }

  // Number of categories with at least one value.
  size_t CategoryCount() const { return values_.size(); }

  size_t TotalMatches() const {
    size_t total = 0;
    for (const auto& entry : values_) {
      total += entry.second.size();
    }
    return total;
  }

  bool operator==(const PIIExtractionResult& other) const {
    return rejected_ == other.rejected_ &&
           (!rejected_ || rejected_by_ == other.rejected_by_) &&
           values_ == other.values_;
  }

  bool operator!=(const PIIExtractionResult& other) const {
    return !(*this == other);
  }

 private:
  friend class PIIExtractor;

  void Set(PIICategory category, std::vector<std::string> values) {
    if (values.empty()) {
      values_.erase(category);
      return;
    }
    values_[category] = std::move(values);
  }

  bool rejected_;
  PIISignature rejected_by_;
  std::map<PIICategory, std::vector<std::string>> values_;
};

#endif  // PII_DEFENDER_PII_EXTRACTION_RESULT_H_
