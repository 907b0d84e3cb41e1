#ifndef PII_DEFENDER_PII_SECURITY_GATE_H_
#define PII_DEFENDER_PII_SECURITY_GATE_H_

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <re2/re2.h>

#include "PIICategory.hpp"
#include "PIIEventSink.hpp"
#include "PIIPatternSet.hpp"

struct PIISafetyVerdict {
  bool safe;
  // Only meaningful when safe is false.
  PIISignature signature;

  static PIISafetyVerdict Safe() {
    return PIISafetyVerdict{true, PIISignature::kSqlInjection};
  }

  static PIISafetyVerdict Unsafe(PIISignature signature) {
    return PIISafetyVerdict{false, signature};
  }
};

// Looks for attack signatures anywhere in the input.
class PIISecurityGate {
 public:
  // The gate keeps a reference to |patterns|, which must outlive it. A null
  // |sink| records nothing.
  PIISecurityGate(const PIIPatternSet& patterns,
                  std::shared_ptr<PIIEventSink> sink)
      : patterns_(patterns),
        sink_(sink ? std::move(sink) : std::make_shared<PIINullEventSink>()) {}

  // Scans signatures in AllSignatures() order and stops at the first hit,
  // which is reported to the sink by name only.
  PIISafetyVerdict Check(const std::string& text) const {
    for (PIISignature signature : AllSignatures()) {
      if (RE2::PartialMatch(text, patterns_.Pattern(signature))) {
        sink_->Record(PIIEvent::SignatureDetected(signature));
        return PIISafetyVerdict::Unsafe(signature);
      }
    }
    return PIISafetyVerdict::Safe();
  }

  // Returns every signature present in the text, in scan order. Does not
  // emit events.
  std::vector<PIISignature> Scan(const std::string& text) const {
    std::vector<PIISignature> found;
    for (PIISignature signature : AllSignatures()) {
      if (RE2::PartialMatch(text, patterns_.Pattern(signature))) {
        found.push_back(signature);
      }
    }
    return found;
  }

 private:
  const PIIPatternSet& patterns_;
  std::shared_ptr<PIIEventSink> sink_;
};

#endif  // PII_DEFENDER_PII_SECURITY_GATE_H_
