#ifndef PII_DEFENDER_PII_EXTRACTOR_H_
#define PII_DEFENDER_PII_EXTRACTOR_H_

#include <future>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "PIICategory.hpp"
#include "PIIEventSink.hpp"
#include "PIIExtractionResult.hpp"
#include "PIIMatcher.hpp"
#include "PIIPatternSet.hpp"
#include "PIISanitizer.hpp"
#include "PIISecurityGate.hpp"
#include "PIIValidator.hpp"

struct PIIExtractorConfig {
  // Character used to hide parts of sensitive values.
  char mask_char = '*';

  // Categories whose values get masked before they are returned.
  std::set<PIICategory> sensitive_categories = {PIICategory::kEmail,
                                                PIICategory::kCreditCard};

  // Run every category pass as its own task. Output is the same either way.
  bool parallel_categories = false;
};

// Runs the whole pipeline on a piece of text: security gate first, then for
// every category match -> validate -> mask.
//
// Extract() is const and keeps all of its state on the stack, so one
// extractor can serve any number of threads. The event sink must be thread
// safe in that case.
class PIIExtractor {
 public:
  PIIExtractor() : PIIExtractor(PIIExtractorConfig()) {}

  // |patterns| is held by reference and must outlive the extractor; the
  // default process wide set always does.
  explicit PIIExtractor(const PIIExtractorConfig& config,
                        std::shared_ptr<PIIEventSink> sink = nullptr,
                        const PIIPatternSet& patterns = PIIPatternSet::Default())
      : config_(config),
        sink_(sink ? std::move(sink) : std::make_shared<PIINullEventSink>()),
        gate_(patterns, sink_),
        matcher_(patterns),
        sanitizer_(config.mask_char, config.sensitive_categories) {}

  PIIExtractionResult Extract(const std::string& text) const {
    // Any signature rejects the whole input, there are no partial results.
    PIISafetyVerdict verdict = gate_.Check(text);
    if (!verdict.safe) {
      sink_->Record(PIIEvent::InputRejected(verdict.signature));
      return PIIExtractionResult::Rejected(verdict.signature);
    }

    PIIExtractionResult result;
    if (config_.parallel_categories) {
      std::vector<std::future<std::vector<std::string>>> passes;
      for (PIICategory category : AllCategories()) {
        passes.push_back(std::async(
            std::launch::async,
            [this, &text, category] { return ProcessCategory(text, category); }));
      }
      for (size_t i = 0; i < passes.size(); ++i) {
        result.Set(AllCategories()[i], passes[i].get());
      }
    } else {
      for (PIICategory category : AllCategories()) {
        result.Set(category, ProcessCategory(text, category));
      }
    }
    return result;
  }

  const PIIExtractorConfig& config() const { return config_; }

 private:
  // One category pass. Touches nothing but its own locals.
  std::vector<std::string> ProcessCategory(const std::string& text,
                                           PIICategory category) const {
    std::vector<std::string> values;
    for (const PIIRawMatch& match : matcher_.Find(text, category)) {
      if (!PIIValidator::Accept(category, match.text)) {
        continue;
      }
      values.push_back(sanitizer_.Mask(category, match.text));
    }
    return values;
  }

  PIIExtractorConfig config_;
  std::shared_ptr<PIIEventSink> sink_;
  PIISecurityGate gate_;
  PIIMatcher matcher_;
  PIISanitizer sanitizer_;
};

#endif  // PII_DEFENDER_PII_EXTRACTOR_H_
