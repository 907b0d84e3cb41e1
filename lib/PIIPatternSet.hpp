#ifndef PII_DEFENDER_PII_PATTERN_SET_H_
#define PII_DEFENDER_PII_PATTERN_SET_H_

#include <array>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

#include <re2/re2.h>

#include "PIICategory.hpp"

// Source of one category pattern. The value to extract must be capture
// group 1; the pattern may consume one more character after it.
struct PIICategoryPattern {
  std::string pattern;
  // The value must start on a word boundary. Checked by PIIMatcher against
  // the character before the match.
  bool leading_word_boundary;
};

// Holds one compiled pattern per category and one per security signature.
// Everything is compiled in the constructor and never touched again, so a
// single instance can be shared between threads. RE2 is automaton based and
// runs in linear time, which matters because we feed it untrusted text.
//
// Input is UTF-8. Word characters are Unicode letters, digits and '_'. RE2's
// own \w and \b only know ASCII, so the patterns spell out [\pL\pN_] and a
// trailing word boundary is written as "next character is not a word
// character or the text ends", consumed outside group 1.
class PIIPatternSet {
 public:
  PIIPatternSet() {
    const std::string word = R"re([\pL\pN_])re";
    const std::string word_end = R"re((?:[^\pL\pN_]|$))re";

    Set(PIICategory::kEmail,
        {R"re(\b([a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}))re" + word_end,
         true});
    Set(PIICategory::kUrl,
        {"(https?://(?:[-" + word + ".])+(?::[0-9]+)?"
             "(?:/(?:[/." + word + "])*"
             "(?:\\?(?:[&=%." + word + "])*)?"
             "(?:#(?:[." + word + "])*)?)?)",
         false});
    Set(PIICategory::kPhone,
        {R"re(((?:\+?1[-.\s]?)?\(?[0-9]{3}\)?[-.\s]?[0-9]{3}[-.\s]?[0-9]{4}))re" +
             word_end,
         false});
    // Two shapes: contiguous digits following the brand prefix rules, or
    // Visa / MasterCard written as four groups of four.
    Set(PIICategory::kCreditCard,
        {R"re(\b((?:4[0-9]{12}(?:[0-9]{3})?|5[1-5][0-9]{14}|3[47][0-9]{13})re"
         R"re(|3[0-9]{13}|6(?:011|5[0-9]{2})[0-9]{12}))re"
         R"re(|(?:4[0-9]{3}[\s-]?[0-9]{4}[\s-]?[0-9]{4}[\s-]?[0-9]{4})re"
         R"re(|5[1-5][0-9]{2}[\s-]?[0-9]{4}[\s-]?[0-9]{4}[\s-]?[0-9]{4})))re" +
             word_end,
         true});
    Set(PIICategory::kTime,
        {R"re(\b((?:[01]?[0-9]|2[0-3]):[0-5][0-9](?:\s?[AaPp][Mm])?))re" +
             word_end,
         true});

    // Keyword based signatures ignore case, the token based ones do not.
    signature_patterns_[Index(PIISignature::kSqlInjection)] = Compile(
        R"re((?i)(?:^|[^\pL\pN_])(union\s+select|drop\s+table|delete\s+from)re"
        R"re(|insert\s+into|update\s+set))re" + word_end);
    signature_patterns_[Index(PIISignature::kXss)] = Compile(
        R"re((?i)(<script[^>]*>|javascript:|on)re" + word +
        R"re(+\s*=\s*["'][^"'>]*["']))re");
    signature_patterns_[Index(PIISignature::kPathTraversal)] = Compile(
        R"re(\.\.[\\/])re");
    signature_patterns_[Index(PIISignature::kCommandInjection)] = Compile(
        R"re([;&|`]\s*)re" + word + "+");

    word_char_ = Compile(word);
  }

  // Default patterns with some categories replaced.
  explicit PIIPatternSet(
      const std::map<PIICategory, PIICategoryPattern>& overrides)
      : PIIPatternSet() {
    for (const auto& entry : overrides) {
      Set(entry.first, entry.second);
    }
  }

  PIIPatternSet(const PIIPatternSet&) = delete;
  PIIPatternSet& operator=(const PIIPatternSet&) = delete;

  const RE2& Pattern(PIICategory category) const {
    return *category_patterns_[Index(category)];
  }

  bool LeadingWordBoundary(PIICategory category) const {
    return leading_word_boundary_[Index(category)];
  }

  const RE2& Pattern(PIISignature signature) const {
    return *signature_patterns_[Index(signature)];
  }

  // True if the UTF-8 code point is a letter, digit or underscore.
  bool IsWordChar(const re2::StringPiece& code_point) const {
    return RE2::FullMatch(code_point, *word_char_);
  }

  // Process wide instance, built on first use.
  static const PIIPatternSet& Default() {
    static const PIIPatternSet pattern_set;
    return pattern_set;
  }

 private:
  static size_t Index(PIICategory category) {
    return static_cast<size_t>(category);
  }

  static size_t Index(PIISignature signature) {
    return static_cast<size_t>(signature);
  }

  void Set(PIICategory category, const PIICategoryPattern& source) {
    category_patterns_[Index(category)] = Compile(source.pattern);
    leading_word_boundary_[Index(category)] = source.leading_word_boundary;
  }

  // A pattern that does not compile is a bug in this file, not bad input.
  static std::unique_ptr<RE2> Compile(const std::string& pattern) {
    RE2::Options options;
    options.set_log_errors(false);
    auto re = std::make_unique<RE2>(pattern, options);
    if (!re->ok()) {
      throw std::logic_error("PIIPatternSet: cannot compile \"" + pattern +
                             "\": " + re->error());
    }
    return re;
  }

  std::array<std::unique_ptr<RE2>, kCategoryCount> category_patterns_;
  std::array<bool, kCategoryCount> leading_word_boundary_ = {};
  std::array<std::unique_ptr<RE2>, kSignatureCount> signature_patterns_;
  std::unique_ptr<RE2> word_char_;
};

#endif  // PII_DEFENDER_PII_PATTERN_SET_H_
