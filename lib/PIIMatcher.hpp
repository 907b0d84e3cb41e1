#ifndef PII_DEFENDER_PII_MATCHER_H_
#define PII_DEFENDER_PII_MATCHER_H_

#include <stdexcept>
#include <string>
#include <vector>

#include <re2/re2.h>

#include "PIICategory.hpp"
#include "PIIPatternSet.hpp"

// A candidate found by a category pattern, before validation.
struct PIIRawMatch {
  PIICategory category;
  std::string text;
  // Byte offset of the match in the input.
  size_t offset;
};

class PIIMatcher {
 public:
  // The pattern set is not copied and must outlive the matcher.
  explicit PIIMatcher(const PIIPatternSet& patterns) : patterns_(patterns) {}

  // Returns all non-overlapping matches of the category pattern, left to
  // right. The value is capture group 1 of the pattern.
  std::vector<PIIRawMatch> Find(const std::string& text,
                                PIICategory category) const {
    const RE2& re = patterns_.Pattern(category);
    if (re.NumberOfCapturingGroups() < 1) {
      throw std::logic_error(std::string("PIIMatcher: pattern for ") +
                             PIICategoryName(category) +
                             " has no capture group");
    }
    const bool leading_boundary = patterns_.LeadingWordBoundary(category);

    std::vector<PIIRawMatch> matches;
    re2::StringPiece input(text);
    re2::StringPiece groups[2];
    size_t pos = 0;

    // RE2::Match keeps the whole text as context, so \b still sees the
    // character right before the resume position.
    while (pos <= text.size() &&
           re.Match(input, pos, text.size(), RE2::UNANCHORED, groups, 2)) {
      const re2::StringPiece& whole = groups[0];
      const re2::StringPiece& value = groups[1];
      if (value.data() == nullptr) {
        size_t end = whole.data() - input.data() + whole.size();
        pos = whole.empty() ? end + 1 : end;
        continue;
      }
      size_t start = value.data() - input.data();
      if (leading_boundary && FollowsWordChar(text, start)) {
        // Not a word start after all. Candidates rejected here never
        // overlap, so the scan stays linear.
        pos = start + 1;
        continue;
      }
      size_t end = start + value.size();
      matches.push_back(PIIRawMatch{
          category, std::string(value.data(), value.size()), start});
      // Resume right after the value; the character that closed it may
      // start the next one. Empty matches still have to move on.
      pos = end > start ? end : end + 1;
    }
    return matches;
  }

 private:
  // True if the code point ending right before byte |start| is a letter,
  // digit or underscore. RE2's \b already covers ASCII neighbours, this
  // catches the rest.
  bool FollowsWordChar(const std::string& text, size_t start) const {
    if (start == 0 || start > text.size()) return false;
    if (!IsAsciiWordChar(text[start])) return false;
    size_t lead = start - 1;
    // Step back over UTF-8 continuation bytes.
    while (lead > 0 && start - lead < 4 &&
           (static_cast<unsigned char>(text[lead]) & 0xC0) == 0x80) {
      --lead;
    }
    if (static_cast<unsigned char>(text[lead]) < 0x80) return false;
    return patterns_.IsWordChar(
        re2::StringPiece(text.data() + lead, start - lead));
  }

  static bool IsAsciiWordChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_';
  }

  const PIIPatternSet& patterns_;
};

#endif  // PII_DEFENDER_PII_MATCHER_H_
