#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "PIIExtractor.hpp"
#include "RecordingEventSink.hpp"

namespace {

typedef std::vector<std::string> Values;

const char kSupportText[] =
    "Email tech-support@company.com or visit https://help.company.com/support\n"
    "Phone: (555) 123-4567\n"
    "Visa: 4532015112830366\n"
    "Hours: 9:00 AM to 6:00 PM\n";

}  // namespace

TEST(PIIExtractorTest, ExtractsEveryCategory) {
  PIIExtractor extractor;
  PIIExtractionResult result = extractor.Extract(kSupportText);

  EXPECT_FALSE(result.rejected());
  EXPECT_EQ(Values({"te**********@company.com"}),
            result.Matches(PIICategory::kEmail));
  EXPECT_EQ(Values({"https://help.company.com/support"}),
            result.Matches(PIICategory::kUrl));
  ASSERT_FALSE(result.Matches(PIICategory::kPhone).empty());
  EXPECT_EQ("(555) 123-4567", result.Matches(PIICategory::kPhone)[0]);
  EXPECT_EQ(Values({"************0366"}),
            result.Matches(PIICategory::kCreditCard));
  EXPECT_EQ(Values({"9:00 AM", "6:00 PM"}), result.Matches(PIICategory::kTime));
  EXPECT_EQ(5u, result.CategoryCount());
}

TEST(PIIExtractorTest, SameInputSameResult) {
  PIIExtractor extractor;
  EXPECT_EQ(extractor.Extract(kSupportText), extractor.Extract(kSupportText));
}

TEST(PIIExtractorTest, RejectionWipesEveryCategory) {
  auto sink = std::make_shared<RecordingEventSink>();
  PIIExtractor extractor(PIIExtractorConfig(), sink);
  PIIExtractionResult result =
      extractor.Extract("user@test.com'; DROP TABLE users; --");

  EXPECT_TRUE(result.rejected());
  EXPECT_EQ(PIISignature::kSqlInjection, result.rejected_by());
  EXPECT_TRUE(result.Empty());
  EXPECT_EQ(0u, result.TotalMatches());
  for (PIICategory category : AllCategories()) {
    EXPECT_TRUE(result.Matches(category).empty()) << PIICategoryName(category);
  }
  EXPECT_EQ(std::vector<PIIEvent>(
                {PIIEvent::SignatureDetected(PIISignature::kSqlInjection),
                 PIIEvent::InputRejected(PIISignature::kSqlInjection)}),
            sink->events());
}

TEST(PIIExtractorTest, RejectionIgnoresGenuineData) {
  PIIExtractor extractor;
  std::string text = std::string(kSupportText) + "<script>alert(1)</script>";
  PIIExtractionResult result = extractor.Extract(text);
  EXPECT_TRUE(result.rejected());
  EXPECT_EQ(PIISignature::kXss, result.rejected_by());
  EXPECT_TRUE(result.Empty());
}

TEST(PIIExtractorTest, LuhnDecidesCreditCards) {
  PIIExtractor extractor;
  EXPECT_EQ(Values({"************0366"}),
            extractor.Extract("card 4532015112830366").Matches(
                PIICategory::kCreditCard));
  EXPECT_TRUE(extractor.Extract("card 4532015112830367")
                  .Matches(PIICategory::kCreditCard)
                  .empty());
  EXPECT_TRUE(extractor.Extract("card 5555-4444-3333-2222")
                  .Matches(PIICategory::kCreditCard)
                  .empty());
  EXPECT_EQ(Values({"************1111"}),
            extractor.Extract("card 4111 1111 1111 1111")
                .Matches(PIICategory::kCreditCard));
}

TEST(PIIExtractorTest, EmailMasking) {
  PIIExtractor extractor;
  EXPECT_EQ(Values({"ab@example.com"}),
            extractor.Extract("ab@example.com").Matches(PIICategory::kEmail));
  EXPECT_EQ(Values({"ab****@example.com"}),
            extractor.Extract("abcdef@example.com").Matches(PIICategory::kEmail));
}

TEST(PIIExtractorTest, OverlongEmailsAreDropped) {
  PIIExtractor extractor;
  EXPECT_TRUE(extractor.Extract("user@" + std::string(300, 'a') + ".com")
                  .Matches(PIICategory::kEmail)
                  .empty());
  EXPECT_TRUE(extractor.Extract(std::string(70, 'a') + "@example.com")
                  .Matches(PIICategory::kEmail)
                  .empty());
}

TEST(PIIExtractorTest, EmptyAndBlankInput) {
  auto sink = std::make_shared<RecordingEventSink>();
  PIIExtractor extractor(PIIExtractorConfig(), sink);
  for (const std::string text : {"", "   ", "No data here just plain text"}) {
    PIIExtractionResult result = extractor.Extract(text);
    EXPECT_FALSE(result.rejected()) << "'" << text << "'";
    EXPECT_TRUE(result.Empty()) << "'" << text << "'";
  }
  EXPECT_TRUE(sink->events().empty());
}

TEST(PIIExtractorTest, OverlongUrlIsDropped) {
  PIIExtractor extractor;
  std::string url = "https://" + std::string(2048, 'a') + ".com";
  EXPECT_TRUE(extractor.Extract("go to " + url).Matches(PIICategory::kUrl).empty());
  EXPECT_EQ(Values({"https://example.com/page"}),
            extractor.Extract("go to https://example.com/page<br/>")
                .Matches(PIICategory::kUrl));
}

TEST(PIIExtractorTest, PhoneAndTimeAreTakenAsMatched) {
  PIIExtractor extractor;
  PIIExtractionResult result = extractor.Extract("Call 555.987.6543 at 13:45 PM");
  EXPECT_EQ(Values({"555.987.6543"}), result.Matches(PIICategory::kPhone));
  EXPECT_EQ(Values({"13:45 PM"}), result.Matches(PIICategory::kTime));
}

TEST(PIIExtractorTest, CategoriesAreIndependent) {
  PIIExtractor extractor;
  std::string with_phones =
      "Mail ann@example.org, call (555) 123-4567 or 555.987.6543, pay "
      "4111 1111 1111 1111 at 10:30 via https://example.com/pay";
  std::string without_phones =
      "Mail ann@example.org, call  or , pay "
      "4111 1111 1111 1111 at 10:30 via https://example.com/pay";

  PIIExtractionResult a = extractor.Extract(with_phones);
  PIIExtractionResult b = extractor.Extract(without_phones);
  EXPECT_FALSE(a.Matches(PIICategory::kPhone).empty());
  for (PIICategory category : {PIICategory::kEmail, PIICategory::kUrl,
                               PIICategory::kCreditCard, PIICategory::kTime}) {
    EXPECT_FALSE(a.Matches(category).empty()) << PIICategoryName(category);
    EXPECT_EQ(a.Matches(category), b.Matches(category))
        << PIICategoryName(category);
  }
}

TEST(PIIExtractorTest, ParallelPassesMatchSequential) {
  PIIExtractorConfig parallel_config;
  parallel_config.parallel_categories = true;
  PIIExtractor sequential;
  PIIExtractor parallel(parallel_config);

  EXPECT_EQ(sequential.Extract(kSupportText), parallel.Extract(kSupportText));
  EXPECT_EQ(sequential.Extract("a; b"), parallel.Extract("a; b"));
  EXPECT_TRUE(parallel.Extract("a; b").rejected());
}

TEST(PIIExtractorTest, ParallelPassPropagatesExceptions) {
  // A category pattern without a value group makes its pass throw.
  std::map<PIICategory, PIICategoryPattern> overrides;
  overrides[PIICategory::kTime] = PIICategoryPattern{"[0-9]+:[0-9]+", false};
  PIIPatternSet patterns(overrides);
  PIIExtractorConfig parallel_config;
  parallel_config.parallel_categories = true;

  PIIExtractor parallel(parallel_config, nullptr, patterns);
  PIIExtractor sequential(PIIExtractorConfig(), nullptr, patterns);
  EXPECT_THROW(parallel.Extract("at 10:30"), std::logic_error);
  EXPECT_THROW(sequential.Extract("at 10:30"), std::logic_error);
  // Rejected input never reaches the category passes.
  EXPECT_TRUE(parallel.Extract("at 10:30; rm").rejected());
}

TEST(PIIExtractorTest, ConcurrentCallersShareOneExtractor) {
  auto sink = std::make_shared<RecordingEventSink>();
  PIIExtractor extractor(PIIExtractorConfig(), sink);
  const PIIExtractionResult expected_safe = extractor.Extract(kSupportText);
  const PIIExtractionResult expected_rejected = extractor.Extract("../etc");

  const int kThreads = 8;
  const int kRounds = 50;
  std::vector<int> mismatches(kThreads, 0);
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kRounds; ++i) {
        if (t % 2 == 0) {
          if (extractor.Extract(kSupportText) != expected_safe) ++mismatches[t];
        } else {
          if (extractor.Extract("../etc") != expected_rejected) ++mismatches[t];
        }
      }
    });
  }
  for (std::thread& thread : threads) {
    thread.join();
  }

  for (int t = 0; t < kThreads; ++t) {
    EXPECT_EQ(0, mismatches[t]) << "thread " << t;
  }
  // Two events per rejected call, the two warm-up calls included.
  EXPECT_EQ(2u * (1 + (kThreads / 2) * kRounds), sink->events().size());
}

TEST(PIIExtractorTest, NonAsciiText) {
  PIIExtractor extractor;
  PIIExtractionResult result = extractor.Extract(
      "visit https://müller.de/straße today, naïve_x@ex.com à 14:00");
  EXPECT_FALSE(result.rejected());
  EXPECT_EQ(Values({"https://müller.de/straße"}), result.Matches(PIICategory::kUrl));
  EXPECT_TRUE(result.Matches(PIICategory::kEmail).empty());
  EXPECT_EQ(Values({"14:00"}), result.Matches(PIICategory::kTime));
  EXPECT_EQ(2u, result.CategoryCount());
}

TEST(PIIExtractorTest, CustomMaskingPolicy) {
  PIIExtractorConfig config;
  config.mask_char = 'x';
  config.sensitive_categories = {PIICategory::kCreditCard};
  PIIExtractor extractor(config);

  PIIExtractionResult result =
      extractor.Extract("abcdef@example.com pays with 4532015112830366");
  EXPECT_EQ(Values({"abcdef@example.com"}), result.Matches(PIICategory::kEmail));
  EXPECT_EQ(Values({"xxxxxxxxxxxx0366"}),
            result.Matches(PIICategory::kCreditCard));
}
