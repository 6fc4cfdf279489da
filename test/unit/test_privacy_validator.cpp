#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "anonymization/anonymizer.hpp"
#include "audit/audit_ledger.hpp"
#include "classification/content_classifier.hpp"
#include "detection/entity_detector.hpp"
#include "filter/content_filter.hpp"
#include "support/test_backends.hpp"
#include "util/worker_pool.hpp"
#include "validation/privacy_validator.hpp"

using privgate::privacy::ContentCategory;
using privgate::privacy::PrivacyLevel;
using privgate::validation::PrivacyValidator;
using privgate::validation::ValidationResult;

namespace {

const char *kClean = "Lovely weather today.";
const char *kWithEmail = "Contact me at john@example.com";
const char *kHostile = "I will kill you, you stupid idiot";

const std::vector<PrivacyLevel> kAllLevels = {
    PrivacyLevel::None, PrivacyLevel::Low, PrivacyLevel::Medium, PrivacyLevel::High, PrivacyLevel::Strict};

class PrivacyValidatorTest : public ::testing::Test
{
protected:
    PrivacyValidatorTest()
        : anonymizer(std::make_shared<privgate::detection::PatternEntityDetector>(),
                     privgate::privacy::AnonymizationConfig())
        , contentFilter(std::make_shared<privgate::classification::LexiconContentClassifier>(),
                        privgate::privacy::FilterConfig())
    {
    }

    ValidationResult run(const PrivacyValidator &v, const std::string &text, PrivacyLevel level)
    {
        return v.validate(text, level, &anonymizer, &contentFilter);
    }

    privgate::anonymization::Anonymizer anonymizer;
    privgate::filter::ContentFilter contentFilter;
};

} // namespace

TEST(LevelPolicyTest, ColumnsAreNonDecreasing) {
    const auto &table = privgate::validation::kLevelPolicies;
    for (size_t i = 1; i < table.size(); ++i) {
        EXPECT_LE(table[i - 1].detect, table[i].detect);
        EXPECT_LE(table[i - 1].filter, table[i].filter);
        EXPECT_LE(table[i - 1].piiFails, table[i].piiFails);
        EXPECT_LE(table[i - 1].contentFails, table[i].contentFails);
        EXPECT_LE(table[i - 1].forcedAudit, table[i].forcedAudit);
    }
}

TEST_F(PrivacyValidatorTest, NoneAlwaysPasses) {
    PrivacyValidator validator;
    const ValidationResult r = run(validator, std::string(kHostile) + " at john@example.com", PrivacyLevel::None);
    EXPECT_TRUE(r.passed);
    EXPECT_FALSE(r.piiDetected);
    EXPECT_EQ(r.piiCount, 0u);
    EXPECT_TRUE(r.contentViolations.empty());
    EXPECT_TRUE(r.recommendations.empty());

    // No component is consulted at None.
    EXPECT_TRUE(validator.validate(kHostile, PrivacyLevel::None, nullptr, nullptr).passed);
}

TEST_F(PrivacyValidatorTest, LowReportsPiiButPasses) {
    PrivacyValidator validator;
    const ValidationResult r = run(validator, kWithEmail, PrivacyLevel::Low);
    EXPECT_TRUE(r.passed);
    EXPECT_TRUE(r.piiDetected);
    EXPECT_EQ(r.piiCount, 1u);
    ASSERT_FALSE(r.recommendations.empty());
    EXPECT_EQ(r.recommendations[0],
              "Detected 1 sensitive entity (EMAIL_ADDRESS); anonymize the text before use.");
    EXPECT_TRUE(r.contentScores.empty());
}

TEST_F(PrivacyValidatorTest, MediumFailsOnContentOnly) {
    PrivacyValidator validator;
    EXPECT_TRUE(run(validator, kWithEmail, PrivacyLevel::Medium).passed);

    const ValidationResult hostile = run(validator, kHostile, PrivacyLevel::Medium);
    EXPECT_FALSE(hostile.passed);
    const std::vector<ContentCategory> expected = {
        ContentCategory::Toxicity, ContentCategory::Threat, ContentCategory::Insult};
    EXPECT_EQ(hostile.contentViolations, expected);
    ASSERT_FALSE(hostile.recommendations.empty());
    EXPECT_NE(hostile.recommendations[0].find("Content violates 'toxicity'"), std::string::npos);
}

TEST_F(PrivacyValidatorTest, HighFailsOnPii) {
    PrivacyValidator validator;
    EXPECT_FALSE(run(validator, kWithEmail, PrivacyLevel::High).passed);
    EXPECT_TRUE(run(validator, kClean, PrivacyLevel::High).passed);
}

TEST_F(PrivacyValidatorTest, StrictRejectsPiiWithRecommendations) {
    PrivacyValidator validator;
    const ValidationResult r = run(validator, kWithEmail, PrivacyLevel::Strict);
    EXPECT_FALSE(r.passed);
    EXPECT_TRUE(r.piiDetected);
    EXPECT_FALSE(r.recommendations.empty());
    EXPECT_EQ(r.level, PrivacyLevel::Strict);
}

TEST_F(PrivacyValidatorTest, StrictRejectsContentAlone) {
    PrivacyValidator validator;
    const ValidationResult r = run(validator, "You are a moron and a loser", PrivacyLevel::Strict);
    EXPECT_EQ(r.piiCount, 0u);
    EXPECT_FALSE(r.passed);
}

TEST_F(PrivacyValidatorTest, RejectionIsMonotoneInLevel) {
    PrivacyValidator validator;
    const std::vector<std::string> texts = {
        kClean, kWithEmail, kHostile, "totally worthless",
        "Call 555-123-4567, you idiot", "", "card 4111 1111 1111 1111"};
    for (const auto &text : texts) {
        bool rejected = false;
        for (PrivacyLevel level : kAllLevels) {
            const bool passed = run(validator, text, level).passed;
            if (rejected) {
                EXPECT_FALSE(passed) << "'" << text << "' at " << level;
            }
            rejected = rejected || !passed;
        }
    }
}

TEST_F(PrivacyValidatorTest, NearMissIsReportedWithoutFailing) {
    PrivacyValidator validator;
    const ValidationResult r = run(validator, "totally worthless", PrivacyLevel::Medium);
    EXPECT_TRUE(r.passed);
    EXPECT_TRUE(r.contentViolations.empty());

    bool insultNotice = false;
    for (const auto &line : r.recommendations) {
        if (line == "Content is close to the 'insult' threshold (score 0.65 of 0.70).") {
            insultNotice = true;
        }
    }
    EXPECT_TRUE(insultNotice);
}

TEST_F(PrivacyValidatorTest, OneAuditEntryPerValidate) {
    privgate::audit::AuditLedger ledger;
    PrivacyValidator validator(&ledger);
    anonymizer.setAuditLedger(&ledger);
    contentFilter.setAuditLedger(&ledger);

    run(validator, kClean, PrivacyLevel::Medium);
    run(validator, kWithEmail, PrivacyLevel::Strict);
    validator.validate(kHostile, PrivacyLevel::High, &anonymizer, &contentFilter, std::string("req-7"));

    const auto entries = ledger.entries();
    ASSERT_EQ(entries.size(), 3u);
    for (const auto &e : entries) {
        EXPECT_EQ(e.operation, privgate::audit::AuditOperation::Validate);
    }
    EXPECT_EQ(entries[1].piiCount, 1u);
    EXPECT_EQ(entries[1].passed, std::optional<bool>(false));
    EXPECT_EQ(entries[2].contextId, std::optional<std::string>("req-7"));
    const std::vector<std::string> names = {"toxicity", "threat", "insult"};
    EXPECT_EQ(entries[2].violationCategories, names);
}

TEST_F(PrivacyValidatorTest, HighLevelsAuditEvenWhenDisabled) {
    privgate::audit::AuditLedger ledger;
    PrivacyValidator validator(&ledger);
    validator.setAuditEnabled(false);

    run(validator, kClean, PrivacyLevel::Medium);
    EXPECT_EQ(ledger.size(), 0u);

    run(validator, kClean, PrivacyLevel::High);
    EXPECT_EQ(ledger.size(), 1u);
}

TEST_F(PrivacyValidatorTest, AuditFailureBecomesWarning) {
    privgate::audit::AuditLedger ledger(std::make_unique<privgate::test::FailingAuditStore>());
    PrivacyValidator validator(&ledger);

    const ValidationResult r = run(validator, kWithEmail, PrivacyLevel::Strict);
    EXPECT_FALSE(r.passed);
    ASSERT_TRUE(r.auditWarning.has_value());
    EXPECT_NE(r.auditWarning->find("disk full"), std::string::npos);
}

TEST_F(PrivacyValidatorTest, ForcedAuditWithoutLedgerWarns) {
    PrivacyValidator validator;
    EXPECT_TRUE(run(validator, kClean, PrivacyLevel::High).auditWarning.has_value());
    EXPECT_FALSE(run(validator, kClean, PrivacyLevel::Medium).auditWarning.has_value());
}

TEST_F(PrivacyValidatorTest, MissingComponentIsRejected) {
    PrivacyValidator validator;
    EXPECT_THROW(validator.validate(kClean, PrivacyLevel::Low, nullptr, &contentFilter),
                 std::invalid_argument);
    EXPECT_THROW(validator.validate(kClean, PrivacyLevel::Medium, &anonymizer, nullptr),
                 std::invalid_argument);
    EXPECT_NO_THROW(validator.validate(kClean, PrivacyLevel::Low, &anonymizer, nullptr));
}

TEST_F(PrivacyValidatorTest, DefaultLevelOverload) {
    PrivacyValidator validator;
    EXPECT_EQ(validator.level(), PrivacyLevel::Medium);
    EXPECT_TRUE(validator.validate(kWithEmail, &anonymizer, &contentFilter).passed);

    validator.setLevel(PrivacyLevel::Strict);
    const ValidationResult r = validator.validate(kWithEmail, &anonymizer, &contentFilter);
    EXPECT_EQ(r.level, PrivacyLevel::Strict);
    EXPECT_FALSE(r.passed);
}

TEST_F(PrivacyValidatorTest, BatchPreservesOrder) {
    privgate::util::WorkerPool pool(3);
    PrivacyValidator validator(nullptr, PrivacyLevel::Strict);
    validator.setWorkerPool(&pool);

    const std::vector<std::string> texts = {kClean, kWithEmail, kHostile, "", "nice work"};
    const auto results = validator.validateBatch(texts, &anonymizer, &contentFilter);
    ASSERT_EQ(results.size(), texts.size());
    EXPECT_TRUE(results[0].passed);
    EXPECT_FALSE(results[1].passed);
    EXPECT_FALSE(results[2].passed);
    EXPECT_TRUE(results[3].passed);
    EXPECT_TRUE(results[4].passed);

    const auto lenient = validator.validateBatch(texts, PrivacyLevel::None, &anonymizer, &contentFilter);
    for (const auto &r : lenient) {
        EXPECT_TRUE(r.passed);
    }
}
