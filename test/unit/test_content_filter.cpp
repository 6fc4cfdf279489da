#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "audit/audit_ledger.hpp"
#include "classification/content_classifier.hpp"
#include "filter/content_filter.hpp"
#include "support/test_backends.hpp"
#include "util/errors.hpp"
#include "util/worker_pool.hpp"

using privgate::filter::ContentFilter;
using privgate::filter::FilterResult;
using privgate::privacy::ContentCategory;
using privgate::privacy::FilterAction;
using privgate::privacy::FilterConfig;

namespace {

const char *kHostile = "I will kill you, you stupid idiot";

std::shared_ptr<const privgate::classification::ContentClassifier> lexicon() {
    return std::make_shared<privgate::classification::LexiconContentClassifier>();
}

FilterConfig withAction(FilterAction action) {
    FilterConfig cfg;
    cfg.action = action;
    return cfg;
}

bool hasViolation(const FilterResult &r, ContentCategory c) {
    return std::find(r.violations.begin(), r.violations.end(), c) != r.violations.end();
}

} // namespace

TEST(ContentFilterTest, FriendlyTextPassesToxicityFlag) {
    FilterConfig cfg;
    cfg.categories = {ContentCategory::Toxicity};
    cfg.thresholds = {{ContentCategory::Toxicity, 0.7}};
    cfg.action = FilterAction::Flag;
    ContentFilter contentFilter(lexicon(), cfg);

    const FilterResult result = contentFilter.filter("This is a friendly message.");
    EXPECT_TRUE(result.passed);
    EXPECT_LT(result.scores.at(ContentCategory::Toxicity), 0.7);
    EXPECT_EQ(result.text, "This is a friendly message.");
    EXPECT_TRUE(result.violations.empty());
}

TEST(ContentFilterTest, FlagReportsViolationsInCategoryOrder) {
    ContentFilter contentFilter(lexicon(), withAction(FilterAction::Flag));
    const FilterResult result = contentFilter.filter(kHostile);

    EXPECT_FALSE(result.passed);
    EXPECT_EQ(result.text, kHostile);
    const std::vector<ContentCategory> expected = {
        ContentCategory::Toxicity, ContentCategory::Threat, ContentCategory::Insult};
    EXPECT_EQ(result.violations, expected);
    EXPECT_EQ(result.actionTaken, FilterAction::Flag);
}

TEST(ContentFilterTest, AllowPassesButRecordsViolations) {
    ContentFilter contentFilter(lexicon(), withAction(FilterAction::Allow));
    const FilterResult result = contentFilter.filter(kHostile);
    EXPECT_TRUE(result.passed);
    EXPECT_EQ(result.text, kHostile);
    EXPECT_FALSE(result.violations.empty());
}

TEST(ContentFilterTest, RejectEmptiesViolatingText) {
    ContentFilter contentFilter(lexicon(), withAction(FilterAction::Reject));
    const FilterResult rejected = contentFilter.filter(kHostile);
    EXPECT_FALSE(rejected.passed);
    EXPECT_EQ(rejected.text, "");

    const FilterResult clean = contentFilter.filter("Lovely weather today.");
    EXPECT_TRUE(clean.passed);
    EXPECT_EQ(clean.text, "Lovely weather today.");
}

TEST(ContentFilterTest, RedactReplacesLexiconSpans) {
    ContentFilter contentFilter(lexicon(), withAction(FilterAction::Redact));
    const FilterResult result = contentFilter.filter(kHostile);
    EXPECT_TRUE(result.passed);
    EXPECT_EQ(result.text, "I will [FILTERED], you [FILTERED] [FILTERED]");
}

TEST(ContentFilterTest, RedactWithoutSpansReplacesWholeText) {
    auto backend = std::make_shared<privgate::test::FakeClassifier>(
        std::map<std::string, double>{{"toxicity", 0.95}});
    ContentFilter contentFilter(std::make_shared<privgate::classification::MlContentClassifier>(backend),
                                withAction(FilterAction::Redact));
    const FilterResult result = contentFilter.filter("whatever the model disliked");
    EXPECT_TRUE(result.passed);
    EXPECT_EQ(result.text, "[CONTENT FILTERED]");
    EXPECT_TRUE(hasViolation(result, ContentCategory::Toxicity));
}

TEST(ContentFilterTest, BlocklistIsCaseInsensitive) {
    FilterConfig cfg;
    cfg.customBlocklist = {"ProjectX"};
    ContentFilter flagging(lexicon(), cfg);
    const FilterResult flagged = flagging.filter("details about projectx launch");
    EXPECT_FALSE(flagged.passed);
    EXPECT_TRUE(hasViolation(flagged, ContentCategory::CustomBlocklist));

    cfg.action = FilterAction::Redact;
    ContentFilter redacting(lexicon(), cfg);
    EXPECT_EQ(redacting.filter("details about PROJECTX launch").text, "details about [FILTERED] launch");
}

TEST(ContentFilterTest, DisabledFilterPassesWithoutScoring) {
    FilterConfig cfg;
    cfg.enabled = false;
    ContentFilter contentFilter(lexicon(), cfg);
    const FilterResult result = contentFilter.filter(kHostile);
    EXPECT_TRUE(result.passed);
    EXPECT_EQ(result.text, kHostile);
    EXPECT_TRUE(result.scores.empty());
    EXPECT_TRUE(result.violations.empty());
}

TEST(ContentFilterTest, RejectsInvalidConfig) {
    FilterConfig blocklistCategory;
    blocklistCategory.categories.insert(ContentCategory::CustomBlocklist);
    EXPECT_THROW(ContentFilter(lexicon(), blocklistCategory), privgate::util::ConfigurationError);

    FilterConfig badThreshold;
    badThreshold.thresholds[ContentCategory::Threat] = 1.5;
    EXPECT_THROW(ContentFilter(lexicon(), badThreshold), privgate::util::ConfigurationError);
}

TEST(ContentFilterTest, MissingThresholdsFallBackToDefaults) {
    FilterConfig cfg;
    cfg.thresholds.clear();
    ContentFilter contentFilter(lexicon(), cfg);
    EXPECT_DOUBLE_EQ(contentFilter.config().thresholdFor(ContentCategory::Threat), 0.5);
    EXPECT_DOUBLE_EQ(contentFilter.config().thresholdFor(ContentCategory::Toxicity), 0.7);
}

TEST(ContentFilterTest, BatchPreservesOrder) {
    ContentFilter contentFilter(lexicon(), withAction(FilterAction::Reject));
    privgate::util::WorkerPool pool(2);
    contentFilter.setWorkerPool(&pool);

    const std::vector<std::string> texts = {"hello there", kHostile, "", "nice work"};
    const auto results = contentFilter.filterBatch(texts);
    ASSERT_EQ(results.size(), texts.size());
    EXPECT_TRUE(results[0].passed);
    EXPECT_FALSE(results[1].passed);
    EXPECT_TRUE(results[2].passed);
    EXPECT_EQ(results[3].text, "nice work");
}

TEST(ContentFilterTest, OnlyFilterWritesAuditEntries) {
    privgate::audit::AuditLedger ledger;
    ContentFilter contentFilter(lexicon(), withAction(FilterAction::Flag));
    contentFilter.setAuditLedger(&ledger);

    contentFilter.evaluate(kHostile);
    EXPECT_EQ(ledger.size(), 0u);

    contentFilter.filter(kHostile, std::string("ctx-9"));
    const auto entries = ledger.entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].operation, privgate::audit::AuditOperation::Filter);
    EXPECT_EQ(entries[0].passed, std::optional<bool>(false));
    const std::vector<std::string> names = {"toxicity", "threat", "insult"};
    EXPECT_EQ(entries[0].violationCategories, names);
}
