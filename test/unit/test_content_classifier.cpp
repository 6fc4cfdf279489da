#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <string>

#include "classification/content_classifier.hpp"
#include "support/test_backends.hpp"
#include "util/errors.hpp"

using privgate::classification::LexiconContentClassifier;
using privgate::classification::MlContentClassifier;
using privgate::privacy::ContentCategory;

TEST(LexiconContentClassifierTest, FriendlyTextScoresZero) {
    LexiconContentClassifier classifier;
    const auto result = classifier.score("This is a friendly message.");
    for (ContentCategory c : privgate::privacy::kScoredCategories) {
        EXPECT_DOUBLE_EQ(result.scoreFor(c), 0.0) << privgate::privacy::contentCategoryName(c);
    }
    EXPECT_TRUE(result.spansAvailable);
}

TEST(LexiconContentClassifierTest, ScoresThreatsAndInsults) {
    LexiconContentClassifier classifier;
    const std::string text = "I will kill you, you stupid idiot";
    const auto result = classifier.score(text);

    EXPECT_GE(result.scoreFor(ContentCategory::Threat), 0.5);
    EXPECT_GE(result.scoreFor(ContentCategory::Insult), 0.7);
    EXPECT_GE(result.scoreFor(ContentCategory::Toxicity), 0.7);
    EXPECT_DOUBLE_EQ(result.scoreFor(ContentCategory::SexualExplicit), 0.0);

    // The longest threat term claims the bytes; "kill" alone is not counted again.
    const auto &threatSpans = result.spans.at(ContentCategory::Threat);
    ASSERT_EQ(threatSpans.size(), 1u);
    EXPECT_EQ(text.substr(threatSpans[0].start, threatSpans[0].end - threatSpans[0].start), "kill you");
}

TEST(LexiconContentClassifierTest, CaseInsensitiveWholeWords) {
    LexiconContentClassifier classifier;
    EXPECT_GT(classifier.score("YOU IDIOT").scoreFor(ContentCategory::Insult), 0.0);

    const auto inside = classifier.score("skill and hello, a classic");
    EXPECT_DOUBLE_EQ(inside.scoreFor(ContentCategory::Threat), 0.0);
    EXPECT_DOUBLE_EQ(inside.scoreFor(ContentCategory::Profanity), 0.0);
}

TEST(LexiconContentClassifierTest, ScoresStayInUnitInterval) {
    LexiconContentClassifier classifier;
    const auto result = classifier.score("idiot idiot idiot moron moron loser stupid dumb fool");
    for (const auto &kv : result.scores) {
        EXPECT_GE(kv.second, 0.0);
        EXPECT_LE(kv.second, 1.0);
    }
    EXPECT_DOUBLE_EQ(result.scoreFor(ContentCategory::Insult), 1.0);
}

TEST(LexiconContentClassifierTest, BlankTextScoresNothing) {
    LexiconContentClassifier classifier;
    const auto result = classifier.score("   \t ");
    EXPECT_DOUBLE_EQ(result.scoreFor(ContentCategory::Toxicity), 0.0);
    EXPECT_TRUE(result.spans.empty());
}

TEST(LexiconContentClassifierTest, MalformedInputThrows) {
    LexiconContentClassifier classifier;
    EXPECT_THROW(classifier.score(std::string("a\0b", 3)), privgate::util::ClassificationError);
}

TEST(MlContentClassifierTest, ClampsAndSkipsUnknownCategories) {
    auto backend = std::make_shared<privgate::test::FakeClassifier>(std::map<std::string, double>{
        {"toxicity", 1.4}, {"threat", -0.2}, {"Insult", 0.75}, {"unknown_cat", 0.9}});
    MlContentClassifier classifier(backend);
    const auto result = classifier.score("anything");

    EXPECT_FALSE(result.spansAvailable);
    EXPECT_EQ(result.scores.size(), 3u);
    EXPECT_DOUBLE_EQ(result.scoreFor(ContentCategory::Toxicity), 1.0);
    EXPECT_DOUBLE_EQ(result.scoreFor(ContentCategory::Threat), 0.0);
    EXPECT_DOUBLE_EQ(result.scoreFor(ContentCategory::Insult), 0.75);
}

TEST(MlContentClassifierTest, FallsBackToLexiconWhenBackendFails) {
    auto backend = std::make_shared<privgate::test::FakeClassifier>(
        std::map<std::string, double>{}, true, true);
    MlContentClassifier classifier(backend);
    const auto result = classifier.score("you idiot");
    EXPECT_TRUE(result.spansAvailable);
    EXPECT_GT(result.scoreFor(ContentCategory::Insult), 0.0);
}

TEST(MakeContentClassifierTest, SelectsVariantFromHandle) {
    privgate::backend::BackendHandle empty;
    EXPECT_EQ(privgate::classification::makeContentClassifier(empty)->variantName(), "lexicon");

    privgate::backend::BackendHandle withModel(nullptr, std::make_shared<privgate::test::FakeClassifier>());
    EXPECT_EQ(privgate::classification::makeContentClassifier(withModel)->variantName(), "ml:fake-tox");
}
