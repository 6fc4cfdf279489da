#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include "backend/backend_probe.hpp"
#include "detection/entity_detector.hpp"
#include "privacy/policy_config.hpp"
#include "support/test_backends.hpp"
#include "util/errors.hpp"

using privgate::detection::EntityDetector;
using privgate::detection::MlEntityDetector;
using privgate::detection::PatternEntityDetector;
using privgate::privacy::AnonymizationConfig;
using privgate::privacy::EntityKind;
using privgate::privacy::PIIEntity;

namespace {

const PIIEntity* findKind(const std::vector<PIIEntity> &entities, EntityKind kind) {
    for (const auto &e : entities) {
        if (e.type == kind) return &e;
    }
    return nullptr;
}

bool sortedAndDisjoint(const std::vector<PIIEntity> &entities) {
    for (size_t i = 1; i < entities.size(); ++i) {
        if (entities[i - 1].end > entities[i].start) return false;
    }
    return true;
}

PIIEntity makeEntity(size_t start, size_t end, double confidence) {
    PIIEntity e;
    e.type = EntityKind::Person;
    e.start = start;
    e.end = end;
    e.confidence = confidence;
    return e;
}

} // namespace

TEST(PatternEntityDetectorTest, FindsPersonEmailAndPhone) {
    PatternEntityDetector detector;
    const std::string text = "Contact John Smith at john@example.com or call 555-123-4567";
    const auto entities = detector.detect(text, AnonymizationConfig());

    ASSERT_GE(entities.size(), 3u);
    const PIIEntity *person = findKind(entities, EntityKind::Person);
    const PIIEntity *email = findKind(entities, EntityKind::EmailAddress);
    const PIIEntity *phone = findKind(entities, EntityKind::PhoneNumber);
    ASSERT_NE(person, nullptr);
    ASSERT_NE(email, nullptr);
    ASSERT_NE(phone, nullptr);
    EXPECT_EQ(person->matchedText, "John Smith");
    EXPECT_EQ(email->matchedText, "john@example.com");
    EXPECT_EQ(phone->matchedText, "555-123-4567");
    EXPECT_EQ(text.substr(email->start, email->end - email->start), "john@example.com");
    EXPECT_TRUE(sortedAndDisjoint(entities));
}

TEST(PatternEntityDetectorTest, RespectsAllowlist) {
    PatternEntityDetector detector;
    AnonymizationConfig cfg;
    cfg.entityAllowlist = {EntityKind::EmailAddress};
    const auto entities = detector.detect(
        "Contact John Smith at john@example.com or call 555-123-4567", cfg);
    ASSERT_EQ(entities.size(), 1u);
    EXPECT_EQ(entities[0].type, EntityKind::EmailAddress);
}

TEST(PatternEntityDetectorTest, RespectsScoreThreshold) {
    PatternEntityDetector detector;
    AnonymizationConfig cfg;
    cfg.scoreThreshold = 0.7;
    const auto entities = detector.detect(
        "Contact John Smith at john@example.com or call 555-123-4567", cfg);
    EXPECT_EQ(findKind(entities, EntityKind::Person), nullptr);
    EXPECT_NE(findKind(entities, EntityKind::EmailAddress), nullptr);
    EXPECT_NE(findKind(entities, EntityKind::PhoneNumber), nullptr);
}

TEST(PatternEntityDetectorTest, CreditCardNeedsLuhn) {
    PatternEntityDetector detector;
    const auto valid = detector.detect("card 4111 1111 1111 1111 on file", AnonymizationConfig());
    const PIIEntity *card = findKind(valid, EntityKind::CreditCard);
    ASSERT_NE(card, nullptr);
    EXPECT_EQ(card->matchedText, "4111 1111 1111 1111");

    const auto invalid = detector.detect("card 4111 1111 1111 1112 on file", AnonymizationConfig());
    EXPECT_EQ(findKind(invalid, EntityKind::CreditCard), nullptr);
}

TEST(PatternEntityDetectorTest, SsnAndIpShapeChecks) {
    PatternEntityDetector detector;
    EXPECT_NE(findKind(detector.detect("ssn 123-45-6789", AnonymizationConfig()), EntityKind::UsSsn),
              nullptr);
    EXPECT_EQ(findKind(detector.detect("ssn 000-12-3456", AnonymizationConfig()), EntityKind::UsSsn),
              nullptr);
    EXPECT_NE(findKind(detector.detect("host 192.168.1.20 is up", AnonymizationConfig()),
                       EntityKind::IpAddress), nullptr);
    EXPECT_EQ(findKind(detector.detect("host 999.1.1.1 is up", AnonymizationConfig()),
                       EntityKind::IpAddress), nullptr);
}

TEST(PatternEntityDetectorTest, HonorificPerson) {
    PatternEntityDetector detector;
    const auto entities = detector.detect("Please ask Dr. Watson about it", AnonymizationConfig());
    const PIIEntity *person = findKind(entities, EntityKind::Person);
    ASSERT_NE(person, nullptr);
    EXPECT_EQ(person->matchedText, "Dr. Watson");
}

TEST(PatternEntityDetectorTest, PlainTextHasNoEntities) {
    PatternEntityDetector detector;
    EXPECT_TRUE(detector.detect("nothing sensitive here at all", AnonymizationConfig()).empty());
    EXPECT_TRUE(detector.detect("", AnonymizationConfig()).empty());
}

TEST(PatternEntityDetectorTest, MalformedInputThrows) {
    PatternEntityDetector detector;
    EXPECT_THROW(detector.detect(std::string("abc\0def", 7), AnonymizationConfig()),
                 privgate::util::DetectionError);
    EXPECT_THROW(detector.detect("bad \xFF byte", AnonymizationConfig()),
                 privgate::util::DetectionError);
}

TEST(PatternEntityDetectorTest, Deterministic) {
    PatternEntityDetector detector;
    const std::string text = "Mail jane@corp.io, call (555) 987-6543, from 10.0.0.1";
    const auto a = detector.detect(text, AnonymizationConfig());
    const auto b = detector.detect(text, AnonymizationConfig());
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].start, b[i].start);
        EXPECT_EQ(a[i].end, b[i].end);
        EXPECT_EQ(a[i].type, b[i].type);
    }
}

TEST(ResolveOverlapsTest, LongerSpanThenConfidenceThenStart) {
    // [8,20) is longest and beats [0,10); [5,8) touches neither survivor.
    auto kept = privgate::detection::resolveOverlaps({
        makeEntity(0, 10, 0.5), makeEntity(5, 8, 0.9), makeEntity(8, 20, 0.6)});
    ASSERT_EQ(kept.size(), 2u);
    EXPECT_EQ(kept[0].start, 5u);
    EXPECT_EQ(kept[1].start, 8u);

    kept = privgate::detection::resolveOverlaps({makeEntity(0, 5, 0.6), makeEntity(2, 7, 0.9)});
    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(kept[0].start, 2u);

    kept = privgate::detection::resolveOverlaps({makeEntity(2, 7, 0.8), makeEntity(0, 5, 0.8)});
    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(kept[0].start, 0u);
}

TEST(MlEntityDetectorTest, PostProcessesBackendSpans) {
    auto recognizer = std::make_shared<privgate::test::FakeRecognizer>(
        std::vector<privgate::backend::RecognizedSpan>{
            {"EMAIL_ADDRESS", 0, 5, 0.9},
            {"BOGUS_KIND", 0, 3, 0.99},
            {"PERSON", 3, 40, 0.95},
            {"PERSON", 6, 11, 0.3},
            {"PHONE_NUMBER", 6, 11, 1.7},
        });
    MlEntityDetector detector(recognizer);
    const auto entities = detector.detect("abcde fghij", AnonymizationConfig());

    ASSERT_EQ(entities.size(), 2u);
    EXPECT_EQ(entities[0].type, EntityKind::EmailAddress);
    EXPECT_EQ(entities[0].matchedText, "abcde");
    EXPECT_EQ(entities[1].type, EntityKind::PhoneNumber);
    EXPECT_DOUBLE_EQ(entities[1].confidence, 1.0);
}

TEST(MlEntityDetectorTest, FallsBackToPatternsWhenBackendFails) {
    auto recognizer = std::make_shared<privgate::test::FakeRecognizer>(
        std::vector<privgate::backend::RecognizedSpan>{}, true, true);
    MlEntityDetector detector(recognizer);
    const auto entities = detector.detect("reach me at john@example.com", AnonymizationConfig());
    ASSERT_EQ(entities.size(), 1u);
    EXPECT_EQ(entities[0].type, EntityKind::EmailAddress);
    EXPECT_EQ(recognizer->calls(), 1);
}

TEST(MakeEntityDetectorTest, SelectsVariantFromHandle) {
    privgate::backend::BackendHandle empty;
    EXPECT_EQ(privgate::detection::makeEntityDetector(empty)->variantName(), "pattern");

    privgate::backend::BackendHandle withNer(std::make_shared<privgate::test::FakeRecognizer>(), nullptr);
    EXPECT_EQ(privgate::detection::makeEntityDetector(withNer)->variantName(), "ml:fake-ner");
}

TEST(MlEntityDetectorTest, DropsSpansThatSplitACharacter) {
    // "caf\xC3\xA9 x": bytes 3-4 encode one character.
    auto recognizer = std::make_shared<privgate::test::FakeRecognizer>(
        std::vector<privgate::backend::RecognizedSpan>{
            {"PERSON", 0, 4, 0.9},
            {"PHONE_NUMBER", 4, 7, 0.9},
            {"EMAIL_ADDRESS", 6, 7, 0.9},
        });
    MlEntityDetector detector(recognizer);
    const auto entities = detector.detect("caf\xC3\xA9 x", AnonymizationConfig());

    ASSERT_EQ(entities.size(), 1u);
    EXPECT_EQ(entities[0].type, EntityKind::EmailAddress);
    EXPECT_EQ(entities[0].matchedText, "x");
}
