#include <gtest/gtest.h>

#include "snap/core/clock.hpp"
#include "snap/store/memory_store.hpp"

using namespace snap::core;
using namespace snap::store;

namespace {

SecretDraft plain(std::string text) {
    SecretDraft d;
    d.text = std::move(text);
    return d;
}

SecretDraft challenged(std::string text, std::string prompt, std::string answer) {
    SecretDraft d;
    d.text = std::move(text);
    d.prompt = std::move(prompt);
    d.answer = std::move(answer);
    return d;
}

class MemoryStoreTest : public ::testing::Test {
protected:
    ManualClock clock;
    MemorySecretStore store{StoreConfig{}, clock};
};

} // namespace

//=============================================================================
// Create
//=============================================================================

TEST_F(MemoryStoreTest, CreateAssignsDistinctIds) {
    SecretId a{};
    SecretId b{};
    ASSERT_TRUE(is_ok(store.create(plain("one"), &a)));
    ASSERT_TRUE(is_ok(store.create(plain("one"), &b)));
    EXPECT_NE(a, b);

    u64 n = 0;
    ASSERT_TRUE(is_ok(store.count(&n)));
    EXPECT_EQ(n, 2u);
}

TEST_F(MemoryStoreTest, CreateRejectsInvalidDraft) {
    SecretId id{};
    const Status s = store.create(plain(""), &id);
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_EQ(s.domain, StatusDomain::Core);
    EXPECT_EQ(s.aux, static_cast<u32>(InvalidReason::EmptyText));

    SecretDraft half = plain("x");
    half.prompt = "question only";
    EXPECT_EQ(store.create(half, &id).aux, static_cast<u32>(InvalidReason::PartialChallenge));

    u64 n = 1;
    ASSERT_TRUE(is_ok(store.count(&n)));
    EXPECT_EQ(n, 0u);
}

TEST_F(MemoryStoreTest, NullOutputIsInvalid) {
    EXPECT_EQ(store.create(plain("x"), nullptr).code, StatusCode::Invalid);
    EXPECT_EQ(store.consume_if_valid(SecretId{}, nullptr).code, StatusCode::Invalid);
    EXPECT_EQ(store.sweep_expired(nullptr).code, StatusCode::Invalid);
}

//=============================================================================
// Consume
//=============================================================================

TEST_F(MemoryStoreTest, RevealsOnce) {
    SecretId id{};
    ASSERT_TRUE(is_ok(store.create(plain("hunter2"), &id)));

    ConsumeResult r;
    ASSERT_TRUE(is_ok(store.consume_if_valid(id, &r)));
    EXPECT_EQ(r.outcome, ConsumeOutcome::Revealed);
    EXPECT_EQ(r.text, "hunter2");

    ConsumeResult again;
    EXPECT_EQ(store.consume_if_valid(id, &again).code, StatusCode::NotFound);
}

TEST_F(MemoryStoreTest, UnknownIdIsNotFound) {
    SecretId id{};
    id.b[0] = 0x42;
    ConsumeResult r;
    const Status s = store.consume_if_valid(id, &r);
    EXPECT_EQ(s.code, StatusCode::NotFound);
    EXPECT_EQ(s.domain, StatusDomain::Store);
    EXPECT_EQ(store.validate_and_consume(id, "x", &r).code, StatusCode::NotFound);
}

TEST_F(MemoryStoreTest, ChallengeShowsPromptWithoutConsuming) {
    SecretId id{};
    ASSERT_TRUE(is_ok(store.create(challenged("launch codes", "Favorite color?", "Blue"), &id)));

    for (int i = 0; i < 3; ++i) {
        ConsumeResult r;
        ASSERT_TRUE(is_ok(store.consume_if_valid(id, &r)));
        EXPECT_EQ(r.outcome, ConsumeOutcome::ChallengeRequired);
        EXPECT_EQ(r.prompt, "Favorite color?");
        EXPECT_TRUE(r.text.empty());
    }

    u64 n = 0;
    ASSERT_TRUE(is_ok(store.count(&n)));
    EXPECT_EQ(n, 1u);
}

TEST_F(MemoryStoreTest, WrongAnswerKeepsSecret) {
    SecretId id{};
    ASSERT_TRUE(is_ok(store.create(challenged("launch codes", "Favorite color?", "Blue"), &id)));

    ConsumeResult r;
    const Status s = store.validate_and_consume(id, "blue", &r);
    EXPECT_EQ(s.code, StatusCode::Mismatch);
    EXPECT_EQ(s.domain, StatusDomain::Security);

    ASSERT_TRUE(is_ok(store.validate_and_consume(id, "Blue", &r)));
    EXPECT_EQ(r.outcome, ConsumeOutcome::Revealed);
    EXPECT_EQ(r.text, "launch codes");

    EXPECT_EQ(store.validate_and_consume(id, "Blue", &r).code, StatusCode::NotFound);
}

TEST_F(MemoryStoreTest, AnswerDoesNotRequirePromptFirst) {
    SecretId shown{};
    SecretId unseen{};
    ASSERT_TRUE(is_ok(store.create(challenged("after prompt", "p", "a"), &shown)));
    ASSERT_TRUE(is_ok(store.create(challenged("straight in", "p", "a"), &unseen)));

    ConsumeResult r;
    ASSERT_TRUE(is_ok(store.consume_if_valid(shown, &r)));
    EXPECT_EQ(r.outcome, ConsumeOutcome::ChallengeRequired);
    ASSERT_TRUE(is_ok(store.validate_and_consume(shown, "a", &r)));
    EXPECT_EQ(r.text, "after prompt");

    ASSERT_TRUE(is_ok(store.validate_and_consume(unseen, "a", &r)));
    EXPECT_EQ(r.outcome, ConsumeOutcome::Revealed);
    EXPECT_EQ(r.text, "straight in");
}

TEST_F(MemoryStoreTest, IgnoreCaseMatching) {
    SecretDraft d = challenged("s", "p", "Blue");
    d.answer_match = AnswerMatch::IgnoreAsciiCase;
    SecretId id{};
    ASSERT_TRUE(is_ok(store.create(d, &id)));

    ConsumeResult r;
    ASSERT_TRUE(is_ok(store.validate_and_consume(id, "bLUE", &r)));
    EXPECT_EQ(r.text, "s");
}

TEST_F(MemoryStoreTest, AnswerOnUnchallengedSecretConsumes) {
    SecretId id{};
    ASSERT_TRUE(is_ok(store.create(plain("open"), &id)));
    ConsumeResult r;
    ASSERT_TRUE(is_ok(store.validate_and_consume(id, "whatever", &r)));
    EXPECT_EQ(r.text, "open");
}

TEST(MemoryStoreAttempts, LimitDestroysSecret) {
    ManualClock clock;
    StoreConfig cfg;
    cfg.max_answer_attempts = 2;
    MemorySecretStore store(cfg, clock);

    SecretId id{};
    ASSERT_TRUE(is_ok(store.create(challenged("s", "p", "right"), &id)));

    ConsumeResult r;
    EXPECT_EQ(store.validate_and_consume(id, "wrong", &r).code, StatusCode::Mismatch);
    EXPECT_EQ(store.validate_and_consume(id, "wrong", &r).code, StatusCode::Mismatch);
    EXPECT_EQ(store.validate_and_consume(id, "right", &r).code, StatusCode::NotFound);
}

//=============================================================================
// Expiry
//=============================================================================

TEST_F(MemoryStoreTest, ExpiredSecretIsNotFound) {
    SecretDraft d = plain("short lived");
    d.expire_in = 1000;
    SecretId id{};
    ASSERT_TRUE(is_ok(store.create(d, &id)));

    clock.advance(999);
    u64 n = 0;
    ASSERT_TRUE(is_ok(store.count(&n)));
    EXPECT_EQ(n, 1u);

    clock.advance(1);
    ConsumeResult r;
    EXPECT_EQ(store.consume_if_valid(id, &r).code, StatusCode::NotFound);
}

TEST_F(MemoryStoreTest, ZeroTtlExpiresImmediately) {
    SecretDraft d = plain("gone");
    d.expire_in = 0;
    SecretId id{};
    ASSERT_TRUE(is_ok(store.create(d, &id)));

    ConsumeResult r;
    EXPECT_EQ(store.consume_if_valid(id, &r).code, StatusCode::NotFound);
}

TEST_F(MemoryStoreTest, DefaultTtlIsSystemMaximum) {
    SecretId id{};
    ASSERT_TRUE(is_ok(store.create(plain("week"), &id)));

    clock.advance(7 * kMillisPerDay - 1);
    u64 n = 0;
    ASSERT_TRUE(is_ok(store.count(&n)));
    EXPECT_EQ(n, 1u);

    clock.advance(1);
    ASSERT_TRUE(is_ok(store.count(&n)));
    EXPECT_EQ(n, 0u);
}

TEST_F(MemoryStoreTest, SweepRemovesOnlyExpired) {
    SecretDraft short_lived = plain("a");
    short_lived.expire_in = 10;
    SecretDraft long_lived = plain("b");
    long_lived.expire_in = kMillisPerHour;

    SecretId a{};
    SecretId b{};
    ASSERT_TRUE(is_ok(store.create(short_lived, &a)));
    ASSERT_TRUE(is_ok(store.create(short_lived, &a)));
    ASSERT_TRUE(is_ok(store.create(long_lived, &b)));

    clock.advance(10);
    u64 removed = 0;
    ASSERT_TRUE(is_ok(store.sweep_expired(&removed)));
    EXPECT_EQ(removed, 2u);

    ASSERT_TRUE(is_ok(store.sweep_expired(&removed)));
    EXPECT_EQ(removed, 0u);

    ConsumeResult r;
    ASSERT_TRUE(is_ok(store.consume_if_valid(b, &r)));
    EXPECT_EQ(r.text, "b");
}

TEST(MemoryStoreUnbounded, ZeroMaxTtlNeverExpires) {
    ManualClock clock;
    StoreConfig cfg;
    cfg.max_ttl_ms = 0;
    MemorySecretStore store(cfg, clock);

    SecretId id{};
    ASSERT_TRUE(is_ok(store.create(plain("forever"), &id)));
    clock.advance(365 * kMillisPerDay);

    ConsumeResult r;
    ASSERT_TRUE(is_ok(store.consume_if_valid(id, &r)));
    EXPECT_EQ(r.text, "forever");
}
