#include <gtest/gtest.h>
#include "identity/digest.hpp"
#include "identity/state_key.hpp"
#include "common/errors.hpp"

#include <limits>
#include <unordered_set>

using namespace kchoice;

// ─── Digest Tests ──────────────────────────────────────────────

TEST(IdentityTest, Sha256KnownVectors) {
    auto abc = Digest::sha256("abc");
    EXPECT_EQ(abc[0], 0xba);
    EXPECT_EQ(abc[31], 0xad);
    EXPECT_EQ(Digest::truncate64(abc), 0xba7816bf8f01cfeaULL);

    EXPECT_EQ(Digest::fingerprint(""), 0xe3b0c44298fc1c14ULL);
}

// ─── State Key Tests ───────────────────────────────────────────

TEST(IdentityTest, KeyIgnoresItemOrder) {
    Canonicalizer canon(10.0, 1e-12);
    StateKey a = canon.makeKey(3.0, {2, 0, 1});
    StateKey b = canon.makeKey(3.0, {0, 1, 2});

    EXPECT_EQ(a, b);
    EXPECT_EQ(a.hash(), b.hash());
    EXPECT_EQ(a.remaining, (std::vector<ItemId>{0, 1, 2}));
}

TEST(IdentityTest, KeyAbsorbsSubtractionOrder) {
    Canonicalizer canon(1.0, 1e-12);
    double ab = 1.0 - 0.1 - 0.2;
    double ba = 1.0 - 0.2 - 0.1;

    EXPECT_EQ(canon.ticks(ab), canon.ticks(ba));
    EXPECT_EQ(canon.makeKey(ab, {3}), canon.makeKey(ba, {3}));
}

TEST(IdentityTest, KeyDistinguishesSubproblems) {
    Canonicalizer canon(10.0, 1e-12);
    StateKey base = canon.makeKey(5.0, {0, 1});

    EXPECT_NE(base, canon.makeKey(4.0, {0, 1}));
    EXPECT_NE(base, canon.makeKey(5.0, {0}));

    std::unordered_set<StateKey, StateKey::Hash> keys;
    keys.insert(base);
    keys.insert(canon.makeKey(5.0, {1, 0}));
    keys.insert(canon.makeKey(4.0, {0, 1}));
    EXPECT_EQ(keys.size(), 2u);
}

TEST(IdentityTest, CanonicalTextAndFingerprint) {
    auto items = makeItems({10.0, 7.0}, {5.0, 3.0});
    Canonicalizer canon(10.0, 1e-12);
    StateKey key = canon.makeKey(5.0, {1, 0});

    EXPECT_EQ(key.canonicalText(items), "cap:500000000000|0:10:5,1:7:3");
    EXPECT_EQ(key.fingerprint(items), Digest::fingerprint(key.canonicalText(items)));
}

TEST(IdentityTest, RejectsInvalidResolution) {
    EXPECT_THROW(Canonicalizer(10.0, 0.0), InvalidParameterError);
    EXPECT_THROW(Canonicalizer(10.0, -1e-9), InvalidParameterError);
    EXPECT_THROW(Canonicalizer(10.0, std::numeric_limits<double>::quiet_NaN()),
                 InvalidParameterError);
}
