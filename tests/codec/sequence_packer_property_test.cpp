// =============================================================================
// gpack - Sequence Packer Property Tests
// =============================================================================
// Property-based tests for nucleotide packing: round-trip fidelity, capacity
// rejection, order sensitivity and chunked packing.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "gpack/codec/sequence_packer.h"

namespace gpack::codec::test {

// =============================================================================
// RapidCheck Generators
// =============================================================================

namespace gen {

[[nodiscard]] rc::Gen<Nucleotide> base() {
    return rc::gen::element(Nucleotide::kA, Nucleotide::kT, Nucleotide::kG, Nucleotide::kC);
}

/// @brief Generate a sequence of exactly length bases.
[[nodiscard]] rc::Gen<std::vector<Nucleotide>> sequence(std::size_t length) {
    return rc::gen::container<std::vector<Nucleotide>>(length, base());
}

/// @brief Generate a base string over "ACGTacgt".
[[nodiscard]] rc::Gen<std::string> baseString(std::size_t length) {
    return rc::gen::container<std::string>(
        length, rc::gen::element('A', 'C', 'G', 'T', 'a', 'c', 'g', 't'));
}

}  // namespace gen

// =============================================================================
// Property Tests - Single Word
// =============================================================================

/// @brief Any sequence that fits the capacity survives encode/decode.
RC_GTEST_PROP(SequencePackerProperty, RoundTripWithinCapacity, ()) {
    const auto capacity = *rc::gen::inRange<std::size_t>(0, kWordBits + 1);
    const auto length = *rc::gen::inRange<std::size_t>(0, capacity / 2 + 1);
    const auto bases = *gen::sequence(length);

    auto word = SequencePacker::encode(bases, capacity);
    RC_ASSERT(word.has_value());

    auto decoded = SequencePacker::decode(*word, length, capacity);
    RC_ASSERT(decoded.has_value());
    RC_ASSERT(*decoded == bases);
}

/// @brief Packed bits never spill past the used lanes.
RC_GTEST_PROP(SequencePackerProperty, WordUsesOnlyLowBits, ()) {
    const auto length = *rc::gen::inRange<std::size_t>(0, kMaxCodesPerWord + 1);
    const auto bases = *gen::sequence(length);

    auto word = SequencePacker::encode(bases);
    RC_ASSERT(word.has_value());
    RC_ASSERT((*word & ~usedBitsMask(length)) == Word{0});
}

/// @brief More than capacity / 2 bases is rejected, never truncated.
RC_GTEST_PROP(SequencePackerProperty, RejectsOverCapacity, ()) {
    const auto capacity = *rc::gen::inRange<std::size_t>(0, kWordBits + 1);
    const auto length = *rc::gen::inRange<std::size_t>(capacity / 2 + 1, capacity / 2 + 40);
    const auto bases = *gen::sequence(length);

    auto word = SequencePacker::encode(bases, capacity);
    RC_ASSERT(!word.has_value());
    RC_ASSERT(word.error().code() == ErrorCode::kCapacityExceeded);
}

/// @brief Swapping two distinct adjacent bases changes the word.
RC_GTEST_PROP(SequencePackerProperty, OrderSensitive, ()) {
    const auto length = *rc::gen::inRange<std::size_t>(2, kMaxCodesPerWord + 1);
    auto bases = *gen::sequence(length);
    const auto i = *rc::gen::inRange<std::size_t>(0, length - 1);
    RC_PRE(bases[i] != bases[i + 1]);

    auto swapped = bases;
    std::swap(swapped[i], swapped[i + 1]);

    RC_ASSERT(*SequencePacker::encode(bases) != *SequencePacker::encode(swapped));
}

/// @brief Text and symbol entry points agree, regardless of case.
RC_GTEST_PROP(SequencePackerProperty, TextMatchesSymbols, ()) {
    const auto length = *rc::gen::inRange<std::size_t>(0, kMaxCodesPerWord + 1);
    const auto text = *gen::baseString(length);

    std::vector<Nucleotide> bases;
    for (char c : text) {
        bases.push_back(*NucleotideAlphabet::fromChar(c));
    }

    auto fromText = SequencePacker::encode(text);
    RC_ASSERT(fromText.has_value());
    RC_ASSERT(*fromText == *SequencePacker::encode(bases));
}

/// @brief Tagged words index the same symbols as the input.
RC_GTEST_PROP(SequencePackerProperty, TaggedAtMatchesInput, ()) {
    const auto length = *rc::gen::inRange<std::size_t>(0, kMaxCodesPerWord + 1);
    const auto bases = *gen::sequence(length);

    auto packed = SequencePacker::pack(bases);
    RC_ASSERT(packed.has_value());
    RC_ASSERT(packed->count() == length);
    for (std::size_t i = 0; i < length; ++i) {
        RC_ASSERT(packed->at(i) == bases[i]);
    }
    RC_ASSERT(SequencePacker::unpack(*packed) == bases);
}

// =============================================================================
// Property Tests - Chunks
// =============================================================================

RC_GTEST_PROP(SequencePackerProperty, ChunkedRoundTrip, ()) {
    const auto length = *rc::gen::inRange<std::size_t>(0, 500);
    const auto bases = *gen::sequence(length);

    auto words = SequencePacker::encodeChunks(bases);
    RC_ASSERT(words.has_value());
    RC_ASSERT(words->size() == SequencePacker::chunkCount(length));

    auto decoded = SequencePacker::decodeChunks(*words, length);
    RC_ASSERT(decoded.has_value());
    RC_ASSERT(*decoded == bases);
}

/// @brief Every full chunk equals the single-word encoding of its bases.
RC_GTEST_PROP(SequencePackerProperty, ChunksMatchSingleWordEncoding, ()) {
    const auto length = *rc::gen::inRange<std::size_t>(1, 200);
    const auto bases = *gen::sequence(length);

    auto words = SequencePacker::encodeChunks(bases);
    RC_ASSERT(words.has_value());

    for (std::size_t k = 0; k < words->size(); ++k) {
        const std::size_t start = k * kMaxCodesPerWord;
        const std::size_t len = std::min(kMaxCodesPerWord, length - start);
        std::vector<Nucleotide> chunk(bases.begin() + static_cast<std::ptrdiff_t>(start),
                                      bases.begin() + static_cast<std::ptrdiff_t>(start + len));
        RC_ASSERT((*words)[k] == *SequencePacker::encode(chunk));
    }
}

// =============================================================================
// Property Tests - Mismatch Count
// =============================================================================

RC_GTEST_PROP(SequencePackerProperty, MismatchCountMatchesNaive, ()) {
    const auto length = *rc::gen::inRange<std::size_t>(0, kMaxCodesPerWord + 1);
    const auto a = *gen::sequence(length);
    const auto b = *gen::sequence(length);

    std::size_t expected = 0;
    for (std::size_t i = 0; i < length; ++i) {
        expected += a[i] != b[i] ? 1 : 0;
    }

    auto count = SequencePacker::mismatchCount(*SequencePacker::pack(a), *SequencePacker::pack(b));
    RC_ASSERT(count.has_value());
    RC_ASSERT(*count == expected);
}

// =============================================================================
// Unit Tests
// =============================================================================

TEST(SequencePackerTest, PacksAtcgToThirty) {
    auto word = SequencePacker::encode("ATCG");
    ASSERT_TRUE(word.has_value());
    EXPECT_EQ(*word, 30u);  // 00 01 11 10

    auto bases = SequencePacker::decode(30, 4);
    ASSERT_TRUE(bases.has_value());
    const std::vector<Nucleotide> expected = {Nucleotide::kA, Nucleotide::kT, Nucleotide::kC,
                                              Nucleotide::kG};
    EXPECT_EQ(*bases, expected);
}

TEST(SequencePackerTest, OrderMatters) {
    const std::vector<Nucleotide> at = {Nucleotide::kA, Nucleotide::kT};
    const std::vector<Nucleotide> ta = {Nucleotide::kT, Nucleotide::kA};
    EXPECT_EQ(*SequencePacker::encode(at, 64), 0b0001u);
    EXPECT_EQ(*SequencePacker::encode(ta, 64), 0b0100u);
}

TEST(SequencePackerTest, EmptySequencePacksToZero) {
    const std::vector<Nucleotide> empty;
    auto word = SequencePacker::encode(empty, 0);
    ASSERT_TRUE(word.has_value());
    EXPECT_EQ(*word, 0u);

    auto decoded = SequencePacker::decode(0, 0, 0);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->empty());
}

TEST(SequencePackerTest, FullWordUsesTopBits) {
    const std::string text(kMaxCodesPerWord, 'C');
    auto word = SequencePacker::encode(text);
    ASSERT_TRUE(word.has_value());
    EXPECT_EQ(*word, ~Word{0});

    std::string firstIsG = text;
    firstIsG[0] = 'G';
    EXPECT_EQ(*SequencePacker::encode(firstIsG), ~Word{0} ^ (Word{1} << 62));
}

TEST(SequencePackerTest, CapacityExceededCarriesCountAndLimit) {
    auto word = SequencePacker::encode("ACGTA", 8);
    ASSERT_FALSE(word.has_value());
    EXPECT_EQ(word.error().code(), ErrorCode::kCapacityExceeded);
    ASSERT_TRUE(word.error().context().has_value());
    EXPECT_EQ(word.error().context()->value.value(), 5u);
    EXPECT_EQ(word.error().context()->limit.value(), 4u);
}

TEST(SequencePackerTest, OddCapacityRoundsDown) {
    EXPECT_TRUE(SequencePacker::encode("ACG", 7).has_value());
    EXPECT_FALSE(SequencePacker::encode("ACGT", 7).has_value());
}

TEST(SequencePackerTest, CapacityWiderThanWordIsInvalid) {
    auto word = SequencePacker::encode("A", 65);
    ASSERT_FALSE(word.has_value());
    EXPECT_EQ(word.error().code(), ErrorCode::kInvalidArgument);

    auto decoded = SequencePacker::decode(0, 1, 128);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kInvalidArgument);
}

TEST(SequencePackerTest, DecodeRejectsLengthBeyondCapacity) {
    auto decoded = SequencePacker::decode(0, 33);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kCapacityExceeded);
}

TEST(SequencePackerTest, UnrecognizedCharacterIsRejectedNotSkipped) {
    auto word = SequencePacker::encode("ACNGT");
    ASSERT_FALSE(word.has_value());
    EXPECT_EQ(word.error().code(), ErrorCode::kInvalidSymbol);
    ASSERT_TRUE(word.error().context().has_value());
    EXPECT_EQ(word.error().context()->index.value(), 2u);
    EXPECT_EQ(word.error().context()->value.value(), static_cast<std::uint64_t>('N'));
}

TEST(SequencePackerTest, OutOfRangeEnumIsRejected) {
    const std::vector<Nucleotide> bases = {Nucleotide::kA, static_cast<Nucleotide>(7)};
    auto word = SequencePacker::encode(bases);
    ASSERT_FALSE(word.has_value());
    EXPECT_EQ(word.error().code(), ErrorCode::kInvalidSymbol);
    EXPECT_EQ(word.error().context()->index.value(), 1u);
}

TEST(SequencePackerTest, WrongLengthDecodesWithoutError) {
    // The word does not record its length; a shorter length returns the tail.
    auto decoded = SequencePacker::decodeToString(30, 2);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, "CG");

    auto longer = SequencePacker::decodeToString(30, 6);
    ASSERT_TRUE(longer.has_value());
    EXPECT_EQ(*longer, "AAATCG");
}

TEST(SequencePackerTest, FromWordReattachesCount) {
    auto packed = PackedSequence::fromWord(30, 4);
    ASSERT_TRUE(packed.has_value());
    EXPECT_EQ(SequencePacker::unpackToString(*packed), "ATCG");
    EXPECT_EQ(*packed, *SequencePacker::pack("ATCG"));

    auto stray = PackedSequence::fromWord(30 | (Word{1} << 40), 4);
    ASSERT_TRUE(stray.has_value());
    EXPECT_EQ(stray->word(), 30u);
    EXPECT_EQ(*stray, *packed);

    auto tooMany = PackedSequence::fromWord(0, 33);
    ASSERT_FALSE(tooMany.has_value());
    EXPECT_EQ(tooMany.error().code(), ErrorCode::kCapacityExceeded);
}

TEST(SequencePackerTest, ChunkLayout) {
    // 33 bases: one full word of A then a single T in its own word.
    const std::string text = std::string(32, 'A') + "T";
    auto words = SequencePacker::encodeChunks(text);
    ASSERT_TRUE(words.has_value());
    ASSERT_EQ(words->size(), 2u);
    EXPECT_EQ((*words)[0], 0u);
    EXPECT_EQ((*words)[1], 1u);

    auto back = SequencePacker::decodeChunksToString(*words, text.size());
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, text);
}

TEST(SequencePackerTest, ChunkedRejectsInvalidCharacterWithGlobalIndex) {
    const std::string text = std::string(40, 'G') + "X";
    auto words = SequencePacker::encodeChunks(text);
    ASSERT_FALSE(words.has_value());
    EXPECT_EQ(words.error().code(), ErrorCode::kInvalidSymbol);
    EXPECT_EQ(words.error().context()->index.value(), 40u);
}

TEST(SequencePackerTest, DecodeChunksChecksWordCount) {
    const std::vector<Word> words = {0, 0};

    auto tooLong = SequencePacker::decodeChunks(words, 65);
    ASSERT_FALSE(tooLong.has_value());
    EXPECT_EQ(tooLong.error().code(), ErrorCode::kCapacityExceeded);

    auto trailing = SequencePacker::decodeChunks(words, 32);
    ASSERT_FALSE(trailing.has_value());
    EXPECT_EQ(trailing.error().code(), ErrorCode::kInvalidArgument);

    auto empty = SequencePacker::decodeChunks(std::span<const Word>{}, 0);
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST(SequencePackerTest, DecodeChunksRejectsLengthNearSizeMax) {
    constexpr std::size_t kHuge = std::numeric_limits<std::size_t>::max();
    EXPECT_EQ(SequencePacker::chunkCount(kHuge), kHuge / kMaxCodesPerWord + 1);
    EXPECT_EQ(SequencePacker::chunkCount(kHuge - 5), kHuge / kMaxCodesPerWord + 1);

    auto none = SequencePacker::decodeChunks(std::span<const Word>{}, kHuge);
    ASSERT_FALSE(none.has_value());
    EXPECT_EQ(none.error().code(), ErrorCode::kCapacityExceeded);

    const std::vector<Word> one = {0};
    auto single = SequencePacker::decodeChunks(one, kHuge - 5);
    ASSERT_FALSE(single.has_value());
    EXPECT_EQ(single.error().code(), ErrorCode::kCapacityExceeded);
}

TEST(SequencePackerTest, MismatchCount) {
    auto a = SequencePacker::pack("ACGTACGT");
    auto b = SequencePacker::pack("ACCTACGA");
    ASSERT_TRUE(a.has_value() && b.has_value());
    EXPECT_EQ(*SequencePacker::mismatchCount(*a, *b), 2u);
    EXPECT_EQ(*SequencePacker::mismatchCount(*a, *a), 0u);

    auto shorter = SequencePacker::pack("ACG");
    auto mismatch = SequencePacker::mismatchCount(*a, *shorter);
    ASSERT_FALSE(mismatch.has_value());
    EXPECT_EQ(mismatch.error().code(), ErrorCode::kInvalidArgument);
}

}  // namespace gpack::codec::test
