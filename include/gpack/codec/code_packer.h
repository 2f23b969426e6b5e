// =============================================================================
// gpack - Two-Bit Code Packer
// =============================================================================
// Packs an ordered run of 2-bit alphabet codes into a single fixed-capacity
// word, and unpacks it again.
//
// Packing Order (wire contract):
// - Start from 0; for each symbol: word = (word << 2) | code(symbol)
// - The first symbol ends up in the most significant used bits, the last
//   symbol in bits 1..0, i.e. word = sum(code(s_i) * 4^(n-1-i))
//
// A bare word does not record its length or alphabet. Callers either keep
// the count out-of-band and use decode(word, length), or use the tagged
// PackedCodes<A> type, which carries both (the alphabet in the C++ type, the
// count as a member) without changing the stored word.
//
// Validation happens before any bits are written; encode never returns a
// partially packed word.
// =============================================================================

#ifndef GPACK_CODEC_CODE_PACKER_H
#define GPACK_CODEC_CODE_PACKER_H

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "gpack/codec/alphabet.h"
#include "gpack/common/error.h"
#include "gpack/common/types.h"

namespace gpack::codec {

template <PackingAlphabet A>
class CodePacker;

// =============================================================================
// PackedCodes
// =============================================================================

/// @brief A packed word tagged with its alphabet and symbol count.
/// @tparam A Alphabet the word was packed with.
/// @note Only CodePacker and fromWord() can create non-empty values, so
///       count() <= kMaxCodesPerWord always holds.
template <PackingAlphabet A>
class PackedCodes {
public:
    using Alphabet = A;
    using Symbol = typename A::Symbol;

    /// @brief Empty sequence (word 0, count 0).
    constexpr PackedCodes() noexcept = default;

    /// @brief Re-attach a descriptor to a word read back from storage.
    /// @param word Bare packed word.
    /// @param count Number of codes in the word.
    /// @return Tagged word with bits above count cleared, or kCapacityExceeded
    ///         if count > kMaxCodesPerWord.
    [[nodiscard]] static Result<PackedCodes> fromWord(Word word, std::size_t count);

    /// @brief The bare packed word (the stored representation).
    [[nodiscard]] constexpr Word word() const noexcept { return word_; }

    /// @brief Number of codes in the word.
    [[nodiscard]] constexpr std::size_t count() const noexcept { return count_; }

    [[nodiscard]] constexpr bool empty() const noexcept { return count_ == 0; }

    /// @brief Number of low-order bits in use.
    [[nodiscard]] constexpr std::size_t bits() const noexcept { return count_ * kBitsPerCode; }

    /// @brief Symbol at logical index i (0 = first packed).
    /// @pre i < count()
    [[nodiscard]] constexpr Symbol at(std::size_t i) const noexcept {
        const std::size_t shift = (count_ - 1 - i) * kBitsPerCode;
        return A::decode(static_cast<Code>((word_ >> shift) & kCodeMask));
    }

    [[nodiscard]] bool operator==(const PackedCodes& other) const noexcept = default;

private:
    friend class CodePacker<A>;

    constexpr PackedCodes(Word word, std::size_t count) noexcept : word_(word), count_(count) {}

    Word word_ = 0;
    std::size_t count_ = 0;
};

// =============================================================================
// CodePacker
// =============================================================================

/// @brief MSB-first packer for one alphabet.
///
/// All members are static pure functions; any number of calls may run
/// concurrently.
///
/// Usage:
/// @code
/// std::vector<Nucleotide> bases = {Nucleotide::kA, Nucleotide::kT};
/// auto word = CodePacker<NucleotideAlphabet>::encode(bases);     // 0b0001
/// auto back = CodePacker<NucleotideAlphabet>::decode(*word, 2);  // {A, T}
/// @endcode
template <PackingAlphabet A>
class CodePacker {
public:
    using Alphabet = A;
    using Symbol = typename A::Symbol;
    using Packed = PackedCodes<A>;

    CodePacker() = delete;

    // -------------------------------------------------------------------------
    // Bare words
    // -------------------------------------------------------------------------

    /// @brief Pack symbols into a word.
    /// @param symbols Ordered symbols, first symbol ends up most significant.
    /// @param capacityBits Number of low-order bits available (0..64).
    /// @return Packed word, or:
    ///         - kInvalidArgument if capacityBits > 64
    ///         - kCapacityExceeded if symbols.size() * 2 > capacityBits
    ///         - kInvalidSymbol if a symbol is outside the alphabet
    [[nodiscard]] static Result<Word> encode(std::span<const Symbol> symbols,
                                             std::size_t capacityBits = kDefaultCapacityBits);

    /// @brief Pack a text run, one character per symbol.
    /// @note Unrecognized characters fail with kInvalidSymbol; the context
    ///       index is the character offset. Nothing is skipped.
    [[nodiscard]] static Result<Word> encode(std::string_view text,
                                             std::size_t capacityBits = kDefaultCapacityBits);

    /// @brief Unpack length symbols from a word.
    /// @note The word does not carry its length; a wrong length yields a
    ///       wrong result without an error.
    /// @return Symbols in original order, or kInvalidArgument /
    ///         kCapacityExceeded for an impossible length.
    [[nodiscard]] static Result<std::vector<Symbol>> decode(
        Word word, std::size_t length, std::size_t capacityBits = kDefaultCapacityBits);

    /// @brief Unpack length symbols and render them as characters.
    [[nodiscard]] static Result<std::string> decodeToString(
        Word word, std::size_t length, std::size_t capacityBits = kDefaultCapacityBits);

    // -------------------------------------------------------------------------
    // Tagged words
    // -------------------------------------------------------------------------

    [[nodiscard]] static Result<Packed> pack(std::span<const Symbol> symbols,
                                             std::size_t capacityBits = kDefaultCapacityBits);

    [[nodiscard]] static Result<Packed> pack(std::string_view text,
                                             std::size_t capacityBits = kDefaultCapacityBits);

    /// @brief Unpack a tagged word using its carried count. Never fails.
    [[nodiscard]] static std::vector<Symbol> unpack(const Packed& packed);

    [[nodiscard]] static std::string unpackToString(const Packed& packed);

protected:
    /// @brief Pure left fold of codes into a word. Symbols must be valid.
    [[nodiscard]] static Word fold(std::span<const Symbol> symbols) noexcept;

    /// @brief Reverse of fold() for exactly length codes.
    [[nodiscard]] static std::vector<Symbol> unfold(Word word, std::size_t length);

    [[nodiscard]] static VoidResult checkCapacity(std::size_t count, std::size_t capacityBits);

    /// @brief Reject symbols outside the closed set.
    /// @param offset Added to the reported index.
    [[nodiscard]] static VoidResult checkSymbols(std::span<const Symbol> symbols,
                                                 std::size_t offset = 0);

    /// @brief Convert characters to symbols, failing on the first bad one.
    [[nodiscard]] static Result<std::vector<Symbol>> parse(std::string_view text);
};

extern template class PackedCodes<NucleotideAlphabet>;
extern template class PackedCodes<GenotypeAlphabet>;
extern template class CodePacker<NucleotideAlphabet>;
extern template class CodePacker<GenotypeAlphabet>;

}  // namespace gpack::codec

#endif  // GPACK_CODEC_CODE_PACKER_H
