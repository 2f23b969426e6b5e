// =============================================================================
// gpack - Alphabet Codec
// =============================================================================
// Bidirectional mapping between the closed 4-symbol alphabets and their
// 2-bit codes.
//
// Two alphabets are defined:
// - NucleotideAlphabet: A=00, T=01, G=10, C=11
// - GenotypeAlphabet:   HomRef=00, Het=01, HomAlt=10, Incomplete=11
//
// Both are dense: every 2-bit pattern decodes to exactly one symbol, so
// decode() never fails. The two alphabets share shape but are distinct
// types; a word packed with one cannot be handed to the other's packer
// without an explicit conversion.
//
// Character mapping (used by the text entry points):
// - Nucleotides: 'A', 'T', 'G', 'C' (case-insensitive)
// - Genotypes:   '0' HomRef, '1' Het, '2' HomAlt, '.' Incomplete
// Any other character is rejected with ErrorCode::kInvalidSymbol.
// =============================================================================

#ifndef GPACK_CODEC_ALPHABET_H
#define GPACK_CODEC_ALPHABET_H

#include <array>
#include <cstdint>
#include <string_view>

#include "gpack/common/error.h"
#include "gpack/common/types.h"

namespace gpack::codec {

// =============================================================================
// Symbol Enumerations
// =============================================================================

/// @brief Nucleotide base.
/// @note Underlying values are the wire codes.
enum class Nucleotide : std::uint8_t {
    kA = 0b00,
    kT = 0b01,
    kG = 0b10,
    kC = 0b11
};

/// @brief Diploid genotype call.
/// @note Underlying values are the wire codes.
enum class GenotypeCall : std::uint8_t {
    /// @brief Homozygous reference (0/0).
    kHomRef = 0b00,

    /// @brief Heterozygous (0/1).
    kHet = 0b01,

    /// @brief Homozygous alternate (1/1).
    kHomAlt = 0b10,

    /// @brief Missing or partially called genotype.
    kIncomplete = 0b11
};

// =============================================================================
// Nucleotide Alphabet
// =============================================================================

struct NucleotideAlphabet {
    using Symbol = Nucleotide;

    static constexpr const char* kName = "nucleotide";

    /// @brief All symbols in code order.
    static constexpr std::array<Symbol, 4> kSymbols = {
        Nucleotide::kA, Nucleotide::kT, Nucleotide::kG, Nucleotide::kC};

    /// @brief Check that a symbol is a member of the closed set.
    /// @note Out-of-range values can only be produced by static_cast.
    [[nodiscard]] static constexpr bool isValid(Symbol symbol) noexcept {
        return static_cast<std::uint8_t>(symbol) <= kCodeMask;
    }

    [[nodiscard]] static constexpr Code encode(Symbol symbol) noexcept {
        switch (symbol) {
            case Nucleotide::kA:
                return 0b00;
            case Nucleotide::kT:
                return 0b01;
            case Nucleotide::kG:
                return 0b10;
            case Nucleotide::kC:
                return 0b11;
        }
        return static_cast<Code>(static_cast<std::uint8_t>(symbol) & kCodeMask);
    }

    /// @brief Decode a code; only the low 2 bits are read.
    [[nodiscard]] static constexpr Symbol decode(Code code) noexcept {
        switch (code & kCodeMask) {
            case 0b00:
                return Nucleotide::kA;
            case 0b01:
                return Nucleotide::kT;
            case 0b10:
                return Nucleotide::kG;
            default:
                return Nucleotide::kC;
        }
    }

    [[nodiscard]] static constexpr char toChar(Symbol symbol) noexcept {
        switch (symbol) {
            case Nucleotide::kA:
                return 'A';
            case Nucleotide::kT:
                return 'T';
            case Nucleotide::kG:
                return 'G';
            case Nucleotide::kC:
                return 'C';
        }
        return '?';
    }

    /// @brief Parse a base character (case-insensitive).
    /// @return The nucleotide, or kInvalidSymbol for anything else (including 'N').
    [[nodiscard]] static Result<Symbol> fromChar(char c);
};

// =============================================================================
// Genotype Alphabet
// =============================================================================

struct GenotypeAlphabet {
    using Symbol = GenotypeCall;

    static constexpr const char* kName = "genotype";

    static constexpr std::array<Symbol, 4> kSymbols = {
        GenotypeCall::kHomRef, GenotypeCall::kHet, GenotypeCall::kHomAlt,
        GenotypeCall::kIncomplete};

    [[nodiscard]] static constexpr bool isValid(Symbol symbol) noexcept {
        return static_cast<std::uint8_t>(symbol) <= kCodeMask;
    }

    [[nodiscard]] static constexpr Code encode(Symbol symbol) noexcept {
        switch (symbol) {
            case GenotypeCall::kHomRef:
                return 0b00;
            case GenotypeCall::kHet:
                return 0b01;
            case GenotypeCall::kHomAlt:
                return 0b10;
            case GenotypeCall::kIncomplete:
                return 0b11;
        }
        return static_cast<Code>(static_cast<std::uint8_t>(symbol) & kCodeMask);
    }

    [[nodiscard]] static constexpr Symbol decode(Code code) noexcept {
        switch (code & kCodeMask) {
            case 0b00:
                return GenotypeCall::kHomRef;
            case 0b01:
                return GenotypeCall::kHet;
            case 0b10:
                return GenotypeCall::kHomAlt;
            default:
                return GenotypeCall::kIncomplete;
        }
    }

    [[nodiscard]] static constexpr char toChar(Symbol symbol) noexcept {
        switch (symbol) {
            case GenotypeCall::kHomRef:
                return '0';
            case GenotypeCall::kHet:
                return '1';
            case GenotypeCall::kHomAlt:
                return '2';
            case GenotypeCall::kIncomplete:
                return '.';
        }
        return '?';
    }

    /// @brief Parse a dosage character ('0', '1', '2' or '.').
    [[nodiscard]] static Result<Symbol> fromChar(char c);
};

// =============================================================================
// AlphabetCodec
// =============================================================================

/// @brief Codec over one alphabet.
///
/// Thin generic layer over the alphabet tables adding the checked entry
/// points (fromCode, display names). All members are static and pure.
///
/// Usage:
/// @code
/// Code c = NucleotideCodec::encode(Nucleotide::kG);         // 0b10
/// Nucleotide n = NucleotideCodec::decode(0b11);             // kC
/// auto parsed = NucleotideCodec::fromChar('x');             // kInvalidSymbol
/// @endcode
template <PackingAlphabet A>
class AlphabetCodec {
public:
    using Alphabet = A;
    using Symbol = typename A::Symbol;

    AlphabetCodec() = delete;

    [[nodiscard]] static constexpr Code encode(Symbol symbol) noexcept { return A::encode(symbol); }

    [[nodiscard]] static constexpr Symbol decode(Code code) noexcept { return A::decode(code); }

    [[nodiscard]] static constexpr bool isValid(Symbol symbol) noexcept {
        return A::isValid(symbol);
    }

    [[nodiscard]] static constexpr char toChar(Symbol symbol) noexcept { return A::toChar(symbol); }

    [[nodiscard]] static Result<Symbol> fromChar(char c) { return A::fromChar(c); }

    /// @brief Checked decode of a raw value.
    /// @return The symbol, or kInvalidSymbol if value does not fit in 2 bits.
    [[nodiscard]] static Result<Symbol> fromCode(std::uint8_t value);

    /// @brief Alphabet name used in messages ("nucleotide", "genotype").
    [[nodiscard]] static constexpr std::string_view name() noexcept { return A::kName; }

    /// @brief All symbols in code order.
    [[nodiscard]] static constexpr const std::array<Symbol, 4>& symbols() noexcept {
        return A::kSymbols;
    }
};

using NucleotideCodec = AlphabetCodec<NucleotideAlphabet>;
using GenotypeCodec = AlphabetCodec<GenotypeAlphabet>;

extern template class AlphabetCodec<NucleotideAlphabet>;
extern template class AlphabetCodec<GenotypeAlphabet>;

/// @brief Short display name of a nucleotide ("A", "T", "G", "C").
[[nodiscard]] std::string_view toString(Nucleotide base) noexcept;

/// @brief Short display name of a genotype call ("hom_ref", "het", ...).
[[nodiscard]] std::string_view toString(GenotypeCall call) noexcept;

// =============================================================================
// Static Assertions
// =============================================================================

static_assert(PackingAlphabet<NucleotideAlphabet>);
static_assert(PackingAlphabet<GenotypeAlphabet>);
static_assert(sizeof(Nucleotide) == 1, "Nucleotide must be 1 byte");
static_assert(sizeof(GenotypeCall) == 1, "GenotypeCall must be 1 byte");

}  // namespace gpack::codec

#endif  // GPACK_CODEC_ALPHABET_H
