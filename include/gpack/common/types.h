// =============================================================================
// gpack - Common Type Definitions
// =============================================================================
// Core type definitions for the gpack library.
//
// This module defines:
// - Word: the fixed-width container every packer emits
// - Bit-width constants shared by the sequence and genotype packers
// - PackerOptions: tunables for capacity and batch parallelism
// - C++20 Concepts for type constraints
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef GPACK_COMMON_TYPES_H
#define GPACK_COMMON_TYPES_H

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <type_traits>

#include "gpack/common/error.h"

namespace gpack {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Packed word type.
using Word = std::uint64_t;

/// @brief Raw 2-bit code as produced by an alphabet (only the low 2 bits are used).
using Code = std::uint8_t;

// =============================================================================
// Constants
// =============================================================================

/// @brief Width of a packed word in bits.
inline constexpr std::size_t kWordBits = std::numeric_limits<Word>::digits;

/// @brief Bits occupied by one alphabet code.
inline constexpr std::size_t kBitsPerCode = 2;

/// @brief Mask selecting one code.
inline constexpr Word kCodeMask = (Word{1} << kBitsPerCode) - 1;

/// @brief Number of codes that fit in a full word.
inline constexpr std::size_t kMaxCodesPerWord = kWordBits / kBitsPerCode;

/// @brief Default packing capacity (a full word).
inline constexpr std::size_t kDefaultCapacityBits = kWordBits;

/// @brief Default record count at which batch operations go parallel.
inline constexpr std::size_t kDefaultParallelThreshold = 4096;

/// @brief Default TBB grain size for batch operations.
inline constexpr std::size_t kDefaultGrainSize = 1024;

/// @brief Lane mask with the low bit of every 2-bit lane set (0b0101...).
inline constexpr Word kLowLaneMask = 0x5555'5555'5555'5555ULL;

/// @brief Mask covering the low `codes` 2-bit lanes of a word.
/// @pre codes <= kMaxCodesPerWord
[[nodiscard]] constexpr Word usedBitsMask(std::size_t codes) noexcept {
    return codes >= kMaxCodesPerWord ? ~Word{0} : (Word{1} << (codes * kBitsPerCode)) - 1;
}

// =============================================================================
// Packer Options
// =============================================================================

/// @brief Options shared by the packers and the codec facade.
struct PackerOptions {
    /// @brief Number of low-order bits of the word a packed sequence may use.
    /// @note Must be in [0, kWordBits]. Odd values round down to whole codes.
    std::size_t capacityBits = kDefaultCapacityBits;

    /// @brief Batch size at which batch operations switch to tbb::parallel_for.
    /// @note 0 disables parallel batches.
    std::size_t parallelThreshold = kDefaultParallelThreshold;

    /// @brief Grain size handed to tbb::blocked_range.
    std::size_t grainSize = kDefaultGrainSize;

    /// @brief Check the options for consistency.
    /// @return Success, or kUsageError describing the first bad option.
    [[nodiscard]] VoidResult validate() const;

    /// @brief Number of whole codes that fit in capacityBits.
    [[nodiscard]] constexpr std::size_t maxCodes() const noexcept {
        return capacityBits / kBitsPerCode;
    }

    [[nodiscard]] bool operator==(const PackerOptions& other) const noexcept = default;
};

// =============================================================================
// C++20 Concepts
// =============================================================================

/// @brief Concept for a closed 4-symbol alphabet usable by the packers.
/// @note The alphabet type supplies the symbol enum and its code mapping.
template <typename A>
concept PackingAlphabet = requires(typename A::Symbol symbol, Code code, char c) {
    requires std::is_enum_v<typename A::Symbol>;
    { A::kName } -> std::convertible_to<const char*>;
    { A::encode(symbol) } -> std::same_as<Code>;
    { A::decode(code) } -> std::same_as<typename A::Symbol>;
    { A::isValid(symbol) } -> std::same_as<bool>;
    { A::toChar(symbol) } -> std::same_as<char>;
    { A::fromChar(c) } -> std::same_as<Result<typename A::Symbol>>;
};

// =============================================================================
// Static Assertions
// =============================================================================

static_assert(kWordBits == 64, "Word must be 64 bits");
static_assert(kMaxCodesPerWord == 32, "A word must hold 32 two-bit codes");
static_assert(kCodeMask == 3, "Code mask must select two bits");

}  // namespace gpack

#endif  // GPACK_COMMON_TYPES_H
