// =============================================================================
// gpack - Variant Record Packer
// =============================================================================
// Packs a single-nucleotide variant record into one 64-bit word.
//
// Word Layout (bit 63 = MSB):
// +------------+----------------+-------+-------+-------------+
// | chrom (12) | position (28)  | ref(2)| alt(2)| flags (20)  |
// +------------+----------------+-------+-------+-------------+
//  63      52   51          24   23  22  21  20   19         0
//
// - chrom:    0 .. 4095
// - position: 0 .. 268,435,455
// - ref/alt:  nucleotide codes (A=00, T=01, G=10, C=11)
// - flags:    0 .. 1,048,575, opaque to the codec and passed through unchanged
//
// Because fields are laid out most significant first, comparing two packed
// words as unsigned integers orders them by (chrom, position, ref, alt,
// flags), the same order as VariantRecord's operator<=>.
// =============================================================================

#ifndef GPACK_CODEC_VARIANT_PACKER_H
#define GPACK_CODEC_VARIANT_PACKER_H

#include <compare>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "gpack/codec/alphabet.h"
#include "gpack/common/error.h"
#include "gpack/common/types.h"

namespace gpack::codec {

// =============================================================================
// Field Layout Constants
// =============================================================================

inline constexpr std::size_t kFlagsBits = 20;
inline constexpr std::size_t kAltBits = 2;
inline constexpr std::size_t kRefBits = 2;
inline constexpr std::size_t kPositionBits = 28;
inline constexpr std::size_t kChromBits = 12;

inline constexpr std::size_t kFlagsShift = 0;
inline constexpr std::size_t kAltShift = kFlagsShift + kFlagsBits;
inline constexpr std::size_t kRefShift = kAltShift + kAltBits;
inline constexpr std::size_t kPositionShift = kRefShift + kRefBits;
inline constexpr std::size_t kChromShift = kPositionShift + kPositionBits;

inline constexpr std::uint64_t kFlagsMax = (std::uint64_t{1} << kFlagsBits) - 1;
inline constexpr std::uint64_t kPositionMax = (std::uint64_t{1} << kPositionBits) - 1;
inline constexpr std::uint64_t kChromMax = (std::uint64_t{1} << kChromBits) - 1;

static_assert(kChromShift + kChromBits == kWordBits, "Variant fields must fill the word");
static_assert(kChromShift == 52 && kPositionShift == 24 && kRefShift == 22 && kAltShift == 20,
              "Variant field boundaries are part of the wire format");
static_assert(kChromMax == 4095);
static_assert(kPositionMax == 268'435'455);
static_assert(kFlagsMax == 1'048'575);

// =============================================================================
// VariantRecord
// =============================================================================

/// @brief A single-nucleotide variant.
/// @note Member order matches the packed field order, so the defaulted
///       comparison agrees with comparing packed words.
struct VariantRecord {
    /// @brief Chromosome identifier (12 bits).
    std::uint32_t chrom = 0;

    /// @brief Genomic position (28 bits).
    std::uint32_t position = 0;

    Nucleotide ref = Nucleotide::kA;

    Nucleotide alt = Nucleotide::kA;

    /// @brief Caller-defined flags (20 bits), not interpreted here.
    std::uint32_t flags = 0;

    [[nodiscard]] auto operator<=>(const VariantRecord& other) const noexcept = default;
};

// =============================================================================
// VariantRecordPacker
// =============================================================================

/// @brief Packs and unpacks VariantRecord values.
///
/// Usage:
/// @code
/// auto word = VariantRecordPacker::encode(2, 12345, Nucleotide::kA, Nucleotide::kT, 0);
/// VariantRecord rec = VariantRecordPacker::decode(*word);
/// @endcode
class VariantRecordPacker {
public:
    VariantRecordPacker() = delete;

    /// @brief Check every field against its width.
    /// @return Success, or the first failure in field order:
    ///         kFieldOverflow (chrom, position, flags) or kInvalidSymbol (ref, alt).
    [[nodiscard]] static VoidResult validate(std::uint64_t chrom, std::uint64_t position,
                                             Nucleotide ref, Nucleotide alt,
                                             std::uint64_t flags);

    [[nodiscard]] static VoidResult validate(const VariantRecord& record);

    /// @brief Pack individual fields.
    /// @note Fields are taken as 64-bit values so over-wide inputs are
    ///       reported rather than truncated by the call itself.
    [[nodiscard]] static Result<Word> encode(std::uint64_t chrom, std::uint64_t position,
                                             Nucleotide ref, Nucleotide alt,
                                             std::uint64_t flags);

    [[nodiscard]] static Result<Word> encode(const VariantRecord& record);

    /// @brief Unpack a word. Every bit pattern is a valid record.
    [[nodiscard]] static VariantRecord decode(Word word) noexcept;

    /// @brief Pack a batch of records, all or nothing.
    /// @param records Records to pack.
    /// @param options parallelThreshold and grainSize control TBB use.
    /// @return One word per record, or the first invalid record's error with
    ///         its batch index in the context, or kUsageError for bad options.
    [[nodiscard]] static Result<std::vector<Word>> encodeBatch(
        std::span<const VariantRecord> records, const PackerOptions& options = {});

    /// @brief Unpack a batch of words.
    [[nodiscard]] static Result<std::vector<VariantRecord>> decodeBatch(
        std::span<const Word> words, const PackerOptions& options = {});

private:
    [[nodiscard]] static Word pack(const VariantRecord& record) noexcept;
};

}  // namespace gpack::codec

#endif  // GPACK_CODEC_VARIANT_PACKER_H
