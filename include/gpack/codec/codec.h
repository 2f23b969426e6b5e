// =============================================================================
// gpack - Codec Entry Points
// =============================================================================
// The public surface of the packing library:
//
//   packSequence   / unpackSequence    nucleotides  <-> one word
//   packVariant    / unpackVariant     VariantRecord <-> one word
//   packGenotypes  / unpackGenotypes   genotype calls <-> one word
//
// PackerOptions is validated on every call taking it; a bad option is
// reported as kUsageError before any packing happens. Everything else is
// reported as documented on SequencePacker, GenotypePacker and
// VariantRecordPacker.
//
// A bare word records neither its alphabet nor its element count. Keep both
// alongside the word, or use the tagged PackedSequence / PackedGenotypes
// types from the individual packers.
// =============================================================================

#ifndef GPACK_CODEC_CODEC_H
#define GPACK_CODEC_CODEC_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "gpack/codec/alphabet.h"
#include "gpack/codec/genotype_packer.h"
#include "gpack/codec/sequence_packer.h"
#include "gpack/codec/variant_packer.h"
#include "gpack/common/error.h"
#include "gpack/common/types.h"

namespace gpack {

using codec::GenotypeCall;
using codec::Nucleotide;
using codec::VariantRecord;

/// @brief Pack nucleotides into one word, first base most significant.
[[nodiscard]] Result<Word> packSequence(std::span<const Nucleotide> bases,
                                        const PackerOptions& options = {});

/// @brief Unpack length nucleotides from a word.
[[nodiscard]] Result<std::vector<Nucleotide>> unpackSequence(Word word, std::size_t length,
                                                             const PackerOptions& options = {});

/// @brief Pack a variant record.
[[nodiscard]] Result<Word> packVariant(const VariantRecord& record);

/// @brief Pack variant fields.
[[nodiscard]] Result<Word> packVariant(std::uint64_t chrom, std::uint64_t position,
                                       Nucleotide ref, Nucleotide alt, std::uint64_t flags);

/// @brief Unpack a variant word. Never fails.
[[nodiscard]] VariantRecord unpackVariant(Word word) noexcept;

/// @brief Pack per-sample genotype calls into one word, first sample most significant.
[[nodiscard]] Result<Word> packGenotypes(std::span<const GenotypeCall> calls,
                                         const PackerOptions& options = {});

/// @brief Unpack count genotype calls from a word.
[[nodiscard]] Result<std::vector<GenotypeCall>> unpackGenotypes(
    Word word, std::size_t count, const PackerOptions& options = {});

}  // namespace gpack

#endif  // GPACK_CODEC_CODEC_H
