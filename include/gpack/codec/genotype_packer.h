// =============================================================================
// gpack - Genotype Packer
// =============================================================================
// Packs per-sample diploid genotype calls into 64-bit words, 2 bits per call,
// first sample in the most significant used bits. Same contract as the
// sequence packer over the genotype alphabet.
//
// Also provides per-state call counts computed directly on the packed word.
// =============================================================================

#ifndef GPACK_CODEC_GENOTYPE_PACKER_H
#define GPACK_CODEC_GENOTYPE_PACKER_H

#include <cstddef>

#include "gpack/codec/alphabet.h"
#include "gpack/codec/code_packer.h"
#include "gpack/common/types.h"

namespace gpack::codec {

/// @brief A packed genotype word tagged with its call count.
using PackedGenotypes = PackedCodes<GenotypeAlphabet>;

/// @brief Number of samples in each genotype state.
struct GenotypeCounts {
    std::size_t homRef = 0;
    std::size_t het = 0;
    std::size_t homAlt = 0;
    std::size_t incomplete = 0;

    [[nodiscard]] constexpr std::size_t total() const noexcept {
        return homRef + het + homAlt + incomplete;
    }

    /// @brief Alternate allele count over the called samples (het + 2 * homAlt).
    [[nodiscard]] constexpr std::size_t altAlleleCount() const noexcept {
        return het + 2 * homAlt;
    }

    [[nodiscard]] bool operator==(const GenotypeCounts& other) const noexcept = default;
};

/// @brief Genotype call packer.
///
/// Usage:
/// @code
/// auto packed = GenotypePacker::pack("0012.");   // 5 samples
/// auto counts = GenotypePacker::countCalls(*packed);
/// // counts.homRef == 2, counts.het == 1, counts.homAlt == 1, counts.incomplete == 1
/// @endcode
class GenotypePacker : public CodePacker<GenotypeAlphabet> {
public:
    GenotypePacker() = delete;

    /// @brief Count calls per state without unpacking.
    [[nodiscard]] static GenotypeCounts countCalls(const PackedGenotypes& genotypes) noexcept;
};

}  // namespace gpack::codec

#endif  // GPACK_CODEC_GENOTYPE_PACKER_H
