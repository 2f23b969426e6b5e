// =============================================================================
// gpack - Genotype Packer Implementation
// =============================================================================

#include "gpack/codec/genotype_packer.h"

#include <bit>

namespace gpack::codec {

GenotypeCounts GenotypePacker::countCalls(const PackedGenotypes& genotypes) noexcept {
    const Word lanes = kLowLaneMask & usedBitsMask(genotypes.count());
    const Word lo = genotypes.word() & lanes;
    const Word hi = (genotypes.word() >> 1) & lanes;

    GenotypeCounts counts;
    counts.het = static_cast<std::size_t>(std::popcount(lo & ~hi));         // 01
    counts.homAlt = static_cast<std::size_t>(std::popcount(hi & ~lo));      // 10
    counts.incomplete = static_cast<std::size_t>(std::popcount(lo & hi));   // 11
    counts.homRef = genotypes.count() - counts.het - counts.homAlt - counts.incomplete;
    return counts;
}

}  // namespace gpack::codec
