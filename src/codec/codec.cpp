// =============================================================================
// gpack - Codec Entry Points Implementation
// =============================================================================

#include "gpack/codec/codec.h"

namespace gpack {

Result<Word> packSequence(std::span<const Nucleotide> bases, const PackerOptions& options) {
    if (auto ok = options.validate(); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    return codec::SequencePacker::encode(bases, options.capacityBits);
}

Result<std::vector<Nucleotide>> unpackSequence(Word word, std::size_t length,
                                               const PackerOptions& options) {
    if (auto ok = options.validate(); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    return codec::SequencePacker::decode(word, length, options.capacityBits);
}

Result<Word> packVariant(const VariantRecord& record) {
    return codec::VariantRecordPacker::encode(record);
}

Result<Word> packVariant(std::uint64_t chrom, std::uint64_t position, Nucleotide ref,
                         Nucleotide alt, std::uint64_t flags) {
    return codec::VariantRecordPacker::encode(chrom, position, ref, alt, flags);
}

VariantRecord unpackVariant(Word word) noexcept {
    return codec::VariantRecordPacker::decode(word);
}

Result<Word> packGenotypes(std::span<const GenotypeCall> calls, const PackerOptions& options) {
    if (auto ok = options.validate(); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    return codec::GenotypePacker::encode(calls, options.capacityBits);
}

Result<std::vector<GenotypeCall>> unpackGenotypes(Word word, std::size_t count,
                                                  const PackerOptions& options) {
    if (auto ok = options.validate(); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    return codec::GenotypePacker::decode(word, count, options.capacityBits);
}

}  // namespace gpack
