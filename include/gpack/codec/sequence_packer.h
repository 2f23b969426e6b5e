// =============================================================================
// gpack - Sequence Packer
// =============================================================================
// Packs nucleotide sequences into 64-bit words, 2 bits per base, first base
// in the most significant used bits.
//
// This module provides:
// - Single-word packing with an explicit capacity (inherited from CodePacker)
// - Multi-word chunking for sequences longer than 32 bases
// - Mismatch counting between two packed sequences without unpacking
//
// Chunk Layout:
// - Word k holds bases [32k, min(32k + 32, n)), MSB-first within its own
//   base count; only the final word may be partial
// =============================================================================

#ifndef GPACK_CODEC_SEQUENCE_PACKER_H
#define GPACK_CODEC_SEQUENCE_PACKER_H

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "gpack/codec/alphabet.h"
#include "gpack/codec/code_packer.h"
#include "gpack/common/error.h"
#include "gpack/common/types.h"

namespace gpack::codec {

/// @brief A packed nucleotide word tagged with its base count.
using PackedSequence = PackedCodes<NucleotideAlphabet>;

/// @brief Nucleotide packer.
///
/// Usage:
/// @code
/// auto word = SequencePacker::encode("ATCG");          // 0b00011110 == 30
/// auto bases = SequencePacker::decodeToString(30, 4);  // "ATCG"
///
/// auto chunks = SequencePacker::encodeChunks(longRead);
/// auto read = SequencePacker::decodeChunks(*chunks, longRead.size());
/// @endcode
class SequencePacker : public CodePacker<NucleotideAlphabet> {
public:
    SequencePacker() = delete;

    /// @brief Number of words needed to hold length bases.
    [[nodiscard]] static constexpr std::size_t chunkCount(std::size_t length) noexcept {
        return length / kMaxCodesPerWord + (length % kMaxCodesPerWord != 0 ? 1 : 0);
    }

    /// @brief Pack a sequence of any length into consecutive full words.
    /// @return One word per 32 bases, or kInvalidSymbol (index is the
    ///         position in the whole sequence).
    [[nodiscard]] static Result<std::vector<Word>> encodeChunks(std::span<const Nucleotide> bases);

    /// @brief Text overload of encodeChunks().
    [[nodiscard]] static Result<std::vector<Word>> encodeChunks(std::string_view bases);

    /// @brief Unpack a chunked sequence.
    /// @param words Words produced by encodeChunks().
    /// @param length Total base count.
    /// @return Bases, or kCapacityExceeded if words cannot hold length bases,
    ///         or kInvalidArgument if words has more entries than length needs.
    [[nodiscard]] static Result<std::vector<Nucleotide>> decodeChunks(std::span<const Word> words,
                                                                      std::size_t length);

    /// @brief Text overload of decodeChunks().
    [[nodiscard]] static Result<std::string> decodeChunksToString(std::span<const Word> words,
                                                                  std::size_t length);

    /// @brief Count positions at which two packed sequences differ.
    /// @return Mismatch count, or kInvalidArgument if the lengths differ.
    [[nodiscard]] static Result<std::size_t> mismatchCount(const PackedSequence& a,
                                                           const PackedSequence& b);
};

}  // namespace gpack::codec

#endif  // GPACK_CODEC_SEQUENCE_PACKER_H
