// =============================================================================
// gpack - Sequence Packer Implementation
// =============================================================================

#include "gpack/codec/sequence_packer.h"

#include <algorithm>
#include <bit>

#include <fmt/format.h>

#include "gpack/common/logger.h"

namespace gpack::codec {

// =============================================================================
// Chunked Packing
// =============================================================================

Result<std::vector<Word>> SequencePacker::encodeChunks(std::span<const Nucleotide> bases) {
    if (auto ok = checkSymbols(bases); !ok) {
        return std::unexpected(std::move(ok.error()));
    }

    std::vector<Word> words;
    words.reserve(chunkCount(bases.size()));
    for (std::size_t start = 0; start < bases.size(); start += kMaxCodesPerWord) {
        const std::size_t len = std::min(kMaxCodesPerWord, bases.size() - start);
        words.push_back(fold(bases.subspan(start, len)));
    }

    GPACK_LOG_TRACE("Packed {} bases into {} words", bases.size(), words.size());
    return words;
}

Result<std::vector<Word>> SequencePacker::encodeChunks(std::string_view bases) {
    auto symbols = parse(bases);
    if (!symbols) {
        return std::unexpected(std::move(symbols.error()));
    }
    return encodeChunks(std::span<const Nucleotide>(*symbols));
}

Result<std::vector<Nucleotide>> SequencePacker::decodeChunks(std::span<const Word> words,
                                                             std::size_t length) {
    const std::size_t needed = chunkCount(length);
    if (words.size() < needed) {
        return makeError<std::vector<Nucleotide>>(
            ErrorCode::kCapacityExceeded,
            fmt::format("{} bases need {} words, got {}", length, needed, words.size()),
            ErrorContext{"length"}.withValue(length).withLimit(words.size() * kMaxCodesPerWord));
    }
    if (words.size() > needed) {
        return makeError<std::vector<Nucleotide>>(
            ErrorCode::kInvalidArgument,
            fmt::format("{} bases need {} words, got {} (trailing words)", length, needed,
                        words.size()),
            ErrorContext{"words"}.withValue(words.size()).withLimit(needed));
    }

    std::vector<Nucleotide> bases;
    bases.reserve(length);
    for (std::size_t k = 0; k < words.size(); ++k) {
        const std::size_t len = std::min(kMaxCodesPerWord, length - k * kMaxCodesPerWord);
        auto chunk = unfold(words[k], len);
        bases.insert(bases.end(), chunk.begin(), chunk.end());
    }
    return bases;
}

Result<std::string> SequencePacker::decodeChunksToString(std::span<const Word> words,
                                                         std::size_t length) {
    return decodeChunks(words, length).transform([](const std::vector<Nucleotide>& bases) {
        std::string text;
        text.reserve(bases.size());
        for (Nucleotide b : bases) {
            text.push_back(NucleotideAlphabet::toChar(b));
        }
        return text;
    });
}

// =============================================================================
// Comparison
// =============================================================================

Result<std::size_t> SequencePacker::mismatchCount(const PackedSequence& a,
                                                  const PackedSequence& b) {
    if (a.count() != b.count()) {
        return makeError<std::size_t>(
            ErrorCode::kInvalidArgument,
            fmt::format("cannot compare sequences of length {} and {}", a.count(), b.count()),
            ErrorContext{"length"}.withValue(b.count()).withLimit(a.count()));
    }

    // A lane differs if either of its two bits differs; fold each lane onto
    // its low bit and count.
    const Word diff = a.word() ^ b.word();
    const Word lanes = (diff | (diff >> 1)) & kLowLaneMask & usedBitsMask(a.count());
    return static_cast<std::size_t>(std::popcount(lanes));
}

}  // namespace gpack::codec
