// =============================================================================
// gpack - Two-Bit Code Packer Implementation
// =============================================================================

#include "gpack/codec/code_packer.h"

#include <numeric>

#include <fmt/format.h>

#include "gpack/common/logger.h"

namespace gpack::codec {

// =============================================================================
// PackedCodes Implementation
// =============================================================================

template <PackingAlphabet A>
Result<PackedCodes<A>> PackedCodes<A>::fromWord(Word word, std::size_t count) {
    if (count > kMaxCodesPerWord) {
        return makeError<PackedCodes>(
            ErrorCode::kCapacityExceeded,
            fmt::format("{} codes do not fit in a {}-bit word", count, kWordBits),
            ErrorContext{"count"}.withValue(count).withLimit(kMaxCodesPerWord));
    }
    return PackedCodes{word & usedBitsMask(count), count};
}

// =============================================================================
// Validation
// =============================================================================

template <PackingAlphabet A>
VoidResult CodePacker<A>::checkCapacity(std::size_t count, std::size_t capacityBits) {
    if (capacityBits > kWordBits) {
        return std::unexpected(Error{
            ErrorCode::kInvalidArgument,
            fmt::format("capacity of {} bits exceeds the {}-bit word", capacityBits, kWordBits),
            ErrorContext{"capacity_bits"}.withValue(capacityBits).withLimit(kWordBits)});
    }

    // Compare counts rather than count * 2 so huge inputs cannot wrap.
    const std::size_t maxCodes = capacityBits / kBitsPerCode;
    if (count > maxCodes) {
        GPACK_LOG_DEBUG("Rejected {} run of {} codes: capacity is {} bits", A::kName, count,
                        capacityBits);
        return std::unexpected(Error{
            ErrorCode::kCapacityExceeded,
            fmt::format("{} {} codes need {} bits, capacity is {}", count, A::kName,
                        count * kBitsPerCode, capacityBits),
            ErrorContext{"count"}.withValue(count).withLimit(maxCodes)});
    }
    return makeVoidSuccess();
}

template <PackingAlphabet A>
VoidResult CodePacker<A>::checkSymbols(std::span<const Symbol> symbols, std::size_t offset) {
    for (std::size_t i = 0; i < symbols.size(); ++i) {
        if (!A::isValid(symbols[i])) {
            const auto raw = static_cast<std::uint8_t>(symbols[i]);
            return std::unexpected(Error{
                ErrorCode::kInvalidSymbol,
                fmt::format("value {} is not a {} symbol", raw, A::kName),
                ErrorContext{"symbol"}.withValue(raw).withLimit(kCodeMask).withIndex(offset + i)});
        }
    }
    return makeVoidSuccess();
}

template <PackingAlphabet A>
Result<std::vector<typename CodePacker<A>::Symbol>> CodePacker<A>::parse(std::string_view text) {
    std::vector<Symbol> symbols;
    symbols.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        auto symbol = A::fromChar(text[i]);
        if (!symbol) {
            Error error = std::move(symbol.error());
            ErrorContext ctx = error.context().value_or(ErrorContext{"symbol"});
            ctx.withIndex(i);
            GPACK_LOG_DEBUG("Rejected {} text at offset {}", A::kName, i);
            return makeError<std::vector<Symbol>>(error.code(),
                                                  fmt::format("{} at offset {}", error.message(), i),
                                                  std::move(ctx));
        }
        symbols.push_back(*symbol);
    }
    return symbols;
}

// =============================================================================
// Fold / Unfold
// =============================================================================

template <PackingAlphabet A>
Word CodePacker<A>::fold(std::span<const Symbol> symbols) noexcept {
    return std::accumulate(symbols.begin(), symbols.end(), Word{0}, [](Word acc, Symbol s) {
        return (acc << kBitsPerCode) | static_cast<Word>(A::encode(s));
    });
}

template <PackingAlphabet A>
std::vector<typename CodePacker<A>::Symbol> CodePacker<A>::unfold(Word word, std::size_t length) {
    // Extraction runs last-to-first, so fill from the back.
    std::vector<Symbol> symbols(length);
    for (std::size_t i = length; i > 0; --i) {
        symbols[i - 1] = A::decode(static_cast<Code>(word & kCodeMask));
        word >>= kBitsPerCode;
    }
    return symbols;
}

// =============================================================================
// Bare Words
// =============================================================================

template <PackingAlphabet A>
Result<Word> CodePacker<A>::encode(std::span<const Symbol> symbols, std::size_t capacityBits) {
    if (auto ok = checkCapacity(symbols.size(), capacityBits); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    if (auto ok = checkSymbols(symbols); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    return fold(symbols);
}

template <PackingAlphabet A>
Result<Word> CodePacker<A>::encode(std::string_view text, std::size_t capacityBits) {
    if (auto ok = checkCapacity(text.size(), capacityBits); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    auto symbols = parse(text);
    if (!symbols) {
        return std::unexpected(std::move(symbols.error()));
    }
    return fold(*symbols);
}

template <PackingAlphabet A>
Result<std::vector<typename CodePacker<A>::Symbol>> CodePacker<A>::decode(
    Word word, std::size_t length, std::size_t capacityBits) {
    if (auto ok = checkCapacity(length, capacityBits); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    return unfold(word, length);
}

template <PackingAlphabet A>
Result<std::string> CodePacker<A>::decodeToString(Word word, std::size_t length,
                                                  std::size_t capacityBits) {
    auto symbols = decode(word, length, capacityBits);
    if (!symbols) {
        return std::unexpected(std::move(symbols.error()));
    }

    std::string text;
    text.reserve(symbols->size());
    for (Symbol s : *symbols) {
        text.push_back(A::toChar(s));
    }
    return text;
}

// =============================================================================
// Tagged Words
// =============================================================================

template <PackingAlphabet A>
Result<PackedCodes<A>> CodePacker<A>::pack(std::span<const Symbol> symbols,
                                           std::size_t capacityBits) {
    return encode(symbols, capacityBits).transform([&symbols](Word word) {
        return Packed{word, symbols.size()};
    });
}

template <PackingAlphabet A>
Result<PackedCodes<A>> CodePacker<A>::pack(std::string_view text, std::size_t capacityBits) {
    return encode(text, capacityBits).transform([&text](Word word) {
        return Packed{word, text.size()};
    });
}

template <PackingAlphabet A>
std::vector<typename CodePacker<A>::Symbol> CodePacker<A>::unpack(const Packed& packed) {
    return unfold(packed.word(), packed.count());
}

template <PackingAlphabet A>
std::string CodePacker<A>::unpackToString(const Packed& packed) {
    std::string text;
    text.reserve(packed.count());
    for (std::size_t i = 0; i < packed.count(); ++i) {
        text.push_back(A::toChar(packed.at(i)));
    }
    return text;
}

// =============================================================================
// Explicit Instantiations
// =============================================================================

template class PackedCodes<NucleotideAlphabet>;
template class PackedCodes<GenotypeAlphabet>;
template class CodePacker<NucleotideAlphabet>;
template class CodePacker<GenotypeAlphabet>;

}  // namespace gpack::codec
