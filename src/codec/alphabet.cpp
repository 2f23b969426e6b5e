// =============================================================================
// gpack - Alphabet Codec Implementation
// =============================================================================

#include "gpack/codec/alphabet.h"

#include <cctype>
#include <string>

#include <fmt/format.h>

namespace gpack::codec {

namespace {

/// @brief Render a character for an error message, escaping non-printables.
std::string describeChar(char c) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isprint(uc) != 0) {
        return fmt::format("'{}'", c);
    }
    return fmt::format("0x{:02x}", static_cast<unsigned>(uc));
}

template <typename Symbol>
Result<Symbol> unrecognizedChar(const char* alphabet, char c) {
    return makeError<Symbol>(
        ErrorCode::kInvalidSymbol,
        fmt::format("unrecognized {} character {}", alphabet, describeChar(c)),
        ErrorContext{"symbol"}.withValue(static_cast<unsigned char>(c)));
}

}  // namespace

// =============================================================================
// Character Parsing
// =============================================================================

Result<Nucleotide> NucleotideAlphabet::fromChar(char c) {
    switch (c) {
        case 'A':
        case 'a':
            return Nucleotide::kA;
        case 'T':
        case 't':
            return Nucleotide::kT;
        case 'G':
        case 'g':
            return Nucleotide::kG;
        case 'C':
        case 'c':
            return Nucleotide::kC;
        default:
            return unrecognizedChar<Nucleotide>(kName, c);
    }
}

Result<GenotypeCall> GenotypeAlphabet::fromChar(char c) {
    switch (c) {
        case '0':
            return GenotypeCall::kHomRef;
        case '1':
            return GenotypeCall::kHet;
        case '2':
            return GenotypeCall::kHomAlt;
        case '.':
            return GenotypeCall::kIncomplete;
        default:
            return unrecognizedChar<GenotypeCall>(kName, c);
    }
}

// =============================================================================
// AlphabetCodec Implementation
// =============================================================================

template <PackingAlphabet A>
Result<typename AlphabetCodec<A>::Symbol> AlphabetCodec<A>::fromCode(std::uint8_t value) {
    if (value > kCodeMask) {
        return makeError<Symbol>(
            ErrorCode::kInvalidSymbol,
            fmt::format("{} code {} does not fit in {} bits", A::kName, value, kBitsPerCode),
            ErrorContext{"code"}.withValue(value).withLimit(kCodeMask));
    }
    return A::decode(value);
}

template class AlphabetCodec<NucleotideAlphabet>;
template class AlphabetCodec<GenotypeAlphabet>;

// =============================================================================
// Display Names
// =============================================================================

std::string_view toString(Nucleotide base) noexcept {
    switch (base) {
        case Nucleotide::kA:
            return "A";
        case Nucleotide::kT:
            return "T";
        case Nucleotide::kG:
            return "G";
        case Nucleotide::kC:
            return "C";
    }
    return "?";
}

std::string_view toString(GenotypeCall call) noexcept {
    switch (call) {
        case GenotypeCall::kHomRef:
            return "hom_ref";
        case GenotypeCall::kHet:
            return "het";
        case GenotypeCall::kHomAlt:
            return "hom_alt";
        case GenotypeCall::kIncomplete:
            return "incomplete";
    }
    return "unknown";
}

}  // namespace gpack::codec
