// =============================================================================
// gpack - Variant Record Packer Implementation
// =============================================================================

#include "gpack/codec/variant_packer.h"

#include <string>
#include <string_view>

#include <fmt/format.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include "gpack/common/logger.h"

namespace gpack::codec {

namespace {

VoidResult checkField(std::string_view field, std::uint64_t value, std::uint64_t max) {
    if (value > max) {
        GPACK_LOG_DEBUG("Rejected variant: {} = {} exceeds {}", std::string(field), value, max);
        return std::unexpected(Error{
            ErrorCode::kFieldOverflow,
            FieldOverflowError::formatFieldOverflow(field, value, max),
            ErrorContext{std::string(field)}.withValue(value).withLimit(max)});
    }
    return makeVoidSuccess();
}

VoidResult checkBase(std::string_view field, Nucleotide base) {
    if (!NucleotideAlphabet::isValid(base)) {
        const auto raw = static_cast<std::uint8_t>(base);
        return std::unexpected(Error{
            ErrorCode::kInvalidSymbol,
            fmt::format("{} value {} is not a nucleotide", field, raw),
            ErrorContext{std::string(field)}.withValue(raw).withLimit(kCodeMask)});
    }
    return makeVoidSuccess();
}

/// @brief Whether a batch of n items should run on TBB.
bool runParallel(std::size_t n, const PackerOptions& options) noexcept {
    return options.parallelThreshold != 0 && n >= options.parallelThreshold;
}

}  // namespace

// =============================================================================
// Validation
// =============================================================================

VoidResult VariantRecordPacker::validate(std::uint64_t chrom, std::uint64_t position,
                                         Nucleotide ref, Nucleotide alt, std::uint64_t flags) {
    if (auto ok = checkField("chrom", chrom, kChromMax); !ok) {
        return ok;
    }
    if (auto ok = checkField("position", position, kPositionMax); !ok) {
        return ok;
    }
    if (auto ok = checkBase("ref", ref); !ok) {
        return ok;
    }
    if (auto ok = checkBase("alt", alt); !ok) {
        return ok;
    }
    return checkField("flags", flags, kFlagsMax);
}

VoidResult VariantRecordPacker::validate(const VariantRecord& record) {
    return validate(record.chrom, record.position, record.ref, record.alt, record.flags);
}

// =============================================================================
// Single Record
// =============================================================================

Word VariantRecordPacker::pack(const VariantRecord& record) noexcept {
    return (static_cast<Word>(record.chrom) << kChromShift) |
           (static_cast<Word>(record.position) << kPositionShift) |
           (static_cast<Word>(NucleotideAlphabet::encode(record.ref)) << kRefShift) |
           (static_cast<Word>(NucleotideAlphabet::encode(record.alt)) << kAltShift) |
           (static_cast<Word>(record.flags) << kFlagsShift);
}

Result<Word> VariantRecordPacker::encode(std::uint64_t chrom, std::uint64_t position,
                                         Nucleotide ref, Nucleotide alt, std::uint64_t flags) {
    if (auto ok = validate(chrom, position, ref, alt, flags); !ok) {
        return std::unexpected(std::move(ok.error()));
    }

    VariantRecord record;
    record.chrom = static_cast<std::uint32_t>(chrom);
    record.position = static_cast<std::uint32_t>(position);
    record.ref = ref;
    record.alt = alt;
    record.flags = static_cast<std::uint32_t>(flags);
    return pack(record);
}

Result<Word> VariantRecordPacker::encode(const VariantRecord& record) {
    if (auto ok = validate(record); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    return pack(record);
}

VariantRecord VariantRecordPacker::decode(Word word) noexcept {
    VariantRecord record;
    record.chrom = static_cast<std::uint32_t>((word >> kChromShift) & kChromMax);
    record.position = static_cast<std::uint32_t>((word >> kPositionShift) & kPositionMax);
    record.ref = NucleotideAlphabet::decode(static_cast<Code>((word >> kRefShift) & kCodeMask));
    record.alt = NucleotideAlphabet::decode(static_cast<Code>((word >> kAltShift) & kCodeMask));
    record.flags = static_cast<std::uint32_t>((word >> kFlagsShift) & kFlagsMax);
    return record;
}

// =============================================================================
// Batches
// =============================================================================

Result<std::vector<Word>> VariantRecordPacker::encodeBatch(std::span<const VariantRecord> records,
                                                           const PackerOptions& options) {
    if (auto ok = options.validate(); !ok) {
        return std::unexpected(std::move(ok.error()));
    }

    // Validate everything up front so a failing batch produces no output.
    for (std::size_t i = 0; i < records.size(); ++i) {
        if (auto ok = validate(records[i]); !ok) {
            Error error = std::move(ok.error());
            ErrorContext ctx = error.context().value_or(ErrorContext{});
            ctx.withIndex(i);
            return makeError<std::vector<Word>>(
                error.code(), fmt::format("record {}: {}", i, error.message()), std::move(ctx));
        }
    }

    std::vector<Word> words(records.size());
    const bool parallel = runParallel(records.size(), options);
    GPACK_LOG_DEBUG("Packing {} variant records ({})", records.size(),
                    parallel ? "parallel" : "serial");

    if (parallel) {
        tbb::parallel_for(tbb::blocked_range<std::size_t>(0, records.size(), options.grainSize),
                          [&](const tbb::blocked_range<std::size_t>& range) {
                              for (std::size_t i = range.begin(); i < range.end(); ++i) {
                                  words[i] = pack(records[i]);
                              }
                          });
    } else {
        for (std::size_t i = 0; i < records.size(); ++i) {
            words[i] = pack(records[i]);
        }
    }
    return words;
}

Result<std::vector<VariantRecord>> VariantRecordPacker::decodeBatch(std::span<const Word> words,
                                                                    const PackerOptions& options) {
    if (auto ok = options.validate(); !ok) {
        return std::unexpected(std::move(ok.error()));
    }

    std::vector<VariantRecord> records(words.size());
    const bool parallel = runParallel(words.size(), options);
    GPACK_LOG_DEBUG("Unpacking {} variant words ({})", words.size(),
                    parallel ? "parallel" : "serial");

    if (parallel) {
        tbb::parallel_for(tbb::blocked_range<std::size_t>(0, words.size(), options.grainSize),
                          [&](const tbb::blocked_range<std::size_t>& range) {
                              for (std::size_t i = range.begin(); i < range.end(); ++i) {
                                  records[i] = decode(words[i]);
                              }
                          });
    } else {
        for (std::size_t i = 0; i < words.size(); ++i) {
            records[i] = decode(words[i]);
        }
    }
    return records;
}

}  // namespace gpack::codec
