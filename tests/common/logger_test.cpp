// =============================================================================
// gpack - Logger Tests
// =============================================================================
// Unit tests for logger configuration, level names and the debug records
// written by the packers once a file sink is attached.
// =============================================================================

#include "gpack/common/logger.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "gpack/codec/sequence_packer.h"
#include "gpack/codec/variant_packer.h"

namespace gpack::log {
namespace {

std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

// =============================================================================
// Config Tests
// =============================================================================

TEST(LoggerConfigTest, DefaultsAreValid) {
    Config config;
    EXPECT_EQ(config.level, Level::kInfo);
    EXPECT_EQ(config.loggerName, "gpack");
    EXPECT_TRUE(config.validate().has_value());
}

TEST(LoggerConfigTest, RejectsConfigWithoutSink) {
    Config config;
    config.enableConsole = false;

    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kUsageError);

    auto started = init(config);
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code(), ErrorCode::kUsageError);
    EXPECT_FALSE(isInitialized());
}

TEST(LoggerConfigTest, RejectsEmptyName) {
    Config config;
    config.loggerName.clear();
    EXPECT_EQ(config.validate().error().code(), ErrorCode::kUsageError);
}

// =============================================================================
// Level Tests
// =============================================================================

TEST(LogLevelTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(*parseLevel("DEBUG"), Level::kDebug);
    EXPECT_EQ(*parseLevel("Warning"), Level::kWarning);
    EXPECT_EQ(*parseLevel("critical"), Level::kCritical);
}

TEST(LogLevelTest, ParseRejectsUnknownName) {
    auto level = parseLevel("verbose");
    ASSERT_FALSE(level.has_value());
    EXPECT_EQ(level.error().code(), ErrorCode::kUsageError);
}

TEST(LogLevelTest, NamesRoundTrip) {
    for (auto level : {Level::kTrace, Level::kDebug, Level::kInfo, Level::kWarning,
                       Level::kError, Level::kCritical}) {
        auto parsed = parseLevel(levelName(level));
        ASSERT_TRUE(parsed.has_value()) << levelName(level);
        EXPECT_EQ(*parsed, level);
    }
    EXPECT_EQ(toQuillLevel(Level::kDebug), quill::LogLevel::Debug);
}

// =============================================================================
// Lifecycle Tests
// =============================================================================

// The Quill backend runs once per process, so the whole lifecycle lives in
// one test.
TEST(LoggerLifecycleTest, PackersWriteDebugRecordsToFile) {
    const auto path = std::filesystem::temp_directory_path() / "gpack_logger_test.log";
    std::filesystem::remove(path);

    Config config;
    config.logFile = path.string();
    config.level = Level::kDebug;
    config.enableConsole = false;

    ASSERT_TRUE(init(config).has_value());
    ASSERT_TRUE(isInitialized());
    EXPECT_TRUE(init(config).has_value());

    Config other = config;
    other.loggerName = "other";
    auto clash = init(other);
    ASSERT_FALSE(clash.has_value());
    EXPECT_EQ(clash.error().code(), ErrorCode::kUsageError);

    auto rejected = codec::VariantRecordPacker::encode(4096, 1, codec::Nucleotide::kA,
                                                       codec::Nucleotide::kT, 0);
    ASSERT_FALSE(rejected.has_value());

    const std::vector<codec::VariantRecord> records(3);
    ASSERT_TRUE(codec::VariantRecordPacker::encodeBatch(records).has_value());

    auto tooLong = codec::SequencePacker::encode(std::string(40, 'A'));
    ASSERT_FALSE(tooLong.has_value());

    // Trace is below the configured level.
    ASSERT_TRUE(codec::SequencePacker::encodeChunks("ACGT").has_value());

    flush();
    const std::string text = readFile(path);
    EXPECT_NE(text.find("Rejected variant: chrom = 4096 exceeds 4095"), std::string::npos);
    EXPECT_NE(text.find("Packing 3 variant records (serial)"), std::string::npos);
    EXPECT_NE(text.find("Rejected nucleotide run of 40 codes"), std::string::npos);
    EXPECT_EQ(text.find("Packed 4 bases"), std::string::npos);

    shutdown();
    EXPECT_FALSE(isInitialized());
    EXPECT_EQ(logger(), nullptr);

    auto restart = init(config);
    ASSERT_FALSE(restart.has_value());
    EXPECT_EQ(restart.error().code(), ErrorCode::kUsageError);

    std::filesystem::remove(path);
}

}  // namespace
}  // namespace gpack::log
