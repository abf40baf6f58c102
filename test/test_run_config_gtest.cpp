#include <gtest/gtest.h>
#include "duplex_error.h"
#include "run_config.h"

#include <string>
#include <vector>

// Builds a mutable argv from string literals
class ArgvBuilder {
public:
    ArgvBuilder(std::initializer_list<const char*> args) {
        storage_.push_back("prog");
        for (const char* a : args) storage_.push_back(a);
        for (auto& s : storage_) argv_.push_back(&s[0]);
    }
    int argc() const { return static_cast<int>(argv_.size()); }
    char** argv() { return argv_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> argv_;
};

static DuplexErrorKind kind_of_parse(std::initializer_list<const char*> args) {
    ArgvBuilder a(args);
    RunConfig config;
    std::vector<std::string> rest;
    try {
        parse_config_args(a.argc(), a.argv(), 1, config, rest);
        config.validate();
    } catch (const DuplexError& e) {
        return e.getKind();
    }
    ADD_FAILURE() << "expected DuplexError";
    return DuplexErrorKind::INVALID_STATE;
}

TEST(RunConfigTest, DefaultsAreValid) {
    RunConfig config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_TRUE(config.removeFirstLast);
    EXPECT_TRUE(config.addWatermarks);
    EXPECT_EQ(config.rotationAngle, 180);
    EXPECT_EQ(config.batchSize, 20);
    EXPECT_EQ(config.numberFontSize, 12);
    EXPECT_EQ(config.titleFontSize, 36);
    EXPECT_EQ(config.duplexScope, DuplexScope::GLOBAL);
    EXPECT_FALSE(config.overwrite);
    EXPECT_EQ(config.jobs, 1);
}

TEST(RunConfigTest, RejectsUnsupportedRotation) {
    RunConfig config;
    config.rotationAngle = 45;
    try {
        config.validate();
        FAIL() << "expected DuplexError";
    } catch (const DuplexError& e) {
        EXPECT_EQ(e.getKind(), DuplexErrorKind::INVALID_CONFIGURATION);
        EXPECT_EQ(e.getStage(), "config");
    }

    config.rotationAngle = 90;
    EXPECT_NO_THROW(config.validate());
    config.rotationAngle = 270;
    EXPECT_NO_THROW(config.validate());
}

TEST(RunConfigTest, RejectsNonPositiveBatchSize) {
    RunConfig config;
    config.batchSize = 0;
    EXPECT_THROW(config.validate(), DuplexError);
    config.batchSize = -4;
    EXPECT_THROW(config.validate(), DuplexError);
}

TEST(RunConfigTest, OddBatchSizeOnlyValidForGlobalScope) {
    RunConfig config;
    config.batchSize = 5;
    EXPECT_NO_THROW(config.validate());

    config.duplexScope = DuplexScope::PER_BATCH;
    EXPECT_THROW(config.validate(), DuplexError);

    config.batchSize = 6;
    EXPECT_NO_THROW(config.validate());
}

TEST(RunConfigTest, ResolveLayout) {
    RunConfig config;
    EXPECT_EQ(config.resolveLayout(1), OutputLayout::SEPARATE);
    EXPECT_EQ(config.resolveLayout(3), OutputLayout::BATCHED);

    config.layout = OutputLayout::SEPARATE;
    EXPECT_EQ(config.resolveLayout(3), OutputLayout::SEPARATE);
}

TEST(RunConfigTest, NormalizeOption) {
    EXPECT_EQ(normalize_option("--BatchSize"), "batchsize");
    EXPECT_EQ(normalize_option("-batch-size"), "batchsize");
    EXPECT_EQ(normalize_option("--duplex_scope"), "duplexscope");

    // Bytes outside ASCII pass through unchanged
    EXPECT_EQ(normalize_option("--Gr\xC3\xB6\xC3\x9F" "e"), "gr\xC3\xB6\xC3\x9F" "e");
    EXPECT_THROW(RunConfig::parse_bool("--x", "\xC3\xA9"), DuplexError);
}

TEST(RunConfigTest, ParseBool) {
    EXPECT_TRUE(RunConfig::parse_bool("--x", "Yes"));
    EXPECT_TRUE(RunConfig::parse_bool("--x", "1"));
    EXPECT_FALSE(RunConfig::parse_bool("--x", "off"));
    EXPECT_FALSE(RunConfig::parse_bool("--x", "FALSE"));
    EXPECT_THROW(RunConfig::parse_bool("--x", "maybe"), DuplexError);
}

TEST(RunConfigTest, ParseIntIsStrict) {
    EXPECT_EQ(RunConfig::parse_int("--n", "12"), 12);
    EXPECT_EQ(RunConfig::parse_int("--n", "-3"), -3);
    EXPECT_THROW(RunConfig::parse_int("--n", "12x"), DuplexError);
    EXPECT_THROW(RunConfig::parse_int("--n", ""), DuplexError);
    EXPECT_THROW(RunConfig::parse_int("--n", "abc"), DuplexError);
}

TEST(RunConfigTest, ParseScopeAndLayout) {
    EXPECT_EQ(RunConfig::parse_scope("global"), DuplexScope::GLOBAL);
    EXPECT_EQ(RunConfig::parse_scope("per_batch"), DuplexScope::PER_BATCH);
    EXPECT_EQ(RunConfig::parse_scope("Per-Batch"), DuplexScope::PER_BATCH);
    EXPECT_THROW(RunConfig::parse_scope("sometimes"), DuplexError);

    EXPECT_EQ(RunConfig::parse_layout("batched"), OutputLayout::BATCHED);
    EXPECT_EQ(RunConfig::parse_layout("Separate"), OutputLayout::SEPARATE);
    EXPECT_THROW(RunConfig::parse_layout("stacked"), DuplexError);
}

TEST(RunConfigTest, ParseArgsAppliesOptions) {
    ArgvBuilder a({"input.pdf", "--BatchSize", "10", "-rotation-angle", "90",
                   "--NoWatermarks", "--duplex_scope", "per_batch", "--Jobs", "4",
                   "--OutputDir", "out", "--Overwrite", "--NoTrim"});
    RunConfig config;
    std::vector<std::string> rest;
    parse_config_args(a.argc(), a.argv(), 1, config, rest);

    EXPECT_EQ(config.batchSize, 10);
    EXPECT_EQ(config.rotationAngle, 90);
    EXPECT_FALSE(config.addWatermarks);
    EXPECT_FALSE(config.removeFirstLast);
    EXPECT_TRUE(config.overwrite);
    EXPECT_EQ(config.duplexScope, DuplexScope::PER_BATCH);
    EXPECT_EQ(config.jobs, 4);

    // Unknown arguments are passed through in order
    ASSERT_EQ(rest.size(), 3u);
    EXPECT_EQ(rest[0], "input.pdf");
    EXPECT_EQ(rest[1], "--OutputDir");
    EXPECT_EQ(rest[2], "out");
}

TEST(RunConfigTest, ParseArgsErrors) {
    EXPECT_EQ(kind_of_parse({"--BatchSize"}), DuplexErrorKind::INVALID_CONFIGURATION);
    EXPECT_EQ(kind_of_parse({"--BatchSize", "ten"}), DuplexErrorKind::INVALID_CONFIGURATION);
    EXPECT_EQ(kind_of_parse({"--RotationAngle", "45"}), DuplexErrorKind::INVALID_CONFIGURATION);
    EXPECT_EQ(kind_of_parse({"--AddWatermarks", "perhaps"}),
              DuplexErrorKind::INVALID_CONFIGURATION);
    EXPECT_EQ(kind_of_parse({"--DuplexScope", "per_batch", "--BatchSize", "7"}),
              DuplexErrorKind::INVALID_CONFIGURATION);
}

TEST(DuplexErrorTest, DescribeAndExitCodes) {
    DuplexError e(DuplexErrorKind::INSUFFICIENT_PAGES, "trim", "only 2 pages", "a.pdf");
    EXPECT_EQ(e.describe(), "[trim] a.pdf: only 2 pages");
    EXPECT_STREQ(error_kind_name(e.getKind()), "InsufficientPages");

    EXPECT_EQ(exit_code_for(DuplexErrorKind::INSUFFICIENT_PAGES), EC_INSUFFICIENT_PAGES);
    EXPECT_EQ(exit_code_for(DuplexErrorKind::INVALID_CONFIGURATION), EC_INVALID_CONFIGURATION);
    EXPECT_EQ(exit_code_for(DuplexErrorKind::EMPTY_INPUT), EC_EMPTY_INPUT);
    EXPECT_EQ(exit_code_for(DuplexErrorKind::IO_FAILURE), EC_WRITE_ERROR);
    EXPECT_EQ(exit_code_for(DuplexErrorKind::INVALID_STATE), EC_INVALID_STATE);

    DuplexError no_doc(DuplexErrorKind::EMPTY_INPUT, "merge", "nothing");
    EXPECT_EQ(no_doc.describe(), "[merge] nothing");
}
