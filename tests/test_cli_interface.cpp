#include <gtest/gtest.h>
#include "emodata/cli_interface.h"
#include "emodata/error_handler.h"
#include "emodata/logger.h"
#include "emodata/packed_table.h"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace emodata;
using namespace emodata::cli;

namespace {
    const char* UTTERANCE_ARFF =
        "@relation emodb\n"
        "@attribute name string\n"
        "@attribute f1 numeric\n"
        "@attribute emotion {W,L,E,A,F,T,N}\n"
        "@data\n"
        "'03a01Wa',1.0,W\n"
        "'03a02Fc',3.0,F\n"
        "'08a01Tb',10.0,T\n";
}

class CliInterfaceTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;
    std::ostringstream out_;

    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "emodata_cli_test";
        std::filesystem::create_directories(test_dir_);
        ErrorHandler::instance().clear_error_history();
        ErrorHandler::instance().set_log_errors(false);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
        ErrorHandler::instance().clear_error_history();
        ErrorHandler::instance().set_log_errors(true);
        Logger::instance().set_level(LogLevel::INFO);
    }

    std::string write_file(const std::string& name, const std::string& content) {
        auto path = test_dir_ / name;
        std::ofstream file(path);
        file << content;
        return path.string();
    }

    CliResult run(const std::vector<std::string>& args) {
        CliInterface cli(out_);
        return cli.run(args);
    }
};

TEST_F(CliInterfaceTest, ParseInfoArguments) {
    CliInterface cli(out_);
    CliArguments args = cli.parse_arguments({
        "info", "data.arff", "--corpus", "emodb", "--normalize", "none",
        "--binarize", "--pad", "16", "-q"
    });

    EXPECT_EQ(args.command, CliCommand::INFO);
    EXPECT_EQ(args.input_path, "data.arff");
    ASSERT_TRUE(args.corpus.has_value());
    EXPECT_EQ(*args.corpus, "emodb");
    EXPECT_EQ(*args.normalization, "none");
    EXPECT_TRUE(args.binarize);
    ASSERT_TRUE(args.pad_multiple.has_value());
    EXPECT_EQ(*args.pad_multiple, 16);
    EXPECT_TRUE(args.quiet);
    EXPECT_FALSE(args.granularity.has_value());
    EXPECT_TRUE(args.parse_error.empty());
}

TEST_F(CliInterfaceTest, ParseErrors) {
    CliInterface cli(out_);
    EXPECT_FALSE(cli.parse_arguments({"info", "--corpus"}).parse_error.empty());
    EXPECT_FALSE(cli.parse_arguments({"info", "--pad", "many"}).parse_error.empty());
    EXPECT_FALSE(cli.parse_arguments({"info", "--bogus"}).parse_error.empty());
    EXPECT_FALSE(cli.parse_arguments({"info", "a.arff", "b.arff"}).parse_error.empty());

    CliArguments batch = cli.parse_arguments({"batch", "a.json", "b.json"});
    EXPECT_EQ(batch.command, CliCommand::BATCH);
    EXPECT_EQ(batch.batch_inputs.size(), 2u);

    EXPECT_EQ(cli.parse_arguments({}).command, CliCommand::HELP);
}

TEST_F(CliInterfaceTest, InvalidArgumentsExitWithParameterCode) {
    CliResult result = run({"info"});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, static_cast<int>(ErrorCode::INVALID_PARAMETERS));

    result = run({"info", "x.arff", "-v", "-q"});
    EXPECT_EQ(result.exit_code, static_cast<int>(ErrorCode::INVALID_PARAMETERS));
}

TEST_F(CliInterfaceTest, HelpVersionAndCorpora) {
    CliResult result = run({"help"});
    EXPECT_TRUE(result.success);
    EXPECT_NE(out_.str().find("USAGE:"), std::string::npos);

    out_.str("");
    result = run({"version"});
    EXPECT_TRUE(result.success);
    EXPECT_NE(out_.str().find("emodata v"), std::string::npos);
    EXPECT_NE(out_.str().find("zlib"), std::string::npos);

    out_.str("");
    result = run({"corpora"});
    EXPECT_TRUE(result.success);
    EXPECT_NE(out_.str().find("emodb"), std::string::npos);
    EXPECT_NE(out_.str().find("iemocap"), std::string::npos);
    // Output stream is not a terminal
    EXPECT_EQ(out_.str().find("\033["), std::string::npos);
}

TEST_F(CliInterfaceTest, InfoPrintsDatasetSummary) {
    std::string source = write_file("emodb.arff", UTTERANCE_ARFF);
    CliResult result = run({"info", source, "--binarize", "-q"});

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.exit_code, 0);
    const std::string text = out_.str();
    EXPECT_NE(text.find("Corpus: emodb"), std::string::npos);
    EXPECT_NE(text.find("Instances: 3"), std::string::npos);
    EXPECT_NE(text.find("anger: 1"), std::string::npos);
    EXPECT_NE(text.find("arousal"), std::string::npos);
}

TEST_F(CliInterfaceTest, InfoReportsDatasetErrorCodes) {
    std::string source = write_file("emodb.arff", UTTERANCE_ARFF);
    CliResult result = run({"info", source, "--corpus", "nowhere", "-q"});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, static_cast<int>(ErrorCode::CONFIGURATION_ERROR));

    result = run({"info", (test_dir_ / "missing.arff").string(), "-q"});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, static_cast<int>(ErrorCode::SOURCE_READ_ERROR));
    EXPECT_GE(ErrorHandler::instance().get_error_count(), 2u);
}

TEST_F(CliInterfaceTest, ConfigFileWithOverrides) {
    std::string source = write_file("emodb.arff", UTTERANCE_ARFF);
    std::string config = write_file("config.json",
        "{\"source_path\": \"" + source + "\", \"normalization\": \"all\"}");

    CliInterface cli(out_);
    CliArguments args = cli.parse_arguments({"info", "-c", config, "--normalize", "none"});
    config::PipelineConfig pipeline = cli.create_config_from_args(args);
    EXPECT_EQ(pipeline.source_path, source);
    EXPECT_EQ(pipeline.normalization, "none");

    args = cli.parse_arguments({"info", "-c", (test_dir_ / "absent.json").string()});
    EXPECT_THROW(cli.create_config_from_args(args), ConfigurationError);
}

TEST_F(CliInterfaceTest, BatchSkipsFailedConfigurations) {
    std::string source = write_file("emodb.arff", UTTERANCE_ARFF);
    std::string good = write_file("good.json",
        "{\"config_name\": \"good\", \"source_path\": \"" + source + "\", \"logging\": {\"level\": \"fatal\"}}");
    std::string bad = write_file("bad.json",
        "{\"config_name\": \"bad\", \"source_path\": \"" + source + "\", \"corpus\": \"iemocap\","
        " \"logging\": {\"level\": \"fatal\"}}");

    CliResult result = run({"batch", good, bad, good, "--no-color"});

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.configs_processed, 3u);
    EXPECT_EQ(result.configs_succeeded, 2u);
    EXPECT_EQ(result.configs_failed, 1u);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].find("bad.json"), std::string::npos);
    // emodb label tokens are unknown to iemocap
    EXPECT_EQ(result.exit_code, static_cast<int>(ErrorCode::UNKNOWN_LABEL));
    EXPECT_NE(out_.str().find("[failed]"), std::string::npos);
}

TEST_F(CliInterfaceTest, PackWritesBinaryTable) {
    std::string source = write_file("emodb.arff", UTTERANCE_ARFF);
    CliResult result = run({"pack", source, "-q"});

    ASSERT_TRUE(result.success) << result.message;
    std::string expected_output = (test_dir_ / "emodb.bin").string();
    EXPECT_EQ(cli_utils::default_pack_output(source), expected_output);
    ASSERT_TRUE(std::filesystem::exists(expected_output));

    RawTable table = io::read_tabular(expected_output);
    EXPECT_EQ(table.size(), 3u);

    std::string custom = (test_dir_ / "custom.bin").string();
    result = run({"pack", source, "-o", custom, "-q"});
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(std::filesystem::exists(custom));

    result = run({"pack", (test_dir_ / "absent.arff").string(), "-q"});
    EXPECT_EQ(result.exit_code, static_cast<int>(ErrorCode::SOURCE_READ_ERROR));
}
