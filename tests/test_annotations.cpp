#include <gtest/gtest.h>
#include "emodata/annotations.h"
#include "emodata/error_handler.h"

#include <filesystem>
#include <fstream>

using namespace emodata;
using namespace emodata::io;

class AnnotationsTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "emodata_annotations_test";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    std::string write_file(const std::string& name, const std::string& content) {
        auto path = test_dir_ / name;
        std::ofstream file(path);
        file << content;
        return path.string();
    }
};

TEST_F(AnnotationsTest, ClassificationLabels) {
    std::string path = write_file("labels.csv",
        "Name,Emotion\r\n"
        "Ses01F_impro01_F000,neu\r\n"
        "\r\n"
        "\"Ses01M_script01_M002\",ang\r\n");

    ClassificationAnnotations labels = parse_classification_annotations(path);
    ASSERT_EQ(labels.size(), 2u);
    EXPECT_EQ(labels.at("Ses01F_impro01_F000"), "neu");
    EXPECT_EQ(labels.at("Ses01M_script01_M002"), "ang");
}

TEST_F(AnnotationsTest, RegressionValuesKeyedByHeader) {
    std::string path = write_file("dimensions.csv",
        "Name,Arousal,Valence\n"
        "a1,0.5,-0.25\n"
        "a2,1,2\n");

    RegressionAnnotations values = parse_regression_annotations(path);
    ASSERT_EQ(values.size(), 2u);
    EXPECT_DOUBLE_EQ(values.at("a1").at("Arousal"), 0.5);
    EXPECT_DOUBLE_EQ(values.at("a1").at("Valence"), -0.25);
    EXPECT_DOUBLE_EQ(values.at("a2").at("Valence"), 2.0);
}

TEST_F(AnnotationsTest, MalformedFilesRejected) {
    EXPECT_THROW(parse_classification_annotations((test_dir_ / "none.csv").string()), SourceReadError);

    std::string empty = write_file("empty.csv", "");
    EXPECT_THROW(parse_classification_annotations(empty), SourceReadError);

    std::string short_row = write_file("short.csv", "Name,Emotion\nonly_name\n");
    EXPECT_THROW(parse_classification_annotations(short_row), SourceReadError);

    std::string bad_number = write_file("bad.csv", "Name,Arousal\na1,high\n");
    EXPECT_THROW(parse_regression_annotations(bad_number), SourceReadError);
}

TEST(CsvUtilsTest, SplitRecordHandlesQuotes) {
    auto fields = csv_utils::split_record("a, \"b,c\" ,\"say \"\"hi\"\"\",");
    ASSERT_EQ(fields.size(), 4u);
    EXPECT_EQ(fields[0], "a");
    EXPECT_EQ(fields[1], "b,c");
    EXPECT_EQ(fields[2], "say \"hi\"");
    EXPECT_EQ(fields[3], "");
}
