#include <gtest/gtest.h>
#include "emodata/raw_audio_reader.h"
#include "emodata/audio_utils.h"
#include "emodata/error_handler.h"

#include <filesystem>
#include <fstream>

using namespace emodata;
using namespace emodata::io;

class RawAudioReaderTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "emodata_raw_audio_test";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    void write_wav(const std::string& name, uint16_t channels, uint32_t length) {
        AudioBuffer buffer(16000, channels, length);
        auto& data = buffer.getData();
        for (size_t i = 0; i < data.size(); ++i) {
            data[i] = (i % channels == 0) ? 0.5 : -0.5;
        }
        WavLoader loader;
        loader.saveFile(buffer, (test_dir_ / name).string());
    }

    std::string write_text(const std::string& name, const std::string& content) {
        auto path = test_dir_ / name;
        std::ofstream file(path);
        file << content;
        return path.string();
    }
};

TEST_F(RawAudioReaderTest, ReadsListedFilesAsColumnVectors) {
    write_wav("03a01Wa.wav", 1, 320);
    write_wav("08a02Nc.wav", 2, 160);
    write_text("labels.txt", "Name,Emotion\n03a01Wa,W\n08a02Nc,N\n");
    std::string list = write_text("files.txt", "03a01Wa.wav\n\n08a02Nc.wav\n");

    RawTable table = read_raw_audio(list);

    ASSERT_EQ(table.size(), 2u);
    ASSERT_TRUE(table.has_waveforms());
    std::vector<std::string> expected_names = {"03a01Wa", "08a02Nc"};
    std::vector<std::string> expected_labels = {"W", "N"};
    EXPECT_EQ(table.names, expected_names);
    EXPECT_EQ(table.label_tokens, expected_labels);
    EXPECT_FALSE(table.corpus_id.has_value());

    EXPECT_EQ(table.waveforms[0].rows(), 320);
    EXPECT_EQ(table.waveforms[0].cols(), 1);
    EXPECT_EQ(table.waveforms[1].rows(), 160);
    EXPECT_EQ(table.waveforms[1].cols(), 1);
    // Stereo channels of +0.5 and -0.5 average to silence
    EXPECT_NEAR(table.waveforms[1].cwiseAbs().maxCoeff(), 0.0, 1e-3);
    EXPECT_NEAR(table.waveforms[0](0, 0), 0.5, 1e-3);
}

TEST_F(RawAudioReaderTest, ExplicitAnnotationPath) {
    write_wav("03a01Wa.wav", 1, 16);
    std::string labels = write_text("custom.csv", "Name,Emotion\n03a01Wa,F\n");
    std::string list = write_text("files.lst", (test_dir_ / "03a01Wa.wav").string() + "\n");

    RawTable table = read_raw_audio(list, labels);
    ASSERT_EQ(table.size(), 1u);
    EXPECT_EQ(table.label_tokens[0], "F");
}

TEST_F(RawAudioReaderTest, MissingLabelThrows) {
    write_wav("03a01Wa.wav", 1, 16);
    write_text("labels.txt", "Name,Emotion\nsomething_else,W\n");
    std::string list = write_text("files.txt", "03a01Wa.wav\n");

    try {
        read_raw_audio(list);
        FAIL() << "Expected MissingLabelError";
    } catch (const MissingLabelError& e) {
        EXPECT_EQ(e.get_error_code(), ErrorCode::MISSING_LABEL);
        EXPECT_NE(std::string(e.what()).find("03a01Wa"), std::string::npos);
    }
}

TEST_F(RawAudioReaderTest, UnreadableAudioThrows) {
    write_text("labels.txt", "Name,Emotion\nbroken,W\n");
    write_text("broken.wav", "not audio");
    std::string list = write_text("files.txt", "broken.wav\n");
    EXPECT_THROW(read_raw_audio(list), SourceReadError);

    EXPECT_THROW(read_file_list((test_dir_ / "nothing.txt").string()), SourceReadError);
}

TEST_F(RawAudioReaderTest, DefaultAnnotationPathIsBesideList) {
    std::filesystem::path expected = std::filesystem::path("data") / "audio" / "labels.txt";
    EXPECT_EQ(default_raw_annotation_path("data/audio/files.txt"), expected.string());
}
