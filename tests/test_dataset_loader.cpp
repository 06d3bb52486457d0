#include <gtest/gtest.h>
#include "emodata/dataset_loader.h"
#include "emodata/audio_utils.h"
#include "emodata/error_handler.h"
#include "emodata/logger.h"
#include "emodata/packed_table.h"

#include <hdf5.h>

#include <filesystem>
#include <fstream>

using namespace emodata;

namespace {
    const char* UTTERANCE_ARFF =
        "@relation emodb\n"
        "@attribute name string\n"
        "@attribute f1 numeric\n"
        "@attribute f2 numeric\n"
        "@attribute emotion {W,L,E,A,F,T,N}\n"
        "@data\n"
        "'03a01Wa',1.0,5.0,W\n"
        "'03a02Fc',3.0,5.0,F\n"
        "'08a01Tb',10.0,1.0,T\n"
        "'08a02Nc',20.0,3.0,N\n";

    const char* FRAME_ARFF =
        "@relation emodb\n"
        "@attribute name string\n"
        "@attribute mfcc numeric\n"
        "@attribute emotion {W,L,E,A,F,T,N}\n"
        "@data\n"
        "'03a01Wa',1.0,W\n"
        "'03a01Wa',2.0,W\n"
        "'03a01Wa',3.0,W\n"
        "'08a02Nc',4.0,N\n";
}

class DatasetLoaderTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        Logger::instance().set_level(LogLevel::WARN);
        test_dir_ = std::filesystem::temp_directory_path() / "emodata_loader_test";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
        Logger::instance().set_level(LogLevel::INFO);
    }

    std::string write_file(const std::string& name, const std::string& content) {
        auto path = test_dir_ / name;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path);
        file << content;
        return path.string();
    }
};

TEST_F(DatasetLoaderTest, UtteranceDatasetWithSpeakerNormalization) {
    std::string path = write_file("emodb.arff", UTTERANCE_ARFF);
    Dataset dataset = load_utterance_dataset(path);

    EXPECT_EQ(dataset.corpus, "emodb");
    EXPECT_EQ(dataset.granularity, Granularity::UTTERANCE);
    EXPECT_EQ(dataset.n_instances(), 4u);
    EXPECT_EQ(dataset.n_features(), 2u);
    EXPECT_EQ(dataset.y, (std::vector<int>{0, 4, 5, 6}));

    // Two instances per speaker: values become -1 and +1, constant columns 0
    EXPECT_DOUBLE_EQ(dataset.features(0, 0), -1.0);
    EXPECT_DOUBLE_EQ(dataset.features(1, 0), 1.0);
    EXPECT_DOUBLE_EQ(dataset.features(0, 1), 0.0);
    EXPECT_DOUBLE_EQ(dataset.features(2, 0), -1.0);
    EXPECT_DOUBLE_EQ(dataset.features(3, 1), 1.0);
}

TEST_F(DatasetLoaderTest, CorpusOverrideAndNoNormalization) {
    std::string path = write_file("emodb.arff", UTTERANCE_ARFF);
    LoaderOptions options;
    options.normalization = NormalizationMethod::NONE;
    options.binarize = true;
    Dataset dataset = load_utterance_dataset(path, options);
    EXPECT_DOUBLE_EQ(dataset.features(2, 0), 10.0);
    EXPECT_EQ(dataset.labels.count("valence"), 1u);

    options.corpus = "not-a-corpus";
    EXPECT_THROW(load_utterance_dataset(path, options), UnknownCorpusError);
}

TEST_F(DatasetLoaderTest, FrameDatasetGroupsSequences) {
    std::string path = write_file("frames.arff", FRAME_ARFF);
    LoaderOptions options;
    options.normalization = NormalizationMethod::NONE;
    Dataset dataset = load_frame_dataset(path, options);

    EXPECT_EQ(dataset.granularity, Granularity::FRAME);
    EXPECT_EQ(dataset.names, (std::vector<std::string>{"03a01Wa", "08a02Nc"}));
    ASSERT_EQ(dataset.sequences.size(), 2u);
    EXPECT_EQ(dataset.sequences[0].rows(), 3);
    EXPECT_EQ(dataset.sequences[1].rows(), 1);
    EXPECT_DOUBLE_EQ(dataset.sequences[0](2, 0), 3.0);
    EXPECT_EQ(dataset.y, (std::vector<int>{0, 6}));
    EXPECT_EQ(dataset.gender_indices.at("m"), (std::vector<int>{0}));
    EXPECT_EQ(dataset.gender_indices.at("f"), (std::vector<int>{1}));
    EXPECT_EQ(dataset.labels.at("all").size(), 2);
}

TEST_F(DatasetLoaderTest, PackedSourceMatchesText) {
    std::string arff = write_file("emodb.arff", UTTERANCE_ARFF);
    io::ArffParser parser;
    std::vector<uint8_t> bytes = io::encode_packed_table(parser.parse_file(arff));
    std::string bin = (test_dir_ / "emodb.bin").string();
    {
        std::ofstream file(bin, std::ios::binary);
        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }

    Dataset text = load_dataset(arff, SourceFormat::AUTO, Granularity::UTTERANCE);
    Dataset packed = load_dataset(bin, SourceFormat::AUTO, Granularity::UTTERANCE);
    EXPECT_EQ(packed.names, text.names);
    EXPECT_EQ(packed.y, text.y);
    EXPECT_TRUE(packed.features.isApprox(text.features));
}

TEST_F(DatasetLoaderTest, NetcdfDataset) {
    std::filesystem::create_directories(test_dir_ / "embeddings");
    std::string path = (test_dir_ / "embeddings" / "emb.nc").string();

    hid_t file = H5Fcreate(path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
    hsize_t feature_dims[2] = {2, 2};
    double values[4] = {1.0, 2.0, 3.0, 4.0};
    hid_t space = H5Screate_simple(2, feature_dims, nullptr);
    hid_t dataset = H5Dcreate2(file, "features", H5T_IEEE_F64LE, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    H5Dwrite(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, values);
    H5Dclose(dataset);
    H5Sclose(space);

    const char* names[2] = {"wav/08a02Nc.wav", "wav/03a01Wa.wav"};
    hsize_t name_dims[1] = {2};
    hid_t type = H5Tcopy(H5T_C_S1);
    H5Tset_size(type, H5T_VARIABLE);
    space = H5Screate_simple(1, name_dims, nullptr);
    dataset = H5Dcreate2(file, "filename", type, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    H5Dwrite(dataset, type, H5S_ALL, H5S_ALL, H5P_DEFAULT, names);
    H5Dclose(dataset);
    H5Sclose(space);
    H5Tclose(type);
    H5Fclose(file);

    write_file("labels.csv", "Name,Emotion\n03a01Wa,W\n08a02Nc,N\n");

    LoaderOptions options;
    options.corpus = "emodb";
    options.normalization = NormalizationMethod::NONE;
    Dataset result = load_dataset(path, SourceFormat::AUTO, Granularity::UTTERANCE, options);

    EXPECT_EQ(result.names, (std::vector<std::string>{"03a01Wa", "08a02Nc"}));
    EXPECT_EQ(result.y, (std::vector<int>{0, 6}));
    EXPECT_DOUBLE_EQ(result.features(0, 0), 3.0);
    EXPECT_EQ(result.feature_names.size(), 2u);

    LoaderOptions no_corpus;
    EXPECT_THROW(load_dataset(path, SourceFormat::NETCDF, Granularity::UTTERANCE, no_corpus),
                 ConfigurationError);
    EXPECT_THROW(load_dataset(path, SourceFormat::NETCDF, Granularity::FRAME, options),
                 ConfigurationError);
}

TEST_F(DatasetLoaderTest, RawAudioDataset) {
    AudioBuffer buffer(16000, 1, 100);
    WavLoader loader;
    loader.saveFile(buffer, (test_dir_ / "03a01Wa.wav").string());
    loader.saveFile(buffer, (test_dir_ / "08a02Nc.wav").string());
    write_file("labels.txt", "Name,Emotion\n03a01Wa,W\n08a02Nc,N\n");
    std::string list = write_file("files.txt", "03a01Wa.wav\n08a02Nc.wav\n");

    Dataset dataset = load_raw_dataset(list, "emodb");
    EXPECT_EQ(dataset.granularity, Granularity::RAW);
    ASSERT_EQ(dataset.sequences.size(), 2u);
    EXPECT_EQ(dataset.sequences[0].rows(), 100);
    EXPECT_EQ(dataset.sequences[0].cols(), 1);
    EXPECT_EQ(dataset.feature_names, (std::vector<std::string>{"pcm"}));

    LoaderOptions options;
    options.corpus = "emodb";
    Dataset dispatched = load_dataset(list, SourceFormat::AUTO, Granularity::RAW, options);
    EXPECT_EQ(dispatched.n_instances(), 2u);
    EXPECT_THROW(load_dataset(list, SourceFormat::RAW, Granularity::FRAME, options), ConfigurationError);
}

TEST_F(DatasetLoaderTest, EmptyRawAudioListKeepsRawGranularity) {
    write_file("labels.txt", "Name,Emotion\n03a01Wa,W\n");
    std::string list = write_file("files.txt", "\n\n");

    Dataset dataset = load_raw_dataset(list, "emodb");
    EXPECT_EQ(dataset.granularity, Granularity::RAW);
    EXPECT_EQ(dataset.n_instances(), 0u);
    EXPECT_NO_THROW(dataset.pad_sequences(32));
}

TEST_F(DatasetLoaderTest, UnsupportedCombinations) {
    std::string path = write_file("emodb.arff", UTTERANCE_ARFF);
    EXPECT_THROW(load_dataset(path, SourceFormat::ARFF, Granularity::RAW), ConfigurationError);
    EXPECT_THROW(load_dataset((test_dir_ / "missing.arff").string(), SourceFormat::ARFF,
                              Granularity::UTTERANCE), SourceReadError);

    std::string anonymous = write_file("anon.arff",
        "@relation ''\n@attribute name string\n@attribute f numeric\n@attribute c {W}\n@data\n'03a01Wa',1,W\n");
    EXPECT_THROW(load_utterance_dataset(anonymous), ConfigurationError);
}

TEST(SourceFormatTest, DetectionAndNames) {
    EXPECT_EQ(detect_source_format("a/b.arff"), SourceFormat::ARFF);
    EXPECT_EQ(detect_source_format("a/b.BIN"), SourceFormat::PACKED);
    EXPECT_EQ(detect_source_format("a/b.nc"), SourceFormat::NETCDF);
    EXPECT_EQ(detect_source_format("a/b.h5"), SourceFormat::NETCDF);
    EXPECT_EQ(detect_source_format("a/files.txt"), SourceFormat::RAW);
    EXPECT_EQ(detect_source_format("a/features.csv"), SourceFormat::ARFF);

    EXPECT_EQ(parse_source_format("Packed"), SourceFormat::PACKED);
    EXPECT_EQ(parse_source_format("nc"), SourceFormat::NETCDF);
    EXPECT_THROW(parse_source_format("parquet"), InvalidParameterError);
    EXPECT_EQ(source_format_to_string(SourceFormat::RAW), "raw");

    EXPECT_EQ(parse_granularity("FRAME"), Granularity::FRAME);
    EXPECT_THROW(parse_granularity("word"), InvalidParameterError);
}
