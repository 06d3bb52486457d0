#include <gtest/gtest.h>
#include "emodata/packed_table.h"
#include "emodata/error_handler.h"

#include <zlib.h>

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace emodata;
using namespace emodata::io;

namespace {
    const char* FRAME_ARFF =
        "@relation iemocap\n"
        "@attribute name string\n"
        "@attribute frameTime numeric\n"
        "@attribute mfcc_1 numeric\n"
        "@attribute class {ang,hap,sad,neu}\n"
        "@data\n"
        "'Ses01F_impro01_F000_neu',0.0,-1.25,neu\n"
        "'Ses01F_impro01_F000_neu',0.01,?,neu\n"
        "'Ses01M_impro02_M003_ang',0.0,0.1,ang\n";

    std::vector<uint8_t> header(uint64_t payload_size) {
        std::ostringstream out;
        BinaryWriter writer(out);
        writer.write_uint32(packed_constants::MAGIC);
        writer.write_uint32(packed_constants::FORMAT_VERSION);
        writer.write_uint64(payload_size);
        const std::string bytes = out.str();
        return std::vector<uint8_t>(bytes.begin(), bytes.end());
    }

    // Wraps a hand-built payload in a valid header and zlib stream
    std::vector<uint8_t> pack_payload(const std::string& payload) {
        uLongf compressed_size = compressBound(static_cast<uLong>(payload.size()));
        std::vector<uint8_t> compressed(compressed_size);
        compress2(compressed.data(), &compressed_size,
                  reinterpret_cast<const Bytef*>(payload.data()),
                  static_cast<uLong>(payload.size()), Z_DEFAULT_COMPRESSION);
        compressed.resize(compressed_size);

        std::vector<uint8_t> bytes = header(payload.size());
        bytes.insert(bytes.end(), compressed.begin(), compressed.end());
        return bytes;
    }

    ArffRelation parse(const std::string& text) {
        std::istringstream stream(text);
        ArffParser parser;
        return parser.parse_stream(stream);
    }
}

class PackedTableTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "emodata_packed_test";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    void write_bytes(const std::filesystem::path& path, const std::vector<uint8_t>& bytes) {
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }
};

TEST_F(PackedTableTest, DecodedRelationMatchesSource) {
    ArffRelation relation = parse(FRAME_ARFF);
    std::vector<uint8_t> bytes = encode_packed_table(relation);
    ASSERT_GT(bytes.size(), 16u);

    ZlibPackedTableDecoder decoder;
    ArffRelation decoded = decoder.decode(bytes);

    EXPECT_EQ(decoded.relation, "iemocap");
    ASSERT_EQ(decoded.attributes.size(), relation.attributes.size());
    for (size_t j = 0; j < relation.attributes.size(); ++j) {
        EXPECT_EQ(decoded.attributes[j].name, relation.attributes[j].name);
        EXPECT_EQ(decoded.attributes[j].type, relation.attributes[j].type);
        EXPECT_EQ(decoded.attributes[j].nominal_values, relation.attributes[j].nominal_values);
    }
    ASSERT_EQ(decoded.data.size(), 3u);
    EXPECT_EQ(decoded.data[1][2], "?");
    EXPECT_EQ(decoded.data[2][3], "ang");
}

TEST_F(PackedTableTest, PackedAndTextSourcesGiveSameTable) {
    ArffRelation relation = parse(FRAME_ARFF);
    auto arff_path = test_dir_ / "frames.arff";
    auto bin_path = test_dir_ / "frames.bin";
    {
        std::ofstream file(arff_path);
        file << FRAME_ARFF;
    }
    write_bytes(bin_path, encode_packed_table(relation));

    RawTable text = read_tabular(arff_path.string());
    RawTable packed = read_tabular(bin_path.string());

    EXPECT_EQ(packed.names, text.names);
    EXPECT_EQ(packed.label_tokens, text.label_tokens);
    EXPECT_EQ(packed.attribute_names, text.attribute_names);
    EXPECT_EQ(packed.corpus_id, text.corpus_id);
    ASSERT_EQ(packed.features.rows(), text.features.rows());
    ASSERT_EQ(packed.features.cols(), text.features.cols());
    for (Eigen::Index i = 0; i < text.features.rows(); ++i) {
        for (Eigen::Index j = 0; j < text.features.cols(); ++j) {
            if (std::isnan(text.features(i, j))) {
                EXPECT_TRUE(std::isnan(packed.features(i, j)));
            } else {
                EXPECT_DOUBLE_EQ(packed.features(i, j), text.features(i, j));
            }
        }
    }
}

TEST_F(PackedTableTest, RejectsCorruptInput) {
    ZlibPackedTableDecoder decoder;
    EXPECT_THROW(decoder.decode({}), SourceReadError);

    std::vector<uint8_t> bytes = encode_packed_table(parse(FRAME_ARFF));
    std::vector<uint8_t> bad_magic = bytes;
    bad_magic[0] ^= 0xFF;
    EXPECT_THROW(decoder.decode(bad_magic), SourceReadError);

    std::vector<uint8_t> bad_version = bytes;
    bad_version[4] = 99;
    EXPECT_THROW(decoder.decode(bad_version), SourceReadError);

    std::vector<uint8_t> truncated(bytes.begin(), bytes.begin() + static_cast<long>(bytes.size() / 2));
    EXPECT_THROW(decoder.decode(truncated), SourceReadError);
}

TEST_F(PackedTableTest, RejectsForgedSizes) {
    ZlibPackedTableDecoder decoder;

    std::vector<uint8_t> huge_payload = header(uint64_t(1) << 62);
    huge_payload.resize(huge_payload.size() + 32, 0);
    EXPECT_THROW(decoder.decode(huge_payload), SourceReadError);

    std::ostringstream payload;
    BinaryWriter writer(payload);
    writer.write_string("emodb");
    writer.write_uint32(1);
    writer.write_string("f1");
    writer.write_uint8(static_cast<uint8_t>(AttributeType::NUMERIC));
    writer.write_uint32(0);
    writer.write_uint32(0xFFFFFFFFu);
    EXPECT_THROW(decoder.decode(pack_payload(payload.str())), SourceReadError);

    std::ostringstream no_attributes;
    BinaryWriter empty_writer(no_attributes);
    empty_writer.write_string("emodb");
    empty_writer.write_uint32(0);
    empty_writer.write_uint32(0xFFFFFFFFu);
    EXPECT_THROW(decoder.decode(pack_payload(no_attributes.str())), SourceReadError);

    std::ostringstream attributes;
    BinaryWriter attribute_writer(attributes);
    attribute_writer.write_string("emodb");
    attribute_writer.write_uint32(0x7FFFFFFFu);
    EXPECT_THROW(decoder.decode(pack_payload(attributes.str())), SourceReadError);
}

TEST_F(PackedTableTest, RowWidthMismatchRejectedOnEncode) {
    ArffRelation relation = parse(FRAME_ARFF);
    relation.data[0].pop_back();
    EXPECT_THROW(encode_packed_table(relation), InvalidParameterError);
}

TEST_F(PackedTableTest, MissingFileThrows) {
    EXPECT_THROW(read_tabular((test_dir_ / "absent.bin").string()), SourceReadError);
    EXPECT_TRUE(is_packed_path("a/b/frames.bin"));
    EXPECT_FALSE(is_packed_path("a/b/frames.arff"));
}

TEST(BinaryStreamTest, LittleEndianLayout) {
    std::ostringstream out;
    BinaryWriter writer(out);
    writer.write_uint32(packed_constants::MAGIC);
    writer.write_string("ab");

    const std::string bytes = out.str();
    ASSERT_EQ(bytes.size(), 4u + 4u + 2u);
    EXPECT_EQ(bytes.substr(0, 4), "EMOP");

    std::istringstream in(bytes);
    BinaryReader reader(in);
    EXPECT_EQ(reader.read_uint32(), packed_constants::MAGIC);
    EXPECT_EQ(reader.read_string(), "ab");
    EXPECT_THROW(reader.read_uint8(), SourceReadError);
}
