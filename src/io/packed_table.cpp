#include "emodata/packed_table.h"
#include "emodata/error_handler.h"
#include "emodata/logger.h"
#include <zlib.h>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <limits>
#include <sstream>

namespace emodata {
namespace io {

    namespace {
        constexpr size_t HEADER_SIZE = 16;
        constexpr uint32_t MAX_STRING_LENGTH = 1u << 24;
        constexpr uint64_t MAX_EXPANSION_RATIO = 1032;

        std::string format_numeric(double value) {
            if (std::isnan(value)) {
                return "?";
            }
            std::ostringstream oss;
            oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
            return oss.str();
        }

        AttributeType type_from_uint8(uint8_t value) {
            switch (value) {
                case 0: return AttributeType::NUMERIC;
                case 1: return AttributeType::STRING;
                case 2: return AttributeType::NOMINAL;
                default:
                    throw SourceReadError("Packed table has unknown attribute type " +
                                          std::to_string(value));
            }
        }
    }

    // BinaryWriter implementation
    BinaryWriter::BinaryWriter(std::ostream& stream) : stream_(stream) {
    }

    void BinaryWriter::write_uint8(uint8_t value) {
        stream_.write(reinterpret_cast<const char*>(&value), sizeof(value));
    }

    void BinaryWriter::write_uint32(uint32_t value) {
        for (int shift = 0; shift < 32; shift += 8) {
            write_uint8(static_cast<uint8_t>((value >> shift) & 0xFF));
        }
    }

    void BinaryWriter::write_uint64(uint64_t value) {
        for (int shift = 0; shift < 64; shift += 8) {
            write_uint8(static_cast<uint8_t>((value >> shift) & 0xFF));
        }
    }

    void BinaryWriter::write_double(double value) {
        static_assert(sizeof(double) == sizeof(uint64_t), "Double size assumption failed");
        uint64_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        write_uint64(bits);
    }

    void BinaryWriter::write_string(const std::string& str) {
        write_uint32(static_cast<uint32_t>(str.length()));
        if (!str.empty()) {
            stream_.write(str.c_str(), static_cast<std::streamsize>(str.length()));
        }
    }

    void BinaryWriter::write_bytes(const void* data, size_t size) {
        stream_.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
    }

    // BinaryReader implementation
    BinaryReader::BinaryReader(std::istream& stream) : stream_(stream) {
    }

    uint8_t BinaryReader::read_uint8() {
        uint8_t value = 0;
        read_bytes(&value, sizeof(value));
        return value;
    }

    uint32_t BinaryReader::read_uint32() {
        uint8_t bytes[4];
        read_bytes(bytes, sizeof(bytes));
        uint32_t value = 0;
        for (int i = 3; i >= 0; --i) {
            value = (value << 8) | bytes[i];
        }
        return value;
    }

    uint64_t BinaryReader::read_uint64() {
        uint8_t bytes[8];
        read_bytes(bytes, sizeof(bytes));
        uint64_t value = 0;
        for (int i = 7; i >= 0; --i) {
            value = (value << 8) | bytes[i];
        }
        return value;
    }

    double BinaryReader::read_double() {
        uint64_t bits = read_uint64();
        double value;
        std::memcpy(&value, &bits, sizeof(value));
        return value;
    }

    std::string BinaryReader::read_string() {
        uint32_t length = read_uint32();
        if (length > MAX_STRING_LENGTH) {
            throw SourceReadError("Packed table string length " + std::to_string(length) +
                                  " exceeds limit");
        }
        std::string str(length, '\0');
        if (length > 0) {
            read_bytes(&str[0], length);
        }
        return str;
    }

    void BinaryReader::read_bytes(void* data, size_t size) {
        stream_.read(static_cast<char*>(data), static_cast<std::streamsize>(size));
        if (static_cast<size_t>(stream_.gcount()) != size) {
            throw SourceReadError("Unexpected end of packed table data");
        }
    }

    // ZlibPackedTableDecoder implementation
    ArffRelation ZlibPackedTableDecoder::decode(const std::vector<uint8_t>& bytes) const {
        if (bytes.size() < HEADER_SIZE) {
            throw SourceReadError("Packed table is too short (" + std::to_string(bytes.size()) + " bytes)");
        }

        std::string raw(bytes.begin(), bytes.end());
        std::istringstream header_stream(raw);
        BinaryReader header_reader(header_stream);

        if (header_reader.read_uint32() != packed_constants::MAGIC) {
            throw SourceReadError("Packed table has an invalid magic number");
        }
        uint32_t version = header_reader.read_uint32();
        if (version != packed_constants::FORMAT_VERSION) {
            throw SourceReadError("Unsupported packed table version " + std::to_string(version));
        }
        uint64_t payload_size = header_reader.read_uint64();

        // zlib never expands data by more than 1032:1
        const uint64_t compressed_size = bytes.size() - HEADER_SIZE;
        if (payload_size > compressed_size * MAX_EXPANSION_RATIO) {
            throw SourceReadError("Packed table declares " + std::to_string(payload_size) +
                                  " payload bytes for " + std::to_string(compressed_size) +
                                  " compressed bytes");
        }

        std::vector<uint8_t> payload(static_cast<size_t>(payload_size));
        uLongf output_size = static_cast<uLongf>(payload_size);
        if (payload_size > 0) {
            int result = uncompress(payload.data(), &output_size,
                                    bytes.data() + HEADER_SIZE,
                                    static_cast<uLong>(bytes.size() - HEADER_SIZE));
            if (result != Z_OK || output_size != payload_size) {
                throw SourceReadError("Zlib decompression of packed table failed with error: " +
                                      std::to_string(result));
            }
        }

        std::istringstream payload_stream(std::string(payload.begin(), payload.end()));
        BinaryReader reader(payload_stream);

        // Every counted record occupies at least min_bytes of payload
        auto check_count = [&payload](uint64_t count, uint64_t min_bytes, const char* what) {
            if (min_bytes > 0 && count > payload.size() / min_bytes) {
                throw SourceReadError("Packed table declares " + std::to_string(count) + " " + what +
                                      ", more than the payload can hold");
            }
        };

        ArffRelation relation;
        relation.relation = reader.read_string();

        uint32_t n_attributes = reader.read_uint32();
        check_count(n_attributes, 9, "attributes");
        for (uint32_t i = 0; i < n_attributes; ++i) {
            ArffAttribute attribute;
            attribute.name = reader.read_string();
            attribute.type = type_from_uint8(reader.read_uint8());
            uint32_t n_nominal = reader.read_uint32();
            check_count(n_nominal, 4, "nominal values");
            for (uint32_t k = 0; k < n_nominal; ++k) {
                attribute.nominal_values.push_back(reader.read_string());
            }
            relation.attributes.push_back(std::move(attribute));
        }

        uint32_t n_rows = reader.read_uint32();
        if (n_rows > 0 && n_attributes == 0) {
            throw SourceReadError("Packed table has rows but no attributes");
        }
        // Numeric cells take 8 bytes and string cells at least 4
        check_count(n_rows, 4ULL * n_attributes, "rows");
        for (uint32_t r = 0; r < n_rows; ++r) {
            std::vector<std::string> row;
            row.reserve(n_attributes);
            for (const auto& attribute : relation.attributes) {
                if (attribute.type == AttributeType::NUMERIC) {
                    row.push_back(format_numeric(reader.read_double()));
                } else {
                    row.push_back(reader.read_string());
                }
            }
            relation.data.push_back(std::move(row));
        }

        return relation;
    }

    std::vector<uint8_t> encode_packed_table(const ArffRelation& relation, int compression_level) {
        if (compression_level < 0 || compression_level > 9) {
            compression_level = packed_constants::COMPRESSION_LEVEL;
        }

        std::ostringstream payload_stream;
        BinaryWriter writer(payload_stream);

        writer.write_string(relation.relation);
        writer.write_uint32(static_cast<uint32_t>(relation.attributes.size()));
        for (const auto& attribute : relation.attributes) {
            writer.write_string(attribute.name);
            writer.write_uint8(static_cast<uint8_t>(attribute.type));
            writer.write_uint32(static_cast<uint32_t>(attribute.nominal_values.size()));
            for (const auto& value : attribute.nominal_values) {
                writer.write_string(value);
            }
        }

        writer.write_uint32(static_cast<uint32_t>(relation.data.size()));
        for (const auto& row : relation.data) {
            if (row.size() != relation.attributes.size()) {
                throw InvalidParameterError("Row width " + std::to_string(row.size()) +
                                            " does not match attribute count " +
                                            std::to_string(relation.attributes.size()));
            }
            for (size_t j = 0; j < row.size(); ++j) {
                if (relation.attributes[j].type == AttributeType::NUMERIC) {
                    writer.write_double(arff_utils::parse_numeric(row[j]));
                } else {
                    writer.write_string(row[j]);
                }
            }
        }

        const std::string payload = payload_stream.str();
        uLongf compressed_size = compressBound(static_cast<uLong>(payload.size()));
        std::vector<uint8_t> compressed(compressed_size);
        int result = compress2(compressed.data(), &compressed_size,
                               reinterpret_cast<const Bytef*>(payload.data()),
                               static_cast<uLong>(payload.size()), compression_level);
        if (result != Z_OK) {
            throw SourceReadError("Zlib compression failed with error: " + std::to_string(result));
        }
        compressed.resize(compressed_size);

        std::ostringstream out;
        BinaryWriter out_writer(out);
        out_writer.write_uint32(packed_constants::MAGIC);
        out_writer.write_uint32(packed_constants::FORMAT_VERSION);
        out_writer.write_uint64(static_cast<uint64_t>(payload.size()));
        out_writer.write_bytes(compressed.data(), compressed.size());

        const std::string encoded = out.str();
        return std::vector<uint8_t>(encoded.begin(), encoded.end());
    }

    bool is_packed_path(const std::string& path) {
        return std::filesystem::path(path).extension() == packed_constants::FILE_EXTENSION;
    }

    ArffRelation read_relation(const std::string& path, const PackedTableDecoder& decoder) {
        if (!is_packed_path(path)) {
            ArffParser parser;
            return parser.parse_file(path);
        }

        if (!std::filesystem::exists(path)) {
            throw SourceReadError("Source file not found: " + path);
        }
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            throw SourceReadError("Cannot open packed table: " + path);
        }
        std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                                   std::istreambuf_iterator<char>());
        return decoder.decode(bytes);
    }

    RawTable read_tabular(const std::string& path, const PackedTableDecoder& decoder) {
        RawTable table = relation_to_raw_table(read_relation(path, decoder));
        Logger::instance().log_source_read(is_packed_path(path) ? "packed" : "arff",
                                           path, table.size());
        return table;
    }

    RawTable read_tabular(const std::string& path) {
        ZlibPackedTableDecoder decoder;
        return read_tabular(path, decoder);
    }

} // namespace io
} // namespace emodata
