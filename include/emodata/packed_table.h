#pragma once

#include "arff_reader.h"
#include "raw_table.h"
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace emodata {
namespace io {

    namespace packed_constants {
        constexpr uint32_t MAGIC = 0x504F4D45;      // "EMOP" little-endian
        constexpr uint32_t FORMAT_VERSION = 1;
        constexpr int COMPRESSION_LEVEL = 6;
        constexpr const char* FILE_EXTENSION = ".bin";
    }

    /**
     * @brief Decoder collaborator for binary-packed tabular files
     *
     * Takes the complete file contents and returns the relation it encodes.
     * Implementations throw SourceReadError on corrupt input.
     */
    class PackedTableDecoder {
    public:
        virtual ~PackedTableDecoder() = default;
        virtual ArffRelation decode(const std::vector<uint8_t>& bytes) const = 0;
    };

    /**
     * @brief Default decoder for the zlib-compressed packed layout
     *
     * Layout (all integers little-endian):
     *   uint32 magic, uint32 version, uint64 payload size,
     *   zlib stream of { string relation, uint32 n_attributes,
     *   n_attributes x (string name, uint8 type, uint32 n_nominal, strings),
     *   uint32 n_rows, n_rows x n_attributes values }
     * Numeric values are stored as doubles (NaN for missing), the rest as
     * length-prefixed strings.
     */
    class ZlibPackedTableDecoder : public PackedTableDecoder {
    public:
        ArffRelation decode(const std::vector<uint8_t>& bytes) const override;
    };

    /**
     * @brief Encode a relation into the layout ZlibPackedTableDecoder reads
     */
    std::vector<uint8_t> encode_packed_table(const ArffRelation& relation,
                                             int compression_level = packed_constants::COMPRESSION_LEVEL);

    /**
     * @brief Read a tabular source, dispatching on the file extension
     *
     * `.bin` files are handed to the decoder; anything else is parsed as
     * ARFF text.
     */
    RawTable read_tabular(const std::string& path, const PackedTableDecoder& decoder);
    RawTable read_tabular(const std::string& path);

    /**
     * @brief Relation-level variant of read_tabular
     */
    ArffRelation read_relation(const std::string& path, const PackedTableDecoder& decoder);

    bool is_packed_path(const std::string& path);

    /**
     * @brief Little-endian binary writer for the packed layout
     */
    class BinaryWriter {
    public:
        explicit BinaryWriter(std::ostream& stream);

        void write_uint8(uint8_t value);
        void write_uint32(uint32_t value);
        void write_uint64(uint64_t value);
        void write_double(double value);
        void write_string(const std::string& str);
        void write_bytes(const void* data, size_t size);

    private:
        std::ostream& stream_;
    };

    /**
     * @brief Little-endian binary reader; short reads throw SourceReadError
     */
    class BinaryReader {
    public:
        explicit BinaryReader(std::istream& stream);

        uint8_t read_uint8();
        uint32_t read_uint32();
        uint64_t read_uint64();
        double read_double();
        std::string read_string();
        void read_bytes(void* data, size_t size);

    private:
        std::istream& stream_;
    };

} // namespace io
} // namespace emodata
