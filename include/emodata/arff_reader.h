#pragma once

#include "raw_table.h"
#include <string>
#include <vector>
#include <istream>

namespace emodata {
namespace io {

    /**
     * @brief ARFF attribute types
     */
    enum class AttributeType {
        NUMERIC,    // numeric, real, integer
        STRING,
        NOMINAL     // {a,b,c}
    };

    struct ArffAttribute {
        std::string name;
        AttributeType type = AttributeType::NUMERIC;
        std::vector<std::string> nominal_values;
    };

    /**
     * @brief A parsed relation: name, attribute schema and data rows
     *
     * Values are kept as their textual form; "?" marks a missing value.
     * Numeric values are converted when the relation is turned into a
     * RawTable.
     */
    struct ArffRelation {
        std::string relation;
        std::vector<ArffAttribute> attributes;
        std::vector<std::vector<std::string>> data;
    };

    /**
     * @brief Weka ARFF text parser
     *
     * Supports @relation, @attribute (numeric/real/integer, string,
     * nominal) and dense @data rows with single or double quoting and
     * `%` comments. Sparse rows are rejected.
     */
    class ArffParser {
    public:
        ArffParser() = default;

        /**
         * @brief Parse an ARFF file
         * @throws SourceReadError if the file is missing or malformed
         */
        ArffRelation parse_file(const std::string& path);

        /**
         * @brief Parse ARFF text from a stream
         * @param source Used in error messages
         */
        ArffRelation parse_stream(std::istream& stream, const std::string& source = "<stream>");

    private:
        size_t line_number_ = 0;
        std::string source_;

        void parse_attribute(const std::string& line, ArffRelation& relation);
        std::vector<std::string> split_values(const std::string& line) const;
        [[noreturn]] void fail(const std::string& message) const;
    };

    /**
     * @brief Convert a relation into a RawTable
     *
     * First attribute is the instance name, last is the label token and
     * the attributes in between are numeric features. Missing numeric
     * values become NaN. The relation name surfaces as corpus_id.
     * @throws SourceReadError when the schema does not have that shape
     */
    RawTable relation_to_raw_table(const ArffRelation& relation);

    /**
     * @brief Read a text ARFF file into a RawTable
     */
    RawTable read_arff(const std::string& path);

    /**
     * @brief Serialise a relation back to ARFF text
     */
    void write_arff(const ArffRelation& relation, std::ostream& stream);

    namespace arff_utils {
        std::string trim(const std::string& s);
        std::string to_lower(const std::string& s);
        std::string quote_if_needed(const std::string& value);
        bool is_missing(const std::string& value);
        double parse_numeric(const std::string& value);
    } // namespace arff_utils

} // namespace io
} // namespace emodata
