#include "emodata/arff_reader.h"
#include "emodata/error_handler.h"
#include "emodata/logger.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <limits>

namespace emodata {
namespace io {

    namespace {
        bool starts_with_keyword(const std::string& lower_line, const std::string& keyword) {
            if (lower_line.compare(0, keyword.size(), keyword) != 0) {
                return false;
            }
            return lower_line.size() == keyword.size() ||
                   std::isspace(static_cast<unsigned char>(lower_line[keyword.size()]));
        }

        std::string type_to_string(const ArffAttribute& attribute) {
            switch (attribute.type) {
                case AttributeType::NUMERIC: return "numeric";
                case AttributeType::STRING: return "string";
                case AttributeType::NOMINAL: {
                    std::ostringstream oss;
                    oss << "{";
                    for (size_t i = 0; i < attribute.nominal_values.size(); ++i) {
                        if (i > 0) oss << ",";
                        oss << arff_utils::quote_if_needed(attribute.nominal_values[i]);
                    }
                    oss << "}";
                    return oss.str();
                }
            }
            return "string";
        }
    }

    // ArffParser implementation
    ArffRelation ArffParser::parse_file(const std::string& path) {
        if (!std::filesystem::exists(path)) {
            throw SourceReadError("Source file not found: " + path);
        }

        std::ifstream file(path);
        if (!file.is_open()) {
            throw SourceReadError("Cannot open ARFF file: " + path);
        }

        return parse_stream(file, path);
    }

    ArffRelation ArffParser::parse_stream(std::istream& stream, const std::string& source) {
        ArffRelation relation;
        source_ = source;
        line_number_ = 0;
        bool in_data = false;

        std::string line;
        while (std::getline(stream, line)) {
            ++line_number_;
            std::string trimmed = arff_utils::trim(line);
            if (trimmed.empty() || trimmed[0] == '%') {
                continue;
            }

            if (in_data) {
                if (trimmed[0] == '{') {
                    fail("sparse data rows are not supported");
                }
                auto values = split_values(trimmed);
                if (values.size() != relation.attributes.size()) {
                    fail("expected " + std::to_string(relation.attributes.size()) +
                         " values, found " + std::to_string(values.size()));
                }
                relation.data.push_back(std::move(values));
                continue;
            }

            std::string lower = arff_utils::to_lower(trimmed);
            if (starts_with_keyword(lower, "@relation")) {
                auto values = split_values(arff_utils::trim(trimmed.substr(9)));
                relation.relation = values.empty() ? std::string() : values.front();
            } else if (starts_with_keyword(lower, "@attribute")) {
                parse_attribute(arff_utils::trim(trimmed.substr(10)), relation);
            } else if (starts_with_keyword(lower, "@data")) {
                if (relation.attributes.empty()) {
                    fail("@data section before any @attribute declaration");
                }
                in_data = true;
            } else {
                fail("unexpected header line '" + trimmed + "'");
            }
        }

        if (!in_data) {
            fail("missing @data section");
        }
        return relation;
    }

    void ArffParser::parse_attribute(const std::string& line, ArffRelation& relation) {
        ArffAttribute attribute;
        std::string rest;

        if (!line.empty() && (line[0] == '\'' || line[0] == '"')) {
            char quote = line[0];
            size_t end = line.find(quote, 1);
            if (end == std::string::npos) {
                fail("unterminated attribute name");
            }
            attribute.name = line.substr(1, end - 1);
            rest = line.substr(end + 1);
        } else {
            size_t end = 0;
            while (end < line.size() && !std::isspace(static_cast<unsigned char>(line[end]))) {
                ++end;
            }
            attribute.name = line.substr(0, end);
            rest = line.substr(end);
        }

        std::string type = arff_utils::trim(rest);
        std::string lower_type = arff_utils::to_lower(type);
        if (attribute.name.empty() || type.empty()) {
            fail("malformed @attribute declaration");
        }

        if (lower_type == "numeric" || lower_type == "real" || lower_type == "integer") {
            attribute.type = AttributeType::NUMERIC;
        } else if (lower_type == "string" || starts_with_keyword(lower_type, "date")) {
            attribute.type = AttributeType::STRING;
        } else if (type.front() == '{' && type.back() == '}') {
            attribute.type = AttributeType::NOMINAL;
            attribute.nominal_values = split_values(type.substr(1, type.size() - 2));
        } else {
            fail("unsupported attribute type '" + type + "'");
        }

        relation.attributes.push_back(std::move(attribute));
    }

    std::vector<std::string> ArffParser::split_values(const std::string& line) const {
        std::vector<std::string> values;
        const size_t n = line.size();
        size_t i = 0;

        while (true) {
            while (i < n && std::isspace(static_cast<unsigned char>(line[i]))) ++i;

            std::string value;
            if (i < n && (line[i] == '\'' || line[i] == '"')) {
                char quote = line[i++];
                bool closed = false;
                while (i < n) {
                    char c = line[i++];
                    if (c == '\\' && i < n) {
                        value += line[i++];
                        continue;
                    }
                    if (c == quote) {
                        closed = true;
                        break;
                    }
                    value += c;
                }
                if (!closed) {
                    fail("unterminated quoted value");
                }
                while (i < n && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
                if (i < n && line[i] != ',') {
                    fail("unexpected characters after quoted value");
                }
            } else {
                size_t start = i;
                while (i < n && line[i] != ',') ++i;
                value = arff_utils::trim(line.substr(start, i - start));
            }

            values.push_back(std::move(value));
            if (i >= n) break;
            ++i;  // skip comma
        }

        return values;
    }

    void ArffParser::fail(const std::string& message) const {
        throw SourceReadError(source_ + ":" + std::to_string(line_number_) + ": " + message);
    }

    RawTable relation_to_raw_table(const ArffRelation& relation) {
        const auto& attributes = relation.attributes;
        if (attributes.size() < 2) {
            throw SourceReadError("Relation '" + relation.relation +
                                  "' needs at least a name and a label attribute");
        }

        const size_t n_features = attributes.size() - 2;
        for (size_t j = 1; j + 1 < attributes.size(); ++j) {
            if (attributes[j].type != AttributeType::NUMERIC) {
                throw SourceReadError("Feature attribute '" + attributes[j].name +
                                      "' is not numeric");
            }
        }

        RawTable table;
        if (!relation.relation.empty()) {
            table.corpus_id = relation.relation;
        }
        for (size_t j = 1; j + 1 < attributes.size(); ++j) {
            table.attribute_names.push_back(attributes[j].name);
        }

        const size_t n_rows = relation.data.size();
        table.features.resize(static_cast<Eigen::Index>(n_rows), static_cast<Eigen::Index>(n_features));
        table.names.reserve(n_rows);
        table.label_tokens.reserve(n_rows);

        for (size_t i = 0; i < n_rows; ++i) {
            const auto& row = relation.data[i];
            table.names.push_back(row.front());
            for (size_t j = 0; j < n_features; ++j) {
                table.features(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) =
                    arff_utils::parse_numeric(row[j + 1]);
            }
            table.label_tokens.push_back(row.back());
        }

        return table;
    }

    RawTable read_arff(const std::string& path) {
        ArffParser parser;
        RawTable table = relation_to_raw_table(parser.parse_file(path));
        Logger::instance().log_source_read("arff", path, table.size());
        return table;
    }

    void write_arff(const ArffRelation& relation, std::ostream& stream) {
        stream << "@relation " << arff_utils::quote_if_needed(relation.relation) << "\n\n";
        for (const auto& attribute : relation.attributes) {
            stream << "@attribute " << arff_utils::quote_if_needed(attribute.name)
                   << " " << type_to_string(attribute) << "\n";
        }
        stream << "\n@data\n";
        for (const auto& row : relation.data) {
            for (size_t j = 0; j < row.size(); ++j) {
                if (j > 0) stream << ",";
                stream << (arff_utils::is_missing(row[j]) ? row[j] : arff_utils::quote_if_needed(row[j]));
            }
            stream << "\n";
        }
    }

    namespace arff_utils {

        std::string trim(const std::string& s) {
            const char* whitespace = " \t\r\n";
            size_t start = s.find_first_not_of(whitespace);
            if (start == std::string::npos) {
                return "";
            }
            size_t end = s.find_last_not_of(whitespace);
            return s.substr(start, end - start + 1);
        }

        std::string to_lower(const std::string& s) {
            std::string result = s;
            std::transform(result.begin(), result.end(), result.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return result;
        }

        std::string quote_if_needed(const std::string& value) {
            bool needs_quotes = value.empty() ||
                value.find_first_of(" \t,'\"%{}\\") != std::string::npos;
            if (!needs_quotes) {
                return value;
            }
            std::string quoted = "'";
            for (char c : value) {
                if (c == '\'' || c == '\\') quoted += '\\';
                quoted += c;
            }
            quoted += "'";
            return quoted;
        }

        bool is_missing(const std::string& value) {
            return value == "?";
        }

        double parse_numeric(const std::string& value) {
            if (is_missing(value)) {
                return std::numeric_limits<double>::quiet_NaN();
            }
            const char* begin = value.c_str();
            char* end = nullptr;
            double result = std::strtod(begin, &end);
            if (value.empty() || end != begin + value.size()) {
                throw SourceReadError("Invalid numeric value '" + value + "'");
            }
            return result;
        }

    } // namespace arff_utils

} // namespace io
} // namespace emodata
