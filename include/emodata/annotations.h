#pragma once

#include <map>
#include <string>
#include <vector>

namespace emodata {
namespace io {

    using ClassificationAnnotations = std::map<std::string, std::string>;
    using RegressionAnnotations = std::map<std::string, std::map<std::string, double>>;

    /**
     * @brief Parse a classification annotation CSV
     *
     * The first row is a header. The first column is the instance name,
     * the second the label token. Later duplicates overwrite earlier rows.
     * @throws SourceReadError on unreadable or malformed files
     */
    ClassificationAnnotations parse_classification_annotations(const std::string& path);

    /**
     * @brief Parse a regression annotation CSV into name -> {column: value}
     */
    RegressionAnnotations parse_regression_annotations(const std::string& path);

    namespace csv_utils {
        // Split one CSV record; double quotes may enclose commas, "" escapes a quote
        std::vector<std::string> split_record(const std::string& line);
    }

} // namespace io
} // namespace emodata
