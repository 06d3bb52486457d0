#include "emodata/annotations.h"
#include "emodata/arff_reader.h"
#include "emodata/error_handler.h"
#include "emodata/logger.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace emodata {
namespace io {

    namespace {
        struct CsvTable {
            std::vector<std::string> header;
            std::vector<std::vector<std::string>> rows;
        };

        CsvTable read_csv(const std::string& path, size_t min_columns) {
            if (!std::filesystem::exists(path)) {
                throw SourceReadError("Annotation file not found: " + path);
            }
            std::ifstream file(path);
            if (!file.is_open()) {
                throw SourceReadError("Cannot open annotation file: " + path);
            }

            CsvTable table;
            std::string line;
            size_t line_number = 0;
            bool have_header = false;
            while (std::getline(file, line)) {
                ++line_number;
                if (arff_utils::trim(line).empty()) {
                    continue;
                }
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }

                auto fields = csv_utils::split_record(line);
                if (!have_header) {
                    if (fields.size() < min_columns) {
                        throw SourceReadError(path + ": header needs at least " +
                                              std::to_string(min_columns) + " columns");
                    }
                    table.header = std::move(fields);
                    have_header = true;
                    continue;
                }
                if (fields.size() != table.header.size()) {
                    throw SourceReadError(path + ":" + std::to_string(line_number) +
                                          ": expected " + std::to_string(table.header.size()) +
                                          " fields, found " + std::to_string(fields.size()));
                }
                table.rows.push_back(std::move(fields));
            }

            if (!have_header) {
                throw SourceReadError("Annotation file is empty: " + path);
            }
            return table;
        }
    }

    ClassificationAnnotations parse_classification_annotations(const std::string& path) {
        CsvTable table = read_csv(path, 2);

        ClassificationAnnotations annotations;
        for (auto& row : table.rows) {
            annotations[row[0]] = row[1];
        }

        Logger::instance().log_source_read("annotations", path, annotations.size());
        return annotations;
    }

    RegressionAnnotations parse_regression_annotations(const std::string& path) {
        CsvTable table = read_csv(path, 2);

        RegressionAnnotations annotations;
        for (const auto& row : table.rows) {
            std::map<std::string, double> values;
            for (size_t j = 1; j < row.size(); ++j) {
                const std::string& field = row[j];
                char* end = nullptr;
                double value = std::strtod(field.c_str(), &end);
                if (field.empty() || end != field.c_str() + field.size()) {
                    throw SourceReadError(path + ": non-numeric value '" + field +
                                          "' in column " + table.header[j]);
                }
                values[table.header[j]] = value;
            }
            annotations[row[0]] = std::move(values);
        }

        Logger::instance().log_source_read("annotations", path, annotations.size());
        return annotations;
    }

    namespace csv_utils {

        std::vector<std::string> split_record(const std::string& line) {
            std::vector<std::string> fields;
            std::string field;
            bool in_quotes = false;

            for (size_t i = 0; i < line.size(); ++i) {
                char c = line[i];
                if (in_quotes) {
                    if (c == '"') {
                        if (i + 1 < line.size() && line[i + 1] == '"') {
                            field += '"';
                            ++i;
                        } else {
                            in_quotes = false;
                        }
                    } else {
                        field += c;
                    }
                } else if (c == '"') {
                    in_quotes = true;
                } else if (c == ',') {
                    fields.push_back(arff_utils::trim(field));
                    field.clear();
                } else {
                    field += c;
                }
            }
            fields.push_back(arff_utils::trim(field));
            return fields;
        }

    } // namespace csv_utils

} // namespace io
} // namespace emodata
