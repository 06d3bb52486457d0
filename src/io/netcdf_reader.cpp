#include "emodata/netcdf_reader.h"
#include "emodata/annotations.h"
#include "emodata/error_handler.h"
#include "emodata/logger.h"
#include <algorithm>
#include <filesystem>
#include <numeric>

namespace emodata {
namespace io {

    namespace hdf5_utils {

        ScopedErrorSilencer::ScopedErrorSilencer() {
            H5Eget_auto2(H5E_DEFAULT, &old_func_, &old_data_);
            H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr);
        }

        ScopedErrorSilencer::~ScopedErrorSilencer() {
            H5Eset_auto2(H5E_DEFAULT, old_func_, old_data_);
        }

    } // namespace hdf5_utils

    namespace {
        using hdf5_utils::Handle;

        Handle open_dataset(const Handle& file, const char* name, const std::string& path) {
            if (H5Lexists(file.get(), name, H5P_DEFAULT) <= 0) {
                throw SourceReadError("Variable '" + std::string(name) + "' not found in " + path);
            }
            Handle dataset(H5Dopen2(file.get(), name, H5P_DEFAULT), H5Dclose);
            if (!dataset.valid()) {
                throw SourceReadError("Cannot open variable '" + std::string(name) + "' in " + path);
            }
            return dataset;
        }

        Eigen::MatrixXd read_feature_block(const Handle& file, const std::string& path) {
            Handle dataset = open_dataset(file, "features", path);
            Handle space(H5Dget_space(dataset.get()), H5Sclose);

            if (H5Sget_simple_extent_ndims(space.get()) != 2) {
                throw SourceReadError("Variable 'features' in " + path + " is not 2-D");
            }
            hsize_t dims[2] = {0, 0};
            H5Sget_simple_extent_dims(space.get(), dims, nullptr);

            using RowMajorMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
            RowMajorMatrix block(static_cast<Eigen::Index>(dims[0]), static_cast<Eigen::Index>(dims[1]));
            if (block.size() > 0 &&
                H5Dread(dataset.get(), H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, block.data()) < 0) {
                throw SourceReadError("Cannot read variable 'features' from " + path);
            }
            return block;
        }

        std::vector<std::string> read_string_variable(const Handle& file, const char* name,
                                                      const std::string& path) {
            Handle dataset = open_dataset(file, name, path);
            Handle file_type(H5Dget_type(dataset.get()), H5Tclose);
            Handle space(H5Dget_space(dataset.get()), H5Sclose);

            if (H5Tget_class(file_type.get()) != H5T_STRING) {
                throw SourceReadError("Variable '" + std::string(name) + "' in " + path +
                                      " is not a string variable");
            }

            int ndims = H5Sget_simple_extent_ndims(space.get());
            if (ndims < 1 || ndims > 2) {
                throw SourceReadError("Variable '" + std::string(name) + "' in " + path +
                                      " has unsupported rank " + std::to_string(ndims));
            }
            hsize_t dims[2] = {0, 1};
            H5Sget_simple_extent_dims(space.get(), dims, nullptr);
            const size_t count = static_cast<size_t>(dims[0]);

            std::vector<std::string> values;
            values.reserve(count);

            if (H5Tis_variable_str(file_type.get()) > 0) {
                if (ndims != 1) {
                    throw SourceReadError("Variable-length string variable '" + std::string(name) +
                                          "' must be 1-D in " + path);
                }
                Handle mem_type(H5Tcopy(H5T_C_S1), H5Tclose);
                H5Tset_size(mem_type.get(), H5T_VARIABLE);
                H5Tset_cset(mem_type.get(), H5Tget_cset(file_type.get()));

                std::vector<char*> buffer(count, nullptr);
                if (count > 0 &&
                    H5Dread(dataset.get(), mem_type.get(), H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer.data()) < 0) {
                    throw SourceReadError("Cannot read variable '" + std::string(name) + "' from " + path);
                }
                for (char* value : buffer) {
                    values.emplace_back(value ? value : "");
                }
                if (count > 0) {
                    H5Dvlen_reclaim(mem_type.get(), space.get(), H5P_DEFAULT, buffer.data());
                }
            } else {
                // Fixed-size strings, or a netCDF char matrix (n x string length)
                const size_t element_size = H5Tget_size(file_type.get());
                const size_t width = element_size * static_cast<size_t>(ndims == 2 ? dims[1] : 1);

                Handle mem_type(H5Tcopy(H5T_C_S1), H5Tclose);
                H5Tset_size(mem_type.get(), element_size);
                H5Tset_strpad(mem_type.get(), H5T_STR_NULLPAD);

                std::vector<char> buffer(count * width, '\0');
                if (!buffer.empty() &&
                    H5Dread(dataset.get(), mem_type.get(), H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer.data()) < 0) {
                    throw SourceReadError("Cannot read variable '" + std::string(name) + "' from " + path);
                }
                for (size_t i = 0; i < count; ++i) {
                    std::string value(buffer.data() + i * width, width);
                    size_t end = value.find('\0');
                    if (end != std::string::npos) {
                        value.resize(end);
                    }
                    size_t last = value.find_last_not_of(' ');
                    value.resize(last == std::string::npos ? 0 : last + 1);
                    values.push_back(std::move(value));
                }
            }

            return values;
        }
    }

    std::string default_netcdf_annotation_path(const std::string& path) {
        return (std::filesystem::path(path).parent_path() / ".." / "labels.csv").string();
    }

    GriddedArrays read_gridded_arrays(const std::string& path) {
        if (!std::filesystem::exists(path)) {
            throw SourceReadError("Source file not found: " + path);
        }

        hdf5_utils::ScopedErrorSilencer silencer;
        if (H5Fis_hdf5(path.c_str()) <= 0) {
            throw SourceReadError("Not a netCDF-4/HDF5 file: " + path);
        }

        Handle file(H5Fopen(path.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT), H5Fclose);
        if (!file.valid()) {
            throw SourceReadError("Cannot open netCDF file: " + path);
        }

        GriddedArrays arrays;
        arrays.features = read_feature_block(file, path);
        arrays.filenames = read_string_variable(file, "filename", path);

        if (static_cast<Eigen::Index>(arrays.filenames.size()) != arrays.features.rows()) {
            throw SourceReadError("Variable 'filename' has " + std::to_string(arrays.filenames.size()) +
                                  " entries but 'features' has " +
                                  std::to_string(arrays.features.rows()) + " rows in " + path);
        }
        return arrays;
    }

    RawTable read_netcdf(const std::string& path, const std::optional<std::string>& annotation_path) {
        // File handles are released when read_gridded_arrays returns
        GriddedArrays arrays = read_gridded_arrays(path);

        const auto annotations = parse_classification_annotations(
            annotation_path.value_or(default_netcdf_annotation_path(path)));

        const size_t n = arrays.filenames.size();
        std::vector<std::string> names(n);
        std::vector<std::string> tokens(n);
        for (size_t i = 0; i < n; ++i) {
            names[i] = std::filesystem::path(arrays.filenames[i]).stem().string();
            auto it = annotations.find(names[i]);
            if (it == annotations.end()) {
                throw MissingLabelError(names[i]);
            }
            tokens[i] = it->second;
        }

        std::vector<size_t> order(n);
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(),
                         [&names](size_t a, size_t b) { return names[a] < names[b]; });

        RawTable table;
        table.features.resize(arrays.features.rows(), arrays.features.cols());
        table.names.reserve(n);
        table.label_tokens.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            table.names.push_back(names[order[i]]);
            table.label_tokens.push_back(tokens[order[i]]);
            table.features.row(static_cast<Eigen::Index>(i)) =
                arrays.features.row(static_cast<Eigen::Index>(order[i]));
        }
        for (Eigen::Index j = 0; j < table.features.cols(); ++j) {
            table.attribute_names.push_back("representation_" + std::to_string(j + 1));
        }

        Logger::instance().log_source_read("netcdf", path, table.size());
        return table;
    }

} // namespace io
} // namespace emodata
