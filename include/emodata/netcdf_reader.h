#pragma once

#include "raw_table.h"
#include <hdf5.h>
#include <optional>
#include <string>
#include <vector>

namespace emodata {
namespace io {

    /**
     * @brief Read a gridded-array (netCDF-4) representation file
     *
     * netCDF-4 files are HDF5 containers; the `features` variable
     * (instances x generated, float or double) and the parallel
     * `filename` variable (strings or a char matrix) are read through the
     * HDF5 C API. The file is closed before labels are joined. Names are
     * file stems; labels come from the classification annotation CSV
     * (default: `<dir of file>/../labels.csv`). Rows are then re-sorted
     * lexicographically by name.
     *
     * @throws SourceReadError for missing, unreadable or malformed files
     * @throws MissingLabelError when a name has no annotation
     */
    RawTable read_netcdf(const std::string& path,
                         const std::optional<std::string>& annotation_path = std::nullopt);

    std::string default_netcdf_annotation_path(const std::string& path);

    /**
     * @brief Raw contents of a representation file before label joining
     */
    struct GriddedArrays {
        std::vector<std::string> filenames;
        Eigen::MatrixXd features;
    };

    GriddedArrays read_gridded_arrays(const std::string& path);

    namespace hdf5_utils {

        /**
         * @brief Owning wrapper for an HDF5 identifier
         *
         * Closes the id with the matching H5*close function on destruction.
         */
        class Handle {
        public:
            using Closer = herr_t (*)(hid_t);

            Handle() = default;
            Handle(hid_t id, Closer closer) : id_(id), closer_(closer) {}
            ~Handle() { reset(); }

            Handle(const Handle&) = delete;
            Handle& operator=(const Handle&) = delete;
            Handle(Handle&& other) noexcept : id_(other.id_), closer_(other.closer_) {
                other.id_ = H5I_INVALID_HID;
            }
            Handle& operator=(Handle&& other) noexcept {
                if (this != &other) {
                    reset();
                    id_ = other.id_;
                    closer_ = other.closer_;
                    other.id_ = H5I_INVALID_HID;
                }
                return *this;
            }

            hid_t get() const { return id_; }
            bool valid() const { return id_ >= 0; }
            void reset() {
                if (id_ >= 0 && closer_) {
                    closer_(id_);
                }
                id_ = H5I_INVALID_HID;
            }

        private:
            hid_t id_ = H5I_INVALID_HID;
            Closer closer_ = nullptr;
        };

        /**
         * @brief Silences the HDF5 error stack printer for its lifetime
         */
        class ScopedErrorSilencer {
        public:
            ScopedErrorSilencer();
            ~ScopedErrorSilencer();

            ScopedErrorSilencer(const ScopedErrorSilencer&) = delete;
            ScopedErrorSilencer& operator=(const ScopedErrorSilencer&) = delete;

        private:
            H5E_auto2_t old_func_ = nullptr;
            void* old_data_ = nullptr;
        };

    } // namespace hdf5_utils

} // namespace io
} // namespace emodata
