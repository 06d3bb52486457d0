#pragma once

#include "raw_table.h"
#include <optional>
#include <string>
#include <vector>

namespace emodata {
namespace io {

    /**
     * @brief Read a newline-delimited list of audio file paths
     *
     * Each file is decoded with WavLoader, down-mixed to mono and stored
     * as an (n_samples, 1) waveform. Instance names are file stems, and
     * labels are joined by name from the classification annotation CSV
     * (default: labels.txt beside the list). Blank lines are ignored.
     * Relative entries are resolved against the list's directory when
     * they do not exist relative to the working directory.
     *
     * @throws SourceReadError for unreadable lists or audio files
     * @throws MissingLabelError when a name has no annotation
     */
    RawTable read_raw_audio(const std::string& list_path,
                            const std::optional<std::string>& annotation_path = std::nullopt);

    /**
     * @brief Parse the file list only
     */
    std::vector<std::string> read_file_list(const std::string& list_path);

    std::string default_raw_annotation_path(const std::string& list_path);

} // namespace io
} // namespace emodata
