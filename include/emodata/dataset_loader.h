#pragma once

#include "dataset.h"
#include "normalizer.h"
#include <optional>
#include <string>

namespace emodata {

    enum class SourceFormat {
        AUTO,
        ARFF,       // text ARFF
        PACKED,     // zlib-packed relation (.bin)
        NETCDF,     // gridded-array representation file
        RAW         // list of audio files
    };

    struct LoaderOptions {
        std::optional<std::string> corpus;      // overrides the relation name
        NormalizationMethod normalization = NormalizationMethod::SPEAKER;
        bool binarize = false;
        bool labels_from_names = false;
        std::optional<std::string> annotation_path;
    };

    /**
     * @brief Utterance-level dataset from an ARFF or packed table
     *
     * The corpus comes from options.corpus, else from the relation name.
     * Feature vectors are normalized with options.normalization.
     */
    Dataset load_utterance_dataset(const std::string& path, const LoaderOptions& options = LoaderOptions());

    /**
     * @brief Frame-level dataset from an ARFF or packed frame table
     *
     * Frames are normalized with the speaker of their instance, then
     * grouped into one sequence per name. Speaker, group, gender and
     * label views are computed on the aggregated instances.
     */
    Dataset load_frame_dataset(const std::string& path, const LoaderOptions& options = LoaderOptions());

    /**
     * @brief Dataset from a netCDF-4 representation file, sorted by name
     */
    Dataset load_netcdf_dataset(const std::string& path, const std::string& corpus,
                                const LoaderOptions& options = LoaderOptions());

    /**
     * @brief Raw waveform dataset from an audio file list; never normalized
     */
    Dataset load_raw_dataset(const std::string& list_path, const std::string& corpus,
                             const LoaderOptions& options = LoaderOptions());

    /**
     * @brief Dispatch to the loader for a format and granularity
     *
     * AUTO resolves through detect_source_format. netCDF and raw sources
     * require options.corpus.
     * @throws ConfigurationError for unsupported combinations
     */
    Dataset load_dataset(const std::string& path, SourceFormat format, Granularity granularity,
                         const LoaderOptions& options = LoaderOptions());

    /**
     * @brief Guess a format from the file extension
     *
     * .bin -> PACKED, .nc/.h5/.hdf5 -> NETCDF, .txt/.lst/.list -> RAW,
     * anything else -> ARFF.
     */
    SourceFormat detect_source_format(const std::string& path);

    SourceFormat parse_source_format(const std::string& name);
    std::string source_format_to_string(SourceFormat format);
    Granularity parse_granularity(const std::string& name);

} // namespace emodata
