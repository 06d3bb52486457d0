#include "emodata/dataset_loader.h"
#include "emodata/corpus_registry.h"
#include "emodata/error_handler.h"
#include "emodata/logger.h"
#include "emodata/netcdf_reader.h"
#include "emodata/packed_table.h"
#include "emodata/raw_audio_reader.h"
#include "emodata/sequence_aggregator.h"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace emodata {

    namespace {
        std::string lowercase(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        const CorpusMetadata& resolve_table_corpus(const RawTable& table, const LoaderOptions& options,
                                                   const std::string& path) {
            if (options.corpus) {
                return CorpusRegistry::instance().resolve(*options.corpus);
            }
            if (!table.corpus_id) {
                throw ConfigurationError("No corpus given and " + path + " declares no relation name");
            }
            return CorpusRegistry::instance().resolve(*table.corpus_id);
        }

        AssembleOptions assemble_options(const LoaderOptions& options) {
            AssembleOptions result;
            result.binarize = options.binarize;
            result.labels_from_names = options.labels_from_names;
            return result;
        }
    }

    Dataset load_utterance_dataset(const std::string& path, const LoaderOptions& options) {
        EMODATA_LOG_TIMER(LogLevel::DEBUG, "Loading utterance dataset " + path);

        RawTable table = io::read_tabular(path);
        const CorpusMetadata& corpus = resolve_table_corpus(table, options, path);

        Dataset dataset = assemble(table, corpus, assemble_options(options));
        dataset.features = normalize(dataset.features, dataset.speaker_indices,
                                     dataset.n_speakers(), options.normalization);

        EMODATA_LOG_DEBUG("Normalise method: " + normalization_method_to_string(options.normalization));
        log_dataset_summary(dataset);
        return dataset;
    }

    Dataset load_frame_dataset(const std::string& path, const LoaderOptions& options) {
        EMODATA_LOG_TIMER(LogLevel::DEBUG, "Loading frame dataset " + path);

        RawTable table = io::read_tabular(path);
        const CorpusMetadata& corpus = resolve_table_corpus(table, options, path);

        // Frame-level labels and speakers, before grouping
        Vocabulary vocabulary = build_vocabulary(
            resolve_label_tokens(table, corpus, options.labels_from_names), corpus);
        std::vector<int> frame_speakers = resolve_speaker_indices(table.names, corpus);
        Eigen::MatrixXd frames = normalize(table.features, frame_speakers,
                                           corpus.speakers.size(), options.normalization);

        SequenceBatch batch = aggregate_frames(frames, vocabulary.y, table.names, frame_speakers);

        Dataset dataset;
        dataset.corpus = corpus.id;
        dataset.granularity = Granularity::FRAME;
        dataset.names = std::move(batch.names);
        dataset.sequences = std::move(batch.sequences);
        dataset.y = std::move(batch.labels);
        dataset.classes = std::move(vocabulary.classes);
        dataset.speakers = corpus.speakers;
        dataset.speaker_indices = std::move(batch.speaker_indices);
        dataset.speaker_group_indices = resolve_speaker_groups(dataset.speaker_indices, corpus);
        dataset.gender_indices = partition_by_gender(dataset.speaker_indices, corpus);
        dataset.labels = build_label_views(dataset.y, dataset.classes, corpus, options.binarize);
        dataset.feature_names = table.attribute_names;

        log_dataset_summary(dataset);
        return dataset;
    }

    Dataset load_netcdf_dataset(const std::string& path, const std::string& corpus_id,
                                const LoaderOptions& options) {
        EMODATA_LOG_TIMER(LogLevel::DEBUG, "Loading netCDF dataset " + path);

        const CorpusMetadata& corpus = CorpusRegistry::instance().resolve(corpus_id);
        RawTable table = io::read_netcdf(path, options.annotation_path);

        Dataset dataset = assemble(table, corpus, assemble_options(options));
        dataset.features = normalize(dataset.features, dataset.speaker_indices,
                                     dataset.n_speakers(), options.normalization);

        log_dataset_summary(dataset);
        return dataset;
    }

    Dataset load_raw_dataset(const std::string& list_path, const std::string& corpus_id,
                             const LoaderOptions& options) {
        EMODATA_LOG_TIMER(LogLevel::DEBUG, "Loading raw audio dataset " + list_path);

        const CorpusMetadata& corpus = CorpusRegistry::instance().resolve(corpus_id);
        RawTable table = io::read_raw_audio(list_path, options.annotation_path);

        Dataset dataset = assemble(table, corpus, assemble_options(options));
        log_dataset_summary(dataset);
        return dataset;
    }

    Dataset load_dataset(const std::string& path, SourceFormat format, Granularity granularity,
                         const LoaderOptions& options) {
        if (format == SourceFormat::AUTO) {
            format = detect_source_format(path);
        }

        switch (format) {
            case SourceFormat::ARFF:
            case SourceFormat::PACKED:
                if (granularity == Granularity::FRAME) {
                    return load_frame_dataset(path, options);
                }
                if (granularity == Granularity::RAW) {
                    throw ConfigurationError("Tabular sources cannot produce raw-audio datasets");
                }
                return load_utterance_dataset(path, options);

            case SourceFormat::NETCDF:
                if (!options.corpus) {
                    throw ConfigurationError("netCDF sources require a corpus");
                }
                if (granularity == Granularity::FRAME) {
                    throw ConfigurationError("netCDF sources only hold utterance-level features");
                }
                return load_netcdf_dataset(path, *options.corpus, options);

            case SourceFormat::RAW:
                if (!options.corpus) {
                    throw ConfigurationError("Raw audio sources require a corpus");
                }
                if (granularity == Granularity::FRAME) {
                    throw ConfigurationError("Raw audio sources cannot produce frame-level datasets");
                }
                return load_raw_dataset(path, *options.corpus, options);

            default:
                throw ConfigurationError("Unresolved source format for " + path);
        }
    }

    SourceFormat detect_source_format(const std::string& path) {
        std::string extension = lowercase(std::filesystem::path(path).extension().string());
        if (extension == ".bin") return SourceFormat::PACKED;
        if (extension == ".nc" || extension == ".h5" || extension == ".hdf5") return SourceFormat::NETCDF;
        if (extension == ".txt" || extension == ".lst" || extension == ".list") return SourceFormat::RAW;
        return SourceFormat::ARFF;
    }

    SourceFormat parse_source_format(const std::string& name) {
        std::string lower = lowercase(name);
        if (lower == "auto") return SourceFormat::AUTO;
        if (lower == "arff") return SourceFormat::ARFF;
        if (lower == "packed" || lower == "bin") return SourceFormat::PACKED;
        if (lower == "netcdf" || lower == "nc") return SourceFormat::NETCDF;
        if (lower == "raw") return SourceFormat::RAW;
        throw InvalidParameterError("Unknown source format '" + name +
                                    "' (expected auto, arff, packed, netcdf or raw)");
    }

    std::string source_format_to_string(SourceFormat format) {
        switch (format) {
            case SourceFormat::AUTO: return "auto";
            case SourceFormat::ARFF: return "arff";
            case SourceFormat::PACKED: return "packed";
            case SourceFormat::NETCDF: return "netcdf";
            case SourceFormat::RAW: return "raw";
            default: return "unknown";
        }
    }

    Granularity parse_granularity(const std::string& name) {
        std::string lower = lowercase(name);
        if (lower == "utterance") return Granularity::UTTERANCE;
        if (lower == "frame") return Granularity::FRAME;
        if (lower == "raw") return Granularity::RAW;
        throw InvalidParameterError("Unknown granularity '" + name +
                                    "' (expected utterance, frame or raw)");
    }

} // namespace emodata
