#pragma once

#include "corpus_registry.h"
#include "raw_table.h"
#include <Eigen/Core>
#include <map>
#include <string>
#include <vector>

namespace emodata {

    enum class Granularity {
        UTTERANCE,  // one feature vector per instance
        FRAME,      // variable-length sequence of frame vectors per instance
        RAW         // raw waveform per instance
    };

    /**
     * @brief Uniform in-memory dataset
     *
     * All per-instance containers have n_instances entries. `features` is
     * populated for UTTERANCE granularity, `sequences` for FRAME and RAW.
     * A Dataset is immutable after it is built except for pad_sequences().
     */
    struct Dataset {
        std::string corpus;
        Granularity granularity = Granularity::UTTERANCE;
        std::vector<std::string> names;

        Eigen::MatrixXd features;
        std::vector<Eigen::MatrixXd> sequences;

        std::vector<int> y;
        std::vector<std::string> classes;
        std::vector<std::string> speakers;
        std::vector<int> speaker_indices;
        std::vector<int> speaker_group_indices;

        // "all", plus "m" and "f" when the corpus has gender lists
        std::map<std::string, std::vector<int>> gender_indices;
        // "all" -> y; with binarization "0".."n-1", "arousal", "valence"
        std::map<std::string, Eigen::VectorXd> labels;

        std::vector<std::string> feature_names;

        size_t n_instances() const { return names.size(); }
        size_t n_classes() const { return classes.size(); }
        size_t n_features() const { return feature_names.size(); }
        size_t n_speakers() const { return speakers.size(); }

        /**
         * @brief Zero-pad every sequence to the next multiple of `multiple` rows
         * @throws InvalidParameterError for non-sequence datasets, multiple < 1
         *         or empty sequences
         */
        void pad_sequences(int multiple = 32);
    };

    struct AssembleOptions {
        bool binarize = false;
        bool labels_from_names = false;
    };

    /**
     * @brief Class vocabulary and integer labels for a set of label tokens
     */
    struct Vocabulary {
        std::vector<std::string> classes;
        std::vector<int> y;
    };

    /**
     * @brief Resolve label tokens through the corpus label map
     * @throws UnknownLabelError for tokens that are not label_map keys
     */
    Vocabulary build_vocabulary(const std::vector<std::string>& label_tokens,
                                const CorpusMetadata& corpus);

    /**
     * @brief Speaker index for each name via the corpus speaker rule
     * @throws UnknownSpeakerError when the extracted id is not a known speaker
     */
    std::vector<int> resolve_speaker_indices(const std::vector<std::string>& names,
                                             const CorpusMetadata& corpus);

    /**
     * @brief Collapse speaker indices through the corpus group table, else identity
     */
    std::vector<int> resolve_speaker_groups(const std::vector<int>& speaker_indices,
                                            const CorpusMetadata& corpus);

    /**
     * @brief Instance indices under "all", plus "m" and "f" when the corpus lists both genders
     */
    std::map<std::string, std::vector<int>> partition_by_gender(const std::vector<int>& speaker_indices,
                                                                const CorpusMetadata& corpus);

    /**
     * @brief Build the label views
     *
     * "all" is always present. With `binarize`, one one-vs-rest view per
     * class index (keyed "0", "1", ...) and, when the corpus has both
     * group tables, "arousal" and "valence" views. Classes in neither
     * positive group map to 0.
     */
    std::map<std::string, Eigen::VectorXd> build_label_views(const std::vector<int>& y,
                                                             const std::vector<std::string>& classes,
                                                             const CorpusMetadata& corpus,
                                                             bool binarize);

    /**
     * @brief Label tokens for a table, either its label column or the
     *        corpus label rule applied to each name
     */
    std::vector<std::string> resolve_label_tokens(const RawTable& table,
                                                  const CorpusMetadata& corpus,
                                                  bool labels_from_names);

    /**
     * @brief Build a Dataset from a RawTable
     *
     * Fixed-width tables produce UTTERANCE datasets, waveform tables RAW
     * datasets. Features are not normalized here.
     */
    Dataset assemble(const RawTable& table, const CorpusMetadata& corpus,
                     const AssembleOptions& options = AssembleOptions());

    // Diagnostics
    std::map<std::string, size_t> class_counts(const Dataset& dataset);
    std::map<std::string, size_t> speaker_counts(const Dataset& dataset);
    void log_dataset_summary(const Dataset& dataset);

    std::string granularity_to_string(Granularity granularity);

} // namespace emodata
