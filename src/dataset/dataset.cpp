#include "emodata/dataset.h"
#include "emodata/error_handler.h"
#include "emodata/logger.h"
#include "emodata/sequence_aggregator.h"
#include <algorithm>
#include <sstream>
#include <cstdio>

namespace emodata {

    void Dataset::pad_sequences(int multiple) {
        if (granularity == Granularity::UTTERANCE) {
            throw InvalidParameterError("Cannot pad an utterance-level dataset");
        }
        emodata::pad_sequences(sequences, multiple);
    }

    Vocabulary build_vocabulary(const std::vector<std::string>& label_tokens,
                                const CorpusMetadata& corpus) {
        Vocabulary vocabulary;
        vocabulary.classes = corpus.classes();
        vocabulary.y.reserve(label_tokens.size());

        for (const auto& token : label_tokens) {
            const std::string* label = corpus.find_label(token);
            if (!label) {
                throw UnknownLabelError("Label token '" + token +
                                        "' is not defined for corpus " + corpus.id);
            }
            auto it = std::find(vocabulary.classes.begin(), vocabulary.classes.end(), *label);
            vocabulary.y.push_back(static_cast<int>(it - vocabulary.classes.begin()));
        }
        return vocabulary;
    }

    std::vector<int> resolve_speaker_indices(const std::vector<std::string>& names,
                                             const CorpusMetadata& corpus) {
        std::vector<int> indices;
        indices.reserve(names.size());

        for (const auto& name : names) {
            std::string speaker = corpus.speaker_id(name);
            auto it = std::find(corpus.speakers.begin(), corpus.speakers.end(), speaker);
            if (it == corpus.speakers.end()) {
                throw UnknownSpeakerError("Speaker '" + speaker + "' of instance '" + name +
                                          "' is not a known speaker of corpus " + corpus.id);
            }
            indices.push_back(static_cast<int>(it - corpus.speakers.begin()));
        }
        return indices;
    }

    std::vector<int> resolve_speaker_groups(const std::vector<int>& speaker_indices,
                                            const CorpusMetadata& corpus) {
        if (corpus.speaker_groups.empty()) {
            return speaker_indices;
        }

        std::vector<int> groups;
        groups.reserve(speaker_indices.size());
        for (int index : speaker_indices) {
            if (index < 0 || static_cast<size_t>(index) >= corpus.speaker_groups.size()) {
                throw ConfigurationError("Speaker index " + std::to_string(index) +
                                         " has no group in corpus " + corpus.id);
            }
            groups.push_back(corpus.speaker_groups[static_cast<size_t>(index)]);
        }
        return groups;
    }

    std::map<std::string, std::vector<int>> partition_by_gender(const std::vector<int>& speaker_indices,
                                                                const CorpusMetadata& corpus) {
        std::map<std::string, std::vector<int>> partition;
        auto& all = partition["all"];
        all.reserve(speaker_indices.size());
        for (size_t i = 0; i < speaker_indices.size(); ++i) {
            all.push_back(static_cast<int>(i));
        }

        if (!corpus.has_gender_split()) {
            return partition;
        }

        // speakers is male ++ female, so the index alone decides the gender
        const size_t n_male = corpus.male_speakers->size();
        auto& male = partition["m"];
        auto& female = partition["f"];
        for (size_t i = 0; i < speaker_indices.size(); ++i) {
            const int index = speaker_indices[i];
            if (index < 0 || static_cast<size_t>(index) >= corpus.speakers.size()) {
                throw InvalidParameterError("Speaker index " + std::to_string(index) +
                                            " is out of range for corpus " + corpus.id);
            }
            if (static_cast<size_t>(index) < n_male) {
                male.push_back(static_cast<int>(i));
            } else {
                female.push_back(static_cast<int>(i));
            }
        }
        return partition;
    }

    std::map<std::string, Eigen::VectorXd> build_label_views(const std::vector<int>& y,
                                                             const std::vector<std::string>& classes,
                                                             const CorpusMetadata& corpus,
                                                             bool binarize) {
        const Eigen::Index n = static_cast<Eigen::Index>(y.size());
        std::map<std::string, Eigen::VectorXd> views;

        Eigen::VectorXd all(n);
        for (Eigen::Index i = 0; i < n; ++i) {
            all(i) = y[static_cast<size_t>(i)];
        }
        views["all"] = all;

        if (!binarize) {
            return views;
        }

        for (size_t c = 0; c < classes.size(); ++c) {
            Eigen::VectorXd one_vs_rest(n);
            for (Eigen::Index i = 0; i < n; ++i) {
                one_vs_rest(i) = y[static_cast<size_t>(i)] == static_cast<int>(c) ? 1.0 : 0.0;
            }
            views[std::to_string(c)] = one_vs_rest;
        }

        if (corpus.has_affect_groups()) {
            EMODATA_LOG_DEBUG("Binarising arousal and valence for corpus " + corpus.id);
            Eigen::VectorXd arousal(n);
            Eigen::VectorXd valence(n);
            for (Eigen::Index i = 0; i < n; ++i) {
                const std::string& label = classes[static_cast<size_t>(y[static_cast<size_t>(i)])];
                arousal(i) = corpus.arousal_groups->is_positive(label) ? 1.0 : 0.0;
                valence(i) = corpus.valence_groups->is_positive(label) ? 1.0 : 0.0;
            }
            views["arousal"] = arousal;
            views["valence"] = valence;
        }
        return views;
    }

    std::vector<std::string> resolve_label_tokens(const RawTable& table,
                                                  const CorpusMetadata& corpus,
                                                  bool labels_from_names) {
        if (!labels_from_names) {
            if (table.label_tokens.size() != table.names.size()) {
                throw InvalidParameterError("Table has " + std::to_string(table.names.size()) +
                                            " names but " + std::to_string(table.label_tokens.size()) +
                                            " label tokens");
            }
            return table.label_tokens;
        }

        std::vector<std::string> tokens;
        tokens.reserve(table.names.size());
        for (const auto& name : table.names) {
            tokens.push_back(corpus.label_code(name));
        }
        return tokens;
    }

    Dataset assemble(const RawTable& table, const CorpusMetadata& corpus, const AssembleOptions& options) {
        Dataset dataset;
        dataset.corpus = corpus.id;
        dataset.names = table.names;
        dataset.feature_names = table.attribute_names;

        if (table.has_waveforms()) {
            if (table.waveforms.size() != table.names.size()) {
                throw InvalidParameterError("Waveform count does not match name count");
            }
            dataset.granularity = Granularity::RAW;
            dataset.sequences = table.waveforms;
        } else {
            if (static_cast<size_t>(table.features.rows()) != table.names.size()) {
                throw InvalidParameterError("Feature row count does not match name count");
            }
            dataset.granularity = Granularity::UTTERANCE;
            dataset.features = table.features;
        }

        Vocabulary vocabulary = build_vocabulary(
            resolve_label_tokens(table, corpus, options.labels_from_names), corpus);
        dataset.classes = std::move(vocabulary.classes);
        dataset.y = std::move(vocabulary.y);

        dataset.speakers = corpus.speakers;
        dataset.speaker_indices = resolve_speaker_indices(dataset.names, corpus);
        dataset.speaker_group_indices = resolve_speaker_groups(dataset.speaker_indices, corpus);
        dataset.gender_indices = partition_by_gender(dataset.speaker_indices, corpus);
        dataset.labels = build_label_views(dataset.y, dataset.classes, corpus, options.binarize);

        return dataset;
    }

    std::map<std::string, size_t> class_counts(const Dataset& dataset) {
        std::map<std::string, size_t> counts;
        for (const auto& label : dataset.classes) {
            counts[label] = 0;
        }
        for (int index : dataset.y) {
            counts[dataset.classes[static_cast<size_t>(index)]]++;
        }
        return counts;
    }

    std::map<std::string, size_t> speaker_counts(const Dataset& dataset) {
        std::map<std::string, size_t> counts;
        for (int index : dataset.speaker_indices) {
            counts[dataset.speakers[static_cast<size_t>(index)]]++;
        }
        return counts;
    }

    void log_dataset_summary(const Dataset& dataset) {
        Logger& logger = Logger::instance();
        if (!logger.is_enabled(LogLevel::INFO)) {
            return;
        }

        std::ostringstream classes;
        for (size_t i = 0; i < dataset.classes.size(); ++i) {
            if (i > 0) classes << ", ";
            classes << dataset.classes[i];
        }

        logger.info("Corpus: " + dataset.corpus);
        logger.info_f("Classes: %zu (%s)", dataset.n_classes(), classes.str().c_str());
        logger.info_f("%zu speakers", dataset.n_speakers());

        switch (dataset.granularity) {
            case Granularity::UTTERANCE:
                logger.info_f("%zu instances x %zu features", dataset.n_instances(), dataset.n_features());
                break;
            case Granularity::FRAME:
                logger.info_f("%zu sequences of vectors of size %zu", dataset.n_instances(), dataset.n_features());
                break;
            case Granularity::RAW:
                logger.info_f("%zu audio files", dataset.n_instances());
                break;
        }

        std::ostringstream speaker_row;
        std::ostringstream count_row;
        char cell[32];
        for (const auto& [speaker, count] : speaker_counts(dataset)) {
            std::snprintf(cell, sizeof(cell), "%-5s ", speaker.c_str());
            speaker_row << cell;
            std::snprintf(cell, sizeof(cell), "%-5zu ", count);
            count_row << cell;
        }
        logger.info("Speaker counts:");
        logger.info(speaker_row.str());
        logger.info(count_row.str());
    }

    std::string granularity_to_string(Granularity granularity) {
        switch (granularity) {
            case Granularity::UTTERANCE: return "utterance";
            case Granularity::FRAME: return "frame";
            case Granularity::RAW: return "raw";
            default: return "unknown";
        }
    }

} // namespace emodata
