#include "emodata/sequence_aggregator.h"
#include "emodata/error_handler.h"
#include <unordered_map>

namespace emodata {

    SequenceBatch aggregate_frames(const Eigen::MatrixXd& frames,
                                   const std::vector<int>& frame_labels,
                                   const std::vector<std::string>& frame_names,
                                   const std::vector<int>& frame_speakers) {
        const size_t k = frame_names.size();
        if (static_cast<size_t>(frames.rows()) != k || frame_labels.size() != k ||
            frame_speakers.size() != k) {
            throw InvalidParameterError("Frame table arrays differ in length");
        }

        std::unordered_map<std::string, size_t> group_of;
        std::vector<std::vector<Eigen::Index>> rows;

        SequenceBatch batch;
        for (size_t i = 0; i < k; ++i) {
            auto inserted = group_of.emplace(frame_names[i], batch.names.size());
            if (inserted.second) {
                batch.names.push_back(frame_names[i]);
                batch.labels.push_back(frame_labels[i]);
                batch.speaker_indices.push_back(frame_speakers[i]);
                rows.emplace_back();
            }
            rows[inserted.first->second].push_back(static_cast<Eigen::Index>(i));
        }

        batch.sequences.reserve(rows.size());
        batch.lengths.reserve(rows.size());
        for (const auto& group : rows) {
            Eigen::MatrixXd sequence(static_cast<Eigen::Index>(group.size()), frames.cols());
            for (size_t r = 0; r < group.size(); ++r) {
                sequence.row(static_cast<Eigen::Index>(r)) = frames.row(group[r]);
            }
            batch.lengths.push_back(group.size());
            batch.sequences.push_back(std::move(sequence));
        }
        return batch;
    }

    size_t padded_length(size_t length, int multiple) {
        if (multiple < 1) {
            throw InvalidParameterError("Padding multiple must be at least 1, got " +
                                        std::to_string(multiple));
        }
        const size_t m = static_cast<size_t>(multiple);
        return ((length + m - 1) / m) * m;
    }

    void pad_sequences(std::vector<Eigen::MatrixXd>& sequences, int multiple) {
        if (multiple < 1) {
            throw InvalidParameterError("Padding multiple must be at least 1, got " +
                                        std::to_string(multiple));
        }
        for (const auto& sequence : sequences) {
            if (sequence.rows() == 0) {
                throw InvalidParameterError("Cannot pad a zero-length sequence");
            }
        }

        for (auto& sequence : sequences) {
            const Eigen::Index length = sequence.rows();
            const Eigen::Index target = static_cast<Eigen::Index>(
                padded_length(static_cast<size_t>(length), multiple));
            if (target == length) {
                continue;
            }
            Eigen::MatrixXd padded = Eigen::MatrixXd::Zero(target, sequence.cols());
            padded.topRows(length) = sequence;
            sequence = std::move(padded);
        }
    }

} // namespace emodata
