#pragma once

#include <Eigen/Core>
#include <string>
#include <vector>

namespace emodata {

    /**
     * @brief Ragged per-instance sequences built from a frame table
     */
    struct SequenceBatch {
        std::vector<Eigen::MatrixXd> sequences;
        std::vector<int> labels;
        std::vector<std::string> names;
        std::vector<int> speaker_indices;
        std::vector<size_t> lengths;
    };

    /**
     * @brief Group frame rows into one sequence per unique name
     *
     * Names keep their first-occurrence order. Rows of a name need not be
     * contiguous; they are gathered in source order. Label and speaker of
     * each sequence come from its first row.
     * @throws InvalidParameterError when the per-frame arrays differ in length
     */
    SequenceBatch aggregate_frames(const Eigen::MatrixXd& frames,
                                   const std::vector<int>& frame_labels,
                                   const std::vector<std::string>& frame_names,
                                   const std::vector<int>& frame_speakers);

    /**
     * @brief Append zero rows so each length is the next multiple of `multiple`
     *
     * Sequences whose length is already a multiple are left unchanged.
     * @throws InvalidParameterError for multiple < 1 or an empty sequence
     */
    void pad_sequences(std::vector<Eigen::MatrixXd>& sequences, int multiple = 32);

    size_t padded_length(size_t length, int multiple);

} // namespace emodata
