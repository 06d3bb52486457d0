#pragma once

#include <string>
#include <vector>
#include <optional>
#include <Eigen/Core>

namespace emodata {

    /**
     * @brief Which member of a RawTable carries the instances
     */
    enum class TableLayout {
        VECTORS,    // features, one row per name
        WAVEFORMS   // waveforms, one n_samples x 1 matrix per name
    };

    /**
     * @brief Reader output shared by every source encoding
     *
     * The reader sets `layout`; only the member it names is populated,
     * which holds even when the table has no rows.
     */
    struct RawTable {
        TableLayout layout = TableLayout::VECTORS;
        std::vector<std::string> names;
        Eigen::MatrixXd features;
        std::vector<Eigen::MatrixXd> waveforms;
        std::vector<std::string> label_tokens;
        std::vector<std::string> attribute_names;
        std::optional<std::string> corpus_id;

        size_t size() const { return names.size(); }
        bool has_waveforms() const { return layout == TableLayout::WAVEFORMS; }
    };

} // namespace emodata
