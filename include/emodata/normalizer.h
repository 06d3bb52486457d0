#pragma once

#include <Eigen/Core>
#include <string>
#include <vector>

namespace emodata {

    enum class NormalizationMethod {
        ALL,        // one scaler fitted on every instance
        SPEAKER,    // one scaler per speaker subset
        NONE
    };

    /**
     * @brief Per-column standardization to zero mean and unit variance
     *
     * Uses the population variance. Columns with zero variance get a
     * scale of 1, so a single-row fit maps to zeros.
     */
    class StandardScaler {
    public:
        StandardScaler() = default;

        void fit(const Eigen::MatrixXd& x);
        Eigen::MatrixXd transform(const Eigen::MatrixXd& x) const;
        Eigen::MatrixXd fit_transform(const Eigen::MatrixXd& x);

        bool is_fitted() const { return fitted_; }
        const Eigen::RowVectorXd& mean() const { return mean_; }
        const Eigen::RowVectorXd& scale() const { return scale_; }

    private:
        Eigen::RowVectorXd mean_;
        Eigen::RowVectorXd scale_;
        bool fitted_ = false;
    };

    /**
     * @brief Standardize feature rows globally or per speaker
     * @param speaker_indices One entry per row of x, each in [0, n_speakers)
     *
     * Speakers with no rows are skipped.
     * @throws InvalidParameterError when speaker_indices does not match x
     */
    Eigen::MatrixXd normalize(const Eigen::MatrixXd& x,
                              const std::vector<int>& speaker_indices,
                              size_t n_speakers,
                              NormalizationMethod method = NormalizationMethod::SPEAKER);

    /**
     * @brief Parse "all", "speaker" or "none"
     * @throws InvalidParameterError for other names
     */
    NormalizationMethod parse_normalization_method(const std::string& name);
    std::string normalization_method_to_string(NormalizationMethod method);

} // namespace emodata
