#include "emodata/normalizer.h"
#include "emodata/error_handler.h"
#include <algorithm>
#include <cctype>

namespace emodata {

    void StandardScaler::fit(const Eigen::MatrixXd& x) {
        if (x.rows() == 0) {
            throw InvalidParameterError("Cannot fit a scaler on zero rows");
        }

        mean_ = x.colwise().mean();
        Eigen::MatrixXd centered = x.rowwise() - mean_;
        Eigen::RowVectorXd variance =
            (centered.array().square().colwise().sum() / static_cast<double>(x.rows())).matrix();

        scale_ = variance.array().sqrt().matrix();
        for (Eigen::Index j = 0; j < scale_.size(); ++j) {
            if (scale_(j) == 0.0) {
                scale_(j) = 1.0;
            }
        }
        fitted_ = true;
    }

    Eigen::MatrixXd StandardScaler::transform(const Eigen::MatrixXd& x) const {
        if (!fitted_) {
            throw InvalidParameterError("StandardScaler::transform called before fit");
        }
        if (x.cols() != mean_.size()) {
            throw InvalidParameterError("Scaler fitted on " + std::to_string(mean_.size()) +
                                        " columns, got " + std::to_string(x.cols()));
        }
        return ((x.rowwise() - mean_).array().rowwise() / scale_.array()).matrix();
    }

    Eigen::MatrixXd StandardScaler::fit_transform(const Eigen::MatrixXd& x) {
        fit(x);
        return transform(x);
    }

    Eigen::MatrixXd normalize(const Eigen::MatrixXd& x,
                              const std::vector<int>& speaker_indices,
                              size_t n_speakers,
                              NormalizationMethod method) {
        if (method == NormalizationMethod::NONE || x.rows() == 0) {
            return x;
        }

        if (method == NormalizationMethod::ALL) {
            StandardScaler scaler;
            return scaler.fit_transform(x);
        }

        if (speaker_indices.size() != static_cast<size_t>(x.rows())) {
            throw InvalidParameterError("Got " + std::to_string(speaker_indices.size()) +
                                        " speaker indices for " + std::to_string(x.rows()) + " rows");
        }

        std::vector<std::vector<Eigen::Index>> rows_by_speaker(n_speakers);
        for (size_t i = 0; i < speaker_indices.size(); ++i) {
            int sp = speaker_indices[i];
            if (sp < 0 || static_cast<size_t>(sp) >= n_speakers) {
                throw InvalidParameterError("Speaker index " + std::to_string(sp) + " out of range");
            }
            rows_by_speaker[static_cast<size_t>(sp)].push_back(static_cast<Eigen::Index>(i));
        }

        Eigen::MatrixXd result = x;
        for (size_t sp = 0; sp < n_speakers; ++sp) {
            const auto& rows = rows_by_speaker[sp];
            if (rows.empty()) {
                continue;
            }

            Eigen::MatrixXd subset(static_cast<Eigen::Index>(rows.size()), x.cols());
            for (size_t k = 0; k < rows.size(); ++k) {
                subset.row(static_cast<Eigen::Index>(k)) = x.row(rows[k]);
            }

            StandardScaler scaler;
            Eigen::MatrixXd scaled = scaler.fit_transform(subset);
            for (size_t k = 0; k < rows.size(); ++k) {
                result.row(rows[k]) = scaled.row(static_cast<Eigen::Index>(k));
            }
        }
        return result;
    }

    NormalizationMethod parse_normalization_method(const std::string& name) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "all") return NormalizationMethod::ALL;
        if (lower == "speaker") return NormalizationMethod::SPEAKER;
        if (lower == "none") return NormalizationMethod::NONE;
        throw InvalidParameterError("Unknown normalization method '" + name +
                                    "' (expected all, speaker or none)");
    }

    std::string normalization_method_to_string(NormalizationMethod method) {
        switch (method) {
            case NormalizationMethod::ALL: return "all";
            case NormalizationMethod::SPEAKER: return "speaker";
            case NormalizationMethod::NONE: return "none";
            default: return "unknown";
        }
    }

} // namespace emodata
