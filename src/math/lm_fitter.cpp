// Levenberg-Marquardt Multi-Dimension Fitter - Implementation

#include "math/lm_fitter.hpp"
#include "core/errors.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace rfloc {

LevenbergMarquardtFitter::LevenbergMarquardtFitter(Evaluator evaluator, const Options& options)
    : evaluator_(std::move(evaluator)), options_(options) {
    if (!evaluator_) {
        throw ConfigurationError("fitter requires an evaluation function");
    }
    if (options_.max_iterations < 1 || options_.ndone < 1 || options_.tolerance <= 0.0 ||
        options_.initial_lambda <= 0.0) {
        throw ConfigurationError("invalid Levenberg-Marquardt options");
    }
}

void LevenbergMarquardtFitter::set_input_data(const MatrixXd& points, const VectorXd& y,
                                              const VectorXd& sigma) {
    if (points.rows() != y.size() || y.size() != sigma.size() || y.size() == 0) {
        throw ConfigurationError("fitter input sizes do not match");
    }
    if ((sigma.array() <= 0.0).any()) {
        throw ConfigurationError("observation standard deviations must be positive");
    }

    points_ = points;
    y_ = y;
    sigma_ = sigma;
}

LevenbergMarquardtFitter::FitResult LevenbergMarquardtFitter::fit(
    const VectorXd& initial_params) const {

    if (y_.size() == 0) {
        throw NotReadyError("fitter has no input data");
    }

    const Eigen::Index ma = initial_params.size();

    VectorXd a = initial_params;
    MatrixXd alpha(ma, ma);
    VectorXd beta(ma);

    double chi_sq = compute_normal_equations(a, alpha, beta);
    double ochi_sq = chi_sq;
    double lambda = options_.initial_lambda;
    int done = 0;

    MatrixXd alpha_try(ma, ma);
    VectorXd beta_try(ma);

    for (int iter = 0; iter < options_.max_iterations; iter++) {
        if (done == options_.ndone) {
            // Converged: covariance from the unaugmented normal matrix
            Eigen::FullPivLU<MatrixXd> lu(alpha);
            if (!lu.isInvertible()) {
                throw EstimationFailure("singular normal matrix at solution");
            }

            FitResult result;
            result.params = a;
            result.covariance = lu.inverse();
            result.chi_sq = ochi_sq;
            result.iterations = iter;
            return result;
        }

        // === Augmented normal equations ===
        MatrixXd augmented = alpha;
        augmented.diagonal() *= (1.0 + lambda);

        Eigen::FullPivLU<MatrixXd> lu(augmented);
        if (!lu.isInvertible()) {
            throw EstimationFailure("singular normal matrix at iteration " +
                                    std::to_string(iter));
        }
        const VectorXd da = lu.solve(beta);

        // === Trial step ===
        const VectorXd a_try = a + da;
        chi_sq = compute_normal_equations(a_try, alpha_try, beta_try);

        if (std::abs(chi_sq - ochi_sq) < std::max(options_.tolerance,
                                                  options_.tolerance * chi_sq)) {
            done++;
        }

        if (chi_sq < ochi_sq) {
            // Success: accept and move towards Gauss-Newton
            lambda *= 0.1;
            ochi_sq = chi_sq;
            a = a_try;
            alpha = alpha_try;
            beta = beta_try;
        } else {
            // Failure: move towards gradient descent
            lambda *= 10.0;
            chi_sq = ochi_sq;
        }
    }

    LOG_WARN("Levenberg-Marquardt reached %d iterations (chi2=%.6g)",
             options_.max_iterations, ochi_sq);
    throw EstimationFailure("Levenberg-Marquardt fit did not converge");
}

double LevenbergMarquardtFitter::compute_normal_equations(const VectorXd& params,
                                                          MatrixXd& alpha,
                                                          VectorXd& beta) const {
    const Eigen::Index ma = params.size();
    alpha.setZero(ma, ma);
    beta.setZero(ma);

    VectorXd dyda(ma);
    double chi_sq = 0.0;

    for (Eigen::Index i = 0; i < y_.size(); i++) {
        const VectorXd point = points_.row(i).transpose();
        dyda.setZero();
        const double ymod = evaluator_(static_cast<int>(i), point, params, dyda);

        const double sig2i = 1.0 / (sigma_(i) * sigma_(i));
        const double dy = y_(i) - ymod;

        alpha.noalias() += sig2i * dyda * dyda.transpose();
        beta += sig2i * dy * dyda;
        chi_sq += dy * dy * sig2i;
    }

    if (!std::isfinite(chi_sq)) {
        throw EstimationFailure("model evaluation produced a non-finite residual");
    }
    return chi_sq;
}

}  // namespace rfloc
