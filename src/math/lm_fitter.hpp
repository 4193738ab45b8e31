// Levenberg-Marquardt Multi-Dimension Fitter
//
// Purpose: Fits the parameters a of a scalar model y = f(x; a) to a set of
// observations (x_i, y_i, sigma_i) by minimizing
//
//   chi^2(a) = sum_i ((y_i - f(x_i; a)) / sigma_i)^2
//
// Reference: Press et al., "Numerical Recipes", 3rd ed., section 15.5
//
// Algorithm:
//   1. alpha = J^T W J, beta = J^T W r  (W = diag(1/sigma^2))
//   2. Solve (alpha + lambda*diag(alpha)) da = beta
//   3. Accept step if chi^2 decreases (lambda /= 10), else reject (lambda *= 10)
//   4. Converged after NDONE consecutive iterations with |dchi^2| < tol
//   5. Covariance = alpha^-1 at the solution
//
// Sample Usage:
//   LevenbergMarquardtFitter fitter(evaluator);
//   fitter.set_input_data(points, y, sigma);
//   FitResult result = fitter.fit(initial_params);
//
// Expected Output:
//   - result.params: fitted parameters
//   - result.covariance: parameter covariance (num_params x num_params)
//   - EstimationFailure thrown on singular normal matrix or iteration cap

#pragma once

#include "core/types.hpp"

#include <functional>

namespace rfloc {

/**
 * @brief Levenberg-Marquardt fitter for scalar models of vector inputs
 */
class LevenbergMarquardtFitter {
public:
    /**
     * @brief Per-observation model evaluation
     *
     * (index, point, params, derivatives) -> predicted value.
     * derivatives has params.size() entries and must be filled with
     * d(prediction)/d(params) evaluated at params.
     */
    using Evaluator = std::function<double(int, const VectorXd&, const VectorXd&, VectorXd&)>;

    struct Options {
        int max_iterations;   ///< Iteration cap before EstimationFailure
        int ndone;            ///< Consecutive small chi^2 changes to declare convergence
        double tolerance;     ///< Absolute/relative chi^2 change threshold
        double initial_lambda;

        Options()
            : max_iterations(1000),
              ndone(4),
              tolerance(1e-9),
              initial_lambda(1e-3) {}
    };

    struct FitResult {
        VectorXd params;      ///< Fitted parameters
        MatrixXd covariance;  ///< Parameter covariance
        double chi_sq;        ///< Final chi^2
        int iterations;       ///< Iterations performed

        FitResult() : chi_sq(0.0), iterations(0) {}
    };

    explicit LevenbergMarquardtFitter(Evaluator evaluator, const Options& options = Options());

    /**
     * @brief Set observations
     *
     * @param points One observation point per row
     * @param y Observed values
     * @param sigma Standard deviation of each observation (must be positive)
     * @throws ConfigurationError on size mismatch or non-positive sigma
     */
    void set_input_data(const MatrixXd& points, const VectorXd& y, const VectorXd& sigma);

    /**
     * @brief Run the fit from the given starting parameters
     *
     * @throws NotReadyError if no input data was set
     * @throws EstimationFailure if the normal matrix is singular or the
     *         iteration cap is reached
     */
    FitResult fit(const VectorXd& initial_params) const;

    const Options& options() const { return options_; }

private:
    Evaluator evaluator_;
    Options options_;

    MatrixXd points_;
    VectorXd y_;
    VectorXd sigma_;

    /**
     * @brief Build alpha = J^T W J and beta = J^T W r, return chi^2
     */
    double compute_normal_equations(const VectorXd& params, MatrixXd& alpha,
                                    VectorXd& beta) const;
};

}  // namespace rfloc
