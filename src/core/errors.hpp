/**
 * @file errors.hpp
 * @brief Error taxonomy shared by finders, estimators and solvers
 *
 * Every failure surfaces as one of four distinguishable exception kinds:
 *
 *   ConfigurationError  invalid constructor/setter argument, nothing mutated
 *   LockedError         mutation or estimate() while an estimation runs
 *   NotReadyError       required inputs missing, or too few equations
 *   EstimationFailure   numerical failure (rank deficiency, fitter divergence)
 *
 * Sample Usage:
 *   try {
 *       estimator.estimate();
 *   } catch (const EstimationFailure& e) {
 *       // relax configuration and retry
 *   }
 */

#ifndef RFLOC_CORE_ERRORS_HPP
#define RFLOC_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace rfloc {

/**
 * @brief Base class of all errors raised by this library
 */
class FingerprintError : public std::runtime_error {
public:
    explicit FingerprintError(const std::string& what)
        : std::runtime_error(what) {}
};

class ConfigurationError : public FingerprintError {
public:
    explicit ConfigurationError(const std::string& what)
        : FingerprintError(what) {}
};

class LockedError : public FingerprintError {
public:
    LockedError()
        : FingerprintError("estimator is locked") {}
};

class NotReadyError : public FingerprintError {
public:
    explicit NotReadyError(const std::string& what = "estimator is not ready")
        : FingerprintError(what) {}
};

class EstimationFailure : public FingerprintError {
public:
    explicit EstimationFailure(const std::string& what)
        : FingerprintError(what) {}
};

} // namespace rfloc

#endif // RFLOC_CORE_ERRORS_HPP
