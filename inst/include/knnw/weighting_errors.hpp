#ifndef KNNW_WEIGHTING_ERRORS_HPP_
#define KNNW_WEIGHTING_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace knnw {

/// Numeric failure of a weighting scheme on a valid configuration.
class weighting_error : public std::runtime_error {
public:
    explicit weighting_error(const std::string& message) : std::runtime_error(message) {}
};

/// The regression sample has fewer independent rows than unknowns.
class rank_deficient_error : public weighting_error {
public:
    explicit rank_deficient_error(const std::string& message)
        : weighting_error("rank-deficient regression: " + message) {}
};

/// The fitted hyperplane has a zero-norm normal vector.
class degenerate_hyperplane_error : public weighting_error {
public:
    explicit degenerate_hyperplane_error(const std::string& message)
        : weighting_error("degenerate hyperplane: " + message) {}
};

} // namespace knnw

#endif // KNNW_WEIGHTING_ERRORS_HPP_
