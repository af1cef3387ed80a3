#ifndef KNNW_KNN_SEARCH_HPP_
#define KNNW_KNN_SEARCH_HPP_

#include "dataset.hpp"
#include "weighting_schemes.hpp"

namespace knnw {

/**
 * @brief Fills data.neighbors with the k nearest neighbors of every instance
 *
 * Euclidean kd-tree search (ANN) in the input space or in the input-output
 * space. The query instance itself is never reported as its own neighbor,
 * even when it has exact duplicates. Neighbors are ordered by increasing
 * distance.
 *
 * @throws std::invalid_argument unless 1 <= k < data.size() and data has
 *         at least one input
 */
void find_neighbors(dataset_t& data, int k, weighting_space_t space, bool verbose = false);

} // namespace knnw

#endif // KNNW_KNN_SEARCH_HPP_
