#include "knnw/knn_search.hpp"
#include "knnw/progress_utils.hpp"

#include <chrono>
#include <cstdio>
#include <memory>
#include <string>
#include <stdexcept>
#include <utility>
#include <vector>

#include <ANN/ANN.h>

namespace knnw {

namespace {

/// Owns an ANN point array; releases ANN's global state along with it.
struct ann_points_t {
    ANNpointArray pts;

    ann_points_t(int n_pts, int dim) : pts(annAllocPts(n_pts, dim)) {}
    ~ann_points_t() {
        annDeallocPts(pts);
        annClose();
    }

    ann_points_t(const ann_points_t&) = delete;
    ann_points_t& operator=(const ann_points_t&) = delete;
};

}  // namespace

void find_neighbors(dataset_t& data, int k, weighting_space_t space, bool verbose) {
    const int n_pts = data.size();
    if (data.n_inputs < 1) {
        throw std::invalid_argument("find_neighbors(): dataset has no input attributes");
    }
    if (k < 1 || k >= n_pts) {
        throw std::invalid_argument("find_neighbors(): k = " + std::to_string(k) +
                                    " must be in [1, " + std::to_string(n_pts - 1) + "]");
    }

    auto ptm = std::chrono::steady_clock::now();
    const int dim = space == weighting_space_t::input ? data.n_inputs : data.n_inputs + 1;

    // Create data points array for ANN
    ann_points_t points(n_pts, dim);
    for (int i = 0; i < n_pts; i++) {
        for (int j = 0; j < dim; j++) {
            points.pts[i][j] = data.rows[i][j];
        }
    }
    // Build kd-tree; destroyed before points
    auto kdtree = std::make_unique<ANNkd_tree>(points.pts, n_pts, dim);

    data.neighbors.resize(n_pts);

    // One extra slot since the query point is part of the tree
    const int n_query = k + 1;
    std::vector<ANNidx> nn_idx(n_query);
    std::vector<ANNdist> nn_dists(n_query);

    progress_tracker_t tracker(n_pts, "Neighbor search", n_pts / 10 + 1);

    // ANN keeps search state in globals, so the loop stays serial
    for (int i = 0; i < n_pts; i++) {
        if (verbose) tracker.update(i);
        kdtree->annkSearch(points.pts[i], n_query, nn_idx.data(), nn_dists.data(), 0.0);

        std::vector<int> nn;
        nn.reserve(k);
        for (int j = 0; j < n_query && static_cast<int>(nn.size()) < k; j++) {
            if (nn_idx[j] != i) nn.push_back(nn_idx[j]);
        }
        data.neighbors[i] = std::move(nn);
    }
    if (verbose) tracker.finish();

    if (verbose) {
        char msg[128];
        std::snprintf(msg, sizeof(msg), "Found %d nearest neighbors of %d instances in the %s space",
                      k, n_pts, weighting_space_name(space));
        elapsed_time(ptm, msg, true, true);
    }
}

} // namespace knnw
