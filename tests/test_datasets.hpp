#ifndef KNNW_TEST_DATASETS_HPP_
#define KNNW_TEST_DATASETS_HPP_

#include "knnw/dataset.hpp"

#include <numeric>
#include <utility>
#include <vector>

namespace knnw_test {

/// Each instance lists every other instance as neighbor.
inline void connect_all(knnw::dataset_t& data) {
    for (int i = 0; i < data.size(); ++i) {
        std::vector<int> nn;
        for (int j = 0; j < data.size(); ++j) {
            if (j != i) nn.push_back(j);
        }
        data.set_neighbors(i, std::move(nn));
    }
}

/// Instance 0 at the origin with neighbors on both sides of the first axis.
inline knnw::dataset_t balanced_pair() {
    knnw::dataset_t data(2);
    data.add_instance({0.0, 0.0}, 0.0);
    data.add_instance({1.0, 0.0}, 0.0);
    data.add_instance({-1.0, 0.0}, 0.0);
    data.set_neighbors(0, {1, 2});
    data.set_neighbors(1, {0, 2});
    data.set_neighbors(2, {0, 1});
    return data;
}

/// Points on y = 1 + 2 x1 - 3 x2, no noise.
inline knnw::dataset_t linear_plane(int n) {
    knnw::dataset_t data(2);
    for (int i = 0; i < n; ++i) {
        const double x1 = 0.5 * i;
        const double x2 = (i * i) % 7 - 3.0;
        data.add_instance({x1, x2}, 1.0 + 2.0 * x1 - 3.0 * x2);
    }
    return data;
}

} // namespace knnw_test

#endif // KNNW_TEST_DATASETS_HPP_
