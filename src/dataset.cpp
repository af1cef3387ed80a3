#include "knnw/dataset.hpp"
#include "knnw/error_utils.hpp"

#include <cmath>
#include <string>
#include <stdexcept>
#include <utility>

namespace knnw {

int dataset_t::add_instance(const std::vector<double>& input, double output) {
    if (static_cast<int>(input.size()) != n_inputs) {
        throw std::invalid_argument("add_instance(): expected " + std::to_string(n_inputs) +
                                    " inputs, got " + std::to_string(input.size()));
    }

    std::vector<double> row;
    row.reserve(input.size() + 1);
    row.insert(row.end(), input.begin(), input.end());
    row.push_back(output);

    rows.push_back(std::move(row));
    neighbors.emplace_back();
    return size() - 1;
}

void dataset_t::set_neighbors(int i, std::vector<int> nn) {
    CHECK_INDEX(i, size());
    neighbors[i] = std::move(nn);
}

instance_view_t dataset_t::instance(int i) const {
    CHECK_INDEX(i, size());
    return instance_view_t{this, i};
}

void validate_dataset(const dataset_t& data) {
    if (data.n_inputs < 1) {
        throw std::invalid_argument("dataset must have at least one input attribute");
    }

    const int n_rows = data.size();
    const size_t width = static_cast<size_t>(data.n_inputs) + 1;

    if (static_cast<int>(data.neighbors.size()) != n_rows) {
        throw std::invalid_argument("neighbor table has " + std::to_string(data.neighbors.size()) +
                                    " lists for " + std::to_string(n_rows) + " instances");
    }

    for (int i = 0; i < n_rows; ++i) {
        if (data.rows[i].size() != width) {
            throw std::invalid_argument("instance " + std::to_string(i) + " has " +
                                        std::to_string(data.rows[i].size()) +
                                        " attributes, expected " + std::to_string(width));
        }
        for (size_t j = 0; j < width; ++j) {
            if (!std::isfinite(data.rows[i][j])) {
                throw std::invalid_argument("instance " + std::to_string(i) + " has a non-finite value in attribute " +
                                            std::to_string(j));
            }
        }
        for (int nn : data.neighbors[i]) {
            if (nn < 0 || nn >= n_rows) {
                throw std::invalid_argument("instance " + std::to_string(i) +
                                            " has out-of-range neighbor index " + std::to_string(nn));
            }
            if (nn == i) {
                throw std::invalid_argument("instance " + std::to_string(i) + " is listed as its own neighbor");
            }
        }
    }
}

} // namespace knnw
