#ifndef KNNW_DATASET_HPP_
#define KNNW_DATASET_HPP_

#include <vector>
#include <cstddef>

using std::size_t;

namespace knnw {

struct dataset_t;

/**
 * @brief Read-only view of one instance of a dataset
 *
 * The view borrows its row and neighbor list from the dataset; it stays valid
 * as long as the dataset is alive and not resized. Neighbors are reached
 * through the same dataset, so a neighbor list never owns other instances.
 */
struct instance_view_t {
    const dataset_t* data = nullptr;
    int index = 0;

    int n_inputs() const;                 ///< D
    int n_attrs() const;                  ///< D + 1
    const double* input() const;          ///< first D entries of the row
    double output() const;
    const double* all_attrs() const;      ///< input followed by output
    const std::vector<int>& neighbors() const;
    instance_view_t neighbor(int j) const;
};

/**
 * @brief Labeled dataset with precomputed neighbor lists
 *
 * Each row stores the D inputs followed by the output, so the combined
 * input-output vector is the row itself and cannot drift from its parts.
 * neighbors[i] holds indices into rows of the k nearest neighbors of row i.
 */
struct dataset_t {
    int n_inputs = 0;
    std::vector<std::vector<double>> rows;
    std::vector<std::vector<int>> neighbors;

    dataset_t() = default;
    explicit dataset_t(int n_inputs_) : n_inputs(n_inputs_) {}

    int size() const { return static_cast<int>(rows.size()); }
    bool empty() const { return rows.empty(); }

    /// Appends an instance with an empty neighbor list; throws std::invalid_argument
    /// if input does not have n_inputs entries.
    int add_instance(const std::vector<double>& input, double output);
    void set_neighbors(int i, std::vector<int> nn);

    instance_view_t instance(int i) const;
};

/**
 * @brief Checks the structural invariants relied on by the weighting schemes
 *
 * @throws std::invalid_argument if D < 1, a row does not have D + 1 entries,
 *         an input or output is NaN or infinite, the neighbor table does not have one list per row, a neighbor index
 *         is out of range, or a row lists itself as its own neighbor.
 */
void validate_dataset(const dataset_t& data);

// ---- inline accessors ----

inline int instance_view_t::n_inputs() const { return data->n_inputs; }
inline int instance_view_t::n_attrs() const { return data->n_inputs + 1; }
inline const double* instance_view_t::input() const { return data->rows[index].data(); }
inline double instance_view_t::output() const { return data->rows[index][data->n_inputs]; }
inline const double* instance_view_t::all_attrs() const { return data->rows[index].data(); }
inline const std::vector<int>& instance_view_t::neighbors() const { return data->neighbors[index]; }
inline instance_view_t instance_view_t::neighbor(int j) const {
    return instance_view_t{data, data->neighbors[index][j]};
}

} // namespace knnw

#endif // KNNW_DATASET_HPP_
