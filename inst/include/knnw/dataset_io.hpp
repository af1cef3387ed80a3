#ifndef KNNW_DATASET_IO_HPP_
#define KNNW_DATASET_IO_HPP_

#include "dataset.hpp"
#include "instance_weighting.hpp"

#include <iosfwd>
#include <string>

namespace knnw {

/**
 * @brief Reads a numeric CSV file into a dataset
 *
 * The last column is the output, all preceding columns are inputs, so every
 * row needs at least two fields. Empty lines are ignored. When has_header is
 * false and no field of the first non-empty line parses as a number, it is
 * taken as a header and skipped with a warning. Neighbor lists are left empty.
 *
 * @throws std::runtime_error if the file cannot be opened, a field is not a
 *         finite number, or rows have inconsistent widths
 */
dataset_t read_dataset_csv(const std::string& path,
                           char delimiter = ',',
                           bool has_header = false);

/// Same as read_dataset_csv() on an open stream; source names it in errors.
dataset_t read_dataset_csv(std::istream& in,
                           const std::string& source,
                           char delimiter = ',',
                           bool has_header = false);

/// Writes "index,scheme,status,weight" lines, one per instance, after a header line.
void write_weights_csv(std::ostream& out, const instance_weights_t& result);

/// @throws std::runtime_error if the file cannot be written
void write_weights_csv(const std::string& path, const instance_weights_t& result);

} // namespace knnw

#endif // KNNW_DATASET_IO_HPP_
