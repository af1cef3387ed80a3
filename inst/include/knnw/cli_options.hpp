#ifndef KNNW_CLI_OPTIONS_HPP_
#define KNNW_CLI_OPTIONS_HPP_

#include "instance_weighting.hpp"

#include <iosfwd>
#include <string>

namespace knnw {

/// Settings of one instance_weights run.
struct cli_options_t {
    weighting_params_t params;
    std::string dataset_file;
    std::string output_file;   ///< empty: stdout
    char delimiter = ',';
    bool has_header = false;
};

/**
 * @brief Parses the instance_weights command line and optional parameter file
 *
 * Weighting parameters may also be given in the file named by --params
 * ("key = value" lines, e.g. "scheme = nonlinearity"). A value given on the
 * command line takes precedence over the same key in the file, and a file
 * value takes precedence over the built-in default.
 *
 * @param help_out receives the usage text when --help is given
 *
 * @return false if help was requested and nothing should be run
 *
 * @throws boost::program_options::error on unknown or malformed options
 * @throws std::invalid_argument on invalid option values or a missing dataset
 * @throws std::runtime_error if the parameter file cannot be opened
 */
bool parse_cli_options(int argc, const char* const argv[], cli_options_t& opts, std::ostream& help_out);

} // namespace knnw

#endif // KNNW_CLI_OPTIONS_HPP_
