#include "knnw/cli_options.hpp"
#include "knnw/dataset_io.hpp"
#include "knnw/instance_weighting.hpp"
#include "knnw/knn_search.hpp"
#include "knnw/ols.hpp"
#include "knnw/progress_utils.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>

#include <boost/program_options/errors.hpp>

namespace b_po = boost::program_options;

int main(int argc, char* argv[]) {
    auto start_time = std::chrono::steady_clock::now();

    try {
        knnw::cli_options_t opts;
        if (!knnw::parse_cli_options(argc, argv, opts, std::cout)) {
            return 0;
        }

        knnw::dataset_t data = knnw::read_dataset_csv(opts.dataset_file, opts.delimiter, opts.has_header);
        if (opts.params.verbose) {
            knnw::progress_log("Read %d instances with %d inputs from %s",
                               data.size(), data.n_inputs, opts.dataset_file.c_str());
        }

        knnw::find_neighbors(data, opts.params.k, opts.params.neighbor_space, opts.params.verbose);

        const knnw::eigen_ols_solver_t solver;
        const knnw::instance_weights_t result = knnw::weigh_instances(data, opts.params, solver);

        if (opts.output_file.empty()) {
            knnw::write_weights_csv(std::cout, result);
        } else {
            knnw::write_weights_csv(opts.output_file, result);
        }
    } catch (const b_po::error& e) {
        std::cerr << "error: " << e.what() << " (see --help)" << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }

    knnw::elapsed_time(start_time, "Elapsed time:");
    return 0;
}
