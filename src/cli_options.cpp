#include "knnw/cli_options.hpp"
#include "knnw/error_utils.hpp"

#include <fstream>
#include <ostream>
#include <stdexcept>

#include <boost/program_options.hpp>

namespace b_po = boost::program_options;

namespace knnw {

bool parse_cli_options(int argc, const char* const argv[], cli_options_t& opts, std::ostream& help_out) {
    std::string scheme, space, alternation, on_failure, delimiter, params_file;

    b_po::options_description run_opts("weighting parameters");
    run_opts.add_options()
        ("scheme,s", b_po::value<std::string>(&scheme)->default_value("proximity-x"),
         "weighting scheme: proximity-x, proximity-xy, surrounding-x, surrounding-xy, "
         "nonlinearity, remoteness-x or remoteness-xy")
        ("dist-metric,z", b_po::value<double>(&opts.params.dist_metric)->default_value(2.0),
         "Minkowski exponent (1: Manhattan, 2: Euclidean, <1: fractional)")
        ("k,k", b_po::value<int>(&opts.params.k)->default_value(5),
         "number of nearest neighbors")
        ("neighbor-space", b_po::value<std::string>(&space)->default_value("x"),
         "space of the neighbor search: x or xy")
        ("alternation", b_po::value<std::string>(&alternation)->default_value("round-robin"),
         "remoteness alternation: round-robin or random")
        ("seed", b_po::value<unsigned int>(&opts.params.seed)->default_value(0),
         "seed of the random alternation")
        ("on-failure", b_po::value<std::string>(&on_failure)->default_value("abort"),
         "rank-deficient instances: abort or skip");

    b_po::options_description io_opts("input/output");
    io_opts.add_options()
        ("help,h", b_po::bool_switch()->default_value(false), "show this help")
        ("data,d", b_po::value<std::string>(&opts.dataset_file),
         "CSV dataset; last column is the output")
        ("delimiter", b_po::value<std::string>(&delimiter)->default_value(","),
         "CSV field delimiter (single character)")
        ("header", b_po::bool_switch(&opts.has_header)->default_value(false),
         "first line of the dataset is a header")
        ("params,p", b_po::value<std::string>(&params_file),
         "parameter file with weighting parameters")
        ("output,o", b_po::value<std::string>(&opts.output_file),
         "output CSV (default: stdout)")
        ("verbose,v", b_po::bool_switch(&opts.params.verbose)->default_value(false),
         "log progress to stderr");

    b_po::options_description all_opts;
    all_opts.add(io_opts).add(run_opts);

    b_po::positional_options_description pos;
    pos.add("data", 1);

    // Values stored first win, so the command line goes before the file
    b_po::variables_map var_map;
    b_po::store(b_po::command_line_parser(argc, argv)
                    .options(all_opts)
                    .positional(pos)
                    .run(),
                var_map);

    if (var_map["help"].as<bool>()) {
        help_out << "usage: " << (argc > 0 ? argv[0] : "instance_weights")
                 << " <dataset.csv> [options]\n\n"
                 << all_opts << std::endl;
        return false;
    }

    if (var_map.count("params")) {
        const std::string file = var_map["params"].as<std::string>();
        std::ifstream in(file);
        if (!in) {
            REPORT_ERROR("cannot open parameter file '%s'", file.c_str());
        }
        b_po::store(b_po::parse_config_file(in, run_opts), var_map);
    }
    b_po::notify(var_map);

    if (opts.dataset_file.empty()) {
        throw std::invalid_argument("no dataset given (see --help)");
    }
    if (delimiter.size() != 1 || delimiter[0] == '"' || delimiter[0] == '\n') {
        throw std::invalid_argument("--delimiter expects a single character other than quote or newline");
    }
    opts.delimiter = delimiter[0];

    opts.params.scheme = scheme;
    opts.params.neighbor_space = parse_weighting_space(space);
    opts.params.alternation = parse_alternation(alternation);
    opts.params.on_failure = parse_failure_policy(on_failure);

    validate_weighting_params(opts.params);
    return true;
}

} // namespace knnw
