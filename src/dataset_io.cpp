#include "knnw/dataset_io.hpp"
#include "knnw/error_utils.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace knnw {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r";
    const auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    const auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string> split_fields(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream ss(line);
    while (std::getline(ss, field, delimiter)) {
        fields.push_back(trim(field));
    }
    // getline drops a trailing empty field
    if (!line.empty() && line.back() == delimiter) fields.emplace_back();
    return fields;
}

bool parse_double(const std::string& field, double& value) {
    if (field.empty()) return false;
    const char* begin = field.c_str();
    char* end = nullptr;
    errno = 0;
    value = std::strtod(begin, &end);
    return end == begin + field.size() && errno != ERANGE && std::isfinite(value);
}

bool parse_row(const std::vector<std::string>& fields, std::vector<double>& row) {
    row.resize(fields.size());
    for (size_t j = 0; j < fields.size(); ++j) {
        if (!parse_double(fields[j], row[j])) return false;
    }
    return true;
}

/// A header row has no field that reads as a number.
bool looks_like_header(const std::vector<std::string>& fields) {
    double value = 0.0;
    for (const std::string& field : fields) {
        if (parse_double(field, value)) return false;
    }
    return true;
}

}  // namespace

dataset_t read_dataset_csv(std::istream& in,
                           const std::string& source,
                           char delimiter,
                           bool has_header) {
    dataset_t data;
    std::string line;
    int line_no = 0;
    bool header_pending = has_header;
    bool first_data_line = true;
    size_t n_fields = 0;
    std::vector<double> row;

    while (std::getline(in, line)) {
        ++line_no;
        if (trim(line).empty()) continue;

        if (header_pending) {
            header_pending = false;
            first_data_line = false;
            continue;
        }

        const std::vector<std::string> fields = split_fields(line, delimiter);

        if (!parse_row(fields, row)) {
            if (first_data_line && looks_like_header(fields)) {
                REPORT_WARNING("%s: line %d is not numeric, treating it as a header", source.c_str(), line_no);
                first_data_line = false;
                continue;
            }
            REPORT_ERROR("%s: line %d contains a non-numeric or non-finite field", source.c_str(), line_no);
        }

        if (data.empty()) {
            n_fields = fields.size();
            if (n_fields < 2) {
                REPORT_ERROR("%s: line %d has %zu field(s); need at least one input and the output",
                             source.c_str(), line_no, n_fields);
            }
            data.n_inputs = static_cast<int>(n_fields) - 1;
        } else if (fields.size() != n_fields) {
            REPORT_ERROR("%s: line %d has %zu fields, expected %zu",
                         source.c_str(), line_no, fields.size(), n_fields);
        }

        first_data_line = false;
        const double output = row.back();
        row.pop_back();
        data.add_instance(row, output);
    }

    if (in.bad()) {
        REPORT_ERROR("%s: read failure after line %d", source.c_str(), line_no);
    }
    if (data.empty()) {
        REPORT_ERROR("%s: no data rows", source.c_str());
    }

    return data;
}

dataset_t read_dataset_csv(const std::string& path, char delimiter, bool has_header) {
    std::ifstream in(path);
    if (!in) {
        REPORT_ERROR("cannot open dataset file '%s'", path.c_str());
    }
    return read_dataset_csv(in, path, delimiter, has_header);
}

void write_weights_csv(std::ostream& out, const instance_weights_t& result) {
    out << "index,scheme,status,weight\n";
    out << std::setprecision(17);
    for (int i = 0; i < result.size(); ++i) {
        out << i << ','
            << weighting_scheme_name(result.schemes[i]) << ','
            << weight_status_name(result.status[i]) << ',';
        if (std::isfinite(result.weights[i])) {
            out << result.weights[i];
        } else {
            out << "NA";
        }
        out << '\n';
    }
}

void write_weights_csv(const std::string& path, const instance_weights_t& result) {
    std::ofstream out(path);
    if (!out) {
        REPORT_ERROR("cannot open output file '%s'", path.c_str());
    }
    write_weights_csv(out, result);
    out.flush();
    if (!out.good()) {
        REPORT_ERROR("failed while writing output file '%s'", path.c_str());
    }
}

} // namespace knnw
