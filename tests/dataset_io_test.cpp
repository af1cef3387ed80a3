#include "knnw/dataset_io.hpp"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

TEST(ReadDatasetCsv, LastColumnIsOutput) {
    std::istringstream in("1.0,2.0,3.5\n"
                          "-4,5e-1,6\n"
                          "\n"
                          "7, 8 ,9\n");
    const knnw::dataset_t data = knnw::read_dataset_csv(in, "inline");

    ASSERT_EQ(data.size(), 3);
    EXPECT_EQ(data.n_inputs, 2);
    EXPECT_DOUBLE_EQ(data.instance(0).output(), 3.5);
    EXPECT_DOUBLE_EQ(data.instance(1).input()[0], -4.0);
    EXPECT_DOUBLE_EQ(data.instance(1).input()[1], 0.5);
    EXPECT_DOUBLE_EQ(data.instance(2).input()[1], 8.0);
    EXPECT_DOUBLE_EQ(data.instance(2).all_attrs()[2], 9.0);
    EXPECT_EQ(data.neighbors.size(), 3u);
    EXPECT_TRUE(data.neighbors[0].empty());
}

TEST(ReadDatasetCsv, ExplicitAndDetectedHeaders) {
    std::istringstream with_header("a;b;y\n1;2;3\n");
    const knnw::dataset_t a = knnw::read_dataset_csv(with_header, "inline", ';', true);
    ASSERT_EQ(a.size(), 1);
    EXPECT_DOUBLE_EQ(a.instance(0).output(), 3.0);

    std::istringstream detected("x1,x2,y\n1,2,3\n4,5,6\n");
    const knnw::dataset_t b = knnw::read_dataset_csv(detected, "inline");
    EXPECT_EQ(b.size(), 2);
}

TEST(ReadDatasetCsv, RejectsMalformedInput) {
    std::istringstream ragged("1,2,3\n4,5\n");
    EXPECT_THROW(knnw::read_dataset_csv(ragged, "ragged"), std::runtime_error);

    std::istringstream text("1,2,3\n4,five,6\n");
    EXPECT_THROW(knnw::read_dataset_csv(text, "text"), std::runtime_error);

    std::istringstream missing("1,,3\n");
    EXPECT_THROW(knnw::read_dataset_csv(missing, "missing", ',', true), std::runtime_error);

    std::istringstream single_column("1\n2\n");
    EXPECT_THROW(knnw::read_dataset_csv(single_column, "single"), std::runtime_error);

    std::istringstream empty("\n\n");
    EXPECT_THROW(knnw::read_dataset_csv(empty, "empty"), std::runtime_error);

    EXPECT_THROW(knnw::read_dataset_csv("/nonexistent/knnw/data.csv"), std::runtime_error);
}

TEST(ReadDatasetCsv, MalformedFirstRowIsNotAHeader) {
    std::istringstream typo("1,x,3\n4,5,6\n");
    EXPECT_THROW(knnw::read_dataset_csv(typo, "typo"), std::runtime_error);

    std::istringstream mixed("x1,2,y\n4,5,6\n");
    EXPECT_THROW(knnw::read_dataset_csv(mixed, "mixed"), std::runtime_error);

    std::istringstream partial_header("x1,,y\n4,5,6\n");
    const knnw::dataset_t data = knnw::read_dataset_csv(partial_header, "partial");
    ASSERT_EQ(data.size(), 1);
    EXPECT_DOUBLE_EQ(data.instance(0).output(), 6.0);
}

TEST(ReadDatasetCsv, ErrorNamesSourceAndLine) {
    std::istringstream text("1,2,3\n4,5,6\n7,x,9\n");
    try {
        knnw::read_dataset_csv(text, "broken.csv");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("broken.csv"), std::string::npos);
        EXPECT_NE(msg.find("line 3"), std::string::npos);
    }
}

TEST(WriteWeightsCsv, OneLinePerInstance) {
    knnw::instance_weights_t result;
    result.weights = {0.5, std::numeric_limits<double>::quiet_NaN()};
    result.schemes = {knnw::weighting_scheme_t::proximity_x, knnw::weighting_scheme_t::nonlinearity};
    result.status = {knnw::weight_status_t::ok, knnw::weight_status_t::rank_deficient};
    result.n_failed = 1;

    std::ostringstream out;
    knnw::write_weights_csv(out, result);
    EXPECT_EQ(out.str(),
              "index,scheme,status,weight\n"
              "0,proximity-x,ok,0.5\n"
              "1,nonlinearity,rank-deficient,NA\n");
}

TEST(WriteWeightsCsv, FileRoundTripThroughReader) {
    const std::string path = ::testing::TempDir() + "knnw_dataset_io_test.csv";
    {
        std::ofstream out(path);
        out << "0,0,1\n1,0,2\n0,1,3\n";
    }
    const knnw::dataset_t data = knnw::read_dataset_csv(path);
    EXPECT_EQ(data.size(), 3);
    EXPECT_EQ(data.n_inputs, 2);
    std::remove(path.c_str());

    EXPECT_THROW(knnw::write_weights_csv("/nonexistent/knnw/out.csv", knnw::instance_weights_t{}),
                 std::runtime_error);
}
