#include "knnw/hyperplane.hpp"
#include "knnw/ols.hpp"
#include "knnw/weighting_errors.hpp"
#include "knnw/weighting_schemes.hpp"
#include "test_datasets.hpp"

#include <cmath>
#include <random>
#include <stdexcept>

#include <Eigen/Dense>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

namespace {

class mock_ols_solver_t : public knnw::ols_solver_t {
public:
    MOCK_METHOD(knnw::ols_fit_t, fit, (const Eigen::VectorXd& y, const Eigen::MatrixXd& X), (const, override));
};

knnw::ols_fit_t make_fit(std::initializer_list<double> beta) {
    knnw::ols_fit_t fit;
    fit.beta.resize(static_cast<Eigen::Index>(beta.size()));
    Eigen::Index i = 0;
    for (double b : beta) fit.beta(i++) = b;
    fit.rank = static_cast<int>(beta.size());
    return fit;
}

}  // namespace

TEST(EigenOlsSolver, RecoversExactCoefficients) {
    Eigen::MatrixXd X(5, 2);
    X << 0, 1,
         1, 0,
         2, 3,
         3, 1,
         4, 5;
    Eigen::VectorXd y(5);
    for (int i = 0; i < 5; ++i) y(i) = -2.0 + 0.5 * X(i, 0) + 4.0 * X(i, 1);

    const knnw::eigen_ols_solver_t solver;
    const knnw::ols_fit_t fit = solver.fit(y, X);

    ASSERT_EQ(fit.beta.size(), 3);
    EXPECT_NEAR(fit.beta(0), -2.0, 1e-10);
    EXPECT_NEAR(fit.beta(1), 0.5, 1e-10);
    EXPECT_NEAR(fit.beta(2), 4.0, 1e-10);
    EXPECT_EQ(fit.rank, 3);
}

TEST(EigenOlsSolver, RejectsTooFewRows) {
    Eigen::MatrixXd X(2, 2);
    X << 1, 2,
         3, 5;
    Eigen::VectorXd y(2);
    y << 1, 2;

    const knnw::eigen_ols_solver_t solver;
    EXPECT_THROW(solver.fit(y, X), knnw::rank_deficient_error);
}

TEST(EigenOlsSolver, RejectsCollinearRegressors) {
    Eigen::MatrixXd X(5, 2);
    Eigen::VectorXd y(5);
    for (int i = 0; i < 5; ++i) {
        X(i, 0) = i;
        X(i, 1) = 2.0 * i;
        y(i) = 0.3 * i * i;
    }

    const knnw::eigen_ols_solver_t solver;
    EXPECT_THROW(solver.fit(y, X), knnw::rank_deficient_error);
}

TEST(EigenOlsSolver, RejectsMismatchedShapes) {
    const Eigen::MatrixXd X = Eigen::MatrixXd::Ones(4, 1);
    const Eigen::VectorXd y = Eigen::VectorXd::Zero(3);
    const knnw::eigen_ols_solver_t solver;
    EXPECT_THROW(solver.fit(y, X), std::invalid_argument);
    EXPECT_THROW(knnw::eigen_ols_solver_t(0.0), std::invalid_argument);
}

TEST(Hyperplane, BuiltFromRegressionCoefficients) {
    Eigen::VectorXd beta(3);
    beta << 7.0, 2.0, -3.0;
    const knnw::hyperplane_t plane = knnw::hyperplane_from_ols(beta);

    ASSERT_EQ(plane.n_dims(), 3);
    EXPECT_DOUBLE_EQ(plane.coefficients[0], 2.0);
    EXPECT_DOUBLE_EQ(plane.coefficients[1], -3.0);
    EXPECT_DOUBLE_EQ(plane.coefficients[2], -1.0);
    EXPECT_DOUBLE_EQ(plane.constant, 7.0);

    // (1, 1, y) lies on the plane for y = 7 + 2 - 3
    const double on_plane[] = {1.0, 1.0, 6.0};
    EXPECT_NEAR(knnw::point_hyperplane_distance(on_plane, plane), 0.0, 1e-12);
}

TEST(Hyperplane, ZeroNormIsAnError) {
    knnw::hyperplane_t plane;
    plane.coefficients = {0.0, 0.0, 0.0};
    plane.constant = 1.0;
    const double point[] = {1.0, 2.0, 3.0};
    EXPECT_THROW(knnw::point_hyperplane_distance(point, plane), knnw::degenerate_hyperplane_error);
    EXPECT_THROW(knnw::hyperplane_from_ols(Eigen::VectorXd::Zero(1)), std::invalid_argument);
}

TEST(Nonlinearity, ZeroOnExactlyLinearNeighborhood) {
    knnw::dataset_t data = knnw_test::linear_plane(9);
    knnw_test::connect_all(data);
    const knnw::eigen_ols_solver_t solver;

    for (int i = 0; i < data.size(); ++i) {
        EXPECT_NEAR(knnw::nonlinearity(data.instance(i), solver), 0.0, 1e-9) << "instance " << i;
    }
}

TEST(Nonlinearity, DistanceToFittedLine) {
    // y = 0, 1, 0 at x = -1, 0, 1: fitted line y = 1/3, instance (0, 1) is 2/3 away
    knnw::dataset_t data(1);
    data.add_instance({0.0}, 1.0);
    data.add_instance({-1.0}, 0.0);
    data.add_instance({1.0}, 0.0);
    knnw_test::connect_all(data);

    const knnw::eigen_ols_solver_t solver;
    EXPECT_NEAR(knnw::nonlinearity(data.instance(0), solver), 2.0 / 3.0, 1e-12);
    // the side points are 1/3 away from the same line
    EXPECT_NEAR(knnw::nonlinearity(data.instance(1), solver), 1.0 / 3.0, 1e-12);
}

TEST(Nonlinearity, LargerInNonlinearRegion) {
    knnw::dataset_t data(1);
    for (int i = -3; i <= 3; ++i) {
        const double x = i;
        data.add_instance({x}, x * x);
    }
    knnw::dataset_t line(1);
    for (int i = -3; i <= 3; ++i) {
        const double x = i;
        line.add_instance({x}, 0.5 * x);
    }
    knnw_test::connect_all(data);
    knnw_test::connect_all(line);

    const knnw::eigen_ols_solver_t solver;
    EXPECT_GT(knnw::nonlinearity(data.instance(3), solver), 1.0);
    EXPECT_NEAR(knnw::nonlinearity(line.instance(3), solver), 0.0, 1e-10);
}

TEST(Nonlinearity, ExactlyDeterminedSampleFitsThroughAllRows) {
    knnw::dataset_t data(1);
    data.add_instance({0.0}, 3.0);
    data.add_instance({2.0}, -1.0);
    data.set_neighbors(0, {1});
    data.set_neighbors(1, {0});

    const knnw::eigen_ols_solver_t solver;
    EXPECT_NEAR(knnw::nonlinearity(data.instance(0), solver), 0.0, 1e-12);
}

TEST(Nonlinearity, NoNeighborsIsRankDeficient) {
    knnw::dataset_t data(2);
    data.add_instance({1.0, 2.0}, 3.0);
    const knnw::eigen_ols_solver_t solver;
    EXPECT_THROW(knnw::nonlinearity(data.instance(0), solver), knnw::rank_deficient_error);
    EXPECT_THROW(knnw::weigh_instance(data.instance(0), knnw::make_weighting_config("nonlinearity", 2.0), solver),
                 knnw::weighting_error);
}

TEST(Nonlinearity, TooFewNeighborsIsRankDeficient) {
    knnw::dataset_t data(2);
    data.add_instance({1.0, 2.0}, 3.0);
    data.add_instance({2.0, 0.0}, 1.0);
    data.set_neighbors(0, {1});
    data.set_neighbors(1, {0});
    const knnw::eigen_ols_solver_t solver;
    EXPECT_THROW(knnw::nonlinearity(data.instance(0), solver), knnw::rank_deficient_error);
}

TEST(Nonlinearity, CollinearNeighborhoodIsRankDeficient) {
    knnw::dataset_t data(2);
    for (int i = 0; i < 6; ++i) {
        const double x = i;
        data.add_instance({x, -x}, x * x);
    }
    knnw_test::connect_all(data);
    const knnw::eigen_ols_solver_t solver;
    EXPECT_THROW(knnw::nonlinearity(data.instance(0), solver), knnw::rank_deficient_error);
}

TEST(Nonlinearity, PassesInstanceFirstThenNeighborsToSolver) {
    knnw::dataset_t data(1);
    data.add_instance({0.0}, 0.0);
    data.add_instance({1.0}, 10.0);
    data.add_instance({2.0}, 20.0);
    data.set_neighbors(0, {2, 1});

    Eigen::VectorXd expected_y(3);
    expected_y << 0.0, 20.0, 10.0;
    Eigen::MatrixXd expected_X(3, 1);
    expected_X << 0.0, 2.0, 1.0;

    mock_ols_solver_t solver;
    EXPECT_CALL(solver, fit(_, _))
        .WillOnce([&](const Eigen::VectorXd& y, const Eigen::MatrixXd& X) {
            EXPECT_TRUE(y.isApprox(expected_y));
            EXPECT_TRUE(X.isApprox(expected_X));
            return make_fit({1.0, 2.0});
        });

    // plane 2 x - y + 1 = 0, point (0, 0)
    EXPECT_NEAR(knnw::nonlinearity(data.instance(0), solver), 1.0 / std::sqrt(5.0), 1e-12);
}

TEST(Nonlinearity, SolverFailurePropagates) {
    knnw::dataset_t data = knnw_test::balanced_pair();
    mock_ols_solver_t solver;
    EXPECT_CALL(solver, fit(_, _))
        .WillOnce(Throw(knnw::rank_deficient_error("mocked")));
    EXPECT_THROW(knnw::nonlinearity(data.instance(0), solver), knnw::rank_deficient_error);
}

TEST(Nonlinearity, RejectsWrongCoefficientCount) {
    knnw::dataset_t data = knnw_test::balanced_pair();
    mock_ols_solver_t solver;
    EXPECT_CALL(solver, fit(_, _)).WillOnce(Return(make_fit({1.0, 2.0})));
    EXPECT_THROW(knnw::nonlinearity(data.instance(0), solver), std::invalid_argument);
}
