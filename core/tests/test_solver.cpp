#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "schemasim/solver.hpp"

#include <cmath>

using namespace schemasim;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

SparseMatrix dense_to_sparse(const Matrix& m) {
    return m.sparseView();
}

}  // namespace

TEST_CASE("LinearSolver", "[solver]") {
    LinearSolver solver;
    Vector y;

    SECTION("solves a well-posed system") {
        Matrix m(2, 2);
        m << 2.0, -1.0,
            -1.0, 2.0;
        Vector b(2);
        b << 1.0, 0.0;
        REQUIRE(solver.solve(dense_to_sparse(m), b, y) == SolverStatus::Success);
        CHECK_THAT(y(0), WithinRel(2.0 / 3.0, 1e-12));
        CHECK_THAT(y(1), WithinRel(1.0 / 3.0, 1e-12));
    }

    SECTION("reports a singular matrix") {
        Matrix m(2, 2);
        m << 1.0, -1.0,
            -1.0, 1.0;
        Vector b = Vector::Zero(2);
        CHECK(solver.solve(dense_to_sparse(m), b, y) == SolverStatus::SingularMatrix);
        CHECK_FALSE(solver.last_error().empty());
    }
}

TEST_CASE("NewtonSolver on a linear system", "[solver]") {
    // Ground plus one unknown: 4 * v = 2
    auto system = [](const Vector& /*x*/, SparseMatrix& A, Vector& b) {
        Matrix m(1, 1);
        m << 4.0;
        A = m.sparseView();
        b = Vector::Constant(1, 2.0);
    };

    NewtonSolver solver(NewtonOptions{10, 1e-9});
    NewtonResult result = solver.solve(Vector::Zero(2), system);

    REQUIRE(result.success());
    CHECK(result.iterations == 2);
    CHECK(result.x(0) == 0.0);
    CHECK_THAT(result.x(1), WithinRel(0.5, 1e-12));
    CHECK(result.max_delta == 0.0);

    REQUIRE(result.history.size() == 2);
    CHECK_FALSE(result.history[0].converged);
    CHECK_THAT(result.history[0].max_delta, WithinRel(0.5, 1e-12));
    CHECK(result.history.last().converged);
}

TEST_CASE("NewtonSolver on a scalar nonlinear equation", "[solver]") {
    // f(v) = v^2 - 2, linearized as 2 v_k * v = v_k^2 + 2
    auto system = [](const Vector& x, SparseMatrix& A, Vector& b) {
        const Real v = x(1);
        Matrix m(1, 1);
        m << 2.0 * v;
        A = m.sparseView();
        b = Vector::Constant(1, v * v + 2.0);
    };

    SECTION("converges quadratically") {
        NewtonSolver solver(NewtonOptions{50, 1e-12});
        Vector x0(2);
        x0 << 0.0, 1.0;
        NewtonResult result = solver.solve(x0, system);
        REQUIRE(result.success());
        CHECK_THAT(result.x(1), WithinRel(std::sqrt(2.0), 1e-12));
        CHECK(result.iterations < 10);
        CHECK_FALSE(result.history.is_diverging());
    }

    SECTION("gives up after max_iterations") {
        NewtonSolver solver(NewtonOptions{2, 0.0});
        Vector x0(2);
        x0 << 0.0, 1.0;
        NewtonResult result = solver.solve(x0, system);
        CHECK(result.status == SolverStatus::MaxIterationsReached);
        CHECK(result.iterations == 2);
        CHECK(result.history.size() == 2);
        CHECK(result.error_message == "Newton iteration did not converge in 2 iterations");
    }

    SECTION("singular linearization is reported") {
        NewtonSolver solver;
        NewtonResult result = solver.solve(Vector::Zero(2), system);
        CHECK(result.status == SolverStatus::SingularMatrix);
        CHECK(result.iterations == 1);
        REQUIRE(result.history.size() == 1);
        CHECK_FALSE(result.history[0].converged);
    }
}

TEST_CASE("NewtonSolver reports divergence", "[solver]") {
    // f(v) = cbrt(v): every Newton step maps v to -2 v
    auto system = [](const Vector& x, SparseMatrix& A, Vector& b) {
        const Real v = x(1);
        const Real slope = 1.0 / (3.0 * std::cbrt(v) * std::cbrt(v));
        Matrix m(1, 1);
        m << slope;
        A = m.sparseView();
        b = Vector::Constant(1, slope * v - std::cbrt(v));
    };

    NewtonSolver solver(NewtonOptions{4, 1e-9});
    Vector x0(2);
    x0 << 0.0, 1.0;
    NewtonResult result = solver.solve(x0, system);
    CHECK(result.status == SolverStatus::MaxIterationsReached);
    CHECK_THAT(result.x(1), WithinRel(16.0, 1e-9));
    CHECK(result.history.is_diverging());
    CHECK(result.error_message ==
          "Newton iteration did not converge in 4 iterations (max delta kept growing)");
}

TEST_CASE("ConvergenceHistory", "[solver]") {
    ConvergenceHistory history;
    CHECK(history.empty());
    CHECK_FALSE(history.is_diverging());

    history.add_record({1, 1.0, false});
    history.add_record({2, 2.0, false});
    history.add_record({3, 4.0, false});
    CHECK(history.is_diverging());
    CHECK_FALSE(history.is_diverging(4));

    history.add_record({4, 0.5, false});
    CHECK_FALSE(history.is_diverging());

    for (int i = 0; i < 200; ++i) {
        history.add_record({5 + i, 0.1, false});
    }
    CHECK(history.size() == ConvergenceHistory::max_history);
}
