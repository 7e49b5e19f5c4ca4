// tests/test_examples.cpp
// Worked examples: small closed-form functions with hand-derived gradients.
#include "test_framework.hpp"
#include <cmath>

#include "sg/core/value.hpp"
#include "sg/ops/elementwise.hpp"

using sg::Value;

static const double kPi = 3.14159265358979323846;

TEST("examples/basic_usage") {
    Value x(2.0, "x");
    Value y(3.0, "y");
    Value z = x * y + x.pow(2);
    z.backward();
    ASSERT_NEAR(z.value(), 10.0, 1e-10);
    ASSERT_NEAR(x.grad(), 7.0, 1e-10);
    ASSERT_NEAR(y.grad(), 2.0, 1e-10);
}

TEST("examples/linear_function") {
    Value x(2.0, "x");
    Value y = 3 * x + 1;
    y.backward();
    ASSERT_NEAR(y.value(), 7.0, 1e-10);
    ASSERT_NEAR(x.grad(), 3.0, 1e-10);
}

TEST("examples/quadratic_function") {
    Value x(3.0, "x");
    Value y = x.pow(2) + 2 * x + 1;
    y.backward();
    ASSERT_NEAR(y.value(), 16.0, 1e-10);
    ASSERT_NEAR(x.grad(), 8.0, 1e-10);
}

TEST("examples/sine_at_thirty_degrees") {
    Value x(kPi / 6, "x");
    Value y = x.sin();
    y.backward();
    ASSERT_NEAR(y.value(), 0.5, 1e-10);
    ASSERT_NEAR(x.grad(), std::cos(kPi / 6), 1e-10);
}

TEST("examples/polynomial_times_sine") {
    Value a(2.0, "a"), b(3.0, "b"), c(1.0, "c");
    Value result = (a.pow(2) + b) * c.sin();
    result.backward();
    ASSERT_NEAR(result.value(), 7.0 * std::sin(1.0), 1e-10);
    ASSERT_NEAR(a.grad(), 4.0 * std::sin(1.0), 1e-10);
    ASSERT_NEAR(b.grad(), std::sin(1.0), 1e-10);
    ASSERT_NEAR(c.grad(), 7.0 * std::cos(1.0), 1e-10);
}

TEST("examples/rational_expression_squared") {
    // ((a + b) * (c - a) / b) ** 2
    const double a0 = 1.5, b0 = -2.0, c0 = 0.5;
    Value a(a0), b(b0), c(c0);
    Value expr = ((a + b) * (c - a) / b).pow(2);
    expr.backward();

    const double u = (a0 + b0) * (c0 - a0) / b0;
    ASSERT_NEAR(expr.value(), u * u, 1e-12);
    const double du_da = ((c0 - a0) - (a0 + b0)) / b0;
    const double du_db = (c0 - a0) / b0 - (a0 + b0) * (c0 - a0) / (b0 * b0);
    const double du_dc = (a0 + b0) / b0;
    ASSERT_NEAR(a.grad(), 2 * u * du_da, 1e-12);
    ASSERT_NEAR(b.grad(), 2 * u * du_db, 1e-12);
    ASSERT_NEAR(c.grad(), 2 * u * du_dc, 1e-12);
}

TEST("examples/chain_rule_cubic") {
    Value x(2.0);
    Value y = (x * 3.0 + 1.0).pow(3);
    y.backward();
    ASSERT_NEAR(y.value(), 343.0, 1e-10);
    ASSERT_NEAR(x.grad(), 9.0 * 49.0, 1e-9);
}

TEST("examples/exp_sin_cosh_log_mix") {
    // exp(sin(x)) * cosh(y) + log(x + y)
    Value x(0.5), y(1.0);
    Value expr = x.sin().exp() * y.cosh() + (x + y).log();
    expr.backward();
    const double es = std::exp(std::sin(0.5));
    ASSERT_NEAR(expr.value(), es * std::cosh(1.0) + std::log(1.5), 1e-12);
    ASSERT_NEAR(x.grad(), es * std::cos(0.5) * std::cosh(1.0) + 1.0 / 1.5, 1e-12);
    ASSERT_NEAR(y.grad(), es * std::sinh(1.0) + 1.0 / 1.5, 1e-12);
}

TEST("examples/exp_sin_times_cos") {
    Value x(1.0);
    Value y = x.sin().exp() * x.cos();
    y.backward();
    const double es = std::exp(std::sin(1.0));
    ASSERT_NEAR(y.value(), es * std::cos(1.0), 1e-12);
    ASSERT_NEAR(x.grad(), es * std::cos(1.0) * std::cos(1.0) - es * std::sin(1.0), 1e-12);
}

TEST("examples/hyperbolic_identity") {
    // cosh^2 - sinh^2 == 1, so the gradient vanishes
    Value x(0.9);
    Value y = x.cosh().pow(2) - x.sinh().pow(2);
    y.backward();
    ASSERT_NEAR(y.value(), 1.0, 1e-12);
    ASSERT_NEAR(x.grad(), 0.0, 1e-12);
}

TEST("examples/labelled_intermediates") {
    Value x(2.0, "x"), y(3.0, "y");
    Value z = x * y;
    z.set_label("z = x*y");
    Value w = z + x;
    w.set_label("w = z+x");
    Value result = w.pow(2);
    result.set_label("result");
    result.backward();
    // result = (xy + x)^2 = 64
    ASSERT_NEAR(result.value(), 64.0, 1e-12);
    ASSERT_NEAR(x.grad(), 2 * 8.0 * (3.0 + 1.0), 1e-12);
    ASSERT_NEAR(y.grad(), 2 * 8.0 * 2.0, 1e-12);
}
