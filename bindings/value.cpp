// bindings/value.cpp: single TU pybind11 bindings for sg::Value and the
// scalar ops. Builds the `scalargrad` extension module.
#include <optional>
#include <string>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "sg/all.hpp"

namespace py = pybind11;

#ifndef SG_BINDINGS_VERSION
#define SG_BINDINGS_VERSION "0.1.0"
#endif

namespace {

// Python-side literal coercion: Value passes through, anything float() accepts
// becomes a fresh leaf, everything else is a TypeCoercionError.
sg::Value coerce(const py::handle& obj) {
  if (py::isinstance<sg::Value>(obj)) return obj.cast<sg::Value>();
  if (py::isinstance<py::float_>(obj) || py::isinstance<py::int_>(obj) ||
      py::hasattr(obj, "__float__")) {
    return sg::Value::from_literal(py::float_(py::reinterpret_borrow<py::object>(obj)).cast<double>());
  }
  const std::string tname = py::str(obj.get_type().attr("__name__")).cast<std::string>();
  throw sg::TypeCoercionError("unsupported operand type for scalargrad.Value: '" + tname + "'");
}

} // anon

PYBIND11_MODULE(scalargrad, m) {
  m.doc() = "Scalar reverse-mode automatic differentiation";
  m.attr("__version__") = SG_BINDINGS_VERSION;

  // DomainError -> ValueError subclass, TypeCoercionError -> TypeError subclass
  py::register_exception<sg::DomainError>(m, "DomainError", PyExc_ValueError);
  py::register_exception<sg::TypeCoercionError>(m, "TypeCoercionError", PyExc_TypeError);

  // --- Config ---
  m.def("set_trace", &sg::config::set_trace, py::arg("enabled"),
        "Enable/disable backward trace logging to stderr");
  m.def("trace_enabled", &sg::config::trace_enabled);
  m.def("set_warn_nonfinite", &sg::config::set_warn_nonfinite, py::arg("enabled"));
  m.def("set_dot_precision", &sg::config::set_dot_precision, py::arg("digits"));

  py::class_<sg::Value>(m, "Value")
    .def(py::init([](py::object value, std::optional<std::string> label) {
           sg::Value v = sg::Value::from_literal(coerce(value).value());
           if (label) v.set_label(*label);
           return v;
         }),
         py::arg("value"), py::arg("label") = py::none())
    .def_property_readonly("value", &sg::Value::value)
    .def_property_readonly("grad", &sg::Value::grad)
    .def_property_readonly("op", [](const sg::Value& v) -> py::object {
        if (!v.op()) return py::none();
        return py::str(sg::symbol(*v.op()));
      })
    .def_property("label",
      [](const sg::Value& v) { return v.label(); },
      [](sg::Value& v, std::optional<std::string> label) {
        if (label) v.set_label(std::move(*label)); else v.clear_label();
      })
    .def_property_readonly("prev", &sg::Value::parents)
    .def("backward", &sg::Value::backward)
    .def("zero_grad", &sg::Value::zero_grad)

    // arithmetic, including reflected forms for literal-on-the-left
    .def("__add__",      [](const sg::Value& a, py::object b) { return sg::add(a, coerce(b)); })
    .def("__radd__",     [](const sg::Value& a, py::object b) { return sg::add(coerce(b), a); })
    .def("__sub__",      [](const sg::Value& a, py::object b) { return sg::sub(a, coerce(b)); })
    .def("__rsub__",     [](const sg::Value& a, py::object b) { return sg::sub(coerce(b), a); })
    .def("__mul__",      [](const sg::Value& a, py::object b) { return sg::mul(a, coerce(b)); })
    .def("__rmul__",     [](const sg::Value& a, py::object b) { return sg::mul(coerce(b), a); })
    .def("__truediv__",  [](const sg::Value& a, py::object b) { return sg::div(a, coerce(b)); })
    .def("__rtruediv__", [](const sg::Value& a, py::object b) { return sg::div(coerce(b), a); })
    .def("__pow__",      [](const sg::Value& a, py::object b) { return sg::pow(a, coerce(b)); })
    .def("__rpow__",     [](const sg::Value& a, py::object b) { return sg::pow(coerce(b), a); })
    .def("__neg__",      [](const sg::Value& a) { return sg::neg(a); })

    // transcendentals
    .def("exp",  &sg::Value::exp)
    .def("log",  &sg::Value::log)
    .def("sin",  &sg::Value::sin)
    .def("cos",  &sg::Value::cos)
    .def("tan",  &sg::Value::tan)
    .def("cot",  &sg::Value::cot)
    .def("sinh", &sg::Value::sinh)
    .def("cosh", &sg::Value::cosh)
    .def("tanh", &sg::Value::tanh)
    .def("coth", &sg::Value::coth)

    .def("__repr__", [](const sg::Value& v) { return sg::to_string(v); })
    .def("to_dot", [](const sg::Value& v, int precision) {
        sg::DotOptions opts;
        opts.precision = precision;
        return sg::to_dot(v, opts);
      }, py::arg("precision") = 0)
    // Writes <filename>.dot; rendering to svg/png is left to Graphviz's `dot`.
    .def("visualize", [](const sg::Value& v, const std::string& filename) {
        const std::string path = filename + ".dot";
        sg::write_dot(v, path);
        return path;
      }, py::arg("filename") = "graph")
    ;

  // --- Graph helpers ---
  m.def("detach", &sg::detach, py::arg("x"));
  m.def("topo_order", &sg::topo_order, py::arg("root"));

  // Functional forms, accepting Values or numbers
  m.def("add", [](py::object a, py::object b) { return sg::add(coerce(a), coerce(b)); }, py::arg("a"), py::arg("b"));
  m.def("sub", [](py::object a, py::object b) { return sg::sub(coerce(a), coerce(b)); }, py::arg("a"), py::arg("b"));
  m.def("mul", [](py::object a, py::object b) { return sg::mul(coerce(a), coerce(b)); }, py::arg("a"), py::arg("b"));
  m.def("div", [](py::object a, py::object b) { return sg::div(coerce(a), coerce(b)); }, py::arg("a"), py::arg("b"));
  m.def("pow", [](py::object a, py::object b) { return sg::pow(coerce(a), coerce(b)); }, py::arg("base"), py::arg("exponent"));
  m.def("neg", [](py::object x) { return sg::neg(coerce(x)); }, py::arg("x"));
  m.def("exp", [](py::object x) { return sg::expv(coerce(x)); }, py::arg("x"));
  m.def("log", [](py::object x) { return sg::logv(coerce(x)); }, py::arg("x"));
  m.def("sin", [](py::object x) { return sg::sinv(coerce(x)); }, py::arg("x"));
  m.def("cos", [](py::object x) { return sg::cosv(coerce(x)); }, py::arg("x"));
  m.def("tan", [](py::object x) { return sg::tanv(coerce(x)); }, py::arg("x"));
  m.def("cot", [](py::object x) { return sg::cotv(coerce(x)); }, py::arg("x"));
  m.def("sinh", [](py::object x) { return sg::sinhv(coerce(x)); }, py::arg("x"));
  m.def("cosh", [](py::object x) { return sg::coshv(coerce(x)); }, py::arg("x"));
  m.def("tanh", [](py::object x) { return sg::tanhv(coerce(x)); }, py::arg("x"));
  m.def("coth", [](py::object x) { return sg::cothv(coerce(x)); }, py::arg("x"));
}
