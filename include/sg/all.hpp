#pragma once
// Umbrella header to simplify includes from bindings and examples.

// Core
#include "sg/core/errors.hpp"
#include "sg/core/config.hpp"
#include "sg/core/log.hpp"
#include "sg/core/operation.hpp"
#include "sg/core/value.hpp"

// Ops
#include "sg/ops/elementwise.hpp"
#include "sg/ops/graph.hpp"

// I/O
#include "sg/io/dot.hpp"

// End of umbrella
