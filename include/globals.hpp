#pragma once
#include "evaluator.hpp"

// Bind the built-in library (sin, cos, hypot, sqrt, exp, ln, π) into `env`.
void init_globals(EnvPtr env);
