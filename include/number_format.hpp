#pragma once
#include <string>

// Canonical text of a Bella number: plain decimal for exponents in [-6, 21),
// shortest scientific form outside that window, "NaN", "Infinity", "-Infinity".
// Negative zero prints as "0". Independent of the C++ locale.
std::string format_number(double d);
