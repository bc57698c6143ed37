#pragma once
#include <unistd.h>  // for isatty(), STDERR_FILENO

#include <string>  // for std::string

namespace Color {
inline bool supports_color(int fd = STDERR_FILENO) {
    return isatty(fd);
}
const std::string reset = "\033[0m";

const std::string red = "\033[31m";
}  // namespace Color
