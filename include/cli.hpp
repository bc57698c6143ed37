#pragma once
#include <ostream>
#include <string>

enum class RunMode {
    Execute,
    DumpTokens,
    DumpAst
};

// Lex, parse and run (or dump) one source file. Program output goes to `out`,
// diagnostics to `err`. Returns the process exit status.
int run_file_mode(const std::string& filename, RunMode mode, std::ostream& out, std::ostream& err);

// Full command line: options, file resolution (`<path>.bella` fallback), run.
int run_cli(int argc, char* argv[], std::ostream& out, std::ostream& err);
