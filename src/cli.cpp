#include "cli.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <vector>

#include "evaluator.hpp"
#include "lexer.hpp"
#include "parser.hpp"
#include "print_debug.hpp"

namespace fs = std::filesystem;

int run_file_mode(const std::string& filename, RunMode mode, std::ostream& out, std::ostream& err) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    err << Evaluator::cerr_colored("Error: Could not open file " + filename) << std::endl;
    return 1;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  std::string source_code = buffer.str();

  try {
    SourceManager src_mgr(filename, source_code);
    Lexer lexer(source_code, filename, &src_mgr);
    std::vector < Token > tokens = lexer.tokenize();

    if (mode == RunMode::DumpTokens) {
      print_tokens(tokens, out);
      return 0;
    }

    Parser parser(tokens);
    std::unique_ptr < ProgramNode > ast = parser.parse();

    if (mode == RunMode::DumpAst) {
      print_program_debug(ast.get(), out);
      return 0;
    }

    Evaluator evaluator(out);
    evaluator.evaluate(*ast);
  } catch (const std::exception &e) {
    out.flush();
    err << Evaluator::cerr_colored(e.what()) << std::endl;
    return 1;
  }
  return 0;
}

int run_cli(int argc, char* argv[], std::ostream& out, std::ostream& err) {
  auto print_usage = [](std::ostream &os) {
    os << "Usage: bella [options] <file>\n"
    << "Options:\n"
    << "  -v, --version    Print version and exit\n"
    << "  -h, --help       Show this help message\n"
    << "  --tokens         Print the token stream instead of running\n"
    << "  --ast            Print the parsed program instead of running\n"
    << "\n"
    << "If a filename starts with '-', either use `--` to end options\n"
    << "or prefix the filename with a path (for example `./-weird.bella`):\n"
    << "  bella -- -weird.bella\n";
  };

  RunMode mode = RunMode::Execute;
  std::string potential;
  bool seen_double_dash = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (seen_double_dash) {
      // After `--` everything is a filename argument; take first one
      potential = arg;
      break;
    }

    if (arg == "--") {
      seen_double_dash = true;
      continue;
    }

    // If it looks like an option (starts with '-') handle/validate it
    if (!arg.empty() && arg[0] == '-') {
      if (arg == "-v" || arg == "--version") {
        out << "bella v" << BELLA_VERSION << std::endl;
        return 0;
      } else if (arg == "-h" || arg == "--help") {
        print_usage(out);
        return 0;
      } else if (arg == "--tokens") {
        mode = RunMode::DumpTokens;
        continue;
      } else if (arg == "--ast") {
        mode = RunMode::DumpAst;
        continue;
      } else {
        err << "bella: unknown option '" << arg << "'\n";
        err << "Try 'bella --help' for more information.\n";
        return 1;
      }
    }

    // First non-option argument is treated as filename
    potential = arg;
    break;
  }

  if (potential.empty()) {
    print_usage(err);
    return 1;
  }

  // Use the path as given, else try the .bella extension.
  fs::path p(potential);
  fs::path file_to_run;
  if (fs::exists(p)) {
    file_to_run = p;
  } else if (!p.has_extension() && fs::exists(fs::path(potential + ".bella"))) {
    file_to_run = fs::path(potential + ".bella");
  } else {
    err << Evaluator::cerr_colored("Error: File not found: " + potential) << std::endl;
    return 1;
  }

  return run_file_mode(file_to_run.string(), mode, out, err);
}
