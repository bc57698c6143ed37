#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "BellaError.hpp"
#include "cli.hpp"
#include "evaluator.hpp"
#include "lexer.hpp"
#include "parser.hpp"
#include "print_debug.hpp"

namespace fs = std::filesystem;

class FileExecutionTest : public ::testing::Test {
   protected:
    void SetUp() override {
        test_dir = fs::temp_directory_path() / "bella_test";
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path test_dir;

    void createTestFile(const std::string& filename, const std::string& content) {
        fs::path filepath = test_dir / filename;
        std::ofstream file(filepath);
        file << content;
        file.close();
    }

    std::string readFile(const fs::path& filepath) {
        std::ifstream file(filepath);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    // Same pipeline the CLI drives: source manager, lexer, parser, evaluator.
    std::string runFile(const fs::path& filepath) {
        std::string source = readFile(filepath);
        SourceManager mgr(filepath.string(), source);
        Lexer lexer(source, filepath.string(), &mgr);
        auto tokens = lexer.tokenize();
        Parser parser(tokens);
        auto ast = parser.parse();

        std::ostringstream out;
        Evaluator evaluator(out);
        evaluator.evaluate(*ast);
        return out.str();
    }

    struct CliResult {
        int status;
        std::string out;
        std::string err;
    };

    // Drive the command line exactly as `bella <args...>` would.
    CliResult runCli(std::vector<std::string> args) {
        args.insert(args.begin(), "bella");
        std::vector<char*> argv;
        for (auto& a : args) argv.push_back(a.data());
        argv.push_back(nullptr);

        std::ostringstream out, err;
        int status = run_cli(static_cast<int>(args.size()), argv.data(), out, err);
        return {status, out.str(), err.str()};
    }
};

TEST_F(FileExecutionTest, ExecutesSimpleScript) {
    createTestFile("test.bella", "x := 100\nx = -20\nprint(9 * x)\n");
    EXPECT_EQ(runFile(test_dir / "test.bella"), "-180\n");
}

TEST_F(FileExecutionTest, ExecutesMultiStatementScript) {
    createTestFile("loop.bella",
        "// sum of squares\n"
        "fun square(n) = n * n\n"
        "i := 0\n"
        "total := 0\n"
        "while (i < 4) {\n"
        "  i = i + 1\n"
        "  total = total + square(i)\n"
        "}\n"
        "print total\n"
        "print [i, total > 20]\n");
    EXPECT_EQ(runFile(test_dir / "loop.bella"), "30\n[4, true]\n");
}

TEST_F(FileExecutionTest, HandlesFileNotFound) {
    fs::path nonexistent = test_dir / "nonexistent.bella";
    std::ifstream file(nonexistent);
    EXPECT_FALSE(file.is_open());
}

TEST_F(FileExecutionTest, OutputBeforeErrorIsKept) {
    createTestFile("partial.bella", "print 1\nprint 2\nprint missing\nprint 3\n");

    fs::path filepath = test_dir / "partial.bella";
    std::string source = readFile(filepath);
    Lexer lexer(source, filepath.string());
    auto tokens = lexer.tokenize();
    Parser parser(tokens);
    auto ast = parser.parse();

    std::ostringstream out;
    Evaluator evaluator(out);
    EXPECT_THROW(evaluator.evaluate(*ast), UnboundVariableError);
    EXPECT_EQ(out.str(), "1\n2\n");
}

TEST_F(FileExecutionTest, RuntimeErrorShowsSourceLine) {
    createTestFile("err.bella", "a := [1, 2, 3]\nprint(a[5])\n");
    fs::path filepath = test_dir / "err.bella";
    try {
        runFile(filepath);
        FAIL() << "expected IndexOutOfRangeError";
    } catch (const IndexOutOfRangeError& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("IndexOutOfRangeError"), std::string::npos);
        EXPECT_NE(msg.find(":2:"), std::string::npos);
        EXPECT_NE(msg.find("print(a[5])"), std::string::npos);
    }
}

TEST_F(FileExecutionTest, SyntaxErrorStopsBeforeAnyOutput) {
    createTestFile("syntax.bella", "print 1\nprint (2 +\n");
    EXPECT_THROW(runFile(test_dir / "syntax.bella"), SyntaxError);
}

TEST_F(FileExecutionTest, HandlesWindowsLineEndings) {
    createTestFile("crlf.bella", "x := 2\r\nprint x ** 3\r\n");
    EXPECT_EQ(runFile(test_dir / "crlf.bella"), "8\n");
}

TEST_F(FileExecutionTest, DumpsTokens) {
    std::vector<Token> tokens = Lexer("x := 1", "dump.bella").tokenize();
    std::ostringstream out;
    print_tokens(tokens, out);
    std::string dump = out.str();
    EXPECT_NE(dump.find("IDENTIFIER"), std::string::npos);
    EXPECT_NE(dump.find("WALRUS"), std::string::npos);
    EXPECT_NE(dump.find("dump.bella:1:1"), std::string::npos);
}

TEST_F(FileExecutionTest, DumpsProgramTree) {
    Lexer lexer("fun sq(n) = n * n\nprint sq(3)", "dump.bella");
    auto tokens = lexer.tokenize();
    Parser parser(tokens);
    auto ast = parser.parse();

    std::ostringstream out;
    print_program_debug(ast.get(), out);
    std::string dump = out.str();
    EXPECT_NE(dump.find("sq"), std::string::npos);
    EXPECT_NE(dump.find("(n * n)"), std::string::npos);
}

// ============================================================================
// COMMAND LINE
// ============================================================================

TEST_F(FileExecutionTest, CliRunsScriptAndExitsZero) {
    createTestFile("ok.bella", "fun square(n) = n * n\nprint(square(5))\n");
    auto r = runCli({(test_dir / "ok.bella").string()});
    EXPECT_EQ(r.status, 0);
    EXPECT_EQ(r.out, "25\n");
    EXPECT_EQ(r.err, "");
}

TEST_F(FileExecutionTest, CliFallsBackToBellaExtension) {
    createTestFile("script.bella", "print 1 + 1\n");
    auto r = runCli({(test_dir / "script").string()});
    EXPECT_EQ(r.status, 0);
    EXPECT_EQ(r.out, "2\n");
}

TEST_F(FileExecutionTest, CliReportsMissingFile) {
    auto r = runCli({(test_dir / "nowhere").string()});
    EXPECT_EQ(r.status, 1);
    EXPECT_NE(r.err.find("File not found"), std::string::npos);
    EXPECT_EQ(r.out, "");
}

TEST_F(FileExecutionTest, CliExitsOneOnEvaluationError) {
    createTestFile("bad.bella", "print 1\nprint missing\n");
    auto r = runCli({(test_dir / "bad.bella").string()});
    EXPECT_EQ(r.status, 1);
    EXPECT_EQ(r.out, "1\n");
    EXPECT_NE(r.err.find("UnboundVariableError"), std::string::npos);
    EXPECT_NE(r.err.find("missing"), std::string::npos);
}

TEST_F(FileExecutionTest, CliExitsOneOnSyntaxError) {
    createTestFile("syntax.bella", "x := 1 @ 2\n");
    auto r = runCli({(test_dir / "syntax.bella").string()});
    EXPECT_EQ(r.status, 1);
    EXPECT_NE(r.err.find("SyntaxError"), std::string::npos);
}

TEST_F(FileExecutionTest, CliRejectsUnknownOption) {
    auto r = runCli({"--bogus", "file.bella"});
    EXPECT_EQ(r.status, 1);
    EXPECT_NE(r.err.find("unknown option '--bogus'"), std::string::npos);
}

TEST_F(FileExecutionTest, CliWithoutFileShowsUsage) {
    auto r = runCli({});
    EXPECT_EQ(r.status, 1);
    EXPECT_NE(r.err.find("Usage: bella"), std::string::npos);
}

TEST_F(FileExecutionTest, CliHelpAndVersion) {
    auto help = runCli({"-h"});
    EXPECT_EQ(help.status, 0);
    EXPECT_NE(help.out.find("Usage: bella"), std::string::npos);

    auto version = runCli({"--version"});
    EXPECT_EQ(version.status, 0);
    EXPECT_EQ(version.out, std::string("bella v") + BELLA_VERSION + "\n");
}

TEST_F(FileExecutionTest, CliDoubleDashEndsOptions) {
    createTestFile("-dash.bella", "print 7\n");
    fs::path cwd = fs::current_path();
    fs::current_path(test_dir);
    auto r = runCli({"--", "-dash.bella"});
    fs::current_path(cwd);
    EXPECT_EQ(r.status, 0);
    EXPECT_EQ(r.out, "7\n");
}

TEST_F(FileExecutionTest, CliDumpModesDoNotRunTheProgram) {
    createTestFile("dump.bella", "print missing\n");
    fs::path file = test_dir / "dump.bella";

    auto tokens = runCli({"--tokens", file.string()});
    EXPECT_EQ(tokens.status, 0);
    EXPECT_NE(tokens.out.find("PRINT"), std::string::npos);

    auto ast = runCli({"--ast", file.string()});
    EXPECT_EQ(ast.status, 0);
    EXPECT_NE(ast.out.find("PrintStatement"), std::string::npos);
}
