#include <gtest/gtest.h>
#include <cstdlib>
#include <string>
#include <sys/wait.h>
#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/raw_ostream.h>
#include "test_env.hpp"

// Runs the pyemitc executable built beside this test; PYEMITC_PATH comes from the build.
namespace {

struct TempFile {
    explicit TempFile(const char* suffix){
        auto ec = llvm::sys::fs::createTemporaryFile("pyemitc", suffix, path);
        EXPECT_FALSE(ec) << ec.message();
    }
    ~TempFile(){ llvm::sys::fs::remove(path); }
    std::string str() const { return std::string(path.str()); }
    void write(const std::string& text) const {
        std::error_code ec;
        llvm::raw_fd_ostream os(path, ec, llvm::sys::fs::OF_None);
        ASSERT_FALSE(ec) << ec.message();
        os << text;
    }
    std::string read() const {
        auto buf = llvm::MemoryBuffer::getFile(path);
        return buf ? (*buf)->getBuffer().str() : std::string("<unreadable>");
    }
    llvm::SmallString<128> path;
};

struct Run { int code = -1; std::string out, err; };

Run run_pyemitc(const std::string& args, const std::string& stdin_text = ""){
    TempFile in(".edn"), out(".out"), err(".err");
    in.write(stdin_text);
    std::string cmd = std::string(PYEMITC_PATH) + " " + args + " <'" + in.str() + "' >'" + out.str() + "' 2>'" + err.str() + "'";
    int status = std::system(cmd.c_str());
    Run r;
    if(status != -1 && WIFEXITED(status)) r.code = WEXITSTATUS(status);
    r.out = out.read(); r.err = err.read();
    return r;
}

const char* kPointGraph = R"edn((graph :top-levels [(top :name "Point" :type Point)]
  :types [(class :name Point :properties [(prop :name "x" :type integer) (prop :name "y" :type integer)])]))edn";

const char* kPointSource =
    "class Point:\n"
    "    x: int\n"
    "    y: int\n"
    "\n"
    "    def __init__(self, x: int, y: int) -> None:\n"
    "        self.x = x\n"
    "        self.y = y\n";

class PyemitcTest : public ::testing::Test {
    ScopedEnv unions_{"PYEMIT_DECLARE_UNIONS", nullptr};
    ScopedEnv ascii_{"PYEMIT_ASCII_IDENTIFIERS", nullptr};
    ScopedEnv json_{"PYEMIT_DIAG_JSON", nullptr};
};

} // namespace

TEST_F(PyemitcTest, RendersGraphFileToStdout){
    TempFile graph(".edn");
    graph.write(kPointGraph);
    auto r = run_pyemitc("'" + graph.str() + "'");
    EXPECT_EQ(r.code, 0) << r.err;
    EXPECT_EQ(r.out, kPointSource);
    EXPECT_EQ(r.err, "");
}

TEST_F(PyemitcTest, ReadsStandardInputForDash){
    auto r = run_pyemitc("-", kPointGraph);
    EXPECT_EQ(r.code, 0) << r.err;
    EXPECT_EQ(r.out, kPointSource);
}

TEST_F(PyemitcTest, WritesOutputFile){
    TempFile dest(".py");
    auto r = run_pyemitc("-o '" + dest.str() + "' --comment 'do not edit' -", kPointGraph);
    EXPECT_EQ(r.code, 0) << r.err;
    EXPECT_EQ(r.out, "");
    EXPECT_EQ(dest.read(), std::string("# do not edit\n\n\n") + kPointSource);
}

TEST_F(PyemitcTest, TargetOptionFlags){
    auto r = run_pyemitc("--declare-unions -", R"edn((graph :top-levels [(top :name "Id" :type Id)]
  :types [(union :name Id :members [string integer])]))edn");
    EXPECT_EQ(r.code, 0) << r.err;
    EXPECT_NE(r.out.find("Id = Union[\n    str,\n    int,\n]\n"), std::string::npos) << r.out;

    auto help = run_pyemitc("--help");
    EXPECT_EQ(help.code, 0);
    EXPECT_NE(help.out.find("  --declare-unions  "), std::string::npos) << help.out;
    EXPECT_NE(help.out.find("  --ascii-identifiers  "), std::string::npos) << help.out;
}

TEST_F(PyemitcTest, GraphDiagnosticsExitWithOne){
    const char* bad = R"edn((graph :top-levels [(top :name "X" :type strng)]))edn";
    auto r = run_pyemitc("-", bad);
    EXPECT_EQ(r.code, 1);
    EXPECT_EQ(r.out, "");
    EXPECT_NE(r.err.find("-:1:"), std::string::npos) << r.err;
    EXPECT_NE(r.err.find("error[E2020]: unknown type 'strng'"), std::string::npos) << r.err;
    EXPECT_EQ(r.err.find("{\"success\""), std::string::npos) << r.err;

    ScopedEnv json("PYEMIT_DIAG_JSON", "1");
    auto j = run_pyemitc("-", bad);
    EXPECT_EQ(j.code, 1);
    EXPECT_NE(j.err.find("{\"success\":false,\"errors\":[{\"code\":\"E2020\""), std::string::npos) << j.err;

    auto malformed = run_pyemitc("-", "(graph :types [");
    EXPECT_EQ(malformed.code, 1);
    EXPECT_NE(malformed.err.find(": error: "), std::string::npos) << malformed.err;
}

TEST_F(PyemitcTest, NoneTypedRootExitsWithThree){
    auto r = run_pyemitc("-", R"edn((graph :top-levels [(top :name "Nothing" :type none)]))edn");
    EXPECT_EQ(r.code, 3);
    EXPECT_EQ(r.out, "");
    EXPECT_EQ(r.err.rfind("render error: none type reached the renderer", 0), 0u) << r.err;
}

TEST_F(PyemitcTest, UsageErrorsExitWithTwo){
    auto bogus = run_pyemitc("--bogus -", kPointGraph);
    EXPECT_EQ(bogus.code, 2);
    EXPECT_EQ(bogus.out, "");
    EXPECT_NE(bogus.err.find("unknown option: --bogus\nusage: pyemitc"), std::string::npos) << bogus.err;

    EXPECT_EQ(run_pyemitc("").code, 2);
    EXPECT_EQ(run_pyemitc("-o").code, 2);
    EXPECT_EQ(run_pyemitc("/nonexistent/graph.edn").code, 2);
}
