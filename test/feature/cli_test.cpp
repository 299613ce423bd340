#include <catch2/catch_test_macros.hpp>

#define STRINGIFY_HELPER(x) #x
#define STRINGIFY(x) STRINGIFY_HELPER(x)

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace fs = std::filesystem;

static const std::string xr_cli = STRINGIFY(XR_CLI);

static const std::string book_xml =
    R"(<book><title lang="en" price="12.00">XML</title><description/></book>)";

// Portable exit code extraction: WEXITSTATUS on POSIX, raw value on Windows
static int
exit_code(int status) {
#ifdef _WIN32
  return status;
#else
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  return -1;
#endif
}

static std::string
slurp(const fs::path& path) {
  std::ifstream in(path);
  return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

static int
run_cli(const std::string& args) {
  std::string cmd = xr_cli + " " + args + " >/dev/null 2>/dev/null";
  return exit_code(std::system(cmd.c_str()));
}

static int
run_cli_stderr(const std::string& args, std::string& stderr_output) {
  auto tmp = fs::temp_directory_path() / "xr_cli_stderr.txt";
  std::string cmd = xr_cli + " " + args + " >/dev/null 2>" + tmp.string();
  int rc = exit_code(std::system(cmd.c_str()));
  stderr_output = slurp(tmp);
  fs::remove(tmp);
  return rc;
}

static int
run_cli_stdout(const std::string& args, std::string& stdout_output) {
  auto tmp = fs::temp_directory_path() / "xr_cli_stdout.txt";
  std::string cmd = xr_cli + " " + args + " >" + tmp.string() + " 2>/dev/null";
  int rc = exit_code(std::system(cmd.c_str()));
  stdout_output = slurp(tmp);
  fs::remove(tmp);
  return rc;
}

static std::string
write_tmp_file(const std::string& name, const std::string& content) {
  auto path = fs::temp_directory_path() / ("xr_cli_" + name);
  std::ofstream out(path, std::ios::binary);
  out << content;
  return path.string();
}

// ===== Usage =====

TEST_CASE("--help exits 0 and produces output", "[cli]") {
  std::string err;
  int rc = run_cli_stderr("--help", err);
  CHECK(rc == 0);
  CHECK(err.find("Usage") != std::string::npos);
}

TEST_CASE("-h exits 0", "[cli]") {
  CHECK(run_cli("-h") == 0);
}

TEST_CASE("--version exits 0 and contains version", "[cli]") {
  std::string err;
  int rc = run_cli_stderr("--version", err);
  CHECK(rc == 0);
  CHECK(err.find("xr ") != std::string::npos);
}

TEST_CASE("no arguments exits 1 (usage error)", "[cli]") {
  CHECK(run_cli("") == 1);
}

TEST_CASE("unknown option exits 1", "[cli]") {
  std::string err;
  CHECK(run_cli_stderr("--bogus events x.xml", err) == 1);
  CHECK(err.find("--bogus") != std::string::npos);
}

TEST_CASE("unknown command exits 1", "[cli]") {
  CHECK(run_cli("frobnicate x.xml") == 1);
}

TEST_CASE("nonexistent input file exits 2 (file error)", "[cli]") {
  CHECK(run_cli("events nonexistent.xml") == 2);
}

// ===== events =====

TEST_CASE("events prints one event per line", "[cli]") {
  auto file = write_tmp_file("events.xml", R"(<a x="1"><b/>t</a>)");
  std::string out;
  int rc = run_cli_stdout("events " + file, out);
  fs::remove(file);

  CHECK(rc == 0);
  CHECK(out == "start_document\n"
               "start_element a x=\"1\" @1\n"
               "start_element b / @2\n"
               "end_element b @1\n"
               "characters \"t\"\n"
               "end_element a @0\n"
               "end_document\n");
}

TEST_CASE("events keeps whitespace on request", "[cli]") {
  auto file = write_tmp_file("ws.xml", "<a> </a>");
  std::string ignored;
  std::string preserved;
  run_cli_stdout("events " + file, ignored);
  run_cli_stdout("events --preserve-whitespace " + file, preserved);
  fs::remove(file);

  CHECK(ignored.find("characters") == std::string::npos);
  CHECK(preserved.find("characters \" \"") != std::string::npos);
}

TEST_CASE("events reads standard input", "[cli]") {
  auto file = write_tmp_file("stdin.xml", "<only/>");
  std::string out;
  int rc = run_cli_stdout("events - <" + file, out);
  fs::remove(file);

  CHECK(rc == 0);
  CHECK(out.find("start_element only / @1") != std::string::npos);
}

// ===== malformed input =====

TEST_CASE("malformed markup is skipped with warnings", "[cli]") {
  auto file = write_tmp_file("bad.xml", "<a>&bad<");
  std::string err;
  int rc = run_cli_stderr("events " + file, err);

  std::string out;
  run_cli_stdout("events " + file, out);
  fs::remove(file);

  CHECK(rc == 0);
  CHECK(err.find("line 1, column 4 (offset 3)") != std::string::npos);
  CHECK(err.find("skipped 2 malformed positions") != std::string::npos);
  CHECK(out.find("parse_error") == std::string::npos);
  CHECK(out.find("characters \"bad\"") != std::string::npos);
}

TEST_CASE("--fail-on-error exits 3 for malformed markup", "[cli]") {
  auto file = write_tmp_file("bad_fail.xml", "<a>&bad<");
  int rc = run_cli("--fail-on-error events " + file);
  fs::remove(file);
  CHECK(rc == 3);
}

TEST_CASE("--strict rejects malformed markup", "[cli]") {
  auto file = write_tmp_file("bad_strict.xml", "<a><b></a>");
  std::string err;
  int rc = run_cli_stderr("--strict tree " + file, err);
  fs::remove(file);
  CHECK(rc == 3);
  CHECK(err.find("xr: error:") != std::string::npos);
}

TEST_CASE("--strict accepts well-formed markup", "[cli]") {
  auto file = write_tmp_file("good_strict.xml", book_xml);
  std::string out;
  int rc = run_cli_stdout("--strict events " + file, out);
  fs::remove(file);
  CHECK(rc == 0);
  CHECK(out.find("start_element description / @2") != std::string::npos);
}

// ===== tree and axis =====

TEST_CASE("tree prints nodes in document order", "[cli]") {
  auto file = write_tmp_file("tree.xml", book_xml);
  std::string out;
  int rc = run_cli_stdout("tree " + file, out);
  fs::remove(file);

  CHECK(rc == 0);
  CHECK(out == "0\tdocument\n"
               "1\t  element book\n"
               "2\t    element title\n"
               "3\t      attribute lang \"en\"\n"
               "4\t      attribute price \"12.00\"\n"
               "5\t      text \"XML\"\n"
               "6\t    element description\n");
}

TEST_CASE("axis prints the nodes on the axis with their indices", "[cli]") {
  auto file = write_tmp_file("axis.xml", book_xml);
  std::string following;
  std::string ancestors;
  std::string preceding;
  int rc = run_cli_stdout("axis following 3 " + file, following);
  run_cli_stdout("axis ancestor 2 " + file, ancestors);
  run_cli_stdout("axis preceding 6 " + file, preceding);
  fs::remove(file);

  CHECK(rc == 0);
  CHECK(following == "4\tattribute price \"12.00\"\n"
                     "5\ttext \"XML\"\n"
                     "6\telement description\n");
  CHECK(ancestors == "1\telement book\n"
                     "0\tdocument\n");
  CHECK(preceding == "2\telement title\n"
                     "3\tattribute lang \"en\"\n"
                     "4\tattribute price \"12.00\"\n"
                     "5\ttext \"XML\"\n");
}

TEST_CASE("axis rejects bad arguments", "[cli]") {
  auto file = write_tmp_file("axis_bad.xml", book_xml);
  int unknown_axis = run_cli("axis sideways 1 " + file);
  int bad_index = run_cli("axis following x1 " + file);
  int out_of_range = run_cli("axis following 7 " + file);
  int missing_file = run_cli("axis following 1");
  fs::remove(file);

  CHECK(unknown_axis == 1);
  CHECK(bad_index == 1);
  CHECK(out_of_range == 1);
  CHECK(missing_file == 1);
}
