#include <xr/axis.hpp>
#include <xr/document.hpp>
#include <xr/event_dispatcher.hpp>
#include <xr/expat_reader.hpp>
#include <xr/grammar.hpp>
#include <xr/push_reader.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_parse = 3;

enum class command {
  events,
  tree,
  axis,
};

struct cli_options {
  command cmd = command::events;
  std::string input_file;
  xr::whitespace_handling whitespace = xr::whitespace_handling::ignore;
  bool strict = false;
  bool fail_on_error = false;
  std::optional<xr::axis> axis;
  std::size_t axis_origin = 0;
  bool show_help = false;
  bool show_version = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: xr events [options] <file>\n"
     << "       xr tree [options] <file>\n"
     << "       xr axis <ancestors|descendants|preceding|following> <index> "
        "[options] <file>\n"
     << "\n"
     << "Commands:\n"
     << "  events                 Print the event stream, one event per line\n"
     << "  tree                   Print every node in document order with its "
        "index\n"
     << "  axis                   Print the nodes on an axis of the node at a "
        "document order index\n"
     << "\n"
     << "Options:\n"
     << "  --preserve-whitespace  Report whitespace-only text\n"
     << "  --trim-whitespace      Trim text and drop whitespace-only text\n"
     << "  --strict               Use the expat reader and stop at the first "
        "error\n"
     << "  --fail-on-error        Exit with status 3 if malformed markup was "
        "skipped\n"
     << "  -h, --help             Show this help message\n"
     << "  --version              Show version information\n"
     << "\n"
     << "Use - as <file> to read standard input.\n";
}

static void
print_version(std::ostream& os) {
  os << "xr " << XR_VERSION << "\n";
}

static cli_options
parse_args(int argc, char* argv[]) {
  cli_options opts;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    }

    if (arg == "--version") {
      opts.show_version = true;
      return opts;
    }

    if (arg == "--preserve-whitespace") {
      opts.whitespace = xr::whitespace_handling::preserve;
      continue;
    }

    if (arg == "--trim-whitespace") {
      opts.whitespace = xr::whitespace_handling::trim;
      continue;
    }

    if (arg == "--strict") {
      opts.strict = true;
      continue;
    }

    if (arg == "--fail-on-error") {
      opts.fail_on_error = true;
      continue;
    }

    if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "xr: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    positional.push_back(arg);
  }

  if (positional.empty()) {
    std::cerr << "xr: missing command\n";
    std::exit(exit_usage);
  }

  const std::string& name = positional[0];
  std::size_t expected = 2;
  if (name == "events") {
    opts.cmd = command::events;
  } else if (name == "tree") {
    opts.cmd = command::tree;
  } else if (name == "axis") {
    opts.cmd = command::axis;
    expected = 4;
    if (positional.size() != expected) {
      std::cerr << "xr axis: expected <axis> <index> <file>\n";
      std::exit(exit_usage);
    }
    opts.axis = xr::axis_from_name(positional[1]);
    if (!opts.axis) {
      std::cerr << "xr axis: unknown axis: " << positional[1] << "\n";
      std::exit(exit_usage);
    }
    try {
      std::size_t used = 0;
      opts.axis_origin = std::stoul(positional[2], &used);
      if (used != positional[2].size()) { throw std::invalid_argument("index"); }
    } catch (const std::exception&) {
      std::cerr << "xr axis: index must be a non-negative integer: "
                << positional[2] << "\n";
      std::exit(exit_usage);
    }
  } else {
    std::cerr << "xr: unknown command: " << name << "\n";
    std::exit(exit_usage);
  }

  if (positional.size() != expected) {
    std::cerr << "xr " << name << ": expected exactly one input file\n";
    std::exit(exit_usage);
  }
  opts.input_file = positional.back();
  return opts;
}

static std::string
read_file(const std::string& path) {
  std::ostringstream ss;
  if (path == "-") {
    ss << std::cin.rdbuf();
    return ss.str();
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "xr: cannot open file: " << path << "\n";
    std::exit(exit_io);
  }
  ss << in.rdbuf();
  return ss.str();
}

// Collects malformed-markup offsets and reports each one on stderr.
class error_log {
  const std::string& text_;
  std::size_t count_ = 0;

public:
  explicit error_log(const std::string& text) : text_(text) {}

  void
  report(std::size_t offset) {
    ++count_;
    auto where = xr::locate(text_, offset);
    std::cerr << "xr: warning: malformed markup at line " << where.line
              << ", column " << where.column << " (offset " << offset << ")\n";
  }

  std::size_t
  count() const {
    return count_;
  }
};

static std::unique_ptr<xr::xml_reader>
make_reader(const cli_options& opts, const std::string& text, error_log& log) {
  xr::reader_options options;
  options.whitespace = opts.whitespace;
  options.on_parse_error = [&log](std::size_t offset) { log.report(offset); };
  if (opts.strict) {
    return std::make_unique<xr::expat_reader>(text, std::move(options));
  }
  return std::make_unique<xr::push_reader>(text, std::move(options));
}

static int
finish(const cli_options& opts, const error_log& log) {
  if (log.count() > 0) {
    std::cerr << "xr: skipped " << log.count() << " malformed position"
              << (log.count() == 1 ? "" : "s") << "\n";
    if (opts.fail_on_error) { return exit_parse; }
  }
  return exit_success;
}

static int
run_events(const cli_options& opts, const std::string& text) {
  error_log log(text);
  try {
    auto reader = make_reader(opts, text, log);
    xr::event_dispatcher dispatcher(
        [](const xr::sax_event& event) {
          if (!std::holds_alternative<xr::parse_error_event>(event)) {
            std::cout << event << "\n";
          }
        },
        opts.whitespace);
    dispatcher.dispatch(*reader);
  } catch (const std::exception& e) {
    std::cerr << "xr: error: " << e.what() << "\n";
    return exit_parse;
  }
  return finish(opts, log);
}

static int
run_tree(const cli_options& opts, const std::string& text) {
  error_log log(text);
  try {
    auto reader = make_reader(opts, text, log);
    xr::document doc(*reader);
    std::size_t index = 0;
    for (xr::node_id id : xr::document_order(doc)) {
      std::size_t depth = xr::ancestors(doc, id).to_vector().size();
      std::cout << index++ << '\t' << std::string(depth * 2, ' ')
                << xr::describe(doc, id) << "\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "xr: error: " << e.what() << "\n";
    return exit_parse;
  }
  return finish(opts, log);
}

static int
run_axis(const cli_options& opts, const std::string& text) {
  error_log log(text);
  try {
    auto reader = make_reader(opts, text, log);
    xr::document doc(*reader);
    auto order = xr::document_order(doc);
    if (opts.axis_origin >= order.size()) {
      std::cerr << "xr axis: index " << opts.axis_origin
                << " is out of range; the document has " << order.size()
                << " nodes\n";
      return exit_usage;
    }

    std::vector<std::size_t> index_of(doc.size());
    for (std::size_t i = 0; i < order.size(); ++i) {
      index_of[order[i]] = i;
    }

    xr::node_id origin = order[opts.axis_origin];
    for (xr::node_id id : xr::axis_view(doc, origin, *opts.axis)) {
      std::cout << index_of[id] << '\t' << xr::describe(doc, id) << "\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "xr: error: " << e.what() << "\n";
    return exit_parse;
  }
  return finish(opts, log);
}

int
main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);

  if (opts.show_help) {
    print_usage(std::cerr);
    return exit_success;
  }

  if (opts.show_version) {
    print_version(std::cerr);
    return exit_success;
  }

  std::string text = read_file(opts.input_file);

  switch (opts.cmd) {
    case command::events:
      return run_events(opts, text);
    case command::tree:
      return run_tree(opts, text);
    case command::axis:
      return run_axis(opts, text);
  }
  return exit_usage;
}
