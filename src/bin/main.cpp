#include <segram/expat_reader.hpp>
#include <segram/grammar_library.hpp>
#include <segram/grammar_loader.hpp>
#include <segram/match_result.hpp>
#include <segram/parse_context.hpp>
#include <segram/segment_loader.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_parse = 3;
static constexpr int exit_no_match = 4;

struct cli_options {
  std::string grammar_file;
  std::string segments_file;
  std::string rule;
  segram::parse_settings settings;
  bool show_help = false;
  bool show_version = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: segram [options] <grammar.xml> <segments.xml>\n"
     << "\n"
     << "Options:\n"
     << "  -r <rule>         Rule to match (default: the grammar's root)\n"
     << "  --max-depth <N>   Match recursion limit (default: 255)\n"
     << "  --no-prune        Disable lookahead pruning\n"
     << "  -v                Increase log verbosity (repeatable, max 3)\n"
     << "  -h, --help        Show this help message\n"
     << "  --version         Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "segram " << SEGRAM_VERSION << "\n";
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

    if (arg == "--no-prune") {
      opts.settings.prune_options = false;
      continue;
    }

    if (arg == "-v" || arg == "-vv" || arg == "-vvv") {
      opts.settings.verbosity += static_cast<int>(arg.size()) - 1;
      continue;
    }

    if (arg == "-r") {
      if (i + 1 >= argc) {
        std::cerr << "segram: -r requires an argument\n";
        std::exit(exit_usage);
      }
      opts.rule = argv[++i];
      continue;
    }

    if (arg == "--max-depth") {
      if (i + 1 >= argc) {
        std::cerr << "segram: --max-depth requires an argument\n";
        std::exit(exit_usage);
      }
      try {
        opts.settings.max_match_depth = std::stoul(argv[++i]);
      } catch (const std::exception&) {
        std::cerr << "segram: --max-depth argument must be a number\n";
        std::exit(exit_usage);
      }
      continue;
    }

    if (arg[0] == '-') {
      std::cerr << "segram: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    positional.push_back(arg);
  }

  if (positional.size() > 2) {
    std::cerr << "segram: too many input files\n";
    std::exit(exit_usage);
  }
  if (positional.size() > 0) opts.grammar_file = positional[0];
  if (positional.size() > 1) opts.segments_file = positional[1];

  return opts;
}

static std::string
read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "segram: cannot open file: " << path << "\n";
    std::exit(exit_io);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static spdlog::level::level_enum
log_level(int verbosity) {
  switch (verbosity) {
    case 0:
      return spdlog::level::warn;
    case 1:
      return spdlog::level::info;
    case 2:
      return spdlog::level::debug;
    default:
      return spdlog::level::trace;
  }
}

static int
run(const cli_options& opts) {
  auto logger = spdlog::stderr_color_mt("segram");
  logger->set_pattern("[%l] %v");
  logger->set_level(log_level(opts.settings.verbosity));

  // Load the grammar
  segram::grammar_library library;
  {
    std::string xml = read_file(opts.grammar_file);
    try {
      segram::expat_reader reader(xml);
      library = segram::grammar_loader().load(reader);
    } catch (const std::exception& e) {
      std::cerr << "segram: error loading grammar " << opts.grammar_file
                << ": " << e.what() << "\n";
      return exit_parse;
    }
  }
  logger->info("loaded {} rule(s) from {}", library.size(),
               opts.grammar_file);

  // Load the segments
  segram::segment_document document;
  {
    std::string xml = read_file(opts.segments_file);
    try {
      segram::expat_reader reader(xml);
      document = segram::segment_loader().load(reader);
    } catch (const std::exception& e) {
      std::cerr << "segram: error loading segments " << opts.segments_file
                << ": " << e.what() << "\n";
      return exit_parse;
    }
  }

  std::string rule_name = opts.rule.empty() ? library.root() : opts.rule;
  if (rule_name.empty()) {
    std::cerr << "segram: no rule given and the grammar has no root\n";
    return exit_usage;
  }
  const segram::matchable* rule = library.find(rule_name);
  if (rule == nullptr) {
    std::cerr << "segram: unknown rule: " << rule_name << "\n";
    return exit_usage;
  }

  auto segments = document.view();
  segram::match_result result;
  try {
    segram::parse_context ctx(opts.settings, &library, logger);
    result = rule->match(segments, ctx);
  } catch (const std::exception& e) {
    std::cerr << "segram: match error: " << e.what() << "\n";
    return exit_no_match;
  }

  std::cout << "matched: " << result.matched_length() << " segment(s)\n"
            << "unmatched: " << result.unmatched().size() << " segment(s)\n"
            << "complete: " << (result.is_complete() ? "yes" : "no") << "\n"
            << "text: " << result.raw_matched() << "\n";

  if (!result && !rule->is_optional()) return exit_no_match;
  return exit_success;
}

int
main(int argc, char* argv[]) {
  cli_options opts = parse_args(argc, argv);

  if (opts.show_help) {
    print_usage(std::cerr);
    return exit_success;
  }

  if (opts.show_version) {
    print_version(std::cerr);
    return exit_success;
  }

  if (opts.grammar_file.empty() || opts.segments_file.empty()) {
    std::cerr << "segram: a grammar file and a segments file are required\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  return run(opts);
}
