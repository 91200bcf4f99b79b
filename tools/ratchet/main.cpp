// ratchet - Autoloaded constant reference extractor
//
// Usage:
//   ratchet refs <file>... [--format text|json]
//   ratchet snippet <code | ->
//   ratchet index
//   ratchet graph
//
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <filesystem>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "ratchet/basic/diagnostic_printer.hpp"
#include "ratchet/basic/errors.hpp"
#include "ratchet/driver/dependency_graph.hpp"
#include "ratchet/extractor.hpp"
#include "ratchet/output/json_writer.hpp"
#include "ratchet/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "ratchet - autoloaded constant reference extractor\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  refs <file>...           References to project constants in files\n"
            << "  snippet <code>           References in a code snippet ('-' reads stdin)\n"
            << "  index                    Dump the namespace index\n"
            << "  graph                    File dependency edges for the whole project\n\n"
            << "Options:\n"
            << "  --config <path>          Configuration file (default: nearest ratchet.yml)\n"
            << "  --root <dir>             Project root (overrides the configuration)\n"
            << "  --format <text|json>     Output format (default: text)\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

bool stderr_has_color() { return isatty(fileno(stderr)) != 0; }

/// Report a failure that has no source context
void print_error(const char * code, std::string message, std::string_view origin)
{
  ratchet::Diagnostic diag;
  diag.code = code;
  diag.message = std::move(message);
  ratchet::DiagnosticPrinter printer(std::cerr, stderr_has_color());
  printer.print(diag, nullptr, origin);
}

void print_reference_text(const ratchet::Reference & ref)
{
  const auto & file = ref.constant.defining_file;
  std::cout << fmt::format(
    "{}:{}:{}: {} ({})\n", ref.relative_path, ref.location.start_line, ref.location.start_column,
    ref.constant.name(), file ? file->generic_string() : "-");
}

// ============================================================================
// Argument Parsing
// ============================================================================

enum class OutputFormat { Text, Json };

struct CommandArgs
{
  std::string command;
  std::vector<std::string> inputs;
  std::string config_path;
  std::string root;
  OutputFormat format = OutputFormat::Text;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--config" || arg == "--root" || arg == "--format") {
      if (i + 1 >= argc) {
        args.error = "missing value for " + arg;
        return args;
      }
      std::string value = argv[++i];
      if (arg == "--config") {
        args.config_path = std::move(value);
      } else if (arg == "--root") {
        args.root = std::move(value);
      } else if (value == "text") {
        args.format = OutputFormat::Text;
      } else if (value == "json") {
        args.format = OutputFormat::Json;
      } else {
        args.error = "invalid --format '" + value + "' (must be 'text' or 'json')";
        return args;
      }
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg == "-" || arg[0] != '-') {
      args.inputs.push_back(std::move(arg));
    } else {
      args.error = "unknown option '" + arg + "'";
      return args;
    }
  }

  return args;
}

// ============================================================================
// Project Setup
// ============================================================================

/// Configuration from --config, the nearest ratchet.yml, or the defaults
std::optional<ratchet::ProjectConfig> load_config(const CommandArgs & args)
{
  const fs::path start = args.root.empty() ? fs::current_path() : fs::path(args.root);

  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    config_path = ratchet::find_project_config(start);
  }

  ratchet::ProjectConfig config;
  if (config_path) {
    auto result = ratchet::load_project_config(*config_path);
    if (!result.success) {
      print_error(ratchet::diag_codes::k_config_error, result.error, config_path->string());
      return std::nullopt;
    }
    config = std::move(result.config);
    if (args.verbose) {
      fmt::print(stderr, "Using configuration: {}\n", config_path->string());
    }
  } else {
    config = ratchet::default_project_config(start);
    if (args.verbose) {
      fmt::print(stderr, "No {} found, using default autoload paths\n",
                 ratchet::k_project_config_file_name);
    }
  }

  if (!args.root.empty()) {
    config.project_root = fs::absolute(args.root).lexically_normal();
  }
  if (args.verbose) {
    fmt::print(stderr, "Project root: {}\n", config.project_root.string());
  }
  return config;
}

std::optional<ratchet::NamespaceIndex> build_index(
  const ratchet::ProjectConfig & config, bool verbose)
{
  try {
    auto index = ratchet::NamespaceIndex::scan(
      config.project_root, ratchet::make_autoload_roots(config), ratchet::make_inflector(config),
      ratchet::make_scan_options(config));
    if (verbose) {
      fmt::print(stderr, "Indexed {} namespaces\n", index.size());
    }
    return index;
  } catch (const ratchet::NamespaceCollisionError & e) {
    ratchet::Diagnostic diag;
    diag.code = ratchet::diag_codes::k_namespace_collision;
    diag.message = e.what();
    diag.help_message = "rename one of the files or collapse the directory that contains it";
    ratchet::DiagnosticPrinter printer(std::cerr, stderr_has_color());
    printer.print(diag, nullptr, e.incoming_file().generic_string());
    return std::nullopt;
  }
}

ratchet::Extractor make_extractor(
  const ratchet::ProjectConfig & config, const ratchet::NamespaceIndex & index)
{
  ratchet::Extractor extractor(config.project_root, index, ratchet::make_inspectors(config));
  extractor.set_parse_failure_handler([](const ratchet::ParseFailure & failure) {
    ratchet::DiagnosticPrinter printer(std::cerr, stderr_has_color());
    printer.print_all(failure.unit.diags, &failure.unit.source, failure.relative_path);
  });
  return extractor;
}

// ============================================================================
// Commands
// ============================================================================

int print_references(const std::vector<ratchet::Reference> & refs, OutputFormat format)
{
  if (format == OutputFormat::Json) {
    std::cout << ratchet::to_json(refs).dump(2) << "\n";
  } else {
    for (const auto & ref : refs) {
      print_reference_text(ref);
    }
  }
  return 0;
}

int cmd_refs(const CommandArgs & args)
{
  if (args.inputs.empty()) {
    std::cerr << "error: at least one file required\n";
    std::cerr << "usage: ratchet refs <file>...\n";
    return 1;
  }

  const auto config = load_config(args);
  if (!config) return 1;
  const auto index = build_index(*config, args.verbose);
  if (!index) return 1;
  const auto extractor = make_extractor(*config, *index);

  std::vector<ratchet::Reference> refs;
  for (const auto & input : args.inputs) {
    // Paths on the command line are relative to the working directory
    const fs::path path = fs::absolute(input);
    if (args.verbose) {
      fmt::print(stderr, "Extracting: {}\n", path.string());
    }
    try {
      auto file_refs = extractor.references_from_file(path);
      refs.insert(
        refs.end(), std::make_move_iterator(file_refs.begin()),
        std::make_move_iterator(file_refs.end()));
    } catch (const ratchet::UnsupportedFileError & e) {
      print_error(ratchet::diag_codes::k_unsupported_file, e.what(), input);
      return 1;
    }
  }

  return print_references(refs, args.format);
}

int cmd_snippet(const CommandArgs & args)
{
  if (args.inputs.size() != 1) {
    std::cerr << "error: exactly one snippet required\n";
    std::cerr << "usage: ratchet snippet <code | ->\n";
    return 1;
  }

  std::string code = args.inputs.front();
  if (code == "-") {
    code.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  }

  const auto config = load_config(args);
  if (!config) return 1;
  const auto index = build_index(*config, args.verbose);
  if (!index) return 1;
  const auto extractor = make_extractor(*config, *index);

  return print_references(extractor.references_from_string(std::move(code)), args.format);
}

int cmd_index(const CommandArgs & args)
{
  const auto config = load_config(args);
  if (!config) return 1;
  const auto index = build_index(*config, args.verbose);
  if (!index) return 1;

  if (args.format == OutputFormat::Json) {
    std::cout << ratchet::to_json(*index).dump(2) << "\n";
    return 0;
  }

  for (const auto & [path, entry] : *index) {
    if (path.empty()) continue;
    if (entry.file) {
      std::cout << fmt::format("{} -> {}\n", path.qualified_name(), entry.file->generic_string());
    } else {
      std::cout << fmt::format("{} (namespace)\n", path.qualified_name());
    }
  }
  return 0;
}

int cmd_graph(const CommandArgs & args)
{
  const auto config = load_config(args);
  if (!config) return 1;
  const auto index = build_index(*config, args.verbose);
  if (!index) return 1;
  const auto extractor = make_extractor(*config, *index);

  const auto files = ratchet::project_source_files(*index);
  if (args.verbose) {
    fmt::print(stderr, "Analyzing {} files\n", files.size());
  }

  ratchet::DependencyGraph graph;
  try {
    graph = ratchet::DependencyGraph::build(extractor, files);
  } catch (const ratchet::UnsupportedFileError & e) {
    print_error(ratchet::diag_codes::k_unsupported_file, e.what(), e.path().string());
    return 1;
  }

  if (args.format == OutputFormat::Json) {
    std::cout << ratchet::to_json(graph).dump(2) << "\n";
    return 0;
  }

  for (const auto & edge : graph.edges()) {
    std::vector<std::string> names;
    for (const auto & c : edge.constants) {
      names.push_back(c.qualified_name());
    }
    std::cout << fmt::format(
      "{} -> {} ({} refs: {})\n", edge.from, edge.to, edge.reference_count,
      fmt::join(names, ", "));
  }
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return 1;
  }

  try {
    if (args.command == "refs") {
      return cmd_refs(args);
    }

    if (args.command == "snippet") {
      return cmd_snippet(args);
    }

    if (args.command == "index") {
      return cmd_index(args);
    }

    if (args.command == "graph") {
      return cmd_graph(args);
    }
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
