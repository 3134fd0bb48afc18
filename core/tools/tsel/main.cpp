// tsel - Selection projection and type inference command line interface
//
// Usage:
//   tsel check    <entity> <selection.json>
//   tsel describe <entity> <selection.json> [--json]
//   tsel action   <action> <selection.json> [--page page.json] [--json]
//   tsel emit     <entity> <selection.json> --name <Type> [-o out.ts]
//   tsel verify   <entity> <selection.json> <result.json>
//
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
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

#include <nlohmann/json.hpp>

#include "typed_select/basic/diagnostic_printer.hpp"
#include "typed_select/basic/document_registry.hpp"
#include "typed_select/codegen/shape_json.hpp"
#include "typed_select/codegen/ts_emitter.hpp"
#include "typed_select/driver/projection_engine.hpp"
#include "typed_select/project/project_config.hpp"
#include "typed_select/projection/conformance.hpp"
#include "typed_select/schema/type_utils.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "typed_select v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check <entity> <selection.json>               Validate a selection\n"
            << "  describe <entity> <selection.json>            Print the projected shape\n"
            << "  action <action> <selection.json>              Print an action's result shape\n"
            << "  emit <entity> <selection.json> --name <Type>  Emit a TypeScript declaration\n"
            << "  verify <entity> <selection.json> <result.json>\n"
            << "                                                Check a result\n\n"
            << "Options:\n"
            << "  --schema <file>          Schema dump (repeatable; default: tsel.yaml)\n"
            << "  --config <tsel.yaml>     Project configuration file\n"
            << "  --page <page.json>       Page parameters (action)\n"
            << "  --name <Type>            Declaration name (emit)\n"
            << "  --json                   Print the JSON shape descriptor\n"
            << "  --max-depth <n>          Maximum selection nesting\n"
            << "  --allow-duplicates       Merge fields selected more than once\n"
            << "  -o, --output <path>      Output file (emit)\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(
  const typed_select::DiagnosticBag & diagnostics, const typed_select::DocumentRegistry & documents)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  typed_select::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics, documents);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> positional;
  std::vector<std::string> schema_files;
  std::string config_path;
  std::string page_file;
  std::string type_name;
  std::string output_path;
  std::optional<size_t> max_depth;
  bool allow_duplicates = false;
  bool json = false;
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

  auto value_of = [&](int & i, const std::string & flag) -> std::string {
    if (i + 1 < argc) {
      return argv[++i];
    }
    args.error = "missing value for " + flag;
    return {};
  };

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--schema") {
      args.schema_files.push_back(value_of(i, arg));
    } else if (arg == "--config") {
      args.config_path = value_of(i, arg);
    } else if (arg == "--page") {
      args.page_file = value_of(i, arg);
    } else if (arg == "--name") {
      args.type_name = value_of(i, arg);
    } else if (arg == "-o" || arg == "--output") {
      args.output_path = value_of(i, arg);
    } else if (arg == "--max-depth") {
      const std::string text = value_of(i, arg);
      char * end = nullptr;
      const long depth = std::strtol(text.c_str(), &end, 10);
      if (text.empty() || *end != '\0' || depth < 1) {
        args.error = "--max-depth expects a positive integer";
      } else {
        args.max_depth = static_cast<size_t>(depth);
      }
    } else if (arg == "--allow-duplicates") {
      args.allow_duplicates = true;
    } else if (arg == "--json") {
      args.json = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] != '-') {
      args.positional.push_back(arg);
    } else {
      args.error = "unknown option '" + arg + "'";
    }
  }

  return args;
}

// ============================================================================
// Session
// ============================================================================

/**
 * Everything a command needs: the frozen registry, the options derived from
 * configuration and flags, and the documents diagnostics point into.
 */
struct Session
{
  std::unique_ptr<typed_select::EntityRegistry> registry;
  typed_select::ProjectionOptions options;
  typed_select::TsEmitOptions emit;
  fs::path output_dir;
  typed_select::DocumentRegistry documents;
};

bool read_json_file(const std::string & file, std::string_view root, Session & session)
{
  std::ifstream in(file);
  if (!in.is_open()) {
    std::cerr << "error: failed to open file: " << file << "\n";
    return false;
  }
  try {
    session.documents.add(root, nlohmann::json::parse(in), fs::path(file));
  } catch (const nlohmann::json::parse_error & e) {
    std::cerr << "error: " << file << ": " << e.what() << "\n";
    return false;
  }
  return true;
}

const nlohmann::json & document(const Session & session, std::string_view root)
{
  return session.documents.find(root)->value;
}

/// Load configuration and schema; prints errors and returns false on failure
bool open_session(const CommandArgs & args, Session & session)
{
  std::optional<typed_select::ProjectConfig> config;

  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else if (args.schema_files.empty()) {
    config_path = typed_select::find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no --schema given and no tsel.yaml found in current directory or "
                   "parents\n";
      return false;
    }
  }

  if (config_path) {
    auto result = typed_select::load_project_config(*config_path);
    if (!result.success) {
      std::cerr << "error: " << result.error << "\n";
      return false;
    }
    if (args.verbose) {
      std::cerr << "Using project: "
                << (result.config.project.name.empty() ? config_path->string()
                                                        : result.config.project.name)
                << "\n";
    }
    config = std::move(result.config);
  }

  std::vector<fs::path> schema_files;
  if (!args.schema_files.empty()) {
    schema_files.assign(args.schema_files.begin(), args.schema_files.end());
  } else if (config) {
    schema_files = config->schema_paths();
  }

  if (config) {
    session.options.validation.max_depth = config->validation.max_selection_depth;
    session.options.validation.allow_duplicate_fields = config->validation.allow_duplicate_fields;
    session.emit.indent_width = config->emit.indent;
    session.emit.export_types = config->emit.export_types;
    session.output_dir = config->project_root / config->emit.output_dir;
  }
  if (args.max_depth) {
    session.options.validation.max_depth = *args.max_depth;
  }
  if (args.allow_duplicates) {
    session.options.validation.allow_duplicate_fields = true;
  }
  session.options.verbose = args.verbose;

  typed_select::DiagnosticBag diags;
  session.registry =
    typed_select::ProjectionEngine::load_registry(schema_files, diags, args.verbose);
  if (!diags.empty()) {
    print_diagnostics(diags, session.documents);
  }
  return session.registry != nullptr;
}

bool require_positional(const CommandArgs & args, size_t count, const char * usage)
{
  if (args.positional.size() == count) {
    return true;
  }
  std::cerr << "error: expected " << count << " arguments\n";
  std::cerr << "usage: tsel " << usage << "\n";
  return false;
}

/// Report a projection result; returns the process exit code
int finish(const typed_select::ProjectionResult & result, const Session & session)
{
  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, session.documents);
  }
  return result.success ? 0 : 1;
}

void print_shape(const typed_select::Type * shape, bool as_json)
{
  if (as_json) {
    std::cout << typed_select::to_json(shape).dump(2) << "\n";
  } else {
    std::cout << typed_select::to_string(shape) << "\n";
  }
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  if (!require_positional(args, 2, "check <entity> <selection.json>")) {
    return 1;
  }

  Session session;
  if (!open_session(args, session) || !read_json_file(args.positional[1], "selection", session)) {
    return 1;
  }

  const auto result = typed_select::ProjectionEngine::describe_projection(
    *session.registry, args.positional[0], document(session, "selection"), session.options);
  if (result.success) {
    std::cout << args.positional[1] << ": OK\n";
  }
  return finish(result, session);
}

int cmd_describe(const CommandArgs & args)
{
  if (!require_positional(args, 2, "describe <entity> <selection.json> [--json]")) {
    return 1;
  }

  Session session;
  if (!open_session(args, session) || !read_json_file(args.positional[1], "selection", session)) {
    return 1;
  }

  const auto result = typed_select::ProjectionEngine::describe_projection(
    *session.registry, args.positional[0], document(session, "selection"), session.options);
  if (result.success) {
    print_shape(result.shape, args.json);
  }
  return finish(result, session);
}

int cmd_action(const CommandArgs & args)
{
  if (!require_positional(args, 2, "action <action> <selection.json> [--page page.json]")) {
    return 1;
  }

  Session session;
  if (!open_session(args, session) || !read_json_file(args.positional[1], "selection", session)) {
    return 1;
  }
  if (!args.page_file.empty() && !read_json_file(args.page_file, "page", session)) {
    return 1;
  }

  const nlohmann::json * page =
    args.page_file.empty() ? nullptr : &document(session, "page");
  const auto result = typed_select::ProjectionEngine::describe_action_result(
    *session.registry, args.positional[0], document(session, "selection"), page,
    session.options);
  if (result.success) {
    print_shape(result.shape, args.json);
  }
  return finish(result, session);
}

int cmd_emit(const CommandArgs & args)
{
  if (!require_positional(args, 2, "emit <entity> <selection.json> --name <Type> [-o out.ts]")) {
    return 1;
  }
  if (args.type_name.empty()) {
    std::cerr << "error: --name is required\n";
    return 1;
  }

  Session session;
  if (!open_session(args, session) || !read_json_file(args.positional[1], "selection", session)) {
    return 1;
  }

  const auto result = typed_select::ProjectionEngine::describe_projection(
    *session.registry, args.positional[0], document(session, "selection"), session.options);
  if (!result.success) {
    return finish(result, session);
  }

  typed_select::TsEmitter emitter(session.emit);
  emitter.add(args.type_name, result.shape);
  const std::string text = emitter.emit();

  if (args.output_path.empty()) {
    std::cout << text;
    return finish(result, session);
  }

  fs::path output = args.output_path;
  if (output.is_relative() && !session.output_dir.empty()) {
    output = session.output_dir / output;
  }
  try {
    if (output.has_parent_path()) {
      fs::create_directories(output.parent_path());
    }
  } catch (const fs::filesystem_error & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  std::ofstream out(output);
  if (!out.is_open()) {
    std::cerr << "error: failed to open output file: " << output.string() << "\n";
    return 1;
  }
  out << text;
  std::cerr << "Generated: " << output.string() << "\n";
  return finish(result, session);
}

int cmd_verify(const CommandArgs & args)
{
  if (!require_positional(args, 3, "verify <entity> <selection.json> <result.json>")) {
    return 1;
  }

  Session session;
  if (
    !open_session(args, session) || !read_json_file(args.positional[1], "selection", session) ||
    !read_json_file(args.positional[2], "result", session)) {
    return 1;
  }

  auto result = typed_select::ProjectionEngine::describe_projection(
    *session.registry, args.positional[0], document(session, "selection"), session.options);
  if (!result.success) {
    return finish(result, session);
  }

  if (args.verbose) {
    std::cerr << "Shape: " << typed_select::to_string(result.shape) << "\n";
  }

  if (typed_select::check_conformance(
        result.shape, document(session, "result"), result.diagnostics)) {
    std::cout << args.positional[2] << ": conforms\n";
    return finish(result, session);
  }
  result.success = false;
  return finish(result, session);
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
    return 1;
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "describe") {
    return cmd_describe(args);
  }

  if (args.command == "action") {
    return cmd_action(args);
  }

  if (args.command == "emit") {
    return cmd_emit(args);
  }

  if (args.command == "verify") {
    return cmd_verify(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
