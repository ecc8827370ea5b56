// sdc - Schema DSL Compiler Command Line Interface
//
// Usage:
//   sdc check   [schema.sdl | --project]
//   sdc build   [schema.sdl | --project] [-o types.hpp]
//   sdc sql     [schema.sdl] [--dialect d] [--previous old.sdl]
//   sdc migrate [schema.sdl] [--dry-run]
//   sdc dump    [schema.sdl]
//   sdc introspect
//   sdc init <project-name>
//
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "schema_dsl/ast/ast_context.hpp"
#include "schema_dsl/ast/json_visitor.hpp"
#include "schema_dsl/basic/diagnostic_printer.hpp"
#include "schema_dsl/basic/logging.hpp"
#include "schema_dsl/codegen/sql_generator.hpp"
#include "schema_dsl/db/connection_url.hpp"
#include "schema_dsl/driver/compiler.hpp"
#include "schema_dsl/migrate/introspector.hpp"
#include "schema_dsl/migrate/migrator.hpp"
#include "schema_dsl/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "Schema DSL Compiler v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check [schema.sdl]       Check syntax and semantics\n"
            << "  build [schema.sdl]       Check and write the C++ type header\n"
            << "  sql [schema.sdl]         Print the migration script\n"
            << "  migrate [schema.sdl]     Bring the database in line with the schema\n"
            << "  dump [schema.sdl]        Print the AST as JSON\n"
            << "  introspect               Print the live database schema as JSON\n"
            << "  init <project-name>      Initialize a new project\n\n"
            << "Options:\n"
            << "  -o, --output <path>      Type header path (build)\n"
            << "  --dialect <name>         postgres, mysql, sqlite or generic (sql)\n"
            << "  --previous <file>        Diff against an older schema (sql)\n"
            << "  --dry-run                Print the script without applying it (migrate)\n"
            << "  --project                Use sdc.yaml even when a file is given\n"
            << "  --log-file <path>        Also write a debug log to <path>\n"
            << "  --no-color               Disable colored output\n"
            << "  -v, --verbose            Verbose output (repeat for more)\n"
            << "  -h, --help               Show this help message\n";
}

bool stderr_is_tty()
{
  return isatty(fileno(stderr)) != 0;
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string output_path;
  std::string dialect;
  std::string previous_file;
  std::string log_file;
  bool use_project = false;
  bool dry_run = false;
  bool no_color = false;
  int verbosity = 0;
  bool show_help = false;
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

    if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        args.output_path = argv[++i];
      }
    } else if (arg == "--dialect") {
      if (i + 1 < argc) {
        args.dialect = argv[++i];
      }
    } else if (arg == "--previous") {
      if (i + 1 < argc) {
        args.previous_file = argv[++i];
      }
    } else if (arg == "--log-file") {
      if (i + 1 < argc) {
        args.log_file = argv[++i];
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--dry-run") {
      args.dry_run = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      ++args.verbosity;
    } else if (arg == "-vv") {
      args.verbosity += 2;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    }
  }

  return args;
}

// ============================================================================
// Shared helpers
// ============================================================================

class Session
{
public:
  explicit Session(const CommandArgs & args) : args_(args) {}

  /// Loads sdc.yaml when needed. Reports to stderr and returns false on error.
  bool load_project(bool required)
  {
    if (!required && !args_.use_project && !args_.input_file.empty()) {
      return true;
    }

    const auto config_path = schema_dsl::find_project_config(fs::current_path());
    if (!config_path) {
      if (!required && !args_.use_project) {
        return true;
      }
      std::cerr << "error: no " << schema_dsl::k_project_config_file_name
                << " found in current directory or parents\n";
      return false;
    }

    auto config_result = schema_dsl::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return false;
    }
    spdlog::info("using project {}", config_path->string());
    config_ = std::move(config_result.config);
    return true;
  }

  [[nodiscard]] bool has_project() const { return config_.has_value(); }
  [[nodiscard]] const schema_dsl::ProjectConfig & project() const { return *config_; }

  schema_dsl::CompileResult compile(schema_dsl::CompileOptions options) const
  {
    if (config_ && (args_.use_project || args_.input_file.empty())) {
      return schema_dsl::Compiler::compile_project(*config_, options);
    }
    return schema_dsl::Compiler::compile_file(fs::absolute(args_.input_file), options);
  }

  void print_diagnostics(const schema_dsl::ParsedUnit & unit) const
  {
    if (unit.diags.empty()) {
      return;
    }
    schema_dsl::DiagnosticPrinter printer(std::cerr, !args_.no_color && stderr_is_tty());
    printer.print_all(unit.diags, unit.source);
    printer.print_summary(unit.diags);
  }

  [[nodiscard]] std::string display_name() const
  {
    if (config_ && (args_.use_project || args_.input_file.empty())) {
      return config_->compiler.schema.string();
    }
    return args_.input_file;
  }

  [[nodiscard]] std::string url_env() const
  {
    return config_ ? config_->database.url_env : std::string("DATABASE_URL");
  }

private:
  const CommandArgs & args_;
  std::optional<schema_dsl::ProjectConfig> config_;
};

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  Session session(args);
  if (!session.load_project(args.input_file.empty())) {
    return 1;
  }

  schema_dsl::CompileOptions options;
  options.mode = schema_dsl::CompileMode::Check;

  const auto result = session.compile(options);
  session.print_diagnostics(*result.unit);

  if (result.success) {
    std::cout << session.display_name() << ": OK\n";
    return 0;
  }
  return 1;
}

int cmd_build(const CommandArgs & args)
{
  Session session(args);
  if (!session.load_project(args.input_file.empty())) {
    return 1;
  }

  schema_dsl::CompileOptions options;
  options.mode = schema_dsl::CompileMode::Build;
  if (!args.output_path.empty()) {
    options.types_output = fs::absolute(args.output_path);
  }

  const auto result = session.compile(options);
  session.print_diagnostics(*result.unit);

  if (!result.success) {
    return 1;
  }

  for (const auto & file : result.generated_files) {
    std::cerr << "Generated: " << file.string() << "\n";
  }
  return 0;
}

int cmd_sql(const CommandArgs & args)
{
  Session session(args);
  if (!session.load_project(args.input_file.empty())) {
    return 1;
  }

  schema_dsl::Dialect dialect =
    session.has_project() ? session.project().compiler.dialect : schema_dsl::Dialect::Postgres;
  if (!args.dialect.empty()) {
    const auto parsed = schema_dsl::parse_dialect(args.dialect);
    if (!parsed) {
      std::cerr << "error: unknown dialect '" << args.dialect
                << "' (must be 'postgres', 'mysql', 'sqlite' or 'generic')\n";
      return 1;
    }
    dialect = *parsed;
  }

  schema_dsl::CompileOptions options;
  auto current = session.compile(options);
  session.print_diagnostics(*current.unit);
  if (!current.success) {
    return 1;
  }

  std::optional<schema_dsl::CompileResult> previous;
  if (!args.previous_file.empty()) {
    previous = schema_dsl::Compiler::compile_file(fs::absolute(args.previous_file), options);
    session.print_diagnostics(*previous->unit);
    if (!previous->success) {
      return 1;
    }
  }

  schema_dsl::DiagnosticBag gen_diags;
  schema_dsl::SqlGenerator generator(*current.schema(), dialect, gen_diags);
  const auto plan = generator.generate(previous ? previous->schema() : nullptr);

  if (!gen_diags.empty()) {
    schema_dsl::DiagnosticPrinter printer(std::cerr, !args.no_color && stderr_is_tty());
    printer.print_all(gen_diags, current.unit->source);
  }
  if (!plan) {
    return 1;
  }

  std::cout << plan->render() << "\n";
  return 0;
}

int cmd_migrate(const CommandArgs & args)
{
  Session session(args);
  if (!session.load_project(args.input_file.empty())) {
    return 1;
  }

  // The connection string is resolved before the schema is read.
  const auto url = schema_dsl::connection_url_from_env(session.url_env());
  if (!url.success) {
    std::cerr << "error: " << url.error << "\n";
    return 1;
  }

  schema_dsl::CompileOptions options;
  const auto compiled = session.compile(options);
  session.print_diagnostics(*compiled.unit);
  if (!compiled.success) {
    return 1;
  }

  const auto conn = schema_dsl::db::open_connection(url.url);

  schema_dsl::DiagnosticBag gen_diags;
  schema_dsl::Migrator migrator(*conn, gen_diags);
  schema_dsl::MigratorOptions migrate_options;
  migrate_options.dry_run = args.dry_run;
  const auto result = migrator.migrate(*compiled.schema(), migrate_options);

  if (!gen_diags.empty()) {
    schema_dsl::DiagnosticPrinter printer(std::cerr, !args.no_color && stderr_is_tty());
    printer.print_all(gen_diags, compiled.unit->source);
  }

  if (!result.success) {
    std::cerr << "error: migration failed: " << result.error << "\n";
    if (!result.script.empty()) {
      std::cerr << "script:\n" << result.script << "\n";
    }
    return 1;
  }

  if (!result.applied) {
    std::cout << result.script << "\n";
    return 0;
  }

  std::cerr << "Migration applied.\n";
  return 0;
}

int cmd_dump(const CommandArgs & args)
{
  Session session(args);
  if (!session.load_project(args.input_file.empty())) {
    return 1;
  }

  const auto result = session.compile(schema_dsl::CompileOptions{});
  session.print_diagnostics(*result.unit);
  if (!result.success) {
    return 1;
  }

  std::cout << schema_dsl::to_json(*result.schema()).dump(2) << "\n";
  return 0;
}

int cmd_introspect(const CommandArgs & args)
{
  Session session(args);
  if (!session.load_project(false)) {
    return 1;
  }

  const auto url = schema_dsl::connection_url_from_env(session.url_env());
  if (!url.success) {
    std::cerr << "error: " << url.error << "\n";
    return 1;
  }

  const auto conn = schema_dsl::db::open_connection(url.url);
  schema_dsl::AstContext ast;
  schema_dsl::Introspector introspector(*conn);
  const schema_dsl::Schema * schema = introspector.introspect(ast);

  std::cout << schema_dsl::to_json(*schema, false).dump(2) << "\n";
  return 0;
}

int cmd_init(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: project name required\n";
    std::cerr << "usage: sdc init <project-name>\n";
    return 1;
  }

  const fs::path project_dir = fs::current_path() / args.input_file;

  if (fs::exists(project_dir)) {
    std::cerr << "error: directory already exists: " << project_dir.string() << "\n";
    return 1;
  }

  fs::create_directories(project_dir / "generated");

  std::ofstream config(project_dir / schema_dsl::k_project_config_file_name);
  config << "package:\n"
         << "  name: '" << args.input_file << "'\n"
         << "  version: '0.1.0'\n\n"
         << "compiler:\n"
         << "  schema: './schema.sdl'\n"
         << "  types_output: './generated/schema_types.hpp'\n"
         << "  types_namespace: 'models'\n"
         << "  dialect: 'postgres'\n\n"
         << "database:\n"
         << "  url_env: 'DATABASE_URL'\n";
  config.close();

  std::ofstream schema(project_dir / "schema.sdl");
  schema << "model user {\n"
         << "  id int @primary_key @default(autoincrement())\n"
         << "  email string @unique @required\n"
         << "  created_at datetime @default(now())\n"
         << "}\n";
  schema.close();

  if (!config || !schema) {
    std::cerr << "error: failed to write project files in " << project_dir.string() << "\n";
    return 1;
  }

  std::cout << "Initialized new schema project in " << project_dir.string() << "\n";
  std::cout << "\nNext steps:\n"
            << "  cd " << args.input_file << "\n"
            << "  sdc build\n";
  return 0;
}

int dispatch(const CommandArgs & args, const char * program_name)
{
  if (args.command == "check") {
    return cmd_check(args);
  }
  if (args.command == "build") {
    return cmd_build(args);
  }
  if (args.command == "sql") {
    return cmd_sql(args);
  }
  if (args.command == "migrate") {
    return cmd_migrate(args);
  }
  if (args.command == "dump") {
    return cmd_dump(args);
  }
  if (args.command == "introspect") {
    return cmd_introspect(args);
  }
  if (args.command == "init") {
    return cmd_init(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(program_name);
  return 1;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  schema_dsl::LogOptions log_options;
  log_options.level = schema_dsl::level_for_verbosity(args.verbosity);
  log_options.use_color = !args.no_color && stderr_is_tty();
  log_options.log_file = args.log_file;

  try {
    schema_dsl::init_logging(log_options);
    return dispatch(args, argv[0]);
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}
