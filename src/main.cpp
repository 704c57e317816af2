#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <tally/common/log_level.hpp>
#include <tally/execution/engine.hpp>
#include <tally/storage/memory/storage.hpp>
#include <tally/storage/rocksdb/storage.hpp>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace {

struct options_t final {
  std::string db_path;
  bool in_memory{};
  std::string principal;
  std::vector<std::string> attributes;
  std::string log_level;
  std::string log_file;
  std::string verb;
  std::string operation;
  std::vector<std::string> args;
};

void configure_logging(const options_t& options,
                       const spdlog::level::level_enum level) {
  spdlog::init_thread_pool(8192, 1);

  // stdout carries operation results; logs go to stderr.
  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (!options.log_file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        options.log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "tally", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(level);
}

std::shared_ptr<const tally::execution::identity_provider> make_identity(
    const options_t& options) {
  if (options.principal.empty()) {
    return nullptr;
  }
  auto attributes = std::map<std::string, std::string>{};
  for (const auto& attribute : options.attributes) {
    auto separator = attribute.find('=');
    if (separator == std::string::npos) {
      spdlog::warn("Ignoring attribute '{}' without '='", attribute);
      continue;
    }
    attributes[attribute.substr(0, separator)] =
        attribute.substr(separator + 1);
  }
  return std::make_shared<tally::execution::static_identity>(
      options.principal, std::move(attributes));
}

template <typename Library>
int run(tally::storage::storage<Library>& storage, const options_t& options) {
  auto engine =
      tally::execution::engine<Library>{storage, make_identity(options)};
  auto result = options.verb == "invoke"
                    ? engine.invoke(options.operation, options.args)
                    : engine.query(options.operation, options.args);
  if (result.code != 0) {
    std::cerr << result.codespace << " error " << result.code << ": "
              << result.log;
    if (!result.info.empty()) {
      std::cerr << " [" << result.info << "]";
    }
    std::cerr << std::endl;
    return 1;
  }
  if (!result.data.empty()) {
    std::cout << tally::schema::make_string(result.data) << std::endl;
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  namespace po = boost::program_options;

  auto options = options_t{};
  auto config_file = std::string{};

  auto generic = po::options_description{"Tally"};
  generic.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "INI file with any of the ledger options below");

  auto ledger = po::options_description{"Ledger"};
  ledger.add_options()(
      "db-path,d",
      po::value<std::string>(&options.db_path)->default_value("tally.db"),
      "RocksDB directory holding the ledger")(
      "in-memory", po::bool_switch(&options.in_memory),
      "Use a throwaway in-memory store")(
      "principal,p", po::value<std::string>(&options.principal),
      "Authenticated caller; enables acting-principal checks")(
      "attribute,a",
      po::value<std::vector<std::string>>(&options.attributes)->composing(),
      "Caller attribute as name=value (repeatable)")(
      "log-level,l",
      po::value<std::string>(&options.log_level)->default_value("info"),
      "trace, debug, info, warn, error, critical or off")(
      "log-file", po::value<std::string>(&options.log_file),
      "Also write logs to this file");

  auto hidden = po::options_description{};
  hidden.add_options()("verb", po::value<std::string>(&options.verb))(
      "operation", po::value<std::string>(&options.operation))(
      "args", po::value<std::vector<std::string>>(&options.args));

  auto positional = po::positional_options_description{};
  positional.add("verb", 1).add("operation", 1).add("args", -1);

  auto command_line = po::options_description{};
  command_line.add(generic).add(ledger).add(hidden);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(command_line)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
    if (!config_file.empty()) {
      auto stream = std::ifstream{config_file};
      if (!stream) {
        std::cerr << "cannot open config file " << config_file << std::endl;
        return 2;
      }
      po::store(po::parse_config_file(stream, ledger), vm);
      po::notify(vm);
    }
  } catch (const po::error& ex) {
    std::cerr << ex.what() << std::endl;
    return 2;
  }

  if (vm.contains("help") || options.verb.empty() ||
      options.operation.empty()) {
    std::cout << "Usage: tally [options] (invoke|query) <operation> [args...]"
              << std::endl
              << generic << ledger << std::endl;
    return vm.contains("help") ? 0 : 2;
  }
  if (options.verb != "invoke" && options.verb != "query") {
    std::cerr << "unknown verb '" << options.verb
              << "', expected invoke or query" << std::endl;
    return 2;
  }

  const auto level = tally::common::try_parse_log_level(options.log_level);
  if (!level) {
    std::cerr << "unknown log level '" << options.log_level
              << "', expected trace, debug, info, warn, error, critical or off"
              << std::endl;
    return 2;
  }
  configure_logging(options, *level);

  auto status = 0;
  if (options.in_memory) {
    auto storage =
        tally::storage::make_storage<tally::storage::memory_storage_tag>(
            "cli");
    status = run(storage, options);
  } else {
    auto storage =
        tally::storage::make_storage<tally::storage::rocksdb_storage_tag>(
            options.db_path);
    status = run(storage, options);
  }

  spdlog::shutdown();
  return status;
}
