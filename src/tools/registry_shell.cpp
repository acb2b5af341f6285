#include <boost/program_options.hpp>
#include <relic/registry/registry.hpp>
#include <relic/schema/primitives.hpp>
#include <relic/schema/registry_error_code.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace po = boost::program_options;
using payload_t = std::string;
using asset_t = relic::registry::asset<payload_t>;

/// Registry plus the minted assets that have not been published yet.
struct session final {
  relic::identity::sequential_authority authority;
  relic::registry::registry registry{authority};
  std::vector<asset_t> unplaced;
};

std::optional<relic::schema::address_t> parse_address(
    const std::string& token) {
  return relic::schema::try_make_hash32(std::string_view{token});
}

std::optional<relic::schema::creation_num_t> parse_creation_num(
    const std::string& token) {
  if (token.empty() || !std::all_of(std::begin(token), std::end(token),
                                    [](const char c) {
                                      return c >= '0' && c <= '9';
                                    })) {
    return std::nullopt;
  }
  try {
    return static_cast<relic::schema::creation_num_t>(std::stoull(token));
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::string describe(const relic::schema::operation_result_t& result) {
  if (result.code == 0) {
    return "ok";
  }
  return "error " + std::string{relic::schema::to_string(result.error())};
}

std::string format_identifier(const relic::schema::identifier_t& id) {
  return relic::schema::to_hex(id.creator_address) + " " +
         std::to_string(id.creation_num);
}

std::string run_command(session& state, const std::vector<std::string>& args) {
  static const auto kInvalid = std::string{"error invalid_command"};
  const auto& command = args.front();

  if (command == "init" && args.size() == 2) {
    auto owner = parse_address(args[1]);
    if (!owner) {
      return kInvalid;
    }
    state.registry.initialize_collection<payload_t>(
        relic::schema::signer_t{.address = *owner});
    return "ok";
  }

  if (command == "mint" && args.size() == 4) {
    auto signer = parse_address(args[1]);
    if (!signer) {
      return kInvalid;
    }
    auto minted = state.registry.mint<payload_t>(
        relic::schema::signer_t{.address = *signer}, args[2],
        relic::schema::make_bytes(args[3]));
    auto line = "minted " + format_identifier(minted.id());
    state.unplaced.push_back(std::move(minted));
    return line;
  }

  if (command == "publish" && args.size() == 4) {
    auto owner = parse_address(args[1]);
    auto creator = parse_address(args[2]);
    auto creation_num = parse_creation_num(args[3]);
    if (!owner || !creator || !creation_num) {
      return kInvalid;
    }
    auto id = relic::identity::authority::reconstruct(*creator, *creation_num);
    auto pending = std::find_if(
        std::begin(state.unplaced), std::end(state.unplaced),
        [&](const asset_t& candidate) { return candidate.id() == id; });
    if (pending == std::end(state.unplaced)) {
      return "error " + std::string{relic::schema::to_string(
                            relic::schema::registry_error_code::
                                identifier_not_found)};
    }
    auto result = state.registry.publish(*owner, std::move(*pending));
    if (result.code == 0) {
      state.unplaced.erase(pending);
    }
    return describe(result);
  }

  if (command == "transfer" && args.size() == 5) {
    auto signer = parse_address(args[1]);
    auto to = parse_address(args[2]);
    auto creator = parse_address(args[3]);
    auto creation_num = parse_creation_num(args[4]);
    if (!signer || !to || !creator || !creation_num) {
      return kInvalid;
    }
    return describe(state.registry.transfer<payload_t>(
        relic::schema::signer_t{.address = *signer}, *to, *creator,
        *creation_num));
  }

  if (command == "balance" && args.size() == 2) {
    auto owner = parse_address(args[1]);
    if (!owner) {
      return kInvalid;
    }
    return std::to_string(state.registry.balance_of<payload_t>(*owner));
  }

  if (command == "show" && args.size() == 2) {
    auto owner = parse_address(args[1]);
    if (!owner) {
      return kInvalid;
    }
    auto out = std::string{};
    if (const auto* held = state.registry.collection_of<payload_t>(*owner)) {
      for (const auto& entry : held->assets) {
        out += format_identifier(relic::registry::identifier_of(entry)) + " " +
               relic::registry::payload_of(entry) + " " +
               relic::schema::make_string(relic::registry::content_of(entry)) +
               "\n";
      }
    }
    out += "end";
    return out;
  }

  return kInvalid;
}

void run_script(std::istream& input, std::ostream& output) {
  auto state = session{};
  auto line = std::string{};
  while (std::getline(input, line)) {
    auto tokens = std::vector<std::string>{};
    auto stream = std::istringstream{line};
    std::copy(std::istream_iterator<std::string>{stream},
              std::istream_iterator<std::string>{},
              std::back_inserter(tokens));
    if (tokens.empty() || tokens.front().starts_with('#')) {
      continue;
    }
    output << run_command(state, tokens) << '\n';
  }
}

bool valid_log_level(const std::string_view level) {
  static constexpr auto kLevels = std::array<std::string_view, 7>{
      "trace", "debug", "info", "warn", "error", "critical", "off"};
  return std::find(std::begin(kLevels), std::end(kLevels), level) !=
         std::end(kLevels);
}

void configure_logging(const std::string& level,
                       const std::optional<std::string>& log_file) {
  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (log_file) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(*log_file, false));
  }
  auto logger = std::make_shared<spdlog::logger>("relic", std::begin(sinks),
                                                 std::end(sinks));
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(level));
}

}  // namespace

int main(int argc, const char** argv) {
  auto script = std::string{};
  auto log_level = std::string{};
  auto options = po::options_description{"registry_shell options"};
  options.add_options()("help,h", "show help")(
      "script,s", po::value<std::string>(&script),
      "command script path (default: stdin)")(
      "log-level,l", po::value<std::string>(&log_level)->default_value("warn"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>(), "also write logs to this file")(
      "verbose,v", "enable debug logging");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, options), vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n' << options << '\n';
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << "Usage:\n  registry_shell [--script path] [options]\n\n"
              << options << '\n';
    return 0;
  }

  if (!valid_log_level(log_level)) {
    std::cerr << "unknown log level '" << log_level << "'\n"
              << options << '\n';
    return 1;
  }

  if (vm.contains("verbose")) {
    log_level = "debug";
  }
  auto log_file = std::optional<std::string>{};
  if (vm.contains("log-file")) {
    log_file = vm["log-file"].as<std::string>();
  }
  configure_logging(log_level, log_file);

  if (script.empty()) {
    run_script(std::cin, std::cout);
  } else {
    auto input = std::ifstream{script};
    if (!input) {
      spdlog::error("Failed to open script '{}'", script);
      spdlog::shutdown();
      return 1;
    }
    spdlog::info("Running script '{}'", script);
    run_script(input, std::cout);
  }

  spdlog::shutdown();
  return 0;
}
