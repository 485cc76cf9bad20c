#include <chrono>
#include <exception>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/config/engine_config.hpp"
#include "core/model/app_meta.hpp"
#include "core/model/sample_season.hpp"
#include "core/model/spec_codec.hpp"
#include "core/reveal/verifier.hpp"
#include "core/service/advent_service.hpp"
#include "core/util/canonical.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;
constexpr int kExitInvalid = 3;

void print_usage() {
  std::cerr << advent::kAppDisplayName << ' ' << advent::kAppVersion << " (" << advent::kBuildRelease << ")\n";
  std::cerr << "usage: advent-cli [--config <file>] <command> [args]\n"
               "  sample                           print the default 24-round season\n"
               "  commit <specs.json>              commit a season and print its root\n"
               "  status                           show the stored commitment\n"
               "  reveal <day> [YYYY-MM-DD]        disclose a round as of a UTC date\n"
               "  verify <disclosure.json> [root]  verify a disclosure\n"
               "  execute <day> <inputs.json>      evaluate and record one day\n";
}

advent::Result read_json(const std::string& path, nlohmann::json& out) {
  std::ifstream in(path);
  if (!in) {
    return advent::Result::failure("Cannot open " + path + ".", advent::ErrorKind::Storage);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  try {
    out = nlohmann::json::parse(buffer.str());
  } catch (const nlohmann::json::exception& e) {
    return advent::Result::failure("Cannot parse " + path + ": " + e.what());
  }
  return advent::Result::success();
}

bool parse_day(std::string_view text, int& out) {
  try {
    std::size_t used = 0;
    const int day = std::stoi(std::string{text}, &used);
    if (used != text.size() || day < 1 || day > advent::kRoundCount) {
      return false;
    }
    out = day;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

int fail(const advent::Result& result) {
  std::cerr << "error: " << result.message << '\n';
  return kExitError;
}

int cmd_sample(const advent::EngineConfig& config) {
  if (config.ngo_wallet.empty()) {
    std::cerr << "error: set ngo_wallet in the config to build the sample season\n";
    return kExitError;
  }
  nlohmann::json gifts = nlohmann::json::array();
  for (const auto& spec : advent::sample_season(config.ngo_wallet)) {
    gifts.push_back(advent::round_spec_to_json(spec));
  }
  std::cout << nlohmann::json{{"gifts", gifts}}.dump(2) << '\n';
  return kExitOk;
}

int cmd_commit(advent::AdventService& service, const std::string& specs_path) {
  nlohmann::json document;
  const advent::Result read = read_json(specs_path, document);
  if (!read.ok) {
    return fail(read);
  }
  std::vector<advent::RoundSpec> specs;
  const advent::Result parsed = advent::round_specs_from_json(document, specs);
  if (!parsed.ok) {
    return fail(parsed);
  }

  advent::SeasonCommitment commitment;
  const advent::Result committed = service.commit_season(specs, commitment);
  if (!committed.ok) {
    return fail(committed);
  }
  std::cout << nlohmann::json{{"season", commitment.commitment.season},
                              {"root", commitment.commitment.root},
                              {"timestamp", commitment.commitment.timestamp_unix},
                              {"rounds", commitment.artifacts.size()}}
                   .dump(2)
            << '\n';
  return kExitOk;
}

int cmd_status(const advent::AdventService& service) {
  const advent::SeasonStatus status = service.commitment_status();
  nlohmann::json out = {
      {"season", status.season},
      {"season_start", status.season_start},
      {"committed", status.committed},
      {"rounds", status.round_count},
      {"executed_days", status.executed_days},
      {"data_dir", status.data_dir},
      {"crypto", status.core_phase_status},
  };
  if (status.committed) {
    out["root"] = status.root;
    out["timestamp"] = status.committed_unix;
  }
  std::cout << out.dump(2) << '\n';
  return kExitOk;
}

int cmd_reveal(const advent::AdventService& service, const std::vector<std::string>& args) {
  int day = 0;
  if (args.empty() || !parse_day(args[0], day)) {
    print_usage();
    return kExitUsage;
  }
  std::chrono::sys_days today = advent::util::utc_day_of(advent::util::unix_timestamp_now());
  if (args.size() > 1U) {
    const auto parsed = advent::util::parse_iso_date(args[1]);
    if (!parsed.has_value()) {
      std::cerr << "error: '" << args[1] << "' is not a YYYY-MM-DD date\n";
      return kExitUsage;
    }
    today = *parsed;
  }

  advent::Disclosure disclosure;
  const advent::Result disclosed = service.disclose(day, today, disclosure);
  if (!disclosed.ok) {
    return fail(disclosed);
  }
  std::cout << advent::disclosure_to_json(disclosure).dump(2) << '\n';
  return kExitOk;
}

int cmd_verify(const advent::AdventService* service, const std::vector<std::string>& args) {
  if (args.empty()) {
    print_usage();
    return kExitUsage;
  }
  nlohmann::json document;
  const advent::Result read = read_json(args[0], document);
  if (!read.ok) {
    return fail(read);
  }
  advent::Disclosure disclosure;
  const advent::Result parsed = advent::disclosure_from_json(document, disclosure);
  if (!parsed.ok) {
    return fail(parsed);
  }

  advent::VerificationReport report;
  // An explicit root checks against a published value without opening a season.
  const advent::Result verified = service == nullptr ? advent::verify_disclosure(disclosure, args.at(1), report)
                                                     : service->verify(disclosure, report);
  if (!verified.ok) {
    return fail(verified);
  }
  std::cout << advent::verification_report_to_json(report).dump(2) << '\n';
  return report.valid ? kExitOk : kExitInvalid;
}

int cmd_execute(advent::AdventService& service, const std::vector<std::string>& args) {
  int day = 0;
  if (args.size() < 2U || !parse_day(args[0], day)) {
    print_usage();
    return kExitUsage;
  }
  nlohmann::json document;
  const advent::Result read = read_json(args[1], document);
  if (!read.ok) {
    return fail(read);
  }
  advent::DayInputs inputs;
  const advent::Result parsed = advent::day_inputs_from_json(document, inputs);
  if (!parsed.ok) {
    return fail(parsed);
  }

  advent::ExecutionResult result;
  advent::ExecutionLog log;
  const advent::Result executed = service.execute_day(day, inputs, result, log);
  if (!executed.ok) {
    return fail(executed);
  }
  std::cout << nlohmann::json{{"result", advent::execution_result_to_json(result)},
                              {"log", advent::execution_log_to_json(log)}}
                   .dump(2)
            << '\n';
  return kExitOk;
}

}  // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  advent::EngineConfig config = advent::default_engine_config();
  if (args.size() >= 2U && args[0] == "--config") {
    const advent::Result loaded = advent::load_engine_config(args[1], config);
    if (!loaded.ok) {
      return fail(loaded);
    }
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.empty()) {
    print_usage();
    return kExitUsage;
  }

  const std::string command = args[0];
  const std::vector<std::string> rest(args.begin() + 1, args.end());
  if (command == "sample") {
    return cmd_sample(config);
  }
  if (command == "verify" && rest.size() > 1U) {
    return cmd_verify(nullptr, rest);
  }

  advent::AdventService service;
  const advent::Result init = service.init(config);
  if (!init.ok) {
    std::cerr << "advent-cli init failed: " << init.message << '\n';
    return kExitError;
  }

  if (command == "commit" && rest.size() == 1U) {
    return cmd_commit(service, rest[0]);
  }
  if (command == "status") {
    return cmd_status(service);
  }
  if (command == "reveal") {
    return cmd_reveal(service, rest);
  }
  if (command == "verify") {
    return cmd_verify(&service, rest);
  }
  if (command == "execute") {
    return cmd_execute(service, rest);
  }

  print_usage();
  return kExitUsage;
}
