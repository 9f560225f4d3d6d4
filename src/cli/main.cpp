#include <charconv>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ha/common.h"
#include "ha/core/record_store.h"
#include "ha/core/request_ledger.h"
#include "ha/error.h"
#include "ha/errors.h"
#include "ha/oracle/decryption_oracle_client.h"
#include "ha/oracle/local_engine.h"
#include "ha/oracle/proof.h"
#include "ha/orchestrator/audit_service.h"
#include "ha/orchestrator/config.h"
#include "ha/orchestrator/event_bus.h"
#include "ha/security/zeroizer.h"
#include "ha/storage/kv_store.h"

namespace {

  constexpr int kExitOk = 0;
  constexpr int kExitUsage = 1;
  constexpr int kExitAudit = 2;

  void PrintUsage() {
    std::cerr << "HashAudit\n";
    std::cerr << "Usage:\n";
    std::cerr << "  ha-audit submit-hash <hash> [--description=<text>]\n";
    std::cerr << "  ha-audit submit-guess <hash-id> <guess>\n";
    std::cerr << "  ha-audit request-reveal <hash-id>\n";
    std::cerr << "  ha-audit request-verify <guess-id>\n";
    std::cerr << "  ha-audit deliver\n";
    std::cerr << "  ha-audit list\n";
    std::cerr << "  ha-audit show-hash <hash-id>\n";
    std::cerr << "  ha-audit show-guess <guess-id>\n";
    std::cerr << "  ha-audit stats\n";
    std::cerr << "\nGlobal flags:\n";
    std::cerr << "  --data-dir=<dir>     Record store directory (HA_DATA_DIR)\n";
    std::cerr << "  --as=<identity>      Caller identity (defaults to $USER)\n";
  }

  struct CommandLine {
    std::string command;
    std::vector<std::string> args;
    std::optional<std::string> data_dir;
    std::optional<std::string> identity;
    std::optional<std::string> description;
  };

  std::optional<std::string> FlagValue(std::string_view arg, std::string_view name) {
    if (arg.rfind(name, 0) != 0) {
      return std::nullopt;
    }
    return std::string(arg.substr(name.size()));
  }

  std::optional<CommandLine> ParseCommandLine(int argc, char** argv) {
    CommandLine parsed;
    for (int index = 1; index < argc; ++index) {
      std::string_view arg = argv[index];
      if (arg.rfind("--", 0) != 0) {
        if (parsed.command.empty()) {
          parsed.command = std::string(arg);
        } else {
          parsed.args.emplace_back(arg);
        }
        continue;
      }
      if (auto value = FlagValue(arg, "--data-dir=")) {
        if (value->empty()) {
          return std::nullopt;
        }
        parsed.data_dir = std::move(value);
      } else if (auto identity = FlagValue(arg, "--as=")) {
        parsed.identity = std::move(identity);
      } else if (auto description = FlagValue(arg, "--description=")) {
        parsed.description = std::move(description);
      } else {
        return std::nullopt;
      }
    }
    if (parsed.command.empty()) {
      return std::nullopt;
    }
    return parsed;
  }

  std::optional<uint64_t> ParseId(std::string_view text) {
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size() || value == 0) {
      return std::nullopt;
    }
    return value;
  }

  std::string ResolveIdentity(const CommandLine& cmd) {
    if (cmd.identity) {
      return *cmd.identity;
    }
    const char* user = std::getenv("USER");
    return user ? std::string(user) : std::string();
  }

  // Wires the audit core to a file-backed store and the reference engine.
  class Workspace {
  public:
    explicit Workspace(const ha::orchestrator::AuditConfig& config)
        : records_(config.data_dir / "records"),
          engine_state_(config.data_dir / "engine"),
          store_(&records_),
          ledger_(&records_),
          secret_(ha::orchestrator::LoadOrCreateEngineSecret(config.engine_key_file)),
          engine_(secret_, &engine_state_),
          verifier_(engine_.oracle_key()),
          client_(engine_, ledger_, verifier_),
          service_(store_, ledger_, client_) {
      ha::security::Zeroizer::Wipe(secret_);
      store_.Load();
      ledger_.Load();
      engine_.Load();
    }

    ha::orchestrator::AuditService& service() { return service_; }
    ha::oracle::LocalEngine& engine() { return engine_; }

  private:
    ha::storage::FileKeyValueStore records_;
    ha::storage::FileKeyValueStore engine_state_;
    ha::core::RecordStore store_;
    ha::core::RequestLedger ledger_;
    ha::oracle::LocalEngine::MasterSecret secret_{};
    ha::oracle::LocalEngine engine_;
    ha::oracle::HmacProofVerifier verifier_;
    ha::oracle::DecryptionOracleClient client_;
    ha::orchestrator::AuditService service_;
  };

  void PrintHash(const ha::core::PasswordHashRecord& record, const std::string& viewer) {
    std::cout << "hash " << record.id << "\n";
    std::cout << "  owner:        " << record.owner << "\n";
    if (!record.description.empty()) {
      std::cout << "  description:  " << record.description << "\n";
    }
    std::cout << "  submitted_at: " << record.submitted_at << "\n";
    std::cout << "  state:        " << ha::core::ToString(record.reveal_state) << "\n";
    std::cout << "  ciphertext:   " << record.encrypted_hash.ToHex() << "\n";
    if (record.revealed_hash) {
      std::cout << "  revealed:     " << (viewer == record.owner ? *record.revealed_hash : "[hidden]") << "\n";
    }
  }

  void PrintGuess(const ha::core::GuessRecord& record) {
    std::cout << "guess " << record.id << "\n";
    std::cout << "  hash:         " << record.target_hash_id << "\n";
    std::cout << "  owner:        " << record.owner << "\n";
    std::cout << "  submitted_at: " << record.submitted_at << "\n";
    std::cout << "  state:        " << ha::core::ToString(record.verification_state)
              << (record.verification_requested ? " (verification requested)" : "") << "\n";
  }

  void ReportError(const ha::Error& err) {
    std::cerr << "Error [" << ha::errors::CodeName(err.code) << " 0x" << std::hex << err.code << std::dec
              << "]: " << err.what() << std::endl;
  }

  int HandleDeliver(Workspace& workspace) {
    size_t failures = 0;
    size_t delivered = 0;
    try {
      delivered = workspace.engine().DeliverPending([&](const ha::oracle::OracleCallback& callback) {
        try {
          auto resolved = workspace.service().HandleOracleCallback(callback.request_id, callback.payload,
                                                                   callback.proof);
          std::cout << "request " << resolved.request_id << " -> " << ha::core::ToString(resolved.kind) << " "
                    << resolved.target_record_id << "\n";
        } catch (const ha::Error& err) {
          if (err.retryability == ha::Retryability::kRetryable) {
            throw;
          }
          ++failures;
          ReportError(err);
        }
      });
    } catch (const ha::Error& err) {
      ReportError(err);
      std::cerr << "delivery stopped; remaining callbacks stay queued" << std::endl;
      ++failures;
    }
    for (const auto& job : workspace.engine().TakeFailedJobs()) {
      ++failures;
      std::cerr << "request " << job.request_id << " dropped: " << job.reason << std::endl;
    }
    std::cout << "delivered " << delivered << " callback(s)" << std::endl;
    return failures == 0 ? kExitOk : kExitAudit;
  }

  int HandleList(Workspace& workspace) {
    for (const auto& hash : workspace.service().ListHashes()) {
      std::cout << hash.id << "\t" << ha::core::ToString(hash.reveal_state) << "\t" << hash.owner;
      if (!hash.description.empty()) {
        std::cout << "\t" << hash.description;
      }
      std::cout << "\n";
      for (const auto& guess : workspace.service().GuessesForHash(hash.id)) {
        std::cout << "  guess " << guess.id << "\t" << ha::core::ToString(guess.verification_state) << "\t"
                  << guess.owner << "\n";
      }
    }
    std::cout.flush();
    return kExitOk;
  }

  int HandleStats(Workspace& workspace) {
    const auto stats = workspace.service().Statistics();
    std::cout << "hashes:    " << stats.total_hashes << " (" << stats.revealed_hashes << " revealed)\n";
    std::cout << "guesses:   " << stats.total_guesses << "\n";
    std::cout << "correct:   " << stats.correct_guesses << "\n";
    std::cout << "incorrect: " << stats.incorrect_guesses << "\n";
    std::cout << "pending:   " << stats.pending_guesses << "\n";
    std::cout << "engine:    " << (workspace.service().IsAvailable() ? "available" : "unavailable") << std::endl;
    return kExitOk;
  }

} // namespace

int main(int argc, char** argv) {
  auto cmd = ParseCommandLine(argc, argv);
  if (!cmd) {
    PrintUsage();
    return kExitUsage;
  }
  const auto& args = cmd->args;
  auto expect_args = [&](size_t count) { return args.size() == count; };

  try {
    auto config = ha::orchestrator::AuditConfig::FromEnvironment();
    if (cmd->data_dir) {
      config.SetDataDir(*cmd->data_dir);
    }
    ha::orchestrator::ConfigureDefaultJsonLogger(config.audit_log);
    const std::string identity = ResolveIdentity(*cmd);

    if (cmd->command == "submit-hash") {
      if (!expect_args(1)) {
        PrintUsage();
        return kExitUsage;
      }
      Workspace workspace(config);
      const auto handle = workspace.engine().Encrypt(args[0]);
      const auto id = workspace.service().SubmitHash(handle, identity, cmd->description.value_or(""));
      std::cout << "hash " << id << std::endl;
      return kExitOk;
    }
    if (cmd->command == "submit-guess") {
      auto hash_id = expect_args(2) ? ParseId(args[0]) : std::nullopt;
      if (!hash_id) {
        PrintUsage();
        return kExitUsage;
      }
      Workspace workspace(config);
      const auto handle = workspace.engine().Encrypt(args[1]);
      const auto id = workspace.service().SubmitGuess(*hash_id, handle, identity);
      std::cout << "guess " << id << std::endl;
      return kExitOk;
    }
    if (cmd->command == "request-reveal" || cmd->command == "request-verify") {
      auto record_id = expect_args(1) ? ParseId(args[0]) : std::nullopt;
      if (!record_id) {
        PrintUsage();
        return kExitUsage;
      }
      Workspace workspace(config);
      const auto request_id = cmd->command == "request-reveal"
                                  ? workspace.service().RequestHashReveal(*record_id, identity)
                                  : workspace.service().RequestGuessVerification(*record_id, identity);
      std::cout << "request " << request_id << std::endl;
      return kExitOk;
    }
    if (cmd->command == "deliver" && expect_args(0)) {
      Workspace workspace(config);
      return HandleDeliver(workspace);
    }
    if (cmd->command == "list" && expect_args(0)) {
      Workspace workspace(config);
      return HandleList(workspace);
    }
    if (cmd->command == "show-hash" || cmd->command == "show-guess") {
      auto record_id = expect_args(1) ? ParseId(args[0]) : std::nullopt;
      if (!record_id) {
        PrintUsage();
        return kExitUsage;
      }
      Workspace workspace(config);
      if (cmd->command == "show-hash") {
        auto record = workspace.service().GetHash(*record_id);
        if (!record) {
          ha::ThrowAuditError(ha::ErrorDomain::Validation, ha::errors::audit::kUnknownRecord,
                              ha::errors::msg::kUnknownRecord, args[0]);
        }
        PrintHash(*record, identity);
        for (const auto& guess : workspace.service().GuessesForHash(*record_id)) {
          PrintGuess(guess);
        }
      } else {
        auto record = workspace.service().GetGuess(*record_id);
        if (!record) {
          ha::ThrowAuditError(ha::ErrorDomain::Validation, ha::errors::audit::kUnknownRecord,
                              ha::errors::msg::kUnknownRecord, args[0]);
        }
        PrintGuess(*record);
      }
      std::cout.flush();
      return kExitOk;
    }
    if (cmd->command == "stats" && expect_args(0)) {
      Workspace workspace(config);
      return HandleStats(workspace);
    }

    PrintUsage();
    return kExitUsage;
  } catch (const ha::Error& err) {
    ReportError(err);
    return kExitAudit;
  } catch (const std::exception& err) {
    std::cerr << "Error: " << err.what() << std::endl;
    return kExitAudit;
  }
}
