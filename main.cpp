#include <boost/program_options.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "src/ballots/tally.h"
#include "src/core/log.h"
#include "src/core/result.h"
#include "src/crypto/hash.h"
#include "src/crypto/keypair.h"
#include "src/service/voting_service.h"

namespace po = boost::program_options;

namespace {

constexpr int EXIT_USAGE = 2;

const char* const COMMANDS =
    "Commands:\n"
    "  create-election <election_id> <title>   create a draft election, print its keys\n"
    "  add-options <election_id> <label>...    add choices to a draft election's ballot\n"
    "  import-voters <election_id> <voter_id>...  register voters, print identity tokens\n"
    "  reissue-token <election_id> <voter_id>  replace a voter's identity token\n"
    "  open <election_id>                      open voting\n"
    "  close <election_id>                     close voting\n"
    "  status <election_id> [voter_id]         election or voter status\n"
    "  authenticate <identity_token>           exchange an identity token for a ballot token\n"
    "  seal <public_key_hex> <choice>          encrypt a choice for an election\n"
    "  cast <ballot_token> <ciphertext_hex>    cast an encrypted ballot\n"
    "  verify-receipt <receipt>                confirm a ballot was recorded\n"
    "  audit-verify <election_id>              verify the audit hash chain\n"
    "  audit-trail <election_id>               print the audit trail\n"
    "  turnout <election_id>                   voter counts per state\n"
    "  tally <election_id> [secret_key_hex]    read (and decrypt) ballots of a closed election\n";

int report(const core::Failure& failure) {
    std::cerr << "error: " << core::error_to_string(failure.code);
    if (failure.code == core::Error::ChainBroken) {
        std::cerr << " at sequence " << failure.sequence_no;
    }
    std::cerr << std::endl;
    return EXIT_FAILURE;
}

bool expect_args(const std::vector<std::string>& args, size_t min, size_t max) {
    if (args.size() < min || args.size() > max) {
        std::cerr << "wrong number of arguments" << std::endl << COMMANDS;
        return false;
    }
    return true;
}

int create_election(service::VotingService& service, const std::vector<std::string>& args) {
    if (!expect_args(args, 2, 2)) return EXIT_USAGE;

    auto created = service.registry().create(
        args[0], args[1], service.config().identity_token_ttl_seconds);
    if (!created) {
        return report(created.failure());
    }

    std::cout << "election:   " << created->election.election_id << std::endl;
    std::cout << "public key: " << crypto::to_hex(created->election.public_key) << std::endl;
    std::cout << "secret key: " << crypto::to_hex(created->secret_key) << std::endl;
    std::cout << "The secret key is not stored. Keep it for the tally." << std::endl;
    return EXIT_SUCCESS;
}

int add_options(service::VotingService& service, const std::vector<std::string>& args) {
    if (!expect_args(args, 2, args.size())) return EXIT_USAGE;

    std::vector<std::string> labels(args.begin() + 1, args.end());
    auto added = service.registry().add_options(args[0], labels);
    return added ? EXIT_SUCCESS : report(added.failure());
}

int import_voters(service::VotingService& service, const std::vector<std::string>& args) {
    if (!expect_args(args, 2, args.size())) return EXIT_USAGE;

    std::vector<std::string> voter_ids(args.begin() + 1, args.end());
    auto issued = service.registry().register_voters(args[0], voter_ids);
    if (!issued) {
        return report(issued.failure());
    }

    for (const auto& token : *issued) {
        std::cout << token.voter_id << " " << token.token << " " << token.expires_at << std::endl;
    }
    return EXIT_SUCCESS;
}

int reissue_token(service::VotingService& service, const std::vector<std::string>& args) {
    if (!expect_args(args, 2, 2)) return EXIT_USAGE;

    auto issued = service.registry().reissue_identity_token(args[0], args[1]);
    if (!issued) {
        return report(issued.failure());
    }
    std::cout << issued->voter_id << " " << issued->token << " " << issued->expires_at << std::endl;
    return EXIT_SUCCESS;
}

int open_election(service::VotingService& service, const std::vector<std::string>& args) {
    if (!expect_args(args, 1, 1)) return EXIT_USAGE;

    auto opened = service.registry().open(args[0]);
    return opened ? EXIT_SUCCESS : report(opened.failure());
}

int close_election(service::VotingService& service, const std::vector<std::string>& args) {
    if (!expect_args(args, 1, 1)) return EXIT_USAGE;

    auto closed = service.registry().close(args[0]);
    return closed ? EXIT_SUCCESS : report(closed.failure());
}

int status(service::VotingService& service, const std::vector<std::string>& args) {
    if (!expect_args(args, 1, 2)) return EXIT_USAGE;

    if (args.size() == 2) {
        auto voter = service.registry().voter(args[0], args[1]);
        if (!voter) {
            return report(voter.failure());
        }
        std::cout << voter->voter_id << ": " << voters::voter_state_to_string(voter->state)
                  << " (token expires " << voter->expires_at << ")" << std::endl;
        return EXIT_SUCCESS;
    }

    auto election = service.registry().get(args[0]);
    if (!election) {
        return report(election.failure());
    }

    std::cout << "election:   " << election->election_id << std::endl;
    std::cout << "title:      " << election->title << std::endl;
    std::cout << "status:     " << elections::election_status_to_string(election->status) << std::endl;
    std::cout << "public key: " << crypto::to_hex(election->public_key) << std::endl;

    auto options = service.registry().options(args[0]);
    if (!options) {
        return report(options.failure());
    }
    for (size_t i = 0; i < options->size(); ++i) {
        std::cout << "option " << i + 1 << ":   " << (*options)[i] << std::endl;
    }
    return EXIT_SUCCESS;
}

int authenticate(service::VotingService& service, const std::vector<std::string>& args) {
    if (!expect_args(args, 1, 1)) return EXIT_USAGE;

    auto token = service.identity_validate(args[0]);
    if (!token) {
        return report(token.failure());
    }
    std::cout << "ballot token: " << token->token << std::endl;
    std::cout << "expires at:   " << token->expires_at << std::endl;
    return EXIT_SUCCESS;
}

int seal(const std::vector<std::string>& args) {
    if (!expect_args(args, 2, 2)) return EXIT_USAGE;

    auto key_bytes = crypto::from_hex(args[0]);
    if (key_bytes.size() != crypto::PUBLIC_KEY_SIZE) {
        std::cerr << "invalid public key" << std::endl;
        return EXIT_USAGE;
    }

    crypto::PublicKey public_key{};
    std::copy(key_bytes.begin(), key_bytes.end(), public_key.begin());

    std::vector<uint8_t> choice(args[1].begin(), args[1].end());
    std::cout << crypto::to_hex(crypto::seal(choice, public_key)) << std::endl;
    return EXIT_SUCCESS;
}

int cast(service::VotingService& service, const std::vector<std::string>& args) {
    if (!expect_args(args, 2, 2)) return EXIT_USAGE;

    auto ciphertext = crypto::from_hex(args[1]);
    if (ciphertext.empty()) {
        std::cerr << "ciphertext must be non-empty hex" << std::endl;
        return EXIT_USAGE;
    }

    auto receipt = service.ballot_cast(args[0], ciphertext);
    if (!receipt) {
        return report(receipt.failure());
    }
    std::cout << "receipt: " << receipt->receipt << std::endl;
    return EXIT_SUCCESS;
}

int verify_receipt(service::VotingService& service, const std::vector<std::string>& args) {
    if (!expect_args(args, 1, 1)) return EXIT_USAGE;

    auto found = service.receipt_check(args[0]);
    if (!found) {
        return report(found.failure());
    }
    if (!*found) {
        std::cout << "not recorded" << std::endl;
        return EXIT_FAILURE;
    }
    std::cout << "recorded in election " << (*found)->election_id
              << " at " << (*found)->cast_at << std::endl;
    return EXIT_SUCCESS;
}

int audit_verify(service::VotingService& service, const std::vector<std::string>& args) {
    if (!expect_args(args, 1, 1)) return EXIT_USAGE;

    auto verified = service.audit_verify(args[0]);
    if (!verified) {
        return report(verified.failure());
    }
    std::cout << "ok: " << verified->entries << " entries, head "
              << crypto::to_hex(verified->head_hash) << std::endl;
    return EXIT_SUCCESS;
}

int audit_trail(service::VotingService& service, const std::vector<std::string>& args) {
    if (!expect_args(args, 1, 1)) return EXIT_USAGE;

    auto trail = service.ledger().entries(args[0]);
    if (!trail) {
        return report(trail.failure());
    }

    for (const auto& event : *trail) {
        std::cout << event.sequence_no << " " << event.recorded_at << " "
                  << event.event_type << " " << event.actor_ref << " "
                  << crypto::to_hex(event.entry_hash);

        auto payload = audit::decode_payload(event.payload);
        if (payload) {
            for (const auto& [key, value] : *payload) {
                std::cout << " " << key << "=" << value;
            }
        }
        std::cout << std::endl;
    }
    return EXIT_SUCCESS;
}

int turnout(service::VotingService& service, const std::vector<std::string>& args) {
    if (!expect_args(args, 1, 1)) return EXIT_USAGE;

    auto counts = service.turnout(args[0]);
    if (!counts) {
        return report(counts.failure());
    }
    std::cout << "invited:       " << counts->invited << std::endl;
    std::cout << "authenticated: " << counts->authenticated << std::endl;
    std::cout << "voted:         " << counts->voted << std::endl;
    return EXIT_SUCCESS;
}

int tally(service::VotingService& service, const std::vector<std::string>& args) {
    if (!expect_args(args, 1, 2)) return EXIT_USAGE;

    std::optional<crypto::ElectionKeypair> keypair;
    if (args.size() == 2) {
        keypair = crypto::ElectionKeypair::from_bytes(crypto::from_hex(args[1]));
        if (!keypair) {
            std::cerr << "invalid secret key" << std::endl;
            return EXIT_USAGE;
        }
    }

    auto cursor = service.tally_read(args[0]);
    if (!cursor) {
        return report(cursor.failure());
    }

    if (keypair) {
        auto result = ballots::count_ballots(*cursor, *keypair);
        if (!result) {
            return report(result.failure());
        }
        for (const auto& [option, count] : result->counts) {
            std::cout << option << ": " << count << std::endl;
        }
        std::cout << "invalid: " << result->invalid << std::endl;
        if (result->undecryptable > 0) {
            std::cout << "undecryptable: " << result->undecryptable << std::endl;
        }
        std::cout << "total: " << result->total << std::endl;
        return EXIT_SUCCESS;
    }

    // No key: list the ciphertexts for an offline trustee
    uint64_t total = 0;
    while (true) {
        auto ballot = cursor->next();
        if (!ballot) {
            return report(ballot.failure());
        }
        if (!*ballot) {
            break;
        }
        ++total;
        std::cout << (*ballot)->ballot_id << " " << crypto::to_hex((*ballot)->encrypted_choice)
                  << std::endl;
    }
    std::cout << "total: " << total << std::endl;
    return EXIT_SUCCESS;
}

int dispatch(service::VotingService& service, const std::string& command,
             const std::vector<std::string>& args) {
    if (command == "create-election") return create_election(service, args);
    if (command == "add-options") return add_options(service, args);
    if (command == "import-voters") return import_voters(service, args);
    if (command == "reissue-token") return reissue_token(service, args);
    if (command == "open") return open_election(service, args);
    if (command == "close") return close_election(service, args);
    if (command == "status") return status(service, args);
    if (command == "authenticate") return authenticate(service, args);
    if (command == "cast") return cast(service, args);
    if (command == "verify-receipt") return verify_receipt(service, args);
    if (command == "audit-verify") return audit_verify(service, args);
    if (command == "audit-trail") return audit_trail(service, args);
    if (command == "turnout") return turnout(service, args);
    if (command == "tally") return tally(service, args);

    std::cerr << "unknown command: " << command << std::endl << COMMANDS;
    return EXIT_USAGE;
}

}

int main(int argc, char* argv[]) {
    if (!crypto::init()) {
        std::cerr << "Failed to initialize libsodium" << std::endl;
        return EXIT_FAILURE;
    }

    service::Config config;
    uint64_t identity_ttl_hours = config.identity_token_ttl_seconds / 3600;

    po::options_description settings("Settings (command line or config file)");
    // clang-format off
    settings.add_options()
        ("database,d", po::value<std::string>(&config.database_path)->default_value(config.database_path),
            "SQLite database file")
        ("identity-ttl-hours", po::value<uint64_t>(&identity_ttl_hours)->default_value(identity_ttl_hours),
            "Lifetime of identity tokens of new elections")
        ("ballot-ttl", po::value<uint64_t>(&config.ballot_token_ttl_seconds)->default_value(config.ballot_token_ttl_seconds),
            "Lifetime of ballot tokens in seconds")
        ("busy-timeout-ms", po::value<int>(&config.busy_timeout_ms)->default_value(config.busy_timeout_ms),
            "How long to wait for a locked database")
        ("pool-size", po::value<size_t>(&config.pool_size)->default_value(config.pool_size),
            "Idle connections kept per component")
        ("log-level", po::value<std::string>(&config.log_level)->default_value(config.log_level),
            "trace, debug, info, warn, error or off");
    // clang-format on

    po::options_description generic("Options");
    generic.add_options()
        ("help,h", "Display help message.")
        ("config,c", po::value<std::string>(), "INI-style config file with the settings below");

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::string>(), "")
        ("args", po::value<std::vector<std::string>>()->default_value({}, ""), "");

    po::positional_options_description positional;
    positional.add("command", 1).add("args", -1);

    po::options_description cmdline;
    cmdline.add(generic).add(settings).add(hidden);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(cmdline).positional(positional).run(), vm);

        if (vm.count("config")) {
            const auto& path = vm["config"].as<std::string>();
            std::ifstream file(path);
            if (!file) {
                std::cerr << "cannot read config file " << path << std::endl;
                return EXIT_USAGE;
            }
            // Command-line values stored first take precedence
            po::store(po::parse_config_file(file, settings), vm);
        }

        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << e.what() << std::endl;
        return EXIT_USAGE;
    }

    if (vm.count("help") || !vm.count("command")) {
        std::cout << "Usage: sealvote [options] <command> [args...]" << std::endl << std::endl
                  << generic << std::endl << settings << std::endl << COMMANDS;
        return vm.count("help") ? EXIT_SUCCESS : EXIT_USAGE;
    }

    if (identity_ttl_hours == 0 || identity_ttl_hours > elections::MAX_TOKEN_TTL_SECONDS / 3600) {
        std::cerr << "identity-ttl-hours must be between 1 and "
                  << elections::MAX_TOKEN_TTL_SECONDS / 3600 << std::endl;
        return EXIT_USAGE;
    }
    if (config.ballot_token_ttl_seconds == 0 ||
        config.ballot_token_ttl_seconds > elections::MAX_TOKEN_TTL_SECONDS) {
        std::cerr << "ballot-ttl must be between 1 and " << elections::MAX_TOKEN_TTL_SECONDS << std::endl;
        return EXIT_USAGE;
    }
    config.identity_token_ttl_seconds = identity_ttl_hours * 3600;

    if (!core::set_log_level(config.log_level)) {
        std::cerr << "unknown log level " << config.log_level << std::endl;
        return EXIT_USAGE;
    }

    const auto command = vm["command"].as<std::string>();
    const auto& args = vm["args"].as<std::vector<std::string>>();

    // Needs no database
    if (command == "seal") {
        return seal(args);
    }

    try {
        service::VotingService service(config);
        service.ledger().set_on_chain_broken([](const std::string& election_id, uint64_t sequence_no) {
            core::get_logger("cli")->critical(
                "audit chain of {} is broken at {}, stop trusting it from there", election_id, sequence_no);
        });
        return dispatch(service, command, args);
    } catch (const storage::StorageError& e) {
        core::get_logger("cli")->critical("cannot open {}: {}", config.database_path, e.what());
        return EXIT_FAILURE;
    }
}
