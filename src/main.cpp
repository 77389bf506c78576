#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <getopt.h>

#include <nlohmann/json.hpp>

#include "core/temporal_ledger.h"
#include "core/hash_engine.h"
#include "math/phi_math.h"
#include "crypto/crypto.h"
#include "infrastructure/error_handling.h"
#include "utils/logger.h"
#include "utils/config.h"

namespace phichain {

using json = nlohmann::json;

static const char* VERSION = "0.1.0";

struct CliConfig {
    std::string configPath;
    std::string scriptPath;
    std::string logLevel;
    double tolerance = 0.0;
    bool toleranceSet = false;
    bool showHelp = false;
    bool showVersion = false;
};

static void printUsage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "\n"
              << "Reads ledger commands, one per line, from --script or stdin.\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help              Show this help\n"
              << "  -v, --version           Show version\n"
              << "  -c, --config <path>     Load key=value configuration\n"
              << "  -s, --script <path>     Read commands from file\n"
              << "  -l, --loglevel <level>  trace|debug|info|warn|error|off\n"
              << "  -t, --tolerance <x>     Relative symmetry tolerance\n"
              << "\n"
              << "Commands:\n"
              << "  append <forward|backward> [payload]\n"
              << "  append-hex <forward|backward> <hex>\n"
              << "  state <position>\n"
              << "  rewind <steps>\n"
              << "  stats\n"
              << "  chain <forward|backward>\n"
              << "  verify\n"
              << "  digest <payload>\n"
              << "  fib <n>\n"
              << "  zeckendorf <n>\n"
              << "  quit\n"
              << "\n"
              << "A payload is every byte after the single space that follows the\n"
              << "direction, so leading and trailing blanks are kept and an empty\n"
              << "payload is allowed. Only a final CR (CRLF input) is dropped.\n"
              << "Output records carry payloadHex, the exact bytes, beside payload.\n";
}

static bool parseArgs(int argc, char* argv[], CliConfig& config) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"config", required_argument, nullptr, 'c'},
        {"script", required_argument, nullptr, 's'},
        {"loglevel", required_argument, nullptr, 'l'},
        {"tolerance", required_argument, nullptr, 't'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;

    while ((opt = getopt_long(argc, argv, "hvc:s:l:t:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                config.showHelp = true;
                return true;
            case 'v':
                config.showVersion = true;
                return true;
            case 'c':
                config.configPath = optarg;
                break;
            case 's':
                config.scriptPath = optarg;
                break;
            case 'l':
                config.logLevel = optarg;
                break;
            case 't':
                try {
                    config.tolerance = std::stod(optarg);
                } catch (const std::exception&) {
                    std::cerr << "Invalid tolerance: " << optarg << "\n";
                    return false;
                }
                config.toleranceSet = true;
                break;
            default:
                return false;
        }
    }
    return true;
}

static void setupLogging(const utils::LoggingConfig& cfg) {
    utils::LogLevel level = utils::LogLevel::INFO;
    if (!utils::Logger::parseLevel(cfg.level, level)) {
        std::cerr << "Unknown log level '" << cfg.level << "', using info\n";
    }
    utils::Logger::setLevel(level);
    utils::Logger::enableConsole(cfg.console);
    utils::Logger::setMaxFileSize(cfg.maxFileSize);
    utils::Logger::setMaxFiles(cfg.maxFiles);
    if (!cfg.file.empty()) {
        utils::Logger::init(cfg.file);
    } else {
        utils::Logger::enableFile(false);
    }
}

static json recordToJson(const core::Record& record) {
    json j;
    j["direction"] = core::directionToString(record.direction);
    j["createdAt"] = record.createdAt;
    j["payload"] = record.payloadString();
    j["payloadHex"] = crypto::toHex(record.payload);
    j["predecessorDigest"] = record.predecessorDigest;
    j["primaryDigest"] = record.primaryDigest;
    j["mirrorDigest"] = record.mirrorDigest;
    return j;
}

// Invalid UTF-8 in payloads is replaced with U+FFFD; payloadHex stays exact.
static std::string render(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

static json errorToJson(const Error& error) {
    json j;
    j["ok"] = false;
    j["code"] = errorToString(error.code);
    j["message"] = error.message;
    if (!error.context.empty()) j["context"] = error.context;
    return j;
}

static json failure(ErrorCode code, const std::string& message) {
    Error err = makeError(code, message);
    ErrorHandler::instance().handle(err);
    return errorToJson(err);
}

static bool parseInt64(const std::string& text, int64_t& out) {
    try {
        size_t used = 0;
        long long v = std::stoll(text, &used);
        if (used != text.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

static std::vector<std::string> tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream iss(line);
    std::string token;
    while (iss >> token) tokens.push_back(token);
    return tokens;
}

// Bytes after the separator that ends the skipped words, verbatim apart
// from a trailing CR.
static std::string payloadField(const std::string& line, size_t skipTokens) {
    std::string text = line;
    if (!text.empty() && text.back() == '\r') text.pop_back();

    size_t pos = 0;
    for (size_t i = 0; i < skipTokens; i++) {
        pos = text.find_first_not_of(" \t", pos);
        if (pos == std::string::npos) return "";
        pos = text.find_first_of(" \t", pos);
        if (pos == std::string::npos) return "";
    }
    return text.substr(pos + 1);
}

static json appendRecord(core::TemporalLedger& ledger, const std::vector<uint8_t>& payload,
                         core::Direction direction) {
    auto result = ledger.append(payload, direction);
    if (result.failed()) {
        ErrorHandler::instance().handle(result.error());
        return errorToJson(result.error());
    }
    json out;
    out["ok"] = true;
    out["record"] = recordToJson(result.value());
    return out;
}

static json runCommand(core::TemporalLedger& ledger, const std::string& line) {
    auto tokens = tokenize(line);
    const std::string& cmd = tokens[0];

    if (cmd == "append" || cmd == "append-hex") {
        core::Direction direction = core::Direction::FORWARD;
        if (tokens.size() < 2) {
            return failure(ErrorCode::INVALID_ARGUMENT, "usage: " + cmd + " <forward|backward> <payload>");
        }
        if (!core::directionFromString(tokens[1], direction)) {
            return failure(ErrorCode::INVALID_DIRECTION, "unknown direction: " + tokens[1]);
        }
        std::string field = payloadField(line, 2);
        if (cmd == "append") {
            return appendRecord(ledger, std::vector<uint8_t>(field.begin(), field.end()), direction);
        }
        if (field.size() % 2 != 0 || !crypto::isHex(field, field.size())) {
            return failure(ErrorCode::INVALID_ARGUMENT, "payload is not an even-length hex string");
        }
        return appendRecord(ledger, crypto::fromHex(field), direction);
    }

    if (cmd == "state") {
        int64_t position = -1;
        if (tokens.size() > 1 && !parseInt64(tokens[1], position)) {
            return failure(ErrorCode::INVALID_ARGUMENT, "invalid position: " + tokens[1]);
        }
        auto state = ledger.temporalState(position);
        json out;
        out["ok"] = true;
        out["position"] = position;
        out["forward"] = state.forward ? recordToJson(*state.forward) : json(nullptr);
        out["backward"] = state.backward ? recordToJson(*state.backward) : json(nullptr);
        out["symmetric"] = state.symmetric;
        return out;
    }

    if (cmd == "rewind") {
        int64_t steps = 1;
        if (tokens.size() > 1 && (!parseInt64(tokens[1], steps) || steps < 0)) {
            return failure(ErrorCode::INVALID_ARGUMENT, "invalid step count: " + tokens[1]);
        }
        auto removed = ledger.rewind(static_cast<size_t>(steps));
        json out;
        out["ok"] = true;
        out["removed"] = json::array();
        for (const auto& r : removed) out["removed"].push_back(recordToJson(r));
        return out;
    }

    if (cmd == "stats") {
        auto s = ledger.stats();
        json out;
        out["ok"] = true;
        out["forwardCount"] = s.forwardCount;
        out["backwardCount"] = s.backwardCount;
        out["totalCount"] = s.totalCount;
        out["symmetryScore"] = s.symmetryScore;
        // JSON has no infinity literal.
        if (std::isinf(s.temporalBalance)) out["temporalBalance"] = "inf";
        else out["temporalBalance"] = s.temporalBalance;
        return out;
    }

    if (cmd == "chain") {
        core::Direction direction = core::Direction::FORWARD;
        if (tokens.size() < 2 || !core::directionFromString(tokens[1], direction)) {
            return failure(ErrorCode::INVALID_DIRECTION, "usage: chain <forward|backward>");
        }
        auto records = direction == core::Direction::FORWARD ? ledger.forwardChain() : ledger.backwardChain();
        json out;
        out["ok"] = true;
        out["records"] = json::array();
        for (const auto& r : records) out["records"].push_back(recordToJson(r));
        return out;
    }

    if (cmd == "verify") {
        json out;
        out["ok"] = true;
        out["valid"] = ledger.verifyChains();
        return out;
    }

    if (cmd == "digest") {
        std::string payload = payloadField(line, 1);
        std::vector<uint8_t> bytes(payload.begin(), payload.end());
        json out;
        out["ok"] = true;
        out["sha3_256"] = crypto::sha3_256Hex(bytes);
        out["primary"] = core::HashEngine::primaryDigest(bytes);
        out["mirror"] = core::HashEngine::mirrorDigest(bytes, core::Direction::BACKWARD);
        return out;
    }

    if (cmd == "fib" || cmd == "zeckendorf") {
        int64_t n = 0;
        if (tokens.size() < 2 || !parseInt64(tokens[1], n)) {
            return failure(ErrorCode::INVALID_ARGUMENT, "usage: " + cmd + " <n>");
        }
        json out;
        out["ok"] = true;
        if (cmd == "fib") {
            if (n > math::MAX_FIBONACCI_INDEX || n < -math::MAX_FIBONACCI_INDEX) {
                return failure(ErrorCode::INVALID_ARGUMENT, "index out of range: " + tokens[1]);
            }
            out["value"] = math::fibonacci(static_cast<int>(n));
        } else {
            out["terms"] = math::zeckendorf(n);
        }
        return out;
    }

    return failure(ErrorCode::INVALID_ARGUMENT, "unknown command: " + cmd);
}

static std::string runGuarded(core::TemporalLedger& ledger, const std::string& line) {
    try {
        return render(runCommand(ledger, line));
    } catch (const crypto::CryptoError& e) {
        return render(failure(ErrorCode::CRYPTO_ERROR, e.what()));
    } catch (const json::exception& e) {
        return render(failure(ErrorCode::INTERNAL_ERROR, e.what()));
    }
}

static int runSession(core::TemporalLedger& ledger, std::istream& in) {
    std::string line;
    uint64_t lineNo = 0;
    while (std::getline(in, line)) {
        lineNo++;
        auto tokens = tokenize(line);
        if (tokens.empty() || tokens[0][0] == '#') continue;
        if (tokens[0] == "quit" || tokens[0] == "exit") break;
        PHICHAIN_CONTEXT("line " + std::to_string(lineNo));
        std::cout << runGuarded(ledger, line) << std::endl;
    }
    return 0;
}

int run(int argc, char* argv[]) {
    CliConfig cli;
    if (!parseArgs(argc, argv, cli)) {
        printUsage(argv[0]);
        return 1;
    }
    if (cli.showHelp) {
        printUsage(argv[0]);
        return 0;
    }
    if (cli.showVersion) {
        std::cout << "phichain " << VERSION << "\n";
        return 0;
    }

    ErrorHandler::instance().setHandler([](const Error& err) {
        std::string text = std::string(errorToString(err.code)) + ": " + err.message;
        if (!err.context.empty()) text += " (" + err.context + ")";
        if (err.code == ErrorCode::REJECTED_SYMMETRY) LOG_INFO(text);
        else LOG_ERROR(text);
    });

    auto& config = utils::Config::instance();
    if (!cli.configPath.empty() && !config.load(cli.configPath)) {
        ErrorHandler::instance().handle(
            makeError(ErrorCode::FILE_NOT_FOUND, "cannot read config: " + cli.configPath));
        return 1;
    }
    if (!cli.logLevel.empty()) config.set("log.level", cli.logLevel);
    if (cli.toleranceSet) config.set("ledger.symmetry_tolerance", cli.tolerance);

    setupLogging(config.getLoggingConfig());

    if (!math::verifyPhiConstant()) {
        LOG_FATAL("Fixed-point phi constant failed self-check");
        return 2;
    }

    core::TemporalLedger ledger(config.getLedgerConfig());
    LOG_INFO("Ledger ready, symmetry tolerance " + std::to_string(ledger.symmetryTolerance()));

    int rc;
    if (!cli.scriptPath.empty()) {
        std::ifstream script(cli.scriptPath);
        if (!script.is_open()) {
            ErrorHandler::instance().handle(
                makeError(ErrorCode::FILE_NOT_FOUND, "cannot open script: " + cli.scriptPath));
            return 1;
        }
        rc = runSession(ledger, script);
    } else {
        rc = runSession(ledger, std::cin);
    }

    auto s = ledger.stats();
    auto& errors = ErrorHandler::instance();
    uint64_t rejections = errors.getErrorCount(ErrorCode::REJECTED_SYMMETRY);
    LOG_INFO("Session finished: " + std::to_string(s.totalCount) + " record(s), " +
             std::to_string(rejections) + " rejection(s), " +
             std::to_string(errors.getErrorCount() - rejections) + " other error(s)");
    utils::Logger::shutdown();
    return rc;
}

}

int main(int argc, char* argv[]) {
    try {
        return phichain::run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }
}
