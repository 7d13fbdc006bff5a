// demo_suffix.cpp
//
// A small standalone program that drives the suffix codec end to end with
// Result<T>, logging and the layered config.  Run it with:
//
//     ./demo_suffix new                                   # fresh v7-based suffix
//     ./demo_suffix encode 01890a5d-ac96-774b-bcce-b302099a8057
//     ./demo_suffix decode 01h455vb4pex5vsknk084sn02q
//     ./demo_suffix decode 81h455vb4pex5vsknk084sn02q     # -> InvalidFirstCharacter
//
// Settings come from ~/.tid/config.toml, overridden by ./tid.toml if present:
//
//     [log]
//     level = "trace"
//     [diagnostics]
//     trace = true

#include <tid/config.hpp>
#include <tid/log.hpp>
#include <tid/result.hpp>
#include <tid/suffix.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using namespace tid;

// Load a config layer if the file exists; a broken or unreachable file is
// reported and skipped.
static std::optional<Config> load_layer(const std::string& path) {
    if (path.empty()) return std::nullopt;
    std::error_code ec;
    bool present = fs::exists(path, ec);
    if (ec) {
        log::warn("ignoring config %s: %s", path.c_str(), ec.message().c_str());
        return std::nullopt;
    }
    if (!present) return std::nullopt;
    auto r = Config::load(path);
    if (r.is_err()) {
        log::warn("ignoring config: %s", r.error().format().c_str());
        return std::nullopt;
    }
    log::debug("loaded config %s", path.c_str());
    return std::move(r).value();
}

struct Command {
    std::string verb;
    std::string arg;
};

static Result<Command> parse_args(int argc, char** argv) {
    if (argc < 2) {
        return TidError{
            TidError::InvalidArg,
            "no command specified",
            "usage: demo_suffix new | encode <uuid> | decode <suffix>"
        };
    }
    Command cmd{argv[1], argc > 2 ? argv[2] : ""};
    if (cmd.verb != "new" && cmd.verb != "encode" && cmd.verb != "decode") {
        return TidError{
            TidError::InvalidArg,
            "unknown command '" + cmd.verb + "'",
            "expected one of: new, encode, decode"
        };
    }
    if (cmd.verb != "new" && argc < 3) {
        return TidError{
            TidError::InvalidArg,
            "'" + cmd.verb + "' needs an argument",
            "usage: demo_suffix " + cmd.verb + (cmd.verb == "encode" ? " <uuid>" : " <suffix>")
        };
    }
    return Result<Command>::ok(cmd);
}

static Result<std::string> run(int argc, char** argv) {
    TID_TRY_ASSIGN(cmd, parse_args(argc, argv));

    if (cmd.verb == "new") {
        auto suffix = Suffix::generate();
        log::info("generated from uuid %s", suffix.to_uuid().to_string().c_str());
        return Result<std::string>::ok(suffix.to_string());
    }

    if (cmd.verb == "encode") {
        TID_TRY_ASSIGN(uuid, Uuid::from_string(cmd.arg));
        log::info("uuid version %d, variant %s", uuid.version(), variant_name(uuid.variant()));
        return Result<std::string>::ok(Suffix::from_uuid(uuid).to_string());
    }

    TID_TRY_ASSIGN(suffix, Suffix::parse(cmd.arg));
    return Result<std::string>::ok(suffix.to_uuid().to_string());
}

int main(int argc, char** argv) {
    auto cfg = Config::effective(load_layer(global_config_path()), load_layer("tid.toml"));
    cfg.apply();

    auto result = run(argc, argv);

    if (result.is_ok()) {
        std::cout << result.value() << "\n";
        return 0;
    }
    std::cerr << result.error().format() << "\n";
    return 1;
}
