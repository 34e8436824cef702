// demo_package_id.cpp
//
// Compute the package ID for a set of build inputs described in TOML and
// print the canonical dump it was derived from. Run it with:
//
//     ./demo_package_id inputs.toml
//     ./demo_package_id inputs.toml --record zlib/1.2.11@conan/stable
//
// --record also stores the identity in the store named by the [store] path
// config key (default ~/.pkgid/identities.db).

#include <pkgid/config.hpp>
#include <pkgid/identity/inputs.hpp>
#include <pkgid/identity_store.hpp>
#include <pkgid/log.hpp>
#include <pkgid/result.hpp>

#include <iostream>
#include <optional>
#include <string>

using namespace pkgid;

struct Args {
    std::string inputs_path;
    std::optional<std::string> record_ref;
};

Result<Args> parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--record") {
            if (i + 1 >= argc) {
                return PkgidError{PkgidError::InvalidArg,
                    "--record needs a reference",
                    "usage: demo_package_id <inputs.toml> [--record name/version]"};
            }
            args.record_ref = argv[++i];
        } else if (args.inputs_path.empty()) {
            args.inputs_path = arg;
        } else {
            return PkgidError{PkgidError::InvalidArg, "unexpected argument: " + arg};
        }
    }
    if (args.inputs_path.empty()) {
        return PkgidError{PkgidError::InvalidArg,
            "no inputs file specified",
            "usage: demo_package_id <inputs.toml> [--record name/version]"};
    }
    return Result<Args>::ok(std::move(args));
}

// Global config first, then ./pkgid.toml if present
Result<Config> load_config() {
    std::optional<Config> global, local;
    std::string global_path = global_config_path();
    if (!global_path.empty()) {
        auto r = Config::load(global_path);
        if (r.is_ok()) {
            global = std::move(r).value();
        } else if (r.error().code != PkgidError::NotFound) {
            return std::move(r).error();
        }
    }
    auto r = Config::load("pkgid.toml");
    if (r.is_ok()) {
        local = std::move(r).value();
    } else if (r.error().code != PkgidError::NotFound) {
        return std::move(r).error();
    }
    return Result<Config>::ok(Config::effective(global, local));
}

Status run(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    PKGID_TRY(args);

    auto config = load_config();
    PKGID_TRY(config);
    config.value().apply();

    auto inputs = BuildInputs::load(args.value().inputs_path);
    PKGID_TRY(inputs);

    BuildIdentity identity = inputs.value().to_identity();
    std::cout << identity.canonical_dump() << "\n";
    std::cout << "package id: " << identity.package_identity() << "\n";

    if (args.value().record_ref) {
        auto ref = ComponentRef::parse(*args.value().record_ref);
        PKGID_TRY(ref);

        std::string store_path = config.value().store_path.empty()
            ? IdentityStore::default_store_path()
            : config.value().store_path;

        IdentityStore store;
        PKGID_TRY(store.open(store_path));
        PKGID_TRY(store.record(ref.value(), identity));
        log::info("recorded %s:%s in %s", ref.value().short_string().c_str(),
                  identity.package_identity().c_str(), store_path.c_str());
    }
    return ok_status();
}

int main(int argc, char** argv) {
    auto status = run(argc, argv);
    if (status.is_err()) {
        std::cerr << status.error().format() << "\n";
        return 1;
    }
    return 0;
}
