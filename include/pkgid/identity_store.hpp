#pragma once

#include <pkgid/result.hpp>
#include <pkgid/identity/build_identity.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace pkgid {

struct StoredIdentity {
    std::string reference;   // name/version[@user/channel]
    std::string package_id;
    int64_t created_at = 0;
};

// SQLite index of computed identities: reference + package ID -> canonical
// dump. Keeps provenance for diffing and settings queries; holds no artifacts.
class IdentityStore {
public:
    IdentityStore();
    ~IdentityStore();
    IdentityStore(IdentityStore&&) noexcept;
    IdentityStore& operator=(IdentityStore&&) noexcept;

    // Database lifecycle
    Status open(const std::string& db_path);
    void close();
    bool is_open() const;
    static std::string default_store_path();

    // Upserts; the package identity part of `ref` is ignored
    Status record(const ComponentRef& ref, const BuildIdentity& identity);
    Result<BuildIdentity> lookup(const ComponentRef& ref, const std::string& package_id);
    Result<std::vector<StoredIdentity>> list(const ComponentRef& ref);
    // Package IDs whose full settings contain every name=value of `query`
    Result<std::vector<std::string>> search(const ComponentRef& ref,
                                            const std::map<std::string, std::string>& query);
    Status remove(const ComponentRef& ref, const std::string& package_id);
    Result<int64_t> count();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace pkgid
