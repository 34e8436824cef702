#pragma once

#include <pkgid/error.hpp>
#include <variant>
#include <string>

namespace pkgid {

template<typename T>
class Result {
    std::variant<T, PkgidError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from PkgidError so PKGID_TRY can return errors across Result<T> types
    Result(PkgidError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(PkgidError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<PkgidError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    PkgidError& error() & { return std::get<PkgidError>(data_); }
    const PkgidError& error() const& { return std::get<PkgidError>(data_); }
    PkgidError&& error() && { return std::get<PkgidError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    // Attach the file an error came from, unless one is already recorded
    Result with_file(const std::string& path) && {
        if (is_err() && error().file.empty()) {
            error().file = path;
        }
        return std::move(*this);
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define PKGID_TRY(expr) \
    do { \
        auto _pkgid_result = (expr); \
        if (_pkgid_result.is_err()) return std::move(_pkgid_result).error(); \
    } while(0)

} // namespace pkgid
