#pragma once

#include <shortguid/error.hpp>
#include <functional>
#include <utility>
#include <variant>

namespace shortguid {

// Either a T or the GuidError explaining why there is none.
//
//   auto id = ShortGuid::try_parse(text);
//   if (id.is_err()) return id.error();
//   use(id.value());
template<typename T>
class Result {
public:
    using value_type = T;

    // Implicit so functions returning Result<T> can `return GuidError{...};`
    Result(GuidError err) : data_(std::move(err)) {}

    static Result ok(T val) { return Result(std::in_place_index<0>, std::move(val)); }
    static Result err(GuidError e) { return Result(std::move(e)); }

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }
    explicit operator bool() const { return is_ok(); }

    T& value() & { return std::get<0>(data_); }
    const T& value() const& { return std::get<0>(data_); }
    T&& value() && { return std::get<0>(std::move(data_)); }

    GuidError& error() & { return std::get<1>(data_); }
    const GuidError& error() const& { return std::get<1>(data_); }
    GuidError&& error() && { return std::get<1>(std::move(data_)); }

    // The error is discarded
    T value_or(T fallback) const& {
        return is_ok() ? value() : std::move(fallback);
    }

    template<typename F>
    auto map(F&& f) const -> Result<std::invoke_result_t<F, const T&>> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_err()) return Result<U>::err(error());
        return Result<U>::ok(std::invoke(std::forward<F>(f), value()));
    }

    // Rewrites the error, e.g. to prefix the message with context
    template<typename F>
    Result map_err(F&& f) const {
        if (is_ok()) return *this;
        return Result::err(std::invoke(std::forward<F>(f), error()));
    }

    template<typename F>
    auto and_then(F&& f) const -> std::invoke_result_t<F, const T&> {
        using R = std::invoke_result_t<F, const T&>;
        if (is_err()) return R::err(error());
        return std::invoke(std::forward<F>(f), value());
    }

    template<typename F>
    Result or_else(F&& f) const {
        if (is_ok()) return *this;
        return std::invoke(std::forward<F>(f), error());
    }

private:
    template<typename... Args>
    explicit Result(std::in_place_index_t<0> tag, Args&&... args)
        : data_(tag, std::forward<Args>(args)...) {}

    std::variant<T, GuidError> data_;
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

// Returns early with the error of a failed Result or Status
#define SHORTGUID_TRY(expr) \
    do { \
        auto _shortguid_result = (expr); \
        if (_shortguid_result.is_err()) return std::move(_shortguid_result).error(); \
    } while(0)

} // namespace shortguid
