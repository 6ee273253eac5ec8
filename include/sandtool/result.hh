#pragma once

#include <type_traits>
#include <utility>
#include <variant>

template <class T>
struct Ok {
    T val;
};

template <class T>
Ok(T) -> Ok<T>;

template <class E>
struct Err {
    E err;
};

template <class E>
Err(E) -> Err<E>;

// Either a value (Ok) or an error (Err)
template <class T, class E>
class Result {
    static_assert(!std::is_same_v<T, E>, "ambiguous Result");

    std::variant<T, E> var_;

public:
    template <class U>
    // NOLINTNEXTLINE(google-explicit-constructor)
    Result(Ok<U> ok)
    : var_{std::in_place_index<0>, std::move(ok.val)} {}

    template <class U>
    // NOLINTNEXTLINE(google-explicit-constructor)
    Result(Err<U> err)
    : var_{std::in_place_index<1>, std::move(err.err)} {}

    [[nodiscard]] bool is_ok() const noexcept { return var_.index() == 0; }

    [[nodiscard]] bool is_err() const noexcept { return var_.index() == 1; }

    T& operator*() & { return std::get<0>(var_); }
    const T& operator*() const& { return std::get<0>(var_); }
    T&& operator*() && { return std::get<0>(std::move(var_)); }

    T* operator->() { return &std::get<0>(var_); }
    const T* operator->() const { return &std::get<0>(var_); }

    E& unwrap_err() & { return std::get<1>(var_); }
    const E& unwrap_err() const& { return std::get<1>(var_); }
    E&& unwrap_err() && { return std::get<1>(std::move(var_)); }
};
