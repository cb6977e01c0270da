#pragma once

#include <system_error>
#include <utility>
#include <variant>

template <typename E>
struct ErrorWrapper {
    E value;
};

template <typename E>
ErrorWrapper<std::decay_t<E>> error(E&& e)
{
    return ErrorWrapper<std::decay_t<E>> { std::forward<E>(e) };
}

template <typename T, typename E = std::error_code>
class Result {
public:
    Result(const T& t)
        : value_(std::in_place_index<0>, t)
    {
    }

    Result(T&& t)
        : value_(std::in_place_index<0>, std::move(t))
    {
    }

    template <typename U>
    Result(ErrorWrapper<U>&& e)
        : value_(std::in_place_index<1>, E { std::move(e.value) })
    {
    }

    bool hasValue() const { return value_.index() == 0; }
    explicit operator bool() const { return hasValue(); }

    const T& value() const { return std::get<0>(value_); }
    T& value() { return std::get<0>(value_); }

    const T& operator*() const { return value(); }
    T& operator*() { return value(); }

    const T* operator->() const { return &value(); }
    T* operator->() { return &value(); }

    const E& error() const { return std::get<1>(value_); }
    E& error() { return std::get<1>(value_); }

private:
    std::variant<T, E> value_;
};

// For operations that either succeed without producing anything or fail
template <typename E>
class Result<void, E> {
public:
    Result() = default;

    template <typename U>
    Result(ErrorWrapper<U>&& e)
        : error_(E { std::move(e.value) })
        , failed_(true)
    {
    }

    bool hasValue() const { return !failed_; }
    explicit operator bool() const { return hasValue(); }

    const E& error() const { return error_; }
    E& error() { return error_; }

private:
    E error_ {};
    bool failed_ = false;
};
