#pragma once

#include <type_traits>
#include <utility>
#include <stdexcept>
#include <new>

namespace Enclave {

template<typename E>
class Unexpected;

// std::expected-like carrier used for every fallible operation in Enclave
template<typename T, typename E>
class Expected {
    template<typename U>
    static constexpr bool isSelf = std::is_same_v<std::decay_t<U>, Expected>;

    template<typename U>
    static constexpr bool isUnexpected = std::is_same_v<std::decay_t<U>, Unexpected<E>>;

public:
    struct ValueTag {};
    struct ErrorTag {};

    template<typename U = T, typename = std::enable_if_t<std::is_default_constructible_v<U>>>
    Expected() noexcept(std::is_nothrow_default_constructible_v<T>)
        : hasValue_(true) {
        new (&value_) T();
    }

    template<typename U, typename = std::enable_if_t<
        !isSelf<U> && !isUnexpected<U> && std::is_constructible_v<T, U>>>
    Expected(U&& value) noexcept(std::is_nothrow_constructible_v<T, U>)
        : hasValue_(true) {
        new (&value_) T(std::forward<U>(value));
    }

    template<typename U>
    Expected(ValueTag, U&& value)
        : hasValue_(true) {
        new (&value_) T(std::forward<U>(value));
    }

    template<typename G>
    Expected(ErrorTag, G&& error)
        : hasValue_(false) {
        new (&error_) E(std::forward<G>(error));
    }

    // Bare error values are accepted when they cannot be mistaken for a T
    template<typename G, typename = std::enable_if_t<
        std::is_constructible_v<E, const G&> &&
        !std::is_constructible_v<T, const G&> &&
        !isSelf<G> && !isUnexpected<G>>>
    Expected(const G& error)
        : hasValue_(false) {
        new (&error_) E(error);
    }

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, const G&>>>
    Expected(const Unexpected<G>& unexpected)
        : hasValue_(false) {
        new (&error_) E(unexpected.error());
    }

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, G&&>>>
    Expected(Unexpected<G>&& unexpected)
        : hasValue_(false) {
        new (&error_) E(std::move(unexpected).error());
    }

    Expected(const Expected& other) : hasValue_(other.hasValue_) {
        if (hasValue_) {
            new (&value_) T(other.value_);
        } else {
            new (&error_) E(other.error_);
        }
    }

    Expected(Expected&& other) noexcept : hasValue_(other.hasValue_) {
        if (hasValue_) {
            new (&value_) T(std::move(other.value_));
        } else {
            new (&error_) E(std::move(other.error_));
        }
    }

    ~Expected() {
        destroy();
    }

    Expected& operator=(const Expected& other) {
        if (this != &other) {
            Expected copy(other);
            destroy();
            new (this) Expected(std::move(copy));
        }
        return *this;
    }

    Expected& operator=(Expected&& other) noexcept {
        if (this != &other) {
            destroy();
            new (this) Expected(std::move(other));
        }
        return *this;
    }

    bool hasValue() const noexcept { return hasValue_; }
    bool hasError() const noexcept { return !hasValue_; }
    explicit operator bool() const noexcept { return hasValue_; }

    const T& value() const& {
        if (!hasValue_) {
            throw std::logic_error("Expected holds an error, not a value");
        }
        return value_;
    }

    T& value() & {
        if (!hasValue_) {
            throw std::logic_error("Expected holds an error, not a value");
        }
        return value_;
    }

    T&& value() && {
        if (!hasValue_) {
            throw std::logic_error("Expected holds an error, not a value");
        }
        return std::move(value_);
    }

    const E& error() const& {
        if (hasValue_) {
            throw std::logic_error("Expected holds a value, not an error");
        }
        return error_;
    }

    E& error() & {
        if (hasValue_) {
            throw std::logic_error("Expected holds a value, not an error");
        }
        return error_;
    }

    template<typename U>
    T valueOr(U&& fallback) const& {
        return hasValue_ ? value_ : static_cast<T>(std::forward<U>(fallback));
    }

    template<typename U>
    T valueOr(U&& fallback) && {
        return hasValue_ ? std::move(value_) : static_cast<T>(std::forward<U>(fallback));
    }

    // f(const T&) -> Expected<U, E>
    template<typename F>
    auto andThen(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using Result = std::invoke_result_t<F, const T&>;
        if (hasValue_) {
            return std::forward<F>(f)(value_);
        }
        return Result(typename Result::ErrorTag{}, error_);
    }

    // f(const T&) -> U
    template<typename F>
    auto transform(F&& f) const& -> Expected<std::invoke_result_t<F, const T&>, E> {
        using Result = Expected<std::invoke_result_t<F, const T&>, E>;
        if (hasValue_) {
            return Result(typename Result::ValueTag{}, std::forward<F>(f)(value_));
        }
        return Result(typename Result::ErrorTag{}, error_);
    }

private:
    void destroy() noexcept {
        if (hasValue_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }

    bool hasValue_;
    union {
        T value_;
        E error_;
    };
};

template<typename E>
class Unexpected {
public:
    explicit Unexpected(const E& error) : error_(error) {}
    explicit Unexpected(E&& error) : error_(std::move(error)) {}

    const E& error() const& { return error_; }
    E& error() & { return error_; }
    E&& error() && { return std::move(error_); }

private:
    E error_;
};

template<typename E>
Unexpected<std::decay_t<E>> makeUnexpected(E&& error) {
    return Unexpected<std::decay_t<E>>(std::forward<E>(error));
}

template<typename E>
class Expected<void, E> {
    template<typename G>
    static constexpr bool isSelf = std::is_same_v<std::decay_t<G>, Expected>;

public:
    struct ErrorTag {};

    Expected() noexcept : hasValue_(true) {}

    template<typename G, typename = std::enable_if_t<
        !isSelf<G> && std::is_constructible_v<E, G&&>>>
    Expected(G&& error)
        : hasValue_(false) {
        new (&error_) E(std::forward<G>(error));
    }

    template<typename G>
    Expected(ErrorTag, G&& error)
        : hasValue_(false) {
        new (&error_) E(std::forward<G>(error));
    }

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, const G&>>>
    Expected(const Unexpected<G>& unexpected)
        : hasValue_(false) {
        new (&error_) E(unexpected.error());
    }

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, G&&>>>
    Expected(Unexpected<G>&& unexpected)
        : hasValue_(false) {
        new (&error_) E(std::move(unexpected).error());
    }

    Expected(const Expected& other) : hasValue_(other.hasValue_) {
        if (!hasValue_) {
            new (&error_) E(other.error_);
        }
    }

    Expected(Expected&& other) noexcept : hasValue_(other.hasValue_) {
        if (!hasValue_) {
            new (&error_) E(std::move(other.error_));
        }
    }

    ~Expected() {
        if (!hasValue_) {
            error_.~E();
        }
    }

    Expected& operator=(const Expected& other) {
        if (this != &other) {
            Expected copy(other);
            this->~Expected();
            new (this) Expected(std::move(copy));
        }
        return *this;
    }

    Expected& operator=(Expected&& other) noexcept {
        if (this != &other) {
            this->~Expected();
            new (this) Expected(std::move(other));
        }
        return *this;
    }

    bool hasValue() const noexcept { return hasValue_; }
    bool hasError() const noexcept { return !hasValue_; }
    explicit operator bool() const noexcept { return hasValue_; }

    void value() const {
        if (!hasValue_) {
            throw std::logic_error("Expected holds an error, not a value");
        }
    }

    const E& error() const& {
        if (hasValue_) {
            throw std::logic_error("Expected holds a value, not an error");
        }
        return error_;
    }

private:
    bool hasValue_;
    union {
        E error_;
    };
};

} // namespace Enclave
