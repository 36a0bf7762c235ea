#pragma once
#include <stdexcept>
#include <utility>
#include <variant>

namespace core {

template <typename E>
struct Unexpected {
    E error;
};

template <typename E>
Unexpected<std::decay_t<E>> make_unexpected(E&& e) {
    return Unexpected<std::decay_t<E>>{std::forward<E>(e)};
}

// Value-or-error result used at the adapter and per-segment boundaries.
template <typename T, typename E>
class Expected {
public:
    Expected(const T& value) : storage_(std::in_place_index<0>, value) {}
    Expected(T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Expected(Unexpected<E> u) : storage_(std::in_place_index<1>, std::move(u.error)) {}

    bool has_value() const { return storage_.index() == 0; }
    bool has_error() const { return storage_.index() == 1; }
    explicit operator bool() const { return has_value(); }

    T& value() {
        if (!has_value()) throw std::logic_error("Expected::value() on error");
        return std::get<0>(storage_);
    }
    const T& value() const {
        if (!has_value()) throw std::logic_error("Expected::value() on error");
        return std::get<0>(storage_);
    }
    const E& error() const {
        if (!has_error()) throw std::logic_error("Expected::error() on value");
        return std::get<1>(storage_);
    }

private:
    std::variant<T, E> storage_;
};

} // namespace core
