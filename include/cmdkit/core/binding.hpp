/**
 * @file binding.hpp
 * @brief Adapts typed callables into command handlers.
 *
 * A handler receives CallArgs. Most commands are easier to write with
 * typed parameters, so bind() unpacks the resolved values in signature
 * order and converts each one to the parameter's type:
 *
 * @code
 * registry.command("greet", {param("name"), param("capitalize", false)},
 *     [](const std::string& name, bool capitalize) {
 *         return capitalize ? utils::to_upper(name) : name;
 *     });
 * @endcode
 *
 * Supported parameter types: std::string, bool, integral types, double,
 * Value, std::optional<std::string>, Kwargs (keyword catch-all) and Argv
 * (raw capture).
 *
 * @copyright Copyright (c) 2024 cmdkit Contributors
 * @license MIT License
 */

#pragma once

#include "cmdkit/core/command.hpp"
#include "cmdkit/core/errors.hpp"
#include "cmdkit/core/value.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

namespace cmdkit {

namespace detail {

template<typename T>
struct callable_traits : callable_traits<decltype(&T::operator())> {};

template<typename R, typename... Args>
struct callable_traits<R (*)(Args...)> {
    using result_type = R;
    using args_tuple = std::tuple<Args...>;
    static constexpr size_t arity = sizeof...(Args);
};

template<typename R, typename... Args>
struct callable_traits<R(Args...)> : callable_traits<R (*)(Args...)> {};

template<typename C, typename R, typename... Args>
struct callable_traits<R (C::*)(Args...)> : callable_traits<R (*)(Args...)> {};

template<typename C, typename R, typename... Args>
struct callable_traits<R (C::*)(Args...) const> : callable_traits<R (*)(Args...)> {};

template<typename T>
inline constexpr bool always_false_v = false;

template<typename F>
inline constexpr bool is_raw_handler_v = std::is_invocable_v<F&, const CallArgs&>;

[[noreturn]] inline void throwConversionError(const std::string& name, const Value& value,
                                              const char* expected) {
    throw UsageError("argument " + name + ": invalid " + expected + " value: '" +
                     value.to_string() + "'");
}

template<typename T>
T narrow_integer(int64_t raw, const std::string& name) {
    bool fits;
    if constexpr (std::is_unsigned_v<T>) {
        fits = raw >= 0 &&
               static_cast<uint64_t>(raw) <= static_cast<uint64_t>(std::numeric_limits<T>::max());
    } else {
        fits = raw >= static_cast<int64_t>(std::numeric_limits<T>::min()) &&
               raw <= static_cast<int64_t>(std::numeric_limits<T>::max());
    }
    if (!fits) {
        throw UsageError("argument " + name + ": int value out of range: '" +
                         std::to_string(raw) + "'");
    }
    return static_cast<T>(raw);
}

} // namespace detail

/**
 * @brief Convert a resolved value to a handler parameter type.
 * @throws UsageError if the value has no sensible conversion or does not
 *         fit the integer type
 */
template<typename T>
T value_cast(const Value& value, const std::string& name) {
    if constexpr (std::is_same_v<T, Value>) {
        return value;
    } else if constexpr (std::is_same_v<T, std::string>) {
        return value.is_string() ? value.as_string() : value.to_string();
    } else if constexpr (std::is_same_v<T, std::optional<std::string>>) {
        if (value.is_none()) {
            return std::nullopt;
        }
        return value_cast<std::string>(value, name);
    } else if constexpr (std::is_same_v<T, bool>) {
        if (value.is_bool()) {
            return value.as_bool();
        }
        if (value.is_none()) {
            return false;
        }
        if (value.is_string()) {
            if (auto parsed = parseBoolean(value.as_string())) {
                return *parsed;
            }
        }
        detail::throwConversionError(name, value, "bool");
    } else if constexpr (std::is_integral_v<T>) {
        if (value.is_integer()) {
            return detail::narrow_integer<T>(value.as_integer(), name);
        }
        if (value.is_string()) {
            if (auto parsed = coerceText(value.as_string(), ValueType::Integer)) {
                return detail::narrow_integer<T>(parsed->as_integer(), name);
            }
        }
        detail::throwConversionError(name, value, "int");
    } else if constexpr (std::is_floating_point_v<T>) {
        if (value.is_float()) {
            return static_cast<T>(value.as_float());
        }
        if (value.is_integer()) {
            return static_cast<T>(value.as_integer());
        }
        if (value.is_string()) {
            if (auto parsed = coerceText(value.as_string(), ValueType::Float)) {
                return static_cast<T>(parsed->as_float());
            }
        }
        detail::throwConversionError(name, value, "float");
    } else {
        static_assert(detail::always_false_v<T>, "unsupported handler parameter type");
    }
}

namespace detail {

template<typename P>
std::decay_t<P> extract(const CallArgs& args, size_t index) {
    using T = std::decay_t<P>;
    if constexpr (std::is_same_v<T, Kwargs>) {
        return args.extra();
    } else if constexpr (std::is_same_v<T, Argv>) {
        return args.raw();
    } else {
        return value_cast<T>(args.at(index), args.name_at(index));
    }
}

template<typename F, size_t... I>
Value invoke_bound(F& fn, const CallArgs& args, std::index_sequence<I...>) {
    using traits = callable_traits<F>;
    using R = typename traits::result_type;
    using Params = typename traits::args_tuple;

    if constexpr (std::is_void_v<R>) {
        fn(extract<std::tuple_element_t<I, Params>>(args, I)...);
        return Value();
    } else {
        return Value(fn(extract<std::tuple_element_t<I, Params>>(args, I)...));
    }
}

} // namespace detail

/**
 * @brief Number of parameters a callable declares, or std::nullopt for a
 *        handler taking CallArgs directly.
 */
template<typename F>
constexpr std::optional<size_t> arity_of() {
    if constexpr (detail::is_raw_handler_v<F>) {
        return std::nullopt;
    } else {
        return detail::callable_traits<std::decay_t<F>>::arity;
    }
}

/**
 * @brief Wrap a callable into a Handler.
 *
 * Callables taking `const CallArgs&` are wrapped as-is; anything else has
 * its parameters filled from the resolved values. A void result becomes a
 * none value.
 */
template<typename F>
Handler bind(F fn) {
    if constexpr (detail::is_raw_handler_v<F>) {
        return [fn = std::move(fn)](const CallArgs& args) mutable -> Value {
            if constexpr (std::is_void_v<std::invoke_result_t<F&, const CallArgs&>>) {
                fn(args);
                return Value();
            } else {
                return Value(fn(args));
            }
        };
    } else {
        constexpr size_t arity = detail::callable_traits<F>::arity;
        return [fn = std::move(fn)](const CallArgs& args) mutable -> Value {
            return detail::invoke_bound(fn, args, std::make_index_sequence<arity>{});
        };
    }
}

} // namespace cmdkit
