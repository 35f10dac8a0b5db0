#ifndef SRC_IDLRPC_HANDLER_HPP_
#define SRC_IDLRPC_HANDLER_HPP_

#include "idlrpc/Representation.hpp"
#include "idlrpc/RpcError.hpp"
#include "idlrpc/Value.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace idlrpc {

// Uppercases the first character of |name|, mapping schema function names to callable names.
std::string capitalize(std::string_view name);

// The two values every handler function returns: a result and an error, where a present error means failure and the
// result is ignored.
template <typename T> struct Reply {
    using ResultType = T;

    Reply(): result(), error() { }
    Reply(T r): result(std::move(r)), error() { }
    Reply(RpcError e): result(), error(std::move(e)) { }

    T result;
    std::optional<RpcError> error;
};

// A type-erased handler function. |params| and |returns| are the declared representations, checked against the
// schema at registration. |invoke| receives converted parameter values and returns the declared return values, which
// for well-formed callables are exactly [result, error-or-nil].
struct Callable {
    using Invoker = std::function<std::vector<Value>(const std::vector<Value>& params)>;

    std::vector<Representation> params;
    std::vector<Representation> returns;
    Invoker invoke;
};

// Explicit representations for a bound function, needed for struct and enum types, which bind as Value.
struct Signature {
    std::vector<Representation> params;
    Representation result;
};

namespace internal {

// Maps supported C++ parameter and result types to their Representation and to and from converted Values.
template <typename T> struct ValueTraits;

template <> struct ValueTraits<std::string> {
    static Representation representation() { return Representation::makeString(); }
    static std::string extract(const Value& v) { return v.getString(); }
    static Value wrap(std::string s) { return Value::makeString(std::move(s)); }
};

template <> struct ValueTraits<int64_t> {
    static Representation representation() { return Representation::makeInt(); }
    static int64_t extract(const Value& v) { return v.getInteger(); }
    static Value wrap(int64_t i) { return Value::makeInteger(i); }
};

template <> struct ValueTraits<double> {
    static Representation representation() { return Representation::makeFloat(); }
    static double extract(const Value& v) { return v.getNumber(); }
    static Value wrap(double d) { return Value::makeFloat(d); }
};

template <> struct ValueTraits<bool> {
    static Representation representation() { return Representation::makeBool(); }
    static bool extract(const Value& v) { return v.getBool(); }
    static Value wrap(bool b) { return Value::makeBool(b); }
};

template <> struct ValueTraits<Value> {
    static Representation representation() { return Representation::makeAny(); }
    static Value extract(const Value& v) { return v; }
    static Value wrap(Value v) { return v; }
};

template <typename T> struct ValueTraits<std::optional<T>> {
    static Representation representation() { return ValueTraits<T>::representation().asNullable(); }
    static std::optional<T> extract(const Value& v) {
        if (v.isNil()) {
            return std::nullopt;
        }
        return ValueTraits<T>::extract(v);
    }
    static Value wrap(std::optional<T> o) {
        if (!o) {
            return Value::makeNil();
        }
        return ValueTraits<T>::wrap(std::move(*o));
    }
};

template <typename T> struct ValueTraits<std::vector<T>> {
    static Representation representation() { return ValueTraits<T>::representation().asArray(); }
    static std::vector<T> extract(const Value& v) {
        std::vector<T> elements;
        if (v.isNil()) {
            return elements;
        }
        elements.reserve(v.size());
        for (const auto& element : v.getArray()) {
            elements.emplace_back(ValueTraits<T>::extract(element));
        }
        return elements;
    }
    static Value wrap(std::vector<T> elements) {
        auto array = Value::makeArray();
        for (auto& element : elements) {
            array.push(ValueTraits<T>::wrap(std::move(element)));
        }
        return array;
    }
};

template <typename F> struct FunctionTraits : FunctionTraits<decltype(&F::operator())> { };

template <typename R, typename... Args> struct FunctionTraits<R (*)(Args...)> {
    using Return = R;
    using Arguments = std::tuple<std::decay_t<Args>...>;
    static constexpr size_t kArity = sizeof...(Args);
};

template <typename C, typename R, typename... Args>
struct FunctionTraits<R (C::*)(Args...) const> : FunctionTraits<R (*)(Args...)> { };

template <typename C, typename R, typename... Args>
struct FunctionTraits<R (C::*)(Args...)> : FunctionTraits<R (*)(Args...)> { };

template <typename... Args> std::vector<Representation> paramRepresentations(std::tuple<Args...>*) {
    return { ValueTraits<Args>::representation()... };
}

template <typename F, typename... Args, size_t... I>
std::vector<Value> invokeBound(F& function, const std::vector<Value>& params, std::tuple<Args...>*,
                               std::index_sequence<I...>) {
    using Return = typename FunctionTraits<F>::Return;
    Return reply = function(ValueTraits<Args>::extract(params[I])...);
    std::vector<Value> returns;
    returns.emplace_back(ValueTraits<typename Return::ResultType>::wrap(std::move(reply.result)));
    returns.emplace_back(reply.error ? reply.error->toValue() : Value::makeNil());
    return returns;
}

template <typename F> Callable::Invoker makeInvoker(F function) {
    using Traits = FunctionTraits<F>;
    return [function = std::move(function)](const std::vector<Value>& params) mutable -> std::vector<Value> {
        // A Signature can declare a different arity than the function has, which must not index out of range.
        if (params.size() != Traits::kArity) {
            return std::vector<Value>();
        }
        return invokeBound(function, params, static_cast<typename Traits::Arguments*>(nullptr),
                           std::make_index_sequence<Traits::kArity>());
    };
}

} // namespace internal

// The binding table of one interface implementation, mapping capitalized function names to Callables. Built before
// registration and read-only afterwards.
class Handler {
public:
    Handler() = default;
    ~Handler() = default;

    // Binds a function object whose parameters are std::string, int64_t, double, bool, Value, or std::optional or
    // std::vector of those, and which returns a Reply<T> of the same set. Representations derive from the C++ types,
    // with Value binding as kAny.
    template <typename F> Handler& bind(std::string_view functionName, F function) {
        using Traits = internal::FunctionTraits<F>;
        Callable callable;
        callable.params = internal::paramRepresentations(static_cast<typename Traits::Arguments*>(nullptr));
        callable.returns = { internal::ValueTraits<typename Traits::Return::ResultType>::representation(),
                             Representation::makeError() };
        callable.invoke = internal::makeInvoker(std::move(function));
        return bindCallable(functionName, std::move(callable));
    }

    // As above, with the representations given explicitly by |signature|.
    template <typename F> Handler& bind(std::string_view functionName, F function, Signature signature) {
        Callable callable;
        callable.params = std::move(signature.params);
        callable.returns = { std::move(signature.result), Representation::makeError() };
        callable.invoke = internal::makeInvoker(std::move(function));
        return bindCallable(functionName, std::move(callable));
    }

    // Binds an already type-erased Callable. Replaces any existing binding of the same name.
    Handler& bindCallable(std::string_view functionName, Callable callable);

    // |functionName| may be in schema or capitalized form. Returns nullptr if not bound.
    const Callable* find(std::string_view functionName) const;
    size_t size() const { return m_callables.size(); }

private:
    std::unordered_map<std::string, Callable> m_callables;
};

} // namespace idlrpc

#endif // SRC_IDLRPC_HANDLER_HPP_
