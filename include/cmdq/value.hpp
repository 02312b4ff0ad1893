#ifndef CMDQ_VALUE_HPP
#define CMDQ_VALUE_HPP

#include <any>
#include <chrono>
#include <cstdint>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

namespace cmdq {

enum class Kind {
    None,
    Bool,
    Int,
    Int64,
    UInt64,
    Float,
    Double,
    Duration,
    String,
    IntList,
    StringList,
    Object,
};

// Describes the declared type of a parameter or the runtime type of a Value.
// Two types are equal when they name the same C++ type.
class Type {
public:
    Type() = default;

    template <typename T>
    static Type of();

    // User types: anything that is not one of the built-in kinds.
    template <typename T>
    static Type object(std::string name) {
        return Type(Kind::Object, std::type_index(typeid(T)), std::move(name));
    }

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] std::type_index index() const { return index_; }

    bool operator==(const Type& other) const { return index_ == other.index_; }
    bool operator!=(const Type& other) const { return !(*this == other); }

private:
    Type(Kind kind, std::type_index index, std::string name)
        : kind_(kind), index_(index), name_(std::move(name)) {}

    Kind kind_{Kind::None};
    std::type_index index_{typeid(void)};
    std::string name_{"none"};

    template <typename T>
    friend struct TypeOf;
};

// Maps a C++ type to its Type. Specialized for the built-in kinds; everything
// else becomes an Object named after typeid(T).
template <typename T>
struct TypeOf {
    static Type get() { return Type(Kind::Object, std::type_index(typeid(T)), typeid(T).name()); }
};

template <>
struct TypeOf<void> {
    static Type get() { return Type(Kind::None, std::type_index(typeid(void)), "none"); }
};

template <>
struct TypeOf<bool> {
    static Type get() { return Type(Kind::Bool, std::type_index(typeid(bool)), "bool"); }
};

template <>
struct TypeOf<int> {
    static Type get() { return Type(Kind::Int, std::type_index(typeid(int)), "int"); }
};

template <>
struct TypeOf<std::int64_t> {
    static Type get() { return Type(Kind::Int64, std::type_index(typeid(std::int64_t)), "int64"); }
};

template <>
struct TypeOf<std::uint64_t> {
    static Type get() { return Type(Kind::UInt64, std::type_index(typeid(std::uint64_t)), "uint64"); }
};

template <>
struct TypeOf<float> {
    static Type get() { return Type(Kind::Float, std::type_index(typeid(float)), "float"); }
};

template <>
struct TypeOf<double> {
    static Type get() { return Type(Kind::Double, std::type_index(typeid(double)), "double"); }
};

template <>
struct TypeOf<std::chrono::milliseconds> {
    static Type get() { return Type(Kind::Duration, std::type_index(typeid(std::chrono::milliseconds)), "duration"); }
};

template <>
struct TypeOf<std::string> {
    static Type get() { return Type(Kind::String, std::type_index(typeid(std::string)), "string"); }
};

template <>
struct TypeOf<std::vector<int>> {
    static Type get() { return Type(Kind::IntList, std::type_index(typeid(std::vector<int>)), "int[]"); }
};

template <>
struct TypeOf<std::vector<std::string>> {
    static Type get() { return Type(Kind::StringList, std::type_index(typeid(std::vector<std::string>)), "string[]"); }
};

template <typename T>
Type Type::of() {
    return TypeOf<std::decay_t<T>>::get();
}

// A tagged value. Tokens produced by the tokenizer are String values; values
// forwarded between pipeline stages keep whatever type the handler returned.
class Value {
public:
    using Storage = std::variant<std::monostate,
                                 bool,
                                 int,
                                 std::int64_t,
                                 std::uint64_t,
                                 float,
                                 double,
                                 std::chrono::milliseconds,
                                 std::string,
                                 std::vector<int>,
                                 std::vector<std::string>,
                                 std::any>;

    Value() = default;
    explicit Value(std::string s) : type_(Type::of<std::string>()), data_(std::in_place_type<std::string>, std::move(s)) {}
    explicit Value(const char* s) : Value(std::string(s)) {}

    template <typename T>
    static Value of(T&& v) {
        using U = std::decay_t<T>;
        if constexpr (std::is_same_v<U, Value>) {
            return Value(std::forward<T>(v));
        } else if constexpr (std::is_same_v<U, const char*> || std::is_same_v<U, char*>) {
            return Value(std::string(v));
        } else {
            return ofStored<U>(std::forward<T>(v));
        }
    }

    // For user types registered under an explicit name (see Type::object).
    template <typename T>
    static Value object(T&& v, Type type) {
        Value out;
        out.type_ = std::move(type);
        out.data_.template emplace<std::any>(std::forward<T>(v));
        return out;
    }

    [[nodiscard]] const Type& type() const { return type_; }
    [[nodiscard]] Kind kind() const { return type_.kind(); }
    [[nodiscard]] bool isNone() const { return std::holds_alternative<std::monostate>(data_); }

    template <typename T>
    [[nodiscard]] bool is() const {
        return type_ == Type::of<T>();
    }

    // Throws std::bad_variant_access / std::bad_any_cast on a type mismatch.
    template <typename T>
    [[nodiscard]] T as() const {
        using U = std::decay_t<T>;
        if constexpr (isBuiltin<U>()) {
            return std::get<U>(data_);
        } else {
            return std::any_cast<U>(std::get<std::any>(data_));
        }
    }

    // Text form used when a typed value has to go through a converter again.
    [[nodiscard]] std::string toString() const;

private:
    template <typename U, typename T>
    static Value ofStored(T&& v) {
        Value out;
        out.type_ = Type::of<U>();
        if constexpr (isBuiltin<U>()) {
            out.data_.template emplace<U>(std::forward<T>(v));
        } else {
            out.data_.template emplace<std::any>(std::forward<T>(v));
        }
        return out;
    }

    template <typename U>
    static constexpr bool isBuiltin() {
        return std::is_same_v<U, bool> || std::is_same_v<U, int> || std::is_same_v<U, std::int64_t> ||
               std::is_same_v<U, std::uint64_t> || std::is_same_v<U, float> || std::is_same_v<U, double> ||
               std::is_same_v<U, std::chrono::milliseconds> || std::is_same_v<U, std::string> ||
               std::is_same_v<U, std::vector<int>> || std::is_same_v<U, std::vector<std::string>>;
    }

    Type type_;
    Storage data_;
};

} // namespace cmdq

#endif // CMDQ_VALUE_HPP
