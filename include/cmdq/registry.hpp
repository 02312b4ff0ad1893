#ifndef CMDQ_REGISTRY_HPP
#define CMDQ_REGISTRY_HPP

#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include "context.hpp"
#include "converter.hpp"
#include "value.hpp"

namespace cmdq {

// Type services used while binding arguments: converter lookup, fallback
// construction for types without a converter, and default values for
// parameters that received no token.
//
// Safe to read from several executor threads while another thread registers.
class Registry {
public:
    // Builds a value of the factory's type from raw tokens; std::nullopt on failure.
    using Factory = std::function<std::optional<Value>(const std::vector<Value>& tokens, const Context& ctx)>;
    using DefaultMaker = std::function<Value()>;

    // Starts with the built-in converters.
    Registry();

    // Replaces any converter already registered for the same type.
    Registry& addConverter(std::shared_ptr<const Converter> converter);

    Registry& addFactory(const Type& type, Factory factory, DefaultMaker makeDefault = {});

    // Registers a user type under `name`; its default value is T{} when T is
    // default constructible.
    template <typename T>
    Registry& addType(Factory factory) {
        DefaultMaker makeDefault;
        if constexpr (std::is_default_constructible_v<T>) {
            makeDefault = [] { return Value::of(T{}); };
        }
        return addFactory(Type::of<T>(), std::move(factory), std::move(makeDefault));
    }

    [[nodiscard]] std::shared_ptr<const Converter> converter(const Type& type) const;

    // Zero/empty value for built-in kinds, the registered default for user
    // types, and a None value when nothing is known.
    [[nodiscard]] Value constructDefault(const Type& type) const;

    [[nodiscard]] std::optional<Value> constructFromTokens(const Type& type,
                                                           const std::vector<Value>& tokens,
                                                           const Context& ctx) const;

private:
    struct FactoryEntry {
        Factory build;
        DefaultMaker makeDefault;
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, std::shared_ptr<const Converter>> converters_;
    std::unordered_map<std::type_index, FactoryEntry> factories_;
};

} // namespace cmdq

#endif // CMDQ_REGISTRY_HPP
