#include "cmdq/registry.hpp"

#include <mutex>

namespace cmdq {

Registry::Registry() {
    for (auto& c : builtinConverters()) {
        converters_[c->type().index()] = std::move(c);
    }
}

Registry& Registry::addConverter(std::shared_ptr<const Converter> converter) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const auto key = converter->type().index();
    converters_[key] = std::move(converter);
    return *this;
}

Registry& Registry::addFactory(const Type& type, Factory factory, DefaultMaker makeDefault) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    factories_[type.index()] = FactoryEntry{std::move(factory), std::move(makeDefault)};
    return *this;
}

std::shared_ptr<const Converter> Registry::converter(const Type& type) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = converters_.find(type.index());
    if (it == converters_.end()) return nullptr;
    return it->second;
}

Value Registry::constructDefault(const Type& type) const {
    switch (type.kind()) {
        case Kind::None: return Value();
        case Kind::Bool: return Value::of(false);
        case Kind::Int: return Value::of(0);
        case Kind::Int64: return Value::of(std::int64_t{0});
        case Kind::UInt64: return Value::of(std::uint64_t{0});
        case Kind::Float: return Value::of(0.0f);
        case Kind::Double: return Value::of(0.0);
        case Kind::Duration: return Value::of(std::chrono::milliseconds{0});
        case Kind::String: return Value(std::string());
        case Kind::IntList: return Value::of(std::vector<int>{});
        case Kind::StringList: return Value::of(std::vector<std::string>{});
        case Kind::Object: break;
    }

    DefaultMaker makeDefault;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        const auto it = factories_.find(type.index());
        if (it != factories_.end()) makeDefault = it->second.makeDefault;
    }
    if (!makeDefault) return Value();
    return makeDefault();
}

std::optional<Value> Registry::constructFromTokens(const Type& type,
                                                   const std::vector<Value>& tokens,
                                                   const Context& ctx) const {
    Factory build;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        const auto it = factories_.find(type.index());
        if (it != factories_.end()) build = it->second.build;
    }
    if (!build) return std::nullopt;
    return build(tokens, ctx);
}

} // namespace cmdq
