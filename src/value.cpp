#include "cmdq/value.hpp"

#include <sstream>

namespace cmdq {

namespace {

template <typename T>
std::string joinList(const std::vector<T>& items) {
    std::ostringstream os;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i) os << ' ';
        os << items[i];
    }
    return os.str();
}

} // namespace

std::string Value::toString() const {
    switch (kind()) {
        case Kind::None: return {};
        case Kind::Bool: return std::get<bool>(data_) ? "true" : "false";
        case Kind::Int: return std::to_string(std::get<int>(data_));
        case Kind::Int64: return std::to_string(std::get<std::int64_t>(data_));
        case Kind::UInt64: return std::to_string(std::get<std::uint64_t>(data_));
        case Kind::Float: {
            std::ostringstream os;
            os << std::get<float>(data_);
            return os.str();
        }
        case Kind::Double: {
            std::ostringstream os;
            os << std::get<double>(data_);
            return os.str();
        }
        case Kind::Duration: return std::to_string(std::get<std::chrono::milliseconds>(data_).count()) + "ms";
        case Kind::String: return std::get<std::string>(data_);
        case Kind::IntList: return joinList(std::get<std::vector<int>>(data_));
        case Kind::StringList: return joinList(std::get<std::vector<std::string>>(data_));
        case Kind::Object: return "<" + type_.name() + ">";
    }
    return {};
}

} // namespace cmdq
