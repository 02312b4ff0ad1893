#include "cmdq/metadata.hpp"

#include "cmdq/utils.hpp"

namespace cmdq {

void MetadataTable::add(Entry metadata) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(std::move(metadata));
}

std::vector<MetadataTable::Entry> MetadataTable::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

std::vector<MetadataTable::Entry> MetadataTable::resolveByAlias(std::string_view input) const {
    const auto lowered = utils::toLower(input);
    std::vector<Entry> out;
    for (auto& entry : snapshot()) {
        if (entry->match(lowered)) out.push_back(std::move(entry));
    }
    return out;
}

std::vector<std::string> MetadataTable::aliasPatterns() const {
    std::vector<std::string> out;
    for (const auto& entry : snapshot()) {
        for (const auto& alias : entry->aliases()) out.push_back(alias.pattern());
    }
    return out;
}

std::size_t MetadataTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace cmdq
