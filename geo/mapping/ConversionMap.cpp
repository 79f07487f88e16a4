#include "ConversionMap.h"

#include <algorithm>

namespace GeoBuffer::Mapping {

void ConversionMap::assign(int id, Category category) {
    auto it = categories_.find(id);
    if (it == categories_.end()) {
        order_.push_back(id);
        categories_.emplace(id, category);
        return;
    }
    it->second = category;
}

std::optional<Category> ConversionMap::category(int id) const {
    auto it = categories_.find(id);
    if (it == categories_.end()) return std::nullopt;
    return it->second;
}

void ConversionMap::setRollerMappings(std::vector<RollerMapping> mappings) {
    // A repeated name keeps its first slot but takes the later category.
    std::vector<RollerMapping> merged;
    for (auto& m : mappings) {
        auto it = std::find_if(merged.begin(), merged.end(), [&](const RollerMapping& e) { return e.name == m.name; });
        if (it != merged.end()) {
            it->to = m.to;
        } else {
            merged.push_back(std::move(m));
        }
    }
    rollers_ = std::move(merged);
}

std::vector<std::string> ConversionMap::rollerNames() const {
    std::vector<std::string> names;
    if (!rollers_) return names;
    names.reserve(rollers_->size());
    for (const auto& m : *rollers_) names.push_back(m.name);
    return names;
}

Category ConversionMap::resolveRoller(const std::string& name) const {
    if (rollers_) {
        auto find = [&](const std::string& key) -> const RollerMapping* {
            for (const auto& m : *rollers_) {
                if (m.name == key) return &m;
            }
            return nullptr;
        };
        if (const auto* m = find(name)) return m->to;
        if (const auto* m = find(kDefaultRollerName)) return m->to;
    }
    return kFallbackRollerCategory;
}

bool ConversionMap::applyRollerOverride(const std::string& name) {
    if (!rollers_) return false;
    const Category to = resolveRoller(name);
    for (int id : kRollerIds) {
        assign(id, to);
    }
    return true;
}

}  // namespace GeoBuffer::Mapping
