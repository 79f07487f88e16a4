// Item id -> geoBuffer category lookup, with the roller group override.
#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace GeoBuffer::Mapping {

struct Category {
    int x{0};
    int y{0};

    bool operator==(const Category& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Category& other) const { return !(*this == other); }
};

struct CategoryHash {
    std::size_t operator()(const Category& c) const {
        const auto hi = static_cast<unsigned long long>(static_cast<unsigned int>(c.x)) << 32;
        return std::hash<unsigned long long>()(hi | static_cast<unsigned int>(c.y));
    }
};

// Named category choice for the roller group (one entry of roller_mappings.json).
struct RollerMapping {
    std::string name;
    Category to;
};

// Ids that move together when a roller entry is selected.
constexpr std::array<int, 8> kRollerIds = {41, 42, 43, 44, 579, 580, 587, 588};
constexpr const char* kDefaultRollerName = "Default";
constexpr Category kFallbackRollerCategory{24, 4};

class ConversionMap {
public:
    // Maps id to category. A new id is appended to the iteration order; an existing id keeps its slot.
    void assign(int id, Category category);

    std::optional<Category> category(int id) const;
    bool contains(int id) const { return categories_.count(id) != 0; }

    // Mapped ids in the order they were first assigned.
    const std::vector<int>& ids() const { return order_; }
    std::size_t size() const { return order_.size(); }
    bool empty() const { return order_.empty(); }

    void setRollerMappings(std::vector<RollerMapping> mappings);
    bool hasRollerMappings() const { return rollers_.has_value(); }
    // Configured roller names, in file order.
    std::vector<std::string> rollerNames() const;
    // Category the named entry resolves to: the entry itself, else "Default", else (24, 4).
    Category resolveRoller(const std::string& name) const;

    // Reassigns every roller id to the selected entry's category.
    // Returns false and leaves the map untouched when no roller configuration is loaded.
    bool applyRollerOverride(const std::string& name);

private:
    std::vector<int> order_;
    std::unordered_map<int, Category> categories_;
    std::optional<std::vector<RollerMapping>> rollers_;
};

}  // namespace GeoBuffer::Mapping
