// Parsed level data: fixed-width rows of item ids in file order.
#pragma once

#include <array>
#include <cstddef>
#include <vector>

namespace GeoBuffer::Level {

constexpr std::size_t kRowWidth = 5;

using Row = std::array<int, kRowWidth>;
using LevelGrid = std::vector<Row>;

}  // namespace GeoBuffer::Level
