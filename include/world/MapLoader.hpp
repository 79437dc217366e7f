/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef MAP_LOADER_HPP
#define MAP_LOADER_HPP

#include "world/GameMap.hpp"
#include <optional>
#include <string>

namespace ArenaEngine {

class JsonValue;

/**
 * @brief Reads arena maps from JSON
 *
 * Format:
 * @code
 * {
 *   "name": "arena", "width": 10, "height": 10, "seed": 42,
 *   "round_cap": 500,                         // optional
 *   "terrain": ["..........", "...##....."],  // optional, '.' normal, '#' void
 *   "ore": [[0, 5, 5], [0, 0, 10]],           // optional, rows of numbers
 *   "hq": {"A": [1, 1], "B": [8, 8]},
 *   "towers": {"A": [[2, 3]], "B": [[7, 6]]}  // optional
 * }
 * @endcode
 *
 * Failures are logged and reported as an empty optional. A map that parses
 * but fails GameMap::validate() is still returned; Match::initialize rejects it.
 */
class MapLoader {
public:
    static std::optional<GameMap> loadFromFile(const std::string& path);
    static std::optional<GameMap> loadFromString(const std::string& json, const std::string& fallbackName = "map");
    static std::optional<GameMap> fromJson(const JsonValue& root, const std::string& fallbackName);

    /// "<mapPath>/<mapName>.json"
    static std::string resolvePath(const std::string& mapPath, const std::string& mapName);

private:
    static std::optional<MapLocation> parseLocation(const JsonValue& value);
};

} // namespace ArenaEngine

#endif // MAP_LOADER_HPP
