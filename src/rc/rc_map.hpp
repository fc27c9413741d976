// rc_map.hpp — Static map description consumed at match construction
//
// The engine only queries the map: bounds, terrain, encampment squares,
// pre-laid mines and the ordered list of robots placed before round 0.
// Loading maps from files is somebody else's job; parse() exists so tests
// and examples can draw a map inline:
//
//   '.' land       '#' void       'E' encampment square
//   'A' / 'B' HQ   'a' / 'b' soldier
//   'm' neutral mine
//
// Placements are registered in row-major order, so ids follow the drawing.

#pragma once
#include "rc_core.hpp"
#include "rc_constants.hpp"
#include <string>
#include <vector>

namespace rc
{

enum class TerrainTile : uint8_t
{
	Land,
	Void,
	OffMap
};

struct Placement
{
	RobotType type = RobotType::Soldier;
	Team team = Team::A;
	MapLocation loc;
};

struct MinePlacement
{
	MapLocation loc;
	Team team = Team::Neutral;
};

class GameMap
{
public:
	GameMap() = default;
	GameMap(int w, int h) : m_width(w), m_height(h), m_terrain(static_cast<size_t>(w * h), TerrainTile::Land) {}

	int width() const { return m_width; }
	int height() const { return m_height; }

	bool on_map(MapLocation loc) const
	{
		return loc.x >= 0 && loc.y >= 0 && loc.x < m_width && loc.y < m_height;
	}

	TerrainTile terrain(MapLocation loc) const
	{
		if (!on_map(loc)) return TerrainTile::OffMap;
		return m_terrain[static_cast<size_t>(loc.y * m_width + loc.x)];
	}

	bool passable(MapLocation loc) const { return terrain(loc) == TerrainTile::Land; }

	void set_terrain(MapLocation loc, TerrainTile t)
	{
		if (on_map(loc))
			m_terrain[static_cast<size_t>(loc.y * m_width + loc.x)] = t;
	}

	void add_encampment(MapLocation loc) { m_encampments.push_back(loc); }
	void add_mine(MapLocation loc, Team team = Team::Neutral) { m_mines.push_back({loc, team}); }
	void place(RobotType type, Team team, MapLocation loc) { m_placements.push_back({type, team, loc}); }

	bool is_encampment(MapLocation loc) const
	{
		for (auto &e : m_encampments)
			if (e == loc) return true;
		return false;
	}

	const std::vector<MapLocation> &encampments() const { return m_encampments; }
	const std::vector<MinePlacement> &mines() const { return m_mines; }
	const std::vector<Placement> &placements() const { return m_placements; }

	// Rows must all have the same width.
	static GameMap parse(const std::vector<std::string> &rows)
	{
		if (rows.empty())
			throw EngineFault("map has no rows");
		int w = static_cast<int>(rows[0].size());
		int h = static_cast<int>(rows.size());
		GameMap map(w, h);
		for (int y = 0; y < h; y++)
		{
			if (static_cast<int>(rows[y].size()) != w)
				throw EngineFault("map row " + std::to_string(y) + " has wrong width");
			for (int x = 0; x < w; x++)
			{
				MapLocation loc{x, y};
				switch (rows[y][x])
				{
				case '.': break;
				case '#': map.set_terrain(loc, TerrainTile::Void); break;
				case 'E': map.add_encampment(loc); break;
				case 'A': map.place(RobotType::HQ, Team::A, loc); break;
				case 'B': map.place(RobotType::HQ, Team::B, loc); break;
				case 'a': map.place(RobotType::Soldier, Team::A, loc); break;
				case 'b': map.place(RobotType::Soldier, Team::B, loc); break;
				case 'm': map.add_mine(loc); break;
				default:
					throw EngineFault(std::string("unknown map glyph '") + rows[y][x] + "'");
				}
			}
		}
		return map;
	}

private:
	int m_width = 0, m_height = 0;
	std::vector<TerrainTile> m_terrain;
	std::vector<MapLocation> m_encampments;
	std::vector<MinePlacement> m_mines;
	std::vector<Placement> m_placements;
};

} // namespace rc
