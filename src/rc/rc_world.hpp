// rc_world.hpp — World state store
//
// The single source of truth for a match: robot registry, component pool,
// round clock, RNG, team names, winner and running flags, message board,
// mines, research counters and team memory.
//
// OWNERSHIP:
// The World owns every Robot and Component. Everything else holds Ids and
// resolves them here, so a destroyed robot can never dangle.
//
// WRITERS:
// register_robot() and advance_round() are bookkeeping. All gameplay mutation
// goes through the ActionResolver, which works on a staged copy of the World
// and swaps it in only when the whole round committed. World is a value type
// for exactly that reason.

#pragma once
#include "rc_core.hpp"
#include "rc_constants.hpp"
#include "rc_component.hpp"
#include "rc_map.hpp"
#include "rc_memory.hpp"
#include "rc_util.hpp"
#include <array>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rc
{

// =============================================================================
// Robot — a world entity
// =============================================================================
struct Robot
{
	Id id = NULL_ID;
	Team team = Team::A;
	RobotType type = RobotType::Soldier;
	MapLocation loc;
	double energon = 0.0;
	double shields = 0.0;
	int active_at_round = 0; // action cooldown expires at this round
	Id parent = NULL_ID;
	int born_round = -1;
	std::vector<Id> components;
	std::array<std::string, GameConstants::NUMBER_OF_INDICATOR_STRINGS> indicators;
	uint64_t control_bits = 0;
	bool hat = false;

	const RobotTypeInfo &type_info() const { return info(type); }
	bool is_active(int round) const { return active_at_round <= round; }
	int rounds_until_active(int round) const { return active_at_round > round ? active_at_round - round : 0; }

	bool operator==(const Robot &o) const
	{
		return id == o.id && team == o.team && type == o.type && loc == o.loc && energon == o.energon &&
			   shields == o.shields && active_at_round == o.active_at_round && parent == o.parent &&
			   born_round == o.born_round && components == o.components && indicators == o.indicators &&
			   control_bits == o.control_bits && hat == o.hat;
	}
};

// =============================================================================
// TeamState — per-team auxiliary state
// =============================================================================
struct TeamState
{
	double power = GameConstants::INITIAL_TEAM_POWER;
	std::array<Counter, UPGRADE_COUNT> research{};
	bool resigned = false;
	int mines_laid = 0;

	TeamState()
	{
		for (int i = 0; i < UPGRADE_COUNT; i++)
			research[static_cast<size_t>(i)] = Counter(info(static_cast<Upgrade>(i)).rounds);
	}

	bool operator==(const TeamState &o) const
	{
		return power == o.power && research == o.research && resigned == o.resigned && mines_laid == o.mines_laid;
	}
};

// =============================================================================
// World
// =============================================================================
class World
{
public:
	World(uint32_t seed, std::string team_a, std::string team_b, std::shared_ptr<const GameMap> map,
		  TeamMemory memory)
		: m_seed(seed), m_rng(seed), m_team_a(std::move(team_a)), m_team_b(std::move(team_b)),
		  m_map(std::move(map)), m_memory(std::move(memory))
	{
		if (!m_map)
			throw EngineFault("world constructed without a map");
		m_occupancy.assign(static_cast<size_t>(m_map->width() * m_map->height()), NULL_ID);
		for (auto &m : m_map->mines())
			set_mine(m.loc, m.team);
	}

	// ====== CLOCK ======
	int current_round() const { return m_round; }
	bool is_running() const { return m_running; }
	void stop() { m_running = false; }

	void advance_round()
	{
		if (!m_running)
			throw EngineFault("advance_round after the match terminated at round " + std::to_string(m_round));
		m_round++;
	}

	std::optional<Team> winner() const { return m_winner; }

	// Write-once. Repeating the same team is harmless; a different team means
	// two parts of the engine disagree about the outcome.
	void set_winner(Team t)
	{
		if (t == Team::Neutral)
			throw EngineFault("neutral team cannot win");
		if (m_winner)
		{
			if (*m_winner != t)
				throw EngineFault(std::string("winner already ") + team_str(*m_winner) + ", refusing " + team_str(t));
			return;
		}
		m_winner = t;
		m_running = false;
	}

	const std::string &team_name(Team t) const
	{
		static const std::string NEUTRAL = "neutralplayer";
		switch (t)
		{
		case Team::A: return m_team_a;
		case Team::B: return m_team_b;
		default: return NEUTRAL;
		}
	}

	uint32_t seed() const { return m_seed; }
	Rng &rng() { return m_rng; }
	const GameMap &map() const { return *m_map; }

	// ====== REGISTRY ======
	Id register_robot(Team team, RobotType type, MapLocation loc, Id parent = NULL_ID)
	{
		if (!m_map->passable(loc))
			throw EngineFault("register_robot on impassable square " + loc_str(loc));
		if (robot_at(loc) != NULL_ID)
			throw EngineFault("register_robot on occupied square " + loc_str(loc));

		Id id = m_next_id++;
		const auto &ti = info(type);
		Robot r;
		r.id = id;
		r.team = team;
		r.type = type;
		r.loc = loc;
		r.energon = ti.max_energon;
		r.parent = parent;
		r.born_round = m_round;
		r.active_at_round = m_round + 1;
		for (int i = 0; i < ti.loadout_count; i++)
		{
			Component c;
			c.id = m_next_component_id++;
			c.type = ti.loadout[i];
			c.owner = id;
			if (c.component_class() == ComponentClass::Armor)
				r.shields += GameConstants::PLATING_SHIELDS;
			r.components.push_back(c.id);
			m_components.add(c.id, c);
		}
		m_robots.add(id, std::move(r));
		occupancy(loc) = id;
		return id;
	}

	Robot *lookup(Id id) { return m_robots.get(id); }
	const Robot *lookup(Id id) const { return m_robots.get(id); }
	const Pool<Robot> &robots() const { return m_robots; }
	Id next_id() const { return m_next_id; }

	// Removes the robot and destroys the components it still carries.
	void remove_robot(Id id)
	{
		Robot *r = m_robots.get(id);
		if (!r)
			return;
		for (Id cid : r->components)
			m_components.remove(cid);
		if (occupancy(r->loc) == id)
			occupancy(r->loc) = NULL_ID;
		m_robots.remove(id);
	}

	Id robot_at(MapLocation loc) const
	{
		if (!m_map->on_map(loc))
			return NULL_ID;
		return m_occupancy[index(loc)];
	}

	void move_robot(Id id, MapLocation to)
	{
		Robot *r = m_robots.get(id);
		if (!r)
			throw EngineFault("move_robot on unknown id " + std::to_string(id));
		if (robot_at(to) != NULL_ID || !m_map->passable(to))
			throw EngineFault("move_robot into blocked square " + loc_str(to));
		occupancy(r->loc) = NULL_ID;
		r->loc = to;
		occupancy(to) = id;
	}

	std::optional<Id> hq(Team t) const
	{
		for (size_t i = 0; i < m_robots.size(); i++)
		{
			const Robot &r = m_robots.items[i];
			if (r.team == t && r.type_info().command)
				return r.id;
		}
		return std::nullopt;
	}

	int count_robots(Team t, bool (*pred)(const RobotTypeInfo &)) const
	{
		int n = 0;
		m_robots.each([&](const Robot &r) {
			if (r.team == t && pred(r.type_info())) n++;
		});
		return n;
	}

	int count_encampments(Team t) const
	{
		return count_robots(t, [](const RobotTypeInfo &ti) { return ti.encampment; });
	}

	int count_type(Team t, RobotType type) const
	{
		int n = 0;
		m_robots.each([&](const Robot &r) {
			if (r.team == t && r.type == type) n++;
		});
		return n;
	}

	// ====== COMPONENTS ======
	Component *component(Id id) { return m_components.get(id); }
	const Component *component(Id id) const { return m_components.get(id); }
	const Pool<Component> &components() const { return m_components; }

	// First attached component of the class, optionally skipping active ones.
	const Component *find_component(Id robot, ComponentClass cls, bool idle_only) const
	{
		const Robot *r = lookup(robot);
		if (!r)
			return nullptr;
		for (Id cid : r->components)
		{
			const Component *c = component(cid);
			if (c && c->component_class() == cls && (!idle_only || !c->is_active()))
				return c;
		}
		return nullptr;
	}

	const Component *find_component(Id robot, ComponentType type, bool idle_only) const
	{
		const Robot *r = lookup(robot);
		if (!r)
			return nullptr;
		for (Id cid : r->components)
		{
			const Component *c = component(cid);
			if (c && c->type == type && (!idle_only || !c->is_active()))
				return c;
		}
		return nullptr;
	}

	void activate_component(Id id)
	{
		Component *c = component(id);
		if (!c)
			throw EngineFault("activate unknown component " + std::to_string(id));
		c->activate();
	}

	// An in-use component cannot be removed.
	void unequip(Id component_id)
	{
		Component *c = component(component_id);
		if (!c || !c->attached())
			throw GameActionException(GameActionExceptionType::CantDoThat,
									  "component " + std::to_string(component_id) + " is not equipped");
		if (c->is_active())
			throw GameActionException(GameActionExceptionType::AlreadyActive,
									  "component " + std::to_string(component_id) + " is in use");
		Robot *r = lookup(c->owner);
		if (r)
		{
			auto &v = r->components;
			v.erase(std::remove(v.begin(), v.end(), component_id), v.end());
		}
		c->owner = NULL_ID;
	}

	// Once per round, every component, owned or not.
	void tick_components()
	{
		m_components.each_mut([](Component &c) { c.tick(); });
	}

	int range_bonus(Team t) const
	{
		return has_upgrade(t, Upgrade::Vision) ? GameConstants::VISION_RANGE_BONUS : 0;
	}

	// ====== MESSAGE BOARD ======
	static bool valid_channel(int channel) { return channel >= 0 && channel < GameConstants::BROADCAST_MAX_CHANNELS; }

	int32_t read_broadcast(int channel) const
	{
		auto it = m_board.find(channel);
		return it != m_board.end() ? it->second : 0;
	}

	void write_broadcast(int channel, int32_t data)
	{
		if (!valid_channel(channel))
			throw EngineFault("broadcast channel " + std::to_string(channel) + " out of range");
		m_board[channel] = data;
	}

	// ====== MINES ======
	std::optional<Team> mine_at(MapLocation loc) const
	{
		auto it = m_mines.find(loc);
		if (it == m_mines.end())
			return std::nullopt;
		return it->second;
	}

	void set_mine(MapLocation loc, Team t) { m_mines[loc] = t; }
	void clear_mine(MapLocation loc) { m_mines.erase(loc); }
	const std::map<MapLocation, Team> &mines() const { return m_mines; }

	// ====== TEAMS ======
	TeamState &team(Team t) { return m_teams[team_slot(t)]; }
	const TeamState &team(Team t) const { return m_teams[team_slot(t)]; }

	bool has_upgrade(Team t, Upgrade u) const
	{
		if (t == Team::Neutral)
			return false;
		return team(t).research[static_cast<size_t>(u)].done;
	}

	double capture_cost(Team t) const
	{
		return GameConstants::CAPTURE_POWER_COST * (1 + count_encampments(t));
	}

	// ====== TEAM MEMORY ======
	TeamMemory &memory() { return m_memory; }
	const TeamMemory &memory() const { return m_memory; }
	const std::vector<int64_t> &team_memory(Team t) const { return m_memory.current(t); }
	const std::vector<int64_t> &old_team_memory(Team t) const { return m_memory.read(t); }

	static std::string loc_str(MapLocation loc)
	{
		return "(" + std::to_string(loc.x) + "," + std::to_string(loc.y) + ")";
	}

private:
	int m_round = -1;
	bool m_running = true;
	std::optional<Team> m_winner;
	uint32_t m_seed;
	Rng m_rng;
	std::string m_team_a, m_team_b;
	std::shared_ptr<const GameMap> m_map;
	TeamMemory m_memory;

	Id m_next_id = 1;
	Id m_next_component_id = 1;
	Pool<Robot> m_robots;
	Pool<Component> m_components;
	std::vector<Id> m_occupancy;

	std::unordered_map<int, int32_t> m_board;
	std::map<MapLocation, Team> m_mines;
	TeamState m_teams[2];

	size_t index(MapLocation loc) const { return static_cast<size_t>(loc.y * m_map->width() + loc.x); }
	Id &occupancy(MapLocation loc) { return m_occupancy[index(loc)]; }

	static size_t team_slot(Team t)
	{
		if (t == Team::Neutral)
			throw EngineFault("neutral team has no team state");
		return static_cast<size_t>(team_index(t));
	}
};

} // namespace rc
