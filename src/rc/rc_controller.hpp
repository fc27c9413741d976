// rc_controller.hpp — The surface player logic sees
//
// A RobotController is built for one robot for one round. It reads the
// committed start-of-round World, never another robot's in-flight buffer,
// and writes only into that robot's TurnBuffer.
//
// METERING:
// Every call is a checkpoint that charges the BytecodeMeter. Player logic
// reports its own work through charge(n). Once the quantum is spent the
// meter throws TurnEnd and keeps throwing it at every later checkpoint, so
// swallowing the first one buys nothing. The scheduler discards the buffer
// of an exhausted turn.
//
// ERRORS:
// Precondition failures throw GameActionException at issue time. The same
// preconditions are checked again at commit by the ActionResolver.

#pragma once
#include "rc_core.hpp"
#include "rc_action.hpp"
#include "rc_constants.hpp"
#include "rc_world.hpp"
#include <optional>
#include <string>
#include <vector>

namespace rc
{

// =============================================================================
// BytecodeMeter — per-robot, per-round computation quantum
// =============================================================================
class BytecodeMeter
{
public:
	explicit BytecodeMeter(int limit) : m_limit(limit) {}

	void charge(int n)
	{
		checkpoint();
		if (n <= 0)
			return;
		// m_used never exceeds m_limit, so the subtraction cannot overflow.
		if (n > m_limit - m_used)
		{
			m_used = m_limit;
			m_exhausted = true;
			m_ended = true;
			throw TurnEnd{};
		}
		m_used += n;
	}

	void checkpoint() const
	{
		if (m_ended)
			throw TurnEnd{};
	}

	void end_turn()
	{
		m_ended = true;
		throw TurnEnd{};
	}

	int used() const { return m_used; }
	int limit() const { return m_limit; }
	int left() const { return m_used >= m_limit ? 0 : m_limit - m_used; }
	bool exhausted() const { return m_exhausted; }
	bool ended() const { return m_ended; }

private:
	int m_limit;
	int m_used = 0;
	bool m_exhausted = false;
	bool m_ended = false;
};

struct RobotInfo
{
	Id id = NULL_ID;
	Team team = Team::A;
	RobotType type = RobotType::Soldier;
	MapLocation loc;
	double energon = 0.0;
	double shields = 0.0;
};

class RobotController;

// =============================================================================
// ComponentController — one attached component, seen from its owner
// =============================================================================
class ComponentController
{
public:
	ComponentController(RobotController &owner, Id component) : m_owner(&owner), m_id(component) {}

	Id id() const { return m_id; }
	bool is_active() const;
	int rounds_until_idle() const;
	ComponentType type() const;
	ComponentClass component_class() const;
	bool within_range(MapLocation loc) const;
	void unequip();

private:
	RobotController *m_owner;
	Id m_id;

	const Component &get() const;
};

// =============================================================================
// RobotController
// =============================================================================
class RobotController
{
public:
	RobotController(const World &world, Id robot, TurnBuffer &buffer, BytecodeMeter &meter)
		: m_world(&world), m_id(robot), m_buffer(&buffer), m_meter(&meter),
		  m_rng(mix_seed(world.seed(), robot, world.current_round()))
	{
		if (!world.lookup(robot))
			throw EngineFault("controller for unknown robot " + std::to_string(robot));
	}

	RobotController(const RobotController &) = delete;
	RobotController &operator=(const RobotController &) = delete;

	// ====== SELF ======
	Id id() const { return m_id; }
	Team team() const { return me().team; }
	RobotType type() const { return me().type; }

	double energon() { charge(GameConstants::QUERY_COST); return me().energon; }
	double shields() { charge(GameConstants::QUERY_COST); return me().shields; }
	double team_power() { charge(GameConstants::QUERY_COST); return m_world->team(me().team).power; }
	MapLocation location() { charge(GameConstants::QUERY_COST); return me().loc; }
	int map_width() { charge(GameConstants::QUERY_COST); return m_world->map().width(); }
	int map_height() { charge(GameConstants::QUERY_COST); return m_world->map().height(); }
	int round() { charge(GameConstants::QUERY_COST); return m_world->current_round(); }
	uint64_t control_bits() { charge(GameConstants::QUERY_COST); return me().control_bits; }

	int rounds_until_active()
	{
		charge(GameConstants::QUERY_COST);
		return me().rounds_until_active(m_world->current_round());
	}

	bool is_active()
	{
		charge(GameConstants::QUERY_COST);
		return me().is_active(m_world->current_round());
	}

	// Deterministic per robot and round; never touches world state.
	uint32_t rand()
	{
		charge(GameConstants::QUERY_COST);
		return m_rng.next();
	}

	// ====== METERING ======
	void charge(int bytecodes) { m_meter->charge(bytecodes); }
	int bytecodes_left() const { return m_meter->left(); }
	int bytecode_num() const { return m_meter->used(); }

	// ====== SENSING ======
	bool can_sense_square(MapLocation loc)
	{
		charge(GameConstants::QUERY_COST);
		return sees(loc);
	}

	bool can_sense_object(Id robot)
	{
		charge(GameConstants::QUERY_COST);
		const Robot *r = m_world->lookup(robot);
		return r && sees(r->loc);
	}

	std::optional<RobotInfo> sense_object_at(MapLocation loc)
	{
		charge(GameConstants::SENSE_COST);
		require_sees(loc);
		Id id = m_world->robot_at(loc);
		if (id == NULL_ID)
			return std::nullopt;
		return info_of(*m_world->lookup(id));
	}

	RobotInfo sense_robot_info(Id robot)
	{
		charge(GameConstants::SENSE_COST);
		const Robot *r = m_world->lookup(robot);
		if (!r || !sees(r->loc))
			throw GameActionException(GameActionExceptionType::CantSenseThat,
									  "robot " + std::to_string(robot) + " is not in sensor range");
		return info_of(*r);
	}

	MapLocation sense_location_of(Id robot) { return sense_robot_info(robot).loc; }

	// radius_sq < 0 means the full sensor range.
	std::vector<RobotInfo> sense_nearby_robots(int radius_sq = -1, std::optional<Team> team = std::nullopt)
	{
		charge(GameConstants::SENSE_NEARBY_COST);
		std::vector<RobotInfo> out;
		MapLocation here = me().loc;
		m_world->robots().each([&](Id id, const Robot &r) {
			if (id == m_id) return;
			if (team && r.team != *team) return;
			if (radius_sq >= 0 && here.distance_sq_to(r.loc) > radius_sq) return;
			if (!sees(r.loc)) return;
			out.push_back(info_of(r));
		});
		return out;
	}

	// Own mines are always known; others only inside sensor range.
	std::optional<Team> sense_mine(MapLocation loc)
	{
		charge(GameConstants::SENSE_COST);
		auto mine = m_world->mine_at(loc);
		if (!mine)
			return std::nullopt;
		if (*mine == me().team || sees(loc))
			return mine;
		return std::nullopt;
	}

	// Opponent mines inside sensor range, in map order.
	std::vector<MapLocation> sense_all_enemy_mine_locations()
	{
		charge(GameConstants::SENSE_NEARBY_COST);
		std::vector<MapLocation> out;
		Team enemy = opponent(me().team);
		for (auto &m : m_world->mines())
			if (m.second == enemy && sees(m.first))
				out.push_back(m.first);
		return out;
	}

	std::vector<MapLocation> sense_all_encampments()
	{
		charge(GameConstants::SENSE_NEARBY_COST);
		return m_world->map().encampments();
	}

	std::vector<MapLocation> sense_allied_encampments()
	{
		charge(GameConstants::SENSE_NEARBY_COST);
		std::vector<MapLocation> out;
		Team mine = me().team;
		m_world->robots().each([&](const Robot &r) {
			if (r.team == mine && r.type_info().encampment)
				out.push_back(r.loc);
		});
		return out;
	}

	bool sense_encampment_square(MapLocation loc)
	{
		charge(GameConstants::QUERY_COST);
		return m_world->map().is_encampment(loc);
	}

	MapLocation sense_hq_location()
	{
		charge(GameConstants::QUERY_COST);
		return hq_location(me().team);
	}

	MapLocation sense_enemy_hq_location()
	{
		charge(GameConstants::QUERY_COST);
		return hq_location(opponent(me().team));
	}

	int sense_enemy_nuke_progress()
	{
		charge(GameConstants::SENSE_COST);
		require_hq("sense enemy nuke progress");
		return m_world->team(opponent(me().team)).research[static_cast<size_t>(Upgrade::Nuke)].count;
	}

	TerrainTile sense_terrain(MapLocation loc)
	{
		charge(GameConstants::QUERY_COST);
		return m_world->map().terrain(loc);
	}

	double sense_capture_cost()
	{
		charge(GameConstants::QUERY_COST);
		return m_world->capture_cost(me().team);
	}

	// ====== CAPABILITY QUERIES ======

	// Terrain and other robots only; ignores this robot's own cooldown.
	bool can_move(Direction dir)
	{
		charge(GameConstants::QUERY_COST);
		return open_square(me().loc.add(dir)) && is_compass(dir);
	}

	bool can_attack_square(MapLocation loc)
	{
		charge(GameConstants::QUERY_COST);
		return weapon_for(loc, false) != nullptr;
	}

	bool has_upgrade(Upgrade u)
	{
		charge(GameConstants::QUERY_COST);
		return m_world->has_upgrade(me().team, u);
	}

	int check_research_progress(Upgrade u)
	{
		charge(GameConstants::QUERY_COST);
		require_hq("check research progress");
		return m_world->team(me().team).research[static_cast<size_t>(u)].count;
	}

	std::vector<ComponentController> components()
	{
		charge(GameConstants::QUERY_COST);
		std::vector<ComponentController> out;
		for (Id cid : me().components)
			out.emplace_back(*this, cid);
		return out;
	}

	// ====== MESSAGE BOARD ======

	// Returns what was committed by the end of last round.
	int32_t read_broadcast(int channel)
	{
		charge(GameConstants::READ_BROADCAST_COST);
		require_channel(channel);
		return m_world->read_broadcast(channel);
	}

	// Queued; readers see it from next round on.
	void broadcast(int channel, int32_t data)
	{
		charge(GameConstants::BROADCAST_COST);
		require_channel(channel);
		m_buffer->side.push_back(BroadcastWrite{channel, data});
	}

	// ====== TEAM MEMORY ======

	// What the previous match left for this team.
	const std::vector<int64_t> &team_memory()
	{
		charge(GameConstants::QUERY_COST);
		return m_world->old_team_memory(me().team);
	}

	void set_team_memory(int index, int64_t value) { set_team_memory(index, value, -1); }

	void set_team_memory(int index, int64_t value, int64_t mask)
	{
		charge(GameConstants::QUERY_COST);
		if (!m_world->memory().valid_index(index))
			throw GameActionException(GameActionExceptionType::OutOfRange,
									  "team memory index " + std::to_string(index));
		m_buffer->side.push_back(MemoryWrite{index, value, mask});
	}

	// ====== DEBUG / MISC ======
	void set_indicator_string(int index, std::string text)
	{
		charge(GameConstants::QUERY_COST);
		if (index < 0 || index >= GameConstants::NUMBER_OF_INDICATOR_STRINGS)
			throw GameActionException(GameActionExceptionType::OutOfRange,
									  "indicator string " + std::to_string(index));
		m_buffer->side.push_back(IndicatorWrite{index, std::move(text)});
	}

	void add_match_observation(std::string text)
	{
		charge(GameConstants::QUERY_COST);
		m_buffer->side.push_back(ObservationWrite{std::move(text)});
	}

	void wear_hat()
	{
		charge(GameConstants::QUERY_COST);
		m_buffer->side.push_back(HatRequest{});
	}

	// Pauses the host after this round, if breakpoints are enabled.
	void breakpoint()
	{
		charge(GameConstants::QUERY_COST);
		m_breakpoint = true;
	}

	bool breakpoint_requested() const { return m_breakpoint; }

	// ====== ACTIONS ======
	void move(Direction dir)
	{
		begin_action();
		if (!is_compass(dir))
			throw GameActionException(GameActionExceptionType::CantMoveThere, "not a compass direction");
		require_component(ComponentClass::Motor, "move");
		if (!open_square(me().loc.add(dir)))
			throw GameActionException(GameActionExceptionType::CantMoveThere,
									  "square " + World::loc_str(me().loc.add(dir)) + " is blocked");
		m_buffer->action = MoveAction{dir};
	}

	void attack_square(MapLocation loc)
	{
		begin_action();
		if (loc == me().loc)
			throw GameActionException(GameActionExceptionType::CantDoThat, "cannot attack own square");
		require_component(ComponentClass::Weapon, "attack");
		const Component *w = weapon_for(loc, true);
		if (!w)
			throw GameActionException(GameActionExceptionType::OutOfRange,
									  "no idle weapon reaches " + World::loc_str(loc));
		m_buffer->action = AttackAction{loc, w->id};
	}

	void spawn(Direction dir, RobotType type = RobotType::Soldier)
	{
		begin_action();
		if (!me().type_info().producer)
			throw GameActionException(GameActionExceptionType::CantDoThat,
									  std::string(me().type_info().name) + " cannot spawn");
		if (type != RobotType::Soldier)
			throw GameActionException(GameActionExceptionType::CantDoThat,
									  std::string("cannot spawn ") + info(type).name);
		require_component(ComponentClass::Builder, "spawn");
		if (m_world->team(me().team).power < GameConstants::SOLDIER_SPAWN_COST)
			throw GameActionException(GameActionExceptionType::NotEnoughResource, "not enough power to spawn");
		MapLocation target = me().loc.add(dir);
		if (!is_compass(dir) || !open_square(target))
			throw GameActionException(GameActionExceptionType::CantMoveThere,
									  "spawn square " + World::loc_str(target) + " is blocked");
		m_buffer->action = SpawnAction{dir, type};
	}

	void lay_mine()
	{
		begin_action();
		require_miner("lay a mine");
		if (m_world->mine_at(me().loc))
			throw GameActionException(GameActionExceptionType::CantDoThat, "square already mined");
		m_buffer->action = LayMineAction{};
	}

	void defuse_mine(MapLocation loc)
	{
		begin_action();
		require_miner("defuse a mine");
		int range = m_world->has_upgrade(me().team, Upgrade::Defusion) ? GameConstants::DEFUSION_DEFUSE_RANGE_SQ
																	   : GameConstants::DEFUSE_RANGE_SQ;
		if (me().loc.distance_sq_to(loc) > range)
			throw GameActionException(GameActionExceptionType::OutOfRange,
									  "mine at " + World::loc_str(loc) + " is too far");
		auto mine = m_world->mine_at(loc);
		if (!mine || (*mine != me().team && !sees(loc)))
			throw GameActionException(GameActionExceptionType::CantDoThat, "no known mine at " + World::loc_str(loc));
		m_buffer->action = DefuseMineAction{loc};
	}

	void capture_encampment(RobotType type)
	{
		begin_action();
		if (me().type != RobotType::Soldier)
			throw GameActionException(GameActionExceptionType::CantDoThat, "only soldiers capture");
		if (!info(type).encampment)
			throw GameActionException(GameActionExceptionType::CantDoThat,
									  std::string(info(type).name) + " is not an encampment type");
		if (!m_world->map().is_encampment(me().loc))
			throw GameActionException(GameActionExceptionType::CantDoThat, "not standing on an encampment square");
		if (m_world->team(me().team).power < m_world->capture_cost(me().team))
			throw GameActionException(GameActionExceptionType::NotEnoughResource, "not enough power to capture");
		m_buffer->action = CaptureAction{type};
	}

	void research_upgrade(Upgrade u)
	{
		begin_action();
		require_hq("research");
		if (m_world->has_upgrade(me().team, u))
			throw GameActionException(GameActionExceptionType::CantDoThat,
									  std::string(info(u).name) + " already researched");
		m_buffer->action = ResearchAction{u};
	}

	// Ends the turn. Never fails.
	void yield() { m_meter->end_turn(); }

	// Replaces any queued action and ends the turn. Never fails.
	void suicide()
	{
		m_meter->checkpoint();
		m_buffer->action = SuicideAction{};
		m_meter->end_turn();
	}

	void resign()
	{
		m_meter->checkpoint();
		m_buffer->action = ResignAction{};
		m_meter->end_turn();
	}

private:
	friend class ComponentController;

	const World *m_world;
	Id m_id;
	TurnBuffer *m_buffer;
	BytecodeMeter *m_meter;
	Rng m_rng;
	bool m_breakpoint = false;

	const Robot &me() const { return *m_world->lookup(m_id); }

	static RobotInfo info_of(const Robot &r) { return {r.id, r.team, r.type, r.loc, r.energon, r.shields}; }

	bool sees(MapLocation loc) const
	{
		const Robot &r = me();
		if (loc == r.loc)
			return true;
		int bonus = m_world->range_bonus(r.team);
		for (Id cid : r.components)
		{
			const Component *c = m_world->component(cid);
			if (c && c->component_class() == ComponentClass::Sensor && !c->is_active() &&
				c->within_range(r.loc, loc, bonus))
				return true;
		}
		return false;
	}

	void require_sees(MapLocation loc) const
	{
		if (!sees(loc))
			throw GameActionException(GameActionExceptionType::CantSenseThat,
									  "square " + World::loc_str(loc) + " is not in sensor range");
	}

	bool open_square(MapLocation loc) const
	{
		return m_world->map().passable(loc) && m_world->robot_at(loc) == NULL_ID;
	}

	const Component *weapon_for(MapLocation loc, bool idle_only) const
	{
		const Robot &r = me();
		for (Id cid : r.components)
		{
			const Component *c = m_world->component(cid);
			if (c && c->component_class() == ComponentClass::Weapon && (!idle_only || !c->is_active()) &&
				c->within_range(r.loc, loc))
				return c;
		}
		return nullptr;
	}

	MapLocation hq_location(Team t) const
	{
		auto hq = m_world->hq(t);
		if (!hq)
			throw GameActionException(GameActionExceptionType::NoRobotThere,
									  std::string("team ") + team_str(t) + " has no HQ");
		return m_world->lookup(*hq)->loc;
	}

	void require_channel(int channel) const
	{
		if (!World::valid_channel(channel))
			throw GameActionException(GameActionExceptionType::OutOfRange,
									  "channel " + std::to_string(channel));
	}

	void require_hq(const char *what) const
	{
		if (!me().type_info().command)
			throw GameActionException(GameActionExceptionType::CantDoThat, std::string("only an HQ can ") + what);
	}

	// Charges the action price, then the two rules every terminal action
	// shares: one per round, and not while cooling down.
	void begin_action()
	{
		charge(GameConstants::ACTION_COST);
		if (m_buffer->action)
			throw GameActionException(GameActionExceptionType::CantDoThat,
									  std::string("already queued ") + action_name(*m_buffer->action));
		if (!me().is_active(m_world->current_round()))
			throw GameActionException(GameActionExceptionType::AlreadyActive,
									  "cooling down for " +
										  std::to_string(me().rounds_until_active(m_world->current_round())) +
										  " more rounds");
	}

	void require_component(ComponentClass cls, const char *what) const
	{
		if (!m_world->find_component(m_id, cls, false))
			throw GameActionException(GameActionExceptionType::CantDoThat, std::string("nothing equipped to ") + what);
		if (!m_world->find_component(m_id, cls, true))
			throw GameActionException(GameActionExceptionType::AlreadyActive, std::string("equipment busy, cannot ") + what);
	}

	void require_miner(const char *what) const
	{
		if (!m_world->find_component(m_id, ComponentType::Miner, false))
			throw GameActionException(GameActionExceptionType::CantDoThat, std::string("no miner equipped to ") + what);
		if (!m_world->find_component(m_id, ComponentType::Miner, true))
			throw GameActionException(GameActionExceptionType::AlreadyActive, std::string("miner busy, cannot ") + what);
	}

	void queue_unequip(Id component)
	{
		charge(GameConstants::QUERY_COST);
		const Component *c = m_world->component(component);
		if (!c || c->owner != m_id)
			throw GameActionException(GameActionExceptionType::CantDoThat,
									  "component " + std::to_string(component) + " is not equipped here");
		if (c->is_active())
			throw GameActionException(GameActionExceptionType::AlreadyActive,
									  "component " + std::to_string(component) + " is in use");
		m_buffer->side.push_back(UnequipRequest{component});
	}
};

// =============================================================================
// ComponentController inline implementations
// =============================================================================
inline const Component &ComponentController::get() const
{
	const Component *c = m_owner->m_world->component(m_id);
	if (!c)
		throw GameActionException(GameActionExceptionType::CantDoThat, "component " + std::to_string(m_id) + " is gone");
	return *c;
}

inline bool ComponentController::is_active() const
{
	m_owner->charge(GameConstants::QUERY_COST);
	return get().is_active();
}

inline int ComponentController::rounds_until_idle() const
{
	m_owner->charge(GameConstants::QUERY_COST);
	return get().rounds_until_idle();
}

inline ComponentType ComponentController::type() const { return get().type; }
inline ComponentClass ComponentController::component_class() const { return get().component_class(); }

inline bool ComponentController::within_range(MapLocation loc) const
{
	m_owner->charge(GameConstants::QUERY_COST);
	const Robot &r = m_owner->me();
	return get().within_range(r.loc, loc, m_owner->m_world->range_bonus(r.team));
}

inline void ComponentController::unequip() { m_owner->queue_unequip(m_id); }

} // namespace rc
