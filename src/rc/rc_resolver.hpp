// rc_resolver.hpp — Action resolver
//
// Turns a round of TurnBuffers into one world transition.
//
// ORDER:
//   1. apply() per Turn, in robot-visit order: side channels first, then the
//      terminal action. Every precondition is checked again against the
//      world as committed so far; a failed check is a silent no-op.
//   2. end_of_round(): encampment effects, mine damage, power income.
//   3. check_winner(): HQ loss, resignation, Nuke, round limit.
//
// The resolver is the only gameplay writer of the World. The engine hands it
// a staged copy and keeps the copy only if nothing here threw EngineFault.

#pragma once
#include "rc_core.hpp"
#include "rc_action.hpp"
#include "rc_constants.hpp"
#include "rc_signal.hpp"
#include "rc_world.hpp"
#include <algorithm>
#include <variant>
#include <vector>

namespace rc
{

class ActionResolver
{
public:
	ActionResolver(World &world, std::vector<Signal> &out, int max_rounds = GameConstants::ROUND_MAX_LIMIT)
		: m_world(world), m_out(out), m_max_rounds(max_rounds)
	{
	}

	// Robots created this round (spawns and captures), in creation order.
	const std::vector<Id> &born() const { return m_born; }

	void apply(const Turn &turn)
	{
		if (!m_world.lookup(turn.robot))
			return; // destroyed earlier this round
		for (auto &side : turn.buffer.side)
			std::visit([&](const auto &s) { apply_side(turn.robot, s); }, side);
		if (turn.buffer.action)
			std::visit([&](const auto &a) { apply_action(turn.robot, a); }, *turn.buffer.action);
	}

	void end_of_round()
	{
		encampment_effects();
		mine_damage();
		power_income();
		check_winner();
	}

	// ====== DAMAGE ======

	// Shields absorb first. Returns true if the robot was destroyed.
	bool damage(Id victim, double amount)
	{
		Robot *r = m_world.lookup(victim);
		if (!r || amount <= 0.0)
			return false;
		double absorbed = std::min(r->shields, amount);
		r->shields -= absorbed;
		r->energon -= amount - absorbed;
		if (r->energon > 0.0)
			return false;
		kill(victim);
		return true;
	}

	void kill(Id id)
	{
		const Robot *r = m_world.lookup(id);
		if (!r)
			return;
		m_out.push_back(DeathSignal{id, r->loc});
		m_world.remove_robot(id);
	}

	// ====== WIN CHECK ======
	void check_winner()
	{
		if (m_world.winner())
			return;
		bool claim[2] = {false, false};
		for (Team t : {Team::A, Team::B})
		{
			bool lost = !m_world.hq(t) || m_world.team(t).resigned;
			bool nuked = m_world.has_upgrade(t, Upgrade::Nuke);
			if (lost)
				claim[team_index(opponent(t))] = true;
			if (nuked)
				claim[team_index(t)] = true;
		}

		if (claim[0] != claim[1])
			declare(claim[0] ? Team::A : Team::B);
		else if (claim[0] || m_world.current_round() >= m_max_rounds - 1)
			declare(tiebreak());
	}

	// HQ energon, then encampments, then mines laid, then a seeded coin flip.
	Team tiebreak()
	{
		auto hq_energon = [&](Team t) {
			auto id = m_world.hq(t);
			return id ? m_world.lookup(*id)->energon : 0.0;
		};
		double ea = hq_energon(Team::A), eb = hq_energon(Team::B);
		if (ea != eb)
			return ea > eb ? Team::A : Team::B;
		int ca = m_world.count_encampments(Team::A), cb = m_world.count_encampments(Team::B);
		if (ca != cb)
			return ca > cb ? Team::A : Team::B;
		int ma = m_world.team(Team::A).mines_laid, mb = m_world.team(Team::B).mines_laid;
		if (ma != mb)
			return ma > mb ? Team::A : Team::B;
		return (m_world.rng().next() & 1u) ? Team::B : Team::A;
	}

private:
	World &m_world;
	std::vector<Signal> &m_out;
	int m_max_rounds;
	std::vector<Id> m_born;

	int round() const { return m_world.current_round(); }

	void declare(Team t)
	{
		m_world.set_winner(t);
		m_out.push_back(WinSignal{t});
	}

	// Returns the robot if it may take a terminal action this round.
	Robot *actor(Id id)
	{
		Robot *r = m_world.lookup(id);
		if (!r || !r->is_active(round()))
			return nullptr;
		return r;
	}

	Component *idle_owned(Id robot, Id component)
	{
		Component *c = m_world.component(component);
		if (!c || c->owner != robot || c->is_active())
			return nullptr;
		return c;
	}

	Component *idle_of(Id robot, ComponentClass cls)
	{
		const Component *c = m_world.find_component(robot, cls, true);
		return c ? m_world.component(c->id) : nullptr;
	}

	Component *idle_of(Id robot, ComponentType type)
	{
		const Component *c = m_world.find_component(robot, type, true);
		return c ? m_world.component(c->id) : nullptr;
	}

	bool open_square(MapLocation loc) const
	{
		return m_world.map().passable(loc) && m_world.robot_at(loc) == NULL_ID;
	}

	// ====== SIDE CHANNELS ======
	void apply_side(Id robot, const BroadcastWrite &w)
	{
		m_world.write_broadcast(w.channel, w.data);
		m_out.push_back(BroadcastSignal{robot, w.channel, w.data});
	}

	void apply_side(Id robot, const IndicatorWrite &w)
	{
		if (w.index < 0 || w.index >= GameConstants::NUMBER_OF_INDICATOR_STRINGS)
			throw EngineFault("indicator index " + std::to_string(w.index) + " reached commit");
		m_world.lookup(robot)->indicators[static_cast<size_t>(w.index)] = w.text;
		m_out.push_back(IndicatorStringSignal{robot, w.index, w.text});
	}

	void apply_side(Id robot, const MemoryWrite &w)
	{
		Team t = m_world.lookup(robot)->team;
		if (w.mask == -1)
			m_world.memory().write(t, w.index, w.value);
		else
			m_world.memory().write_masked(t, w.index, w.value, w.mask);
		m_out.push_back(TeamMemorySignal{t, w.index, m_world.team_memory(t)[static_cast<size_t>(w.index)]});
	}

	void apply_side(Id robot, const UnequipRequest &w)
	{
		Component *c = idle_owned(robot, w.component);
		if (!c)
			return;
		ComponentType type = c->type;
		m_world.unequip(w.component);
		m_out.push_back(UnequipSignal{robot, w.component, type});
	}

	void apply_side(Id robot, const ObservationWrite &w)
	{
		m_out.push_back(ObservationSignal{robot, w.text});
	}

	void apply_side(Id robot, const HatRequest &)
	{
		m_world.lookup(robot)->hat = true;
		m_out.push_back(HatSignal{robot});
	}

	// ====== TERMINAL ACTIONS ======

	// Occupancy is checked against the world committed so far, so the first
	// robot to claim a square keeps it.
	void apply_action(Id id, const MoveAction &a)
	{
		Robot *r = actor(id);
		if (!r || !is_compass(a.dir))
			return;
		Component *motor = idle_of(id, ComponentClass::Motor);
		MapLocation from = r->loc, to = r->loc.add(a.dir);
		if (!motor || !open_square(to))
			return;
		m_world.move_robot(id, to);
		motor->activate();
		r->active_at_round = round() + GameConstants::MOVE_DELAY;
		m_out.push_back(MovementSignal{id, from, to});
	}

	void apply_action(Id id, const AttackAction &a)
	{
		Robot *r = actor(id);
		if (!r)
			return;
		Component *w = idle_owned(id, a.weapon);
		if (!w || w->component_class() != ComponentClass::Weapon || !w->within_range(r->loc, a.target))
			return;
		w->activate();
		ComponentType weapon = w->type;
		const auto &wi = info(weapon);
		r->active_at_round = round() + std::max(1, wi.delay);
		Id victim = m_world.robot_at(a.target);
		m_out.push_back(AttackSignal{id, weapon, a.target, victim});

		// r and w may dangle past this point
		damage(victim, wi.damage);
		if (weapon == ComponentType::Cannon)
			splash(a.target, wi.damage * GameConstants::ARTILLERY_SPLASH_RATIO);
	}

	void splash(MapLocation center, double amount)
	{
		std::vector<Id> hit;
		for (int d = 0; d < 8; d++)
		{
			Id id = m_world.robot_at(center.add(static_cast<Direction>(d)));
			if (id != NULL_ID)
				hit.push_back(id);
		}
		std::sort(hit.begin(), hit.end());
		for (Id id : hit)
			damage(id, amount);
	}

	void apply_action(Id id, const SpawnAction &a)
	{
		Robot *r = actor(id);
		if (!r || !r->type_info().producer || a.type != RobotType::Soldier || !is_compass(a.dir))
			return;
		Component *factory = idle_of(id, ComponentClass::Builder);
		TeamState &ts = m_world.team(r->team);
		MapLocation target = r->loc.add(a.dir);
		if (!factory || ts.power < GameConstants::SOLDIER_SPAWN_COST || !open_square(target))
			return;

		int suppliers = m_world.count_type(r->team, RobotType::Supplier);
		int delay = std::max(GameConstants::MIN_SPAWN_DELAY,
							 GameConstants::HQ_SPAWN_DELAY - suppliers * GameConstants::SUPPLIER_SPAWN_REDUCTION);
		ts.power -= GameConstants::SOLDIER_SPAWN_COST;
		factory->cooldown.start(delay);
		r->active_at_round = round() + delay;
		Team team = r->team;

		// register_robot may reallocate the pools
		Id child = m_world.register_robot(team, a.type, target, id);
		m_born.push_back(child);
		m_out.push_back(SpawnSignal{id, child, a.type, team, target});
	}

	void apply_action(Id id, const LayMineAction &)
	{
		Robot *r = actor(id);
		if (!r)
			return;
		Component *miner = idle_of(id, ComponentType::Miner);
		if (!miner || m_world.mine_at(r->loc))
			return;
		m_world.set_mine(r->loc, r->team);
		m_world.team(r->team).mines_laid++;
		miner->activate();
		r->active_at_round = round() + GameConstants::MINE_LAY_DELAY;
		m_out.push_back(MineSignal{id, r->loc, r->team, true});
	}

	void apply_action(Id id, const DefuseMineAction &a)
	{
		Robot *r = actor(id);
		if (!r)
			return;
		Component *miner = idle_of(id, ComponentType::Miner);
		auto mine = m_world.mine_at(a.target);
		bool defusion = m_world.has_upgrade(r->team, Upgrade::Defusion);
		int range = defusion ? GameConstants::DEFUSION_DEFUSE_RANGE_SQ : GameConstants::DEFUSE_RANGE_SQ;
		if (!miner || !mine || r->loc.distance_sq_to(a.target) > range)
			return;
		m_world.clear_mine(a.target);
		miner->activate();
		r->active_at_round =
			round() + (defusion ? GameConstants::MINE_DEFUSE_DEFUSION_DELAY : GameConstants::MINE_DEFUSE_DELAY);
		m_out.push_back(MineSignal{id, a.target, *mine, false});
	}

	// The soldier is consumed and the encampment takes its square.
	void apply_action(Id id, const CaptureAction &a)
	{
		Robot *r = actor(id);
		if (!r || r->type != RobotType::Soldier || !info(a.type).encampment)
			return;
		if (!m_world.map().is_encampment(r->loc))
			return;
		double cost = m_world.capture_cost(r->team);
		TeamState &ts = m_world.team(r->team);
		if (ts.power < cost)
			return;
		ts.power -= cost;
		Team team = r->team;
		MapLocation loc = r->loc;
		m_world.remove_robot(id);
		Id camp = m_world.register_robot(team, a.type, loc, id);
		m_born.push_back(camp);
		m_out.push_back(CaptureSignal{id, camp, a.type, loc});
	}

	void apply_action(Id id, const ResearchAction &a)
	{
		Robot *r = actor(id);
		if (!r || !r->type_info().command)
			return;
		Counter &progress = m_world.team(r->team).research[static_cast<size_t>(a.upgrade)];
		if (progress.done)
			return;
		progress.increment();
		r->active_at_round = round() + GameConstants::RESEARCH_DELAY;
		m_out.push_back(ResearchSignal{id, a.upgrade, progress.count});
	}

	void apply_action(Id id, const SuicideAction &) { kill(id); }

	void apply_action(Id id, const ResignAction &)
	{
		Team t = m_world.lookup(id)->team;
		TeamState &ts = m_world.team(t);
		if (ts.resigned)
			return;
		ts.resigned = true;
		m_out.push_back(ResignSignal{t});
	}

	// ====== UPKEEP ======
	void encampment_effects()
	{
		std::vector<Id> camps;
		m_world.robots().each([&](Id id, const Robot &r) {
			if (r.type == RobotType::Medbay || r.type == RobotType::Shields)
				camps.push_back(id);
		});
		for (Id cid : camps)
		{
			const Robot *camp = m_world.lookup(cid);
			if (!camp)
				continue;
			for (int d = 0; d < 8; d++)
			{
				Robot *ally = m_world.lookup(m_world.robot_at(camp->loc.add(static_cast<Direction>(d))));
				if (!ally || ally->team != camp->team)
					continue;
				if (camp->type == RobotType::Medbay)
					ally->energon = std::min(ally->type_info().max_energon, ally->energon + GameConstants::MEDBAY_HEAL);
				else
					ally->shields = std::min(GameConstants::MAX_SHIELDS, ally->shields + GameConstants::SHIELDS_PER_ROUND);
			}
		}
	}

	void mine_damage()
	{
		std::vector<Id> hit;
		m_world.robots().each([&](Id id, const Robot &r) {
			auto mine = m_world.mine_at(r.loc);
			if (mine && *mine != r.team)
				hit.push_back(id);
		});
		for (Id id : hit)
			damage(id, GameConstants::MINE_DAMAGE);
	}

	void power_income()
	{
		for (Team t : {Team::A, Team::B})
		{
			if (!m_world.hq(t))
				continue;
			double income = GameConstants::HQ_POWER_PER_ROUND +
							GameConstants::GENERATOR_POWER_PER_ROUND * m_world.count_type(t, RobotType::Generator);
			if (m_world.has_upgrade(t, Upgrade::Fusion))
				income += GameConstants::FUSION_POWER_BONUS;
			m_world.team(t).power += income;
		}
	}
};

} // namespace rc
