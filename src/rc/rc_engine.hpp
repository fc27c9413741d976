// rc_engine.hpp — Round scheduler and host surface
//
// ONE ROUND (step):
//   1. next = committed world, round advanced, every component ticked
//   2. clear last round's signals (the first step hands the map placements
//      to observers before clearing them)
//   3. each robot, ascending id: run its Player under a fresh BytecodeMeter,
//      reading `next`, writing only its own TurnBuffer
//   4. staged = next; ActionResolver commits every buffer into staged
//   5. success: staged becomes the world, signals are appended, observers
//      drain the round, new robots get players
//      EngineFault: nothing is kept, the match stops, the fault is rethrown
//
// PLAYER FAULTS:
//   TurnEnd                turn over, buffer kept unless the quantum ran out
//   GameActionException    turn over, buffer kept
//   anything else          recorded in faults(), buffer dropped, player
//                          disabled for the rest of the match; an
//                          EngineFault thrown by player code lands here too
//
// PAUSE / STEP:
//   A breakpoint() in player logic pauses the engine after the round when
//   breakpoints are enabled. step() does nothing while paused unless the host
//   called request_step(); resume() clears the pause.

#pragma once
#include "rc_core.hpp"
#include "rc_action.hpp"
#include "rc_config.hpp"
#include "rc_controller.hpp"
#include "rc_map.hpp"
#include "rc_memory.hpp"
#include "rc_player.hpp"
#include "rc_resolver.hpp"
#include "rc_signal.hpp"
#include "rc_world.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace rc
{

class Engine
{
public:
	Engine(MatchConfig cfg, GameMap map, PlayerFactory team_a, PlayerFactory team_b,
		   TeamMemory memory = TeamMemory())
		: m_cfg(std::move(cfg)),
		  m_world(m_cfg.seed, m_cfg.team_a, m_cfg.team_b, std::make_shared<const GameMap>(std::move(map)),
				  std::move(memory))
	{
		m_factories[0] = std::move(team_a);
		m_factories[1] = std::move(team_b);

		std::vector<Id> placed;
		for (auto &p : m_world.map().placements())
		{
			Id id = m_world.register_robot(p.team, p.type, p.loc);
			m_log.append(SpawnSignal{NULL_ID, id, p.type, p.team, p.loc});
			placed.push_back(id);
		}
		for (Id id : placed)
			attach_player(id);
	}

	Engine(const Engine &) = delete;
	Engine &operator=(const Engine &) = delete;

	// ====== LOOP ======

	// Runs one round. Returns false if no round ran (match over, or paused
	// with no step requested).
	bool step()
	{
		if (!m_world.is_running())
			return false;
		if (m_paused && !m_step_requested)
			return false;
		m_step_requested = false;
		m_breakpoint_hit = false;

		if (m_world.current_round() < 0)
			m_log.drain(m_world.current_round());
		m_log.clear();

		World next = m_world;
		next.advance_round();
		next.tick_components();

		std::vector<Turn> turns;
		std::vector<Signal> out;
		std::vector<Id> born;
		World staged = next;
		try
		{
			turns.reserve(next.robots().size());
			for (Id id : next.robots().dense_ids)
			{
				Turn t;
				t.robot = id;
				run_turn(next, id, t.buffer);
				turns.push_back(std::move(t));
			}

			ActionResolver resolver(staged, out, m_cfg.max_rounds);
			for (auto &t : turns)
				resolver.apply(t);
			resolver.end_of_round();
			born = resolver.born();
		}
		catch (const EngineFault &e)
		{
			m_faults.push_back(std::string("engine: ") + e.what());
			m_world.stop();
			throw;
		}

		m_world = std::move(staged);
		m_log.append_all(std::move(out));

		for (auto it = m_players.begin(); it != m_players.end();)
		{
			if (!m_world.lookup(it->first))
				it = m_players.erase(it);
			else
				++it;
		}
		for (Id id : born)
			if (m_world.lookup(id))
				attach_player(id);

		m_log.drain(m_world.current_round());

		if (m_breakpoint_hit && m_cfg.breakpoints_enabled)
			m_paused = true;
		return true;
	}

	// Runs until the match ends or a breakpoint pauses it.
	void run()
	{
		while (m_world.is_running() && !m_paused)
			step();
	}

	// ====== HOST QUERIES ======
	int current_round() const { return m_world.current_round(); }
	bool is_running() const { return m_world.is_running(); }
	std::optional<Team> winner() const { return m_world.winner(); }
	const Robot *object_by_id(Id id) const { return m_world.lookup(id); }
	const Component *component_by_id(Id id) const { return m_world.component(id); }
	const World &world() const { return m_world; }
	const TeamMemory &team_memory() const { return m_world.memory(); }
	const MatchConfig &config() const { return m_cfg; }

	const std::vector<Signal> &signals() const { return m_log.signals(); }
	void observe(SignalLog::Observer fn) { m_log.observe(std::move(fn)); }

	const std::vector<std::string> &faults() const { return m_faults; }
	bool has_player(Id id) const
	{
		auto it = m_players.find(id);
		return it != m_players.end() && it->second;
	}

	// ====== HOST CONTROL ======
	bool was_breakpoint_hit() const { return m_breakpoint_hit; }
	bool is_paused() const { return m_paused; }
	void pause() { m_paused = true; }
	void resume() { m_paused = false; }
	void request_step() { m_step_requested = true; }

	// Between rounds only; players see the bits from the next round on.
	void set_control_bits(Id id, uint64_t bits)
	{
		Robot *r = m_world.lookup(id);
		if (!r)
			throw EngineFault("set_control_bits on unknown robot " + std::to_string(id));
		r->control_bits = bits;
	}

private:
	MatchConfig m_cfg;
	World m_world;
	SignalLog m_log;
	PlayerFactory m_factories[2];
	std::map<Id, std::unique_ptr<Player>> m_players;
	std::vector<std::string> m_faults;
	bool m_paused = false;
	bool m_step_requested = false;
	bool m_breakpoint_hit = false;

	void fault(Id id, const char *what)
	{
		m_faults.push_back("robot " + std::to_string(id) + ": " + what);
	}

	void attach_player(Id id)
	{
		const Robot *r = m_world.lookup(id);
		if (!r || r->team == Team::Neutral)
			return;
		const PlayerFactory &factory = m_factories[team_index(r->team)];
		if (!factory)
			return;
		try
		{
			m_players[id] = factory(r->type, id);
		}
		catch (const std::exception &e)
		{
			fault(id, e.what());
		}
		catch (...)
		{
			fault(id, "unknown exception");
		}
	}

	void run_turn(const World &world, Id id, TurnBuffer &buffer)
	{
		auto it = m_players.find(id);
		if (it == m_players.end() || !it->second)
			return;
		const Robot *r = world.lookup(id);
		int limit = m_cfg.bytecode_limit > 0 ? m_cfg.bytecode_limit : r->type_info().bytecode_limit;
		BytecodeMeter meter(limit);
		RobotController rc(world, id, buffer, meter);
		try
		{
			it->second->turn(rc);
		}
		catch (const TurnEnd &)
		{
		}
		catch (const GameActionException &)
		{
		}
		// Anything else thrown from player code, EngineFault included, is the
		// player's fault and never stops the match.
		catch (const std::exception &e)
		{
			fault(id, e.what());
			buffer.discard();
			it->second.reset();
		}
		catch (...)
		{
			fault(id, "unknown exception");
			buffer.discard();
			it->second.reset();
		}

		// Player code that swallowed the TurnEnd still loses the round.
		if (meter.exhausted())
			buffer.discard();
		if (rc.breakpoint_requested())
			m_breakpoint_hit = true;
	}
};

} // namespace rc
