// rc_signal.hpp — What happened this round
//
// A Signal is an immutable record of one committed state change, carrying
// enough data for a replay client to redraw it without diffing worlds.
// Signal is a closed std::variant; signal_name() gives the tag for logs.
//
// SignalLog is round-scoped: the engine clears it when the next round starts,
// after drain() has handed the round to every observer.

#pragma once
#include "rc_core.hpp"
#include "rc_constants.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace rc
{

struct SpawnSignal
{
	Id parent = NULL_ID; // NULL_ID for map placements
	Id robot = NULL_ID;
	RobotType type = RobotType::Soldier;
	Team team = Team::A;
	MapLocation loc;
	bool operator==(const SpawnSignal &o) const
	{
		return parent == o.parent && robot == o.robot && type == o.type && team == o.team && loc == o.loc;
	}
};

struct MovementSignal
{
	Id robot = NULL_ID;
	MapLocation from, to;
	bool operator==(const MovementSignal &o) const { return robot == o.robot && from == o.from && to == o.to; }
};

struct AttackSignal
{
	Id robot = NULL_ID;
	ComponentType weapon = ComponentType::Blaster;
	MapLocation target;
	Id victim = NULL_ID; // NULL_ID when the shot hit an empty square
	bool operator==(const AttackSignal &o) const
	{
		return robot == o.robot && weapon == o.weapon && target == o.target && victim == o.victim;
	}
};

struct DeathSignal
{
	Id robot = NULL_ID;
	MapLocation loc;
	bool operator==(const DeathSignal &o) const { return robot == o.robot && loc == o.loc; }
};

struct BroadcastSignal
{
	Id robot = NULL_ID;
	int channel = 0;
	int32_t data = 0;
	bool operator==(const BroadcastSignal &o) const
	{
		return robot == o.robot && channel == o.channel && data == o.data;
	}
};

struct TeamMemorySignal
{
	Team team = Team::A;
	int index = 0;
	int64_t value = 0; // value after the write
	bool operator==(const TeamMemorySignal &o) const
	{
		return team == o.team && index == o.index && value == o.value;
	}
};

struct IndicatorStringSignal
{
	Id robot = NULL_ID;
	int index = 0;
	std::string text;
	bool operator==(const IndicatorStringSignal &o) const
	{
		return robot == o.robot && index == o.index && text == o.text;
	}
};

struct MineSignal
{
	Id robot = NULL_ID;
	MapLocation loc;
	Team team = Team::Neutral; // owner of the mine laid or removed
	bool laid = true;
	bool operator==(const MineSignal &o) const
	{
		return robot == o.robot && loc == o.loc && team == o.team && laid == o.laid;
	}
};

struct CaptureSignal
{
	Id robot = NULL_ID;      // consumed soldier
	Id encampment = NULL_ID; // new robot
	RobotType type = RobotType::Generator;
	MapLocation loc;
	bool operator==(const CaptureSignal &o) const
	{
		return robot == o.robot && encampment == o.encampment && type == o.type && loc == o.loc;
	}
};

struct ResearchSignal
{
	Id robot = NULL_ID;
	Upgrade upgrade = Upgrade::Nuke;
	int progress = 0;
	bool operator==(const ResearchSignal &o) const
	{
		return robot == o.robot && upgrade == o.upgrade && progress == o.progress;
	}
};

struct UnequipSignal
{
	Id robot = NULL_ID;
	Id component = NULL_ID;
	ComponentType type = ComponentType::Radar;
	bool operator==(const UnequipSignal &o) const
	{
		return robot == o.robot && component == o.component && type == o.type;
	}
};

struct ObservationSignal
{
	Id robot = NULL_ID;
	std::string text;
	bool operator==(const ObservationSignal &o) const { return robot == o.robot && text == o.text; }
};

struct HatSignal
{
	Id robot = NULL_ID;
	bool operator==(const HatSignal &o) const { return robot == o.robot; }
};

struct ResignSignal
{
	Team team = Team::A;
	bool operator==(const ResignSignal &o) const { return team == o.team; }
};

struct WinSignal
{
	Team winner = Team::A;
	bool operator==(const WinSignal &o) const { return winner == o.winner; }
};

using Signal = std::variant<SpawnSignal, MovementSignal, AttackSignal, DeathSignal, BroadcastSignal,
							TeamMemorySignal, IndicatorStringSignal, MineSignal, CaptureSignal,
							ResearchSignal, UnequipSignal, ObservationSignal, HatSignal, ResignSignal,
							WinSignal>;

inline const char *signal_name(const Signal &s)
{
	static const char *const NAMES[] = {"spawn", "move", "attack", "death", "broadcast",
										"memory", "indicator", "mine", "capture",
										"research", "unequip", "observation", "hat", "resign",
										"win"};
	static_assert(sizeof(NAMES) / sizeof(NAMES[0]) == std::variant_size_v<Signal>, "signal names out of sync");
	return NAMES[s.index()];
}

// =============================================================================
// SignalLog — round-scoped append-only record
// =============================================================================
class SignalLog
{
public:
	using Observer = std::function<void(int round, const std::vector<Signal> &)>;

	void append(Signal s) { m_signals.push_back(std::move(s)); }

	void append_all(std::vector<Signal> &&batch)
	{
		for (auto &s : batch)
			m_signals.push_back(std::move(s));
		batch.clear();
	}

	const std::vector<Signal> &signals() const { return m_signals; }
	size_t size() const { return m_signals.size(); }
	void clear() { m_signals.clear(); }

	void observe(Observer fn) { m_observers.push_back(std::move(fn)); }

	// Hand this round's signals to every observer, in registration order.
	void drain(int round) const
	{
		for (auto &fn : m_observers)
			fn(round, m_signals);
	}

	template <typename T>
	size_t count() const
	{
		size_t n = 0;
		for (auto &s : m_signals)
			if (std::holds_alternative<T>(s)) n++;
		return n;
	}

private:
	std::vector<Signal> m_signals;
	std::vector<Observer> m_observers;
};

} // namespace rc
