// rc_action.hpp — Requests buffered by a robot during its turn
//
// Two kinds:
//   Action      — the one terminal action a robot may queue per round
//   SideEffect  — non-conflicting side channels, any number per round
//
// Nothing here touches the World. The ActionResolver replays each buffer
// at commit time and re-validates every precondition there.

#pragma once
#include "rc_core.hpp"
#include "rc_constants.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace rc
{

// =============================================================================
// Terminal actions
// =============================================================================
struct MoveAction
{
	Direction dir = Direction::None;
};

struct AttackAction
{
	MapLocation target;
	Id weapon = NULL_ID;
};

struct SpawnAction
{
	Direction dir = Direction::None;
	RobotType type = RobotType::Soldier;
};

struct LayMineAction
{
};

struct DefuseMineAction
{
	MapLocation target;
};

struct CaptureAction
{
	RobotType type = RobotType::Generator;
};

struct ResearchAction
{
	Upgrade upgrade = Upgrade::Nuke;
};

struct SuicideAction
{
};

struct ResignAction
{
};

using Action = std::variant<MoveAction, AttackAction, SpawnAction, LayMineAction, DefuseMineAction,
							CaptureAction, ResearchAction, SuicideAction, ResignAction>;

inline const char *action_name(const Action &a)
{
	static const char *const NAMES[] = {"move", "attack", "spawn", "lay_mine", "defuse_mine",
										"capture", "research", "suicide", "resign"};
	static_assert(sizeof(NAMES) / sizeof(NAMES[0]) == std::variant_size_v<Action>, "action names out of sync");
	return NAMES[a.index()];
}

// =============================================================================
// Side channels
// =============================================================================
struct BroadcastWrite
{
	int channel = 0;
	int32_t data = 0;
};

struct IndicatorWrite
{
	int index = 0;
	std::string text;
};

struct MemoryWrite
{
	int index = 0;
	int64_t value = 0;
	int64_t mask = -1; // all bits
};

struct UnequipRequest
{
	Id component = NULL_ID;
};

struct ObservationWrite
{
	std::string text;
};

struct HatRequest
{
};

using SideEffect = std::variant<BroadcastWrite, IndicatorWrite, MemoryWrite, UnequipRequest, ObservationWrite,
								HatRequest>;

// =============================================================================
// TurnBuffer — everything one robot asked for in one round
// =============================================================================
struct TurnBuffer
{
	std::optional<Action> action; // empty = yield
	std::vector<SideEffect> side;

	bool empty() const { return !action && side.empty(); }

	void discard()
	{
		action.reset();
		side.clear();
	}
};

struct Turn
{
	Id robot = NULL_ID;
	TurnBuffer buffer;
};

} // namespace rc
