// rc_constants.hpp — Game constants and stat tables
//
// Provides:
//   GameConstants         — match-wide tunables
//   RobotType + info()    — closed set of robot roles, one row each
//   ComponentType + info()— closed set of equipment, one row each
//   Upgrade + info()      — research catalog
//
// Behaviour dispatches on these tables, never on a class hierarchy.

#pragma once
#include "rc_core.hpp"
#include <cstdint>

namespace rc
{

namespace GameConstants
{
	constexpr int BYTECODE_LIMIT = 10000;
	constexpr int TEAM_MEMORY_LENGTH = 32;
	constexpr int BROADCAST_MAX_CHANNELS = 65536;
	constexpr int NUMBER_OF_INDICATOR_STRINGS = 3;
	constexpr int ROUND_MAX_LIMIT = 2500;

	constexpr int MOVE_DELAY = 1;
	constexpr int RESEARCH_DELAY = 1;
	constexpr int HQ_SPAWN_DELAY = 10;
	constexpr int MIN_SPAWN_DELAY = 2;
	constexpr int SUPPLIER_SPAWN_REDUCTION = 2; // per allied supplier
	constexpr int MINE_LAY_DELAY = 25;
	constexpr int MINE_DEFUSE_DELAY = 12;
	constexpr int MINE_DEFUSE_DEFUSION_DELAY = 5;
	constexpr double MINE_DAMAGE = 10.0;

	constexpr double INITIAL_TEAM_POWER = 100.0;
	constexpr double HQ_POWER_PER_ROUND = 40.0;
	constexpr double GENERATOR_POWER_PER_ROUND = 10.0;
	constexpr double FUSION_POWER_BONUS = 10.0;
	constexpr double SOLDIER_SPAWN_COST = 10.0;
	constexpr double CAPTURE_POWER_COST = 10.0;

	constexpr double MEDBAY_HEAL = 2.0;
	constexpr double SHIELDS_PER_ROUND = 5.0;
	constexpr double MAX_SHIELDS = 100.0;
	constexpr double PLATING_SHIELDS = 20.0;
	constexpr double ARTILLERY_SPLASH_RATIO = 0.5;
	constexpr int VISION_RANGE_BONUS = 19;
	constexpr int DEFUSE_RANGE_SQ = 2;
	constexpr int DEFUSION_DEFUSE_RANGE_SQ = 14;

	// Bytecode prices of the player-facing API
	constexpr int QUERY_COST = 1;
	constexpr int SENSE_COST = 10;
	constexpr int SENSE_NEARBY_COST = 100;
	constexpr int BROADCAST_COST = 25;
	constexpr int READ_BROADCAST_COST = 25;
	constexpr int ACTION_COST = 10;
} // namespace GameConstants

// =============================================================================
// Components
// =============================================================================
enum class ComponentClass : uint8_t
{
	Sensor,
	Weapon,
	Motor,
	Builder,
	Armor
};

enum class ComponentType : uint8_t
{
	Radar,
	Telescope,
	Blaster,
	Cannon,
	Treads,
	Factory,
	Miner,
	Plating,
	Count
};

enum class RangeShape : uint8_t
{
	Circle, // squared euclidean distance <= range
	Square  // chebyshev distance <= range
};

struct ComponentTypeInfo
{
	const char *name;
	ComponentClass cls;
	int range;
	RangeShape shape;
	int delay;
	double damage;
};

constexpr ComponentTypeInfo COMPONENT_TABLE[] = {
	{"RADAR", ComponentClass::Sensor, 14, RangeShape::Circle, 0, 0.0},
	{"TELESCOPE", ComponentClass::Sensor, 63, RangeShape::Circle, 0, 0.0},
	{"BLASTER", ComponentClass::Weapon, 2, RangeShape::Circle, 1, 6.0},
	{"CANNON", ComponentClass::Weapon, 63, RangeShape::Circle, 20, 40.0},
	{"TREADS", ComponentClass::Motor, 1, RangeShape::Square, 1, 0.0},
	{"FACTORY", ComponentClass::Builder, 1, RangeShape::Square, GameConstants::HQ_SPAWN_DELAY, 0.0},
	{"MINER", ComponentClass::Builder, 1, RangeShape::Square, 1, 0.0},
	{"PLATING", ComponentClass::Armor, 0, RangeShape::Square, 0, 0.0},
};
static_assert(sizeof(COMPONENT_TABLE) / sizeof(COMPONENT_TABLE[0]) == static_cast<size_t>(ComponentType::Count),
			  "component table out of sync");

inline const ComponentTypeInfo &info(ComponentType t) { return COMPONENT_TABLE[static_cast<size_t>(t)]; }
inline ComponentClass component_class(ComponentType t) { return info(t).cls; }

// =============================================================================
// Robots
// =============================================================================
enum class RobotType : uint8_t
{
	HQ,
	Soldier,
	Artillery,
	Generator,
	Supplier,
	Medbay,
	Shields,
	Count
};

constexpr int MAX_LOADOUT = 4;

struct RobotTypeInfo
{
	const char *name;
	double max_energon;
	int bytecode_limit;
	bool producer;
	bool command;
	bool encampment;
	int loadout_count;
	ComponentType loadout[MAX_LOADOUT];
};

constexpr RobotTypeInfo ROBOT_TABLE[] = {
	{"HQ", 500.0, GameConstants::BYTECODE_LIMIT, true, true, false, 2,
	 {ComponentType::Radar, ComponentType::Factory}},
	{"SOLDIER", 40.0, GameConstants::BYTECODE_LIMIT, false, false, false, 4,
	 {ComponentType::Radar, ComponentType::Blaster, ComponentType::Treads, ComponentType::Miner}},
	{"ARTILLERY", 100.0, GameConstants::BYTECODE_LIMIT, false, false, true, 3,
	 {ComponentType::Telescope, ComponentType::Cannon, ComponentType::Plating}},
	{"GENERATOR", 100.0, GameConstants::BYTECODE_LIMIT, false, false, true, 2,
	 {ComponentType::Radar, ComponentType::Plating}},
	{"SUPPLIER", 100.0, GameConstants::BYTECODE_LIMIT, false, false, true, 2,
	 {ComponentType::Radar, ComponentType::Plating}},
	{"MEDBAY", 100.0, GameConstants::BYTECODE_LIMIT, false, false, true, 2,
	 {ComponentType::Radar, ComponentType::Plating}},
	{"SHIELDS", 100.0, GameConstants::BYTECODE_LIMIT, false, false, true, 2,
	 {ComponentType::Radar, ComponentType::Plating}},
};
static_assert(sizeof(ROBOT_TABLE) / sizeof(ROBOT_TABLE[0]) == static_cast<size_t>(RobotType::Count),
			  "robot table out of sync");

inline const RobotTypeInfo &info(RobotType t) { return ROBOT_TABLE[static_cast<size_t>(t)]; }

// =============================================================================
// Research
// =============================================================================
enum class Upgrade : uint8_t
{
	Defusion,
	Vision,
	Fusion,
	Nuke,
	Count
};

struct UpgradeInfo
{
	const char *name;
	int rounds;
};

constexpr UpgradeInfo UPGRADE_TABLE[] = {
	{"DEFUSION", 25},
	{"VISION", 25},
	{"FUSION", 25},
	{"NUKE", 200},
};
static_assert(sizeof(UPGRADE_TABLE) / sizeof(UPGRADE_TABLE[0]) == static_cast<size_t>(Upgrade::Count),
			  "upgrade table out of sync");

inline const UpgradeInfo &info(Upgrade u) { return UPGRADE_TABLE[static_cast<size_t>(u)]; }

constexpr int UPGRADE_COUNT = static_cast<int>(Upgrade::Count);

} // namespace rc
