// sample_player.cpp — Shared-object player used by the loader test
//
// HQ spawns whenever it can; soldiers walk toward the enemy HQ and shoot
// whatever enemy is in blaster range on the way.
//   cmake --build build --target rc_sample_player

#include "rc_controller.hpp"
#include "rc_player.hpp"

using namespace rc;

static void hq_turn(RobotController &rc)
{
	if (!rc.is_active() || rc.team_power() < GameConstants::SOLDIER_SPAWN_COST)
		return;
	Direction dir = rc.location().direction_to(rc.sense_enemy_hq_location());
	for (int i = 0; i < 8; i++)
	{
		if (rc.can_move(dir))
		{
			rc.spawn(dir);
			return;
		}
		dir = rotate_right(dir);
	}
}

static void soldier_turn(RobotController &rc)
{
	if (!rc.is_active())
		return;
	for (auto &enemy : rc.sense_nearby_robots(-1, opponent(rc.team())))
	{
		if (rc.can_attack_square(enemy.loc))
		{
			rc.attack_square(enemy.loc);
			return;
		}
	}

	Direction dir = rc.location().direction_to(rc.sense_enemy_hq_location());
	if (!is_compass(dir))
		return;
	for (Direction d : {dir, rotate_left(dir), rotate_right(dir)})
	{
		if (rc.can_move(d))
		{
			rc.move(d);
			return;
		}
	}
}

static void sample_turn(RobotController &rc)
{
	try
	{
		if (rc.type() == RobotType::HQ)
			hq_turn(rc);
		else if (rc.type() == RobotType::Soldier)
			soldier_turn(rc);
	}
	catch (const GameActionException &e)
	{
		rc.set_indicator_string(0, e.what());
	}
}

extern "C" void rc_player_register(PlayerRegistry &reg)
{
	reg.add("sample", [](RobotType, Id) { return make_fn_player(sample_turn); });
}
