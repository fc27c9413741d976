// rc_component.hpp — Equipment attached to robots
//
// A Component is a row in the World's component pool. It names its owner by
// Id (NULL_ID once unequipped) and carries one Countdown for its cooldown.
//
//   Idle --use--> Active --N ticks--> Idle
//
// tick() runs once per round for every component, owned or not, whether or
// not the owner can act this round. Queries are pure.

#pragma once
#include "rc_core.hpp"
#include "rc_constants.hpp"
#include "rc_util.hpp"

namespace rc
{

inline bool in_range(RangeShape shape, int range, MapLocation from, MapLocation to)
{
	if (shape == RangeShape::Circle)
		return from.distance_sq_to(to) <= range;
	return from.steps_to(to) <= range;
}

struct Component
{
	Id id = NULL_ID;
	ComponentType type = ComponentType::Radar;
	Id owner = NULL_ID;
	Countdown cooldown;

	bool is_active() const { return cooldown.active(); }
	int rounds_until_idle() const { return cooldown.remaining; }
	ComponentClass component_class() const { return rc::component_class(type); }
	bool attached() const { return owner != NULL_ID; }

	// range_bonus widens circular ranges only (the Vision upgrade).
	bool within_range(MapLocation origin, MapLocation loc, int range_bonus = 0) const
	{
		const auto &ti = info(type);
		int range = ti.range + (ti.shape == RangeShape::Circle ? range_bonus : 0);
		return in_range(ti.shape, range, origin, loc);
	}

	void activate() { cooldown.start(info(type).delay); }
	void tick() { cooldown.tick(); }

	bool operator==(const Component &o) const
	{
		return id == o.id && type == o.type && owner == o.owner && cooldown == o.cooldown;
	}
};

} // namespace rc
