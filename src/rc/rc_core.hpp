// rc_core.hpp — robot combat kernel primitives
//
// THE RULE OF 3 VERBS:
// 1. Data: Pool<T> keyed by Id, iterated in ascending-Id order
// 2. Ids: handed out by World::register_robot(), never reused in a match
// 3. Errors: GameActionException to player logic, EngineFault to the host
//
// Everything here is plain data. The World (rc_world.hpp) owns the pools;
// every other layer refers to entities by Id only.

#pragma once

#include <vector>
#include <string>
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace rc
{

// =============================================================================
// Ids
// =============================================================================
using Id = int32_t;
constexpr Id NULL_ID = 0;
constexpr uint32_t NULL_INDEX = 0xFFFFFFFF;

// =============================================================================
// Teams
// =============================================================================
enum class Team : uint8_t
{
	A,
	B,
	Neutral
};

inline Team opponent(Team t)
{
	switch (t)
	{
	case Team::A: return Team::B;
	case Team::B: return Team::A;
	default: return Team::Neutral;
	}
}

inline int team_index(Team t) { return t == Team::B ? 1 : 0; }

inline const char *team_str(Team t)
{
	switch (t)
	{
	case Team::A: return "A";
	case Team::B: return "B";
	default: return "NEUTRAL";
	}
}

// =============================================================================
// Direction / MapLocation
// =============================================================================
enum class Direction : uint8_t
{
	North,
	NorthEast,
	East,
	SouthEast,
	South,
	SouthWest,
	West,
	NorthWest,
	None,
	Omni
};

constexpr int DX[8] = {0, 1, 1, 1, 0, -1, -1, -1};
constexpr int DY[8] = {-1, -1, 0, 1, 1, 1, 0, -1};

inline bool is_compass(Direction d) { return static_cast<uint8_t>(d) < 8; }

inline Direction rotate_left(Direction d)
{
	if (!is_compass(d)) return d;
	return static_cast<Direction>((static_cast<uint8_t>(d) + 7) % 8);
}

inline Direction rotate_right(Direction d)
{
	if (!is_compass(d)) return d;
	return static_cast<Direction>((static_cast<uint8_t>(d) + 1) % 8);
}

inline Direction reverse(Direction d)
{
	if (!is_compass(d)) return d;
	return static_cast<Direction>((static_cast<uint8_t>(d) + 4) % 8);
}

struct MapLocation
{
	int x = 0, y = 0;

	MapLocation() = default;
	MapLocation(int x, int y) : x(x), y(y) {}

	MapLocation add(Direction d, int n = 1) const
	{
		if (!is_compass(d)) return *this;
		auto i = static_cast<uint8_t>(d);
		return {x + DX[i] * n, y + DY[i] * n};
	}

	int distance_sq_to(MapLocation o) const
	{
		int dx = x - o.x, dy = y - o.y;
		return dx * dx + dy * dy;
	}

	// Chebyshev distance
	int steps_to(MapLocation o) const
	{
		return std::max(std::abs(x - o.x), std::abs(y - o.y));
	}

	bool is_adjacent_to(MapLocation o) const
	{
		return !(*this == o) && steps_to(o) == 1;
	}

	Direction direction_to(MapLocation o) const
	{
		int dx = (o.x > x) - (o.x < x);
		int dy = (o.y > y) - (o.y < y);
		if (dx == 0 && dy == 0) return Direction::Omni;
		for (uint8_t i = 0; i < 8; i++)
			if (DX[i] == dx && DY[i] == dy)
				return static_cast<Direction>(i);
		return Direction::None;
	}

	bool operator==(MapLocation o) const { return x == o.x && y == o.y; }
	bool operator!=(MapLocation o) const { return !(*this == o); }
	bool operator<(MapLocation o) const { return y != o.y ? y < o.y : x < o.x; }
};

// =============================================================================
// Errors
// =============================================================================
enum class GameActionExceptionType : uint8_t
{
	CantDoThat,
	AlreadyActive,
	CantMoveThere,
	CantSenseThat,
	OutOfRange,
	NotEnoughResource,
	NoRobotThere,
	MissingUpgrade
};

inline const char *exception_type_str(GameActionExceptionType t)
{
	switch (t)
	{
	case GameActionExceptionType::CantDoThat: return "CANT_DO_THAT";
	case GameActionExceptionType::AlreadyActive: return "ALREADY_ACTIVE";
	case GameActionExceptionType::CantMoveThere: return "CANT_MOVE_THERE";
	case GameActionExceptionType::CantSenseThat: return "CANT_SENSE_THAT";
	case GameActionExceptionType::OutOfRange: return "OUT_OF_RANGE";
	case GameActionExceptionType::NotEnoughResource: return "NOT_ENOUGH_RESOURCE";
	case GameActionExceptionType::NoRobotThere: return "NO_ROBOT_THERE";
	case GameActionExceptionType::MissingUpgrade: return "MISSING_UPGRADE";
	}
	return "UNKNOWN";
}

// Recoverable precondition failure, surfaced to the offending robot's logic.
struct GameActionException : std::exception
{
	GameActionExceptionType type;
	std::string msg;
	GameActionException(GameActionExceptionType t, std::string m)
		: type(t), msg(std::string(exception_type_str(t)) + ": " + std::move(m)) {}
	const char *what() const noexcept override { return msg.c_str(); }
};

// Engine-level invariant violation. Aborts the match.
struct EngineFault : std::exception
{
	std::string msg;
	explicit EngineFault(std::string m) : msg(std::move(m)) {}
	const char *what() const noexcept override { return msg.c_str(); }
};

// Unwinds player logic at a metering checkpoint. Deliberately not a
// std::exception so `catch (const std::exception&)` in player code misses it.
struct TurnEnd
{
};

struct Result
{
	const char *error = nullptr;
	static Result ok() { return {nullptr}; }
	static Result err(const char *msg) { return {msg}; }
	explicit operator bool() const { return error == nullptr; }
};

// =============================================================================
// Rng — xorshift32 PRNG
// =============================================================================
struct Rng
{
	uint32_t state;

	explicit Rng(uint32_t seed = 42) : state(seed ? seed : 1) {}

	uint32_t next()
	{
		state ^= state << 13;
		state ^= state >> 17;
		state ^= state << 5;
		return state;
	}

	// Uniform int in [0, n)
	int next_int(int n)
	{
		return n > 0 ? static_cast<int>(next() % static_cast<uint32_t>(n)) : 0;
	}

	// Uniform double in [0, 1)
	double next_double()
	{
		return static_cast<double>(next() & 0xFFFFFF) / static_cast<double>(0x1000000);
	}
};

// Stateless stream seed: same (seed, id, round) always gives the same stream.
inline uint32_t mix_seed(uint32_t seed, Id id, int round)
{
	uint32_t h = seed ^ 0x9E3779B9u;
	h ^= static_cast<uint32_t>(id) * 0x85EBCA6Bu;
	h = (h << 13) | (h >> 19);
	h ^= static_cast<uint32_t>(round + 1) * 0xC2B2AE35u;
	h ^= h >> 16;
	return h;
}

// =============================================================================
// Pool<T> — ordered sparse set keyed by Id
//
// Pure data container. Dense storage stays sorted by Id, so each() visits
// entries in ascending-Id order; that order is what makes a round
// reproducible. Ids are handed out monotonically, so add() is an append in
// practice. remove() shifts the tail to keep the order.
// =============================================================================
template <typename T>
class Pool
{
public:
	std::vector<T> items;
	std::vector<Id> dense_ids;
	std::vector<uint32_t> sparse_indices;

	T *add(Id id, T val = T{})
	{
		if (id <= NULL_ID)
			throw EngineFault("pool add with null id");
		auto idx = static_cast<uint32_t>(id);
		if (idx >= sparse_indices.size())
			sparse_indices.resize(idx + 1, NULL_INDEX);

		if (sparse_indices[idx] != NULL_INDEX)
		{
			T &slot = items[sparse_indices[idx]];
			slot = std::move(val);
			return &slot;
		}

		auto pos = std::upper_bound(dense_ids.begin(), dense_ids.end(), id);
		auto dense_idx = static_cast<uint32_t>(pos - dense_ids.begin());
		dense_ids.insert(pos, id);
		items.insert(items.begin() + dense_idx, std::move(val));
		reindex(dense_idx);
		return &items[dense_idx];
	}

	bool remove(Id id)
	{
		auto idx = static_cast<uint32_t>(id);
		if (id <= NULL_ID || idx >= sparse_indices.size() || sparse_indices[idx] == NULL_INDEX)
			return false;

		uint32_t dense_idx = sparse_indices[idx];
		sparse_indices[idx] = NULL_INDEX;
		items.erase(items.begin() + dense_idx);
		dense_ids.erase(dense_ids.begin() + dense_idx);
		reindex(dense_idx);
		return true;
	}

	void clear_all()
	{
		for (Id id : dense_ids)
			sparse_indices[static_cast<uint32_t>(id)] = NULL_INDEX;
		items.clear();
		dense_ids.clear();
	}

	T *get(Id id)
	{
		auto idx = static_cast<uint32_t>(id);
		if (id <= NULL_ID || idx >= sparse_indices.size() || sparse_indices[idx] == NULL_INDEX)
			return nullptr;
		return &items[sparse_indices[idx]];
	}
	const T *get(Id id) const { return const_cast<Pool *>(this)->get(id); }

	bool has(Id id) const { return get(id) != nullptr; }
	size_t size() const { return items.size(); }
	Id id_at(size_t dense_idx) const { return dense_ids[dense_idx]; }

	// Signatures: void(const T&) or void(Id, const T&)
	template <typename F>
	void each(F &&fn) const
	{
		for (size_t i = 0; i < items.size(); i++)
		{
			if constexpr (std::is_invocable_v<F, Id, const T &>)
				fn(dense_ids[i], items[i]);
			else
				fn(items[i]);
		}
	}

	// Signatures: void(T&) or void(Id, T&)
	template <typename F>
	void each_mut(F &&fn)
	{
		for (size_t i = 0; i < items.size(); i++)
		{
			if constexpr (std::is_invocable_v<F, Id, T &>)
				fn(dense_ids[i], items[i]);
			else
				fn(items[i]);
		}
	}

private:
	void reindex(uint32_t from)
	{
		for (size_t i = from; i < dense_ids.size(); i++)
			sparse_indices[static_cast<uint32_t>(dense_ids[i])] = static_cast<uint32_t>(i);
	}
};

} // namespace rc
