// rc_memory.hpp — Team memory carried between matches of a series
//
// Two fixed-length int64 arrays per team:
//   old     — what the previous match left behind, read-only
//   current — what this match will leave behind, starts as a copy of old
//
// Writes are last-write-wins with no history. An index outside the fixed
// length is an engine bug by the time it reaches here (the controller rejects
// bad indices from player code), so it throws EngineFault.
//
// Persistence is a two-line text file, one line per team, decimal values.

#pragma once
#include "rc_core.hpp"
#include "rc_constants.hpp"
#include <cinttypes>
#include <cstdio>
#include <initializer_list>
#include <string>
#include <vector>

namespace rc
{

class TeamMemory
{
public:
	explicit TeamMemory(int length = GameConstants::TEAM_MEMORY_LENGTH)
		: TeamMemory(std::vector<int64_t>(static_cast<size_t>(length), 0),
					 std::vector<int64_t>(static_cast<size_t>(length), 0))
	{
	}

	TeamMemory(std::vector<int64_t> old_a, std::vector<int64_t> old_b)
	{
		if (old_a.size() != old_b.size())
			throw EngineFault("team memory length mismatch: " + std::to_string(old_a.size()) +
							  " vs " + std::to_string(old_b.size()));
		m_old[0] = std::move(old_a);
		m_old[1] = std::move(old_b);
		m_current[0] = m_old[0];
		m_current[1] = m_old[1];
	}

	int length() const { return static_cast<int>(m_old[0].size()); }
	bool valid_index(int index) const { return index >= 0 && index < length(); }

	const std::vector<int64_t> &read(Team t) const { return m_old[slot(t)]; }
	const std::vector<int64_t> &current(Team t) const { return m_current[slot(t)]; }

	void write(Team t, int index, int64_t value)
	{
		check_index(index);
		m_current[slot(t)][static_cast<size_t>(index)] = value;
	}

	void write_masked(Team t, int index, int64_t value, int64_t mask)
	{
		check_index(index);
		int64_t &cell = m_current[slot(t)][static_cast<size_t>(index)];
		cell = (cell & ~mask) | (value & mask);
	}

	bool operator==(const TeamMemory &o) const
	{
		return m_old[0] == o.m_old[0] && m_old[1] == o.m_old[1] &&
			   m_current[0] == o.m_current[0] && m_current[1] == o.m_current[1];
	}

private:
	std::vector<int64_t> m_old[2];
	std::vector<int64_t> m_current[2];

	static size_t slot(Team t)
	{
		if (t == Team::Neutral)
			throw EngineFault("neutral team has no memory");
		return static_cast<size_t>(team_index(t));
	}

	void check_index(int index) const
	{
		if (!valid_index(index))
			throw EngineFault("team memory index " + std::to_string(index) + " outside [0, " +
							  std::to_string(length()) + ")");
	}
};

// Writes the current arrays for the next match of the series.
inline Result save_team_memory(const char *path, const TeamMemory &mem)
{
	FILE *f = fopen(path, "w");
	if (!f)
		return Result::err("could not open team memory file for writing");
	for (Team t : {Team::A, Team::B})
	{
		const auto &arr = mem.current(t);
		for (size_t i = 0; i < arr.size(); i++)
			fprintf(f, i ? " %" PRId64 : "%" PRId64, arr[i]);
		fprintf(f, "\n");
	}
	fclose(f);
	return Result::ok();
}

// A missing file is not an error: the previous match simply left nothing
// behind and both arrays come back zero-filled.
inline Result load_team_memory(const char *path, int length, std::vector<int64_t> &a, std::vector<int64_t> &b)
{
	a.assign(static_cast<size_t>(length), 0);
	b.assign(static_cast<size_t>(length), 0);
	FILE *f = fopen(path, "r");
	if (!f)
		return Result::ok();
	for (auto *arr : {&a, &b})
	{
		for (int i = 0; i < length; i++)
		{
			int64_t v = 0;
			if (fscanf(f, "%" SCNd64, &v) != 1)
			{
				fclose(f);
				a.assign(static_cast<size_t>(length), 0);
				b.assign(static_cast<size_t>(length), 0);
				return Result::err("team memory file is truncated");
			}
			(*arr)[static_cast<size_t>(i)] = v;
		}
	}
	fclose(f);
	return Result::ok();
}

} // namespace rc
