// rc_config.hpp — Match configuration
//
// Plain struct with defaults. Hosts fill it in code or from the command
// line with parse_match_args():
//
//   --seed 7 --team-a red --team-b blue --max-rounds 500
//   --bytecodes 5000 --breakpoints
//   --memory-in prev.mem --memory-out next.mem
//   --player-a players/rusher.so --player-b players/turtle.so
//   --map skirmish

#pragma once
#include "rc_core.hpp"
#include "rc_constants.hpp"
#include <cstdlib>
#include <cstring>
#include <string>

namespace rc
{

struct MatchConfig
{
	uint32_t seed = 42;
	std::string team_a = "teamA";
	std::string team_b = "teamB";
	int max_rounds = GameConstants::ROUND_MAX_LIMIT;
	bool breakpoints_enabled = false;
	int bytecode_limit = 0; // 0 = per robot type
	std::string memory_in;
	std::string memory_out;
	std::string player_a;
	std::string player_b;
	std::string map_name = "skirmish";
};

inline Result parse_int(const char *text, long lo, long hi, long &out)
{
	char *end = nullptr;
	long v = strtol(text, &end, 10);
	if (!*text || *end)
		return Result::err("not an integer");
	if (v < lo || v > hi)
		return Result::err("integer out of range");
	out = v;
	return Result::ok();
}

// argv[0] is skipped. Unknown flags and missing values are errors.
inline Result parse_match_args(int argc, char **argv, MatchConfig &cfg)
{
	for (int i = 1; i < argc; i++)
	{
		const char *key = argv[i];
		if (strcmp(key, "--breakpoints") == 0)
		{
			cfg.breakpoints_enabled = true;
			continue;
		}
		if (i + 1 >= argc)
			return Result::err("missing value for flag");
		const char *val = argv[++i];
		long n = 0;

		if (strcmp(key, "--seed") == 0)
		{
			Result r = parse_int(val, 0, 0xFFFFFFFFL, n);
			if (!r) return r;
			cfg.seed = static_cast<uint32_t>(n);
		}
		else if (strcmp(key, "--max-rounds") == 0)
		{
			Result r = parse_int(val, 1, 1000000, n);
			if (!r) return r;
			cfg.max_rounds = static_cast<int>(n);
		}
		else if (strcmp(key, "--bytecodes") == 0)
		{
			Result r = parse_int(val, 0, 100000000, n);
			if (!r) return r;
			cfg.bytecode_limit = static_cast<int>(n);
		}
		else if (strcmp(key, "--team-a") == 0) cfg.team_a = val;
		else if (strcmp(key, "--team-b") == 0) cfg.team_b = val;
		else if (strcmp(key, "--memory-in") == 0) cfg.memory_in = val;
		else if (strcmp(key, "--memory-out") == 0) cfg.memory_out = val;
		else if (strcmp(key, "--player-a") == 0) cfg.player_a = val;
		else if (strcmp(key, "--player-b") == 0) cfg.player_b = val;
		else if (strcmp(key, "--map") == 0) cfg.map_name = val;
		else
			return Result::err("unknown flag");
	}
	if (cfg.team_a == cfg.team_b)
		return Result::err("team names must differ");
	return Result::ok();
}

} // namespace rc
