// skirmish.cpp — Headless match host
// Build: cmake --build build --target rc_skirmish
// Run:   ./rc_skirmish [--seed N] [--map skirmish|duel|fortress]
//                      [--player-a rusher|turtle|idle|path/to/player.so] [--player-b ...]
//                      [--memory-in prev.mem] [--memory-out next.mem] [--breakpoints]

#include "rc_config.hpp"
#include "rc_controller.hpp"
#include "rc_engine.hpp"
#include "rc_memory.hpp"
#include "rc_player.hpp"
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

using namespace rc;

// =============================================================================
// Maps
// =============================================================================
static bool build_map(const std::string& name, GameMap& out) {
    if (name == "duel") {
        out = GameMap::parse({
            "A.......",
            ".a......",
            "........",
            "......b.",
            ".......B",
        });
        return true;
    }
    if (name == "skirmish") {
        out = GameMap::parse({
            "A.....E.........",
            "..a.......m.....",
            "....##......E...",
            "....##..........",
            "..........##....",
            "...E......##....",
            ".....m.......b..",
            ".........E.....B",
        });
        return true;
    }
    if (name == "fortress") {
        out = GameMap::parse({
            "A.E.......#.....",
            ".aa.......#.....",
            "E.........#.....",
            "................",
            "................",
            ".....#.........E",
            ".....#......bb..",
            ".....#.......E.B",
        });
        return true;
    }
    return false;
}

// =============================================================================
// Built-in players
// =============================================================================

// Spawns constantly and sends everything at the enemy HQ.
static void rusher_turn(RobotController& rc) {
    if (!rc.is_active())
        return;
    MapLocation enemy_hq = rc.sense_enemy_hq_location();
    Direction dir = rc.location().direction_to(enemy_hq);

    if (rc.type() == RobotType::HQ) {
        if (rc.team_power() < GameConstants::SOLDIER_SPAWN_COST)
            return;
        for (int i = 0; i < 8; i++, dir = rotate_right(dir)) {
            if (rc.can_move(dir)) {
                rc.spawn(dir);
                return;
            }
        }
        return;
    }
    if (rc.type() != RobotType::Soldier)
        return;

    for (auto& enemy : rc.sense_nearby_robots(-1, opponent(rc.team()))) {
        if (rc.can_attack_square(enemy.loc)) {
            rc.attack_square(enemy.loc);
            return;
        }
    }
    for (Direction d : {dir, rotate_left(dir), rotate_right(dir)}) {
        if (is_compass(d) && rc.can_move(d) && rc.sense_mine(rc.location().add(d)) != opponent(rc.team())) {
            rc.move(d);
            return;
        }
    }
}

// Researches toward the Nuke, grabs encampments and mines its half.
static void turtle_turn(RobotController& rc) {
    if (rc.round() == 0)
        rc.set_team_memory(0, rc.team_memory()[0] + 1);
    if (!rc.is_active())
        return;

    if (rc.type() == RobotType::HQ) {
        int soldiers = 0;
        for (auto& r : rc.sense_nearby_robots(-1, rc.team()))
            if (r.type == RobotType::Soldier) soldiers++;
        if (soldiers < 3 && rc.team_power() >= GameConstants::SOLDIER_SPAWN_COST) {
            Direction dir = Direction::North;
            for (int i = 0; i < 8; i++, dir = rotate_right(dir)) {
                if (rc.can_move(dir)) {
                    rc.spawn(dir);
                    return;
                }
            }
        }
        if (!rc.has_upgrade(Upgrade::Fusion))
            rc.research_upgrade(Upgrade::Fusion);
        else
            rc.research_upgrade(Upgrade::Nuke);
        return;
    }
    if (rc.type() != RobotType::Soldier)
        return;

    MapLocation here = rc.location();
    if (rc.sense_encampment_square(here) && rc.team_power() >= rc.sense_capture_cost()) {
        rc.capture_encampment(rc.rand() % 2 ? RobotType::Generator : RobotType::Medbay);
        return;
    }
    MapLocation best{-1, -1};
    for (MapLocation e : rc.sense_all_encampments()) {
        if (rc.can_sense_square(e) && rc.sense_object_at(e))
            continue;
        if (best.x < 0 || here.distance_sq_to(e) < here.distance_sq_to(best))
            best = e;
    }
    if (best.x >= 0 && here.distance_sq_to(best) <= 32) {
        Direction d = here.direction_to(best);
        if (rc.can_move(d)) {
            rc.move(d);
            return;
        }
    }
    if (!rc.sense_mine(here)) {
        rc.lay_mine();
        return;
    }
    Direction d = static_cast<Direction>(rc.rand() % 8);
    if (rc.can_move(d))
        rc.move(d);
}

static PlayerFactory builtin(const std::string& name) {
    auto wrap = [](void (*fn)(RobotController&)) -> PlayerFactory {
        return [fn](RobotType, Id) {
            return make_fn_player([fn](RobotController& rc) {
                try {
                    fn(rc);
                } catch (const GameActionException& e) {
                    rc.set_indicator_string(0, e.what());
                }
            });
        };
    };
    if (name == "rusher") return wrap(rusher_turn);
    if (name == "turtle") return wrap(turtle_turn);
    if (name == "idle") return wrap([](RobotController& rc) { rc.yield(); });
    return PlayerFactory{};
}

static bool ends_with(const std::string& s, const char* suffix) {
    size_t n = strlen(suffix);
    return s.size() >= n && s.compare(s.size() - n, n, suffix) == 0;
}

// Built-in name, or a shared object whose registry name matches its file name.
static PlayerFactory resolve_player(const std::string& choice, const char* fallback,
                                    PlayerLibrary& lib, PlayerRegistry& reg) {
    if (choice.empty())
        return builtin(fallback);
    if (!ends_with(choice, ".so"))
        return builtin(choice);
    if (!lib.load(choice, reg))
        return PlayerFactory{};
    auto slash = choice.rfind('/');
    std::string base = choice.substr(slash == std::string::npos ? 0 : slash + 1);
    base = base.substr(0, base.size() - 3);
    if (reg.has(base))
        return reg.find(base);
    std::vector<std::string> names = reg.names();
    return names.empty() ? PlayerFactory{} : reg.find(names.back());
}

// =============================================================================
// Main
// =============================================================================
int main(int argc, char** argv) {
    MatchConfig cfg;
    Result parsed = parse_match_args(argc, argv, cfg);
    if (!parsed) {
        fprintf(stderr, "[match] bad arguments: %s\n", parsed.error);
        return 2;
    }

    GameMap map;
    if (!build_map(cfg.map_name, map)) {
        fprintf(stderr, "[match] unknown map '%s'\n", cfg.map_name.c_str());
        return 2;
    }

    std::vector<int64_t> old_a, old_b;
    if (!cfg.memory_in.empty()) {
        Result r = load_team_memory(cfg.memory_in.c_str(), GameConstants::TEAM_MEMORY_LENGTH, old_a, old_b);
        if (!r) {
            fprintf(stderr, "[match] %s: %s\n", cfg.memory_in.c_str(), r.error);
            return 1;
        }
    } else {
        old_a.assign(GameConstants::TEAM_MEMORY_LENGTH, 0);
        old_b.assign(GameConstants::TEAM_MEMORY_LENGTH, 0);
    }

    // Declared before the engine so player code outlives every Player.
    PlayerLibrary lib;
    PlayerRegistry reg;
    PlayerFactory player_a = resolve_player(cfg.player_a, "rusher", lib, reg);
    PlayerFactory player_b = resolve_player(cfg.player_b, "turtle", lib, reg);
    if (!player_a || !player_b) {
        fprintf(stderr, "[match] could not resolve players '%s' / '%s'\n",
                cfg.player_a.c_str(), cfg.player_b.c_str());
        return 1;
    }

    printf("[match] %s vs %s on '%s', seed %u, %d rounds max\n", cfg.team_a.c_str(), cfg.team_b.c_str(),
           cfg.map_name.c_str(), cfg.seed, cfg.max_rounds);

    try {
        Engine engine(cfg, map, player_a, player_b, TeamMemory(old_a, old_b));

        size_t deaths = 0, spawns = 0;
        engine.observe([&](int round, const std::vector<Signal>& log) {
            for (auto& s : log) {
                if (std::holds_alternative<DeathSignal>(s)) deaths++;
                if (std::holds_alternative<SpawnSignal>(s)) spawns++;
                if (auto* cap = std::get_if<CaptureSignal>(&s))
                    printf("[round] %d  robot %d captured %s at (%d,%d)\n", round, cap->robot,
                           info(cap->type).name, cap->loc.x, cap->loc.y);
            }
            if (round > 0 && round % 250 == 0)
                printf("[round] %d  robots=%zu  spawns=%zu  deaths=%zu\n", round,
                       engine.world().robots().size(), spawns, deaths);
        });

        while (engine.is_running()) {
            engine.run();
            if (engine.is_paused()) {
                printf("[match] breakpoint after round %d\n", engine.current_round());
                engine.resume();
            }
        }

        const World& w = engine.world();
        Team winner = *engine.winner();
        printf("[match] %s (%s) wins at round %d\n", w.team_name(winner).c_str(), team_str(winner),
               engine.current_round());
        for (Team t : {Team::A, Team::B})
            printf("[match]   %-8s power=%.0f  encampments=%d  mines=%d  nuke=%d\n", w.team_name(t).c_str(),
                   w.team(t).power, w.count_encampments(t), w.team(t).mines_laid,
                   w.team(t).research[static_cast<size_t>(Upgrade::Nuke)].count);
        for (auto& f : engine.faults())
            printf("[match] fault: %s\n", f.c_str());

        if (!cfg.memory_out.empty()) {
            Result r = save_team_memory(cfg.memory_out.c_str(), engine.team_memory());
            if (!r) {
                fprintf(stderr, "[match] %s: %s\n", cfg.memory_out.c_str(), r.error);
                return 1;
            }
        }
    } catch (const EngineFault& e) {
        fprintf(stderr, "[match] engine fault: %s\n", e.what());
        return 3;
    }
    return 0;
}
