// rc_player.hpp — Player logic and how it gets into a match
//
// A Player drives one robot. The engine asks a PlayerFactory for one per
// robot when the robot is created and calls turn() once per round.
//
// Shared-object players are compiled against rc headers and export one C
// symbol:
//
//   extern "C" void rc_player_register(rc::PlayerRegistry& reg);
//     Called after dlopen. Add one or more named factories to reg.
//
// Usage:
//   PlayerRegistry reg;
//   PlayerLibrary lib;
//   if (!lib.load("players/rusher.so", reg)) ...
//   Engine engine(cfg, map, reg.find("rusher"), reg.find("turtle"));
//
// The library must outlive every Player it created, so keep the
// PlayerLibrary alive until the Engine is gone.

#pragma once

#include "rc_core.hpp"
#include "rc_constants.hpp"
#include <dlfcn.h>
#include <cstdio>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace rc
{

class RobotController;

class Player
{
public:
	virtual ~Player() = default;
	virtual void turn(RobotController &rc) = 0;
};

using PlayerFactory = std::function<std::unique_ptr<Player>(RobotType type, Id id)>;

// Adapts a plain callable into a Player. Handy for tests and small bots.
template <typename F>
class FnPlayer : public Player
{
public:
	explicit FnPlayer(F fn) : m_fn(std::move(fn)) {}
	void turn(RobotController &rc) override { m_fn(rc); }

private:
	F m_fn;
};

template <typename F>
std::unique_ptr<Player> make_fn_player(F fn)
{
	return std::make_unique<FnPlayer<F>>(std::move(fn));
}

// =============================================================================
// PlayerRegistry — named factories
// =============================================================================
class PlayerRegistry
{
public:
	void add(std::string name, PlayerFactory factory) { m_factories[std::move(name)] = std::move(factory); }

	bool has(const std::string &name) const { return m_factories.count(name) != 0; }

	// Empty factory when the name is unknown: its robots simply yield.
	PlayerFactory find(const std::string &name) const
	{
		auto it = m_factories.find(name);
		return it != m_factories.end() ? it->second : PlayerFactory{};
	}

	std::vector<std::string> names() const
	{
		std::vector<std::string> out;
		for (auto &kv : m_factories)
			out.push_back(kv.first);
		return out;
	}

private:
	std::map<std::string, PlayerFactory> m_factories;
};

// =============================================================================
// PlayerLibrary — dlopen'd shared-object players
// =============================================================================
class PlayerLibrary
{
public:
	PlayerLibrary() = default;
	PlayerLibrary(const PlayerLibrary &) = delete;
	PlayerLibrary &operator=(const PlayerLibrary &) = delete;
	~PlayerLibrary() { unload_all(); }

	Result load(const std::string &path, PlayerRegistry &reg)
	{
		std::string name = basename_noext(path);
		void *handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
		if (!handle)
		{
			fprintf(stderr, "[player] load failed '%s': %s\n", name.c_str(), dlerror());
			return Result::err("dlopen failed");
		}

		auto *register_fn = reinterpret_cast<RegisterFn>(dlsym(handle, "rc_player_register"));
		if (!register_fn)
		{
			fprintf(stderr, "[player] '%s' missing rc_player_register: %s\n", name.c_str(), dlerror());
			dlclose(handle);
			return Result::err("missing rc_player_register");
		}

		m_handles.push_back(handle);
		register_fn(reg);
		printf("[player] loaded: %s\n", name.c_str());
		return Result::ok();
	}

	size_t size() const { return m_handles.size(); }

	void unload_all()
	{
		for (auto it = m_handles.rbegin(); it != m_handles.rend(); ++it)
			dlclose(*it);
		m_handles.clear();
	}

private:
	using RegisterFn = void (*)(PlayerRegistry &);
	std::vector<void *> m_handles;

	static std::string basename_noext(const std::string &path)
	{
		auto slash = path.rfind('/');
		size_t start = (slash == std::string::npos) ? 0 : slash + 1;
		auto dot = path.rfind('.');
		size_t end = (dot == std::string::npos || dot < start) ? path.size() : dot;
		return path.substr(start, end - start);
	}
};

} // namespace rc
