// rc_util.hpp — PLC-inspired helpers for round-based game state
//
// Provides:
//   Countdown — rounds-until-idle timer, ticked once per round
//   Counter   — count up with preset and done flag
//
// All time is whole rounds. No external dependencies.

#pragma once

namespace rc {

// =============================================================================
// Countdown — rounds-until-idle timer
// =============================================================================
//
// Armed with a number of rounds; tick() takes exactly one off per call and
// stops at zero. active() holds from start() until the count runs out.
//   Countdown cd;
//   cd.start(3);             // active, 3 rounds left
//   cd.tick(); cd.tick();    // 1 round left
//   cd.tick();               // idle

struct Countdown {
	int  remaining = 0;
	bool running   = false;

	void start(int rounds) {
		remaining = rounds > 0 ? rounds : 0;
		running   = remaining > 0;
	}

	void tick() {
		if (remaining > 0) --remaining;
		if (remaining == 0) running = false;
	}

	void reset() { remaining = 0; running = false; }
	bool active() const { return running; }

	bool operator==(const Countdown &o) const { return remaining == o.remaining && running == o.running; }
};

// =============================================================================
// Counter — count up with preset and done flag
// =============================================================================
//
//   Counter nuke(200);
//   nuke.increment();       // once per research round
//   if (nuke.done) { /* finished */ }

struct Counter {
	int  count  = 0;
	int  preset = 0;
	bool done   = false;

	Counter() = default;
	explicit Counter(int preset_val) : preset(preset_val) {}

	void increment() {
		if (done) return;
		if (++count >= preset) done = true;
	}

	void reset() { count = 0; done = false; }

	bool operator==(const Counter &o) const { return count == o.count && preset == o.preset && done == o.done; }
};

} // namespace rc
