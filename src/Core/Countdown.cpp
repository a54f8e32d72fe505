#include "Countdown.hpp"

#include <utility>

Countdown::Countdown()
	: remainingSeconds(0),
	  pendingMs(0),
	  active(false),
	  generation(0),
	  tickCallback(),
	  expireCallback() {
}

void Countdown::start(int durationSeconds, TickCallback onTick, ExpireCallback onExpire) {
	tickCallback = std::move(onTick);
	expireCallback = std::move(onExpire);
	arm(durationSeconds);
}

void Countdown::restart(int durationSeconds) {
	arm(durationSeconds);
}

void Countdown::cancel() {
	if (active) {
		++generation;
	}
	active = false;
	pendingMs = 0;
}

void Countdown::reset(int durationSeconds) {
	cancel();
	remainingSeconds = durationSeconds;
}

void Countdown::tick() {
	if (!active) {
		return;
	}
	--remainingSeconds;
	unsigned int current = generation;
	if (tickCallback) {
		TickCallback onTick = tickCallback;
		onTick(remainingSeconds);
	}
	// The tick callback may have cancelled or re-armed us.
	if (!active || current != generation) {
		return;
	}
	if (remainingSeconds > 0) {
		return;
	}
	active = false;
	pendingMs = 0;
	++generation;
	if (expireCallback) {
		ExpireCallback onExpire = expireCallback;
		onExpire();
	}
}

// Returns the milliseconds left over once the countdown stops within this update.
int Countdown::update(int elapsedMs) {
	if (!active || elapsedMs <= 0) {
		return 0;
	}
	int left = pendingMs + elapsedMs;
	while (left >= 1000) {
		left -= 1000;
		unsigned int current = generation;
		tick();
		if (current != generation) {
			return active ? 0 : left;
		}
	}
	pendingMs = left;
	return 0;
}

bool Countdown::isActive() const {
	return active;
}

int Countdown::remaining() const {
	return remainingSeconds;
}

void Countdown::arm(int durationSeconds) {
	++generation;
	remainingSeconds = durationSeconds;
	pendingMs = 0;
	active = durationSeconds > 0;
	unsigned int current = generation;
	if (tickCallback) {
		TickCallback onTick = tickCallback;
		onTick(remainingSeconds);
	}
	if (active || current != generation) {
		return;
	}
	// A zero-length countdown expires immediately.
	++generation;
	if (expireCallback) {
		ExpireCallback onExpire = expireCallback;
		onExpire();
	}
}
