#ifndef COUNTDOWN_HPP
#define COUNTDOWN_HPP

#include <functional>

// Cooperative one-second countdown. The host drives it with tick() or
// update(elapsedMs); nothing runs on its own thread.
class Countdown {
public:
	using TickCallback = std::function<void(int)>;
	using ExpireCallback = std::function<void()>;

	Countdown();

	void start(int durationSeconds, TickCallback onTick, ExpireCallback onExpire);
	void restart(int durationSeconds);
	void cancel();
	void reset(int durationSeconds);

	void tick();
	int update(int elapsedMs);

	bool isActive() const;
	int remaining() const;

private:
	int remainingSeconds;
	int pendingMs;
	bool active;
	unsigned int generation;
	TickCallback tickCallback;
	ExpireCallback expireCallback;

	void arm(int durationSeconds);
};

#endif
