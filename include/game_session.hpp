/**
 * GameSession - One MasterMind Play-Through
 *
 * Integrates the secret, the attempt history and the outcome state in a
 * single class. Drivers (terminal, Python, self-play) only call this API
 * and render what it returns.
 *
 * State machine:
 *   InProgress --submit_guess (exact == length)--> Won
 *   InProgress --submit_guess (history == max)---> Lost
 *   InProgress --abandon------------------------> Abandoned
 *
 * Terminal states reject every mutating call with SessionTerminated.
 * A session is not thread-safe; one driver owns it.
 */

#pragma once

#include "mastermind_types.hpp"
#include "mastermind_rules.hpp"
#include "random_source.hpp"
#include <vector>
#include <functional>
#include <optional>
#include <memory>


namespace mastermind
{


/**
 * Session Callbacks - fired after a successful state change
 */
struct SessionCallbacks
{
	std::function<void(const Attempt&)> onAttempt;
	std::function<void(const Hint&)> onHint;
	std::function<void(SessionState, const Code&)> onFinish;
};


class GameSession
{
public:
	/**
	 * Start a session and generate its secret
	 *
	 * @param config Palette, code length, attempt limit, repeat policy
	 * @param source Random source for the secret and hint; a freshly seeded
	 *               Mt19937Source is used when null
	 * @throws InvalidConfiguration on malformed parameters
	 */
	explicit GameSession(
		const GameConfig& config = GameConfig{},
		std::unique_ptr<RandomSource> source = nullptr,
		const SessionCallbacks& callbacks = SessionCallbacks{}
	);

	/**
	 * Start a session with a seeded Mt19937Source
	 */
	GameSession(const GameConfig& config, unsigned int seed);

	~GameSession() = default;

	GameSession(const GameSession&) = delete;
	GameSession& operator=(const GameSession&) = delete;

	// A moved-from session only answers queries; actions throw std::logic_error
	GameSession(GameSession&& other) noexcept = default;
	GameSession& operator=(GameSession&& other) noexcept = default;


	// === Queries ===

	SessionState get_state() const;

	bool is_active() const;

	const GameConfig& get_config() const;

	/**
	 * Chronological attempt history
	 */
	const std::vector<Attempt>& get_history() const;

	std::optional<Attempt> get_last_attempt() const;

	int attempts_used() const;

	int remaining_attempts() const;

	bool hint_used() const;

	/**
	 * The hint revealed by request_hint, if any
	 */
	std::optional<Hint> get_hint() const;

	/**
	 * The secret, available only once the session is terminal
	 */
	std::optional<Code> get_secret() const;


	// === Actions ===

	/**
	 * Score a guess and advance the state machine
	 *
	 * The call that reaches the attempt limit both scores the guess and
	 * moves the session to Lost. The outcome carries the secret whenever
	 * the call ended the session.
	 *
	 * @throws SessionTerminated if the session is already finished
	 * @throws InvalidGuess on wrong length or off-palette color (no state change)
	 */
	GuessOutcome submit_guess(const Code& guess);

	/**
	 * Reveal one secret position the last attempt got wrong
	 *
	 * Any position is eligible before the first attempt. Does not consume
	 * a turn.
	 *
	 * @throws SessionTerminated if the session is already finished
	 * @throws HintAlreadyUsed on the second call
	 */
	Hint request_hint();

	/**
	 * Give up and reveal the secret
	 *
	 * @throws SessionTerminated if the session is already finished
	 */
	Code abandon();


private:
	void ensure_active(const char* action) const;

	void notify_finish();


	// Configuration
	GameConfig config;
	SessionCallbacks callbacks;
	std::unique_ptr<RandomSource> source;

	// Game state
	Code secret;
	std::vector<Attempt> history;
	SessionState state;

	// Hint
	bool hintUsed;
	std::optional<Hint> hint;
};


}  // namespace mastermind
