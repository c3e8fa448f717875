/**
 * GameSession Implementation
 */

#include "../include/game_session.hpp"
#include "../include/secret_generator.hpp"
#include <stdexcept>


namespace mastermind
{


// === Constructors ===

GameSession::GameSession(
	const GameConfig& config,
	std::unique_ptr<RandomSource> source,
	const SessionCallbacks& callbacks
)
	: config(config)
	, callbacks(callbacks)
	, source(std::move(source))
	, secret()
	, history()
	, state(SessionState::InProgress)
	, hintUsed(false)
	, hint(std::nullopt)
{
	GuessValidation check = validate_config(this->config);
	if (!check.valid)
	{
		throw InvalidConfiguration(check.reason);
	}

	if (!this->source)
	{
		this->source = std::make_unique<Mt19937Source>();
	}

	SecretGenerator generator(*this->source);
	secret = generator.generate(this->config);

	if (static_cast<int>(secret.size()) != this->config.length)
	{
		throw std::logic_error("Generated secret has the wrong length");
	}

	history.reserve(this->config.max_attempts);
}


GameSession::GameSession(const GameConfig& config, unsigned int seed)
	: GameSession(config, std::make_unique<Mt19937Source>(seed))
{
}


// === Queries ===

SessionState GameSession::get_state() const
{
	return state;
}


bool GameSession::is_active() const
{
	return state == SessionState::InProgress;
}


const GameConfig& GameSession::get_config() const
{
	return config;
}


const std::vector<Attempt>& GameSession::get_history() const
{
	return history;
}


std::optional<Attempt> GameSession::get_last_attempt() const
{
	if (history.empty())
	{
		return std::nullopt;
	}
	return history.back();
}


int GameSession::attempts_used() const
{
	return static_cast<int>(history.size());
}


int GameSession::remaining_attempts() const
{
	return config.max_attempts - attempts_used();
}


bool GameSession::hint_used() const
{
	return hintUsed;
}


std::optional<Hint> GameSession::get_hint() const
{
	return hint;
}


std::optional<Code> GameSession::get_secret() const
{
	if (is_active())
	{
		return std::nullopt;
	}
	return secret;
}


// === Actions ===

void GameSession::ensure_active(const char* action) const
{
	if (!is_active())
	{
		throw SessionTerminated(
			std::string("Cannot ") + action + ": session already " + state_to_string(state));
	}

	if (!source)
	{
		throw std::logic_error(std::string("Cannot ") + action + ": session was moved from");
	}
}


GuessOutcome GameSession::submit_guess(const Code& guess)
{
	ensure_active("submit guess");

	GuessValidation check = validate_guess(guess, config);
	if (!check.valid)
	{
		throw InvalidGuess(check.reason);
	}

	Feedback feedback = score_guess(secret, guess);
	history.emplace_back(static_cast<int>(history.size()), guess, feedback);

	// Settle the state before any callback runs
	if (feedback.exact == config.length)
	{
		state = SessionState::Won;
	}
	else if (attempts_used() == config.max_attempts)
	{
		state = SessionState::Lost;
	}

	GuessOutcome outcome;
	outcome.feedback = feedback;
	outcome.state = state;
	if (!is_active())
	{
		outcome.secret = secret;
	}

	if (callbacks.onAttempt)
	{
		callbacks.onAttempt(history.back());
	}

	if (!is_active())
	{
		notify_finish();
	}

	return outcome;
}


Hint GameSession::request_hint()
{
	ensure_active("request hint");

	if (hintUsed)
	{
		throw HintAlreadyUsed("The hint has already been used in this session");
	}

	// Candidate positions: those the latest attempt missed, or all of them
	std::vector<int> candidates;
	for (int i = 0; i < config.length; i++)
	{
		if (history.empty() || history.back().guess[i] != secret[i])
		{
			candidates.push_back(i);
		}
	}

	// An active session's last attempt always has at least one miss
	if (candidates.empty())
	{
		throw std::logic_error("No hint candidate in an active session");
	}

	int position = candidates[source->next_index(candidates.size())];

	hintUsed = true;
	hint = Hint(position, secret[position]);

	if (callbacks.onHint)
	{
		callbacks.onHint(*hint);
	}

	return *hint;
}


Code GameSession::abandon()
{
	ensure_active("abandon");

	state = SessionState::Abandoned;
	notify_finish();
	return secret;
}


void GameSession::notify_finish()
{
	if (callbacks.onFinish)
	{
		callbacks.onFinish(state, secret);
	}
}


}  // namespace mastermind
