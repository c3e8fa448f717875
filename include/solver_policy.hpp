/**
 * Policy Interface for MasterMind Self-Play
 *
 * Abstract interface for automatic guessers:
 * - Random policy (baseline)
 * - Consistent policy (only plays codes that could still be the secret)
 *
 * Policies read the session through its public query surface and never
 * see the secret.
 */

#pragma once

#include "game_session.hpp"
#include "mastermind_rules.hpp"
#include <vector>
#include <random>
#include <memory>
#include <string>
#include <stdexcept>


namespace mastermind
{


/**
 * Abstract Policy Interface
 */
class IPolicy
{
public:
	virtual ~IPolicy() = default;

	/**
	 * Select the next guess for an active session
	 */
	virtual Code select_guess(const GameSession& session) = 0;

	/**
	 * Get policy name for logging
	 */
	virtual std::string name() const = 0;
};


/**
 * Random Policy (Baseline)
 *
 * Each position drawn uniformly from the palette.
 */
class RandomPolicy : public IPolicy
{
private:
	std::mt19937 rng;

public:
	RandomPolicy(unsigned int seed = std::random_device{}())
		: rng(seed)
	{
	}

	Code select_guess(const GameSession& session) override
	{
		const auto& config = session.get_config();
		std::uniform_int_distribution<size_t> dist(0, config.palette.size() - 1);

		Code guess;
		guess.reserve(config.length);
		for (int i = 0; i < config.length; i++)
		{
			guess.push_back(config.palette[dist(rng)]);
		}
		return guess;
	}

	std::string name() const override
	{
		return "Random";
	}
};


/**
 * Consistent Policy
 *
 * Picks uniformly among the codes that reproduce every recorded feedback
 * (reservoir sampling over the full code space). Falls back to a random
 * guess when the code space is larger than `max_codes`.
 */
class ConsistentPolicy : public IPolicy
{
private:
	std::mt19937 rng;
	uint64_t max_codes;
	RandomPolicy fallback;

public:
	ConsistentPolicy(unsigned int seed = std::random_device{}(), uint64_t max_codes = 1u << 20)
		: rng(seed), max_codes(max_codes), fallback(seed + 1)
	{
	}

	Code select_guess(const GameSession& session) override
	{
		const auto& config = session.get_config();
		const auto& history = session.get_history();

		if (count_codes(config, max_codes + 1) > max_codes)
		{
			return fallback.select_guess(session);
		}

		Code chosen;
		uint64_t seen = 0;

		for_each_code(config, [&](const Code& candidate) {
			if (!is_consistent(candidate, history))
			{
				return true;
			}

			seen++;
			std::uniform_int_distribution<uint64_t> dist(0, seen - 1);
			if (dist(rng) == 0)
			{
				chosen = candidate;
			}
			return true;
		});

		if (seen == 0)
		{
			// Only reachable if the history was produced by a different secret
			throw std::runtime_error("No code is consistent with the session history");
		}

		return chosen;
	}

	std::string name() const override
	{
		return "Consistent";
	}
};


/**
 * Policy Factory
 *
 * Creates policies from configuration
 */
class PolicyFactory
{
public:
	static std::unique_ptr<IPolicy> create(const std::string& type, int seed = -1)
	{
		if (seed < 0)
		{
			seed = static_cast<int>(std::random_device{}() & 0x7fffffff);
		}

		if (type == "random")
		{
			return std::make_unique<RandomPolicy>(seed);
		}
		else if (type == "consistent")
		{
			return std::make_unique<ConsistentPolicy>(seed);
		}
		else
		{
			throw std::runtime_error("Unknown policy type: " + type);
		}
	}
};


}  // namespace mastermind
