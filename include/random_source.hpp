/**
 * Random Sources
 *
 * The engine never reads process-global random state. Every consumer of
 * entropy (secret generation, hint position choice) receives a RandomSource,
 * so tests can replace it with a fixed seed or a scripted sequence.
 */

#pragma once

#include <vector>
#include <random>
#include <memory>
#include <cstddef>
#include <stdexcept>


namespace mastermind
{


class RandomSource
{
public:
	virtual ~RandomSource() = default;

	/**
	 * Draw a uniformly distributed index in [0, bound)
	 *
	 * @param bound Exclusive upper bound, must be > 0
	 */
	virtual size_t next_index(size_t bound) = 0;
};


/**
 * Mersenne Twister backed source
 */
class Mt19937Source : public RandomSource
{
private:
	std::mt19937 rng;

public:
	Mt19937Source() : rng(std::random_device{}()) {}

	explicit Mt19937Source(unsigned int seed) : rng(seed) {}

	size_t next_index(size_t bound) override
	{
		if (bound == 0)
		{
			throw std::invalid_argument("next_index bound must be positive");
		}
		std::uniform_int_distribution<size_t> dist(0, bound - 1);
		return dist(rng);
	}
};


/**
 * Replays a fixed list of indices, wrapping around at the end
 *
 * Each value is reduced modulo the requested bound.
 */
class SequenceSource : public RandomSource
{
private:
	std::vector<size_t> values;
	size_t cursor;

public:
	explicit SequenceSource(const std::vector<size_t>& indices)
		: values(indices), cursor(0)
	{
		if (values.empty())
		{
			throw std::invalid_argument("SequenceSource needs at least one value");
		}
	}

	size_t next_index(size_t bound) override
	{
		if (bound == 0)
		{
			throw std::invalid_argument("next_index bound must be positive");
		}
		size_t value = values[cursor];
		cursor = (cursor + 1) % values.size();
		return value % bound;
	}
};


}  // namespace mastermind
