/**
 * Test suite for SecretGenerator and random sources
 */

#include "../include/secret_generator.hpp"
#include "../include/mastermind_rules.hpp"
#include "../include/mastermind_notation.hpp"
#include <iostream>
#include <cassert>
#include <string>
#include <set>


using namespace mastermind;


// === Test Helpers ===

void test_assert(bool condition, const std::string& testName)
{
	if (!condition)
	{
		std::cerr << "❌ FAILED: " << testName << std::endl;
		std::exit(1);
	}
	std::cout << "✓ " << testName << std::endl;
}


// === Random Sources ===

void test_sequence_source()
{
	SequenceSource source({3, 1, 7});

	test_assert(source.next_index(10) == 3, "First scripted value");
	test_assert(source.next_index(10) == 1, "Second scripted value");
	test_assert(source.next_index(4) == 3, "Value reduced modulo bound (7 % 4)");
	test_assert(source.next_index(10) == 3, "Sequence wraps around");

	bool threw = false;
	try
	{
		SequenceSource empty({});
	}
	catch (const std::invalid_argument&)
	{
		threw = true;
	}
	test_assert(threw, "Empty sequence rejected");
}


void test_mt19937_source_bounds()
{
	Mt19937Source source(12345);
	bool inRange = true;
	for (int i = 0; i < 1000; i++)
	{
		if (source.next_index(6) >= 6) inRange = false;
	}
	test_assert(inRange, "Mt19937Source stays below bound");

	bool threw = false;
	try
	{
		source.next_index(0);
	}
	catch (const std::invalid_argument&)
	{
		threw = true;
	}
	test_assert(threw, "Zero bound rejected");
}


// === Generation ===

void test_generate_scripted()
{
	SequenceSource source({0, 1, 2, 3});
	SecretGenerator generator(source);

	Code secret = generator.generate(make_palette(6), 4);
	test_assert(encode_code(secret) == "RGBY", "Scripted indices produce RGBY");

	// Palette order decides which color an index selects
	SequenceSource source2({0, 0, 1});
	SecretGenerator generator2(source2);
	Code reordered = generator2.generate({Color::Purple, Color::Orange}, 3);
	test_assert(encode_code(reordered) == "PPO", "Indices select from the given palette order");
}


void test_generate_seeded_is_reproducible()
{
	Mt19937Source a(42);
	Mt19937Source b(42);
	SecretGenerator genA(a);
	SecretGenerator genB(b);

	bool same = true;
	for (int i = 0; i < 20; i++)
	{
		if (genA.generate(make_palette(6), 4) != genB.generate(make_palette(6), 4))
		{
			same = false;
		}
	}
	test_assert(same, "Same seed yields the same secret sequence");
}


void test_generate_length_and_palette()
{
	Mt19937Source source(7);
	SecretGenerator generator(source);
	std::vector<Color> palette = {Color::Cyan, Color::White, Color::Black};

	bool ok = true;
	std::set<Color> seen;
	for (int i = 0; i < 200; i++)
	{
		Code secret = generator.generate(palette, 5);
		if (secret.size() != 5) ok = false;
		for (Color c : secret)
		{
			if (!in_palette(c, palette)) ok = false;
			seen.insert(c);
		}
	}
	test_assert(ok, "Secrets have the requested length and palette colors");
	test_assert(seen.size() == 3, "Every palette color eventually drawn");

	SequenceSource repeat({2});
	SecretGenerator repeatGenerator(repeat);
	test_assert(encode_code(repeatGenerator.generate(make_palette(6), 4)) == "BBBB",
	            "Colors may repeat with replacement sampling");
}


void test_generate_unique()
{
	Mt19937Source source(99);
	SecretGenerator generator(source);

	bool distinct = true;
	for (int i = 0; i < 200; i++)
	{
		Code secret = generator.generate_unique(make_palette(6), 4);
		if (secret.size() != 4 || has_repeats(secret)) distinct = false;
	}
	test_assert(distinct, "generate_unique never repeats a color");

	// Fisher-Yates with scripted offsets: swap(0,2) → BGRY..., swap(1,1), swap(2,2)
	SequenceSource scripted({2, 0, 0});
	SecretGenerator scriptedGenerator(scripted);
	test_assert(encode_code(scriptedGenerator.generate_unique(make_palette(4), 3)) == "BGR",
	            "Scripted partial shuffle");

	Code full = generator.generate_unique(make_palette(4), 4);
	test_assert(std::set<Color>(full.begin(), full.end()).size() == 4, "Length equal to palette size is a permutation");

	GameConfig noRepeats(make_palette(6), 4, 10, false);
	test_assert(!has_repeats(generator.generate(noRepeats)), "Config without repeats routes to generate_unique");
}


void test_invalid_configuration()
{
	Mt19937Source source(1);
	SecretGenerator generator(source);

	bool emptyThrew = false;
	try
	{
		generator.generate({}, 4);
	}
	catch (const InvalidConfiguration&)
	{
		emptyThrew = true;
	}
	test_assert(emptyThrew, "Empty palette throws InvalidConfiguration");

	bool lengthThrew = false;
	try
	{
		generator.generate(make_palette(6), 0);
	}
	catch (const InvalidConfiguration&)
	{
		lengthThrew = true;
	}
	test_assert(lengthThrew, "Length 0 throws InvalidConfiguration");

	bool uniqueThrew = false;
	try
	{
		generator.generate_unique(make_palette(3), 4);
	}
	catch (const InvalidConfiguration&)
	{
		uniqueThrew = true;
	}
	test_assert(uniqueThrew, "Too many distinct colors throws InvalidConfiguration");
}


int main()
{
	std::cout << "\n=== SecretGenerator Test Suite ===\n" << std::endl;

	std::cout << "--- Random Sources ---" << std::endl;
	test_sequence_source();
	test_mt19937_source_bounds();

	std::cout << "\n--- Generation ---" << std::endl;
	test_generate_scripted();
	test_generate_seeded_is_reproducible();
	test_generate_length_and_palette();
	test_generate_unique();

	std::cout << "\n--- Errors ---" << std::endl;
	test_invalid_configuration();

	std::cout << "\n=== All Tests Passed! ===\n" << std::endl;

	return 0;
}
