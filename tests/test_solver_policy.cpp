/**
 * Test solver policies used by self-play
 */

#include "../include/solver_policy.hpp"
#include "../include/mastermind_notation.hpp"
#include <iostream>
#include <cassert>
#include <string>


using namespace mastermind;


void test_random_policy_produces_valid_guesses()
{
	std::cout << "\n[TEST] Random Policy\n";
	std::cout << "====================\n";

	GameConfig config({Color::Cyan, Color::Black}, 5, 10);
	GameSession session(config, 3u);
	RandomPolicy policy(11);

	for (int i = 0; i < 50; i++)
	{
		Code guess = policy.select_guess(session);
		assert(validate_guess(guess, config).valid);
	}
	assert(policy.name() == "Random");

	std::cout << "✓ Random guesses respect length and palette\n";
}


void test_consistent_policy_follows_feedback()
{
	std::cout << "\n[TEST] Consistent Policy\n";
	std::cout << "========================\n";

	GameSession session(
		GameConfig(make_palette(6), 4, 10),
		std::make_unique<SequenceSource>(std::vector<size_t>{0, 1, 2, 3})
	);
	ConsistentPolicy policy(5);

	session.submit_guess(decode_code("RBGY"));

	for (int i = 0; i < 10; i++)
	{
		Code guess = policy.select_guess(session);
		assert(is_consistent(guess, session.get_history()));
		assert(encode_code(guess) != "RBGY");
	}
	std::cout << "✓ Every proposal reproduces the recorded feedback\n";
}


void test_consistent_policy_solves_games()
{
	std::cout << "\n[TEST] Consistent Policy Solves Games\n";
	std::cout << "=====================================\n";

	GameConfig config(make_palette(6), 4, 12);
	ConsistentPolicy policy(2024);

	int won = 0;
	int totalGuesses = 0;
	for (unsigned int game = 0; game < 20; game++)
	{
		GameSession session(config, game + 100);
		while (session.is_active())
		{
			session.submit_guess(policy.select_guess(session));
		}
		if (session.get_state() == SessionState::Won)
		{
			won++;
		}
		totalGuesses += session.attempts_used();
	}

	std::cout << "Won " << won << "/20, avg " << (totalGuesses / 20.0) << " guesses\n";
	// Random consistent play needs about 4.6 guesses on average for 6x4
	assert(won == 20);
	std::cout << "✓ All 6-color, 4-peg games solved within 12 guesses\n";
}


void test_consistent_policy_single_candidate()
{
	std::cout << "\n[TEST] Single Candidate\n";
	std::cout << "=======================\n";

	GameConfig config(make_palette(2), 2, 10);
	GameSession session(config, std::make_unique<SequenceSource>(std::vector<size_t>{1, 0}));
	ConsistentPolicy policy(1);

	// Secret GR; RG scores 0-2, leaving GR as the only consistent code
	session.submit_guess(decode_code("RG"));
	Code guess = policy.select_guess(session);
	assert(encode_code(guess) == "GR");

	std::cout << "✓ Only remaining code selected\n";
}


void test_consistent_policy_large_space_falls_back()
{
	std::cout << "\n[TEST] Large Code Space\n";
	std::cout << "=======================\n";

	GameConfig config(make_palette(10), 8, 10);
	GameSession session(config, 9u);
	ConsistentPolicy policy(3, 1000);

	Code guess = policy.select_guess(session);
	assert(validate_guess(guess, config).valid);

	std::cout << "✓ Falls back to a random valid guess above the size limit\n";
}


void test_policy_factory()
{
	std::cout << "\n[TEST] Policy Factory\n";
	std::cout << "=====================\n";

	assert(PolicyFactory::create("random", 1)->name() == "Random");
	assert(PolicyFactory::create("consistent", 1)->name() == "Consistent");
	assert(PolicyFactory::create("consistent")->name() == "Consistent");

	bool threw = false;
	try
	{
		PolicyFactory::create("knuth", 1);
	}
	catch (const std::runtime_error&)
	{
		threw = true;
	}
	assert(threw);

	std::cout << "✓ Known types created, unknown type rejected\n";
}


int main()
{
	std::cout << "Solver Policy Test Suite\n";
	std::cout << "========================\n";

	try
	{
		test_random_policy_produces_valid_guesses();
		test_consistent_policy_follows_feedback();
		test_consistent_policy_solves_games();
		test_consistent_policy_single_candidate();
		test_consistent_policy_large_space_falls_back();
		test_policy_factory();

		std::cout << "\n" << std::string(70, '=') << "\n";
		std::cout << "✅ ALL TESTS PASSED!\n";
		std::cout << std::string(70, '=') << "\n";

		return 0;
	}
	catch (const std::exception& e)
	{
		std::cerr << "\n❌ TEST FAILED: " << e.what() << std::endl;
		return 1;
	}
}
