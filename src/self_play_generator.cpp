/**
 * Self-Play Game Generator
 *
 * Plays MasterMind sessions with an automatic guessing policy and
 * records the finished games.
 *
 * Usage:
 *   ./self_play_generator --num-games 1000 --policy consistent
 *   ./self_play_generator --colors 8 --length 5 --num-threads 4 --seed 7
 */

#include "../include/game_session.hpp"
#include "../include/mastermind_notation.hpp"
#include "../include/solver_policy.hpp"
#include "../include/game_recorder.hpp"
#include <iostream>
#include <string>
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <thread>
#include <mutex>
#include <atomic>
#include <algorithm>


using namespace mastermind;
namespace fs = std::filesystem;


/**
 * Self-Play Configuration
 */
struct SelfPlayConfig
{
	// Game settings
	int num_colors{6};
	int length{4};
	int max_attempts{10};
	bool allow_repeats{true};

	// Policy settings
	std::string policy{"consistent"};

	// Generation settings
	int num_games{100};
	int num_threads{1};
	int random_seed{-1};

	// Output settings
	std::string output_dir{"./selfplay_data"};
	bool save_records{true};

	// Logging
	int log_interval{10};
};


/**
 * Self-Play Generator
 */
class SelfPlayGenerator
{
private:
	SelfPlayConfig config;
	GameConfig game_config;
	std::atomic<int> games_completed{0};
	std::atomic<int> games_won{0};
	std::atomic<int> total_guesses{0};
	std::atomic<int> next_game_id{0};
	std::mutex output_mutex;  // Protect console output and win histogram
	std::vector<int> turns_histogram;  // wins per number of guesses
	std::chrono::steady_clock::time_point start_time;

public:
	SelfPlayGenerator(const SelfPlayConfig& cfg)
		: config(cfg)
		, game_config(make_palette(cfg.num_colors), cfg.length, cfg.max_attempts, cfg.allow_repeats)
		, turns_histogram(cfg.max_attempts + 1, 0)
	{
		GuessValidation check = validate_config(game_config);
		if (!check.valid)
		{
			throw InvalidConfiguration(check.reason);
		}

		if (config.save_records)
		{
			fs::create_directories(config.output_dir);
		}
	}

	/**
	 * Generate specified number of games
	 */
	void generate()
	{
		std::cout << "=== MasterMind Self-Play Generator ===" << std::endl;
		std::cout << "Palette: " << encode_code(game_config.palette)
		          << (game_config.allow_repeats ? "" : " (no repeats)") << std::endl;
		std::cout << "Code length: " << game_config.length << std::endl;
		std::cout << "Max attempts: " << game_config.max_attempts << std::endl;
		std::cout << "Games: " << config.num_games << std::endl;
		std::cout << "Policy: " << config.policy << std::endl;
		if (config.num_threads > 1)
		{
			std::cout << "Threads: " << config.num_threads << std::endl;
		}
		if (config.save_records)
		{
			std::cout << "Output: " << config.output_dir << std::endl;
		}
		std::cout << std::endl;

		start_time = std::chrono::steady_clock::now();

		if (config.num_threads > 1)
		{
			generate_parallel();
		}
		else
		{
			generate_single();
		}

		log_final_stats();
	}

private:
	/**
	 * Seed for one game's secret, mixed with the game id
	 */
	unsigned int game_seed(int game_id) const
	{
		uint64_t base_seed = (config.random_seed >= 0)
			? static_cast<uint64_t>(config.random_seed)
			: static_cast<uint64_t>(std::random_device{}());

		uint64_t seed = base_seed ^ (static_cast<uint64_t>(game_id) * 0x9E3779B97F4A7C15ULL);
		return static_cast<unsigned int>(seed ^ (seed >> 32));
	}

	void generate_single()
	{
		auto policy = PolicyFactory::create(config.policy, config.random_seed);

		for (int i = 0; i < config.num_games; i++)
		{
			generate_one_game(i, policy.get());

			if ((i + 1) % config.log_interval == 0)
			{
				log_progress();
			}
		}
	}

	/**
	 * One session at a time per worker
	 */
	void generate_parallel()
	{
		std::vector<std::thread> threads;

		for (int worker_id = 0; worker_id < config.num_threads; worker_id++)
		{
			threads.emplace_back([this, worker_id]() {
				worker_thread(worker_id);
			});
		}

		for (auto& t : threads)
		{
			t.join();
		}
	}

	void worker_thread(int worker_id)
	{
		// Offset in unsigned arithmetic, folded back to a non-negative int
		int base_seed = config.random_seed >= 0
		                ? static_cast<int>((static_cast<unsigned int>(config.random_seed)
		                                    + static_cast<unsigned int>(worker_id) * 10000u) & 0x7FFFFFFFu)
		                : -1;

		std::unique_ptr<IPolicy> policy;

		try
		{
			policy = PolicyFactory::create(config.policy, base_seed);
		}
		catch (const std::exception& e)
		{
			std::lock_guard<std::mutex> lock(output_mutex);
			std::cerr << "Error: worker " << worker_id << " initialization failed: " << e.what() << std::endl;
			return;
		}

		while (true)
		{
			int game_id = next_game_id.fetch_add(1);
			if (game_id >= config.num_games)
			{
				break;
			}

			generate_one_game(game_id, policy.get(), worker_id);

			int completed = games_completed.load();
			if (completed % config.log_interval == 0 && completed > 0)
			{
				std::lock_guard<std::mutex> lock(output_mutex);
				log_progress();
			}
		}
	}

	/**
	 * Play one session to the end
	 */
	void generate_one_game(int game_id, IPolicy* policy, int worker_id = -1)
	{
		GameSession session(game_config, game_seed(game_id));

		std::ostringstream line;
		if (worker_id >= 0)
		{
			line << "[Worker " << worker_id << "][Game " << game_id << "] ";
		}
		else
		{
			line << "[Game " << game_id << "] ";
		}

		bool had_error = false;

		while (session.is_active())
		{
			Code guess;

			try
			{
				guess = policy->select_guess(session);
				GuessOutcome outcome = session.submit_guess(guess);
				line << encode_code(guess) << ":" << encode_feedback(outcome.feedback) << " ";
			}
			catch (const std::exception& e)
			{
				std::lock_guard<std::mutex> lock(output_mutex);
				std::cerr << "\nWarning: Policy failed in game " << game_id
				          << " at move " << session.attempts_used()
				          << " (guess: " << encode_code(guess) << "): " << e.what() << std::endl;
				had_error = true;
				break;
			}
		}

		if (had_error)
		{
			session.abandon();
		}

		int guesses = session.attempts_used();
		line << "; " << state_to_string(session.get_state()) << " in " << guesses
		     << ", secret " << encode_code(*session.get_secret());

		{
			std::lock_guard<std::mutex> lock(output_mutex);
			std::cout << line.str() << std::endl;
			if (session.get_state() == SessionState::Won)
			{
				turns_histogram[guesses]++;
			}
		}

		if (config.save_records)
		{
			SessionRecord record = GameRecorder::record_session(session);
			if (GameRecorder::save_mmn(record, config.output_dir).empty())
			{
				std::lock_guard<std::mutex> lock(output_mutex);
				std::cerr << "Warning: could not write record for game " << game_id << std::endl;
			}
		}

		if (session.get_state() == SessionState::Won)
		{
			games_won++;
		}
		games_completed++;
		total_guesses += guesses;
	}

	void log_progress()
	{
		auto now = std::chrono::steady_clock::now();
		auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
			now - start_time
		).count();

		int completed = games_completed.load();
		int guesses = total_guesses.load();
		float games_per_sec = completed / (float)std::max<long long>(elapsed, 1LL);
		float avg_guesses = guesses / (float)std::max(completed, 1);

		std::cout << "Progress: " << completed << "/" << config.num_games
		          << " games (" << (completed * 100 / config.num_games) << "%)"
		          << " | " << games_per_sec << " games/sec"
		          << " | avg " << avg_guesses << " guesses/game"
		          << std::endl;
	}

	void log_final_stats()
	{
		auto end_time = std::chrono::steady_clock::now();
		auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
			end_time - start_time
		).count();

		int completed = games_completed.load();
		int won = games_won.load();
		int guesses = total_guesses.load();

		std::cout << "\n=== Generation Complete ===" << std::endl;
		std::cout << "Total games: " << completed << std::endl;
		std::cout << "Won: " << won << " ("
		          << std::fixed << std::setprecision(1)
		          << (100.0f * won / std::max(completed, 1)) << "%)" << std::endl;
		std::cout << "Average guesses per game: " << (guesses / (float)std::max(completed, 1)) << std::endl;
		std::cout << "Wins by guess count:";
		for (size_t turns = 1; turns < turns_histogram.size(); turns++)
		{
			if (turns_histogram[turns] > 0)
			{
				std::cout << " " << turns << ":" << turns_histogram[turns];
			}
		}
		std::cout << std::endl;
		std::cout << "Time elapsed: " << elapsed << " seconds" << std::endl;
		if (config.save_records)
		{
			std::cout << "Output directory: " << config.output_dir << std::endl;
		}
	}
};


/**
 * Parse command line arguments
 */
SelfPlayConfig parse_args(int argc, char* argv[])
{
	SelfPlayConfig config;

	for (int i = 1; i < argc; i++)
	{
		std::string arg = argv[i];

		if (arg == "--num-games" && i + 1 < argc)
		{
			config.num_games = std::stoi(argv[++i]);
		}
		else if (arg == "--colors" && i + 1 < argc)
		{
			config.num_colors = std::stoi(argv[++i]);
		}
		else if (arg == "--length" && i + 1 < argc)
		{
			config.length = std::stoi(argv[++i]);
		}
		else if (arg == "--max-attempts" && i + 1 < argc)
		{
			config.max_attempts = std::stoi(argv[++i]);
		}
		else if (arg == "--no-repeats")
		{
			config.allow_repeats = false;
		}
		else if (arg == "--policy" && i + 1 < argc)
		{
			config.policy = argv[++i];
		}
		else if (arg == "--seed" && i + 1 < argc)
		{
			config.random_seed = std::stoi(argv[++i]);
		}
		else if (arg == "--num-threads" && i + 1 < argc)
		{
			config.num_threads = std::stoi(argv[++i]);
		}
		else if (arg == "--output" && i + 1 < argc)
		{
			config.output_dir = argv[++i];
		}
		else if (arg == "--no-save")
		{
			config.save_records = false;
		}
		else if (arg == "--log-interval" && i + 1 < argc)
		{
			config.log_interval = std::stoi(argv[++i]);
		}
		else if (arg == "--help" || arg == "-h")
		{
			std::cout << "Usage: self_play_generator [options]\n";
			std::cout << "Options:\n";
			std::cout << "  --num-games N          Number of games to play (default: 100)\n";
			std::cout << "  --colors N             Palette size, 1-10 (default: 6)\n";
			std::cout << "  --length L             Code length (default: 4)\n";
			std::cout << "  --max-attempts M       Attempts per game (default: 10)\n";
			std::cout << "  --no-repeats           Secrets never repeat a color\n";
			std::cout << "  --policy P             Guessing policy (random/consistent, default: consistent)\n";
			std::cout << "  --seed N               Random seed (default: random)\n";
			std::cout << "  --num-threads N        Worker threads (default: 1)\n";
			std::cout << "  --output DIR           Output directory (default: ./selfplay_data)\n";
			std::cout << "  --no-save              Do not write game records\n";
			std::cout << "  --log-interval N       Progress line every N games (default: 10)\n";
			std::cout << "  --help                 Show this help message\n";
			std::exit(0);
		}
		else
		{
			std::cerr << "Error: Unknown or incomplete option: " << arg << std::endl;
			std::exit(1);
		}
	}

	if (config.num_games < 1 || config.num_threads < 1 || config.log_interval < 1)
	{
		std::cerr << "Error: --num-games, --num-threads and --log-interval must be positive" << std::endl;
		std::exit(1);
	}

	return config;
}


int main(int argc, char* argv[])
{
	try
	{
		SelfPlayConfig config = parse_args(argc, argv);

		SelfPlayGenerator generator(config);

		generator.generate();

		return 0;
	}
	catch (const std::exception& e)
	{
		std::cerr << "Error: " << e.what() << std::endl;
		return 1;
	}
}
