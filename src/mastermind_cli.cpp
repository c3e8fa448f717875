/**
 * MasterMind Terminal Front-End
 *
 * Thin driver over GameSession: reads commands line by line, forwards them
 * to the engine and prints what comes back.
 *
 * Usage:
 *   ./mastermind_cli
 *   ./mastermind_cli --colors 8 --length 5 --max-attempts 12 --record ./games
 */

#include "../include/game_session.hpp"
#include "../include/mastermind_notation.hpp"
#include "../include/game_recorder.hpp"
#include <iostream>
#include <string>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <cctype>


using namespace mastermind;
namespace fs = std::filesystem;


/**
 * CLI Configuration
 */
struct CliConfig
{
	int num_colors{6};
	int length{4};
	int max_attempts{10};
	bool allow_repeats{true};
	int random_seed{-1};
	std::string record_dir{""};  // empty = do not record
};


/**
 * Render a code as letters with color names, e.g. "RGBY (Red Green Blue Yellow)"
 */
std::string describe_code(const Code& code)
{
	std::ostringstream oss;
	oss << encode_code(code) << " (";
	for (size_t i = 0; i < code.size(); i++)
	{
		if (i > 0) oss << ' ';
		oss << color_name(code[i]);
	}
	oss << ")";
	return oss.str();
}


class MastermindCli
{
private:
	CliConfig config;
	GameConfig game_config;
	std::unique_ptr<GameSession> session;
	int games_played{0};
	bool recorded{false};

public:
	MastermindCli(const CliConfig& cfg)
		: config(cfg)
		, game_config(make_palette(cfg.num_colors), cfg.length, cfg.max_attempts, cfg.allow_repeats)
	{
		if (!config.record_dir.empty())
		{
			fs::create_directories(config.record_dir);
		}
	}

	int run()
	{
		print_banner();
		new_game();

		std::string line;
		while (prompt() && std::getline(std::cin, line))
		{
			if (!handle(line))
			{
				break;
			}
		}

		record_if_finished();
		std::cout << "Bye." << std::endl;
		return 0;
	}

private:
	bool prompt() const
	{
		if (session->is_active())
		{
			std::cout << "[" << (session->attempts_used() + 1) << "/"
			          << game_config.max_attempts << "] > " << std::flush;
		}
		else
		{
			std::cout << "[new/quit] > " << std::flush;
		}
		return true;
	}

	void print_banner() const
	{
		std::cout << "=== MasterMind ===" << std::endl;
		std::cout << "Palette:";
		for (Color c : game_config.palette)
		{
			std::cout << " " << color_to_char(c) << "=" << color_name(c);
		}
		std::cout << std::endl;
		std::cout << "Type a code of " << game_config.length << " letters, or 'help'." << std::endl;
	}

	void print_help() const
	{
		std::cout << "Commands:\n";
		std::cout << "  <code>    Submit a guess, e.g. " << encode_code(Code(game_config.palette.begin(),
		          game_config.palette.begin() + std::min<size_t>(game_config.length, game_config.palette.size())))
		          << "\n";
		std::cout << "  hint      Reveal one position (once per game)\n";
		std::cout << "  history   Show previous guesses\n";
		std::cout << "  giveup    Abandon and reveal the secret\n";
		std::cout << "  new       Start a new game\n";
		std::cout << "  quit      Exit\n";
	}

	void new_game()
	{
		record_if_finished();

		std::unique_ptr<RandomSource> source;
		if (config.random_seed >= 0)
		{
			unsigned int seed = static_cast<unsigned int>(config.random_seed) + static_cast<unsigned int>(games_played);
			source = std::make_unique<Mt19937Source>(seed);
		}

		session = std::make_unique<GameSession>(game_config, std::move(source));
		games_played++;
		recorded = false;

		std::cout << "New game #" << games_played << ": guess the " << game_config.length
		          << "-color code in " << game_config.max_attempts << " attempts." << std::endl;
	}

	void record_if_finished()
	{
		if (config.record_dir.empty() || !session || session->is_active() || recorded)
		{
			return;
		}

		SessionRecord record = GameRecorder::record_session(*session);
		std::string path = GameRecorder::save_mmn(record, config.record_dir);
		if (path.empty())
		{
			std::cerr << "Warning: could not write game record to " << config.record_dir << std::endl;
		}
		else
		{
			std::cout << "Game saved to " << path << std::endl;
		}
		recorded = true;
	}

	/**
	 * @return false when the user asked to quit
	 */
	bool handle(const std::string& raw)
	{
		std::string command = raw;
		command.erase(0, command.find_first_not_of(" \t"));
		command.erase(command.find_last_not_of(" \t\r") + 1);
		std::string lower = command;
		std::transform(lower.begin(), lower.end(), lower.begin(),
		               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

		if (lower.empty())
		{
			return true;
		}

		try
		{
			if (lower == "quit" || lower == "exit")
			{
				return false;
			}
			else if (lower == "help")
			{
				print_help();
			}
			else if (lower == "new")
			{
				new_game();
			}
			else if (lower == "history")
			{
				print_history();
			}
			else if (lower == "hint")
			{
				Hint hint = session->request_hint();
				std::cout << "Hint: position " << (hint.position + 1) << " is "
				          << color_name(hint.color) << " (" << color_to_char(hint.color) << ")" << std::endl;
			}
			else if (lower == "giveup")
			{
				Code secret = session->abandon();
				std::cout << "You gave up. The code was " << describe_code(secret) << std::endl;
				record_if_finished();
			}
			else
			{
				submit(command);
			}
		}
		catch (const InvalidGuess& e)
		{
			std::cout << "Invalid guess: " << e.what() << std::endl;
		}
		catch (const SessionTerminated&)
		{
			std::cout << "This game is over. Type 'new' to play again." << std::endl;
		}
		catch (const HintAlreadyUsed&)
		{
			std::cout << "You already used your hint this game." << std::endl;
		}
		catch (const std::invalid_argument& e)
		{
			std::cout << e.what() << ". Type 'help' for commands." << std::endl;
		}

		return true;
	}

	void submit(const std::string& text)
	{
		Code guess = decode_code(text);
		GuessOutcome outcome = session->submit_guess(guess);

		std::cout << "  " << encode_code(guess) << "  exact: " << outcome.feedback.exact
		          << "  partial: " << outcome.feedback.partial << std::endl;

		if (outcome.state == SessionState::Won)
		{
			std::cout << "You found the code in " << session->attempts_used() << " attempt(s)!" << std::endl;
			record_if_finished();
		}
		else if (outcome.state == SessionState::Lost)
		{
			std::cout << "Out of attempts. The code was " << describe_code(*outcome.secret) << std::endl;
			record_if_finished();
		}
	}

	void print_history() const
	{
		const auto& history = session->get_history();
		if (history.empty())
		{
			std::cout << "No guesses yet." << std::endl;
			return;
		}

		for (const auto& attempt : history)
		{
			std::cout << "  " << (attempt.turn_index + 1) << ". " << encode_code(attempt.guess)
			          << "  " << encode_feedback(attempt.feedback) << std::endl;
		}
		std::cout << "Remaining attempts: " << session->remaining_attempts()
		          << (session->hint_used() ? " (hint used)" : "") << std::endl;
	}
};


/**
 * Parse command line arguments
 */
CliConfig parse_args(int argc, char* argv[])
{
	CliConfig config;

	for (int i = 1; i < argc; i++)
	{
		std::string arg = argv[i];

		if (arg == "--colors" && i + 1 < argc)
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
		else if (arg == "--seed" && i + 1 < argc)
		{
			config.random_seed = std::stoi(argv[++i]);
		}
		else if (arg == "--record" && i + 1 < argc)
		{
			config.record_dir = argv[++i];
		}
		else if (arg == "--help" || arg == "-h")
		{
			std::cout << "Usage: mastermind_cli [options]\n";
			std::cout << "Options:\n";
			std::cout << "  --colors N         Palette size, 1-10 (default: 6)\n";
			std::cout << "  --length L         Code length (default: 4)\n";
			std::cout << "  --max-attempts M   Attempts per game (default: 10)\n";
			std::cout << "  --no-repeats       Secrets never repeat a color\n";
			std::cout << "  --seed N           Random seed (default: random)\n";
			std::cout << "  --record DIR       Save finished games to DIR\n";
			std::cout << "  --help             Show this help message\n";
			std::exit(0);
		}
		else
		{
			std::cerr << "Error: Unknown or incomplete option: " << arg << std::endl;
			std::exit(1);
		}
	}

	return config;
}


int main(int argc, char* argv[])
{
	try
	{
		CliConfig config = parse_args(argc, argv);

		MastermindCli cli(config);

		return cli.run();
	}
	catch (const std::exception& e)
	{
		std::cerr << "Error: " << e.what() << std::endl;
		return 1;
	}
}
