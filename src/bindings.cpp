/**
 * Python Bindings for the MasterMind Game Engine
 *
 * Uses pybind11 to expose GameSession and the rule helpers to Python,
 * so scripted front-ends can drive the engine without reimplementing it.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "../include/game_session.hpp"
#include "../include/mastermind_notation.hpp"
#include "../include/game_recorder.hpp"

namespace py = pybind11;
using namespace mastermind;


/**
 * Python module: mastermind_engine
 */
PYBIND11_MODULE(mastermind_engine, m)
{
	m.doc() = "MasterMind game engine - C++ implementation with Python bindings";


	// === Exceptions ===

	auto base_error = py::register_exception<MastermindError>(m, "MastermindError", PyExc_RuntimeError);
	py::register_exception<InvalidConfiguration>(m, "InvalidConfiguration", base_error.ptr());
	py::register_exception<InvalidGuess>(m, "InvalidGuess", base_error.ptr());
	py::register_exception<SessionTerminated>(m, "SessionTerminated", base_error.ptr());
	py::register_exception<HintAlreadyUsed>(m, "HintAlreadyUsed", base_error.ptr());


	// === Enums ===

	py::enum_<Color>(m, "Color")
		.value("RED", Color::Red)
		.value("GREEN", Color::Green)
		.value("BLUE", Color::Blue)
		.value("YELLOW", Color::Yellow)
		.value("ORANGE", Color::Orange)
		.value("PURPLE", Color::Purple)
		.value("CYAN", Color::Cyan)
		.value("MAGENTA", Color::Magenta)
		.value("WHITE", Color::White)
		.value("BLACK", Color::Black)
		.export_values();

	py::enum_<SessionState>(m, "SessionState")
		.value("IN_PROGRESS", SessionState::InProgress)
		.value("WON", SessionState::Won)
		.value("LOST", SessionState::Lost)
		.value("ABANDONED", SessionState::Abandoned)
		.export_values();


	// === Structs ===

	py::class_<Feedback>(m, "Feedback")
		.def(py::init<>())
		.def(py::init<int, int>())
		.def_readonly("exact", &Feedback::exact)
		.def_readonly("partial", &Feedback::partial)
		.def("__repr__", [](const Feedback& f) {
			return "Feedback(exact=" + std::to_string(f.exact) +
			       ", partial=" + std::to_string(f.partial) + ")";
		})
		.def("__eq__", &Feedback::operator==)
		.def("__ne__", &Feedback::operator!=);

	py::class_<Attempt>(m, "Attempt")
		.def_readonly("turn_index", &Attempt::turn_index)
		.def_readonly("guess", &Attempt::guess)
		.def_readonly("feedback", &Attempt::feedback)
		.def("__repr__", [](const Attempt& a) {
			return "Attempt(" + std::to_string(a.turn_index) + ", " +
			       encode_code(a.guess) + ", " + encode_feedback(a.feedback) + ")";
		});

	py::class_<Hint>(m, "Hint")
		.def_readonly("position", &Hint::position)
		.def_readonly("color", &Hint::color)
		.def("__repr__", [](const Hint& h) {
			return "Hint(position=" + std::to_string(h.position) +
			       ", color=" + color_name(h.color) + ")";
		});

	py::class_<GameConfig>(m, "GameConfig")
		.def(py::init<>())
		.def(py::init<const std::vector<Color>&, int, int, bool>(),
		     py::arg("palette"), py::arg("length") = 4,
		     py::arg("max_attempts") = 10, py::arg("allow_repeats") = true)
		.def_readwrite("palette", &GameConfig::palette)
		.def_readwrite("length", &GameConfig::length)
		.def_readwrite("max_attempts", &GameConfig::max_attempts)
		.def_readwrite("allow_repeats", &GameConfig::allow_repeats);

	py::class_<GuessOutcome>(m, "GuessOutcome")
		.def_readonly("feedback", &GuessOutcome::feedback)
		.def_readonly("state", &GuessOutcome::state)
		.def_readonly("secret", &GuessOutcome::secret);

	py::class_<GuessValidation>(m, "GuessValidation")
		.def_readonly("valid", &GuessValidation::valid)
		.def_readonly("reason", &GuessValidation::reason);


	// === Main GameSession Class ===

	py::class_<GameSession>(m, "GameSession")
		.def(py::init([](const GameConfig& config, std::optional<unsigned int> seed) {
			std::unique_ptr<RandomSource> source;
			if (seed.has_value())
			{
				source = std::make_unique<Mt19937Source>(*seed);
			}
			return std::make_unique<GameSession>(config, std::move(source));
		}), py::arg("config") = GameConfig{}, py::arg("seed") = py::none())

		// Replays `indices` as the random source, so a host can fix the secret
		.def_static("with_sequence", [](const GameConfig& config, const std::vector<size_t>& indices) {
			return std::make_unique<GameSession>(config, std::make_unique<SequenceSource>(indices));
		}, py::arg("config"), py::arg("indices"))

		// Queries
		.def("get_state", &GameSession::get_state, "Get session state")
		.def("is_active", &GameSession::is_active, "Check if session accepts moves")
		.def("get_config", &GameSession::get_config, "Get configuration")
		.def("get_history", &GameSession::get_history, "Get attempt history")
		.def("get_last_attempt", &GameSession::get_last_attempt, "Get last attempt")
		.def("attempts_used", &GameSession::attempts_used, "Number of scored guesses")
		.def("remaining_attempts", &GameSession::remaining_attempts, "Attempts left")
		.def("hint_used", &GameSession::hint_used, "Check if the hint was used")
		.def("get_hint", &GameSession::get_hint, "Get revealed hint")
		.def("get_secret", &GameSession::get_secret, "Get secret (None while in progress)")

		// Actions
		.def("submit_guess", &GameSession::submit_guess, "Score a guess", py::arg("guess"))
		.def("submit", [](GameSession& session, const std::string& text) {
			return session.submit_guess(decode_code(text));
		}, "Score a guess written in letter notation", py::arg("text"))
		.def("request_hint", &GameSession::request_hint, "Reveal one secret position")
		.def("abandon", &GameSession::abandon, "Give up and reveal the secret");


	// === Utility Functions ===

	m.def("score_guess", &score_guess, "Score a guess against a secret",
	      py::arg("secret"), py::arg("guess"));

	m.def("validate_guess", &validate_guess, "Check guess length and palette",
	      py::arg("guess"), py::arg("config"));

	m.def("is_consistent", &is_consistent, "Check candidate against past attempts",
	      py::arg("candidate"), py::arg("attempts"));

	m.def("make_palette", &make_palette, "First N colors", py::arg("size"));

	m.def("encode_code", &encode_code, "Code to letters", py::arg("code"));

	m.def("decode_code", &decode_code, "Letters to code", py::arg("text"));

	m.def("session_to_mmn", [](const GameSession& session) {
		return GameRecorder::to_mmn(GameRecorder::record_session(session));
	}, "Export a finished session to MMN text", py::arg("session"));


	// === Module Metadata ===

	m.attr("__version__") = "1.0.0";
}
