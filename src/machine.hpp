// Stack machine: state, dispatcher and run loop

#ifndef MACHINE_HPP
#define MACHINE_HPP

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <utility>
#include <variant>

#include "instruction.hpp"
#include "outcome.hpp"
#include "port.hpp"
#include "rational.hpp"
#include "stack_bank.hpp"

namespace sigil {

// Counts recoverable faults. Never decremented.
struct CurseCounter {
	std::uint64_t count {0};

	void raise() { count++; }

	template<typename T>
	T absorb(Outcome<T> outcome) {
		if (outcome.cursed) raise();
		return std::move(outcome.value);
	}
};

// Everything a single run mutates besides the instruction pointer
template<typename Number>
struct Machine {
	StackBank<Number> stacks {};
	ValueQueue<Number> queue {};
	CurseCounter curses {};
};

struct PointerUpdate {
	enum class Kind {
		ADVANCE,
		JUMP,
		HALT,
	};

	Kind kind;
	std::uint64_t target {0};

	static PointerUpdate advance() { return {Kind::ADVANCE, 0}; }
	static PointerUpdate jump_to(std::uint64_t target) { return {Kind::JUMP, target}; }
	static PointerUpdate halt() { return {Kind::HALT, 0}; }
};

struct Completed {
	std::uint64_t curses;
};

enum class AbortReason {
	INVALID_JUMP_TARGET,
};

struct Aborted {
	AbortReason reason;
	std::size_t index;     // the jump instruction
	std::uint64_t target;  // the rejected target
};

using RunResult = std::variant<Completed, Aborted>;

const char* abort_reason_repr(AbortReason reason);

// Executes one instruction. Faults are counted in machine.curses and never
// stop execution; the returned update is not validated here.
template<typename Number>
auto dispatch(const Instruction& inst, Machine<Number>& machine, Port& port)
	-> PointerUpdate;

template<typename Number>
struct Interpreter {
	Interpreter(const Program& program, Port& port)
	: program {program}, port {port} {}

	const Program& program;
	Port& port;

	Machine<Number> machine {};
	std::size_t pointer {0};

	// write every executed instruction to stderr
	bool trace {false};

	// fetch, dispatch and apply one pointer update. false once the run ended
	bool step();
	RunResult run();

	bool is_running() const { return not m_halted and not m_aborted.has_value(); }
	RunResult result() const;

 private:
	bool m_halted {false};
	std::optional<Aborted> m_aborted {};
};

// runs program to the end on a fresh machine
template<typename Number>
RunResult run_program(const Program& program, Port& port);

template<typename Number>
void print_machine(FILE*, const Machine<Number>&);

extern template struct Interpreter<BoundedRational>;
extern template struct Interpreter<BigRational>;

} // namespace sigil

#endif
