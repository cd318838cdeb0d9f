#include "machine.hpp"

#include <iterator>
#include <string>

namespace sigil {

namespace {

constexpr std::uint64_t MAX_CODEPOINT = 0x10ffff;

bool is_codepoint(std::uint64_t value) {
	if (value > MAX_CODEPOINT) return false;
	return value < 0xd800 or value > 0xdfff;
}

template<typename Number>
auto combine(Arith arith, const Number& left, const Number& right)
	-> Outcome<Number> {
	switch (arith) {
		case Arith::ADD: return left.add(right);
		case Arith::SUB: return left.subtract(right);
		case Arith::MUL: return left.multiply(right);
		case Arith::DIV: return left.divide(right);
	}
	std::unreachable();
}

} // namespace

const char* abort_reason_repr(AbortReason reason) {
	switch (reason) {
		case AbortReason::INVALID_JUMP_TARGET: return "invalid jump target";
	}
	std::unreachable();
}

template<typename Number>
auto dispatch(const Instruction& inst, Machine<Number>& machine, Port& port)
	-> PointerUpdate {
	auto& stacks = machine.stacks;
	auto& curses = machine.curses;

	switch (inst.opcode) {
		case OpKind::PUSH: {
			if (inst.span == 0) break;
			auto value = curses.absorb(Number::from_magnitude(inst.magnitude));
			for (std::size_t i = 1; i <= inst.span; i++) stacks.push(i, value);
			break;
		}
		case OpKind::COMBINE: {
			// the result of each step is the left operand of the next one
			for (std::size_t i = 1; i < inst.span; i++) {
				auto left = curses.absorb(stacks.pop(i));
				auto right = curses.absorb(stacks.pop(i + 1));
				auto result = curses.absorb(combine(inst.arith, left, right));
				stacks.push(i + 1, std::move(result));
			}
			break;
		}
		case OpKind::TRANSFER_TO_QUEUE:
			machine.queue.enqueue(curses.absorb(stacks.pop(inst.span)));
			break;
		case OpKind::TRANSFER_FROM_QUEUE:
			stacks.push(inst.span, curses.absorb(machine.queue.dequeue()));
			break;
		case OpKind::DUPLICATE_SPREAD: {
			auto value = curses.absorb(stacks.peek(1));
			for (std::size_t i = 2; i <= inst.span; i++) stacks.push(i, value);
			break;
		}
		case OpKind::JUMP_IF_NONPOSITIVE: {
			// an empty stack reads as sign 0, so the jump is taken
			int sign = curses.absorb(stacks.peek_sign(inst.span));
			if (sign <= 0) return PointerUpdate::jump_to(inst.magnitude);
			break;
		}
		case OpKind::JUMP_ALWAYS: return PointerUpdate::jump_to(inst.magnitude);
		case OpKind::OUTPUT_NUMBER: {
			auto value = curses.absorb(stacks.pop(inst.span));
			port.write_text(value.to_string());
			break;
		}
		case OpKind::OUTPUT_CHAR: {
			auto popped = stacks.pop(inst.span);
			auto codepoint = popped.value.to_u64();
			if (popped.cursed or not codepoint.has_value()
			    or not is_codepoint(*codepoint)) {
				curses.raise();
				break;
			}
			port.write_codepoint((std::uint32_t)*codepoint);
			break;
		}
		case OpKind::INPUT_NUMBER: {
			auto token = port.read_number();
			std::optional<Number> value {};
			if (token.has_value()) value = Number::parse(*token);
			if (not value.has_value()) {
				curses.raise();
				value = Number::zero();
			}
			stacks.push(inst.span, std::move(*value));
			break;
		}
		case OpKind::INPUT_CHAR: {
			auto codepoint = port.read_codepoint();
			if (not codepoint.has_value()) {
				curses.raise();
				stacks.push(inst.span, Number::zero());
				break;
			}
			stacks.push(inst.span, curses.absorb(Number::from_magnitude(*codepoint)));
			break;
		}
		case OpKind::TERMINATE: return PointerUpdate::halt();
	}

	return PointerUpdate::advance();
}

template<typename Number>
bool Interpreter<Number>::step() {
	if (not is_running()) return false;

	// walking off the end is the normal way out
	if (pointer >= program.size()) {
		m_halted = true;
		return false;
	}

	const auto& inst = program.at(pointer);
	if (trace) {
		fprintf(stderr, "[%04zu]", pointer);
		print_inst(stderr, inst);
		fprintf(stderr, "\n");
	}

	auto update = dispatch(inst, machine, port);
	switch (update.kind) {
		case PointerUpdate::Kind::ADVANCE: pointer++; break;
		case PointerUpdate::Kind::JUMP:
			if (update.target > program.size()) {
				m_aborted = Aborted {AbortReason::INVALID_JUMP_TARGET, pointer, update.target};
				return false;
			}
			pointer = (std::size_t)update.target;
			break;
		case PointerUpdate::Kind::HALT: m_halted = true; return false;
	}
	return true;
}

template<typename Number>
RunResult Interpreter<Number>::run() {
	while (step()) {}
	return result();
}

template<typename Number>
RunResult Interpreter<Number>::result() const {
	if (m_aborted.has_value()) return *m_aborted;
	return Completed {machine.curses.count};
}

template<typename Number>
RunResult run_program(const Program& program, Port& port) {
	Interpreter<Number> interpreter {program, port};
	return interpreter.run();
}

template<typename Values>
static void print_values(FILE* fd, const char* name, const Values& values) {
	fprintf(fd, "%s: [", name);
	for (auto it = values.begin(); it != values.end(); it++) {
		fprintf(fd, "%s", it->to_string().c_str());
		if (std::next(it) != values.end()) fprintf(fd, ", ");
	}
	fprintf(fd, "]\n");
}

template<typename Number>
void print_machine(FILE* fd, const Machine<Number>& machine) {
	for (const auto& [index, stack] : machine.stacks.stacks()) {
		auto name = "stack " + std::to_string(index);
		print_values(fd, name.c_str(), stack);
	}
	print_values(fd, "queue", machine.queue.items());
	fprintf(fd, "curses: %llu\n", (unsigned long long)machine.curses.count);
}

template struct Interpreter<BoundedRational>;
template struct Interpreter<BigRational>;

template auto dispatch<BoundedRational>(
	const Instruction&, Machine<BoundedRational>&, Port&
) -> PointerUpdate;
template auto dispatch<BigRational>(
	const Instruction&, Machine<BigRational>&, Port&
) -> PointerUpdate;

template RunResult run_program<BoundedRational>(const Program&, Port&);
template RunResult run_program<BigRational>(const Program&, Port&);

template void print_machine<BoundedRational>(FILE*, const Machine<BoundedRational>&);
template void print_machine<BigRational>(FILE*, const Machine<BigRational>&);

} // namespace sigil
