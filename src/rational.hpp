// Exact rational numbers

#ifndef SIGIL_RATIONAL_HPP
#define SIGIL_RATIONAL_HPP

#include <gmpxx.h>

#include <concepts>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "outcome.hpp"

namespace sigil {

// Per-backend integer operations. `Wide` must hold any product or sum of two
// `Int` values without overflowing.
template<typename Int>
struct IntegerTraits;

template<>
struct IntegerTraits<std::int64_t> {
	using Wide = __int128;

	static bool fits(const Wide& w);
	static std::int64_t narrow(const Wide& w);
	static Wide gcd(Wide a, Wide b);
	// digits are read wide, so a value is only rejected after reduction
	static auto parse(std::string_view digits) -> std::optional<Wide>;
	static auto from_u64(std::uint64_t value) -> std::optional<std::int64_t>;
	static auto to_u64(const std::int64_t& value) -> std::optional<std::uint64_t>;
	static std::string to_string(const std::int64_t& value);
};

template<>
struct IntegerTraits<mpz_class> {
	using Wide = mpz_class;

	static bool fits(const Wide&) { return true; }
	static mpz_class narrow(const Wide& w) { return w; }
	static Wide gcd(const Wide& a, const Wide& b);
	static auto parse(std::string_view digits) -> std::optional<Wide>;
	static auto from_u64(std::uint64_t value) -> std::optional<mpz_class>;
	static auto to_u64(const mpz_class& value) -> std::optional<std::uint64_t>;
	static std::string to_string(const mpz_class& value);
};

// Signed rational kept in lowest terms with a positive denominator.
// Operations that cannot produce a value (division by zero, overflow of a
// bounded backend) return the policy value 0/1 and set `cursed`.
template<typename Int>
class BasicRational {
 public:
	using Traits = IntegerTraits<Int>;
	using Wide = typename Traits::Wide;

	BasicRational() : m_num {0}, m_den {1} {}

	static BasicRational zero() { return BasicRational {}; }
	static BasicRational from_integer(Int value);
	static auto from_magnitude(std::uint64_t magnitude) -> Outcome<BasicRational>;

	// Accepts `[+-]D`, `[+-]D/D` and `[+-]D.D`
	static auto parse(std::string_view text) -> std::optional<BasicRational>;

	auto add(const BasicRational& other) const -> Outcome<BasicRational>;
	auto subtract(const BasicRational& other) const -> Outcome<BasicRational>;
	auto multiply(const BasicRational& other) const -> Outcome<BasicRational>;
	auto divide(const BasicRational& other) const -> Outcome<BasicRational>;
	auto negate() const -> Outcome<BasicRational>;

	int sign() const;
	bool is_integer() const { return m_den == 1; }
	auto to_integer() const -> std::optional<Int>;
	auto to_u64() const -> std::optional<std::uint64_t>;
	std::string to_string() const;

	const Int& numerator() const { return m_num; }
	const Int& denominator() const { return m_den; }

	static int compare(const BasicRational& a, const BasicRational& b);

 private:
	BasicRational(Int num, Int den) : m_num {std::move(num)}, m_den {std::move(den)} {}

	// normalizes sign, reduces and narrows; `den` must not be zero
	static auto make(Wide num, Wide den) -> Outcome<BasicRational>;
	static auto overflow() -> Outcome<BasicRational> { return {zero(), true}; }

	Int m_num;
	Int m_den;
};

template<typename Int>
bool operator==(const BasicRational<Int>& a, const BasicRational<Int>& b) {
	return BasicRational<Int>::compare(a, b) == 0;
}

template<typename Int>
bool operator!=(const BasicRational<Int>& a, const BasicRational<Int>& b) {
	return BasicRational<Int>::compare(a, b) != 0;
}

template<typename Int>
bool operator<(const BasicRational<Int>& a, const BasicRational<Int>& b) {
	return BasicRational<Int>::compare(a, b) < 0;
}

template<typename Int>
std::ostream& operator<<(std::ostream& st, const BasicRational<Int>& value) {
	return st << value.to_string();
}

extern template class BasicRational<std::int64_t>;
extern template class BasicRational<mpz_class>;

using BoundedRational = BasicRational<std::int64_t>;
using BigRational = BasicRational<mpz_class>;

template<class Number>
concept rational_number = requires(
	const Number a, const Number b, std::string_view text, std::uint64_t magnitude
) {
	// clang-format off
	{ Number::zero() } -> std::same_as<Number>;
	{ Number::from_magnitude(magnitude) } -> std::same_as<Outcome<Number>>;
	{ Number::parse(text) } -> std::same_as<std::optional<Number>>;
	{ a.add(b) } -> std::same_as<Outcome<Number>>;
	{ a.subtract(b) } -> std::same_as<Outcome<Number>>;
	{ a.multiply(b) } -> std::same_as<Outcome<Number>>;
	{ a.divide(b) } -> std::same_as<Outcome<Number>>;
	{ a.negate() } -> std::same_as<Outcome<Number>>;
	{ a.sign() } -> std::same_as<int>;
	{ a.to_u64() } -> std::same_as<std::optional<std::uint64_t>>;
	{ a.to_string() } -> std::same_as<std::string>;
	{ a == b } -> std::same_as<bool>;
	// clang-format on
};

static_assert(rational_number<BoundedRational>);
static_assert(rational_number<BigRational>);

} // namespace sigil

#endif
