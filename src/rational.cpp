#include "rational.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace sigil {

/// BOUNDED BACKEND

bool IntegerTraits<std::int64_t>::fits(const Wide& w) {
	return w >= std::numeric_limits<std::int64_t>::min()
	   and w <= std::numeric_limits<std::int64_t>::max();
}

std::int64_t IntegerTraits<std::int64_t>::narrow(const Wide& w) {
	return static_cast<std::int64_t>(w);
}

auto IntegerTraits<std::int64_t>::gcd(Wide a, Wide b) -> Wide {
	if (a < 0) a = -a;
	if (b < 0) b = -b;
	while (b != 0) {
		Wide t = a % b;
		a = b;
		b = t;
	}
	return a;
}

auto IntegerTraits<std::int64_t>::parse(std::string_view digits)
	-> std::optional<Wide> {
	constexpr Wide max = static_cast<Wide>(~static_cast<unsigned __int128>(0) >> 1);
	Wide value = 0;
	for (char c : digits) {
		Wide digit = c - '0';
		if (digit < 0 or digit > 9) return {};
		if (value > (max - digit) / 10) return {};
		value = value * 10 + digit;
	}
	return value;
}

auto IntegerTraits<std::int64_t>::from_u64(std::uint64_t value)
	-> std::optional<std::int64_t> {
	if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
		return {};
	return static_cast<std::int64_t>(value);
}

auto IntegerTraits<std::int64_t>::to_u64(const std::int64_t& value)
	-> std::optional<std::uint64_t> {
	if (value < 0) return {};
	return static_cast<std::uint64_t>(value);
}

std::string IntegerTraits<std::int64_t>::to_string(const std::int64_t& value) {
	return std::to_string(value);
}

/// ARBITRARY-PRECISION BACKEND

auto IntegerTraits<mpz_class>::gcd(const Wide& a, const Wide& b) -> Wide {
	mpz_class g;
	mpz_gcd(g.get_mpz_t(), a.get_mpz_t(), b.get_mpz_t());
	return g;
}

auto IntegerTraits<mpz_class>::parse(std::string_view digits)
	-> std::optional<mpz_class> {
	mpz_class value;
	if (value.set_str(std::string(digits), 10) != 0) return {};
	return value;
}

auto IntegerTraits<mpz_class>::from_u64(std::uint64_t value)
	-> std::optional<mpz_class> {
	static_assert(sizeof(unsigned long) >= sizeof(std::uint64_t));
	return mpz_class(static_cast<unsigned long>(value));
}

auto IntegerTraits<mpz_class>::to_u64(const mpz_class& value)
	-> std::optional<std::uint64_t> {
	if (sgn(value) < 0 or not value.fits_ulong_p()) return {};
	return static_cast<std::uint64_t>(value.get_ui());
}

std::string IntegerTraits<mpz_class>::to_string(const mpz_class& value) {
	return value.get_str(10);
}

/// RATIONAL

template<typename Int>
auto BasicRational<Int>::make(Wide num, Wide den) -> Outcome<BasicRational> {
	if (den < 0) {
		num = -num;
		den = -den;
	}
	// gcd(0, den) == den, which turns 0/den into 0/1
	Wide g = Traits::gcd(num, den);
	num /= g;
	den /= g;
	if (not Traits::fits(num) or not Traits::fits(den)) return overflow();
	return {BasicRational {Traits::narrow(num), Traits::narrow(den)}, false};
}

template<typename Int>
BasicRational<Int> BasicRational<Int>::from_integer(Int value) {
	return BasicRational {std::move(value), Int {1}};
}

template<typename Int>
auto BasicRational<Int>::from_magnitude(std::uint64_t magnitude)
	-> Outcome<BasicRational> {
	auto value = Traits::from_u64(magnitude);
	if (not value.has_value()) return overflow();
	return {from_integer(std::move(*value)), false};
}

static bool all_digits(std::string_view text) {
	return not text.empty() and std::ranges::all_of(text, [](char c) {
		return std::isdigit(static_cast<unsigned char>(c)) != 0;
	});
}

template<typename Int>
auto BasicRational<Int>::parse(std::string_view text)
	-> std::optional<BasicRational> {
	bool negative = false;
	if (not text.empty() and (text[0] == '-' or text[0] == '+')) {
		negative = text[0] == '-';
		text.remove_prefix(1);
	}

	std::string num_text {};
	std::string den_text {"1"};

	if (auto slash = text.find('/'); slash != std::string_view::npos) {
		auto num_part = text.substr(0, slash);
		auto den_part = text.substr(slash + 1);
		if (not all_digits(num_part) or not all_digits(den_part)) return {};
		num_text = num_part;
		den_text = den_part;
	} else if (auto dot = text.find('.'); dot != std::string_view::npos) {
		auto int_part = text.substr(0, dot);
		auto frac_part = text.substr(dot + 1);
		if (not all_digits(int_part) or not all_digits(frac_part)) return {};
		num_text = std::string(int_part) + std::string(frac_part);
		den_text += std::string(frac_part.size(), '0');
	} else {
		if (not all_digits(text)) return {};
		num_text = text;
	}

	auto num = Traits::parse(num_text);
	auto den = Traits::parse(den_text);
	if (not num.has_value() or not den.has_value()) return {};
	if (*den == 0) return {};

	if (negative) *num = -*num;
	auto made = make(std::move(*num), std::move(*den));
	if (made.cursed) return {};
	return made.value;
}

template<typename Int>
auto BasicRational<Int>::add(const BasicRational& other) const
	-> Outcome<BasicRational> {
	Wide num = Wide(m_num) * Wide(other.m_den);
	num += Wide(other.m_num) * Wide(m_den);
	Wide den = Wide(m_den) * Wide(other.m_den);
	return make(num, den);
}

template<typename Int>
auto BasicRational<Int>::subtract(const BasicRational& other) const
	-> Outcome<BasicRational> {
	Wide num = Wide(m_num) * Wide(other.m_den);
	num -= Wide(other.m_num) * Wide(m_den);
	Wide den = Wide(m_den) * Wide(other.m_den);
	return make(num, den);
}

template<typename Int>
auto BasicRational<Int>::multiply(const BasicRational& other) const
	-> Outcome<BasicRational> {
	Wide num = Wide(m_num) * Wide(other.m_num);
	Wide den = Wide(m_den) * Wide(other.m_den);
	return make(num, den);
}

template<typename Int>
auto BasicRational<Int>::divide(const BasicRational& other) const
	-> Outcome<BasicRational> {
	if (other.sign() == 0) return {zero(), true};
	Wide num = Wide(m_num) * Wide(other.m_den);
	Wide den = Wide(m_den) * Wide(other.m_num);
	return make(num, den);
}

template<typename Int>
auto BasicRational<Int>::negate() const -> Outcome<BasicRational> {
	Wide num = -Wide(m_num);
	return make(num, Wide(m_den));
}

template<typename Int>
int BasicRational<Int>::sign() const {
	if (m_num < 0) return -1;
	if (m_num > 0) return 1;
	return 0;
}

template<typename Int>
auto BasicRational<Int>::to_integer() const -> std::optional<Int> {
	if (not is_integer()) return {};
	return m_num;
}

template<typename Int>
auto BasicRational<Int>::to_u64() const -> std::optional<std::uint64_t> {
	if (not is_integer()) return {};
	return Traits::to_u64(m_num);
}

template<typename Int>
std::string BasicRational<Int>::to_string() const {
	if (is_integer()) return Traits::to_string(m_num);
	return Traits::to_string(m_num) + "/" + Traits::to_string(m_den);
}

// denominators are positive, so cross-multiplying preserves the order
template<typename Int>
int BasicRational<Int>::compare(const BasicRational& a, const BasicRational& b) {
	Wide lhs = Wide(a.m_num) * Wide(b.m_den);
	Wide rhs = Wide(b.m_num) * Wide(a.m_den);
	if (lhs < rhs) return -1;
	if (rhs < lhs) return 1;
	return 0;
}

template class BasicRational<std::int64_t>;
template class BasicRational<mpz_class>;

} // namespace sigil
