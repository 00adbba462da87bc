#ifndef SP_SCP_UTIL_HEADER
#define SP_SCP_UTIL_HEADER

#include "types.hpp"

#include <charconv>
#include <optional>
#include <string_view>
#include <vector>

namespace securepath::scp {

/// removes every '\n' from the string
std::string remove_newlines(std::string_view);

/// splits on single spaces, consecutive separators produce empty fields
std::vector<std::string_view> split_fields(std::string_view, char separator = ' ');

/// the whole string must be a decimal integer, no sign, no surrounding whitespace
template<typename Int>
std::optional<Int> parse_decimal(std::string_view s) {
	Int v{};
	if(s.empty() || s.front() == '-') {
		return std::nullopt;
	}
	auto [ptr, ec] = std::from_chars(s.data(), s.data()+s.size(), v);
	if(ec != std::errc{} || ptr != s.data()+s.size()) {
		return std::nullopt;
	}
	return v;
}

/// quotes argument for POSIX shell using single quotes
std::string shell_quote(std::string_view);

/// printable form of the text for log lines, control characters are escaped
std::string printable(std::string_view);

}

#endif
