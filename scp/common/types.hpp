#ifndef SP_SCP_TYPES_HEADER
#define SP_SCP_TYPES_HEADER

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace securepath::scp {

using byte_vector = std::vector<std::byte>;
using span = std::span<std::byte>;
using const_span = std::span<std::byte const>;

// seconds since the Unix epoch, zero means not set
using unix_time = std::int64_t;

inline std::string_view to_string_view(const_span s) {
	return std::string_view((char const*)s.data(), s.size());
}

inline const_span to_span(std::string_view v) {
	return const_span((std::byte const*)v.data(), v.size());
}

inline span to_span(std::string& v) {
	return span((std::byte*)v.data(), v.size());
}

#if !defined(SPSCP_ASSERT) && !defined(NDEBUG)
#	define SPSCP_ASSERT(cond, message) assert((cond) && (message))
#elif !defined(SPSCP_ASSERT)
#	define SPSCP_ASSERT(cond, message)
#endif

}

#endif
