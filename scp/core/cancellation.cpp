#include "cancellation.hpp"

namespace securepath::scp {

cancel_context::cancel_context(clock_type::time_point deadline)
: deadline_(deadline)
{
}

cancel_context::cancel_context(clock_type::duration timeout)
: deadline_(clock_type::now() + timeout)
{
}

void cancel_context::cancel() {
	cancelled_ = true;
}

bool cancel_context::is_cancelled() const {
	if(cancelled_) {
		return true;
	}
	return deadline_ && clock_type::now() >= *deadline_;
}

std::optional<cancel_context::clock_type::duration> cancel_context::remaining() const {
	if(!deadline_) {
		return std::nullopt;
	}
	auto now = clock_type::now();
	return now < *deadline_ ? *deadline_ - now : clock_type::duration{};
}

cancel_context const& cancel_context::never() {
	static cancel_context const ctx;
	return ctx;
}

}
