#ifndef SP_SCP_CANCELLATION_HEADER
#define SP_SCP_CANCELLATION_HEADER

#include <atomic>
#include <chrono>
#include <optional>

namespace securepath::scp {

/** \brief Cancellation signal observed by every blocking stream operation
 *
 *  Can be cancelled explicitly (also from other thread) or by passing the deadline.
 *  Once cancelled it stays cancelled.
 */
class cancel_context {
public:
	using clock_type = std::chrono::steady_clock;

	cancel_context() = default;
	explicit cancel_context(clock_type::time_point deadline);
	explicit cancel_context(clock_type::duration timeout);

	cancel_context(cancel_context const&) = delete;
	cancel_context& operator=(cancel_context const&) = delete;

	void cancel();

	bool is_cancelled() const;

	bool has_deadline() const { return deadline_.has_value(); }

	/// time left until deadline, zero when passed, nullopt if no deadline
	std::optional<clock_type::duration> remaining() const;

	/// context that is never cancelled
	static cancel_context const& never();

private:
	std::atomic<bool> cancelled_{};
	std::optional<clock_type::time_point> deadline_;
};

}

#endif
