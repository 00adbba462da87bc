#include "progress_stream.hpp"

namespace securepath::scp {

progress_in_stream::progress_in_stream(in_stream& next, progress_observer observer)
: next_(next)
, observer_(std::move(observer))
{
}

io_result progress_in_stream::read(span s, cancel_context const& c) {
	auto res = next_.read(s, c);
	if(res.ok() && res.size) {
		total_ += res.size;
		if(observer_) {
			observer_(total_, res.size);
		}
	}
	return res;
}

progress_out_stream::progress_out_stream(out_stream& next, progress_observer observer)
: next_(next)
, observer_(std::move(observer))
{
}

io_result progress_out_stream::write(const_span s, cancel_context const& c) {
	auto res = next_.write(s, c);
	if(res.ok() && res.size) {
		total_ += res.size;
		if(observer_) {
			observer_(total_, res.size);
		}
	}
	return res;
}

}
