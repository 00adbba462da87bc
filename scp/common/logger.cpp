#include "logger.hpp"

#include <utility>
#include <stdio.h>

namespace securepath::scp {

std::string_view to_string(logger::type t) {
	switch(t) {
		case logger::error:         return "error";
		case logger::info:          return "info";
		case logger::debug:         return "debug";
		case logger::debug_verbose: return "verbose";
		case logger::debug_trace:   return "trace";
		default: return "log";
	}
}

logger::type log_level_for_verbosity(unsigned verbosity) {
	switch(verbosity) {
		case 0:  return logger::type(logger::error | logger::info);
		case 1:  return logger::type(logger::error | logger::info | logger::debug);
		default: return logger::log_all;
	}
}

void stderr_logger::do_log_line(logger::type t, std::string const& s, std::source_location&&) {
	std::fprintf(stderr, "[%.*s] %s\n", int(to_string(t).size()), to_string(t).data(), s.c_str());
}

transfer_logger::transfer_logger(logger& l, std::string tag)
: log_(l)
, tag_(std::move(tag))
{}

void transfer_logger::do_log_line(logger::type t, std::string const& s, std::source_location&& loc) {
	log_.log_line(t, tag_ + s, std::move(loc));
}

}
