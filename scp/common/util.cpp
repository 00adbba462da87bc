#include "util.hpp"

#include <iomanip>
#include <ostream>
#include <sstream>

namespace securepath::scp {

std::string remove_newlines(std::string_view s) {
	std::string res;
	res.reserve(s.size());
	for(auto c : s) {
		if(c != '\n') {
			res += c;
		}
	}
	return res;
}

std::vector<std::string_view> split_fields(std::string_view view, char separator) {
	std::vector<std::string_view> out;
	std::string_view::size_type start = 0, end = 0;

	while(end != std::string_view::npos) {
		end = view.find(separator, start);
		if(end == std::string_view::npos) {
			out.emplace_back(view.substr(start));
		} else {
			out.emplace_back(view.substr(start, end-start));
		}
		start = end + 1;
	}

	return out;
}

std::string shell_quote(std::string_view s) {
	std::string res = "'";
	for(auto c : s) {
		if(c == '\'') {
			// close quote, escaped quote, open again
			res += "'\\''";
		} else {
			res += c;
		}
	}
	res += "'";
	return res;
}

std::string printable(std::string_view s) {
	std::ostringstream out;
	for(unsigned char c : s) {
		if(c == '\n') {
			out << "\\n";
		} else if(c < 0x20 || c == 0x7f) {
			out << "\\x" << std::hex << std::setw(2) << std::setfill('0') << int(c) << std::dec;
		} else {
			out << c;
		}
	}
	return out.str();
}

}
