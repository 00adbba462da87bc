#include "command_parser.hpp"

#include <fstream>
#include <iomanip>

namespace securepath {

struct bool_command : command_base {
	bool_command(bool& v)
	: value_(v)
	{}

	void parse(std::vector<std::string> const&) override {
		value_ = true;
	}
	void print(std::ostream& o) const override {
		o << (value_ ? "true" : "false");
	}

	bool& value_;
};

void command_parser::parse(int argc, char* args[]) {
	std::string s;
	for(int i = 1; i != argc; ++i) {
		if(i > 1) {
			s += " ";
		}
		std::string arg = args[i];
		if(arg.find_first_of(" \"") != std::string::npos) {
			std::ostringstream quoted;
			quoted << std::quoted(arg);
			arg = quoted.str();
		}
		s += arg;
	}
	parse(s);
}

void command_parser::parse(std::string s) {
	std::istringstream in(s);
	parse(in);
}

std::string command_parser::parse_name(std::istream& in) {
	std::string s;
	in >> s;
	return s;
}

std::string command_parser::parse_quoted(std::istream& in) {
	std::string s;
	if(!(in >> std::quoted(s))) {
		throw invalid_argument("unterminated quote");
	}
	return s;
}

std::string command_parser::parse_arg(std::istream& in) {
	std::string s;
	if(in.peek() == '"') {
		s = parse_quoted(in);
	} else {
		in >> s;
	}
	return s;
}

void command_parser::parse_args(std::istream& in, std::string const& name) {
	auto it = commands_.find(name);
	if(it == commands_.end()) {
		throw invalid_argument("no parameter named '" + name + "'");
	}

	std::vector<std::string> args;
	// flags take no value, so whatever follows is positional
	bool const is_flag = dynamic_cast<bool_command*>(it->second->extract.get()) != nullptr;
	if(!is_flag) {
		for(;in >> std::ws && in.peek() != '-';) {
			std::string a = parse_arg(in);
			if(!a.empty())  {
				args.push_back(std::move(a));
			}
		}
	}

	it->second->extract->parse(args);
}

void command_parser::parse(std::istream& in) {
	for(; in >> std::ws; ) {
		char c = in.peek();
		if(c == '-') {
			parse_args(in, parse_name(in));
		} else {
			positionals_.push_back(parse_arg(in));
		}
	}
}

namespace {

struct print_align {
	print_align(std::ostream& out)
	: out_(out)
	{}

	~print_align () {
		out_ << temp_out_.str();
	}

	template<typename T>
	print_align& operator<<(T const& v) {
		temp_out_ << v;
		return *this;
	}

	print_align& align(std::size_t s) {
		std::string str = temp_out_.str().substr(0, s);
		out_ << str << std::string(s-str.size(), ' ');
		temp_out_.clear();
		temp_out_.str("");
		return *this;
	}

	std::ostringstream temp_out_;
	std::ostream& out_;
};

}

void command_parser::print_help(std::ostream& out) {
	for(auto&& v : commands_) {
		if(v.first.substr(0, 2) == "--") {
			auto const& info = *v.second;
			std::string alias;
			if(!info.alias.empty()) {
				alias = ", -" + info.alias;
			}

			(print_align(out) << "--" << info.name << alias).align(40) << " " << info.info;

			if(show_value_in_help_) {
				std::ostringstream extract_out;
				info.extract->print(extract_out);
				std::string eout = extract_out.str();

				if(!eout.empty()) {
					out << " (" + eout + ")";
				}
			}
			out << std::endl;
		}
	}
}

void command_parser::parse_file(std::string file_name) {
	std::ifstream is(file_name);
	if(!is) {
		throw invalid_argument("cannot open config file '" + file_name + "'");
	}
	std::string line;
	while(std::getline(is, line)) {
		auto p = line.find_first_not_of(" \t");
		if(p == std::string::npos || line[p] == '#') {
			continue;
		}
		parse(line);
	}
}

void command_parser::add(bool& var, std::string name, std::string alias, std::string info) {
	add_impl<bool_command>(var, std::move(name), std::move(alias), std::move(info));
}

}
