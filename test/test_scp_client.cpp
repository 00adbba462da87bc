#include "log.hpp"
#include "test_streams.hpp"
#include "scp/client/scp_client.hpp"
#include "scp/core/progress_stream.hpp"
#include <catch2/catch.hpp>

#include <map>
#include <set>

namespace securepath::scp::test {

namespace {

/// remote replies are scripted in `remote`, everything the client sends lands in `sent`
struct client_context {
	client_context(std::string script, scp_config config = {})
	: log(test_log(), "[client] ")
	, remote(std::move(script))
	, client(remote, sent, log, std::move(config))
	{}

	transfer_logger log;
	string_in_stream remote;
	string_out_stream sent;
	scp_client client;
};

struct memory_sink : download_sink {
	out_stream* open_file(file_infos const& f, scp_error& error) override {
		opened.push_back(f);
		if(refuse.contains(f.filename)) {
			error = scp_error{scp_error_code::local_io_error, "refused"};
			return nullptr;
		}
		auto& s = files[f.filename];
		s.fail_at = write_fail_at;
		return &s;
	}

	scp_error close_file(file_infos const& f, scp_error const& result) override {
		closed.emplace_back(f, result);
		if(fail_close.contains(f.filename)) {
			return scp_error{scp_error_code::local_io_error, "unable to set times"};
		}
		return scp_error{};
	}

	std::string content(std::string const& name) const {
		auto it = files.find(name);
		return it != files.end() ? it->second.data : std::string{};
	}

	std::map<std::string, string_out_stream> files;
	std::vector<file_infos> opened;
	std::vector<std::pair<file_infos, scp_error>> closed;
	std::set<std::string> refuse;
	std::set<std::string> fail_close;
	std::size_t write_fail_at{std::size_t(-1)};
};

// real scp -t announces readiness before the first directive
scp_config ready_sink(scp_config c = {}) {
	c.expect_ready_byte = true;
	return c;
}

file_infos regular_file(std::string name, std::uint64_t size, std::string perms = "0644") {
	return file_infos{.filename = std::move(name), .permissions = std::move(perms), .size = size};
}

}

TEST_CASE("upload empty file", "[client]") {
	client_context ctx("\0\0\0"_bin, ready_sink());
	string_in_stream content;

	auto err = ctx.client.upload_file(regular_file("test.txt", 0), content, cancel_context::never());
	CHECK(!err);
	CHECK(ctx.sent.data == "C0644 0 test.txt\n\0"_bin);
	CHECK(ctx.remote.remaining().empty());
	CHECK(content.reads == 0);
	CHECK(ctx.client.state() == client_state::ready);
}

TEST_CASE("upload empty file without ready byte", "[client]") {
	client_context ctx("\0\0"_bin);
	string_in_stream content;

	auto err = ctx.client.upload_file(regular_file("test.txt", 0), content, cancel_context::never());
	CHECK(!err);
	CHECK(ctx.sent.data == "C0644 0 test.txt\n\0"_bin);
	CHECK(ctx.remote.remaining().empty());
	CHECK(ctx.client.state() == client_state::ready);
}

TEST_CASE("upload files with progress", "[client]") {
	client_context ctx("\0\0\0\0\0"_bin, ready_sink(scp_config{.buffer_size = 3}));
	string_in_stream first("hello");
	string_in_stream second("0123456789");

	std::vector<std::uint64_t> totals;
	progress_out_stream payload(ctx.sent, [&](std::uint64_t total, std::size_t) { totals.push_back(total); });

	REQUIRE(!ctx.client.upload_file(regular_file("a.txt", 5), first, cancel_context::never(), &payload));
	REQUIRE(!ctx.client.upload_file(regular_file("b.bin", 10, "0600"), second, cancel_context::never(), &payload));

	CHECK(ctx.sent.data == "C0644 5 a.txt\nhello\0C0600 10 b.bin\n0123456789\0"_bin);
	// only payload goes through the proxy
	CHECK(payload.total() == 15);
	CHECK(totals == std::vector<std::uint64_t>{3, 5, 8, 11, 14, 15});
}

TEST_CASE("upload stops at announced size", "[client]") {
	client_context ctx("\0\0\0"_bin, ready_sink());
	string_in_stream content("hello world");

	REQUIRE(!ctx.client.upload_file(regular_file("a", 5), content, cancel_context::never()));
	CHECK(ctx.sent.data == "C0644 5 a\nhello\0"_bin);
	CHECK(content.remaining() == " world");
}

TEST_CASE("upload preserving times", "[client]") {
	client_context ctx("\0\0\0\0"_bin, ready_sink(scp_config{.preserve_times = true}));
	string_in_stream content("x");
	auto f = regular_file("t", 1);
	f.access_time = 1610000000;
	f.modify_time = 1609999000;

	REQUIRE(!ctx.client.upload_file(f, content, cancel_context::never()));
	CHECK(ctx.sent.data == "T1610000000 0 1609999000 0\nC0644 1 t\nx\0"_bin);
}

TEST_CASE("upload remote error after payload", "[client]") {
	client_context ctx("\0\0\x02no space left\n"_bin, ready_sink());
	string_in_stream content("abc");

	auto err = ctx.client.upload_file(regular_file("big", 3), content, cancel_context::never());
	CHECK(err == scp_error_code::remote_error);
	CHECK(err.message() == "no space left");
	CHECK(err.is_session_fatal());
	CHECK(ctx.client.state() == client_state::closed);
	CHECK(ctx.sent.data == "C0644 3 big\nabc\0"_bin);

	// nothing more goes to the remote
	string_in_stream more("z");
	CHECK(ctx.client.upload_file(regular_file("next", 1), more, cancel_context::never()) == scp_error_code::session_closed);
	CHECK(ctx.client.enter_directory(file_infos{.filename = "d", .permissions = "0755"}, cancel_context::never()) == scp_error_code::session_closed);
	CHECK(ctx.sent.data == "C0644 3 big\nabc\0"_bin);
}

TEST_CASE("upload remote rejects directive", "[client]") {
	SECTION("error") {
		client_context ctx("\0\x02permission denied\n"_bin, ready_sink());
		string_in_stream content("abc");
		auto err = ctx.client.upload_file(regular_file("f", 3), content, cancel_context::never());
		CHECK(err == scp_error_code::remote_error);
		// payload is not sent
		CHECK(ctx.sent.data == "C0644 3 f\n");
		CHECK(content.reads == 0);
		CHECK(ctx.client.state() == client_state::closed);
	}
	SECTION("warning keeps session") {
		client_context ctx("\0\x01scp: f: Permission denied\n\0\0"_bin, ready_sink());
		string_in_stream content("abc");
		auto err = ctx.client.upload_file(regular_file("f", 3), content, cancel_context::never());
		CHECK(err == scp_error_code::remote_warning);
		CHECK(!err.is_session_fatal());
		CHECK(ctx.client.state() == client_state::ready);

		string_in_stream other("xy");
		REQUIRE(!ctx.client.upload_file(regular_file("g", 2), other, cancel_context::never()));
		CHECK(ctx.sent.data == "C0644 3 f\nC0644 2 g\nxy\0"_bin);
	}
	SECTION("remote not ready") {
		client_context ctx("\x01scp: /nope: No such file or directory\n"_bin, ready_sink());
		string_in_stream content("abc");
		CHECK(ctx.client.upload_file(regular_file("f", 3), content, cancel_context::never()) == scp_error_code::remote_warning);
		CHECK(ctx.sent.data.empty());
	}
}

TEST_CASE("upload protocol violations", "[client]") {
	SECTION("directive as reply") {
		client_context ctx("\0C0644 1 x\n"_bin, ready_sink());
		string_in_stream content("a");
		CHECK(ctx.client.upload_file(regular_file("f", 1), content, cancel_context::never()) == scp_error_code::protocol_violation);
		CHECK(ctx.client.state() == client_state::closed);
	}
	SECTION("unknown status") {
		client_context ctx("\0?"_bin, ready_sink());
		string_in_stream content("a");
		CHECK(ctx.client.upload_file(regular_file("f", 1), content, cancel_context::never()) == scp_error_code::protocol_violation);
	}
	SECTION("remote goes away") {
		client_context ctx("\0"_bin, ready_sink());
		string_in_stream content("a");
		CHECK(ctx.client.upload_file(regular_file("f", 1), content, cancel_context::never()) == scp_error_code::transport_error);
		CHECK(ctx.client.state() == client_state::closed);
		CHECK(to_string(ctx.client.state()) == "closed");
	}
}

TEST_CASE("upload local read failure", "[client]") {
	SECTION("short file") {
		client_context ctx("\0\0\0\0\0\0"_bin, ready_sink());
		string_in_stream content("hel");
		auto err = ctx.client.upload_file(regular_file("a", 5), content, cancel_context::never());
		CHECK(err == scp_error_code::local_io_error);
		CHECK(err.message() == "file is shorter than announced size");
		// remote still gets the announced amount and a warning instead of end of payload
		CHECK(ctx.sent.data == "C0644 5 a\nhel\0\0\x01" "file is shorter than announced size\n"_bin);
		CHECK(ctx.client.state() == client_state::ready);

		string_in_stream next("b");
		CHECK(!ctx.client.upload_file(regular_file("b", 1), next, cancel_context::never()));
	}
	SECTION("read error") {
		client_context ctx("\0\0\0"_bin, ready_sink(scp_config{.buffer_size = 2}));
		string_in_stream content("abcdef");
		content.fail_at = 2;
		auto err = ctx.client.upload_file(regular_file("a", 6), content, cancel_context::never());
		CHECK(err == scp_error_code::local_io_error);
		CHECK(err.message() == "read failure");
		CHECK(ctx.sent.data == "C0644 6 a\nab\0\0\0\0\x01read failure\n"_bin);
	}
}

TEST_CASE("upload transport failure", "[client]") {
	client_context ctx("\0\0\0"_bin, ready_sink());
	ctx.sent.fail_at = 12;
	string_in_stream content("hello");
	auto err = ctx.client.upload_file(regular_file("a", 5), content, cancel_context::never());
	CHECK(err == scp_error_code::transport_error);
	CHECK(ctx.client.state() == client_state::closed);
	CHECK(ctx.sent.data == "C0644 5 a\nhe");
}

TEST_CASE("upload invalid arguments", "[client]") {
	client_context ctx("\0\0\0"_bin, ready_sink());
	string_in_stream content("x");
	CHECK(ctx.client.upload_file(regular_file("a/b", 1), content, cancel_context::never()) == scp_error_code::invalid_argument);
	CHECK(ctx.client.upload_file(regular_file("a\nb", 1), content, cancel_context::never()) == scp_error_code::invalid_argument);
	CHECK(ctx.client.upload_file(regular_file("a", 1, "rw"), content, cancel_context::never()) == scp_error_code::invalid_argument);
	CHECK(ctx.client.exit_directory(cancel_context::never()) == scp_error_code::invalid_argument);
	CHECK(ctx.sent.data.empty());
	CHECK(ctx.client.state() == client_state::ready);
}

TEST_CASE("upload cancelled", "[client]") {
	client_context ctx("\0\0\0"_bin, ready_sink());
	string_in_stream content("hello");
	cancel_context c;
	c.cancel();
	CHECK(ctx.client.upload_file(regular_file("a", 5), content, c) == scp_error_code::cancelled);
	CHECK(ctx.client.state() == client_state::closed);
	CHECK(ctx.sent.data.empty());
}

TEST_CASE("upload cancelled during payload", "[client]") {
	client_context ctx("\0\0\0"_bin, ready_sink(scp_config{.buffer_size = 2}));
	string_in_stream content("hello");
	cancel_context c;
	content.on_read = [&](std::size_t pos) { if(pos == 2) c.cancel(); };
	CHECK(ctx.client.upload_file(regular_file("a", 5), content, c) == scp_error_code::cancelled);
	CHECK(ctx.client.state() == client_state::closed);
	CHECK(ctx.sent.data == "C0644 5 a\n");
}

TEST_CASE("upload directory", "[client]") {
	client_context ctx("\0\0\0\0\0\0\0\0\0"_bin, ready_sink());
	string_in_stream f1("1");
	string_in_stream f2("22");

	REQUIRE(!ctx.client.enter_directory(file_infos{.filename = "dir", .permissions = "0755"}, cancel_context::never()));
	CHECK(ctx.client.directory_depth() == 1);
	REQUIRE(!ctx.client.upload_file(regular_file("one", 1), f1, cancel_context::never()));
	REQUIRE(!ctx.client.enter_directory(file_infos{.filename = "sub", .permissions = "0700"}, cancel_context::never()));
	REQUIRE(!ctx.client.upload_file(regular_file("two", 2), f2, cancel_context::never()));
	REQUIRE(!ctx.client.exit_directory(cancel_context::never()));
	REQUIRE(!ctx.client.exit_directory(cancel_context::never()));
	CHECK(ctx.client.directory_depth() == 0);

	CHECK(ctx.sent.data == "D0755 0 dir\nC0644 1 one\n1\0D0700 0 sub\nC0644 2 two\n22\0E\nE\n"_bin);
	CHECK(ctx.remote.remaining().empty());

	CHECK(ctx.client.exit_directory(cancel_context::never()) == scp_error_code::invalid_argument);
}

TEST_CASE("upload batch report", "[client]") {
	client_context ctx("\0\0\0\x01skip\n\0\0"_bin, ready_sink());
	string_in_stream a("aa");
	string_in_stream b("b");
	string_in_stream c("ccc");

	transfer_report report;
	auto err = ctx.client.upload({
			upload_item{regular_file("a", 2), &a},
			upload_item{regular_file("b", 1), &b},
			upload_item{regular_file("x", 1), nullptr},
			upload_item{regular_file("c", 3), &c}},
		cancel_context::never(), report);

	CHECK(!err);
	REQUIRE(report.files.size() == 4);
	CHECK(!report.files[0].error);
	CHECK(report.files[1].error == scp_error_code::remote_warning);
	CHECK(report.files[2].error == scp_error_code::invalid_argument);
	CHECK(!report.files[3].error);
	CHECK(report.failed_count() == 2);
	CHECK(report.bytes == 5);
	CHECK(ctx.sent.data == "C0644 2 a\naa\0C0644 1 b\nC0644 3 c\nccc\0"_bin);
}

TEST_CASE("upload batch stops on fatal error", "[client]") {
	client_context ctx("\0\x02gone\n"_bin, ready_sink());
	string_in_stream a("a");
	string_in_stream b("b");

	transfer_report report;
	auto err = ctx.client.upload({
			upload_item{regular_file("a", 1), &a},
			upload_item{regular_file("b", 1), &b}},
		cancel_context::never(), report);

	CHECK(err == scp_error_code::remote_error);
	REQUIRE(report.files.size() == 1);
	CHECK(report.files[0].file.filename == "a");
}

TEST_CASE("download with time directive", "[client]") {
	client_context ctx("T1610000000 0 1609999000 0\nC0644 5 a.txt\nhello\0"_bin);
	memory_sink sink;
	transfer_report report;

	REQUIRE(!ctx.client.download(sink, cancel_context::never(), report));

	// start, after time, after permission, after payload
	CHECK(ctx.sent.data == "\0\0\0\0"_bin);
	CHECK(sink.content("a.txt") == "hello");

	REQUIRE(report.files.size() == 1);
	auto const& f = report.files[0].file;
	CHECK(!report.files[0].error);
	CHECK(f.access_time == 1610000000);
	CHECK(f.modify_time == 1609999000);
	CHECK(f.filename == "a.txt");
	CHECK(f.size == 5);
	CHECK(f.permissions == "0644");

	REQUIRE(sink.opened.size() == 1);
	CHECK(sink.opened[0] == f);
	REQUIRE(sink.closed.size() == 1);
	CHECK(!sink.closed[0].second);
	CHECK(ctx.client.state() == client_state::ready);
}

TEST_CASE("download several files with progress", "[client]") {
	client_context ctx("C0644 3 a\nabc\0C0600 0 empty\n\0C0755 4 b\nwxyz\0"_bin, scp_config{.buffer_size = 2});

	memory_sink sink;
	transfer_report report;
	std::uint64_t progress{};
	progress_in_stream payload(ctx.remote, [&](std::uint64_t total, std::size_t) { progress = total; });

	REQUIRE(!ctx.client.download(sink, cancel_context::never(), report, &payload));

	CHECK(sink.content("a") == "abc");
	CHECK(sink.content("empty").empty());
	CHECK(sink.files.contains("empty"));
	CHECK(sink.content("b") == "wxyz");
	CHECK(progress == 7);
	CHECK(report.files.size() == 3);
	CHECK(report.failed_count() == 0);
	CHECK(report.bytes == 7);
	CHECK(ctx.sent.data == std::string(7, '\0'));
}

TEST_CASE("download remote warning and error", "[client]") {
	SECTION("warning skips file") {
		client_context ctx("\x01scp: missing: No such file or directory\nC0644 2 b\nhi\0"_bin);
		memory_sink sink;
		transfer_report report;

		REQUIRE(!ctx.client.download(sink, cancel_context::never(), report));
		REQUIRE(report.files.size() == 2);
		CHECK(report.files[0].error == scp_error_code::remote_warning);
		CHECK(report.files[0].error.message() == "scp: missing: No such file or directory");
		CHECK(!report.files[1].error);
		CHECK(sink.content("b") == "hi");
		// nothing is sent in response to warning
		CHECK(ctx.sent.data == "\0\0\0"_bin);
	}
	SECTION("error stops session") {
		client_context ctx("C0644 1 a\nx\0\x02" "fatal\nC0644 1 b\ny\0"_bin);
		memory_sink sink;
		transfer_report report;

		auto err = ctx.client.download(sink, cancel_context::never(), report);
		CHECK(err == scp_error_code::remote_error);
		CHECK(err.message() == "fatal");
		CHECK(ctx.client.state() == client_state::closed);
		CHECK(ctx.remote.remaining() == "C0644 1 b\ny\0"_bin);
		REQUIRE(report.files.size() == 2);
		CHECK(!report.files[0].error);
		CHECK(report.files[1].error == scp_error_code::remote_error);
		CHECK(!sink.files.contains("b"));

		CHECK(ctx.client.download(sink, cancel_context::never(), report) == scp_error_code::session_closed);
	}
	SECTION("warning instead of end of payload") {
		client_context ctx("C0644 2 a\nxx\x01read error\n"_bin);
		memory_sink sink;
		transfer_report report;

		REQUIRE(!ctx.client.download(sink, cancel_context::never(), report));
		REQUIRE(report.files.size() == 1);
		CHECK(report.files[0].error == scp_error_code::remote_warning);
		REQUIRE(sink.closed.size() == 1);
		CHECK(sink.closed[0].second == scp_error_code::remote_warning);
		CHECK(ctx.sent.data == "\0\0\0"_bin);
	}
}

TEST_CASE("download local failures", "[client]") {
	SECTION("sink refuses file") {
		client_context ctx("C0644 3 bad\nabc\0C0644 2 ok\nhi\0"_bin);
		memory_sink sink;
		sink.refuse.insert("bad");
		transfer_report report;

		REQUIRE(!ctx.client.download(sink, cancel_context::never(), report));
		CHECK(ctx.sent.data == "\0\0\x01refused\n\0\0"_bin);
		REQUIRE(report.files.size() == 2);
		CHECK(report.files[0].error == scp_error_code::local_io_error);
		CHECK(!report.files[1].error);
		CHECK(sink.content("ok") == "hi");
		// refused file is never closed
		CHECK(sink.closed.size() == 1);
	}
	SECTION("write failure drains payload") {
		client_context ctx("C0644 6 a\nabcdef\0"_bin, scp_config{.buffer_size = 2});
		memory_sink sink;
		sink.write_fail_at = 2;
		transfer_report report;

		REQUIRE(!ctx.client.download(sink, cancel_context::never(), report));
		CHECK(sink.content("a") == "ab");
		REQUIRE(report.files.size() == 1);
		CHECK(report.files[0].error == scp_error_code::local_io_error);
		CHECK(ctx.remote.remaining().empty());
		CHECK(ctx.sent.data == "\0\0\x01write failure\n"_bin);
	}
	SECTION("close failure") {
		client_context ctx("C0644 1 a\nx\0"_bin);
		memory_sink sink;
		sink.fail_close.insert("a");
		transfer_report report;

		REQUIRE(!ctx.client.download(sink, cancel_context::never(), report));
		REQUIRE(report.files.size() == 1);
		CHECK(report.files[0].error == scp_error_code::local_io_error);
		CHECK(report.files[0].error.message() == "unable to set times");
		CHECK(ctx.sent.data == "\0\0\x01unable to set times\n"_bin);
	}
	SECTION("path in filename") {
		client_context ctx("C0644 2 ../x\nab\0"_bin);
		memory_sink sink;
		transfer_report report;

		REQUIRE(!ctx.client.download(sink, cancel_context::never(), report));
		CHECK(sink.opened.empty());
		REQUIRE(report.files.size() == 1);
		CHECK(report.files[0].error == scp_error_code::invalid_argument);
		CHECK(ctx.remote.remaining().empty());
	}
}

TEST_CASE("download malformed directives", "[client]") {
	SECTION("permission") {
		client_context ctx("C0644 abc x\nC0644 1 y\nz\0"_bin);
		memory_sink sink;
		transfer_report report;

		REQUIRE(!ctx.client.download(sink, cancel_context::never(), report));
		CHECK(ctx.sent.data == "\0\x01unable to parse permission directive\n\0\0"_bin);
		REQUIRE(report.files.size() == 2);
		CHECK(report.files[0].error == scp_error_code::directive_parse_error);
		CHECK(report.files[0].file.raw_message == "0644 abc x\n");
		CHECK(sink.content("y") == "z");
	}
	SECTION("time") {
		client_context ctx("Tnope 0 1 0\nC0644 1 y\nz\0"_bin);
		memory_sink sink;
		transfer_report report;

		REQUIRE(!ctx.client.download(sink, cancel_context::never(), report));
		REQUIRE(report.files.size() == 2);
		CHECK(report.files[0].error.message() == "unable to parse access time");
		// times of the rejected line are not applied
		CHECK(report.files[1].file.access_time == 0);
	}
}

TEST_CASE("download protocol violations", "[client]") {
	SECTION("ok without directive") {
		client_context ctx("\0"_bin);
		memory_sink sink;
		transfer_report report;
		CHECK(ctx.client.download(sink, cancel_context::never(), report) == scp_error_code::protocol_violation);
		CHECK(ctx.client.state() == client_state::closed);
	}
	SECTION("directory directive") {
		client_context ctx("D0755 0 dir\n"_bin);
		memory_sink sink;
		transfer_report report;
		CHECK(ctx.client.download(sink, cancel_context::never(), report) == scp_error_code::protocol_violation);
	}
	SECTION("directive instead of end of payload") {
		client_context ctx("C0644 1 a\nxC0644 1 b\ny\0"_bin);
		memory_sink sink;
		transfer_report report;
		CHECK(ctx.client.download(sink, cancel_context::never(), report) == scp_error_code::protocol_violation);
		CHECK(report.files.empty());
	}
	SECTION("stream ends inside payload") {
		client_context ctx("C0644 10 a\nabc"_bin);
		memory_sink sink;
		transfer_report report;
		CHECK(ctx.client.download(sink, cancel_context::never(), report) == scp_error_code::transport_error);
		CHECK(ctx.client.state() == client_state::closed);
	}
	SECTION("stream ends before end of payload status") {
		client_context ctx("C0644 1 a\nx"_bin);
		memory_sink sink;
		transfer_report report;
		CHECK(ctx.client.download(sink, cancel_context::never(), report) == scp_error_code::transport_error);
	}
}

TEST_CASE("download nothing", "[client]") {
	client_context ctx("");
	memory_sink sink;
	transfer_report report;
	REQUIRE(!ctx.client.download(sink, cancel_context::never(), report));
	CHECK(report.files.empty());
	CHECK(ctx.sent.data == "\0"_bin);
}

TEST_CASE("download cancelled", "[client]") {
	client_context ctx("C0644 6 a\nabcdef\0"_bin, scp_config{.buffer_size = 2});
	memory_sink sink;
	transfer_report report;
	cancel_context c;
	ctx.remote.on_read = [&](std::size_t pos) { if(pos == 12) c.cancel(); };

	CHECK(ctx.client.download(sink, c, report) == scp_error_code::cancelled);
	CHECK(ctx.client.state() == client_state::closed);
	CHECK(ctx.remote.remaining() == "cdef\0"_bin);
}

}
