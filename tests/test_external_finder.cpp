#include <doctest/doctest.h>

#include "display_manager.h"
#include "finder.h"
#include "process.h"
#include "selector.h"
#include "test_helpers.h"

#include <csignal>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

using fuzzpick::tests::contains;
using fuzzpick::tests::make_catalog;
using fuzzpick::tests::read_file;
using fuzzpick::tests::sample_catalog;
using fuzzpick::tests::ScriptedReader;
using fuzzpick::tests::TempDir;

namespace {

FinderConfig stub_config(const std::filesystem::path& executable)
{
	FinderConfig config;
	config.executable = executable.string();
	config.header     = "Pick one";
	return config;
}

// Bitmask of ignored signals as the child sees it, from /proc/<pid>/status.
unsigned long long child_ignored_signals()
{
	const auto status = Process::run({"cat", "/proc/self/status"}, "");
	REQUIRE(status.has_value());
	const auto pos = status->out.find("SigIgn:");
	REQUIRE(pos != std::string::npos);
	return std::stoull(status->out.substr(pos + 7), nullptr, 16);
}

} // namespace

TEST_CASE("serialize writes one tab-separated line per entry")
{
	const auto catalog = sample_catalog();
	CHECK(ExternalFinder::serialize(catalog) ==
	      "hello\tSay hello\nbuild\tBuild project\nbundle\tBundle assets\n");
}

TEST_CASE("interpret maps exit codes and output")
{
	const auto catalog = sample_catalog();

	const auto aborted = ExternalFinder::interpret(catalog, 130, "");
	REQUIRE(std::holds_alternative<Cancelled>(aborted));
	CHECK(std::get<Cancelled>(aborted).code == 130);

	const auto quiet = ExternalFinder::interpret(catalog, 0, "\n");
	REQUIRE(std::holds_alternative<Cancelled>(quiet));
	CHECK(std::get<Cancelled>(quiet).code == 0);

	const auto picked = ExternalFinder::interpret(catalog, 0, "build\tBuild project\r\nextra\n");
	REQUIRE(std::holds_alternative<Resolved>(picked));
	CHECK(std::get<Resolved>(picked).entry->identifier == "build");

	const auto bare = ExternalFinder::interpret(catalog, 0, "hello");
	REQUIRE(std::holds_alternative<Resolved>(bare));

	const auto unknown = ExternalFinder::interpret(catalog, 0, "ghost\tBoo\n");
	REQUIRE(std::holds_alternative<ProtocolViolation>(unknown));
	CHECK(std::get<ProtocolViolation>(unknown).selection == "ghost");
}

TEST_CASE("missing finder binary is not applicable")
{
	const auto catalog = sample_catalog();
	FinderConfig config;
	config.executable = "fuzzpick-no-such-finder";
	ExternalFinder finder(config);

	CHECK(!finder.try_delegate(catalog, "").has_value());
}

TEST_CASE("finder receives the catalog on stdin and the interface flags")
{
	TempDir dir;
	const auto input = dir.path() / "input.txt";
	const auto args  = dir.path() / "args.txt";
	const auto stub  = dir.write_executable("finder.sh",
	                                        "#!/bin/sh\n"
	                                        "cat > '" + input.string() + "'\n"
	                                        "printf '%s\\n' \"$@\" > '" + args.string() + "'\n"
	                                        "printf 'bundle\\tBundle assets\\n'\n");

	const auto catalog = sample_catalog();
	ExternalFinder finder(stub_config(stub));

	const auto outcome = finder.try_delegate(catalog, "bu");
	REQUIRE(outcome.has_value());
	REQUIRE(std::holds_alternative<Resolved>(*outcome));
	CHECK(std::get<Resolved>(*outcome).entry->identifier == "bundle");

	CHECK(read_file(input) == ExternalFinder::serialize(catalog));

	const auto argv = read_file(args);
	CHECK(contains(argv, "--layout=reverse\n"));
	CHECK(contains(argv, "--no-multi\n"));
	CHECK(contains(argv, "--with-nth=1,2\n"));
	CHECK(contains(argv, "--height=40%\n"));
	CHECK(contains(argv, "--header=Pick one\n"));
	CHECK(contains(argv, "--query=bu\n"));
}

TEST_CASE("finder exit status becomes a cancellation")
{
	TempDir dir;
	const auto stub = dir.write_executable("finder.sh", "#!/bin/sh\ncat > /dev/null\nexit 130\n");
	const auto catalog = sample_catalog();
	ExternalFinder finder(stub_config(stub));

	const auto outcome = finder.try_delegate(catalog, "");
	REQUIRE(outcome.has_value());
	REQUIRE(std::holds_alternative<Cancelled>(*outcome));
	CHECK(std::get<Cancelled>(*outcome).code == 130);
}

TEST_CASE("finder that ignores stdin still reports its result")
{
	TempDir dir;
	const auto stub = dir.write_executable("finder.sh", "#!/bin/sh\nprintf 'ghost\\n'\n");
	const auto catalog = sample_catalog();
	ExternalFinder finder(stub_config(stub));

	const auto outcome = finder.try_delegate(catalog, "");
	REQUIRE(outcome.has_value());
	REQUIRE(std::holds_alternative<ProtocolViolation>(*outcome));
	CHECK(std::get<ProtocolViolation>(*outcome).selection == "ghost");
}

TEST_CASE("selector returns Cancelled(0) when the finder prints nothing")
{
	TempDir dir;
	const auto stub = dir.write_executable("finder.sh", "#!/bin/sh\ncat > /dev/null\nexit 0\n");
	const auto catalog = sample_catalog();
	ExternalFinder finder(stub_config(stub));

	std::ostringstream out;
	std::ostringstream err;
	const DisplayManager display(out, err, false);
	ScriptedReader reader;
	const Selector selector(&finder, reader, display);

	const auto outcome = selector.select(catalog, "");
	REQUIRE(std::holds_alternative<Cancelled>(outcome));
	CHECK(std::get<Cancelled>(outcome).code == 0);
	CHECK(reader.reads == 0);
	CHECK(out.str().empty());
}

TEST_CASE("Process::run collects output and exit codes")
{
	const auto echoed = Process::run({"sh", "-c", "tr a-z A-Z; exit 3"}, "abc\n");
	REQUIRE(echoed.has_value());
	CHECK(echoed->out == "ABC\n");
	CHECK(echoed->exit_code == 3);

	const auto killed = Process::run({"sh", "-c", "kill -TERM $$"}, "");
	REQUIRE(killed.has_value());
	CHECK(killed->exit_code == 128 + 15);

	CHECK(!Process::run({}, "").has_value());
}

TEST_CASE("Process::run_attached runs in the given directory")
{
	TempDir dir;
	const auto code = Process::run_attached(
	        {"sh", "-c", "pwd > marker.txt; exit 4"}, dir.path().string());
	REQUIRE(code.has_value());
	CHECK(*code == 4);
	CHECK(std::filesystem::exists(dir.path() / "marker.txt"));
}

TEST_CASE("Process::run streams input larger than a pipe buffer through an echoing child")
{
	std::string input = {};
	while (input.size() < 256 * 1024) {
		input += "line " + std::to_string(input.size()) + " of a long catalog\n";
	}

	const auto echoed = Process::run({"cat"}, input);
	REQUIRE(echoed.has_value());
	CHECK(echoed->exit_code == 0);
	CHECK(echoed->out == input);
}

TEST_CASE("finder that echoes a large catalog while reading it resolves the first line")
{
	std::vector<std::pair<std::string, std::string>> items;
	for (int i = 0; i < 5000; ++i) {
		items.emplace_back("entry-" + std::to_string(i),
		                   "A fairly long secondary label for entry " + std::to_string(i));
	}
	const auto catalog = make_catalog(items);
	REQUIRE(ExternalFinder::serialize(catalog).size() > 64 * 1024);

	TempDir dir;
	const auto stub = dir.write_executable("finder.sh", "#!/bin/sh\nexec cat\n");
	ExternalFinder finder(stub_config(stub));

	const auto outcome = finder.try_delegate(catalog, "");
	REQUIRE(outcome.has_value());
	REQUIRE(std::holds_alternative<Resolved>(*outcome));
	CHECK(std::get<Resolved>(*outcome).entry->identifier == "entry-0");
}

TEST_CASE("children inherit the caller's SIGINT disposition")
{
	const unsigned long long int_bit = 1ULL << (SIGINT - 1);

	struct sigaction ignore = {};
	struct sigaction saved  = {};
	ignore.sa_handler       = SIG_IGN;
	sigemptyset(&ignore.sa_mask);

	REQUIRE(sigaction(SIGINT, &ignore, &saved) == 0);
	const auto while_ignored = child_ignored_signals();
	REQUIRE(sigaction(SIGINT, &saved, nullptr) == 0);

	CHECK((while_ignored & int_bit) != 0);
	if (saved.sa_handler == SIG_DFL) {
		CHECK((child_ignored_signals() & int_bit) == 0);
	}
}
