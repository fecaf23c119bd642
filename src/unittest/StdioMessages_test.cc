#include <catch2/catch.hpp>
#include "StdioMessages.hh"

#include <sstream>
#include <string>

using namespace bin2s;

TEST_CASE("StdioMessages")
{
	std::ostringstream out;
	StdioMessages messages("bin2s", out);

	SECTION("levels") {
		messages.printInfo("converted 3 files");
		messages.printWarning("skipping empty file \"", "empty.bin", '"');
		messages.printError(std::string_view("something failed"));
		CHECK(out.str() ==
			"bin2s: info: converted 3 files\n"
			"bin2s: warning: skipping empty file \"empty.bin\"\n"
			"bin2s: error: something failed\n");
	}
	SECTION("quiet suppresses info only") {
		messages.setQuiet(true);
		messages.printInfo("not shown");
		messages.printWarning("shown");
		messages.printError("also shown");
		CHECK(out.str() ==
			"bin2s: warning: shown\n"
			"bin2s: error: also shown\n");

		messages.setQuiet(false);
		messages.printInfo("shown again: ", 42);
		CHECK(out.str().ends_with("bin2s: info: shown again: 42\n"));
	}
}

TEST_CASE("CliComm: level strings")
{
	CHECK(toString(CliComm::LogLevel::INFO) == "info");
	CHECK(toString(CliComm::LogLevel::WARNING) == "warning");
	CHECK(toString(CliComm::LogLevel::LOGLEVEL_ERROR) == "error");
}
