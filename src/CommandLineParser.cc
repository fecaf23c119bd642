#include "CommandLineParser.hh"

#include "Bin2sException.hh"
#include "FileOperations.hh"
#include "ParameterException.hh"
#include "Version.hh"

#include "strCat.hh"

#include <algorithm>
#include <array>
#include <cassert>
#include <iostream>
#include <ostream>
#include <utility>

namespace bin2s {

// class CommandLineParser

CommandLineParser::CommandLineParser()
	: alignmentOption(parameters)
	, lineLengthOption(parameters)
{
	registerOption("-h",            helpOption);
	registerOption("--help",        helpOption);
	registerOption("-a",            alignmentOption);
	registerOption("--alignment",   alignmentOption);
	registerOption("-l",            lineLengthOption);
	registerOption("--line-length", lineLengthOption);
	registerOption("-o",            outputOption);
	registerOption("--output",      outputOption);
	registerOption("-z",            gunzipOption);
	registerOption("--gunzip",      gunzipOption);
	registerOption("-q",            quietOption);
	registerOption("--quiet",       quietOption);
	registerOption("--verbose",     verboseOption);
	registerOption("-v",            versionOption);
	registerOption("--version",     versionOption);

	// At this point all options must be registered
	std::ranges::sort(options, {}, &OptionData::name);
}

void CommandLineParser::registerOption(std::string_view str, CLIOption& cliOption)
{
	options.push_back(OptionData{str, &cliOption});

	if (!helpItems.empty() && (helpItems.back().first == &cliOption)) {
		strAppend(helpItems.back().second, ", ", str);
	} else {
		helpItems.emplace_back(&cliOption, std::string(str));
	}
}

CLIOption* CommandLineParser::findOption(std::string_view name) const
{
	auto it = std::ranges::lower_bound(options, name, {}, &OptionData::name);
	if ((it == options.end()) || (it->name != name)) {
		return nullptr;
	}
	return it->option;
}

// Besides the plain forms "-a 4" and "--alignment 4" this accepts
// "--alignment=4", "-a4" and groups of flags like "-qz".
bool CommandLineParser::parseOption(const std::string& arg, std::span<std::string>& cmdLine)
{
	try {
		if (auto* option = findOption(arg)) {
			option->parseOption(arg, cmdLine);
			return true;
		}

		if (arg.starts_with("--")) {
			auto eq = arg.find('=');
			if (eq == std::string::npos) return false;
			std::string name = arg.substr(0, eq);
			auto* option = findOption(name);
			if (!option) return false;

			std::array<std::string, 1> value = {arg.substr(eq + 1)};
			std::span<std::string> valueLine(value);
			option->parseOption(name, valueLine);
			if (!valueLine.empty()) {
				throw FatalError("Option \"", name, "\" doesn't take an argument");
			}
			return true;
		}

		std::string name = arg.substr(0, 2);
		auto* option = findOption(name);
		if (!option) return false;

		std::array<std::string, 1> rest = {arg.substr(2)};
		std::span<std::string> restLine(rest);
		option->parseOption(name, restLine);
		if (!restLine.empty()) {
			// not an argument, but more single letter flags
			return parseOption(strCat('-', rest.front()), cmdLine);
		}
		return true;
	} catch (Bin2sException& e) {
		throw FatalError(std::move(e).getMessage());
	}
}

void CommandLineParser::parse(std::span<char*> argv)
{
	parseStatus = Status::RUN;
	if (!argv.empty() && argv.front()) {
		programName = FileOperations::getFilename(argv.front());
	}

	std::vector<std::string> cmdLineBuf;
	for (const char* a : argv.subspan(argv.empty() ? 0 : 1)) {
		cmdLineBuf.emplace_back(a);
	}
	std::span<std::string> cmdLine(cmdLineBuf);

	bool endOfOptions = false;
	while (!cmdLine.empty()) {
		std::string arg = std::move(cmdLine.front());
		cmdLine = cmdLine.subspan(1);
		if (!endOfOptions && (arg == "--")) {
			endOfOptions = true;
		} else if (!endOfOptions && (arg.size() > 1) && (arg[0] == '-')) {
			if (!parseOption(arg, cmdLine)) {
				throw FatalError(
					"Unknown option: ", arg, "\n"
					"Use \"", programName, " -h\" to see a list of available options");
			}
		} else {
			inputFiles.push_back(std::move(arg));
		}
	}

	if (helpOption.requested) {
		printHelp(std::cout);
		parseStatus = Status::EXIT;
		return;
	}
	if (versionOption.requested) {
		std::cout << Version::full() << '\n';
		parseStatus = Status::EXIT;
		return;
	}

	try {
		parameters.validate();
	} catch (ParameterException& e) {
		throw FatalError(std::move(e).getMessage());
	}
	if (inputFiles.empty()) {
		throw FatalError(
			"No input files given\n"
			"Use \"", programName, " -h\" to see a list of available options");
	}
}

CommandLineParser::Status CommandLineParser::getParseStatus() const
{
	assert(parseStatus != Status::UNPARSED);
	return parseStatus;
}


// Help option

static constexpr std::string_view DESCRIPTION =
	"Convert binary files to GCC assembly modules.\n"
	"\n"
	"For each input file it will output assembly defining:\n"
	"\n"
	"    * {identifier}:\n"
	"        An array of bytes containing the data.\n"
	"    * {identifier}_end:\n"
	"        Will be at the location directly after the end of the data.\n"
	"    * {identifier}_size:\n"
	"        An unsigned int containing the length of the data in bytes.\n"
	"\n"
	"Roughly equivalent to this pseudocode:\n"
	"\n"
	"    unsigned int identifier_size = ...\n"
	"    unsigned char identifier[identifier_size] = { ... }\n"
	"    unsigned char identifier_end[] = identifier + identifier_size\n"
	"\n"
	"Where {identifier} is the input file's name,\n"
	"sanitized to produce a legal C identifier, by doing the following:\n"
	"\n"
	"    * Stripping all character that are not ASCII letters, digits or one of _-./\n"
	"    * Replacing all of -./ with _\n"
	"    * Prepending _ if the remaining identifier begins with a digit.\n"
	"\n"
	"e.g. for gfx/foo.bin {identifier} will be foo_bin,\n"
	"     and for 4bit.chr it will be _4bit_chr.\n";

static void printHelpItem(std::ostream& os, std::string_view names, std::string_view help)
{
	static constexpr size_t COLUMN = 24;
	os << strCat("  ", names,
	             spaces(names.size() < COLUMN ? COLUMN - names.size() : 1),
	             help, '\n');
}

void CommandLineParser::printHelp(std::ostream& os) const
{
	os << "usage: " << programName << " [options] FILE [FILE ...]\n"
	      "\n"
	   << DESCRIPTION
	   << "\n"
	      "positional arguments:\n";
	printHelpItem(os, "FILE", "Binary file to convert to GCC assembly, - for stdin");
	os << "\n"
	      "options:\n";
	for (const auto& [option, names] : helpItems) {
		printHelpItem(os, names, option->optionHelp());
	}
}

void CommandLineParser::HelpOption::parseOption(
	const std::string& /*option*/, std::span<std::string>& /*cmdLine*/)
{
	requested = true;
}

std::string_view CommandLineParser::HelpOption::optionHelp() const
{
	return "Shows this text";
}


// Version option

void CommandLineParser::VersionOption::parseOption(
	const std::string& /*option*/, std::span<std::string>& /*cmdLine*/)
{
	requested = true;
}

std::string_view CommandLineParser::VersionOption::optionHelp() const
{
	return "Prints bin2s version and exits";
}


// Alignment option

void CommandLineParser::AlignmentOption::parseOption(
	const std::string& option, std::span<std::string>& cmdLine)
{
	parameters.alignment = getIntArgument(option, cmdLine);
}

std::string_view CommandLineParser::AlignmentOption::optionHelp() const
{
	return "Boundary alignment, in bytes [default: 4]";
}


// Line length option

void CommandLineParser::LineLengthOption::parseOption(
	const std::string& option, std::span<std::string>& cmdLine)
{
	parameters.lineLength = getIntArgument(option, cmdLine);
}

std::string_view CommandLineParser::LineLengthOption::optionHelp() const
{
	return "Length of data lines to output, in bytes [default: 16]";
}


// Output option

void CommandLineParser::OutputOption::parseOption(
	const std::string& option, std::span<std::string>& cmdLine)
{
	if (!filename.empty()) {
		throw FatalError("Only one ", option, " option allowed");
	}
	filename = getArgument(option, cmdLine);
	if (filename.empty()) {
		throw FatalError("Empty filename for option \"", option, '"');
	}
}

std::string_view CommandLineParser::OutputOption::optionHelp() const
{
	return "Output file, writes to stdout if not provided";
}


// Gunzip option

void CommandLineParser::GunzipOption::parseOption(
	const std::string& /*option*/, std::span<std::string>& /*cmdLine*/)
{
	enabled = true;
}

std::string_view CommandLineParser::GunzipOption::optionHelp() const
{
	return "Embed the decompressed content of gzip compressed input files";
}


// Quiet option

void CommandLineParser::QuietOption::parseOption(
	const std::string& /*option*/, std::span<std::string>& /*cmdLine*/)
{
	enabled = true;
}

std::string_view CommandLineParser::QuietOption::optionHelp() const
{
	return "Don't print informational messages";
}


// Verbose option

void CommandLineParser::VerboseOption::parseOption(
	const std::string& /*option*/, std::span<std::string>& /*cmdLine*/)
{
	enabled = true;
}

std::string_view CommandLineParser::VerboseOption::optionHelp() const
{
	return "Report the symbol name and size of every converted file";
}

} // namespace bin2s
