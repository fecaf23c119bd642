/*
 *  bin2s - convert binary files to GNU assembler modules
 *
 */

#include "BatchConverter.hh"
#include "Bin2sException.hh"
#include "CommandLineParser.hh"
#include "FileException.hh"
#include "FileOperations.hh"
#include "StdioMessages.hh"

#include <exception>
#include <fstream>
#include <iostream>
#include <span>
#include <string>
#include <utility>

namespace bin2s {

static void run(const CommandLineParser& parser, StdioMessages& messages)
{
	std::ofstream outputFile;
	const auto& outputFilename = parser.getOutputFilename();
	if (!outputFilename.empty()) {
		try {
			FileOperations::openOfStream(outputFile, outputFilename);
		} catch (FileException& e) {
			throw FatalError(std::move(e).getMessage());
		}
	}
	std::ostream& output = outputFilename.empty() ? std::cout : outputFile;

	BatchConverter converter(output, messages, parser.getParameters(),
	                         parser.getOpenMode());
	converter.setVerbose(parser.isVerbose());
	converter.convert(parser.getProgramName(), parser.getInputFiles());

	output.flush();
	if (!output) {
		throw FatalError("Error writing output");
	}
}

static int main(int argc, char **argv)
{
	StdioMessages messages(std::string(
		FileOperations::getFilename((argc > 0) ? argv[0] : "bin2s")));
	try {
		CommandLineParser parser;
		parser.parse(std::span<char*>{argv, size_t(argc)});
		messages.setQuiet(parser.isQuiet());

		if (parser.getParseStatus() != CommandLineParser::Status::EXIT) {
			run(parser, messages);
		}
	} catch (FatalError& e) {
		messages.printError(e.getMessage());
		return 1;
	} catch (Bin2sException& e) {
		messages.printError("Uncaught exception: ", e.getMessage());
		return 1;
	} catch (std::exception& e) {
		messages.printError("Uncaught std::exception: ", e.what());
		return 1;
	}
	return 0;
}

} // namespace bin2s

int main(int argc, char **argv)
{
	return bin2s::main(argc, argv);
}
