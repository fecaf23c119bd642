#include "CLIOption.hh"

#include "Bin2sException.hh"

#include "StringOp.hh"

#include <utility>

namespace bin2s {

std::string CLIOption::getArgument(const std::string& option, std::span<std::string>& cmdLine)
{
	if (cmdLine.empty()) {
		throw FatalError("Missing argument for option \"", option, '\"');
	}
	std::string argument = std::move(cmdLine.front());
	cmdLine = cmdLine.subspan(1);
	return argument;
}

int CLIOption::getIntArgument(const std::string& option, std::span<std::string>& cmdLine)
{
	auto argument = getArgument(option, cmdLine);
	auto value = StringOp::stringToBase<10, int>(argument);
	if (!value) {
		throw FatalError("Invalid value for option \"", option, "\": \"",
		                 argument, "\" is not an integer");
	}
	return *value;
}

} // namespace bin2s
