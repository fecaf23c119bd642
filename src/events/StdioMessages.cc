#include "StdioMessages.hh"

#include <iostream>
#include <utility>

namespace bin2s {

StdioMessages::StdioMessages(std::string programName_)
	: StdioMessages(std::move(programName_), std::cerr)
{
}

StdioMessages::StdioMessages(std::string programName_, std::ostream& out_)
	: programName(std::move(programName_))
	, out(out_)
{
}

void StdioMessages::log(LogLevel level, std::string_view message)
{
	if (quiet && (level == LogLevel::INFO)) return;
	out << programName << ": " << toString(level) << ": " << message << '\n' << std::flush;
}

} // namespace bin2s
