#ifndef CLIOPTION_HH
#define CLIOPTION_HH

#include <span>
#include <string>
#include <string_view>

namespace bin2s {

class CLIOption
{
public:
	CLIOption(const CLIOption&) = delete;
	CLIOption& operator=(const CLIOption&) = delete;

	virtual void parseOption(const std::string& option,
	                         std::span<std::string>& cmdLine) = 0;
	[[nodiscard]] virtual std::string_view optionHelp() const = 0;

protected:
	CLIOption() = default;
	~CLIOption() = default;
	[[nodiscard]] static std::string getArgument(
		const std::string& option, std::span<std::string>& cmdLine);
	[[nodiscard]] static int getIntArgument(
		const std::string& option, std::span<std::string>& cmdLine);
};

} // namespace bin2s

#endif
