#ifndef CLICOMM_HH
#define CLICOMM_HH

#include "strCat.hh"

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

namespace bin2s {

class CliComm
{
public:
	enum class LogLevel : uint8_t {
		INFO,
		WARNING,
		LOGLEVEL_ERROR, // ERROR may give preprocessor name clashes
		NUM // must be last
	};

	/** Log a message with a certain priority level.
	  */
	virtual void log(LogLevel level, std::string_view message) = 0;

	// convenience methods (shortcuts for log())
	void printInfo    (std::string_view message);
	void printWarning (std::string_view message);
	void printError   (std::string_view message);

	// These overloads are (only) needed for efficiency, because otherwise
	// the templated overload below is a better match than the 'string_view'
	// overload above (and we don't want to construct a temp string).
	void printInfo(const char* message) {
		printInfo(std::string_view(message));
	}
	void printWarning(const char* message) {
		printWarning(std::string_view(message));
	}
	void printError(const char* message) {
		printError(std::string_view(message));
	}

	template<typename... Args>
	void printInfo(Args&& ...args) {
		auto tmp = strCat(std::forward<Args>(args)...);
		printInfo(std::string_view(tmp));
	}
	template<typename... Args>
	void printWarning(Args&& ...args) {
		auto tmp = strCat(std::forward<Args>(args)...);
		printWarning(std::string_view(tmp));
	}
	template<typename... Args>
	void printError(Args&& ...args) {
		auto tmp = strCat(std::forward<Args>(args)...);
		printError(std::string_view(tmp));
	}

	// string representations of the LogLevel enum
	[[nodiscard]] static std::string_view getLevelString(LogLevel level) {
		static constexpr std::array<std::string_view, std::to_underlying(LogLevel::NUM)> levelStr = {
			"info", "warning", "error"
		};
		return levelStr[std::to_underlying(level)];
	}

protected:
	CliComm() = default;
	~CliComm() = default;
};

[[nodiscard]] inline auto toString(CliComm::LogLevel type)
{
	return CliComm::getLevelString(type);
}

} // namespace bin2s

#endif
