#ifndef BIN2SEXCEPTION_HH
#define BIN2SEXCEPTION_HH

#include "strCat.hh"

#include <concepts>
#include <string>
#include <type_traits>
#include <utility>

namespace bin2s {

class Bin2sException
{
public:
	explicit Bin2sException() = default;

	explicit Bin2sException(std::string message_)
		: message(std::move(message_)) {}

	template<typename T, typename... Args>
		requires(!std::same_as<Bin2sException, std::remove_cvref_t<T>>) // don't block copy-constructor
	explicit Bin2sException(T&& t, Args&&... args)
		: message(strCat(std::forward<T>(t), std::forward<Args>(args)...))
	{
	}

	[[nodiscard]] const std::string& getMessage() const &  { return message; }
	[[nodiscard]]       std::string  getMessage()       && { return std::move(message); }

private:
	std::string message;
};

/** Aborts the whole run (as opposed to the conversion of a single file).
  */
class FatalError
{
public:
	explicit FatalError(std::string message_)
		: message(std::move(message_)) {}

	template<typename T, typename... Args>
		requires(!std::same_as<FatalError, std::remove_cvref_t<T>>) // don't block copy-constructor
	explicit FatalError(T&& t, Args&&... args)
		: message(strCat(std::forward<T>(t), std::forward<Args>(args)...))
	{
	}

	[[nodiscard]] const std::string& getMessage() const &  { return message; }
	[[nodiscard]]       std::string  getMessage()       && { return std::move(message); }

private:
	std::string message;
};

} // namespace bin2s

#endif
