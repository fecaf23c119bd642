#include "AsmParameters.hh"

#include "ParameterException.hh"

namespace bin2s {

void AsmParameters::validate() const
{
	if (alignment <= 0) {
		throw ParameterException(
			"alignment must be greater than 0, but got: ", alignment);
	}
	if (lineLength <= 0) {
		throw ParameterException(
			"line length must be greater than 0, but got: ", lineLength);
	}
}

} // namespace bin2s
