#ifndef PARAMETEREXCEPTION_HH
#define PARAMETEREXCEPTION_HH

#include "Bin2sException.hh"

namespace bin2s {

class ParameterException final : public Bin2sException
{
public:
	using Bin2sException::Bin2sException;
};

} // namespace bin2s

#endif
