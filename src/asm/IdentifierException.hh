#ifndef IDENTIFIEREXCEPTION_HH
#define IDENTIFIEREXCEPTION_HH

#include "Bin2sException.hh"

namespace bin2s {

class IdentifierException final : public Bin2sException
{
public:
	using Bin2sException::Bin2sException;
};

} // namespace bin2s

#endif
