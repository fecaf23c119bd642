#ifndef FILEEXCEPTION_HH
#define FILEEXCEPTION_HH

#include "Bin2sException.hh"

namespace bin2s {

class FileException : public Bin2sException
{
public:
	using Bin2sException::Bin2sException;
};

} // namespace bin2s

#endif
