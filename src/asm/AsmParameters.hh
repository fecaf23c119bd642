#ifndef ASMPARAMETERS_HH
#define ASMPARAMETERS_HH

namespace bin2s {

/** Layout parameters of a generated assembly module.
  */
struct AsmParameters
{
	static constexpr int DEFAULT_ALIGNMENT = 4;
	static constexpr int DEFAULT_LINE_LENGTH = 16;

	/** Boundary alignment of the data, in bytes. */
	int alignment = DEFAULT_ALIGNMENT;
	/** Number of bytes per '.byte' line. */
	int lineLength = DEFAULT_LINE_LENGTH;

	/** @throws ParameterException when a value is not strictly positive.
	  */
	void validate() const;

	[[nodiscard]] bool operator==(const AsmParameters&) const = default;
};

} // namespace bin2s

#endif
