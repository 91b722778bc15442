/*
 * AscoreErrors.hpp
 *
 *  Exceptions thrown by the scoring pipeline. None of them is retried or
 *  converted into a default value.
 */

#ifndef ASCOREERRORS_HPP_
#define ASCOREERRORS_HPP_

#include <stdexcept>
#include <string>

namespace ascore {

class AscoreError : public std::runtime_error {
public:
	explicit AscoreError(const std::string &what) : std::runtime_error(what) {}
};

// malformed or mismatched peak arrays
class InvalidSpectrum : public AscoreError {
public:
	explicit InvalidSpectrum(const std::string &what) : AscoreError(what) {}
};

// empty sequence, unknown residue, bad fixed modification arrays
class InvalidPeptide : public AscoreError {
public:
	explicit InvalidPeptide(const std::string &what) : AscoreError(what) {}
};

// more unlocalized modifications than eligible residues
class InsufficientCandidates : public AscoreError {
public:
	explicit InsufficientCandidates(const std::string &what) : AscoreError(what) {}
};

class ConfigurationError : public AscoreError {
public:
	explicit ConfigurationError(const std::string &what) : AscoreError(what) {}
};

// scoring requested before a peptide and its peaks were consumed
class EmptyMatchTable : public AscoreError {
public:
	explicit EmptyMatchTable(const std::string &what) : AscoreError(what) {}
};

// calls made out of order, e.g. reading a result that was never produced
class UsageError : public AscoreError {
public:
	explicit UsageError(const std::string &what) : AscoreError(what) {}
};

} // namespace ascore

#endif /* ASCOREERRORS_HPP_ */
