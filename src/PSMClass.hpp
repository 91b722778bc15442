/*
 * PSMClass.hpp
 *
 *  Scores one peptide-spectrum match at a time: bins the spectrum, places
 *  the unlocalized modifications and computes the Ascore. An instance keeps
 *  the state of a single pass and must not be shared between threads.
 */

#ifndef PSMCLASS_HPP_
#define PSMCLASS_HPP_

#include <string>
#include <vector>
#include "structs.hpp"
#include "BinnedSpectrumClass.hpp"
#include "ModifiedPeptideClass.hpp"
#include "AscoreClass.hpp"
#include "AscoreResultClass.hpp"

namespace ascore {

class PSMClass {
private:
	paramStruct params;
	BinnedSpectrumClass spectrum;
	ModifiedPeptideClass modPeptide;
	AscoreClass ascore;

	AscoreResultClass result;
	bool resultReady;

public:
	explicit PSMClass(const paramStruct &p = paramStruct());

	void addNeutralLoss(const std::string &group, double mass);

	const AscoreResultClass& score(const std::vector<double> &mz, const std::vector<double> &intensity,
			const std::string &peptide, int n_mods,
			const std::vector<int> &fixedPos = std::vector<int>(),
			const std::vector<double> &fixedMass = std::vector<double>());

	bool hasResult() const { return resultReady; }
	const AscoreResultClass& getResult() const;

	const paramStruct& getParams() const { return params; }
	const BinnedSpectrumClass& getSpectrum() const { return spectrum; }
	const ModifiedPeptideClass& getModifiedPeptide() const { return modPeptide; }
};

} // namespace ascore

#endif /* PSMCLASS_HPP_ */
