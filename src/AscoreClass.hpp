/*
 * AscoreClass.hpp
 *
 *  Turns the match table of a ModifiedPeptideClass into peptide scores,
 *  picks the best placement and computes the per-site Ascore.
 */

#ifndef ASCORECLASS_HPP_
#define ASCORECLASS_HPP_

#include <map>
#include <vector>
#include "structs.hpp"
#include "BinnedSpectrumClass.hpp"
#include "ModifiedPeptideClass.hpp"
#include "AscoreResultClass.hpp"

namespace ascore {

class AscoreClass {
private:
	paramStruct params;

	std::vector<scoreStruct> scoreContainers;
	std::map< std::vector<int>, int > containerIdx;
	std::vector<int> candidates;
	bool scored;

	scoreStruct scoreSignature(const matchRowStruct &row, double binSize) const;
	int findBestSignature() const;

public:
	explicit AscoreClass(const paramStruct &p);

	AscoreResultClass score(const BinnedSpectrumClass &spectrum, const ModifiedPeptideClass &modPeptide);

	siteStruct evaluateSite(const std::vector<int> &signature, int site) const;
	const std::vector<scoreStruct>& getScoreContainers() const;
};

} // namespace ascore

#endif /* ASCORECLASS_HPP_ */
