/*
 * AscoreResultClass.hpp
 *
 *  Immutable outcome of one scoring pass. Accessors return the object's own
 *  copies, so a result can be kept after the scorer moves on.
 */

#ifndef ASCORERESULTCLASS_HPP_
#define ASCORERESULTCLASS_HPP_

#include <string>
#include <vector>
#include "structs.hpp"

namespace ascore {

class AscoreResultClass {
private:
	std::string bestSequence;
	double bestScore;
	std::vector<int> bestSignature;
	std::vector<siteStruct> sites;
	std::vector<scoreStruct> scoreTable;

public:
	AscoreResultClass();
	AscoreResultClass(const std::string &seq, double score, const std::vector<int> &signature,
			const std::vector<siteStruct> &siteVec, const std::vector<scoreStruct> &table);

	const std::string& getBestSequence() const { return bestSequence; }
	double getBestScore() const { return bestScore; }
	const std::vector<int>& getBestSignature() const { return bestSignature; }
	const std::vector<siteStruct>& getSites() const { return sites; }
	const std::vector<scoreStruct>& getScoreTable() const { return scoreTable; }

	std::vector<double> getAscores() const;
	std::vector< std::vector<int> > getAlternativeSites() const;

	std::string toString() const;
};

} // namespace ascore

#endif /* ASCORERESULTCLASS_HPP_ */
