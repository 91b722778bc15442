/*
 * AscoreResultClass.cpp
 */

#include <sstream>
#include <string>
#include <vector>
#include "AscoreResultClass.hpp"
#include "globals.hpp"

using namespace std;

namespace ascore {


AscoreResultClass::AscoreResultClass() {
	bestScore = 0;
}



AscoreResultClass::AscoreResultClass(const string &seq, double score, const vector<int> &signature,
		const vector<siteStruct> &siteVec, const vector<scoreStruct> &table)
	: bestSequence(seq),
	  bestScore(score),
	  bestSignature(signature),
	  sites(siteVec),
	  scoreTable(table) {
}



// one Ascore per modified site of the best signature, in sequence order
vector<double> AscoreResultClass::getAscores() const {
	vector<double> ret;
	for(int i = 0; i < (signed) sites.size(); i++) ret.push_back( sites[i].ascore );
	return ret;
}



vector< vector<int> > AscoreResultClass::getAlternativeSites() const {
	vector< vector<int> > ret;
	for(int i = 0; i < (signed) sites.size(); i++) ret.push_back( sites[i].altSites );
	return ret;
}



// Function writes the result and the per-signature table as tab delimited text
string AscoreResultClass::toString() const {
	stringstream ss;

	ss << "Best sequence:\t" << bestSequence << "\n"
	   << "Best score:\t" << bestScore << "\n";

	for(int i = 0; i < (signed) sites.size(); i++) {
		ss << "Site " << sites[i].position << ":\tAscore " << sites[i].ascore
		   << "\talternatives " << positions2string(sites[i].altSites) << "\n";
	}

	ss << "signature\tsequence\tweighted_score\ttotal_fragments\tcounts\tscores\n";
	for(int i = 0; i < (signed) scoreTable.size(); i++) {
		const scoreStruct &row = scoreTable[i];
		ss << positions2string(row.signature) << "\t"
		   << row.sequence << "\t"
		   << row.weightedScore << "\t"
		   << row.totalFragments << "\t";

		for(int d = 0; d < (signed) row.counts.size(); d++) ss << (d ? "," : "") << row.counts[d];
		ss << "\t";
		for(int d = 0; d < (signed) row.scores.size(); d++) ss << (d ? "," : "") << row.scores[d];
		ss << "\n";
	}

	return ss.str();
}

} // namespace ascore
