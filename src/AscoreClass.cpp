/*
 * AscoreClass.cpp
 *
 *  Peptide score and per-site Ascore as described by Beausoleil et al.
 *  (Nat. Biotechnol. 2006): a cumulative binomial probability of the matched
 *  ion count at each peak depth, weighted across depths.
 */

#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <string>
#include <vector>
#include "AscoreClass.hpp"
#include "AscoreErrors.hpp"
#include "globals.hpp"
#include "statsFunctions.hpp"

using namespace std;

namespace ascore {


AscoreClass::AscoreClass(const paramStruct &p) {
	validateParams(p);
	params = p;
	scored = false;
}



// Function scores every signature held by 'modPeptide' against the peaks it
// has consumed and returns the best placement with its site scores
AscoreResultClass AscoreClass::score(const BinnedSpectrumClass &spectrum, const ModifiedPeptideClass &modPeptide) {

	scored = false;
	scoreContainers.clear();
	containerIdx.clear();
	candidates.clear();

	vector<matchRowStruct> table = modPeptide.getMatchTable();
	if(table.empty()) {
		throw EmptyMatchTable("match table of " + modPeptide.getPeptide() + " has no signatures");
	}
	if( (signed) table[0].counts.size() != params.max_depth ) {
		throw ConfigurationError("match table covers " + int2string((signed) table[0].counts.size())
				+ " peak depths but the scorer expects " + int2string(params.max_depth));
	}

	for(int i = 0; i < (signed) table.size(); i++) {
		scoreStruct sc = scoreSignature(table[i], spectrum.getBinSize());
		sc.sequence = modPeptide.renderSequence(sc.signature);

		containerIdx[ sc.signature ] = (signed) scoreContainers.size();
		scoreContainers.push_back(sc);
	}
	candidates = modPeptide.getCandidates();
	scored = true;

	const scoreStruct &best = scoreContainers.at( findBestSignature() );

	vector<siteStruct> sites;
	for(int i = 0; i < (signed) best.signature.size(); i++) {
		sites.push_back( evaluateSite(best.signature, best.signature[i]) );
	}

	if(params.debug) {
		cerr << "\n## AscoreClass::score():\n"
			 << "Signatures:     " << scoreContainers.size() << endl
			 << "Best sequence:  " << best.sequence << endl
			 << "PeptideScore:   " << best.weightedScore << endl
			 << "Fragments:      " << best.totalFragments << endl;
		for(int i = 0; i < (signed) sites.size(); i++) {
			cerr << "Site " << sites[i].position << ":         Ascore " << sites[i].ascore
				 << ", alternatives " << positions2string(sites[i].altSites) << endl;
		}
	}

	return AscoreResultClass(best.sequence, best.weightedScore, best.signature, sites, scoreContainers);
}



// Function computes the per-depth scores and the weighted peptide score of
// one match table row. At depth d the chance of a random ion match is taken
// to be d peaks per bin width.
scoreStruct AscoreClass::scoreSignature(const matchRowStruct &row, double binSize) const {
	scoreStruct ret;

	ret.signature = row.signature;
	ret.counts = row.counts;
	ret.totalFragments = row.totalFragments;

	for(int d = 1; d <= params.max_depth; d++) {
		double pr = min(1.0, ((double) d) / binSize);
		int k = row.counts.at(d - 1);

		ret.scores.push_back( binomialScore(row.totalFragments, k, pr, params.score_ceiling) );
	}

	ret.weightedScore = weightedMean(ret.scores, params.depth_weights);
	return ret;
}



// Function returns the index of the highest scoring signature. Ties go to the
// lexicographically lowest position set.
int AscoreClass::findBestSignature() const {
	int ret = 0;

	for(int i = 1; i < (signed) scoreContainers.size(); i++) {
		const scoreStruct &cur = scoreContainers[i];
		const scoreStruct &best = scoreContainers[ret];

		if(cur.weightedScore > best.weightedScore) ret = i;
		else if( (cur.weightedScore == best.weightedScore) && (cur.signature < best.signature) ) ret = i;
	}

	return ret;
}



// Function computes the Ascore of 'site' within 'signature': the drop in
// weighted score when the site is moved to the strongest free candidate with
// every other placed position held fixed. Candidates giving the identical
// match counts are reported as alternative sites.
siteStruct AscoreClass::evaluateSite(const vector<int> &signature, int site) const {

	if( !scored ) {
		throw UsageError("evaluateSite() called before score()");
	}

	vector<int> key = signature;
	sort(key.begin(), key.end());

	map< vector<int>, int >::const_iterator refIter = containerIdx.find(key);
	if(refIter == containerIdx.end()) {
		throw UsageError("signature " + positions2string(key) + " was not scored");
	}
	if(find(key.begin(), key.end(), site) == key.end()) {
		throw UsageError("position " + int2string(site) + " is not part of signature " + positions2string(key));
	}

	const scoreStruct &ref = scoreContainers[ refIter->second ];

	siteStruct ret;
	ret.position = site;
	ret.ascore = params.unambiguous_ascore;

	bool haveCompetitor = false;
	double bestAltScore = 0;

	for(int i = 0; i < (signed) candidates.size(); i++) {
		int c = candidates[i];
		if(find(key.begin(), key.end(), c) != key.end()) continue;

		vector<int> swapped = key;
		replace(swapped.begin(), swapped.end(), site, c);
		sort(swapped.begin(), swapped.end());

		map< vector<int>, int >::const_iterator altIter = containerIdx.find(swapped);
		if(altIter == containerIdx.end()) continue;

		const scoreStruct &alt = scoreContainers[ altIter->second ];

		if( !haveCompetitor || (alt.weightedScore > bestAltScore) ) {
			bestAltScore = alt.weightedScore;
			haveCompetitor = true;
		}

		if( (alt.counts == ref.counts) && (alt.totalFragments == ref.totalFragments) ) {
			ret.altSites.push_back(c);
		}
	}

	if(haveCompetitor) ret.ascore = ref.weightedScore - bestAltScore;

	return ret;
}



const vector<scoreStruct>& AscoreClass::getScoreContainers() const {
	if( !scored ) {
		throw UsageError("getScoreContainers() called before score()");
	}
	return scoreContainers;
}

} // namespace ascore
