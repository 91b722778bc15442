/*
 * ModifiedPeptideClass.cpp
 */

#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <string>
#include <vector>
#include "ModifiedPeptideClass.hpp"
#include "AscoreErrors.hpp"
#include "globals.hpp"

using namespace std;

namespace ascore {


static bool ionCmp(const ionStruct &a, const ionStruct &b) {
	if(a.mz != b.mz) return a.mz < b.mz;
	if(a.ionType != b.ionType) return a.ionType < b.ionType;
	if(a.ionNum != b.ionNum) return a.ionNum < b.ionNum;
	if(a.charge != b.charge) return a.charge < b.charge;
	return a.lossIdx < b.lossIdx;
}

static bool ionBelowMZ(const ionStruct &ion, double mz) {
	return ion.mz < mz;
}



ModifiedPeptideClass::ModifiedPeptideClass(const paramStruct &p) {
	validateParams(p);

	params = p;
	AAmass = initialize_AA_masses();

	numMods = 0;
	nterm_mass = 0;
	cterm_mass = 0;
	peptideConsumed = false;
	peaksConsumed = false;
	numPeaksConsumed = 0;
}



// Function registers a mass offset that is applied to every fragment ion
// holding a placed modification on one of the residues in 'group'.
// Only ladders built by later consumePeptide() calls are affected.
void ModifiedPeptideClass::addNeutralLoss(const string &group, double mass) {

	if(group.empty()) {
		throw ConfigurationError("neutral loss residue group is empty");
	}
	for(int i = 0; i < (signed) group.length(); i++) {
		if(AAmass.find( group.at(i) ) == AAmass.end()) {
			throw ConfigurationError("unknown residue '" + group.substr(i, 1) + "' in neutral loss group");
		}
	}
	if( !isFinite(mass) ) {
		throw ConfigurationError("neutral loss mass is not a finite number");
	}

	neutralLossStruct nl;
	nl.group = group;
	nl.mass = mass;
	neutralLosses.push_back(nl);
}



// Function replaces the current peptide, enumerates all placements of 'n_mods'
// modifications and builds the ion ladder for each of them
void ModifiedPeptideClass::consumePeptide(const string &seq, int n_mods,
		const vector<int> &fixedPos, const vector<double> &fixedMass) {

	peptideConsumed = false;
	peaksConsumed = false;
	numPeaksConsumed = 0;
	peptide.clear();
	candidates.clear();
	signatures.clear();
	signatureIdx.clear();
	ions.clear();
	matchDepth.clear();
	fixedModMass.clear();
	fixedModSite.clear();
	nterm_mass = 0;
	cterm_mass = 0;
	numMods = 0;

	if(seq.empty()) {
		throw InvalidPeptide("peptide sequence is empty");
	}
	for(int i = 0; i < (signed) seq.length(); i++) {
		if(AAmass.find( seq.at(i) ) == AAmass.end()) {
			throw InvalidPeptide("unrecognized residue '" + seq.substr(i, 1) + "' at position "
					+ int2string(i + 1) + " of " + seq);
		}
	}

	if(n_mods < 0) {
		throw InvalidPeptide("number of unlocalized modifications is negative");
	}

	if(fixedPos.size() != fixedMass.size()) {
		throw InvalidPeptide("fixed modification positions and masses differ in length");
	}

	int L = (signed) seq.length();
	vector<double> modMass(L + 2, 0.0);
	vector<bool> modSite(L + 2, false);
	double ntm = 0, ctm = 0;
	for(int i = 0; i < (signed) fixedPos.size(); i++) {
		int pos = fixedPos.at(i);
		double mass = fixedMass.at(i);

		if( (pos < 0) || (pos > L + 1) ) {
			throw InvalidPeptide("fixed modification position " + int2string(pos)
					+ " is outside of " + seq);
		}
		if( !isFinite(mass) ) {
			throw InvalidPeptide("fixed modification mass at position " + int2string(pos) + " is not finite");
		}

		if(pos == 0) ntm += mass;
		else if(pos == L + 1) ctm += mass;
		else modMass[ pos ] += mass;
		modSite[ pos ] = true;
	}

	peptide = seq;
	numMods = n_mods;
	nterm_mass = ntm;
	cterm_mass = ctm;
	fixedModMass.swap(modMass);
	fixedModSite.swap(modSite);

	identifyCandidates();

	if(numMods > (signed) candidates.size()) {
		throw InsufficientCandidates(int2string(numMods) + " modifications requested but "
				+ peptide + " has only " + int2string((signed) candidates.size())
				+ " eligible residues");
	}

	// the number of signatures must fit in a vector
	double numSignatures = combinatorial( (double) candidates.size(), (double) numMods );
	if(numSignatures >= (double) signatures.max_size()) {
		throw ConfigurationError("placing " + int2string(numMods) + " modifications on "
				+ int2string((signed) candidates.size()) + " candidates of " + peptide
				+ " gives " + dbl2string(numSignatures) + " signatures, too many to enumerate");
	}

	enumerateSignatures();

	for(int i = 0; i < (signed) signatures.size(); i++) makeIons(i);

	clearMatches();
	peptideConsumed = true;

	if(params.debug) {
		cerr << "\n## ModifiedPeptideClass::consumePeptide():\n"
			 << "Peptide:        " << peptide << endl
			 << "Modifications:  " << numMods << endl
			 << "Candidates:     " << positions2string(candidates) << endl
			 << "Signatures:     " << signatures.size() << endl
			 << "Neutral losses: " << neutralLosses.size() << endl;
	}
}



// Function records the positions (1-based) of residues that belong to the
// modifiable group and carry no fixed modification
void ModifiedPeptideClass::identifyCandidates() {

	candidates.clear();
	for(int i = 0; i < (signed) peptide.length(); i++) {
		int pos = i + 1;
		if(params.mod_group.find( peptide.at(i) ) == string::npos) continue;
		if(fixedModSite.at(pos)) continue;

		candidates.push_back(pos);
	}
}



// Function generates every numMods-combination of the candidate positions in
// lexicographic order
void ModifiedPeptideClass::enumerateSignatures() {

	int n = (signed) candidates.size();
	int k = numMods;

	signatures.reserve( (size_t) combinatorial(n, k) );

	vector<int> idx(k);
	for(int i = 0; i < k; i++) idx[i] = i;

	while(true) {
		vector<int> curSig(k);
		for(int i = 0; i < k; i++) curSig[i] = candidates[ idx[i] ];

		signatureIdx[ curSig ] = (signed) signatures.size();
		signatures.push_back(curSig);

		// advance to the next combination
		int i = k - 1;
		while( (i >= 0) && (idx[i] == n - k + i) ) i--;
		if(i < 0) break;

		idx[i]++;
		for(int j = i + 1; j < k; j++) idx[j] = idx[j - 1] + 1;
	}
}



// Function fragments the peptide carrying the given signature into its
// N-terminal (b/c) and C-terminal (y/z) ions
void ModifiedPeptideClass::makeIons(int sigIdx) {

	const vector<int> &sig = signatures.at(sigIdx);
	int L = (signed) peptide.length();
	int numNL = (signed) neutralLosses.size();

	vector<double> resMass(L);
	vector<bool> isModified(L, false);
	for(int i = 0; i < L; i++) {
		resMass[i] = AAmass[ peptide.at(i) ] + fixedModMass.at(i + 1);
	}
	for(int j = 0; j < (signed) sig.size(); j++) {
		resMass[ sig[j] - 1 ] += params.mod_mass;
		isModified[ sig[j] - 1 ] = true;
	}

	// lossAt[i][n] is true when residue i carries a placed modification
	// that can undergo neutral loss n
	vector< vector<bool> > lossAt(L, vector<bool>(numNL, false));
	for(int i = 0; i < L; i++) {
		if( !isModified[i] ) continue;
		for(int n = 0; n < numNL; n++) {
			if(neutralLosses[n].group.find( peptide.at(i) ) != string::npos) lossAt[i][n] = true;
		}
	}

	vector<ionStruct> ladder;
	vector<bool> bLoss(numNL, false), yLoss(numNL, false);
	double bMass = nterm_mass;
	double yMass = H2O + cterm_mass;

	for(int len = 1; len < L; len++) {
		int bRes = len - 1; // residue added to the N-terminal fragment
		int yRes = L - len; // residue added to the C-terminal fragment

		bMass += resMass[ bRes ];
		yMass += resMass[ yRes ];
		for(int n = 0; n < numNL; n++) {
			if(lossAt[ bRes ][n]) bLoss[n] = true;
			if(lossAt[ yRes ][n]) yLoss[n] = true;
		}

		for(int t = 0; t < (signed) params.fragment_types.length(); t++) {
			char ionType = params.fragment_types.at(t);

			if(ionType == 'b') generateIonsMZ(ladder, bMass, 'b', len, bLoss);
			else if(ionType == 'c') generateIonsMZ(ladder, bMass + NH3, 'c', len, bLoss);
			else if(ionType == 'y') generateIonsMZ(ladder, yMass, 'y', len, yLoss);
			else if(ionType == 'z') generateIonsMZ(ladder, yMass - NH3 + H, 'z', len, yLoss);
		}
	}

	sort(ladder.begin(), ladder.end(), ionCmp);
	ions.push_back(ladder);
}



// function records the m/z values of the given neutral fragment mass for every
// allowed charge state, plus one ion per applicable neutral loss
void ModifiedPeptideClass::generateIonsMZ(vector<ionStruct> &ladder, double mass, char ionType,
		int ionNum, const vector<bool> &lossApplies) {

	for(int z = 1; z <= params.max_fragment_charge; z++) {

		for(int n = -1; n < (signed) neutralLosses.size(); n++) {
			double curMass = mass;
			if(n >= 0) {
				if( !lossApplies[n] ) continue;
				curMass += neutralLosses[n].mass;
			}

			double mz_value = ( curMass + (PROTON * z) ) / z;
			if( (mz_value <= 0) || (mz_value < params.min_fragment_mz) ) continue;

			ionStruct ion;
			ion.mz = mz_value;
			ion.ionType = ionType;
			ion.ionNum = ionNum;
			ion.charge = z;
			ion.lossIdx = n;
			ladder.push_back(ion);
		}
	}
}



void ModifiedPeptideClass::clearMatches() {
	matchDepth.resize(ions.size());
	for(int i = 0; i < (signed) ions.size(); i++) {
		matchDepth[i].assign(ions[i].size(), 0);
	}
	peaksConsumed = false;
	numPeaksConsumed = 0;
}



// Function matches one observed peak against the ladder of every signature.
// The nearest still unmatched ion within mz_error is assigned the peak depth
// rank+1; a peak is assigned to at most one ion per signature.
void ModifiedPeptideClass::consumePeak(double mz, int rank) {

	if( !peptideConsumed ) {
		throw UsageError("consumePeak() called before a peptide was consumed");
	}
	if( !isFinite(mz) || (rank < 0) ) {
		throw InvalidSpectrum("invalid peak (m/z " + dbl2string(mz) + ", rank " + int2string(rank) + ")");
	}

	peaksConsumed = true;
	numPeaksConsumed++;

	int depth = rank + 1;
	if(depth > params.max_depth) return;

	double a = mz - params.mz_error;
	double b = mz + params.mz_error;

	for(int s = 0; s < (signed) ions.size(); s++) {
		const vector<ionStruct> &ladder = ions[s];
		vector<int> &depths = matchDepth[s];

		vector<ionStruct>::const_iterator iter = lower_bound(ladder.begin(), ladder.end(), a, ionBelowMZ);

		int best = -1;
		double bestDist = 0;
		for(int i = (int) (iter - ladder.begin()); i < (signed) ladder.size(); i++) {
			if(ladder[i].mz > b) break;
			if(depths[i] != 0) continue;

			double dist = fabs(ladder[i].mz - mz);
			if( (best < 0) || (dist < bestDist) ) {
				best = i;
				bestDist = dist;
			}
		}

		if(best >= 0) depths[best] = depth;
	}
}



// Function feeds every peak of the binned spectrum, bin by bin and rank by
// rank, through consumePeak(). Any earlier matches are discarded first.
// A spectrum that was given no peaks at all leaves the match table empty;
// one whose peaks all had zero intensity counts as a pass with no matches.
void ModifiedPeptideClass::consumeSpectrum(const BinnedSpectrumClass &spectrum) {

	if( !peptideConsumed ) {
		throw UsageError("consumeSpectrum() called before a peptide was consumed");
	}

	clearMatches();

	BinnedPeakIterator iter(spectrum);
	while(iter.hasNext()) {
		binnedPeakStruct pk = iter.next();
		consumePeak(pk.mz, pk.rank);
	}

	if(spectrum.getNumInputPeaks() > 0) peaksConsumed = true;
}



const vector<int>& ModifiedPeptideClass::getSignature(int sigIdx) const {
	if( (sigIdx < 0) || (sigIdx >= (signed) signatures.size()) ) {
		throw UsageError("signature index " + int2string(sigIdx) + " is out of range");
	}
	return signatures[sigIdx];
}



// Function returns the index of the signature with the given positions, -1 if
// there is none
int ModifiedPeptideClass::findSignature(const vector<int> &positions) const {
	vector<int> key = positions;
	sort(key.begin(), key.end());

	map< vector<int>, int >::const_iterator iter = signatureIdx.find(key);
	if(iter == signatureIdx.end()) return -1;
	return iter->second;
}



const vector<ionStruct>& ModifiedPeptideClass::getIons(int sigIdx) const {
	getSignature(sigIdx); // range check
	return ions[sigIdx];
}



int ModifiedPeptideClass::getTotalFragments(int sigIdx) const {
	return (signed) getIons(sigIdx).size();
}



// Function returns the cumulative number of matched ions at depths 1..max_depth
vector<int> ModifiedPeptideClass::getMatchCounts(int sigIdx) const {
	getSignature(sigIdx); // range check

	vector<int> counts(params.max_depth, 0);
	const vector<int> &depths = matchDepth[sigIdx];
	for(int i = 0; i < (signed) depths.size(); i++) {
		if(depths[i] > 0) counts[ depths[i] - 1 ]++;
	}
	for(int d = 1; d < (signed) counts.size(); d++) counts[d] += counts[d - 1];

	return counts;
}



vector<matchRowStruct> ModifiedPeptideClass::getMatchTable() const {

	if( !peptideConsumed ) {
		throw EmptyMatchTable("no peptide has been consumed");
	}
	if( !peaksConsumed ) {
		throw EmptyMatchTable("no peaks have been consumed for " + peptide);
	}

	vector<matchRowStruct> ret;
	ret.reserve(signatures.size());
	for(int s = 0; s < (signed) signatures.size(); s++) {
		matchRowStruct row;
		row.signature = signatures[s];
		row.counts = getMatchCounts(s);
		row.totalFragments = (signed) ions[s].size();
		ret.push_back(row);
	}
	return ret;
}



// Function writes the peptide with every modified position followed by its
// added mass in brackets, e.g. n[42.0106]AGS[79.9663]TPR. Masses are written
// with 6 significant digits, so parseAnnotatedPeptide() recovers positions
// exactly but masses only to that precision.
string ModifiedPeptideClass::renderSequence(const vector<int> &signature) const {
	string ret;

	if(nterm_mass != 0) ret += "n[" + dbl2string(nterm_mass) + "]";

	for(int i = 0; i < (signed) peptide.length(); i++) {
		int pos = i + 1;
		double mass = fixedModMass.at(pos);
		if(find(signature.begin(), signature.end(), pos) != signature.end()) mass += params.mod_mass;

		ret += peptide.at(i);
		if(mass != 0) ret += "[" + dbl2string(mass) + "]";
	}

	if(cterm_mass != 0) ret += "c[" + dbl2string(cterm_mass) + "]";

	return ret;
}

} // namespace ascore
