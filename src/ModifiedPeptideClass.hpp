/*
 * ModifiedPeptideClass.hpp
 *
 *  Enumerates every placement ("signature") of the unlocalized modifications
 *  on a peptide, builds the fragment ion ladder of each placement and counts
 *  the ladder ions matched by the peaks it is fed, per peak depth.
 */

#ifndef MODIFIEDPEPTIDECLASS_HPP_
#define MODIFIEDPEPTIDECLASS_HPP_

#include <map>
#include <string>
#include <vector>
#include "structs.hpp"
#include "BinnedSpectrumClass.hpp"

namespace ascore {

class ModifiedPeptideClass {
private:
	paramStruct params;
	std::map<char, double> AAmass;
	std::vector<neutralLossStruct> neutralLosses;

	std::string peptide;
	int numMods;
	double nterm_mass;
	double cterm_mass;
	std::vector<double> fixedModMass; // indexed by 1-based position, 0 and L+1 unused
	std::vector<bool> fixedModSite;   // true where a fixed modification was given, whatever its mass
	std::vector<int> candidates;      // 1-based positions that may carry the modification

	std::vector< std::vector<int> > signatures;
	std::map< std::vector<int>, int > signatureIdx;
	std::vector< std::vector<ionStruct> > ions;  // per signature, sorted by m/z
	std::vector< std::vector<int> > matchDepth;  // per ion, 0 = unmatched

	bool peptideConsumed;
	bool peaksConsumed;
	int numPeaksConsumed;

	void identifyCandidates();
	void enumerateSignatures();
	void makeIons(int sigIdx);
	void generateIonsMZ(std::vector<ionStruct> &ladder, double mass, char ionType,
			int ionNum, const std::vector<bool> &lossApplies);
	void clearMatches();

public:
	explicit ModifiedPeptideClass(const paramStruct &p);

	void addNeutralLoss(const std::string &group, double mass);

	void consumePeptide(const std::string &seq, int n_mods,
			const std::vector<int> &fixedPos = std::vector<int>(),
			const std::vector<double> &fixedMass = std::vector<double>());
	void consumePeak(double mz, int rank);
	void consumeSpectrum(const BinnedSpectrumClass &spectrum);

	const std::string& getPeptide() const { return peptide; }
	int getNumMods() const { return numMods; }
	int getMaxDepth() const { return params.max_depth; }
	double getModMass() const { return params.mod_mass; }
	const std::vector<int>& getCandidates() const { return candidates; }
	const std::vector<neutralLossStruct>& getNeutralLosses() const { return neutralLosses; }
	int getNumPeaksConsumed() const { return numPeaksConsumed; }

	int getNumSignatures() const { return (signed) signatures.size(); }
	const std::vector<int>& getSignature(int sigIdx) const;
	int findSignature(const std::vector<int> &positions) const;
	const std::vector<ionStruct>& getIons(int sigIdx) const;
	int getTotalFragments(int sigIdx) const;
	std::vector<int> getMatchCounts(int sigIdx) const;
	std::vector<matchRowStruct> getMatchTable() const;

	std::string renderSequence(const std::vector<int> &signature) const;
};

} // namespace ascore

#endif /* MODIFIEDPEPTIDECLASS_HPP_ */
