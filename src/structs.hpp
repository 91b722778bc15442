/*
 * structs.hpp
 *
 *  Plain records shared by the binning, placement and scoring classes.
 */

#ifndef STRUCTS_HPP_
#define STRUCTS_HPP_

#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace ascore {

// a single observed peak
struct peakStruct {
	double mz;
	double intensity;
};

// a peak as seen through BinnedPeakIterator
struct binnedPeakStruct {
	int bin;
	int rank; // 0 = most intense peak of the bin
	double mz;
	double intensity;
};

// one theoretical fragment ion
struct ionStruct {
	double mz;
	char ionType;  // b, c, y or z
	int ionNum;    // number of residues in the fragment
	int charge;
	int lossIdx;   // index into the registered neutral losses, -1 if none
};

struct neutralLossStruct {
	std::string group;
	double mass; // signed offset added to the fragment mass
};

// one row of the match table handed from ModifiedPeptideClass to AscoreClass
struct matchRowStruct {
	std::vector<int> signature;
	std::vector<int> counts; // counts[d-1] = ions matched within the top d peaks per bin
	int totalFragments;
};

struct scoreStruct {
	std::vector<int> signature;
	std::vector<int> counts;
	std::vector<double> scores;
	double weightedScore;
	int totalFragments;
	std::string sequence;
};

struct siteStruct {
	int position;
	double ascore;
	std::vector<int> altSites;
};

// peptide plus co-indexed modification arrays, see parseAnnotatedPeptide()
struct annotatedPeptideStruct {
	std::string peptide;
	std::vector<int> modPos;
	std::vector<double> modMass;
};

struct paramStruct {
	double bin_size;
	int n_top;
	std::string mod_group;
	double mod_mass;
	double mz_error;
	std::string fragment_types;
	int max_fragment_charge;
	double min_fragment_mz;
	int max_depth;
	std::vector<double> depth_weights;
	double score_ceiling;
	double unambiguous_ascore;
	bool debug;

	paramStruct()
		: bin_size(100.0),
		  n_top(10),
		  mod_group("STY"),
		  mod_mass(79.966331),
		  mz_error(0.5),
		  fragment_types("by"),
		  max_fragment_charge(1),
		  min_fragment_mz(0.0),
		  max_depth(10),
		  score_ceiling(-10.0 * std::log10(std::numeric_limits<double>::denorm_min())),
		  unambiguous_ascore(1000.0),
		  debug(false) {

		// peak depth weights from the Ascore paper, depth 1 first
		const double wt[] = { 0.5, 0.75, 1, 1, 1, 1, 0.75, 0.5, 0.25, 0.25 };
		depth_weights.assign(wt, wt + 10);
	}
};

} // namespace ascore

#endif /* STRUCTS_HPP_ */
