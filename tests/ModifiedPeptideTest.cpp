/*
 * ModifiedPeptideTest.cpp
 */

#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "ModifiedPeptideClass.hpp"
#include "BinnedSpectrumClass.hpp"
#include "AscoreErrors.hpp"
#include "globals.hpp"

using namespace std;
using namespace ascore;


class ModifiedPeptideTest : public ::testing::Test {
protected:
	paramStruct params;
};


// m/z of the first ion with the given type, length and loss
static double ionMZ(const vector<ionStruct> &ions, char type, int num, int lossIdx = -1) {
	for(int i = 0; i < (signed) ions.size(); i++) {
		if( (ions[i].ionType == type) && (ions[i].ionNum == num) && (ions[i].lossIdx == lossIdx) ) return ions[i].mz;
	}
	return -1;
}


TEST_F(ModifiedPeptideTest, CandidatesAndSignatures) {
	ModifiedPeptideClass modPep(params);
	modPep.consumePeptide("AGSTPR", 1);

	EXPECT_EQ("AGSTPR", modPep.getPeptide());
	EXPECT_EQ(1, modPep.getNumMods());
	EXPECT_DOUBLE_EQ(params.mod_mass, modPep.getModMass());
	EXPECT_EQ(params.max_depth, modPep.getMaxDepth());

	ASSERT_EQ(2, (signed) modPep.getCandidates().size());
	EXPECT_EQ(3, modPep.getCandidates()[0]);
	EXPECT_EQ(4, modPep.getCandidates()[1]);

	ASSERT_EQ(2, modPep.getNumSignatures());
	EXPECT_EQ(vector<int>{ 3 }, modPep.getSignature(0));
	EXPECT_EQ(vector<int>{ 4 }, modPep.getSignature(1));
	EXPECT_EQ(1, modPep.findSignature(vector<int>{ 4 }));
	EXPECT_EQ(-1, modPep.findSignature(vector<int>{ 5 }));
}

TEST_F(ModifiedPeptideTest, SignatureCountIsBinomialCoefficient) {
	ModifiedPeptideClass modPep(params);

	for(int n = 0; n <= 6; n++) {
		modPep.consumePeptide("STYSTY", n);
		EXPECT_EQ(combinatorial(6, n), modPep.getNumSignatures()) << "n = " << n;
	}

	// signatures are distinct position sets in lexicographic order
	modPep.consumePeptide("STYSTY", 2);
	for(int i = 1; i < modPep.getNumSignatures(); i++) {
		EXPECT_LT(modPep.getSignature(i - 1), modPep.getSignature(i));
	}
}

TEST_F(ModifiedPeptideTest, NoModificationsGivesOneEmptySignature) {
	ModifiedPeptideClass modPep(params);
	modPep.consumePeptide("PEPTIDE", 0);

	ASSERT_EQ(1, modPep.getNumSignatures());
	EXPECT_TRUE(modPep.getSignature(0).empty());
	EXPECT_EQ("PEPTIDE", modPep.renderSequence(modPep.getSignature(0)));
}

TEST_F(ModifiedPeptideTest, TooManyModifications) {
	ModifiedPeptideClass modPep(params);
	EXPECT_THROW(modPep.consumePeptide("AGSTPR", 3), InsufficientCandidates);
	EXPECT_THROW(modPep.consumePeptide("AGAAPR", 1), InsufficientCandidates);
	EXPECT_EQ(0, modPep.getNumSignatures());
}

TEST_F(ModifiedPeptideTest, FixedModificationRemovesCandidate) {
	ModifiedPeptideClass modPep(params);
	modPep.consumePeptide("AGSTPR", 1, vector<int>{ 3 }, vector<double>{ 79.966331 });

	ASSERT_EQ(1, (signed) modPep.getCandidates().size());
	EXPECT_EQ(4, modPep.getCandidates()[0]);
	EXPECT_EQ("AGS[79.9663]T[79.9663]PR", modPep.renderSequence(modPep.getSignature(0)));

	EXPECT_THROW(modPep.consumePeptide("AGSTPR", 2, vector<int>{ 3 }, vector<double>{ 79.966331 }), InsufficientCandidates);
}

TEST_F(ModifiedPeptideTest, ZeroMassFixedModificationRemovesCandidate) {
	ModifiedPeptideClass modPep(params);

	modPep.consumePeptide("AGSTPR", 1, vector<int>{ 3 }, vector<double>{ 0.0 });
	ASSERT_EQ(1, (signed) modPep.getCandidates().size());
	EXPECT_EQ(4, modPep.getCandidates()[0]);

	// masses on one residue that cancel out still occupy it
	modPep.consumePeptide("AGSTPR", 1, vector<int>{ 4, 4 }, vector<double>{ 15.994915, -15.994915 });
	ASSERT_EQ(1, (signed) modPep.getCandidates().size());
	EXPECT_EQ(3, modPep.getCandidates()[0]);
	EXPECT_EQ("AGS[79.9663]TPR", modPep.renderSequence(modPep.getSignature(0)));
}

TEST_F(ModifiedPeptideTest, TooManySignaturesToEnumerate) {
	ModifiedPeptideClass modPep(params);

	// C(70,35) placements
	EXPECT_THROW(modPep.consumePeptide(string(70, 'S'), 35), ConfigurationError);
	EXPECT_EQ(0, modPep.getNumSignatures());
	EXPECT_THROW(modPep.getMatchTable(), EmptyMatchTable);

	modPep.consumePeptide(string(20, 'S'), 2);
	EXPECT_EQ(190, modPep.getNumSignatures());
}

TEST_F(ModifiedPeptideTest, RejectsInvalidPeptides) {
	ModifiedPeptideClass modPep(params);

	EXPECT_THROW(modPep.consumePeptide("", 0), InvalidPeptide);
	EXPECT_THROW(modPep.consumePeptide("AGZSTPR", 1), InvalidPeptide);
	EXPECT_THROW(modPep.consumePeptide("agstpr", 1), InvalidPeptide);
	EXPECT_THROW(modPep.consumePeptide("AGSTPR", -1), InvalidPeptide);
	EXPECT_THROW(modPep.consumePeptide("AGSTPR", 1, vector<int>{ 1, 2 }, vector<double>{ 1.0 }), InvalidPeptide);
	EXPECT_THROW(modPep.consumePeptide("AGSTPR", 1, vector<int>{ 8 }, vector<double>{ 1.0 }), InvalidPeptide);
	EXPECT_THROW(modPep.consumePeptide("AGSTPR", 1, vector<int>{ -1 }, vector<double>{ 1.0 }), InvalidPeptide);
}

TEST_F(ModifiedPeptideTest, BYLadderMasses) {
	ModifiedPeptideClass modPep(params);
	modPep.consumePeptide("AGSTPR", 1);

	const vector<ionStruct> &ions = modPep.getIons( modPep.findSignature(vector<int>{ 3 }) );
	EXPECT_EQ(10, (signed) ions.size());
	EXPECT_EQ(10, modPep.getTotalFragments(0));

	EXPECT_NEAR(72.04439, ionMZ(ions, 'b', 1), 1e-4);
	EXPECT_NEAR(129.06585, ionMZ(ions, 'b', 2), 1e-4);
	EXPECT_NEAR(296.06421, ionMZ(ions, 'b', 3), 1e-4);
	EXPECT_NEAR(175.11894, ionMZ(ions, 'y', 1), 1e-4);
	EXPECT_NEAR(540.21774, ionMZ(ions, 'y', 4), 1e-4);

	// sorted by m/z
	for(int i = 1; i < (signed) ions.size(); i++) EXPECT_LE(ions[i - 1].mz, ions[i].mz);
}

TEST_F(ModifiedPeptideTest, TerminalModificationsShiftLadders) {
	ModifiedPeptideClass modPep(params);
	modPep.consumePeptide("AGSTPR", 1, vector<int>{ 0, 7 }, vector<double>{ 42.010565, 1.0 });

	const vector<ionStruct> &ions = modPep.getIons(0);
	EXPECT_NEAR(72.04439 + 42.010565, ionMZ(ions, 'b', 1), 1e-4);
	EXPECT_NEAR(175.11894 + 1.0, ionMZ(ions, 'y', 1), 1e-4);
	EXPECT_EQ("n[42.0106]AGS[79.9663]TPRc[1]", modPep.renderSequence(modPep.getSignature(0)));
}

TEST_F(ModifiedPeptideTest, AdditionalIonTypesAndCharges) {
	params.fragment_types = "bcyz";
	params.max_fragment_charge = 2;
	ModifiedPeptideClass modPep(params);
	modPep.consumePeptide("AGSTPR", 1);

	const vector<ionStruct> &ions = modPep.getIons(0);
	EXPECT_EQ(5 * 4 * 2, (signed) ions.size());

	double b2 = ionMZ(ions, 'b', 2);
	EXPECT_NEAR(b2 + NH3, ionMZ(ions, 'c', 2), 1e-6);
	EXPECT_NEAR(ionMZ(ions, 'y', 2) - 16.018724, ionMZ(ions, 'z', 2), 1e-4);

	int doubly = 0;
	for(int i = 0; i < (signed) ions.size(); i++) {
		if( (ions[i].charge == 2) && (ions[i].ionType == 'b') && (ions[i].ionNum == 2) ) {
			EXPECT_NEAR((b2 + PROTON) / 2.0, ions[i].mz, 1e-6);
			doubly++;
		}
	}
	EXPECT_EQ(1, doubly);
}

TEST_F(ModifiedPeptideTest, MinimumFragmentMZ) {
	params.min_fragment_mz = 150.0;
	ModifiedPeptideClass modPep(params);
	modPep.consumePeptide("AGSTPR", 1);

	// b1 (72.04) and b2 (129.07) are dropped
	EXPECT_EQ(8, modPep.getTotalFragments(0));
}

TEST_F(ModifiedPeptideTest, NeutralLossDuplicatesModifiedFragments) {
	ModifiedPeptideClass modPep(params);
	modPep.addNeutralLoss("STY", -97.976896);
	modPep.consumePeptide("AGSTPR", 1);

	// b3, b4, b5, y4, y5 contain S3; b4, b5, y3, y4, y5 contain T4
	EXPECT_EQ(15, modPep.getTotalFragments( modPep.findSignature(vector<int>{ 3 }) ));
	EXPECT_EQ(15, modPep.getTotalFragments( modPep.findSignature(vector<int>{ 4 }) ));

	const vector<ionStruct> &ions = modPep.getIons(0);
	EXPECT_NEAR(ionMZ(ions, 'b', 3) - 97.976896, ionMZ(ions, 'b', 3, 0), 1e-6);
	EXPECT_LT(ionMZ(ions, 'b', 2, 0), 0); // no loss without the modification
}

TEST_F(ModifiedPeptideTest, NeutralLossGroupMustContainModifiedResidue) {
	ModifiedPeptideClass modPep(params);
	modPep.addNeutralLoss("Y", -97.976896);
	modPep.consumePeptide("AGSTPR", 1);

	EXPECT_EQ(10, modPep.getTotalFragments(0));
}

TEST_F(ModifiedPeptideTest, NeutralLossOnlyAffectsLaterPeptides) {
	ModifiedPeptideClass modPep(params);
	modPep.consumePeptide("AGSTPR", 1);
	modPep.addNeutralLoss("STY", -97.976896);

	EXPECT_EQ(10, modPep.getTotalFragments(0));

	modPep.consumePeptide("AGSTPR", 1);
	EXPECT_EQ(15, modPep.getTotalFragments(0));

	EXPECT_THROW(modPep.addNeutralLoss("", -18.0), ConfigurationError);
	EXPECT_THROW(modPep.addNeutralLoss("SB", -18.0), ConfigurationError);
}

TEST_F(ModifiedPeptideTest, PeakMatchesAtMostOneIon) {
	ModifiedPeptideClass modPep(params);
	modPep.consumePeptide("AGSTPR", 1);

	double b2 = ionMZ(modPep.getIons(0), 'b', 2);
	modPep.consumePeak(b2 + 0.1, 0);
	modPep.consumePeak(b2 - 0.1, 1); // the b2 ion is already taken

	vector<int> counts = modPep.getMatchCounts(0);
	ASSERT_EQ(10, (signed) counts.size());
	for(int d = 0; d < 10; d++) EXPECT_EQ(1, counts[d]);
	EXPECT_EQ(2, modPep.getNumPeaksConsumed());
}

TEST_F(ModifiedPeptideTest, MatchDepthFollowsRank) {
	ModifiedPeptideClass modPep(params);
	modPep.consumePeptide("AGSTPR", 1);

	const vector<ionStruct> &ions = modPep.getIons(0);
	modPep.consumePeak(ionMZ(ions, 'y', 1), 2);
	modPep.consumePeak(ionMZ(ions, 'b', 2), 0);
	modPep.consumePeak(ionMZ(ions, 'y', 2), 9);
	modPep.consumePeak(ionMZ(ions, 'y', 3), 10); // deeper than max_depth
	modPep.consumePeak(400.0, 0);                // matches nothing

	vector<int> counts = modPep.getMatchCounts(0);
	EXPECT_EQ(1, counts[0]);
	EXPECT_EQ(1, counts[1]);
	EXPECT_EQ(2, counts[2]);
	EXPECT_EQ(2, counts[8]);
	EXPECT_EQ(3, counts[9]);
}

TEST_F(ModifiedPeptideTest, ToleranceWindow) {
	params.mz_error = 0.05;
	ModifiedPeptideClass modPep(params);
	modPep.consumePeptide("AGSTPR", 1);

	double b2 = ionMZ(modPep.getIons(0), 'b', 2);
	modPep.consumePeak(b2 + 0.2, 0);
	EXPECT_EQ(0, modPep.getMatchCounts(0)[9]);

	modPep.consumePeak(b2 + 0.04, 0);
	EXPECT_EQ(1, modPep.getMatchCounts(0)[9]);
}

TEST_F(ModifiedPeptideTest, CountsAreMonotonicOverDepth) {
	ModifiedPeptideClass modPep(params);
	modPep.consumePeptide("GSTYPSR", 2);

	vector<double> mz, intensity;
	for(int i = 0; i < 200; i++) {
		mz.push_back(60.0 + i * 3.7);
		intensity.push_back( (double) ((i * 37) % 101 + 1) );
	}
	BinnedSpectrumClass spec(100.0, 10);
	spec.consumeSpectrum(mz, intensity);
	modPep.consumeSpectrum(spec);

	vector<matchRowStruct> table = modPep.getMatchTable();
	ASSERT_EQ(modPep.getNumSignatures(), (signed) table.size());
	for(int s = 0; s < (signed) table.size(); s++) {
		for(int d = 1; d < (signed) table[s].counts.size(); d++) {
			EXPECT_LE(table[s].counts[d - 1], table[s].counts[d]);
		}
		EXPECT_LE(table[s].counts.back(), table[s].totalFragments);
	}
}

TEST_F(ModifiedPeptideTest, ConsumeSpectrumStartsFromScratch) {
	ModifiedPeptideClass modPep(params);
	modPep.consumePeptide("AGSTPR", 1);

	double b2 = ionMZ(modPep.getIons(0), 'b', 2);
	BinnedSpectrumClass spec(100.0, 10);
	spec.consumeSpectrum(vector<double>{ b2 }, vector<double>{ 10 });

	modPep.consumeSpectrum(spec);
	modPep.consumeSpectrum(spec);
	EXPECT_EQ(1, modPep.getMatchCounts(0)[9]);
	EXPECT_EQ(1, modPep.getNumPeaksConsumed());
}

TEST_F(ModifiedPeptideTest, MatchTableRequiresPeptideAndPeaks) {
	ModifiedPeptideClass modPep(params);
	EXPECT_THROW(modPep.getMatchTable(), EmptyMatchTable);
	EXPECT_THROW(modPep.consumePeak(100.0, 0), UsageError);

	modPep.consumePeptide("AGSTPR", 1);
	EXPECT_THROW(modPep.getMatchTable(), EmptyMatchTable);

	// a spectrum without any peaks leaves nothing to score
	BinnedSpectrumClass spec(100.0, 10);
	spec.consumeSpectrum(vector<double>(), vector<double>());
	modPep.consumeSpectrum(spec);
	EXPECT_THROW(modPep.getMatchTable(), EmptyMatchTable);

	// zero intensity peaks are consumed but match nothing
	spec.consumeSpectrum(vector<double>{ 129.06585, 175.11894 }, vector<double>{ 0, 0 });
	modPep.consumeSpectrum(spec);
	vector<matchRowStruct> table = modPep.getMatchTable();
	ASSERT_EQ(2, (signed) table.size());
	EXPECT_EQ(0, table[0].counts.back());
	EXPECT_EQ(0, modPep.getNumPeaksConsumed());

	// a new peptide invalidates the table again
	modPep.consumePeptide("AGSTPR", 1);
	EXPECT_THROW(modPep.getMatchTable(), EmptyMatchTable);
}

TEST_F(ModifiedPeptideTest, RenderedMassesKeepSixSignificantDigits) {
	ModifiedPeptideClass modPep(params);
	modPep.consumePeptide("AGSTPR", 1, vector<int>{ 0, 7 }, vector<double>{ 42.010565, 0.984016 });

	string rendered = modPep.renderSequence(vector<int>{ 4 });
	EXPECT_EQ("n[42.0106]AGST[79.9663]PRc[0.984016]", rendered);

	// positions come back exactly, masses at the rendered precision
	annotatedPeptideStruct ap = parseAnnotatedPeptide(rendered);
	EXPECT_EQ("AGSTPR", ap.peptide);
	EXPECT_EQ((vector<int>{ 0, 4, 7 }), ap.modPos);
	ASSERT_EQ(3, (signed) ap.modMass.size());
	EXPECT_DOUBLE_EQ(42.0106, ap.modMass[0]);
	EXPECT_DOUBLE_EQ(79.9663, ap.modMass[1]);
	EXPECT_DOUBLE_EQ(0.984016, ap.modMass[2]);
	EXPECT_NEAR(42.010565, ap.modMass[0], 5e-5);
}

TEST_F(ModifiedPeptideTest, RenderSequence) {
	ModifiedPeptideClass modPep(params);
	modPep.consumePeptide("AGSTPR", 1);

	EXPECT_EQ("AGS[79.9663]TPR", modPep.renderSequence(vector<int>{ 3 }));
	EXPECT_EQ("AGST[79.9663]PR", modPep.renderSequence(vector<int>{ 4 }));

	annotatedPeptideStruct ap = parseAnnotatedPeptide( modPep.renderSequence(vector<int>{ 4 }) );
	EXPECT_EQ("AGSTPR", ap.peptide);
	EXPECT_EQ(vector<int>{ 4 }, ap.modPos);
}
