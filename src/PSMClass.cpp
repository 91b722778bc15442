/*
 * PSMClass.cpp
 */

#include <iostream>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp> // to time each scoring pass
#include "PSMClass.hpp"
#include "AscoreErrors.hpp"
#include "globals.hpp"

using namespace std;

namespace ascore {


// validateParams() runs before any member is built so a bad configuration is
// always reported as a ConfigurationError
static const paramStruct& checkedParams(const paramStruct &p) {
	validateParams(p);
	return p;
}



PSMClass::PSMClass(const paramStruct &p)
	: params( checkedParams(p) ),
	  spectrum(p.bin_size, p.n_top),
	  modPeptide(p),
	  ascore(p),
	  resultReady(false) {

	if(params.debug) {
		cerr << "\n==============================================================\n"
			 << "Run parameters:\n"
			 << getExecutionParameters(params)
			 << "==============================================================\n";
	}
}



void PSMClass::addNeutralLoss(const string &group, double mass) {
	modPeptide.addNeutralLoss(group, mass);
}



// Function runs one complete scoring pass. Any previous result is discarded
// first, so a failed pass leaves nothing to read.
const AscoreResultClass& PSMClass::score(const vector<double> &mz, const vector<double> &intensity,
		const string &peptide, int n_mods,
		const vector<int> &fixedPos, const vector<double> &fixedMass) {

	resultReady = false;
	result = AscoreResultClass();

	boost::posix_time::ptime start_time(boost::posix_time::microsec_clock::local_time());

	spectrum.consumeSpectrum(mz, intensity);
	modPeptide.consumePeptide(peptide, n_mods, fixedPos, fixedMass);
	modPeptide.consumeSpectrum(spectrum);

	result = ascore.score(spectrum, modPeptide);
	resultReady = true;

	if(params.debug) {
		boost::posix_time::ptime end_time(boost::posix_time::microsec_clock::local_time());
		boost::posix_time::time_duration delta( end_time - start_time );

		cerr << "\n## PSMClass::score():\n"
			 << "Peptide:        " << peptide << endl
			 << "Peaks kept:     " << spectrum.getNumPeaks() << " in " << spectrum.getNumBins() << " bins\n"
			 << "Best sequence:  " << result.getBestSequence() << endl
			 << "Run time:       " << boost::posix_time::to_simple_string(delta) << endl;
	}

	return result;
}



const AscoreResultClass& PSMClass::getResult() const {
	if( !resultReady ) {
		throw UsageError("no scoring result is available, score() has not completed");
	}
	return result;
}

} // namespace ascore
