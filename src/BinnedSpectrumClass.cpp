/*
 * BinnedSpectrumClass.cpp
 */

#include <algorithm>
#include <cmath>
#include <vector>
#include "BinnedSpectrumClass.hpp"
#include "AscoreErrors.hpp"
#include "globals.hpp"

using namespace std;

namespace ascore {


// most intense first, ties broken by ascending m/z so the input order never matters
static bool peakRankCmp(const peakStruct &a, const peakStruct &b) {
	if(a.intensity != b.intensity) return a.intensity > b.intensity;
	return a.mz < b.mz;
}



BinnedSpectrumClass::BinnedSpectrumClass(double bin_size, int n_top) {

	if( !isFinite(bin_size) || (bin_size <= 0) ) {
		throw ConfigurationError("bin size must be a positive number, got " + dbl2string(bin_size));
	}
	if(n_top < 1) {
		throw ConfigurationError("the number of peaks kept per bin must be at least 1, got " + int2string(n_top));
	}

	binSize = bin_size;
	nTop = n_top;
	maxMZ = 0;
	numPeaks = 0;
	numInputPeaks = 0;
}



void BinnedSpectrumClass::consumeSpectrum(const vector<double> &mz, const vector<double> &intensity) {

	if(mz.size() != intensity.size()) {
		bins.clear();
		maxMZ = 0;
		numPeaks = 0;
		numInputPeaks = 0;
		throw InvalidSpectrum("m/z and intensity arrays differ in length ("
				+ int2string((signed) mz.size()) + " vs "
				+ int2string((signed) intensity.size()) + ")");
	}

	if(mz.empty()) consumeSpectrum(NULL, NULL, 0);
	else consumeSpectrum(&mz[0], &intensity[0], mz.size());
}



// Function replaces the current spectrum with the given peak list.
// Peaks with zero intensity carry no evidence and are not kept.
void BinnedSpectrumClass::consumeSpectrum(const double *mz, const double *intensity, size_t n) {

	bins.clear();
	maxMZ = 0;
	numPeaks = 0;
	numInputPeaks = 0;

	if( (n > 0) && ((mz == NULL) || (intensity == NULL)) ) {
		throw InvalidSpectrum("missing peak array");
	}

	// validate everything before building any bins
	double topMZ = 0;
	for(size_t i = 0; i < n; i++) {
		if( !isFinite(mz[i]) || (mz[i] < 0) ) {
			throw InvalidSpectrum("peak " + int2string((int) i) + " has an invalid m/z value: " + dbl2string(mz[i]));
		}
		if( !isFinite(intensity[i]) || (intensity[i] < 0) ) {
			throw InvalidSpectrum("peak " + int2string((int) i) + " has an invalid intensity: " + dbl2string(intensity[i]));
		}
		if(mz[i] > topMZ) topMZ = mz[i];
	}

	if(n == 0) return;

	int numBins = (int) floor(topMZ / binSize) + 1;
	vector< vector<peakStruct> > newBins(numBins);

	for(size_t i = 0; i < n; i++) {
		if(intensity[i] == 0) continue;

		int idx = (int) floor(mz[i] / binSize);
		if(idx >= numBins) idx = numBins - 1; // guards rounding at the upper edge

		peakStruct pk;
		pk.mz = mz[i];
		pk.intensity = intensity[i];
		newBins[ idx ].push_back(pk);
	}

	for(int i = 0; i < numBins; i++) {
		vector<peakStruct> &curBin = newBins[i];
		sort(curBin.begin(), curBin.end(), peakRankCmp);
		if( (signed) curBin.size() > nTop ) curBin.resize(nTop);
		numPeaks += (signed) curBin.size();
	}

	bins.swap(newBins);
	maxMZ = topMZ;
	numInputPeaks = (int) n;
}



const vector<peakStruct>& BinnedSpectrumClass::getBin(int idx) const {
	if( (idx < 0) || (idx >= (signed) bins.size()) ) {
		throw UsageError("bin index " + int2string(idx) + " is out of range");
	}
	return bins[idx];
}




BinnedPeakIterator::BinnedPeakIterator(const BinnedSpectrumClass &src) {
	spectrum = &src;
	reset();
}



void BinnedPeakIterator::reset() {
	curBin = 0;
	curRank = 0;
	skipEmptyBins();
}



// moves curBin forward to the next bin that still has a peak at curRank
void BinnedPeakIterator::skipEmptyBins() {
	int N = spectrum->getNumBins();
	while( (curBin < N) && (curRank >= (signed) spectrum->getBin(curBin).size()) ) {
		curBin++;
		curRank = 0;
	}
}



bool BinnedPeakIterator::hasNext() const {
	return curBin < spectrum->getNumBins();
}



binnedPeakStruct BinnedPeakIterator::next() {
	if( !hasNext() ) {
		throw UsageError("BinnedPeakIterator advanced past the last peak");
	}

	const peakStruct &pk = spectrum->getBin(curBin).at(curRank);

	binnedPeakStruct ret;
	ret.bin = curBin;
	ret.rank = curRank;
	ret.mz = pk.mz;
	ret.intensity = pk.intensity;

	curRank++;
	skipEmptyBins();

	return ret;
}

} // namespace ascore
