/*
 * BinnedSpectrumClass.hpp
 *
 *  Splits a peak list into fixed width m/z bins and ranks the peaks of each
 *  bin by intensity.
 */

#ifndef BINNEDSPECTRUMCLASS_HPP_
#define BINNEDSPECTRUMCLASS_HPP_

#include <cstddef>
#include <vector>
#include "structs.hpp"

namespace ascore {

class BinnedSpectrumClass {
private:
	double binSize;
	int nTop;
	double maxMZ;
	int numPeaks;
	int numInputPeaks; // peaks supplied to the last consumeSpectrum(), zero intensities included

	// bins[i] holds the peaks in [i*binSize, (i+1)*binSize), most intense first
	std::vector< std::vector<peakStruct> > bins;

public:
	BinnedSpectrumClass(double bin_size, int n_top);

	void consumeSpectrum(const std::vector<double> &mz, const std::vector<double> &intensity);
	void consumeSpectrum(const double *mz, const double *intensity, std::size_t n);

	double getBinSize() const { return binSize; }
	int getNTop() const { return nTop; }
	double getMaxMZ() const { return maxMZ; }
	int getNumBins() const { return (signed) bins.size(); }
	int getNumPeaks() const { return numPeaks; }
	int getNumInputPeaks() const { return numInputPeaks; }
	const std::vector<peakStruct>& getBin(int idx) const;
};


/*
 * Forward-only, restartable walk over the (bin, rank, peak) triples of a
 * BinnedSpectrumClass in m/z-then-intensity order. The spectrum must outlive
 * the iterator and must not be re-consumed while it is in use.
 */
class BinnedPeakIterator {
private:
	const BinnedSpectrumClass *spectrum;
	int curBin;
	int curRank;

	void skipEmptyBins();

public:
	explicit BinnedPeakIterator(const BinnedSpectrumClass &src);

	void reset();
	bool hasNext() const;
	binnedPeakStruct next();
};

} // namespace ascore

#endif /* BINNEDSPECTRUMCLASS_HPP_ */
