/*
 * statsFunctions.cpp
 *
 *  Binomial tail probabilities for the peptide score.
 */

#include <cmath>
#include <vector>
#include <boost/math/distributions/binomial.hpp>
#include "statsFunctions.hpp"

using namespace std;

namespace ascore {


// Function returns the probability of observing at least 'k' successes
// out of 'N' trials with success probability 'pr'
double cum_binomial_prob(int N, int k, double pr) {

	if(k <= 0) return 1.0;
	if(k > N) return 0.0;
	if(pr <= 0) return 0.0;
	if(pr >= 1) return 1.0;

	boost::math::binomial_distribution<double> dist( (double) N, pr );

	// P(X >= k) = 1 - P(X <= k-1)
	return boost::math::cdf( boost::math::complement(dist, (double) (k - 1)) );
}



// Function returns -10*log10 of the cumulative binomial probability.
// An underflowed probability is reported as 'ceiling'.
double binomialScore(int N, int k, double pr, double ceiling) {

	if(k <= 0) return 0.0;

	double prob = cum_binomial_prob(N, k, pr);
	if(prob <= 0) return ceiling;

	double ret = -10.0 * log10(prob);
	if(ret > ceiling) ret = ceiling;
	if(ret < 0) ret = 0.0; // rounding in the tail sum can give prob slightly above 1

	return ret;
}



// Function returns sum(x*wt) / sum(wt) over the common length of both vectors
double weightedMean(const vector<double> &x, const vector<double> &wt) {
	double num = 0, denom = 0;

	int N = (signed) min(x.size(), wt.size());
	for(int i = 0; i < N; i++) {
		num += x.at(i) * wt.at(i);
		denom += wt.at(i);
	}

	if(denom <= 0) return 0.0;
	return num / denom;
}

} // namespace ascore
