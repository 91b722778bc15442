/*
 * statsFunctions.hpp
 */

#ifndef STATSFUNCTIONS_HPP_
#define STATSFUNCTIONS_HPP_

#include <vector>

namespace ascore {

// P(X >= k) for X ~ Binomial(N, pr)
double cum_binomial_prob(int N, int k, double pr);

// -10 * log10( P(X >= k) ), 'ceiling' when the probability underflows
double binomialScore(int N, int k, double pr, double ceiling);

double weightedMean(const std::vector<double> &x, const std::vector<double> &wt);

} // namespace ascore

#endif /* STATSFUNCTIONS_HPP_ */
