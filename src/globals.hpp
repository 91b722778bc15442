/*
 * globals.hpp
 *
 *  Mass constants, the residue mass table and small helper functions.
 */

#ifndef GLOBALS_HPP_
#define GLOBALS_HPP_

#include <map>
#include <string>
#include <vector>
#include "structs.hpp"

namespace ascore {

const double PROTON = 1.00727646688;
const double H = 1.00782503207;  // hydrogen atom
const double H2O = 18.010565;
const double NH3 = 17.026549;

std::map<char, double> initialize_AA_masses();

void validateParams(const paramStruct &params);
std::string getExecutionParameters(const paramStruct &params);

annotatedPeptideStruct parseAnnotatedPeptide(const std::string &txt);

std::string int2string(int i);
std::string dbl2string(double d);
double str2dbl(std::string ch);
double combinatorial(double n, double k);
bool isFinite(double x);
std::string positions2string(const std::vector<int> &v);

} // namespace ascore

#endif /* GLOBALS_HPP_ */
