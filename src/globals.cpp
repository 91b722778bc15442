/*
 * globals.cpp
 *
 *  Residue masses, parameter checks and string helpers used by every class.
 */

#include <iostream>
#include <cstdlib>
#include <map>
#include <sstream>
#include <cmath>
#include <boost/regex.hpp>
#include "globals.hpp"
#include "AscoreErrors.hpp"


using namespace std;

namespace ascore {


// function initializes the AA mass map (monoisotopic residue masses)
map<char, double> initialize_AA_masses() {
	map<char, double> AAmass;

	AAmass['A'] = 71.03711;
	AAmass['R'] = 156.1011;
	AAmass['N'] = 114.04293;
	AAmass['D'] = 115.02694;
	AAmass['C'] = 103.00919;
	AAmass['E'] = 129.04259;
	AAmass['Q'] = 128.05858;
	AAmass['G'] = 57.02146;
	AAmass['H'] = 137.05891;
	AAmass['I'] = 113.08406;
	AAmass['L'] = 113.08406;
	AAmass['K'] = 128.09496;
	AAmass['M'] = 131.04049;
	AAmass['F'] = 147.06841;
	AAmass['P'] = 97.05276;
	AAmass['S'] = 87.03203;
	AAmass['T'] = 101.04768;
	AAmass['W'] = 186.07931;
	AAmass['Y'] = 163.06333;
	AAmass['V'] = 99.06841;

	return AAmass;
}



// Function checks every field of the parameter struct and throws
// ConfigurationError on the first bad value
void validateParams(const paramStruct &params) {

	if( !isFinite(params.bin_size) || (params.bin_size <= 0) ) {
		throw ConfigurationError("bin size must be a positive number, got " + dbl2string(params.bin_size));
	}

	if(params.n_top < 1) {
		throw ConfigurationError("the number of peaks kept per bin must be at least 1, got " + int2string(params.n_top));
	}

	if( !isFinite(params.mz_error) || (params.mz_error < 0) ) {
		throw ConfigurationError("fragment ion tolerance must be >= 0, got " + dbl2string(params.mz_error));
	}

	if(params.mod_group.empty()) {
		throw ConfigurationError("the modifiable residue group is empty");
	}

	map<char, double> AAmass = initialize_AA_masses();
	for(int i = 0; i < (signed) params.mod_group.length(); i++) {
		if(AAmass.find( params.mod_group.at(i) ) == AAmass.end()) {
			throw ConfigurationError("unknown residue '" + params.mod_group.substr(i, 1) + "' in modifiable residue group");
		}
	}

	if( !isFinite(params.mod_mass) ) {
		throw ConfigurationError("modification mass is not a finite number");
	}

	if(params.fragment_types.empty()) {
		throw ConfigurationError("no fragment ion types given");
	}
	string ionTypes = "bcyz";
	for(int i = 0; i < (signed) params.fragment_types.length(); i++) {
		if(ionTypes.find( params.fragment_types.at(i) ) == string::npos) {
			throw ConfigurationError("unsupported fragment ion type '" + params.fragment_types.substr(i, 1) + "'");
		}
	}

	if(params.max_fragment_charge < 1) {
		throw ConfigurationError("maximum fragment charge must be at least 1");
	}

	if( !isFinite(params.min_fragment_mz) || (params.min_fragment_mz < 0) ) {
		throw ConfigurationError("minimum fragment m/z must be >= 0");
	}

	if(params.max_depth < 1) {
		throw ConfigurationError("maximum peak depth must be at least 1");
	}

	if( (signed) params.depth_weights.size() != params.max_depth ) {
		throw ConfigurationError("expected " + int2string(params.max_depth) + " depth weights, got "
				+ int2string((signed) params.depth_weights.size()));
	}

	double wtSum = 0;
	for(int i = 0; i < (signed) params.depth_weights.size(); i++) {
		double w = params.depth_weights.at(i);
		if( !isFinite(w) || (w < 0) ) {
			throw ConfigurationError("depth weights must be non-negative numbers");
		}
		wtSum += w;
	}
	if(wtSum <= 0) {
		throw ConfigurationError("depth weights sum to zero");
	}

	if( !isFinite(params.score_ceiling) || (params.score_ceiling <= 0) ) {
		throw ConfigurationError("score ceiling must be a positive number");
	}

	if( !isFinite(params.unambiguous_ascore) ) {
		throw ConfigurationError("unambiguous Ascore must be a finite number");
	}
}



// Function returns a string that reports all of the options that are being
// used for this scoring run
string getExecutionParameters(const paramStruct &params) {
	string ret;

	ret += "Bin size:\t" + dbl2string(params.bin_size) + "\n"
		+ "Peaks per bin:\t" + int2string(params.n_top) + "\n"
		+ "Modifiable residues:\t" + params.mod_group + "\n"
		+ "Modification mass:\t" + dbl2string(params.mod_mass) + "\n"
		+ "Fragment ion tolerance:\t" + dbl2string(params.mz_error) + " Da\n"
		+ "Fragment ion types:\t" + params.fragment_types + "\n"
		+ "Max fragment charge:\t" + int2string(params.max_fragment_charge) + "\n"
		+ "Min fragment m/z:\t" + dbl2string(params.min_fragment_mz) + "\n"
		+ "Max peak depth:\t" + int2string(params.max_depth) + "\n";

	ret += "Depth weights:\t";
	for(int i = 0; i < (signed) params.depth_weights.size(); i++) {
		if(i > 0) ret += ",";
		ret += dbl2string(params.depth_weights.at(i));
	}
	ret += "\n";

	return ret;
}



// Function parses a bracket annotated peptide such as "n[42.0106]AGS[79.9663]TPR"
// into the bare sequence and co-indexed modification positions/masses.
// Position 0 is the N-terminus, length+1 the C-terminus.
annotatedPeptideStruct parseAnnotatedPeptide(const string &txt) {
	annotatedPeptideStruct ret;

	static const string massPat = "[-+]?(?:\\d+\\.?\\d*|\\.\\d+)";
	static const boost::regex pep_regex("^(?:n\\[(" + massPat + ")\\])?((?:[A-Z](?:\\[" + massPat + "\\])?)+)(?:c\\[(" + massPat + ")\\])?$");
	static const boost::regex residue_regex("([A-Z])(?:\\[(" + massPat + ")\\])?");
	boost::smatch matches;

	if( !boost::regex_match(txt, matches, pep_regex) ) {
		throw InvalidPeptide("unable to parse annotated peptide '" + txt + "'");
	}

	if(matches[1].matched) {
		ret.modPos.push_back(0);
		ret.modMass.push_back( str2dbl( string(matches[1].first, matches[1].second) ) );
	}

	string body(matches[2].first, matches[2].second);
	boost::sregex_iterator iter(body.begin(), body.end(), residue_regex);
	boost::sregex_iterator end;
	for(; iter != end; iter++) {
		const boost::smatch &m = *iter;
		ret.peptide += string(m[1].first, m[1].second);

		if(m[2].matched) {
			ret.modPos.push_back( (signed) ret.peptide.length() );
			ret.modMass.push_back( str2dbl( string(m[2].first, m[2].second) ) );
		}
	}

	if(matches[3].matched) {
		ret.modPos.push_back( (signed) ret.peptide.length() + 1 );
		ret.modMass.push_back( str2dbl( string(matches[3].first, matches[3].second) ) );
	}

	return ret;
}



// Function converts an int into a string
string int2string(int i) {
	stringstream ss;
	ss << i;
	return ss.str();
}



// Function converts a double into a string
string dbl2string(double d) {
	stringstream ss;
	ss << d;
	return ss.str();
}



// function converts a string into a double
double str2dbl(string ch) {
	double ret = 0;

	istringstream iss(ch);
	iss >> ret;

	return ret;
}



// Function returns the number of combinations of (n choose k)
double combinatorial(double n, double k) {
	if( (k < 0) || (k > n) ) return 0;

	double ret = 1;
	for(double i = 1; i <= k; i++) {
		ret *= (n - k + i) / i;
	}
	return round(ret);
}



// Function returns false for nan and +/- infinity
bool isFinite(double x) {
	return std::isfinite(x);
}



// Function renders a list of positions as "{3,5}"
string positions2string(const vector<int> &v) {
	string ret = "{";
	for(int i = 0; i < (signed) v.size(); i++) {
		if(i > 0) ret += ",";
		ret += int2string(v.at(i));
	}
	ret += "}";
	return ret;
}

} // namespace ascore
