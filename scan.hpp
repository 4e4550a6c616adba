#ifndef SCAN_HPP
#define SCAN_HPP

#include <functional>
#include <ostream>
#include <string>
#include <vector>
#include <boost/multiprecision/cpp_int.hpp>
#include "store.hpp"

using boost::multiprecision::cpp_int;

    // Decides whether a space-joined candidate phrase is worth keeping,
    // eg a mnemonic checksum check. Lives outside this project.
typedef std::function<bool(const std::string&)> CandidateFilter;

    // store key holding the last rank written out
inline constexpr const char* SCAN_INDEX_KEY = "current_index";

struct ScanResult {
    cpp_int total;      // P(n,k)
    cpp_int first;      // first rank visited
    cpp_int end;        // one past the last rank visited
    long scanned = 0;
    long accepted = 0;
};

/*
    Unrank the next batch of k-permutations of `words` and write one line per
    rank to `out`:  <rank>,<words joined by ' '>[,valid|,invalid]
    The validity column is only written when a filter is given.

    Resumes from the rank saved under SCAN_INDEX_KEY in `store` (a fresh store
    starts at 0, otherwise at saved + 1) and stops at min(saved + count, P(n,k)).
    Every rank visited is saved back to `store`.

    @param count Batch size, >= 0
*/
ScanResult run_scan(const std::vector<std::string>& words, int k, const cpp_int& count,
                    const KeyValueStore& store, std::ostream& out,
                    const CandidateFilter& filter = CandidateFilter());

#endif // SCAN_HPP
