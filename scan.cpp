#include <stdexcept>
#include <boost/algorithm/string/join.hpp>
#include "scan.hpp"
#include "permutation.hpp"

using namespace std;

ScanResult run_scan(const vector<string>& words, int k, const cpp_int& count,
                    const KeyValueStore& store, ostream& out, const CandidateFilter& filter) {
    if (count < 0)
        throw invalid_argument("Batch size cannot be negative: " + count.str());

    int n = words.size();
    if (k < 0 || k > n)
        throw ArityError(k, n);

    ScanResult scan;
    scan.total = count_permutations(n, k);
    out << "Total " << k << "-permutations from " << n << " elements: " << scan.total << endl;

    StoreOptions options;
    options.if_not_exist = KeyValueStore::encode_bigint(0);
    options.create_if_missing = true;
    cpp_int saved = store.get_bigint(SCAN_INDEX_KEY, options);

    scan.first = (saved == 0) ? cpp_int(0) : cpp_int(saved + 1);
    scan.end = bigint_min_max({saved + count, scan.total}).first;

    UnrankIterator<string> it(words, k, scan.first, scan.end);
    while (it.hasNext()) {
        cpp_int rank = it.index();
        string phrase = boost::algorithm::join(it.next(), " ");

        out << rank << "," << phrase;
        if (filter) {
            bool valid = filter(phrase);
            out << (valid ? ",valid" : ",invalid");
            if (valid)
                scan.accepted++;
        }
        out << endl;

        if (rank == it.end() - 1)
            out << "----------DONE----------" << endl;

        store.set_bigint(SCAN_INDEX_KEY, rank);
        scan.scanned++;
    }

    return scan;
}
