/*
** kscan: walk the k-permutations of a word list in rank order, a batch at a time.

 Each run unranks the next `count` permutations after the rank saved in the
 store file, prints them as "rank,phrase" lines and saves its progress, so
 repeated runs sweep the whole space of P(n,k) phrases.

 @param words.txt One word per line; line order defines the ranking
 @param k         Words per phrase
 @param count     Batch size (decimal, may exceed 64 bits)
 @param store.txt key=value progress file (default data/store.txt)

 Example:

./kscan data/word.txt 12 5000 data/store.txt
*/
#include <iostream>
#include <string>
#include <vector>
#include <cstdlib>
#include <exception>
#include "permutation.hpp"
#include "read_words.hpp"
#include "store.hpp"
#include "scan.hpp"

using namespace std;

    // print usage and exit
void usage() {
    cerr << "Usage: kscan words.txt k count [store.txt]" << endl;
    cerr << "       where" << endl;
    cerr << "           words.txt is the word list, one word per line" << endl;
    cerr << "           k         is the number of words in each phrase" << endl;
    cerr << "           count     is how many ranks to visit in this run" << endl;
    cerr << "           store.txt keeps the last rank visited (default data/store.txt)" << endl;
    exit(1);
}

int main(int argc, char *argv[]) {
    if (argc != 4 && argc != 5)
        usage();

    try {
        vector<string> words = read_words(argv[1]);
        if (words.empty()) {
            cerr << "No words found in " << argv[1] << "." << endl;
            return 1;
        }

        size_t used = 0;
        int k = stoi(argv[2], &used);
        if (used != string(argv[2]).size()) {
            cerr << "Invalid k." << endl;
            usage();
        }
        cpp_int count = parse_index(argv[3]);

        KeyValueStore store(argc == 5 ? argv[4] : "data/store.txt");

        ScanResult scan = run_scan(words, k, count, store, cout);
        if (scan.scanned == 0 && count > 0)
            cerr << "Nothing left to scan: last rank is " << cpp_int(scan.total - 1) << endl;
    } catch (const exception& e) {
        cerr << e.what() << endl;
        return 1;
    }

    return 0;
}
