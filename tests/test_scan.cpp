#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "../scan.hpp"
#include "../permutation.hpp"

using namespace std;
namespace fs = std::filesystem;

class ScanTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("kperm_scan_" + string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir);
        path = (dir / "store.txt").string();
    }

    void TearDown() override { fs::remove_all(dir); }

    fs::path dir;
    string path;
    vector<string> words = {"a", "b", "c", "d"};
};

TEST_F(ScanTest, FirstBatchStartsAtZero) {
    KeyValueStore store(path);
    ostringstream out;
    ScanResult scan = run_scan(words, 2, 5, store, out);

    EXPECT_EQ(out.str(),
              "Total 2-permutations from 4 elements: 12\n"
              "0,a b\n"
              "1,a c\n"
              "2,a d\n"
              "3,b a\n"
              "4,b c\n"
              "----------DONE----------\n");
    EXPECT_EQ(scan.total, 12);
    EXPECT_EQ(scan.first, 0);
    EXPECT_EQ(scan.end, 5);
    EXPECT_EQ(scan.scanned, 5);
    EXPECT_EQ(store.get_bigint(SCAN_INDEX_KEY), 4);
}

TEST_F(ScanTest, ResumesAfterSavedRankAndStopsAtTotal) {
    KeyValueStore store(path);
    ostringstream out;

    run_scan(words, 2, 5, store, out);

    ScanResult second = run_scan(words, 2, 5, store, out);
    EXPECT_EQ(second.first, 5);
    EXPECT_EQ(second.end, 9);
    EXPECT_EQ(second.scanned, 4);
    EXPECT_EQ(store.get_bigint(SCAN_INDEX_KEY), 8);

    ostringstream last;
    ScanResult third = run_scan(words, 2, 5, store, last);
    EXPECT_EQ(third.first, 9);
    EXPECT_EQ(third.end, 12);
    EXPECT_EQ(third.scanned, 3);
    EXPECT_NE(last.str().find("11,d c\n----------DONE----------\n"), string::npos);

    ostringstream none;
    ScanResult fourth = run_scan(words, 2, 5, store, none);
    EXPECT_EQ(fourth.scanned, 0);
    EXPECT_EQ(none.str(), "Total 2-permutations from 4 elements: 12\n");
    EXPECT_EQ(store.get_bigint(SCAN_INDEX_KEY), 11);
}

TEST_F(ScanTest, ResumesFromHugeSavedRank) {
    vector<string> many;
    for (int i = 0; i < 2048; i++)
        many.push_back("w" + to_string(i));

    KeyValueStore store(path);
    cpp_int last = count_permutations(2048, 12) - 1;
    store.set_bigint(SCAN_INDEX_KEY, last - 2);

    ostringstream out;
    ScanResult scan = run_scan(many, 12, 100, store, out);
    EXPECT_EQ(scan.scanned, 2);
    EXPECT_EQ(store.get_bigint(SCAN_INDEX_KEY), last);
    EXPECT_NE(out.str().find(last.str() + ",w2047 w2046 w2045 w2044 w2043 w2042 w2041 w2040 w2039 w2038 w2037 w2036\n"),
              string::npos);
}

TEST_F(ScanTest, NoFilterWritesNoValidityColumn) {
    KeyValueStore store(path);
    ostringstream out;
    run_scan({"a", "b", "c"}, 1, 2, store, out);

    EXPECT_EQ(out.str(),
              "Total 1-permutations from 3 elements: 3\n"
              "0,a\n"
              "1,b\n"
              "----------DONE----------\n");
}

TEST_F(ScanTest, SavesUnderCurrentIndexKey) {
    EXPECT_STREQ(SCAN_INDEX_KEY, "current_index");

    KeyValueStore store(path);
    ostringstream out;
    run_scan(words, 2, 3, store, out);

    ifstream in(path);
    string line;
    getline(in, line);
    EXPECT_EQ(line, "current_index=2n");
}

TEST_F(ScanTest, FilterMarksCandidates) {
    KeyValueStore store(path);
    ostringstream out;
    CandidateFilter starts_with_b = [](const string& phrase) { return phrase[0] == 'b'; };

    ScanResult scan = run_scan(words, 2, 6, store, out, starts_with_b);
    EXPECT_EQ(scan.accepted, 3);
    EXPECT_NE(out.str().find("2,a d,invalid\n"), string::npos);
    EXPECT_NE(out.str().find("3,b a,valid\n"), string::npos);
    EXPECT_NE(out.str().find("5,b d,valid\n"), string::npos);
}

TEST_F(ScanTest, RejectsBadArguments) {
    KeyValueStore store(path);
    ostringstream out;
    EXPECT_THROW(run_scan(words, 5, 1, store, out), ArityError);
    EXPECT_THROW(run_scan(words, 2, -1, store, out), std::invalid_argument);
    EXPECT_FALSE(fs::exists(path));
}
