#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "../read_words.hpp"

using namespace std;
namespace fs = std::filesystem;

static string write_temp(const string& name, const string& content) {
    fs::path p = fs::temp_directory_path() / name;
    ofstream out(p, ios::binary);
    out << content;
    return p.string();
}

TEST(ReadWords, HandlesLineEndingsAndBlanks) {
    string path = write_temp("kperm_words_mixed.txt", "abandon\r\nability\r\n\r\n  able \n\tabout\n");
    EXPECT_EQ(read_words(path), (vector<string>{"abandon", "ability", "able", "about"}));
    fs::remove(path);
}

TEST(ReadWords, LastLineWithoutNewline) {
    string path = write_temp("kperm_words_last.txt", "zoo\nyard");
    EXPECT_EQ(read_words(path), (vector<string>{"zoo", "yard"}));
    fs::remove(path);
}

TEST(ReadWords, CarriageReturnInsideLineIsKept) {
    string path = write_temp("kperm_words_cr.txt", "ab\rcd\nef\r\ngh\r");
    EXPECT_EQ(read_words(path), (vector<string>{"ab\rcd", "ef", "gh"}));
    fs::remove(path);
}

TEST(ReadWords, EmptyFile) {
    string path = write_temp("kperm_words_empty.txt", "\r\n\n");
    EXPECT_TRUE(read_words(path).empty());
    fs::remove(path);
}

TEST(ReadWords, MissingFile) {
    EXPECT_THROW(read_words((fs::temp_directory_path() / "kperm_no_such_file.txt").string()), std::runtime_error);
}
