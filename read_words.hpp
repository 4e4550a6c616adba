#ifndef READ_WORDS_HPP
#define READ_WORDS_HPP

#include <cstdio>
#include <string>
#include <vector>
#include <stdexcept>
#include <boost/algorithm/string/trim.hpp>

/*
Read in a word list, one word per line. Format is
    abandon
    ability
    able
    ...

Hand crafted reader with simple state.
Accepts both "\n" and "\r\n" line ends; a "\r" inside a line is kept.
Blank lines are skipped; spaces and tabs around a word are dropped.
Order of the file is kept: it is the order permutations are ranked in.
*/
inline std::vector<std::string> read_words(const std::string& filename) {
    FILE *file = fopen(filename.c_str(), "r");
    if (file == nullptr)
        throw std::runtime_error("Error reading file: " + filename);

    std::vector<std::string> words;
    std::string word;

    auto add_word = [&]() {
        boost::algorithm::trim(word);
        if (!word.empty())
            words.push_back(word);
        word.clear();
    };

    int ch;
    bool pendingCR = false;     // a '\r' right before '\n' or EOF is a line end
    while ((ch = getc(file)) != EOF) {
        if (pendingCR && ch != '\n')
            word.push_back('\r');
        pendingCR = false;

        if (ch == '\n')
            add_word();
        else if (ch == '\r')
            pendingCR = true;
        else
            word.push_back((char)ch);
    }
    add_word();     // last line may have no newline

    bool failed = ferror(file);
    fclose(file);
    if (failed)
        throw std::runtime_error("Error reading file: " + filename);

    return words;
}

#endif // READ_WORDS_HPP
