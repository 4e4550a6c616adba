#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/case_conv.hpp>
#include "store.hpp"
#include "permutation.hpp"

using namespace std;
namespace fs = std::filesystem;

KeyValueStore::KeyValueStore(const string& path) : filePath(path) { }

void KeyValueStore::check_key(const string& key) {
    if (boost::algorithm::trim_copy(key).empty())
        throw invalid_argument("Key cannot be empty");

    if (key.find_first_of("=\r\n") != string::npos)
        throw invalid_argument("Key cannot contain \"=\", carriage return, or newline characters");
}

    // [begin, end) of the value on the first "key=" line
bool KeyValueStore::find_line(const string& content, const string& key, size_t& begin, size_t& end) {
    string prefix = key + "=";
    size_t line = 0;
    while (line <= content.size()) {
        size_t eol = content.find('\n', line);
        if (eol == string::npos)
            eol = content.size();

        if (content.compare(line, prefix.size(), prefix) == 0) {
            begin = line + prefix.size();
            end = eol;
            if (end > begin && content[end - 1] == '\r')
                end--;
            return true;
        }
        line = eol + 1;
    }
    return false;
}

bool KeyValueStore::exists() const {
    return fs::exists(filePath);
}

string KeyValueStore::read() const {
    ifstream in(filePath, ios::binary);
    if (!in)
        throw runtime_error("Error reading " + filePath);

    ostringstream content;
    content << in.rdbuf();
    return content.str();
}

void KeyValueStore::write(const string& content) const {
    fs::path dir = fs::path(filePath).parent_path();
    if (!dir.empty())
        fs::create_directories(dir);

    ofstream out(filePath, ios::binary | ios::trunc);
    if (!out)
        throw runtime_error("Error writing " + filePath);
    out << content;
    if (!out.flush())
        throw runtime_error("Error writing " + filePath);
}

string KeyValueStore::encode_bigint(const cpp_int& value) {
    return value.str() + "n";
}

cpp_int KeyValueStore::decode_bigint(const string& text) {
    if (!text.empty() && text.back() == 'n')
        return parse_index(text.substr(0, text.size() - 1));
    return parse_index(text);
}

void KeyValueStore::set(const string& key, const string& value) const {
    check_key(key);

    string content = exists() ? read() : string();

    size_t begin, end;
    if (find_line(content, key, begin, end)) {
        content.replace(begin, end - begin, value);
    } else {
        if (!content.empty() && content.back() != '\n')
            content += "\n";
        content += key + "=" + value;
    }

    write(content);
}

void KeyValueStore::set_bigint(const string& key, const cpp_int& value) const {
    set(key, encode_bigint(value));
}

string KeyValueStore::get(const string& key, const StoreOptions& options) const {
    check_key(key);

    if (!exists()) {
        if (!options.if_not_exist)
            throw runtime_error("File not found: " + filePath);
        if (options.create_if_missing)
            write(key + "=" + *options.if_not_exist);
        return *options.if_not_exist;
    }

    string content = read();

    size_t begin, end;
    if (find_line(content, key, begin, end)) {
        string value = content.substr(begin, end - begin);
        if (options.trim)
            boost::algorithm::trim(value);
        return value;
    }

    if (!options.if_not_exist)
        throw runtime_error("Key not found: " + key);

    if (options.create_if_missing) {
        if (!content.empty() && content.back() != '\n')
            content += "\n";
        content += key + "=" + *options.if_not_exist;
        write(content);
    }
    return *options.if_not_exist;
}

cpp_int KeyValueStore::get_bigint(const string& key, const StoreOptions& options) const {
    return decode_bigint(get(key, options));
}

long KeyValueStore::get_long(const string& key, const StoreOptions& options) const {
    string value = get(key, options);
    size_t used = 0;
    long result = stol(value, &used);
    if (used != value.size())
        throw invalid_argument("Value of " + key + " is not a number: " + value);
    return result;
}

bool KeyValueStore::get_bool(const string& key, const StoreOptions& options) const {
    return boost::algorithm::to_lower_copy(get(key, options)) == "true";
}
