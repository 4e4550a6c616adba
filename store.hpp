#ifndef STORE_HPP
#define STORE_HPP

#include <string>
#include <optional>
#include <boost/multiprecision/cpp_int.hpp>

using boost::multiprecision::cpp_int;

struct StoreOptions {
    std::optional<std::string> if_not_exist;    // returned when the file or key is missing
    bool create_if_missing = false;             // also write if_not_exist to the file
    bool trim = true;
};

/*
    Flat file of `key=value` lines, used to remember how far a scan got.

    Big integers are written with a trailing 'n' (eg "current_index=42n")
    so they can be told apart from plain numbers; get_bigint accepts both.
    Only the first line for a key counts.
*/
class KeyValueStore {
public:
    explicit KeyValueStore(const std::string& path = "data/store.txt");

    void set(const std::string& key, const std::string& value) const;
    void set_bigint(const std::string& key, const cpp_int& value) const;

    std::string get(const std::string& key, const StoreOptions& options = StoreOptions()) const;
    cpp_int get_bigint(const std::string& key, const StoreOptions& options = StoreOptions()) const;
    long get_long(const std::string& key, const StoreOptions& options = StoreOptions()) const;
    bool get_bool(const std::string& key, const StoreOptions& options = StoreOptions()) const;

    const std::string& path() const { return filePath; }

    static std::string encode_bigint(const cpp_int& value);
    static cpp_int decode_bigint(const std::string& text);

private:
    static void check_key(const std::string& key);
    static bool find_line(const std::string& content, const std::string& key,
                          std::size_t& begin, std::size_t& end);

    bool exists() const;
    std::string read() const;
    void write(const std::string& content) const;

    std::string filePath;
};

#endif // STORE_HPP
