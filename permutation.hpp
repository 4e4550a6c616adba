#ifndef PERMUTATION_HPP
#define PERMUTATION_HPP

#include <vector>
#include <set>
#include <string>
#include <stdexcept>
#include <utility>
#include <iterator>
#include <type_traits>
#include <initializer_list>
#include <boost/multiprecision/cpp_int.hpp>

using boost::multiprecision::cpp_int;

// k outside [0, n]
class ArityError : public std::invalid_argument {
public:
    ArityError(int k, int n)
        : std::invalid_argument(k < 0
              ? "k (" + std::to_string(k) + ") cannot be negative"
              : "k (" + std::to_string(k) + ") cannot be greater than n (" + std::to_string(n) + ")"),
          k(k), n(n) {}

    int k, n;
};

// index outside [0, P(n,k))
class IndexRangeError : public std::out_of_range {
public:
    IndexRangeError(const cpp_int& index, const cpp_int& total)
        : std::out_of_range("Index " + index.str() + " is out of bounds (0 to " + cpp_int(total - 1).str() + ")"),
          index(index), total(total) {}

    cpp_int index, total;
};

// The lazy engine lost track of its working set. Never caused by caller input.
class UnrankInvariantError : public std::logic_error {
public:
    UnrankInvariantError(long position, std::size_t remaining)
        : std::logic_error("Algorithm error: could not find element at position " + std::to_string(position)
              + " among " + std::to_string(remaining) + " remaining"),
          position(position), remaining(remaining) {}

    long position;
    std::size_t remaining;
};

/*
    Number of ways to pick k of n elements where order matters, P(n,k).

    @return 0 if k > n, 1 if k == 0, else n * (n-1) * .. * (n-k+1)
*/
inline cpp_int count_permutations(int n, int k) {
    if (k > n) return 0;
    if (k == 0) return 1;

    cpp_int result = 1;
    for (int i = 0; i < k; i++)
        result *= n - i;
    return result;
}

// Parse a decimal index such as "12" or "-1". Anything else is rejected.
inline cpp_int parse_index(const std::string& s) {
    std::size_t start = (!s.empty() && s[0] == '-') ? 1 : 0;
    if (start == s.size())
        throw std::invalid_argument("Index \"" + s + "\" is not a decimal integer");
    for (std::size_t i = start; i < s.size(); i++)
        if (s[i] < '0' || s[i] > '9')
            throw std::invalid_argument("Index \"" + s + "\" is not a decimal integer");
    return cpp_int(s);
}

// Smallest and largest of a non-empty list of big integers.
inline std::pair<cpp_int, cpp_int> bigint_min_max(std::initializer_list<cpp_int> values) {
    if (values.size() == 0)
        throw std::invalid_argument("bigint_min_max needs at least one value");

    std::pair<cpp_int, cpp_int> result(*values.begin(), *values.begin());
    for (const cpp_int& v : values) {
        if (v < result.first) result.first = v;
        if (v > result.second) result.second = v;
    }
    return result;
}

    // Throws on bad (n, k, index) before any work is done.
    // @return P(n,k)
inline cpp_int check_unrank_args(int n, int k, const cpp_int& index) {
    if (k < 0 || k > n)
        throw ArityError(k, n);

    cpp_int total = count_permutations(n, k);
    if (index < 0 || index >= total)
        throw IndexRangeError(index, total);

    return total;
}

/*
    Get the k-permutation at position `index` of the lexicographic ordering
    induced by the order of `elements`.

    Position i of the result is a digit of base P(n-i-1, k-i-1): it selects
    which of the still available elements goes there.

    @param elements Universe of n distinct elements (not modified)
    @param k Number of elements to select
    @param index Rank in [0, P(n,k))
    @return k elements, no repeats
*/
template<typename T>
std::vector<T> unrank_dense(const std::vector<T>& elements, int k, cpp_int index) {
    int n = elements.size();
    check_unrank_args(n, k, index);

    std::vector<T> available(elements);
    std::vector<T> result;
    result.reserve(k);

    for (int i = 0; i < k; i++) {
        cpp_int blockSize = count_permutations(n - i - 1, k - i - 1);

            // index < P(n-i, k-i) on entry, so position < available.size()
        int position = cpp_int(index / blockSize).convert_to<int>();
        index %= blockSize;

        result.push_back(available[position]);
        available.erase(available.begin() + position);
    }

    return result;
}

// Walk the ascending set to its position'th member (0-based).
inline int nth_available(const std::set<int>& available, long position) {
    if (position < 0)
        throw UnrankInvariantError(position, available.size());

    std::set<int>::const_iterator it = available.begin();
    for (long pos = 0; pos < position && it != available.end(); pos++)
        ++it;

    if (it == available.end())
        throw UnrankInvariantError(position, available.size());

    return *it;
}

/*
    Same ordering as unrank_dense, but the universe is the identities 0..n-1
    and only the k chosen identities are ever passed to `resolve`.
    Useful when elements live on disk or are generated on demand.

    @param resolve Callable int -> T, called once per selected identity, in result order
    @param n Size of the universe
    @param k Number of elements to select
    @param index Rank in [0, P(n,k))
*/
template<typename Resolve>
auto unrank_lazy(Resolve resolve, int n, int k, cpp_int index)
    -> std::vector<typename std::decay<decltype(resolve(0))>::type>
{
    check_unrank_args(n, k, index);

    std::set<int> available;
    for (int i = 0; i < n; i++)
        available.insert(available.end(), i);

    std::vector<typename std::decay<decltype(resolve(0))>::type> result;
    result.reserve(k);

    for (int i = 0; i < k; i++) {
        cpp_int blockSize = count_permutations(n - i - 1, k - i - 1);

        long position = cpp_int(index / blockSize).convert_to<long>();
        index %= blockSize;

        int selected = nth_available(available, position);
        result.push_back(resolve(selected));
        available.erase(selected);
    }

    return result;
}

/*
    Iterates the k-permutations of `elements` with ranks in [first, last),
    last being clamped to P(n,k). Used to scan a block of the permutation
    space and resume from a saved rank.
*/
template<typename T>
class UnrankIterator {
public:
    UnrankIterator(const std::vector<T>& elements, int k, const cpp_int& first, const cpp_int& last)
        : elements(elements), k(k), current(first) {
        int n = elements.size();
        if (k < 0 || k > n)
            throw ArityError(k, n);

        permCount = count_permutations(n, k);
        if (first < 0)
            throw IndexRangeError(first, permCount);

        this->last = bigint_min_max({last, permCount}).first;
    }

    bool hasNext() const { return current < last; }

    std::vector<T> next() {
        if (!hasNext())
            throw std::out_of_range("UnrankIterator: no permutation at index " + current.str());

        std::vector<T> result = unrank_dense(elements, k, current);
        ++current;
        return result;
    }

        // rank of the permutation the next call to next() returns
    const cpp_int& index() const { return current; }
    const cpp_int& end() const { return last; }
    const cpp_int& total() const { return permCount; }

private:
    std::vector<T> elements;
    int k;
    cpp_int current, last, permCount;
};

#endif // PERMUTATION_HPP
