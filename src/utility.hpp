#ifndef KMPFIND_UTILITY_HPP_INCLUDED
#define KMPFIND_UTILITY_HPP_INCLUDED

#include <string>
#include <vector>
#include <functional>
#include <iostream>
#include <cstdint>
#include <cstdlib>
#include <typeinfo>
#include <exception>
#include <omp.h>

namespace kmpfind {

using namespace std;

/// Number of threads an OMP parallel section will run with.
int get_thread_count(void);

/// Pick the OMP thread count from, in order: OMP_NUM_THREADS, the cgroup CPU
/// quota, the CPU affinity mask, and the hardware concurrency.
void choose_good_thread_count();

/// A string of the given length drawn from the alphabet. The same seed always
/// gives the same string.
string pseudo_random_sequence(size_t length, uint64_t seed, const string& alphabet = "ACGT");

/// True if argv[optind] exists and is a nonempty file name.
bool have_input_file(int& optind, int argc, char** argv);

/// Take the file named by argv[optind] ("-" for standard input), advance
/// optind past it, and call the callback with the open stream. Exits with an
/// error if there is no file name or the file can't be opened.
void get_input_file(int& optind, int argc, char** argv, function<void(istream&)> callback);

/// Open the named file ("-" for standard input) and call the callback with
/// it. The stream is only valid during the callback.
void get_input_file(const string& file_name, function<void(istream&)> callback);

/// Parse the whole of arg into dest. Returns false, or throws, if arg is not
/// exactly one value of the type. Specialized for each type we parse.
template<typename Result>
bool parse(const string& arg, Result& dest);

/// Signed integers in the range of int
template<>
bool parse(const string& arg, int& dest);

/// Parse a command-line argument, or exit with an error saying what could
/// not be parsed.
template<typename Result>
Result parse(const string& arg) {
    Result to_return;
    bool success;
    try {
        success = parse<Result>(arg, to_return);
    } catch(exception& e) {
        success = false;
    }
    if (!success) {
        cerr << "error: could not parse " << typeid(to_return).name() << " from argument \"" << arg << "\"" << endl;
        exit(1);
    }
    return to_return;
}

template<typename Result>
Result parse(const char* arg) {
    return parse<Result>(string(arg));
}

}

#endif
