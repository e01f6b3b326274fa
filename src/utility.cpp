#include "utility.hpp"
#include "log.hpp"

#include <fstream>
#include <random>
#include <thread>
#include <limits>
#include <cmath>
#include <cerrno>
#include <cstring>
#include <sched.h>
#include <unistd.h>

namespace kmpfind {

int get_thread_count(void) {
    int thread_count = 1;
#pragma omp parallel
    {
#pragma omp master
        thread_count = omp_get_num_threads();
    }
    return thread_count;
}

/// CPUs allowed by the cgroup CPU quota, or 0 if there is no quota we can read.
static int cgroup_cpu_limit() {
    // cgroup v2 has "<quota> <period>", with a quota of "max" for no limit
    ifstream cpu_max("/sys/fs/cgroup/cpu.max");
    if (cpu_max) {
        string quota;
        int64_t period = 0;
        cpu_max >> quota >> period;
        if (cpu_max && quota != "max" && period > 0) {
            int64_t quota_us = 0;
            try {
                quota_us = std::stoll(quota);
            } catch (exception& e) {
                return 0;
            }
            return (int) ceil(quota_us / (double) period);
        }
        return 0;
    }

    // cgroup v1 keeps them in two files, with a quota of -1 for no limit
    ifstream quota_file("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
    ifstream period_file("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
    if (quota_file && period_file) {
        int64_t quota = -1;
        int64_t period = 0;
        quota_file >> quota;
        period_file >> period;
        if (quota_file && period_file && quota >= 0 && period > 0) {
            return (int) ceil(quota / (double) period);
        }
    }
    return 0;
}

void choose_good_thread_count() {
    // 0 means we haven't found a count yet
    int count = 0;

    const char* value = getenv("OMP_NUM_THREADS");
    if (value && *value != '\0') {
        // OpenMP allows a list like "4,2" for nested levels, and the first
        // entry is the one we use
        try {
            count = std::stoi(value);
        } catch (exception& e) {
            count = 0;
        }
        if (count <= 0) {
            logging::warn("kmpfind") << "ignoring OMP_NUM_THREADS value \"" << value << "\"" << endl;
            count = 0;
        }
    }

    if (count == 0) {
        count = cgroup_cpu_limit();
    }

#if !defined(__APPLE__) && defined(_GNU_SOURCE)
    if (count == 0) {
        // the affinity mask is how batch schedulers like Slurm hand out cores
        cpu_set_t mask;
        if (sched_getaffinity(getpid(), sizeof(cpu_set_t), &mask)) {
            auto problem = errno;
            logging::warn("kmpfind") << "cannot determine CPU count from affinity mask: " << strerror(problem) << endl;
        } else {
            count = CPU_COUNT(&mask);
        }
    }
#endif

    if (count == 0) {
        // may itself be 0 if unknown
        count = std::thread::hardware_concurrency();
    }

    if (count > 0) {
        omp_set_num_threads(count);
    }
}

string pseudo_random_sequence(size_t length, uint64_t seed, const string& alphabet) {
    mt19937_64 gen(1357908642ull * seed + 80085ull);
    uniform_int_distribution<size_t> distr(0, alphabet.size() - 1);

    string seq(length, '\0');
    for (size_t i = 0; i < length; i++) {
        seq[i] = alphabet[distr(gen)];
    }
    return seq;
}

bool have_input_file(int& optind, int argc, char** argv) {
    return optind < argc && argv[optind][0] != '\0';
}

void get_input_file(int& optind, int argc, char** argv, function<void(istream&)> callback) {
    if (optind >= argc) {
        logging::error("kmpfind") << "specify input filename, or \"-\" for standard input" << endl;
    }
    string file_name(argv[optind++]);
    if (file_name.empty()) {
        logging::error("kmpfind") << "specify a non-empty input filename" << endl;
    }
    get_input_file(file_name, callback);
}

void get_input_file(const string& file_name, function<void(istream&)> callback) {
    if (file_name == "-") {
        callback(std::cin);
        return;
    }
    ifstream in(file_name);
    if (!in.is_open()) {
        logging::error("kmpfind") << "could not open file \"" << file_name << "\"" << endl;
    }
    callback(in);
}

template<>
bool parse(const string& arg, int& dest) {
    // This will hold the next character after the number parsed
    size_t after;
    long long buffer = std::stoll(arg, &after);
    if (after != arg.size()) {
        return false;
    }
    if (buffer > numeric_limits<int>::max() || buffer < numeric_limits<int>::min()) {
        return false;
    }
    dest = (int) buffer;
    return true;
}

}
