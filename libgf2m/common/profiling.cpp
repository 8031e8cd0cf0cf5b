/** @file
 *****************************************************************************

 Implementation of functions for profiling code blocks.

 See profiling.hpp .

 *****************************************************************************
 * @author     This file is adapted from libiop, itself adapted from
 *             libsnark (see AUTHORS).
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/

#include <cassert>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <ctime>
#include <map>
#include <mutex>
#include <stdexcept>
#include <vector>

#include "libgf2m/common/profiling.hpp"

namespace libgf2m {

namespace {

long long get_nsec_time()
{
    auto timepoint = std::chrono::high_resolution_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(timepoint.time_since_epoch()).count();
}

/* total CPU time of all threads of the process */
long long get_nsec_cpu_time()
{
    ::timespec ts;
    if (::clock_gettime(CLOCK_PROCESS_CPUTIME_ID, &ts))
    {
        throw ::std::runtime_error("clock_gettime(CLOCK_PROCESS_CPUTIME_ID) failed");
    }
    return ts.tv_sec * 1000000000ll + ts.tv_nsec;
}

struct block_entry {
    long long enter_time;
    long long enter_cpu_time;
};

struct profiling_state {
    std::mutex mutex;

    long long start_time;
    long long last_time;
    long long start_cpu_time;
    long long last_cpu_time;

    std::map<std::string, std::size_t> invocation_counts;
    std::map<std::string, long long> cumulative_times;
    std::map<std::string, block_entry> open_blocks;
    std::vector<std::string> block_names;
    std::size_t indentation;

    profiling_state() :
        start_time(get_nsec_time()),
        last_time(start_time),
        start_cpu_time(get_nsec_cpu_time()),
        last_cpu_time(start_cpu_time),
        indentation(0)
    {
    }
};

profiling_state& state()
{
    static profiling_state instance;
    return instance;
}

void print_indent_locked(const profiling_state &st)
{
    for (std::size_t i = 0; i < st.indentation; ++i)
    {
        printf("  ");
    }
}

void print_elapsed(const profiling_state &st,
                   const long long now, const long long since,
                   const long long cpu_now, const long long cpu_since)
{
    const long long from_since = now - since;
    const long long from_start = now - st.start_time;

    if (from_since != 0)
    {
        printf("[%0.4fs x%0.2f]", from_since * 1e-9, 1.0 * (cpu_now - cpu_since) / from_since);
    }
    else
    {
        printf("[             ]");
    }
    if (from_start != 0)
    {
        printf("\t(%0.4fs x%0.2f from start)", from_start * 1e-9,
               1.0 * (cpu_now - st.start_cpu_time) / from_start);
    }
}

} // namespace

void start_profiling()
{
    printf("Reset time counters for profiling\n");

    profiling_state &st = state();
    std::lock_guard<std::mutex> lock(st.mutex);
    st.last_time = st.start_time = get_nsec_time();
    st.last_cpu_time = st.start_cpu_time = get_nsec_cpu_time();
}

void print_time(const char* msg)
{
    profiling_state &st = state();
    std::lock_guard<std::mutex> lock(st.mutex);
    const long long now = get_nsec_time();
    const long long cpu_now = get_nsec_cpu_time();

    printf("%-35s\t", msg);
    print_elapsed(st, now, st.last_time, cpu_now, st.last_cpu_time);
    printf("\n");
    fflush(stdout);

    st.last_time = now;
    st.last_cpu_time = cpu_now;
}

void print_header(const char *msg)
{
    printf("\n================================================================================\n");
    printf("%s\n", msg);
    printf("================================================================================\n\n");
}

void print_separator()
{
    printf("\n================================================================================\n\n");
}

void print_indent()
{
    profiling_state &st = state();
    std::lock_guard<std::mutex> lock(st.mutex);
    print_indent_locked(st);
}

void print_cumulative_times()
{
    profiling_state &st = state();
    std::lock_guard<std::mutex> lock(st.mutex);

    printf("Dumping times:\n");
    for (const auto &kv : st.cumulative_times)
    {
        const double total_ms = kv.second * 1e-6;
        const std::size_t count = st.invocation_counts[kv.first];
        printf("   %-45s: %12.5fms (%zu invocations, %0.5fms per invocation)\n",
               kv.first.c_str(), total_ms, count, total_ms / count);
    }
    fflush(stdout);
}

void enter_block(const std::string &msg, const bool indent)
{
    profiling_state &st = state();
    std::lock_guard<std::mutex> lock(st.mutex);

    block_entry entry;
    entry.enter_time = get_nsec_time();
    entry.enter_cpu_time = get_nsec_cpu_time();
    st.open_blocks[msg] = entry;
    st.block_names.emplace_back(msg);

    print_indent_locked(st);
    printf("(enter) %-35s\t", msg.c_str());
    print_elapsed(st, entry.enter_time, entry.enter_time, entry.enter_cpu_time, entry.enter_cpu_time);
    printf("\n");
    fflush(stdout);

    if (indent)
    {
        ++st.indentation;
    }
}

void leave_block(const std::string &msg, const bool indent)
{
    profiling_state &st = state();
    std::lock_guard<std::mutex> lock(st.mutex);

    assert(!st.block_names.empty() && st.block_names.back() == msg);
    st.block_names.pop_back();

    const long long now = get_nsec_time();
    const long long cpu_now = get_nsec_cpu_time();
    const block_entry &entry = st.open_blocks[msg];

    ++st.invocation_counts[msg];
    st.cumulative_times[msg] += (now - entry.enter_time);

    if (indent && st.indentation > 0)
    {
        --st.indentation;
    }

    print_indent_locked(st);
    printf("(leave) %-35s\t", msg.c_str());
    print_elapsed(st, now, entry.enter_time, cpu_now, entry.enter_cpu_time);
    printf("\n");
    fflush(stdout);
}

} // libgf2m
