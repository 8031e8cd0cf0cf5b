/** @file
 *****************************************************************************

 Declaration of functions for profiling code blocks.

 Reports wall-clock and CPU time of nested blocks, indented by depth, on
 stdout, and keeps per-block invocation counts and cumulative times.

 The profiling state is constructed on first use, so blocks may be entered
 from static initializers of any translation unit.

 *****************************************************************************
 * @author     This file is adapted from libiop, itself adapted from
 *             libsnark (see AUTHORS).
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/

#ifndef LIBGF2M_COMMON_PROFILING_HPP_
#define LIBGF2M_COMMON_PROFILING_HPP_

#include <string>

namespace libgf2m {

void start_profiling();
void print_time(const char* msg);
void print_header(const char* msg);
void print_separator();
void print_indent();

void print_cumulative_times();

void enter_block(const std::string &msg, const bool indent=true);
void leave_block(const std::string &msg, const bool indent=true);

} // libgf2m

#endif // LIBGF2M_COMMON_PROFILING_HPP_
