#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef CPPDEBUG /* Ubuntu's Boost does not provide binaries compatible with libstdc++'s debug mode so we just reduce functionality here */
#include <boost/program_options.hpp>
#endif

#include "libgf2m/algebra/fields/gf2m_element.hpp"
#include "libgf2m/algebra/fields/gf2m_fields.hpp"
#include "libgf2m/algebra/fields/gf2m_lut_element.hpp"
#include "libgf2m/algebra/utils.hpp"
#include "libgf2m/common/profiling.hpp"

#ifndef CPPDEBUG
bool process_instrument_command_line(const int argc, const char** argv,
                                     std::size_t &log_n_min,
                                     std::size_t &log_n_max,
                                     std::size_t &field,
                                     std::string &backend)
{
    namespace po = boost::program_options;

    try
    {
        po::options_description desc("Usage");
        desc.add_options()
        ("help", "print this help message")
        ("log_n_min", po::value<std::size_t>(&log_n_min)->default_value(10))
        ("log_n_max", po::value<std::size_t>(&log_n_max)->default_value(16))
        ("field", po::value<std::size_t>(&field)->default_value(8), "extension degree: 8, 16, 32, 63, 64 or 128")
        ("backend", po::value<std::string>(&backend)->default_value("compute"), "compute or lut (lut needs a field of at most 16 bits)");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help"))
        {
            std::cout << desc << "\n";
            return false;
        }

        po::notify(vm);
    }
    catch(std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return false;
    }

    return true;
}
#endif

using namespace libgf2m;

template<typename FieldT>
void instrument_gf2m(const std::size_t log_n_min,
                     const std::size_t log_n_max)
{
    /* the table backend builds its tables here, outside the timed loop */
    enter_block("Validate modulus and build tables");
    FieldT::validate_modulus();
    (void)FieldT::one().inverse();
    leave_block("Validate modulus and build tables");

    for (std::size_t log_n = log_n_min; log_n <= log_n_max; ++log_n)
    {
        print_separator();
        const std::size_t n = 1ul << log_n;
        print_indent(); printf("* size of n: %zu\n", n);

        enter_block("Sample random vectors");
        const std::vector<FieldT> a_vec = random_vector<FieldT>(n);
        std::vector<FieldT> b_vec = random_vector<FieldT>(n);
        for (std::size_t i = 0; i < n; ++i)
        {
            if (b_vec[i].is_zero())
            {
                b_vec[i] = FieldT::one();
            }
        }
        leave_block("Sample random vectors");

        std::vector<FieldT> result(n);

        enter_block("Multiply");
        for (std::size_t i = 0; i < n; ++i)
        {
            result[i] = a_vec[i] * b_vec[i];
        }
        leave_block("Multiply");

        enter_block("Square");
        for (std::size_t i = 0; i < n; ++i)
        {
            result[i] = a_vec[i].squared();
        }
        leave_block("Square");

        enter_block("Inverse");
        for (std::size_t i = 0; i < n; ++i)
        {
            result[i] = b_vec[i].inverse();
        }
        leave_block("Inverse");

        enter_block("Batch inverse");
        result = batch_inverse<FieldT>(b_vec);
        leave_block("Batch inverse");

        enter_block("Divide");
        for (std::size_t i = 0; i < n; ++i)
        {
            result[i] = a_vec[i] / b_vec[i];
        }
        leave_block("Divide");
    }
}

int main(int argc, const char * argv[])
{
    std::size_t log_n_min;
    std::size_t log_n_max;
    std::size_t field;
    std::string backend;

#ifdef CPPDEBUG
    /* set reasonable defaults */
    if (argc > 1)
    {
        printf("There is no argument parsing in CPPDEBUG mode.");
        exit(1);
    }
    (void)argv;

    log_n_min = 10;
    log_n_max = 16;
    field = 8;
    backend = "compute";
#else
    if (!process_instrument_command_line(argc, argv, log_n_min, log_n_max, field, backend))
    {
        return 1;
    }
#endif

    if (backend != "compute" && backend != "lut")
    {
        throw std::invalid_argument("Backend must be compute or lut.");
    }
    const bool use_lut = (backend == "lut");

    start_profiling();
    print_header("GF(2^m) arithmetic");
    printf("Selected parameters:\n");
    printf("* log_n_min = %zu\n", log_n_min);
    printf("* log_n_max = %zu\n", log_n_max);
    printf("* field = GF(2^%zu)\n", field);
    printf("* backend = %s\n", backend.c_str());

    switch (field)
    {
        case 8:
            if (use_lut)
            {
                instrument_gf2m<gf2_8_rs>(log_n_min, log_n_max);
            }
            else
            {
                instrument_gf2m<gf2m_element<uint8_t, gf2_8_rs::modulus> >(log_n_min, log_n_max);
            }
            break;
        case 16:
            if (use_lut)
            {
                instrument_gf2m<gf2_16>(log_n_min, log_n_max);
            }
            else
            {
                instrument_gf2m<gf2m_element<uint16_t, gf2_16::modulus> >(log_n_min, log_n_max);
            }
            break;
        case 32:
            if (use_lut)
            {
                throw std::invalid_argument("The table backend supports fields of at most 16 bits.");
            }
            instrument_gf2m<gf2_32>(log_n_min, log_n_max);
            break;
        case 63:
            if (use_lut)
            {
                throw std::invalid_argument("The table backend supports fields of at most 16 bits.");
            }
            instrument_gf2m<gf2_63>(log_n_min, log_n_max);
            break;
        case 64:
            if (use_lut)
            {
                throw std::invalid_argument("The table backend supports fields of at most 16 bits.");
            }
            instrument_gf2m<gf2_64>(log_n_min, log_n_max);
            break;
        case 128:
            if (use_lut)
            {
                throw std::invalid_argument("The table backend supports fields of at most 16 bits.");
            }
            instrument_gf2m<gf2_128>(log_n_min, log_n_max);
            break;
        default:
            throw std::invalid_argument("Field size not supported.");
    }

    print_separator();
    print_cumulative_times();
    print_time("Done");
}
