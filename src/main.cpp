#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include "rdgraph/common/dependency_listing.hpp"

int main(int argc, char** argv)
{
    try
    {
        std::cout << "\n\n====== rdgraph ======\n" << std::flush;

        int status = rdgraph::run_listing(std::cin, std::cout, std::cerr);
        if (status != EXIT_SUCCESS)
        {
            std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
            return status;
        }

        std::cout << "\n\n====== normal exit ======\n" << std::flush;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
