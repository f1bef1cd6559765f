#include "version.h"
#include <iostream>
#include <iomanip>

namespace peerdrop {
    namespace version {

        void print_version_info() {
            std::cout << "Version: " << STRING << std::endl;
            std::cout << "Build: " << (BUILD[0] ? BUILD : "default") << std::endl;
        }

        void print_header() {
            std::cout << "        ==================== peerdrop ====================" << std::endl;
            std::cout << "           Version: " << std::left << std::setw(10) << STRING
                      << "  Build: " << (BUILD[0] ? BUILD : "default") << std::endl;
            std::cout << "        ==================================================" << std::endl;
            std::cout << std::endl;
        }
    }
}
