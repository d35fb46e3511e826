#include "bootstrap.hpp"
#include "errors/Error.hpp"

#include <iostream>

int main(const int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);

    try {
        auto ctx = lsm::app::bootstrap();
        const int rc = lsm::cli::runSummon(args, ctx);
        lsm::log::Registry::shutdown();
        return rc;
    } catch (const lsm::Error& e) {
        std::cerr << "Error initializing locksmith: " << e.what() << std::endl;
        return 1;
    }
}
