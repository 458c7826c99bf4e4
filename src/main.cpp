#include <iostream>
#include <cstdlib>
#include "signrecog/cli_interface.h"

int main(int argc, char* argv[]) {
    try {
        signrecog::cli::CliInterface cli;
        auto result = cli.run(argc, argv);
        return result.exit_code;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
