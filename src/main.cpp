#include "core/cli.hpp"

int main(int argc, char* argv[]) {
    return CLI::run(argc, argv);
}
