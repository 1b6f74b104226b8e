#include "kiln/cli.hpp"

int main(int argc, char **argv) {
    return kiln::run_cli(argc, argv);
}
