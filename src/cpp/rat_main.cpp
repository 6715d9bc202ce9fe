#include <rat.hpp>

int main(int argc, char** argv) {
    rat::CommandLine args(argv, argv + argc);
    return rat::run_cli(args);
}
