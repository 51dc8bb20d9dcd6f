#include "eol_lib/App.hpp"
#include "eol_lib/Interrupt.hpp"

#include <iostream>

int main(int argc, char* argv[]) {
    eol_lib::installInterruptHandler();

    std::vector<std::string> args(argv + 1, argv + argc);
    return eol_lib::runApp(args, argv[0], std::cout, std::cerr, &eol_lib::interruptFlag());
}
