#include "cli.hpp"

int main(int argc, char** argv)
{
    return audstego::runCli(argc, argv);
}
