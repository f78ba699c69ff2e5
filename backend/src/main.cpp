#include "app/CliMain.hpp"

int main(int argc, char *argv[])
{
    return tp::app::cli_main(argc, argv);
}
