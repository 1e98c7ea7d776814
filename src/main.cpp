#include "core/cli.hpp"
#include "core/config.hpp"

int main(int argc, char* argv[]) {
    // $HOME is read here once and handed down
    return CLI::run(argc, argv, Config::home_from_env());
}
