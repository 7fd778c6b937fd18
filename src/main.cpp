#include "codebox/cli/commands.hpp"

int main(int argc, char **argv) { return codebox::cli::run_cli(argc, argv); }
