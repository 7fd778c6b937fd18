#pragma once

namespace codebox::cli {

void print_help();
int run_cli(int argc, char **argv);

} // namespace codebox::cli
