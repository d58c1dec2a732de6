#include "pairlink/cli/commands.hpp"

int main(int argc, char **argv) { return pairlink::cli::run_cli(argc, argv); }
