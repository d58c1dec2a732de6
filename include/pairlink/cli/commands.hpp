#pragma once

namespace pairlink::cli {

/// Entry point for the `pairlink` executable. Returns the process exit code.
int run_cli(int argc, char **argv);

} // namespace pairlink::cli
