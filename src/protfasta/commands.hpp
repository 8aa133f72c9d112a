#pragma once

namespace protfasta {

// Each subcommand receives argv with the subcommand name as argv[0].
// Returns the process exit status.
int run_clean(int argc, char* argv[]);
int run_split(int argc, char* argv[]);

} // namespace protfasta
