#pragma once

// Runs the command line tool and returns the process exit status: 0 on success, 1
// when the operation fails and 2 for usage errors.
int run_tool(const int argc, const char* const argv[]);
