#pragma once

namespace tool
{
    // Runs one string_manip invocation described by the command line.
    // Returns the process exit code; argument errors are thrown as string_manip::argument_error.
    int run(int argc, char* argv[]);
    void print_usage();
}
