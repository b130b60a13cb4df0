// Copyright (c) 2009 - Mozy, Inc.

#include "rested/config.h"
#include "rested/test/stdoutlistener.h"

using namespace Rested;
using namespace Rested::Test;

// run_tests [--configvar=value ...] [regex ...]
int main(int argc, char *argv[])
{
    Config::loadFromEnvironment();
    Config::loadFromCommandLine(argc, argv);

    StdoutListener listener;
    bool passed;
    if (argc > 1)
        passed = runTests(selectTests(argc - 1, argv + 1), listener);
    else
        passed = runTests(allTests(), listener);
    return passed ? 0 : 1;
}
