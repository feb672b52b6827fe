// Copyright (c) 2024 UltiMaker
// SwitchTower is released under the terms of the AGPLv3 or higher

#include <signal.h> //For floating point exceptions.

#include <cstdlib>

#include <spdlog/spdlog.h>

#include "Application.h"

namespace switchtower
{

// Signal handler for a "floating point exception", which can also be integer division by zero errors.
void signal_FPE(int n)
{
    (void)n;
    spdlog::error("Arithmetic exception.");
    std::exit(1);
}

} // namespace switchtower

int main(int argc, char** argv)
{
#ifndef DEBUG
    signal(SIGFPE, switchtower::signal_FPE);
#endif

    return switchtower::Application::getInstance().run(argc, argv);
}
