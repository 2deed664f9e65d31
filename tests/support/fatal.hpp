#pragma once

#include <csignal>
#include <iostream>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace coded::test
{

// Runs func in a forked child and returns true if the child was killed by SIGABRT (std::terminate).
template <typename Func>
bool terminates(Func&& func)
{
    std::cout.flush();
    std::cerr.flush();

    const pid_t pid = ::fork();
    if (pid < 0)
        return false;

    if (pid == 0)
    {
        // the child must never return into the test runner
        try
        {
            func();
        }
        catch (...)
        {
            ::_exit(1);
        }
        ::_exit(0);
    }

    int status = 0;
    if (::waitpid(pid, &status, 0) != pid)
        return false;
    return WIFSIGNALED(status) && WTERMSIG(status) == SIGABRT;
}

}  // namespace coded::test
