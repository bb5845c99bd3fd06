#if defined(__linux__)

#include "platform/ProcessImpl.hpp"
#include <errno.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace moddep::process::detail {

	//---Платформенно-специфичная реализация запуска процесса для Linux
    bool spawnPlatform(const fs::path& exe, const std::vector<std::string>& args,
        SpawnResult& out, const RunOptions& opt)
    {
        out = {};

        //---argv готовим до fork: в дочернем процессе только exec
        std::vector<std::string> argvStorage;
        argvStorage.reserve(args.size() + 1);
        argvStorage.push_back(exe.string());
        argvStorage.insert(argvStorage.end(), args.begin(), args.end());

        std::vector<char*> argv;
        argv.reserve(argvStorage.size() + 1);
        for (auto& s : argvStorage) argv.push_back(s.data());
        argv.push_back(nullptr);

        pid_t pid = fork();
        if (pid < 0)
        {
            out.started = false;
            out.sysError = (std::uint32_t)errno;
            return false;
        }

        if (pid == 0)
        {
            if (!opt.workingDir.empty())
                (void)chdir(opt.workingDir.c_str());

            execv(exe.c_str(), argv.data());
            _exit(127); // exec failed
        }

        out.started = true;
        out.pid = (int)pid;
        return true;
    }

    //---Ожидание завершения дочернего процесса
    bool waitPlatform(int pid, bool blocking, ExitStatus& out)
    {
        out = {};

        int status = 0;
        pid_t r = 0;
        do
        {
            r = waitpid((pid_t)pid, &status, blocking ? 0 : WNOHANG);
        } while (r < 0 && errno == EINTR);

        if (r < 0)
        {
            out.sysError = (std::uint32_t)errno;
            return false;
        }
        //---WNOHANG: процесс ещё работает
        if (r == 0) return true;

        out.exited = true;
        if (WIFEXITED(status))
            out.exitCode = WEXITSTATUS(status);
        else if (WIFSIGNALED(status))
            out.exitCode = 128 + WTERMSIG(status);
        else
            out.exitCode = 1;

        return true;
    }

    void terminatePlatform(int pid)
    {
        if (pid > 0) (void)kill((pid_t)pid, SIGTERM);
    }

} // namespace moddep::process::detail
#endif
