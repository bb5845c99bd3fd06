#include "mod_deployer/Process.hpp"
#include "platform/ProcessImpl.hpp"

namespace moddep::process {

// Публичные функции работы с процессами - оболочки над
// платформенно-специфичной реализацией (detail::*Platform)
    bool spawn(const fs::path& exe, const std::vector<std::string>& args,
        SpawnResult& out, const RunOptions& opt)
    {
        return detail::spawnPlatform(exe, args, out, opt);
    }

    bool tryWait(int pid, ExitStatus& out)
    {
        return detail::waitPlatform(pid, false, out);
    }

    bool wait(int pid, ExitStatus& out)
    {
        return detail::waitPlatform(pid, true, out);
    }

    void terminate(int pid)
    {
        detail::terminatePlatform(pid);
    }

} // namespace moddep::process
