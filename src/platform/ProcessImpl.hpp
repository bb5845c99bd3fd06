#pragma once
#include "mod_deployer/Process.hpp"

namespace moddep::process::detail {

// Платформенно-специфичная реализация запуска процесса
// Определяется в соответствующих файлах реализации:
//   - ProcessLinux.cpp для Linux
// Параметры:
//   exe - путь к исполняемому файлу
//   args - аргументы командной строки для передачи процессу
//   out - структура для записи результатов запуска (передается по ссылке)
//   opt - опции запуска процесса
    bool spawnPlatform(const fs::path& exe, const std::vector<std::string>& args,
        SpawnResult& out, const RunOptions& opt);

    // Ожидание завершения: blocking == false - проверка без блокировки
    bool waitPlatform(int pid, bool blocking, ExitStatus& out);

    void terminatePlatform(int pid);

} // namespace moddep::process::detail
