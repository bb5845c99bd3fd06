#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace moddep::process {

    namespace fs = std::filesystem;

    struct RunOptions final {
        fs::path workingDir;          // Рабочий каталог для запускаемого процесса (опционально)
    };

    struct SpawnResult final {
        bool started = false;         // Успешно ли запущен процесс
        int pid = -1;                 // Идентификатор дочернего процесса
        std::uint32_t sysError = 0;   // errno при ошибке запуска
    };

    struct ExitStatus final {
        bool exited = false;          // Процесс завершился (для tryWait: false - ещё работает)
        int exitCode = 0;             // Код завершения (128 + сигнал при завершении сигналом)
        std::uint32_t sysError = 0;   // errno при ошибке ожидания
    };

    //---Запускает внешний процесс без ожидания его завершения
    //
    // Параметры:
    //   exe - путь к исполняемому файлу
    //   args - аргументы командной строки для передачи процессу
    //   out - результат запуска (pid при успехе)
    //   opt - опции запуска процесса
    // Возвращает:
    //   true - процесс запущен
    //   false - ошибка запуска (out.sysError)
    bool spawn(const fs::path& exe, const std::vector<std::string>& args,
        SpawnResult& out, const RunOptions& opt = {});

    //---Неблокирующая проверка завершения (out.exited == false - процесс ещё работает)
    bool tryWait(int pid, ExitStatus& out);

    //---Блокирующее ожидание завершения
    bool wait(int pid, ExitStatus& out);

    //---Принудительное завершение (best-effort)
    void terminate(int pid);

} // namespace moddep::process
