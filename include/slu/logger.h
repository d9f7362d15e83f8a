#ifndef SLU_LOGGER_H
#define SLU_LOGGER_H

#include <fstream>
#include <string>

/**
 * @brief Plain message log written to a file and, optionally, stdout
 */
class Logger {
private:
    std::ofstream file;
    bool to_stdout;
    bool progress_pending;

public:
    /**
     * @brief Open (truncate) the log file
     * @param path Log file, or empty for stdout only
     * @param to_stdout Echo every line to stdout
     * @throws std::runtime_error if the file cannot be opened
     */
    Logger(const std::string& path, bool to_stdout);

    void info(const std::string& message);

    /**
     * @brief Overwritable progress line on stdout, never written to the file
     */
    void progress(const std::string& message);

    /**
     * @brief Local time as "Mon Oct 19 14:02:11 2026"
     */
    static std::string timestamp();
};

#endif // SLU_LOGGER_H
