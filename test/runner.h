/* helper functions for test runners.
 * (C) Simson L. Garfinkel, BasisTech LLC, 2024
 */

#ifndef RUNNER_H
#define RUNNER_H

#include <string>
#include <vector>
#include <sstream>
#include <random>
#include <filesystem>

#include "corr/services/Log.h"

namespace runner {
    std::filesystem::path NamedTemporaryDirectory(std::string prefix, unsigned long long max_tries = 1000);
    bool contains(std::string line, std::string substr);
    std::string file_contents(std::filesystem::path path);
    bool file_contains(std::filesystem::path path, std::string substr);

    /* A file in a fresh temporary directory; both are removed on destruction. */
    struct tempfile {
        tempfile(std::string testname);
        ~tempfile();
        std::filesystem::path temp_dir;
        std::filesystem::path temp_file_path;
        void write(const std::string &contents);
        bool validate_contents(std::string substr);
        bool validate_contains(std::string substr);
    };

    /* Log that keeps every message it is given, in addition to
     * the normal formatting to stderr or a file.
     */
    class CapturingLog : public Log {
    public:
        using Log::log;
        void log(Channel a_channel, const std::string &a_msg) override;
        bool contains(Channel a_channel, const std::string &substr) const;
        size_t count(Channel a_channel) const;
        std::vector<std::pair<Channel, std::string>> messages;
    };

    /* Registers a CapturingLog with CorrServices for the lifetime of the object. */
    class ScopedLog {
    public:
        ScopedLog();
        ~ScopedLog();
        CapturingLog log;
    };
}

#endif
