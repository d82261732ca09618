#pragma once
#include <array>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <sys/wait.h>

namespace codelens_core {

struct ProcessResult {
    std::string output;
    int exit_code;
    bool success;
};

class SubProcess {
public:
    // Runs cmd through the shell and captures stdout byte for byte, embedded NULs included.
    // stderr is discarded unless merged.
    static ProcessResult run(const std::string& cmd, bool merge_stderr = false) {
        std::array<char, 4096> buffer;
        std::string result;

        std::string full_cmd = cmd + (merge_stderr ? " 2>&1" : " 2>/dev/null");

        FILE* pipe = popen(full_cmd.c_str(), "r");
        if (!pipe) throw std::runtime_error("popen() failed for: " + cmd);

        size_t n = 0;
        while ((n = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
            result.append(buffer.data(), n);
        }

        int status = pclose(pipe);
        int rc = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;

        return { result, rc, rc == 0 };
    }

    // Single-quotes an argument for /bin/sh
    static std::string quote(const std::string& arg) {
        std::string out = "'";
        for (char c : arg) {
            if (c == '\'') {
                out += "'\\''";
            } else {
                out += c;
            }
        }
        out += "'";
        return out;
    }
};

}  // namespace codelens_core
