#include "internal.h"

#include <sys/wait.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sstream>
#include <string>
#include <vector>

namespace gitshort {
namespace proc {

Output run(const std::string& cmd) {
    FILE* fp = popen(cmd.c_str(), "r");
    if (!fp) {
        throw IoError("cannot start '" + cmd + "': " + std::strerror(errno));
    }

    Output result;
    char buf[4096];
    while (std::fgets(buf, sizeof(buf), fp)) result.out += buf;

    int status = pclose(fp);
    if (status == -1) {
        throw IoError("cannot wait for '" + cmd + "': " + std::strerror(errno));
    }
    result.status = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}

std::string shell_quote(const std::string& s) {
    std::string quoted = "'";
    for (char c : s) {
        if (c == '\'') quoted += "'\\''";
        else           quoted += c;
    }
    quoted += "'";
    return quoted;
}

std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> result;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        while (!line.empty() &&
               (line.back() == '\r' || line.back() == ' ' || line.back() == '\t'))
            line.pop_back();
        size_t start = line.find_first_not_of(" \t");
        if (start == std::string::npos) continue;
        result.push_back(line.substr(start));
    }
    return result;
}

} // namespace proc
} // namespace gitshort
