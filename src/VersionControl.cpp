#include "termcode-patch/VersionControl.h"

#include <array>
#include <cstdio>
#include <sstream>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace termcode_patch {

// ============================================================================
// Process helpers
// ============================================================================

CommandResult runCommand(const std::string& command, bool merge_stderr) {
    CommandResult result;
#if defined(_WIN32)
    std::string full = command + (merge_stderr ? " 2>&1" : " 2>NUL");
#else
    std::string full = command + (merge_stderr ? " 2>&1" : " 2>/dev/null");
#endif

#if defined(_WIN32)
    FILE* pipe = _popen(full.c_str(), "r");
#else
    FILE* pipe = popen(full.c_str(), "r");
#endif
    if (!pipe) {
        result.output = "failed to start: " + command;
        return result;
    }

    std::array<char, 4096> buffer{};
    while (true) {
        size_t n = fread(buffer.data(), 1, buffer.size(), pipe);
        if (n > 0) {
            result.output.append(buffer.data(), n);
        }
        if (n < buffer.size()) {
            break;
        }
    }

#if defined(_WIN32)
    result.exit_code = _pclose(pipe);
#else
    int status = pclose(pipe);
    if (status == -1) {
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = 128;
    }
#endif
    return result;
}

std::string shellQuote(const std::string& arg) {
    std::string out = "'";
    out.reserve(arg.size() + 16);
    for (char c : arg) {
        if (c == '\'') {
            out += "'\"'\"'";  // close ', add "'", reopen '
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

// ============================================================================
// GitVersionControl Implementation
// ============================================================================

GitVersionControl::GitVersionControl(std::string executable)
    : executable_(std::move(executable)) {
}

std::string GitVersionControl::command(const std::filesystem::path& repo_root,
                                       const std::string& args) const {
    return shellQuote(executable_) + " -C " + shellQuote(repo_root.string()) + " " + args;
}

CommandResult GitVersionControl::apply(const std::filesystem::path& repo_root,
                                       const std::filesystem::path& patch_file,
                                       bool three_way,
                                       bool whitespace_fix) {
    std::string args = "apply";
    if (three_way) {
        args += " --3way";
    }
    if (whitespace_fix) {
        args += " --whitespace=fix";
    }
    args += " " + shellQuote(patch_file.string());
    return runCommand(command(repo_root, args));
}

std::vector<std::string> GitVersionControl::listStagedFiles(
    const std::filesystem::path& repo_root) {
    return listFiles(repo_root, "diff --name-only --cached");
}

std::vector<std::string> GitVersionControl::listUnmergedFiles(
    const std::filesystem::path& repo_root) {
    return listFiles(repo_root, "diff --name-only --diff-filter=U");
}

std::vector<std::string> GitVersionControl::listFiles(
    const std::filesystem::path& repo_root,
    const std::string& args) {
    std::vector<std::string> files;
    // Only stdout names files; warnings on stderr must not become paths.
    CommandResult result = runCommand(command(repo_root, args), /*merge_stderr=*/false);
    if (!result.ok()) {
        return files;
    }

    std::istringstream stream(result.output);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            files.push_back(line);
        }
    }
    return files;
}

} // namespace termcode_patch
