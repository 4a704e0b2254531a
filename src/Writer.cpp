#include "termcode-patch/Writer.h"

#include <fstream>
#include <sstream>

namespace termcode_patch {

namespace fs = std::filesystem;

static void setError(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
}

// ============================================================================
// WorkspaceWriter Implementation
// ============================================================================

WorkspaceWriter::WorkspaceWriter(fs::path root) {
    std::error_code ec;
    fs::path absolute = fs::absolute(root, ec);
    root_ = (ec ? root : absolute).lexically_normal();
}

std::optional<fs::path> WorkspaceWriter::resolve(const std::string& relative,
                                                 std::string* error) const {
    fs::path rel(relative);
    if (relative.empty() || rel.is_absolute()) {
        setError(error, "refusing path outside workspace: '" + relative + "'");
        return std::nullopt;
    }

    fs::path full = (root_ / rel).lexically_normal();
    fs::path back = full.lexically_relative(root_);
    if (back.empty() || back.begin()->string() == "..") {
        setError(error, "refusing path outside workspace: '" + relative + "'");
        return std::nullopt;
    }
    return full;
}

bool WorkspaceWriter::exists(const std::string& relative) const {
    auto full = resolve(relative);
    if (!full) {
        return false;
    }
    std::error_code ec;
    return fs::is_regular_file(*full, ec);
}

bool WorkspaceWriter::readFile(const std::string& relative, std::string& content,
                               std::string* error) const {
    auto full = resolve(relative, error);
    if (!full) {
        return false;
    }

    std::ifstream ifs(*full, std::ios::binary);
    if (!ifs) {
        setError(error, "cannot open '" + relative + "' for reading");
        return false;
    }

    std::stringstream buffer;
    buffer << ifs.rdbuf();
    if (ifs.bad()) {
        setError(error, "error while reading '" + relative + "'");
        return false;
    }
    content = buffer.str();
    return true;
}

bool WorkspaceWriter::writeFile(const std::string& relative, const std::string& content,
                                std::string* error) {
    auto full = resolve(relative, error);
    if (!full) {
        return false;
    }

    std::error_code ec;
    fs::create_directories(full->parent_path(), ec);
    if (ec) {
        setError(error, "cannot create directory for '" + relative + "': " + ec.message());
        return false;
    }

    std::ofstream ofs(*full, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        setError(error, "cannot open '" + relative + "' for writing");
        return false;
    }

    ofs << content;
    ofs.flush();
    if (!ofs) {
        setError(error, "error while writing '" + relative + "'");
        return false;
    }
    return true;
}

bool WorkspaceWriter::removeFile(const std::string& relative, std::string* error) {
    auto full = resolve(relative, error);
    if (!full) {
        return false;
    }

    std::error_code ec;
    if (!fs::remove(*full, ec)) {
        setError(error, ec ? "cannot remove '" + relative + "': " + ec.message()
                           : "cannot remove '" + relative + "': no such file");
        return false;
    }
    return true;
}

} // namespace termcode_patch
