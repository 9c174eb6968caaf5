#include "runtime/file_transfer.hpp"
#include "util/base64.hpp"
#include "util/shell.hpp"
#include <spdlog/spdlog.h>

namespace sandpool::runtime {

std::string build_read_command(const std::string& path) {
    return "base64 -w0 " + util::shell_quote(path);
}

std::string build_write_command(const std::string& path, const std::string& content) {
    std::string quoted = util::shell_quote(path);
    return "mkdir -p \"$(dirname " + quoted + ")\" && echo '" +
           util::base64_encode(content) + "' | base64 -d > " + quoted;
}

ReadResult transfer_read(const ExecFn& exec, const std::string& path, const ExecOptions& opts) {
    ReadResult result;

    ExecResponse response = exec(build_read_command(path), opts);
    if (!response.success) {
        result.error = response.error;
        return result;
    }

    const ExecResult& out = response.result;
    if (out.exit_code != 0) {
        if (!out.stderr_data.empty()) {
            result.error = Error(ErrorKind::COMMAND_FAILED, out.stderr_data, out.exit_code);
        } else if (!out.stdout_data.empty()) {
            result.error = Error(ErrorKind::COMMAND_FAILED, out.stdout_data, out.exit_code);
        } else {
            result.error = Error(ErrorKind::FILE_NOT_FOUND, path);
        }
        spdlog::debug("read_file {} failed: {}", path, result.error.to_string());
        return result;
    }

    auto decoded = util::base64_decode(out.stdout_data);
    if (!decoded) {
        result.error = Error(ErrorKind::INVALID_BASE64, path);
        return result;
    }

    result.success = true;
    result.content = std::move(*decoded);
    return result;
}

OpResult transfer_write(const ExecFn& exec, const std::string& path,
                        const std::string& content, const ExecOptions& opts) {
    ExecResponse response = exec(build_write_command(path, content), opts);
    if (!response.success) {
        return OpResult::fail(response.error);
    }

    const ExecResult& out = response.result;
    if (out.exit_code == 0) {
        return OpResult::ok();
    }

    spdlog::debug("write_file {} exited with {}", path, out.exit_code);
    if (!out.stderr_data.empty()) {
        return OpResult::fail(Error(ErrorKind::COMMAND_FAILED, out.stderr_data, out.exit_code));
    }
    if (!out.stdout_data.empty()) {
        return OpResult::fail(Error(ErrorKind::COMMAND_FAILED, out.stdout_data, out.exit_code));
    }
    return OpResult::fail(Error(ErrorKind::EXIT_CODE, "", out.exit_code));
}

OpResult transfer_write_many(const ExecFn& exec,
                             const std::vector<std::pair<std::string, std::string>>& files,
                             const ExecOptions& opts) {
    for (const auto& [path, content] : files) {
        OpResult result = transfer_write(exec, path, content, opts);
        if (!result.success) {
            spdlog::warn("write_files stopped at {}: {}", path, result.error.to_string());
            return result;
        }
    }
    return OpResult::ok();
}

} // namespace sandpool::runtime
