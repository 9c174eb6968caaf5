/**
 * File transfer over exec
 *
 * Reads and writes files inside any sandbox whose exec environment has a
 * POSIX shell with base64, mkdir -p and redirection. Content is moved as
 * base64 text so binary data (including NUL bytes) survives intact.
 */
#pragma once
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include "runtime/adapter.hpp"

namespace sandpool::runtime {

using ExecFn = std::function<ExecResponse(const std::string& command, const ExecOptions& opts)>;

// Commands as sent to the sandbox shell
std::string build_read_command(const std::string& path);
std::string build_write_command(const std::string& path, const std::string& content);

ReadResult transfer_read(const ExecFn& exec, const std::string& path, const ExecOptions& opts);

OpResult transfer_write(const ExecFn& exec, const std::string& path,
                        const std::string& content, const ExecOptions& opts);

// Sequential, stops at the first failure. Files already written stay written.
OpResult transfer_write_many(const ExecFn& exec,
                             const std::vector<std::pair<std::string, std::string>>& files,
                             const ExecOptions& opts);

} // namespace sandpool::runtime
