#include "../include/stratum/codegen/writer.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>
#include <utility>

namespace stratum::codegen {
namespace {

[[nodiscard]] auto failure(const std::string& target, const char* action) -> WriteResult {
    const int error = errno;
    std::string message = std::string{"failed to "} + action + " '" + target + "'";
    if (error != 0) {
        message += ": ";
        message += std::strerror(error);
    }
    return WriteResult{
        .success = false,
        .target = target,
        .message = std::move(message),
    };
}

}  // namespace

auto FileSystemWriter::write(const std::string& target, const std::string& content) const -> WriteResult {
    errno = 0;
    std::ofstream file(target, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file) {
        return failure(target, "open");
    }
    file << content;
    file.flush();
    if (!file) {
        return failure(target, "write");
    }
    return WriteResult{
        .success = true,
        .target = target,
        .message = {},
    };
}

}  // namespace stratum::codegen
