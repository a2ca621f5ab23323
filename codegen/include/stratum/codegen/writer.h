#pragma once

#include <string>

namespace stratum::codegen {

struct WriteResult {
    bool success = false;
    std::string target;
    std::string message;  // empty on success
};

// Persists named text content.
class ContentWriter {
   public:
    virtual ~ContentWriter() = default;
    [[nodiscard]] virtual auto write(const std::string& target, const std::string& content) const -> WriteResult = 0;
};

// Writes `content` to the file at path `target`, replacing it.
class FileSystemWriter final : public ContentWriter {
   public:
    [[nodiscard]] auto write(const std::string& target, const std::string& content) const -> WriteResult override;
};

}  // namespace stratum::codegen
