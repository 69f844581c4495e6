#pragma once

#include <filesystem>

namespace logship {

// Delivers a finished archive. Deleting the archive after a successful
// delivery, or keeping it for a retry, is up to the implementation.
class PayloadSender {
public:
    virtual ~PayloadSender() = default;
    virtual bool send(const std::filesystem::path& archive) = 0;
};

} // namespace logship
