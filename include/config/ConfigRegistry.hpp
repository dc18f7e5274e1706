#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace bc::config {

class ConfigRegistry {
public:
    // Empty path = built-in defaults
    static void init(const std::filesystem::path& path = {});
    static const Config& get();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace bc::config
