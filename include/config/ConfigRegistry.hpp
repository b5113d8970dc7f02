#pragma once

#include "config/Config.hpp"

#include <mutex>

namespace ad::config {

class ConfigRegistry {
public:
    static void init(const Config& cfg);
    static const Config& get();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace ad::config
