#pragma once

#include <string>

namespace QuietSync {
    struct Version {
        static constexpr int MAJOR = 0;
        static constexpr int MINOR = 3;
        static constexpr int PATCH = 0;
        static constexpr const char* STRING = "0.3.0";

        static std::string toString() {
            return "quietsync " + std::string(STRING);
        }
    };
}
