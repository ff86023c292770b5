#pragma once

#include <string>

namespace Tessera {
    struct Version {
        static constexpr int MAJOR = 0;
        static constexpr int MINOR = 3;
        static constexpr int PATCH = 0;

        /// "MAJOR.MINOR.PATCH"
        static std::string toString() {
            return std::to_string(MAJOR) + "." + std::to_string(MINOR) + "." + std::to_string(PATCH);
        }

        /// Banner for logs and --help, e.g. "tessera-relay/0.3.0"
        static std::string banner(const std::string& program) {
            return "tessera-" + program + "/" + toString();
        }
    };
}
