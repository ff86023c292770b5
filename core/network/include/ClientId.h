#pragma once

#include <uuid/uuid.h>

#include <string>

namespace Tessera {
namespace Signaling {

    class ClientId {
    public:
        /**
         * @brief Random (version 4) UUID in lowercase 8-4-4-4-12 form
         */
        static std::string generate() {
            uuid_t uuid;
            uuid_generate_random(uuid);
            char str[37];
            uuid_unparse_lower(uuid, str);
            return std::string(str);
        }

        // Any case is accepted
        static bool isValid(const std::string& id) {
            if (id.size() != 36) return false;
            uuid_t parsed;
            return uuid_parse(id.c_str(), parsed) == 0;
        }
    };

} // namespace Signaling
} // namespace Tessera
