/**
 * @file fingerprint.cpp
 * @brief FNV-1a fingerprinting
 */

#include "core/fingerprint.hpp"
#include <iomanip>
#include <sstream>

namespace riskengine
{
    std::uint64_t fnv1a_64(const std::string &bytes)
    {
        std::uint64_t hash = 14695981039346656037ULL;

        for (unsigned char c : bytes)
        {
            hash ^= static_cast<std::uint64_t>(c);
            hash *= 1099511628211ULL;
        }

        return hash;
    }

    std::string fingerprint_of_dump(const std::string &canonical)
    {
        std::ostringstream out;
        out << std::hex << std::setw(16) << std::setfill('0') << fnv1a_64(canonical);
        return out.str();
    }

    std::string fingerprint_of(const nlohmann::json &document)
    {
        return fingerprint_of_dump(document.dump());
    }
} // namespace riskengine
