/**
 * @file fingerprint.hpp
 * @brief Deterministic hashing of canonical JSON documents
 *
 * nlohmann::json objects keep their keys sorted, so dump() of a document
 * built from the same values always produces the same bytes. The hash is
 * 64-bit FNV-1a rendered as 16 lowercase hex digits.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace riskengine
{
    /**
     * @brief 64-bit FNV-1a hash of a byte string
     */
    std::uint64_t fnv1a_64(const std::string &bytes);

    /**
     * @brief Hash of an already dumped canonical document
     */
    std::string fingerprint_of_dump(const std::string &canonical);

    /**
     * @brief Hash of the canonical dump of a JSON document
     * @param document Value to fingerprint
     * @return 16-character hex string
     */
    std::string fingerprint_of(const nlohmann::json &document);

} // namespace riskengine
