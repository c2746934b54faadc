#pragma once

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

class HashUtils
{
public:
    /**
     * @brief Number of differing bits between two 64-bit hashes
     */
    static int hammingDistance(uint64_t a, uint64_t b)
    {
        return __builtin_popcountll(a ^ b);
    }

    /**
     * @brief Hash as 16 lower-case hex digits
     */
    static std::string toHex(uint64_t hash)
    {
        std::stringstream ss;
        ss << std::hex << std::setw(16) << std::setfill('0') << hash;
        return ss.str();
    }
};
