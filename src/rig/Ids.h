// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include <cstdint>       // uint64_t
#include <random>        // std::random_device, std::mt19937_64
#include <string>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <functional>

namespace vrig
{
    /// @brief 64-bit identifier, strongly typed by a tag so that bone, skeleton,
    /// stroke and layer ids cannot be mixed up. Zero is the invalid id.
    template<class Tag>
    class Id
    {
    public:
        using underlying_type = uint64_t;

        Id() : value(0) {}
        explicit Id(underlying_type val) : value(val) {}

        static Id generate()
        {
            static thread_local std::mt19937_64 rng(std::random_device{}());
            underlying_type v = 0;
            while (v == 0) v = rng();
            return Id(v);
        }

        static Id from_string(const std::string& str)
        {
            std::istringstream iss(str);
            uint64_t high = 0;
            uint64_t mid = 0;
            uint64_t low = 0;

            char dash1 = 0, dash2 = 0;
            iss >> std::hex >> high >> dash1 >> mid >> dash2 >> low;
            if (iss.fail() || dash1 != '-' || dash2 != '-')
                throw std::invalid_argument("Invalid id string format: " + str);

            return Id((high << 32) | (mid << 16) | low);
        }

        static Id invalid() { return Id(0); }

        bool valid() const { return value != 0; }

        bool operator==(const Id& other) const { return value == other.value; }
        bool operator!=(const Id& other) const { return value != other.value; }
        bool operator<(const Id& other) const { return value < other.value; }

        underlying_type raw() const { return value; }

        std::string to_string() const
        {
            std::ostringstream oss;
            oss << std::hex << std::setfill('0')
                << std::setw(8) << ((value >> 32) & 0xFFFFFFFF) << '-'
                << std::setw(4) << ((value >> 16) & 0xFFFF) << '-'
                << std::setw(4) << (value & 0xFFFF);
            return oss.str();
        }

    private:
        underlying_type value;
    };

    struct BoneTag {};
    struct SkeletonTag {};
    struct StrokeTag {};
    struct LayerTag {};

    using BoneId = Id<BoneTag>;
    using SkeletonId = Id<SkeletonTag>;
    using StrokeId = Id<StrokeTag>;
    using LayerId = Id<LayerTag>;
}

namespace std {
    template<class Tag>
    struct hash<vrig::Id<Tag>>
    {
        size_t operator()(const vrig::Id<Tag>& id) const noexcept
        {
            return std::hash<uint64_t>()(id.raw());
        }
    };
}
