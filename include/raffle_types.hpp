#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>

namespace rf {

using Identity = std::string;
using RequestToken = std::uint64_t;
using Timestamp = std::chrono::system_clock::time_point;
using RandomWord = boost::multiprecision::uint256_t;

} // namespace rf
