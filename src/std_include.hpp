#ifndef STD_INCLUDE_HPP
#define STD_INCLUDE_HPP

#include <algorithm>
#include <any>
#include <array>
#include <atomic>
#include <cmath>
#include <compare>
#include <concepts>
#include <cstddef>
#include <exception>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <numeric>
#include <optional>
#include <ranges>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#endif
