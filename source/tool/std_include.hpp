#pragma once

// Standard C++ includes
#include <string>
#include <vector>
#include <map>
#include <algorithm>
#include <iterator>
#include <memory>
#include <mutex>
#include <chrono>
#include <functional>
#include <fstream>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <cstdint>
#include <cstring>
#include <cctype>

// Project-wide defaults
#define STRING_MANIP_VERSION "1.0.0"
#define STRING_MANIP_CONFIG_FILE "string_manip.ini"
#define STRING_MANIP_LIST_SEPARATOR ';'

using namespace std::literals;
