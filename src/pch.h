#pragma once

// Windows-specific headers (only on Windows)
#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#endif

// Standard C++ Library - Most frequently used
#include <string>
#include <vector>
#include <map>
#include <set>
#include <algorithm>
#include <iostream>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <optional>
#include <memory>
#include <functional>

// Additional commonly used headers
#include <cctype>
#include <cstdlib>
#include <cstdio>
#include <cstring>

// Core project types - used by almost every file
#include "common/project_types.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"
