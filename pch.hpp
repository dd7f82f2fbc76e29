// pch.hpp
#pragma once

// ---------------------------------------------------------
// External libraries
// ---------------------------------------------------------
#include <nlohmann/json.hpp>

// ---------------------------------------------------------
// Linux
// ---------------------------------------------------------
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/ioctl.h>

// ---------------------------------------------------------
// Standard Library
// ---------------------------------------------------------
#include <iostream>
#include <vector>
#include <string>
#include <sstream>
#include <set>
#include <filesystem>
#include <algorithm>
#include <chrono>
#include <optional>
#include <variant>
#include <memory>
#include <functional>
#include <fstream>
#include <cstdlib>
