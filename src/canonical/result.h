#pragma once
#include "failure.h"
#include <expected>

template<typename T>
using Result = std::expected<T, Failure>;

using VoidResult = std::expected<void, Failure>;
