#pragma once

#include <hyprutils/memory/UniquePtr.hpp>

using namespace Hyprutils::Memory;

template <typename T>
using UP = Hyprutils::Memory::CUniquePointer<T>;
