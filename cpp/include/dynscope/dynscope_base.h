/*
 * The core imports for dynscope. Use this to ensure the correct import order can be maintained.
 */

#ifndef DYNSCOPE_BASE_H
#define DYNSCOPE_BASE_H

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <dynscope/dynscope_export.h>
#include <dynscope/dynscope_forward_declarations.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#endif //DYNSCOPE_BASE_H
