/*
 * The core imports for reactree. Use this to ensure the correct import order can be maintained.
 */

#ifndef REACTREE_BASE_H
#define REACTREE_BASE_H

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <reactree/reactree_export.h>
#include <reactree/reactree_forward_declarations.h>
#include <reactree/util/date_time.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#endif //REACTREE_BASE_H
