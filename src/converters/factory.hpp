#pragma once

/**
 * Factory for the ordered converter list.
 */

#include "converter.hpp"
#include <memory>
#include <vector>

namespace x5::converters {

/**
 * Creates one instance of every converter, bound to bundle, in priority
 * order: tool-specific converters first, the default converter last.
 */
std::vector<std::unique_ptr<Converter>> make_converters(Bundle& bundle);

} // namespace x5::converters
