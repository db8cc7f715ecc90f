#include "factory.hpp"
#include "default_converter.hpp"
#include "edge_converter.hpp"
#include "hype_converter.hpp"

namespace x5::converters {

std::vector<std::unique_ptr<Converter>> make_converters(Bundle& bundle) {
    std::vector<std::unique_ptr<Converter>> converters;
    converters.push_back(std::make_unique<EdgeConverter>(bundle));
    converters.push_back(std::make_unique<HypeConverter>(bundle));
    // Always matches; must stay last.
    converters.push_back(std::make_unique<DefaultConverter>(bundle));
    return converters;
}

} // namespace x5::converters
