#include "../../include/conversion_registry.hpp"
#include "../../include/external_routines.hpp"
#include <stdexcept>

namespace convoy {

ConversionRegistry ConversionRegistry::with_builtin_routines() {
    ConversionRegistry registry;
    register_builtin_routines(registry);
    return registry;
}

void ConversionRegistry::add(std::unique_ptr<IConversionRoutine> routine) {
    if (!routine) {
        throw std::invalid_argument("null conversion routine");
    }
    std::string id(routine->id());
    if (id.empty()) {
        throw std::invalid_argument("conversion routine without id");
    }
    if (routines_.count(id)) {
        throw std::invalid_argument("duplicate conversion routine id: " + id);
    }
    routines_.emplace(std::move(id), std::move(routine));
}

IConversionRoutine* ConversionRegistry::find(const std::string& id) const {
    const auto it = routines_.find(id);
    return it == routines_.end() ? nullptr : it->second.get();
}

std::vector<std::string> ConversionRegistry::ids() const {
    std::vector<std::string> out;
    out.reserve(routines_.size());
    for (const auto& [id, routine] : routines_) {
        out.push_back(id);
    }
    return out;
}

} // namespace convoy
