#include "../../include/conversion_registry.hpp"
#include "../../include/external_routines.hpp"

namespace convoy {

void register_builtin_routines(ConversionRegistry& registry) {
    for (const auto media : {ChdMedia::Cd, ChdMedia::Dvd, ChdMedia::HardDisk, ChdMedia::LaserDisc, ChdMedia::Raw}) {
        registry.add(std::make_unique<ChdmanCreateRoutine>(media));
        registry.add(std::make_unique<ChdmanExtractRoutine>(media));
    }
    registry.add(std::make_unique<ChdmanInspectRoutine>(ChdmanInspectRoutine::Mode::Verify));
    registry.add(std::make_unique<ChdmanInspectRoutine>(ChdmanInspectRoutine::Mode::Info));
    registry.add(std::make_unique<DolphinCompressRoutine>());
    registry.add(std::make_unique<DolphinExtractRoutine>());
    registry.add(std::make_unique<MaxcsoCompressRoutine>());
    registry.add(std::make_unique<SevenZipRepackRoutine>());
    registry.add(std::make_unique<SevenZipExtractRoutine>());
}

} // namespace convoy
