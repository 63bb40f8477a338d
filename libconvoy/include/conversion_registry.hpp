/**
 * @file conversion_registry.hpp
 * @brief Static map from stable routine ids to conversion routines.
 */

#ifndef CONVOY_CONVERSION_REGISTRY_HPP
#define CONVOY_CONVERSION_REGISTRY_HPP

#include "conversion_routine.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace convoy {

/**
 * @brief Registry of the available conversion routines.
 *
 * @details The registry owns every routine. It is built once in the
 * coordinator process before the worker pool starts; forked workers get
 * an identical copy and resolve the routine id carried by each job.
 */
class ConversionRegistry {
public:
    /**
     * @brief Builds an empty registry.
     */
    ConversionRegistry() = default;

    /**
     * @brief Registry holding every built-in routine (chdman, dolphin-tool,
     * maxcso, 7z).
     */
    static ConversionRegistry with_builtin_routines();

    /**
     * @brief Registers @p routine under its id.
     * @throws std::invalid_argument if the id is empty or already taken.
     */
    void add(std::unique_ptr<IConversionRoutine> routine);

    /**
     * @brief Looks up a routine.
     * @return Non-owning pointer, or nullptr for unknown ids.
     */
    [[nodiscard]] IConversionRoutine* find(const std::string& id) const;

    [[nodiscard]] bool contains(const std::string& id) const { return find(id) != nullptr; }

    /**
     * @brief Registered ids, sorted.
     */
    [[nodiscard]] std::vector<std::string> ids() const;

private:
    ///< Owned routines keyed by id.
    std::map<std::string, std::unique_ptr<IConversionRoutine>, std::less<>> routines_;
};

} // namespace convoy

#endif // CONVOY_CONVERSION_REGISTRY_HPP
