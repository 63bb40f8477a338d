/**
 * @file conversion_routine.hpp
 * @brief Interface implemented by every conversion routine.
 */

#ifndef CONVOY_CONVERSION_ROUTINE_HPP
#define CONVOY_CONVERSION_ROUTINE_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace convoy {

    class JobContext;
    struct EngineConfig;

    /**
     * @brief What a routine leaves in the workspace output area.
     */
    enum class OutputLayout {
        NamedFiles, ///< `<base_name>.<primary_ext>` plus optional secondary files
        Folder,     ///< Arbitrary tree, moved to `<output_dir>/<base_name>/`
        Nothing     ///< Inspection only (info, verify)
    };

    /**
     * @brief A conversion step performed by an external tool.
     *
     * @details Routines are stateless and registered once in the
     * ConversionRegistry under a stable id. Only that id travels to the
     * worker process, which looks the routine up in its own copy of the
     * registry. Implementations must not throw: tool failures are reported
     * through JobContext::error() and a false return value.
     */
    class IConversionRoutine {
    public:
        virtual ~IConversionRoutine() = default;

        // --- self-description ---
        [[nodiscard]] virtual std::string_view id() const noexcept = 0;
        [[nodiscard]] virtual std::string_view description() const noexcept = 0;
        [[nodiscard]] virtual OutputLayout output_layout() const noexcept { return OutputLayout::NamedFiles; }

        /**
         * @brief Executable the routine invokes, as configured in @p settings.
         * @note Used by the front end to warn about missing tools.
         */
        [[nodiscard]] virtual std::string tool(const EngineConfig& settings) const = 0;

        /**
         * @brief Converts @p staged_input, writing into @p workspace_dir.
         *
         * @param staged_input Input as prepared by the Staging stage.
         * @param workspace_dir Output area of the job workspace.
         * @param base_name Stem every primary output must use.
         * @param ctx Settings, target extension and event emitters of the job.
         * @return true on success.
         */
        virtual bool convert(const std::filesystem::path& staged_input,
                             const std::filesystem::path& workspace_dir,
                             const std::string& base_name,
                             JobContext& ctx) = 0;
    };

} // namespace convoy

#endif // CONVOY_CONVERSION_ROUTINE_HPP
