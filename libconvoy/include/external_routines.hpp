/**
 * @file external_routines.hpp
 * @brief Built-in conversion routines backed by chdman, dolphin-tool, maxcso and 7z.
 */

#ifndef CONVOY_EXTERNAL_ROUTINES_HPP
#define CONVOY_EXTERNAL_ROUTINES_HPP

#include "conversion_routine.hpp"
#include <filesystem>
#include <string>
#include <string_view>

namespace convoy {

class ConversionRegistry;

/**
 * @brief Registers every routine declared in this header.
 */
void register_builtin_routines(ConversionRegistry& registry);

/**
 * @brief Checks that a routine produced a non-empty @p file, reporting otherwise.
 */
bool require_output(const std::filesystem::path& file, JobContext& ctx);

/**
 * @brief Kinds of CHD content chdman can create and extract.
 */
enum class ChdMedia {
    Cd,
    Dvd,
    HardDisk,
    LaserDisc,
    Raw
};

/**
 * @brief `chdman create*`: compresses an image into `<base_name>.chd`.
 */
class ChdmanCreateRoutine final : public IConversionRoutine {
public:
    explicit ChdmanCreateRoutine(ChdMedia media) : media_(media) {}

    [[nodiscard]] std::string_view id() const noexcept override;
    [[nodiscard]] std::string_view description() const noexcept override;
    [[nodiscard]] std::string tool(const EngineConfig& settings) const override;

    bool convert(const std::filesystem::path& staged_input,
                 const std::filesystem::path& workspace_dir,
                 const std::string& base_name,
                 JobContext& ctx) override;

private:
    ChdMedia media_;
};

/**
 * @brief `chdman extract*`: restores the image stored in a CHD.
 *
 * CD, DVD and hard disk CHDs are verified first when
 * chdman_verify_before_extract is set; a failed verification is only
 * a warning.
 */
class ChdmanExtractRoutine final : public IConversionRoutine {
public:
    explicit ChdmanExtractRoutine(ChdMedia media) : media_(media) {}

    [[nodiscard]] std::string_view id() const noexcept override;
    [[nodiscard]] std::string_view description() const noexcept override;
    [[nodiscard]] std::string tool(const EngineConfig& settings) const override;

    bool convert(const std::filesystem::path& staged_input,
                 const std::filesystem::path& workspace_dir,
                 const std::string& base_name,
                 JobContext& ctx) override;

private:
    [[nodiscard]] std::string default_ext() const;

    ChdMedia media_;
};

/**
 * @brief `chdman verify` / `chdman info`: inspection without output files.
 */
class ChdmanInspectRoutine final : public IConversionRoutine {
public:
    enum class Mode { Verify, Info };

    explicit ChdmanInspectRoutine(Mode mode) : mode_(mode) {}

    [[nodiscard]] std::string_view id() const noexcept override {
        return mode_ == Mode::Verify ? "chdman.verify" : "chdman.info";
    }
    [[nodiscard]] std::string_view description() const noexcept override {
        return mode_ == Mode::Verify ? "Verify CHD integrity" : "Print CHD metadata";
    }
    [[nodiscard]] OutputLayout output_layout() const noexcept override { return OutputLayout::Nothing; }
    [[nodiscard]] std::string tool(const EngineConfig& settings) const override;

    bool convert(const std::filesystem::path& staged_input,
                 const std::filesystem::path& workspace_dir,
                 const std::string& base_name,
                 JobContext& ctx) override;

private:
    Mode mode_;
};

/**
 * @brief `dolphin-tool convert` to RVZ, GCZ or WIA (target extension).
 */
class DolphinCompressRoutine final : public IConversionRoutine {
public:
    [[nodiscard]] std::string_view id() const noexcept override { return "dolphin.compress"; }
    [[nodiscard]] std::string_view description() const noexcept override {
        return "GameCube/Wii image to RVZ, GCZ or WIA";
    }
    [[nodiscard]] std::string tool(const EngineConfig& settings) const override;

    bool convert(const std::filesystem::path& staged_input,
                 const std::filesystem::path& workspace_dir,
                 const std::string& base_name,
                 JobContext& ctx) override;
};

/**
 * @brief `dolphin-tool convert` back to a plain ISO.
 */
class DolphinExtractRoutine final : public IConversionRoutine {
public:
    [[nodiscard]] std::string_view id() const noexcept override { return "dolphin.extract"; }
    [[nodiscard]] std::string_view description() const noexcept override {
        return "RVZ, GCZ or WIA to ISO";
    }
    [[nodiscard]] std::string tool(const EngineConfig& settings) const override;

    bool convert(const std::filesystem::path& staged_input,
                 const std::filesystem::path& workspace_dir,
                 const std::string& base_name,
                 JobContext& ctx) override;
};

/**
 * @brief `maxcso`: ISO to CSO.
 */
class MaxcsoCompressRoutine final : public IConversionRoutine {
public:
    [[nodiscard]] std::string_view id() const noexcept override { return "maxcso.compress"; }
    [[nodiscard]] std::string_view description() const noexcept override { return "ISO to CSO"; }
    [[nodiscard]] std::string tool(const EngineConfig& settings) const override;

    bool convert(const std::filesystem::path& staged_input,
                 const std::filesystem::path& workspace_dir,
                 const std::string& base_name,
                 JobContext& ctx) override;
};

/**
 * @brief Re-packs any archive (or plain file) as a solid 7z, then tests it.
 */
class SevenZipRepackRoutine final : public IConversionRoutine {
public:
    [[nodiscard]] std::string_view id() const noexcept override { return "sevenzip.repack"; }
    [[nodiscard]] std::string_view description() const noexcept override { return "Archive to 7z"; }
    [[nodiscard]] std::string tool(const EngineConfig& settings) const override;

    bool convert(const std::filesystem::path& staged_input,
                 const std::filesystem::path& workspace_dir,
                 const std::string& base_name,
                 JobContext& ctx) override;
};

/**
 * @brief Unpacks an archive into `<output_dir>/<base_name>/`.
 *
 * Uses the job's archive stager and falls back on `7z x` for formats
 * libarchive cannot read.
 */
class SevenZipExtractRoutine final : public IConversionRoutine {
public:
    [[nodiscard]] std::string_view id() const noexcept override { return "sevenzip.extract"; }
    [[nodiscard]] std::string_view description() const noexcept override { return "Archive to folder"; }
    [[nodiscard]] OutputLayout output_layout() const noexcept override { return OutputLayout::Folder; }
    [[nodiscard]] std::string tool(const EngineConfig& settings) const override;

    bool convert(const std::filesystem::path& staged_input,
                 const std::filesystem::path& workspace_dir,
                 const std::string& base_name,
                 JobContext& ctx) override;
};

} // namespace convoy

#endif // CONVOY_EXTERNAL_ROUTINES_HPP
