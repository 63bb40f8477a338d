#include "../../include/external_routines.hpp"
#include "../../include/job_context.hpp"
#include "../../include/logger.hpp"

#include <vector>

namespace convoy {

namespace fs = std::filesystem;

namespace {

const char* media_suffix(const ChdMedia media) {
    switch (media) {
        case ChdMedia::Cd:        return "cd";
        case ChdMedia::Dvd:       return "dvd";
        case ChdMedia::HardDisk:  return "hd";
        case ChdMedia::LaserDisc: return "ld";
        case ChdMedia::Raw:       return "raw";
    }
    return "raw";
}

void add_common_args(std::vector<std::string>& argv, const EngineConfig& s) {
    if (s.chdman_num_processors > 0) {
        argv.insert(argv.end(), {"--numprocessors", std::to_string(s.chdman_num_processors)});
    }
}

void add_tuning(std::vector<std::string>& argv, const int hunks, const std::string& compression) {
    if (hunks > 0) {
        argv.insert(argv.end(), {"--hunksize", std::to_string(hunks)});
    }
    if (!compression.empty()) {
        argv.insert(argv.end(), {"--compression", compression});
    }
}

/// Track files chdman writes next to a .cue or .gdi sheet.
bool has_track_files(const fs::path& dir, const std::string& base_name, const bool allow_raw) {
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const auto& p = it->path();
        const auto ext = p.extension().string();
        if (!p.filename().string().starts_with(base_name)) continue;
        if (ext != ".bin" && !(allow_raw && ext == ".raw")) continue;
        std::error_code size_ec;
        if (fs::file_size(p, size_ec) > 0 && !size_ec) return true;
    }
    return false;
}

} // namespace

bool require_output(const fs::path& file, JobContext& ctx) {
    std::error_code ec;
    const auto size = fs::file_size(file, ec);
    if (ec || size == 0) {
        ctx.error("ERROR: Output \"" + file.filename().string() + "\" was not created or is empty.");
        return false;
    }
    return true;
}

// --- create ---

std::string_view ChdmanCreateRoutine::id() const noexcept {
    switch (media_) {
        case ChdMedia::Cd:        return "chdman.createcd";
        case ChdMedia::Dvd:       return "chdman.createdvd";
        case ChdMedia::HardDisk:  return "chdman.createhd";
        case ChdMedia::LaserDisc: return "chdman.createld";
        case ChdMedia::Raw:       return "chdman.createraw";
    }
    return "chdman.createraw";
}

std::string_view ChdmanCreateRoutine::description() const noexcept {
    switch (media_) {
        case ChdMedia::Cd:        return "CD image (cue/gdi/toc/iso) to CHD";
        case ChdMedia::Dvd:       return "DVD image (iso) to CHD";
        case ChdMedia::HardDisk:  return "Hard disk image to CHD";
        case ChdMedia::LaserDisc: return "LaserDisc video to CHD";
        case ChdMedia::Raw:       return "Raw image to CHD";
    }
    return "";
}

std::string ChdmanCreateRoutine::tool(const EngineConfig& settings) const {
    return settings.tool_chdman;
}

bool ChdmanCreateRoutine::convert(const fs::path& staged_input,
                                  const fs::path& workspace_dir,
                                  const std::string& base_name,
                                  JobContext& ctx) {
    const auto& s = ctx.settings();
    const fs::path output = workspace_dir / (base_name + ".chd");
    ctx.output(">> Compressing \"" + staged_input.filename().string() + "\" to " +
               std::string(media_suffix(media_)) + " CHD");

    std::vector<std::string> argv = {
        s.tool_chdman, std::string("create") + media_suffix(media_),
        "-i", staged_input.string(), "-o", output.string()
    };
    add_common_args(argv, s);
    switch (media_) {
        case ChdMedia::Cd:
            add_tuning(argv, s.chdman_cd_hunks, s.chdman_cd_compression);
            break;
        case ChdMedia::Dvd:
            add_tuning(argv, s.chdman_dvd_hunks, s.chdman_dvd_compression);
            break;
        case ChdMedia::HardDisk:
            add_tuning(argv, s.chdman_hd_hunks, s.chdman_hd_compression);
            break;
        case ChdMedia::LaserDisc:
            add_tuning(argv, 0, s.chdman_ld_compression);
            break;
        case ChdMedia::Raw:
            // createraw has no defaults for these two
            argv.insert(argv.end(), {"--hunksize", std::to_string(s.chdman_raw_hunks > 0 ? s.chdman_raw_hunks : 4096),
                                     "--unitsize", std::to_string(s.chdman_raw_unit_size > 0 ? s.chdman_raw_unit_size : 2048)});
            break;
    }

    if (!ctx.run_tool(argv).ok()) return false;
    return require_output(output, ctx);
}

// --- extract ---

std::string_view ChdmanExtractRoutine::id() const noexcept {
    switch (media_) {
        case ChdMedia::Cd:        return "chdman.extractcd";
        case ChdMedia::Dvd:       return "chdman.extractdvd";
        case ChdMedia::HardDisk:  return "chdman.extracthd";
        case ChdMedia::LaserDisc: return "chdman.extractld";
        case ChdMedia::Raw:       return "chdman.extractraw";
    }
    return "chdman.extractraw";
}

std::string_view ChdmanExtractRoutine::description() const noexcept {
    switch (media_) {
        case ChdMedia::Cd:        return "CHD to CD image (cue/bin, gdi, toc)";
        case ChdMedia::Dvd:       return "CHD to DVD image (iso)";
        case ChdMedia::HardDisk:  return "CHD to hard disk image";
        case ChdMedia::LaserDisc: return "CHD to LaserDisc video";
        case ChdMedia::Raw:       return "CHD to raw image";
    }
    return "";
}

std::string ChdmanExtractRoutine::tool(const EngineConfig& settings) const {
    return settings.tool_chdman;
}

std::string ChdmanExtractRoutine::default_ext() const {
    switch (media_) {
        case ChdMedia::Cd:        return "cue";
        case ChdMedia::Dvd:       return "iso";
        case ChdMedia::HardDisk:  return "img";
        case ChdMedia::LaserDisc: return "avi";
        case ChdMedia::Raw:       return "raw";
    }
    return "raw";
}

bool ChdmanExtractRoutine::convert(const fs::path& staged_input,
                                   const fs::path& workspace_dir,
                                   const std::string& base_name,
                                   JobContext& ctx) {
    const auto& s = ctx.settings();

    const bool verifiable = media_ == ChdMedia::Cd || media_ == ChdMedia::Dvd || media_ == ChdMedia::HardDisk;
    if (verifiable && s.chdman_verify_before_extract) {
        ctx.output(">> Verifying CHD: \"" + staged_input.filename().string() + "\"");
        std::vector<std::string> verify = {s.tool_chdman, "verify", "-i", staged_input.string()};
        if (s.chdman_verify_fix) verify.emplace_back("--fix");
        if (!ctx.run_tool(verify).ok()) {
            ctx.error("WARNING: CHD verification failed or found errors. Attempting extraction anyway.");
        }
    }

    const std::string ext = ctx.target_ext().empty() ? default_ext() : ctx.target_ext();
    const fs::path output = workspace_dir / (base_name + "." + ext);
    ctx.output(">> Extracting CHD to " + output.filename().string());

    std::vector<std::string> argv = {
        s.tool_chdman, std::string("extract") + media_suffix(media_),
        "-i", staged_input.string(), "-o", output.string()
    };
    if (media_ == ChdMedia::Cd && ext == "cue") {
        argv.insert(argv.end(), {"-ob", (workspace_dir / (base_name + ".bin")).string()});
    }
    add_common_args(argv, s);

    if (!ctx.run_tool(argv).ok()) return false;
    if (!require_output(output, ctx)) return false;

    if (media_ == ChdMedia::Cd && (ext == "cue" || ext == "gdi")) {
        if (!has_track_files(workspace_dir, base_name, ext == "gdi")) {
            ctx.error("ERROR: Track files for \"" + output.filename().string() + "\" not found or empty.");
            return false;
        }
    }
    return true;
}

// --- inspect ---

std::string ChdmanInspectRoutine::tool(const EngineConfig& settings) const {
    return settings.tool_chdman;
}

bool ChdmanInspectRoutine::convert(const fs::path& staged_input,
                                   const fs::path& /*workspace_dir*/,
                                   const std::string& /*base_name*/,
                                   JobContext& ctx) {
    const auto& s = ctx.settings();
    const std::string name = staged_input.filename().string();

    if (mode_ == Mode::Info) {
        ctx.output(">> Getting info for CHD: \"" + name + "\"");
        if (!ctx.run_tool({s.tool_chdman, "info", "-i", staged_input.string()}).ok()) {
            ctx.error("ERROR: Failed to get info for CHD \"" + name + "\".");
            return false;
        }
        return true;
    }

    ctx.output(">> Verifying CHD: \"" + name + "\"");
    std::vector<std::string> argv = {s.tool_chdman, "verify", "-i", staged_input.string()};
    if (s.chdman_verify_fix) {
        argv.emplace_back("--fix");
        ctx.output("   Attempting to fix errors if found (--fix enabled).");
    }
    if (!ctx.run_tool(argv).ok()) {
        ctx.error("ERROR: CHD \"" + name + "\" verification failed or found errors.");
        return false;
    }
    ctx.output("CHD \"" + name + "\" verified successfully.");
    return true;
}

} // namespace convoy
