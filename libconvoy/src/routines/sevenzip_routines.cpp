#include "../../include/archive_stager.hpp"
#include "../../include/container_format.hpp"
#include "../../include/external_routines.hpp"
#include "../../include/job_context.hpp"

#include <vector>

namespace convoy {

namespace fs = std::filesystem;

std::string SevenZipRepackRoutine::tool(const EngineConfig& settings) const {
    return settings.tool_7z;
}

bool SevenZipRepackRoutine::convert(const fs::path& staged_input,
                                    const fs::path& workspace_dir,
                                    const std::string& base_name,
                                    JobContext& ctx) {
    const auto& s = ctx.settings();
    const fs::path output = workspace_dir / (base_name + ".7z");
    const fs::path contents = workspace_dir / ("." + base_name + "_contents");
    std::error_code ec;

    std::vector<std::string> argv = {
        s.tool_7z, "a", "-t7z", "-mx" + std::to_string(s.sevenzip_level), "-md=128m", "-y", output.string()
    };
    fs::path cwd;

    if (detect_container_format(staged_input) != ContainerFormat::Unknown) {
        ctx.output(">> Converting archive \"" + staged_input.filename().string() + "\" to 7z");
        if (!ctx.archive_stager().extract(staged_input, contents)) {
            ctx.error("Failed to extract source archive \"" + staged_input.filename().string() + "\".");
            fs::remove_all(contents, ec);
            return false;
        }
        if (fs::is_empty(contents, ec)) {
            ctx.error("No content found after extraction to re-compress to 7z.");
            fs::remove_all(contents, ec);
            return false;
        }
        argv.emplace_back(".");
        cwd = contents;
    } else {
        ctx.output(">> Compressing \"" + staged_input.filename().string() + "\" to 7z");
        argv.push_back(staged_input.string());
    }

    const bool packed = ctx.run_tool(argv, cwd).ok();
    fs::remove_all(contents, ec);
    if (!packed || !require_output(output, ctx)) return false;

    if (s.validate_output) {
        ctx.output(">> Validating new 7z archive...");
        if (!ctx.run_tool({s.tool_7z, "t", output.string()}).ok()) {
            ctx.error("Validation failed for \"" + output.filename().string() + "\".");
            return false;
        }
        ctx.output(">> Validation passed.");
    }
    return true;
}

std::string SevenZipExtractRoutine::tool(const EngineConfig& settings) const {
    return settings.tool_7z;
}

bool SevenZipExtractRoutine::convert(const fs::path& staged_input,
                                     const fs::path& workspace_dir,
                                     const std::string& /*base_name*/,
                                     JobContext& ctx) {
    const std::string name = staged_input.filename().string();
    ctx.output(">> Extracting archive \"" + name + "\"");

    if (!ctx.archive_stager().extract(staged_input, workspace_dir)) {
        ctx.error("WARNING: built-in extraction failed for \"" + name + "\", trying 7z.");
        std::error_code ec;
        for (fs::directory_iterator it(workspace_dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
            std::error_code rm_ec;
            fs::remove_all(it->path(), rm_ec);
        }
        const auto& s = ctx.settings();
        if (!ctx.run_tool({s.tool_7z, "x", "-y", "-o" + workspace_dir.string(), staged_input.string()}).ok()) {
            return false;
        }
    }

    std::error_code ec;
    if (fs::is_empty(workspace_dir, ec)) {
        ctx.error("WARNING: Archive \"" + name + "\" extracted, but it contained no files.");
    }
    ctx.output("Archive \"" + name + "\" extracted successfully.");
    return true;
}

} // namespace convoy
