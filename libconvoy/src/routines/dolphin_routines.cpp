#include "../../include/external_routines.hpp"
#include "../../include/job_context.hpp"

#include <vector>

namespace convoy {

namespace fs = std::filesystem;

std::string DolphinCompressRoutine::tool(const EngineConfig& settings) const {
    return settings.tool_dolphin;
}

bool DolphinCompressRoutine::convert(const fs::path& staged_input,
                                     const fs::path& workspace_dir,
                                     const std::string& base_name,
                                     JobContext& ctx) {
    const auto& s = ctx.settings();
    const std::string format = ctx.target_ext().empty() ? "rvz" : ctx.target_ext();
    if (format != "rvz" && format != "gcz" && format != "wia") {
        ctx.error("ERROR: dolphin-tool cannot compress to '" + format + "'.");
        return false;
    }
    const fs::path output = workspace_dir / (base_name + "." + format);
    ctx.output(">> Compressing \"" + staged_input.filename().string() + "\" to " + format);

    std::vector<std::string> argv = {
        s.tool_dolphin, "convert",
        "-i", staged_input.string(), "-o", output.string(), "-f", format
    };
    if (s.dolphin_block_size > 0) {
        argv.insert(argv.end(), {"-b", std::to_string(s.dolphin_block_size)});
    }
    if (format != "gcz") {
        // gcz is always deflate
        argv.insert(argv.end(), {"-c", s.dolphin_compression.empty() ? "zstd" : s.dolphin_compression});
        if (s.dolphin_compression != "none") {
            argv.insert(argv.end(), {"-l", std::to_string(s.dolphin_compression_level)});
        }
    }

    if (!ctx.run_tool(argv).ok()) return false;
    return require_output(output, ctx);
}

std::string DolphinExtractRoutine::tool(const EngineConfig& settings) const {
    return settings.tool_dolphin;
}

bool DolphinExtractRoutine::convert(const fs::path& staged_input,
                                    const fs::path& workspace_dir,
                                    const std::string& base_name,
                                    JobContext& ctx) {
    const auto& s = ctx.settings();
    const fs::path output = workspace_dir / (base_name + ".iso");
    ctx.output(">> Extracting \"" + staged_input.filename().string() + "\" to ISO");

    const std::vector<std::string> argv = {
        s.tool_dolphin, "convert",
        "-i", staged_input.string(), "-o", output.string(), "-f", "iso"
    };
    if (!ctx.run_tool(argv).ok()) return false;
    return require_output(output, ctx);
}

} // namespace convoy
