#include "../../include/workspace.hpp"
#include "../../include/engine_config.hpp"
#include "../../include/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

namespace convoy {

    namespace {

        constexpr const char* kInPlaceTempDir = "_processing_temps_";
        constexpr std::size_t kMaxStemLength = 64;

        std::string sanitized_stem(const std::filesystem::path& input) {
            std::string stem = input.stem().string();
            if (stem.empty()) stem = "job";
            if (stem.size() > kMaxStemLength) stem.resize(kMaxStemLength);
            for (auto& c : stem) {
                if (c == '/' || static_cast<unsigned char>(c) < 0x20) c = '_';
            }
            return stem;
        }

        bool make_unique_dir(const std::filesystem::path& base, const std::string& stem,
                             std::filesystem::path& out, std::error_code& ec) {
            std::string tmpl = (base / (stem + "_temp_XXXXXX")).string();
            std::vector<char> buf(tmpl.begin(), tmpl.end());
            buf.push_back('\0');
            if (::mkdtemp(buf.data()) == nullptr) {
                ec.assign(errno, std::generic_category());
                return false;
            }
            out = std::filesystem::path(buf.data());
            return true;
        }

    } // namespace

    std::filesystem::path Workspace::base_dir_for(const EngineConfig& settings,
                                                  const std::filesystem::path& input) {
        if (settings.copy_locally) {
            return settings.main_temp_dir.empty() ? EngineConfig::default_temp_dir()
                                                  : settings.main_temp_dir;
        }
        auto parent = input.parent_path();
        if (parent.empty()) parent = ".";
        return parent / kInPlaceTempDir;
    }

    std::optional<Workspace> Workspace::create(const std::filesystem::path& base_dir,
                                               const std::filesystem::path& input,
                                               std::error_code& ec) {
        ec.clear();
        const std::string stem = sanitized_stem(input);
        std::filesystem::path root;

        // another job may remove an empty base between the two calls; retry once
        for (int attempt = 0; attempt < 2; ++attempt) {
            ec.clear();
            std::filesystem::create_directories(base_dir, ec);
            if (ec) break;
            if (make_unique_dir(base_dir, stem, root, ec)) break;
            if (ec != std::errc::no_such_file_or_directory) break;
        }
        if (ec) {
            Logger::log(LogLevel::Error, "Failed to create workspace in " + base_dir.string() +
                        " (" + ec.message() + ")", "workspace");
            return std::nullopt;
        }

        Workspace ws(root, base_dir, base_dir.filename() == kInPlaceTempDir);
        std::filesystem::create_directory(ws.staging_dir(), ec);
        if (!ec) std::filesystem::create_directory(ws.output_dir(), ec);
        if (ec) {
            Logger::log(LogLevel::Error, "Failed to lay out workspace " + root.string() +
                        " (" + ec.message() + ")", "workspace");
            return std::nullopt; // ws destructor removes the partial tree
        }
        Logger::log(LogLevel::Debug, "Created workspace: " + root.string(), "workspace");
        return std::optional<Workspace>(std::move(ws));
    }

    Workspace::Workspace(std::filesystem::path root, std::filesystem::path base, const bool remove_base)
        : root_(std::move(root)), base_(std::move(base)), remove_base_(remove_base) {}

    Workspace::Workspace(Workspace&& other) noexcept
        : root_(std::move(other.root_)), base_(std::move(other.base_)), remove_base_(other.remove_base_) {
        other.root_.clear();
    }

    Workspace& Workspace::operator=(Workspace&& other) noexcept {
        if (this != &other) {
            cleanup();
            root_ = std::move(other.root_);
            base_ = std::move(other.base_);
            remove_base_ = other.remove_base_;
            other.root_.clear();
        }
        return *this;
    }

    Workspace::~Workspace() {
        cleanup();
    }

    bool Workspace::cleanup() {
        if (root_.empty()) return true;
        const bool removed = remove_dir_with_retries(root_);
        if (!removed) return false;
        root_.clear();
        if (remove_base_) {
            // only succeeds once no other job uses the folder
            std::error_code ec;
            std::filesystem::remove(base_, ec);
        }
        return true;
    }

    bool remove_dir_with_retries(const std::filesystem::path& dir, const int attempts,
                                 const std::chrono::milliseconds backoff, const std::string_view tag) {
        for (int attempt = 1; attempt <= attempts; ++attempt) {
            std::error_code ec;
            std::filesystem::remove_all(dir, ec);
            std::error_code exists_ec;
            if (!ec && !std::filesystem::exists(dir, exists_ec)) {
                Logger::log(LogLevel::Debug, "Removed temp dir: " + dir.string(), tag);
                return true;
            }
            if (attempt < attempts) {
                Logger::log(LogLevel::Warning, "Can't remove temp dir: " + dir.string() + " (" +
                            ec.message() + "), retrying", tag);
                std::this_thread::sleep_for(backoff);
            } else {
                Logger::log(LogLevel::Error, "Can't remove temp dir: " + dir.string() + " (" +
                            ec.message() + ") after " + std::to_string(attempts) + " attempts", tag);
            }
        }
        return false;
    }

} // namespace convoy
