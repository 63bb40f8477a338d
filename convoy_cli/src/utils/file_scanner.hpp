#ifndef CONVOY_FILE_SCANNER_HPP
#define CONVOY_FILE_SCANNER_HPP

#include <filesystem>
#include <vector>

namespace convoy { struct MediaProfile; }

/**
 * @brief Expands files and folders into the inputs @p profile accepts.
 *
 * Folders are scanned one level deep, or fully with @p recursive. Files the
 * profile does not take, hidden junk files and the `_processing_temps_`
 * folders of running jobs are skipped. Track files already referenced by a
 * collected .cue/.gdi are left out so each disc is converted once.
 */
std::vector<std::filesystem::path>
collect_input_files(const std::vector<std::filesystem::path>& inputs,
                    const convoy::MediaProfile& profile,
                    bool recursive);

#endif // CONVOY_FILE_SCANNER_HPP
