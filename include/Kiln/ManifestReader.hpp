// include/Kiln/ManifestReader.hpp
#ifndef KILN_MANIFEST_READER_HPP
#define KILN_MANIFEST_READER_HPP

#include <Kiln/FileSystem.hpp>
#include <Kiln/Types/Version.hpp>
#include <filesystem>

namespace Kiln {

    // Reads and parses a version manifest. Every failure (missing file, I/O error,
    // invalid JSON, missing id/mainClass) is reported as ManifestReadError.
    Version readManifest(const FileSystem& fs, const std::filesystem::path& manifestPath);

} // namespace Kiln

#endif //KILN_MANIFEST_READER_HPP
