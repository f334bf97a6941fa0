//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file
/// @brief Source loading helpers shared by the Magolor CLI tools.
/// @details Every tool reads files through here so unreadable, oversized, or
///          unregistrable inputs produce the same diagnostics.
///
//===----------------------------------------------------------------------===//

#include "tools/common/source_loader.hpp"

#include <fstream>
#include <new>
#include <sstream>

namespace magolor::tools::common
{

using magolor::support::Expected;
using magolor::support::makeError;

namespace
{
Expected<LoadedSource> registerSource(std::string text,
                                      const std::string &path,
                                      magolor::support::SourceManager &sm)
{
    const uint32_t fileId = sm.addFile(path);
    if (fileId == 0)
        return makeError({}, "source manager exhausted file identifier space");

    LoadedSource source{};
    source.buffer = std::move(text);
    source.fileId = fileId;
    return source;
}
} // namespace

Expected<LoadedSource> loadSourceBuffer(const std::string &path, magolor::support::SourceManager &sm)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return makeError({}, "unable to open " + path);

    in.seekg(0, std::ios::end);
    const auto fileSize = in.tellg();
    in.seekg(0, std::ios::beg);
    if (fileSize < 0 || fileSize > kMaxSourceSize)
        return makeError({}, "source file too large: " + path + " (limit: 64 MB)");

    std::string contents;
    try
    {
        std::ostringstream ss;
        ss << in.rdbuf();
        contents = ss.str();
    }
    catch (const std::bad_alloc &)
    {
        return makeError({}, "out of memory reading " + path);
    }

    return registerSource(std::move(contents), path, sm);
}

Expected<LoadedSource> adoptSourceText(std::string text,
                                       const std::string &pseudoPath,
                                       magolor::support::SourceManager &sm)
{
    return registerSource(std::move(text), pseudoPath, sm);
}

} // namespace magolor::tools::common
