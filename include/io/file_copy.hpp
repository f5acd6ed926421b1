#pragma once

#include "util/cancel.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace updsrv {

// Copies a regular file in chunks, keeping its owner-execute bit.
// `copied` receives the number of bytes written.
Result CopyFile(const std::string& src,
                const std::string& dst,
                const CancelToken& cancel,
                std::uint64_t* copied = nullptr);

// Copies every regular file below `src_dir` into `dst_dir`, creating
// subdirectories as needed.
Result CopyTree(const std::string& src_dir, const std::string& dst_dir, const CancelToken& cancel);

} // namespace updsrv
