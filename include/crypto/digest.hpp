#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace updsrv {

enum class DigestAlgorithm {
    Sha256,
    Md5,
};

std::string Sha256Hex(std::string_view text);
std::string DigestHex(DigestAlgorithm algo, IReader& reader);
Result DigestHexFile(DigestAlgorithm algo, const std::string& path, std::string& out_hex);

} // namespace updsrv
